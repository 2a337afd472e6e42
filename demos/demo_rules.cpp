// demo_rules.cpp
//
// Prints what a copy of <dir> would keep and skip, without copying
// anything, along with the merged .ignorecopy rules of every directory
// that has any:
//
//     ./treecopy-rules path/to/project
//     ./treecopy-rules path/to/project --ignore-copy   # everything is kept
//
// Exclusion decisions come from the same FilterResolver the copier uses.

#include <treecopy/filter.hpp>
#include <treecopy/log.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace treecopy;

struct Tally {
    size_t kept = 0;
    size_t skipped = 0;
};

static void print_rules(const IgnoreRules& rules, const std::string& rel, int depth) {
    if (rules.empty()) return;
    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    std::cout << indent << "# rules for " << rel << ":";
    for (const auto& p : rules.directory_patterns()) std::cout << " " << p << "/";
    for (const auto& p : rules.patterns()) std::cout << " " << p;
    std::cout << "\n";
}

static void walk(const fs::path& dir, FilterResolver& filter, int depth, Tally& tally) {
    auto rel = dir.lexically_relative(filter.base_root()).generic_string();
    print_rules(filter.resolve(dir), rel, depth);

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        log::warn("cannot read %s: %s", dir.c_str(), ec.message().c_str());
        return;
    }

    std::string indent(static_cast<size_t>(depth) * 2, ' ');
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        auto st = it->status(type_ec);
        if (type_ec) continue;

        const fs::path& item = it->path();
        std::string name = item.filename().string();

        if (fs::is_directory(st)) {
            if (filter.is_directory_excluded(item)) {
                std::cout << indent << "- " << name << "/\n";
                tally.skipped++;
                continue;
            }
            std::cout << indent << "+ " << name << "/\n";
            walk(item, filter, depth + 1, tally);
        } else if (fs::is_regular_file(st)) {
            bool skip = filter.is_file_excluded(item);
            std::cout << indent << (skip ? "- " : "+ ") << name << "\n";
            if (skip) tally.skipped++;
            else tally.kept++;
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: treecopy-rules <dir> [--ignore-copy]\n";
        return 1;
    }

    bool ignore_all = argc > 2 && std::string(argv[2]) == "--ignore-copy";

    std::error_code ec;
    fs::path root = fs::weakly_canonical(fs::absolute(argv[1], ec), ec);
    if (ec || !fs::is_directory(root, ec)) {
        std::cerr << "error: not a directory: " << argv[1] << "\n";
        return 1;
    }

    FilterResolver filter(root, ignore_all);
    Tally tally;
    std::cout << root.string() << "/\n";
    walk(root, filter, 1, tally);

    std::cout << "\n" << tally.kept << " file(s) kept, "
              << tally.skipped << " entr" << (tally.skipped == 1 ? "y" : "ies")
              << " skipped, " << filter.cached_directories()
              << " director" << (filter.cached_directories() == 1 ? "y" : "ies")
              << " resolved\n";
    return 0;
}

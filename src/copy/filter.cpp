#include <treecopy/filter.hpp>
#include <treecopy/glob.hpp>
#include <treecopy/log.hpp>

#include <vector>

namespace fs = std::filesystem;

namespace treecopy {

// Lexically normalized, without a trailing separator
static fs::path normalize_dir(const fs::path& p) {
    fs::path n = p.lexically_normal();
    if (!n.has_filename() && n.has_relative_path()) n = n.parent_path();
    return n;
}

FilterResolver::FilterResolver(const fs::path& base_root,
                               bool ignore_all,
                               std::string marker_name)
    : base_root_(normalize_dir(base_root)),
      ignore_all_(ignore_all),
      marker_name_(std::move(marker_name)) {}

std::optional<std::string> FilterResolver::relative_to_root(const fs::path& p) const {
    fs::path rel = normalize_dir(p).lexically_relative(base_root_);
    if (rel.empty()) return std::nullopt;
    if (*rel.begin() == "..") return std::nullopt;
    return rel.generic_string();
}

const IgnoreRules& FilterResolver::resolve(const fs::path& directory) {
    if (ignore_all_) return empty_;

    fs::path key = normalize_dir(directory);
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;

    if (!relative_to_root(key)) {
        log::debug("not under copy root, no rules applied: %s", key.c_str());
        return empty_;
    }

    // Collect marker files leaf-to-root, stopping at the copy root
    std::vector<fs::path> markers;
    fs::path current = key;
    while (true) {
        fs::path marker = current / marker_name_;
        std::error_code ec;
        if (fs::exists(marker, ec)) markers.push_back(marker);

        if (current == base_root_) break;
        fs::path parent = current.parent_path();
        if (parent == current) break;
        current = parent;
    }

    IgnoreRules merged;
    for (auto m = markers.rbegin(); m != markers.rend(); ++m) {
        auto rules = IgnoreRules::load(*m);
        if (rules.is_err()) {
            log::debug("skipping marker file: %s", rules.error().message.c_str());
            continue;
        }
        merged.merge(rules.value());
    }

    log::trace("%s: %zu marker file(s), %zu pattern(s), %zu directory pattern(s)",
               key.c_str(), markers.size(), merged.patterns().size(),
               merged.directory_patterns().size());

    auto [pos, inserted] = cache_.emplace(std::move(key), std::move(merged));
    (void)inserted;
    return pos->second;
}

bool FilterResolver::is_file_excluded(const fs::path& file) {
    if (ignore_all_) return false;

    const auto& rules = resolve(file.parent_path());
    const auto& patterns = rules.patterns();
    if (patterns.empty()) return false;

    auto rel = relative_to_root(file);
    if (!rel) return false;

    if (glob_match_any(patterns, *rel)) return true;
    if (glob_match_any(patterns, file.filename().string())) return true;

    for (fs::path dir = fs::path(*rel).parent_path(); !dir.empty(); dir = dir.parent_path()) {
        if (glob_match_any(patterns, dir.generic_string())) return true;
    }
    return false;
}

bool FilterResolver::is_directory_excluded(const fs::path& dir) {
    if (ignore_all_) return false;

    fs::path norm = normalize_dir(dir);
    const auto& rules = resolve(norm.parent_path());
    if (rules.empty()) return false;

    auto rel = relative_to_root(norm);
    if (!rel) return false;
    std::string name = norm.filename().string();

    const auto& dir_patterns = rules.directory_patterns();
    if (glob_match_any(dir_patterns, *rel) || glob_match_any(dir_patterns, name)) {
        return true;
    }

    const auto& patterns = rules.patterns();
    return glob_match_any(patterns, *rel) || glob_match_any(patterns, name);
}

} // namespace treecopy

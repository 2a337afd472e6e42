#include <treecopy/cli.hpp>
#include <treecopy/cancel.hpp>
#include <treecopy/config.hpp>
#include <treecopy/copier.hpp>
#include <treecopy/log.hpp>

#include <cstdio>
#include <cstring>
#include <vector>

namespace fs = std::filesystem;

namespace treecopy {

std::string usage() {
    return
        "usage: treecopy [options] <source> <destination>\n"
        "\n"
        "Copy a directory tree, skipping entries excluded by .ignorecopy files.\n"
        "\n"
        "options:\n"
        "  --ignore-copy      ignore all marker files (copy everything)\n"
        "  -v, --verbose      detailed output, list errors in the summary\n"
        "  --config <file>    read settings from this TOML file\n"
        "  --marker <name>    marker file name (default .ignorecopy)\n"
        "  --no-progress      do not draw the progress bar\n"
        "  -h, --help         show this help\n";
}

// Handles both "--opt value" and "--opt=value"
static Result<std::string> option_value(const std::string& arg, const char* name,
                                        int& i, int argc, const char* const* argv) {
    size_t n = std::strlen(name);
    if (arg.size() > n && arg[n] == '=') {
        return Result<std::string>::ok(arg.substr(n + 1));
    }
    if (i + 1 >= argc) {
        return TreecopyError{TreecopyError::InvalidArg,
            std::string("option ") + name + " requires a value"};
    }
    return Result<std::string>::ok(argv[++i]);
}

static bool is_option(const std::string& arg, const char* name) {
    size_t n = std::strlen(name);
    return arg.compare(0, n, name) == 0 && (arg.size() == n || arg[n] == '=');
}

Result<CliArgs> parse_args(int argc, const char* const* argv) {
    CliArgs args;
    std::vector<std::string> positional;
    bool options_done = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
            positional.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
        } else if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--ignore-copy") {
            args.ignore_copy = true;
        } else if (arg == "--no-progress") {
            args.no_progress = true;
        } else if (is_option(arg, "--config")) {
            auto v = option_value(arg, "--config", i, argc, argv);
            if (v.is_err()) return std::move(v).error();
            args.config_path = std::move(v).value();
        } else if (is_option(arg, "--marker")) {
            auto v = option_value(arg, "--marker", i, argc, argv);
            if (v.is_err()) return std::move(v).error();
            if (v.value().empty() || v.value().find('/') != std::string::npos) {
                return TreecopyError{TreecopyError::InvalidArg,
                    "--marker must be a plain file name: '" + v.value() + "'"};
            }
            args.marker = std::move(v).value();
        } else {
            return TreecopyError{TreecopyError::InvalidArg,
                "unknown option: " + arg,
                "run 'treecopy --help' for the list of options"};
        }
    }

    if (args.help) return Result<CliArgs>::ok(std::move(args));

    if (positional.size() != 2) {
        return TreecopyError{TreecopyError::InvalidArg,
            positional.size() < 2 ? "missing source or destination"
                                  : "too many arguments",
            "usage: treecopy [options] <source> <destination>"};
    }
    args.source = positional[0];
    args.destination = positional[1];
    return Result<CliArgs>::ok(std::move(args));
}

static fs::path resolve_path(const std::string& raw, std::error_code& ec) {
    fs::path abs = fs::absolute(raw, ec);
    if (ec) return {};
    return fs::weakly_canonical(abs, ec);
}

Result<CopyPaths> validate_paths(const std::string& source,
                                 const std::string& destination) {
    std::error_code ec;
    CopyPaths paths;

    paths.source = resolve_path(source, ec);
    if (ec) {
        return TreecopyError{TreecopyError::IO,
            "cannot resolve source path '" + source + "': " + ec.message()};
    }
    if (!fs::exists(paths.source, ec)) {
        return TreecopyError{TreecopyError::NotFound,
            "source directory '" + paths.source.string() + "' does not exist"};
    }
    if (!fs::is_directory(paths.source, ec)) {
        return TreecopyError{TreecopyError::InvalidArg,
            "source '" + paths.source.string() + "' is not a directory"};
    }

    paths.destination = resolve_path(destination, ec);
    if (ec) {
        return TreecopyError{TreecopyError::IO,
            "cannot resolve destination path '" + destination + "': " + ec.message()};
    }

    auto rel = paths.destination.lexically_relative(paths.source);
    if (!rel.empty() && *rel.begin() != "..") {
        return TreecopyError{TreecopyError::InvalidArg,
            "destination '" + paths.destination.string() + "' is inside the source",
            "choose a destination outside of '" + paths.source.string() + "'"};
    }

    fs::create_directories(paths.destination, ec);
    if (!ec && !fs::is_directory(paths.destination, ec) && !ec) {
        ec = std::make_error_code(std::errc::not_a_directory);
    }
    if (ec) {
        return TreecopyError{
            ec == std::errc::permission_denied ? TreecopyError::Permission
                                               : TreecopyError::IO,
            "cannot create destination directory '" + paths.destination.string() +
                "': " + ec.message()};
    }

    return Result<CopyPaths>::ok(std::move(paths));
}

static Result<Config> load_config(const CliArgs& args) {
    Config cfg;

    std::string path = args.config_path.value_or(global_config_path());
    std::error_code ec;
    // A missing global config is normal; a missing --config file is not
    if (!path.empty() && (args.config_path || fs::exists(path, ec))) {
        auto file_cfg = Config::load(path);
        if (file_cfg.is_err()) return std::move(file_cfg).error();
        cfg.merge(file_cfg.value());
        log::debug("loaded config: %s", path.c_str());
    }

    Config cli;
    if (args.verbose) {
        cli.verbose = true;
        cli.verbose_set = true;
    }
    if (args.no_progress) {
        cli.progress = false;
        cli.progress_set = true;
    }
    if (args.marker) {
        cli.marker_file = *args.marker;
        cli.marker_file_set = true;
    }
    cfg.merge(cli);

    return Result<Config>::ok(std::move(cfg));
}

int run(int argc, const char* const* argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::fprintf(stderr, "%s\n", args.error().format().c_str());
        return ExitFailure;
    }
    if (args.value().help) {
        std::printf("%s", usage().c_str());
        return ExitOk;
    }

    auto cfg = load_config(args.value());
    if (cfg.is_err()) {
        std::fprintf(stderr, "%s\n", cfg.error().format().c_str());
        return ExitFailure;
    }
    cfg.value().apply_logging();
    const Config& config = cfg.value();

    auto paths = validate_paths(args.value().source, args.value().destination);
    if (paths.is_err()) {
        std::fprintf(stderr, "%s\n", paths.error().format().c_str());
        return ExitFailure;
    }

    TreeCopier copier(paths.value().source, paths.value().destination,
                      config.copy_options());
    copier.set_progress_factory(terminal_progress_factory(config.verbose, config.progress));

    if (install_interrupt_handler()) {
        copier.set_cancel_token(&interrupt_token());
    } else {
        log::warn("could not install interrupt handler; Ctrl-C will not cancel cleanly");
    }

    auto report = copier.copy(args.value().ignore_copy);
    std::printf("\n%s", format_summary(report, config.verbose).c_str());

    switch (report.outcome) {
        case CopyOutcome::Succeeded: return ExitOk;
        case CopyOutcome::Cancelled: return ExitCancelled;
        case CopyOutcome::Failed:    return ExitFailure;
    }
    return ExitFailure;
}

} // namespace treecopy

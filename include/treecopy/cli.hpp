#pragma once

#include <treecopy/result.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace treecopy {

struct CliArgs {
    std::string source;
    std::string destination;
    bool ignore_copy = false;
    bool verbose = false;
    bool no_progress = false;
    bool help = false;
    std::optional<std::string> config_path;
    std::optional<std::string> marker;
};

// treecopy [options] <source> <destination>
Result<CliArgs> parse_args(int argc, const char* const* argv);

std::string usage();

struct CopyPaths {
    std::filesystem::path source;
    std::filesystem::path destination;
};

// Resolve both paths to absolute form. The source must be an existing
// directory; the destination is created if missing and may not lie
// inside the source.
Result<CopyPaths> validate_paths(const std::string& source,
                                 const std::string& destination);

// Exit status values returned by run()
enum ExitStatus {
    ExitOk = 0,
    ExitFailure = 1,
    ExitCancelled = 130
};

// Full command-line program: parse, configure, validate, copy, summarize.
int run(int argc, const char* const* argv);

} // namespace treecopy

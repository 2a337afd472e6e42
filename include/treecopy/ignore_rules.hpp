#pragma once

#include <treecopy/result.hpp>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace treecopy {

// Default name of the per-directory marker file.
inline constexpr const char* kDefaultMarkerName = ".ignorecopy";

// Exclusion patterns declared by one marker file, or the union of several
// (see FilterResolver). Generic patterns apply to files and directories;
// directory patterns (written with a trailing '/') only to directories.
//
// Line rules: trimmed; blank lines and '#' comments skipped; one leading
// '/' stripped; a trailing '/' marks a directory pattern and is dropped.
class IgnoreRules {
public:
    IgnoreRules() = default;

    static IgnoreRules parse(const std::vector<std::string>& lines);

    // Split on newlines (CRLF tolerated) and parse.
    static IgnoreRules parse_text(const std::string& text);

    // Read and parse a marker file. IO error if it cannot be read,
    // Parse error if the content is not valid UTF-8.
    static Result<IgnoreRules> load(const std::filesystem::path& path);

    // Union `other` into this rule set. Nothing is ever removed.
    void merge(const IgnoreRules& other);

    const std::set<std::string>& patterns() const { return patterns_; }
    const std::set<std::string>& directory_patterns() const { return directory_patterns_; }

    bool empty() const { return patterns_.empty() && directory_patterns_.empty(); }

private:
    void add_line(const std::string& raw);

    std::set<std::string> patterns_;
    std::set<std::string> directory_patterns_;
};

} // namespace treecopy

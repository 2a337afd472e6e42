#pragma once

#include <treecopy/ignore_rules.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace treecopy {

// Answers "is this path excluded?" for one copy operation.
//
// The effective rules for a directory are the union of every marker file
// found from the copy root down to that directory. They are computed on
// first use and cached for the lifetime of the resolver; marker files are
// assumed not to change while a copy runs.
//
// All queried paths must lie under base_root. Paths that do not are
// never excluded and never trigger marker discovery.
class FilterResolver {
public:
    explicit FilterResolver(const std::filesystem::path& base_root,
                            bool ignore_all = false,
                            std::string marker_name = kDefaultMarkerName);

    // Merged rules for `directory`. With ignore_all set this is always an
    // empty rule set and the cache is left untouched.
    const IgnoreRules& resolve(const std::filesystem::path& directory);

    // Uses the parent directory's rules. Checks the root-relative path,
    // the file name and each ancestor directory against generic patterns.
    bool is_file_excluded(const std::filesystem::path& file);

    // Uses the parent directory's rules, so a marker file inside `dir`
    // never excludes `dir` itself. Checks the root-relative path and the
    // name against directory patterns and generic patterns.
    bool is_directory_excluded(const std::filesystem::path& dir);

    const std::filesystem::path& base_root() const { return base_root_; }
    const std::string& marker_name() const { return marker_name_; }
    bool ignore_all() const { return ignore_all_; }
    size_t cached_directories() const { return cache_.size(); }

private:
    // Root-relative path with '/' separators, nullopt outside the root.
    std::optional<std::string> relative_to_root(const std::filesystem::path& p) const;

    std::filesystem::path base_root_;
    bool ignore_all_;
    std::string marker_name_;
    std::map<std::filesystem::path, IgnoreRules> cache_;
    IgnoreRules empty_;
};

} // namespace treecopy

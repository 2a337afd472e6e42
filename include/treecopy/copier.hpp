#pragma once

#include <treecopy/cancel.hpp>
#include <treecopy/filter.hpp>
#include <treecopy/progress.hpp>
#include <treecopy/result.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace treecopy {

enum class CopyOutcome { Succeeded, Cancelled, Failed };

const char* outcome_name(CopyOutcome outcome);

struct CopyOptions {
    bool verbose = false;
    std::string marker_name = kDefaultMarkerName;
    // Apply exclusion rules while pre-counting. Off by default: the total
    // then counts every file under the source, excluded or not.
    bool filtered_total = false;
};

struct CopyReport {
    CopyOutcome outcome = CopyOutcome::Succeeded;
    size_t total_files = 0;
    size_t files_copied = 0;
    std::vector<std::string> errors;
    // Set when outcome is Failed
    std::string failure;

    bool succeeded() const { return outcome == CopyOutcome::Succeeded; }
};

// Copies source into destination, skipping whatever the marker files
// exclude. Failures on individual files or directories are collected and
// never stop the walk; only cancellation and unexpected errors do.
//
// One instance runs one copy at a time.
class TreeCopier {
public:
    TreeCopier(std::filesystem::path source,
               std::filesystem::path destination,
               CopyOptions options = {});

    // Defaults to NullProgress
    void set_progress_factory(ProgressFactory factory);

    // Polled before every directory entry. May be null.
    void set_cancel_token(const CancelToken* token) { cancel_ = token; }

    // Number of regular files under the source. Exclusion rules only
    // apply when CopyOptions::filtered_total is set.
    size_t count_files(bool ignore_filters);

    // Run the copy. With ignore_filters every marker file is disregarded.
    CopyReport copy(bool ignore_filters = false);

    const std::filesystem::path& source() const { return source_; }
    const std::filesystem::path& destination() const { return destination_; }
    size_t files_copied() const { return files_copied_; }
    const std::vector<std::string>& errors() const { return errors_; }

private:
    size_t count_tree(const std::filesystem::path& dir, FilterResolver* filter);

    Status copy_recursive(const std::filesystem::path& src,
                          const std::filesystem::path& dst,
                          FilterResolver& filter,
                          Progress& progress);

    void copy_file(const std::filesystem::path& src,
                   const std::filesystem::path& dst,
                   Progress& progress);

    Status check_cancelled() const;
    void record_error(const TreecopyError& err);

    std::filesystem::path source_;
    std::filesystem::path destination_;
    CopyOptions options_;
    ProgressFactory progress_factory_;
    const CancelToken* cancel_ = nullptr;

    size_t files_copied_ = 0;
    std::vector<std::string> errors_;
};

// Human-readable end-of-run summary. The error list is only included
// when `verbose` is set.
std::string format_summary(const CopyReport& report, bool verbose);

} // namespace treecopy

#include <treecopy/copier.hpp>
#include <treecopy/log.hpp>

#include <exception>

namespace fs = std::filesystem;

namespace treecopy {

const char* outcome_name(CopyOutcome outcome) {
    switch (outcome) {
        case CopyOutcome::Succeeded: return "succeeded";
        case CopyOutcome::Cancelled: return "cancelled";
        case CopyOutcome::Failed:    return "failed";
    }
    return "unknown";
}

static bool is_permission_error(const std::error_code& ec) {
    return ec == std::errc::permission_denied ||
           ec == std::errc::operation_not_permitted;
}

// "Permission denied copying '/a/b': ..." or "OS error copying '/a/b': ..."
static TreecopyError item_error(const char* action, const fs::path& p,
                                const std::error_code& ec) {
    std::string detail = std::string(action) + " '" + p.string() + "': " + ec.message();
    if (is_permission_error(ec)) {
        return TreecopyError{TreecopyError::Permission, "Permission denied " + detail};
    }
    return TreecopyError{TreecopyError::IO, "OS error " + detail};
}

// Content, modification time and permission bits
static Status copy_with_metadata(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) return item_error("copying", src, ec);

    auto mtime = fs::last_write_time(src, ec);
    if (!ec) fs::last_write_time(dst, mtime, ec);
    if (ec) return item_error("copying", src, ec);

    auto st = fs::status(src, ec);
    if (!ec) fs::permissions(dst, st.permissions(), fs::perm_options::replace, ec);
    if (ec) return item_error("copying", src, ec);

    return ok_status();
}

TreeCopier::TreeCopier(fs::path source, fs::path destination, CopyOptions options)
    : source_(std::move(source)),
      destination_(std::move(destination)),
      options_(std::move(options)),
      progress_factory_(terminal_progress_factory(false, false)) {}

void TreeCopier::set_progress_factory(ProgressFactory factory) {
    progress_factory_ = std::move(factory);
}

Status TreeCopier::check_cancelled() const {
    if (cancel_ && cancel_->requested()) {
        return TreecopyError{TreecopyError::Cancelled, "operation cancelled by user"};
    }
    return ok_status();
}

void TreeCopier::record_error(const TreecopyError& err) {
    if (options_.verbose) log::warn("%s", err.message.c_str());
    errors_.push_back(err.message);
}

size_t TreeCopier::count_files(bool ignore_filters) {
    if (!options_.filtered_total) return count_tree(source_, nullptr);

    FilterResolver filter(source_, ignore_filters, options_.marker_name);
    return count_tree(source_, &filter);
}

size_t TreeCopier::count_tree(const fs::path& dir, FilterResolver* filter) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return 0;

    size_t count = 0;
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        auto st = it->status(type_ec);
        if (type_ec) continue;

        const fs::path& item = it->path();
        if (fs::is_regular_file(st)) {
            if (filter && filter->is_file_excluded(item)) continue;
            count++;
        } else if (fs::is_directory(st)) {
            if (filter && filter->is_directory_excluded(item)) continue;
            count += count_tree(item, filter);
        }
    }
    return count;
}

CopyReport TreeCopier::copy(bool ignore_filters) {
    files_copied_ = 0;
    errors_.clear();

    log::debug("copying from: %s", source_.c_str());
    log::debug("copying to: %s", destination_.c_str());
    if (ignore_filters) log::debug("%s files are ignored", options_.marker_name.c_str());

    CopyReport report;
    FilterResolver filter(source_, ignore_filters, options_.marker_name);

    report.total_files = options_.filtered_total
        ? count_tree(source_, &filter)
        : count_tree(source_, nullptr);

    if (report.total_files == 0) {
        log::info("No files to copy.");
        return report;
    }

    try {
        ProgressScope progress(progress_factory_(report.total_files));
        auto status = copy_recursive(source_, destination_, filter, *progress);
        if (status.is_err()) {
            if (status.error().code == TreecopyError::Cancelled) {
                report.outcome = CopyOutcome::Cancelled;
            } else {
                report.outcome = CopyOutcome::Failed;
                report.failure = status.error().message;
            }
        }
    } catch (const std::exception& e) {
        report.outcome = CopyOutcome::Failed;
        report.failure = e.what();
    }

    if (report.outcome == CopyOutcome::Cancelled) {
        log::warn("Operation cancelled by user.");
    } else if (report.outcome == CopyOutcome::Failed) {
        log::error("Critical error during copy operation: %s", report.failure.c_str());
    }
    log::debug("%zu directories had rules resolved", filter.cached_directories());

    report.files_copied = files_copied_;
    report.errors = errors_;
    return report;
}

Status TreeCopier::copy_recursive(const fs::path& src, const fs::path& dst,
                                  FilterResolver& filter, Progress& progress) {
    TREECOPY_TRY(check_cancelled());

    std::error_code ec;
    fs::create_directories(dst, ec);
    if (!ec && !fs::is_directory(dst, ec) && !ec) {
        ec = std::make_error_code(std::errc::not_a_directory);
    }
    if (ec) {
        record_error(item_error("creating", dst, ec));
        return ok_status();
    }

    fs::directory_iterator it(src, ec);
    if (ec) {
        record_error(item_error("accessing", src, ec));
        return ok_status();
    }

    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        TREECOPY_TRY(check_cancelled());

        // Broken symlinks and entries that vanished are skipped
        std::error_code type_ec;
        auto st = it->status(type_ec);
        if (type_ec) continue;

        const fs::path& item = it->path();
        fs::path dest_item = dst / item.filename();

        if (fs::is_regular_file(st)) {
            if (filter.is_file_excluded(item)) {
                log::trace("excluded: %s", item.c_str());
                continue;
            }
            copy_file(item, dest_item, progress);
        } else if (fs::is_directory(st)) {
            if (filter.is_directory_excluded(item)) {
                log::trace("excluded directory: %s", item.c_str());
                continue;
            }
            TREECOPY_TRY(copy_recursive(item, dest_item, filter, progress));
        }
    }

    if (ec) record_error(item_error("accessing", src, ec));
    return ok_status();
}

void TreeCopier::copy_file(const fs::path& src, const fs::path& dst, Progress& progress) {
    auto status = copy_with_metadata(src, dst);
    if (status.is_err()) {
        // A failed file still counts as processed
        record_error(status.error());
        progress.advance();
        return;
    }

    files_copied_++;
    if (options_.verbose) {
        progress.advance_with_message("Copied: " + src.filename().string());
    } else {
        progress.advance();
    }
}

std::string format_summary(const CopyReport& report, bool verbose) {
    std::string out;
    if (report.outcome == CopyOutcome::Succeeded) {
        out += "Copy completed: ";
    } else {
        out += std::string("Copy ") + outcome_name(report.outcome) + ": ";
    }
    out += std::to_string(report.files_copied) + " files copied";
    if (report.total_files != report.files_copied) {
        out += " (" + std::to_string(report.total_files) + " counted)";
    }
    out += "\n";

    if (!report.errors.empty()) {
        out += "Errors encountered: " + std::to_string(report.errors.size()) + "\n";
        if (verbose) {
            for (const auto& err : report.errors) {
                out += "  Error: " + err + "\n";
            }
        }
    }
    return out;
}

} // namespace treecopy

#pragma once

#include <chrono>
#include <cstdio>
#include <functional>
#include <memory>
#include <string>

namespace treecopy {

// Counter of processed files against a total fixed at construction.
// Subclasses decide how (and whether) progress is rendered.
class Progress {
public:
    explicit Progress(size_t total) : total_(total) {}
    virtual ~Progress() = default;

    Progress(const Progress&) = delete;
    Progress& operator=(const Progress&) = delete;

    void advance(size_t n = 1);
    void advance_with_message(const std::string& message, size_t n = 1);

    // Idempotent. Advancing a closed progress still counts but renders nothing.
    void close();

    size_t total() const { return total_; }
    size_t current() const { return current_; }
    bool closed() const { return closed_; }

protected:
    // `message` is null for a bare advance
    virtual void render(const std::string* message) = 0;
    virtual void finish() {}

private:
    size_t total_;
    size_t current_ = 0;
    bool closed_ = false;
};

// Counts, renders nothing
class NullProgress : public Progress {
public:
    using Progress::Progress;

protected:
    void render(const std::string*) override {}
};

// Verbose: "[current/total] message" lines on stdout, bare advances silent.
// Otherwise: a single redrawn bar line on stderr, throttled, only when
// stderr is a terminal.
class TerminalProgress : public Progress {
public:
    TerminalProgress(size_t total, bool verbose);
    ~TerminalProgress() override;

protected:
    void render(const std::string* message) override;
    void finish() override;

private:
    void draw_bar();
    void clear_line();

    bool verbose_;
    bool draw_;
    bool line_dirty_ = false;
    std::string last_message_;
    std::chrono::steady_clock::time_point last_draw_{};
};

using ProgressFactory = std::function<std::unique_ptr<Progress>(size_t total)>;

// Factory for TerminalProgress, or NullProgress when `enabled` is false
ProgressFactory terminal_progress_factory(bool verbose, bool enabled = true);

// Owns a progress handle and closes it when the scope ends, whichever
// way it ends.
class ProgressScope {
public:
    explicit ProgressScope(std::unique_ptr<Progress> progress)
        : progress_(std::move(progress)) {}
    ~ProgressScope() {
        if (progress_) progress_->close();
    }

    ProgressScope(const ProgressScope&) = delete;
    ProgressScope& operator=(const ProgressScope&) = delete;

    Progress& operator*() { return *progress_; }
    Progress* operator->() { return progress_.get(); }

private:
    std::unique_ptr<Progress> progress_;
};

} // namespace treecopy

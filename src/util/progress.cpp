#include <treecopy/progress.hpp>
#include <treecopy/log.hpp>

#include <unistd.h>

namespace treecopy {

static constexpr int kBarWidth = 30;
static constexpr auto kRedrawInterval = std::chrono::milliseconds(100);
static constexpr size_t kMaxMessageWidth = 40;

void Progress::advance(size_t n) {
    current_ += n;
    if (!closed_) render(nullptr);
}

void Progress::advance_with_message(const std::string& message, size_t n) {
    current_ += n;
    if (!closed_) render(&message);
}

void Progress::close() {
    if (closed_) return;
    closed_ = true;
    finish();
}

TerminalProgress::TerminalProgress(size_t total, bool verbose)
    : Progress(total),
      verbose_(verbose),
      draw_(!verbose && isatty(fileno(stderr))) {
    if (draw_) {
        log::set_pre_write_hook([this] { clear_line(); });
        draw_bar();
    }
}

TerminalProgress::~TerminalProgress() {
    close();
}

void TerminalProgress::render(const std::string* message) {
    if (verbose_) {
        if (message) {
            std::printf("[%zu/%zu] %s\n", current(), total(), message->c_str());
            std::fflush(stdout);
        }
        return;
    }
    if (!draw_) return;

    if (message) last_message_ = *message;
    auto now = std::chrono::steady_clock::now();
    if (current() < total() && now - last_draw_ < kRedrawInterval) return;
    last_draw_ = now;
    draw_bar();
}

void TerminalProgress::draw_bar() {
    double frac = total() > 0
        ? static_cast<double>(current()) / static_cast<double>(total())
        : 1.0;
    if (frac > 1.0) frac = 1.0;
    int filled = static_cast<int>(frac * kBarWidth);

    std::string bar(static_cast<size_t>(filled), '#');
    bar.resize(kBarWidth, ' ');

    std::string tail = last_message_;
    if (tail.size() > kMaxMessageWidth) {
        tail = "..." + tail.substr(tail.size() - (kMaxMessageWidth - 3));
    }

    std::fprintf(stderr, "\rCopying files: %3.0f%%|%s| %zu/%zu files %s\033[K",
                 frac * 100.0, bar.c_str(), current(), total(), tail.c_str());
    std::fflush(stderr);
    line_dirty_ = true;
}

void TerminalProgress::clear_line() {
    if (!line_dirty_) return;
    std::fprintf(stderr, "\r\033[K");
    line_dirty_ = false;
}

void TerminalProgress::finish() {
    if (!draw_) return;
    log::set_pre_write_hook(nullptr);
    draw_bar();
    std::fprintf(stderr, "\n");
    std::fflush(stderr);
    line_dirty_ = false;
}

ProgressFactory terminal_progress_factory(bool verbose, bool enabled) {
    if (!enabled) {
        return [](size_t total) -> std::unique_ptr<Progress> {
            return std::make_unique<NullProgress>(total);
        };
    }
    return [verbose](size_t total) -> std::unique_ptr<Progress> {
        return std::make_unique<TerminalProgress>(total, verbose);
    };
}

} // namespace treecopy

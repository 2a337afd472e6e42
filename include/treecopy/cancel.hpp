#pragma once

#include <csignal>

namespace treecopy {

// Cooperative cancellation flag. Safe to set from a signal handler.
class CancelToken {
public:
    void request() { requested_ = 1; }
    void reset() { requested_ = 0; }
    bool requested() const { return requested_ != 0; }

private:
    volatile std::sig_atomic_t requested_ = 0;
};

// Token set by SIGINT once install_interrupt_handler() has run.
CancelToken& interrupt_token();

// Route SIGINT to interrupt_token(). Returns false if sigaction failed.
bool install_interrupt_handler();

} // namespace treecopy

#include <treecopy/cancel.hpp>

#include <signal.h>

namespace treecopy {

static CancelToken s_interrupt_token;

static void on_sigint(int) {
    s_interrupt_token.request();
}

CancelToken& interrupt_token() {
    return s_interrupt_token;
}

bool install_interrupt_handler() {
    struct sigaction sa {};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    return sigaction(SIGINT, &sa, nullptr) == 0;
}

} // namespace treecopy

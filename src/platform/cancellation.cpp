#include "scfw/cancellation.hpp"

#include <csignal>

namespace scfw {

namespace {

// Raw pointer to the interrupt flag; only lock-free atomics are touched
// from the signal handler.
std::atomic<bool>* g_interrupt_flag = nullptr;

extern "C" void handle_interrupt(int) {
    if (g_interrupt_flag) {
        g_interrupt_flag->store(true);
    }
}

} // namespace

CancellationToken& interrupt_token() {
    static CancellationToken token;
    return token;
}

void install_interrupt_handlers() {
    g_interrupt_flag = interrupt_token().flag_.get();

    struct sigaction sa {};
    sa.sa_handler = handle_interrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace scfw

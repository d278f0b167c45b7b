#include "interrupt.hpp"

namespace progcp::infra {

std::atomic<bool> g_interrupted{false};

namespace {

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace progcp::infra

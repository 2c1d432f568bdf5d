#include "interrupt.hpp"

namespace s3pull::infra {

std::atomic<bool> g_interrupted{false};

namespace {

// Только async-signal-safe: о прерывании логирует тот, кто увидит флаг
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

} // namespace s3pull::infra

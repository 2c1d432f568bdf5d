#pragma once

#include <atomic>
#include <csignal>

namespace s3pull::infra {

extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

// Только для тестов и повторного запуска в одном процессе
inline void reset_interrupted() {
    g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace s3pull::infra

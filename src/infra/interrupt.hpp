#pragma once

#include <atomic>
#include <csignal>

namespace progcp::infra {

extern std::atomic<bool> g_interrupted;

// SIGINT/SIGTERM только выставляют флаг, движок проверяет его между чанками
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

} // namespace progcp::infra

#include "ticker.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sys/time.h>

namespace progcp::infra {

namespace {

std::atomic<bool> g_tick_pending{false};
std::atomic<bool> g_ticker_alive{false};

void tick_handler(int) {
    g_tick_pending.store(true, std::memory_order_relaxed);
}

auto set_timer(std::chrono::milliseconds interval) -> int {
    const auto usec = std::chrono::duration_cast<std::chrono::microseconds>(interval).count();
    struct ::itimerval timer{};
    timer.it_interval.tv_sec = static_cast<time_t>(usec / 1'000'000);
    timer.it_interval.tv_usec = static_cast<suseconds_t>(usec % 1'000'000);
    timer.it_value = timer.it_interval;
    return ::setitimer(ITIMER_REAL, &timer, nullptr);
}

} // namespace

auto Ticker::start(std::chrono::milliseconds interval) -> Result<std::unique_ptr<Ticker>> {
    if (interval.count() <= 0) {
        return std::unexpected(make_error(ErrorCode::Unknown,
            fmt::format("Invalid tick interval: {} ms", interval.count())));
    }
    if (g_ticker_alive.exchange(true)) {
        return std::unexpected(make_error(ErrorCode::Unknown, "A ticker is already running"));
    }

    auto ticker = std::make_unique<Ticker>(Key{});

    struct sigaction action{};
    action.sa_handler = tick_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0; // без SA_RESTART: read() вернёт EINTR
    if (::sigaction(SIGALRM, &action, &ticker->previous_) == -1) {
        g_ticker_alive.store(false);
        return std::unexpected(make_error(ErrorCode::Unknown,
            fmt::format("sigaction(SIGALRM) failed: {}", std::strerror(errno))));
    }

    g_tick_pending.store(false);
    if (set_timer(interval) == -1) {
        const int err = errno;
        if (::sigaction(SIGALRM, &ticker->previous_, nullptr) == -1) {
            spdlog::warn("Failed to restore SIGALRM handler: {}", std::strerror(errno));
        }
        g_ticker_alive.store(false);
        return std::unexpected(make_error(ErrorCode::Unknown,
            fmt::format("setitimer failed: {}", std::strerror(err))));
    }

    spdlog::debug("Ticker armed every {} ms", interval.count());
    return ticker;
}

Ticker::~Ticker() {
    if (set_timer(std::chrono::milliseconds{0}) == -1) {
        spdlog::warn("Failed to disarm ticker: {}", std::strerror(errno));
    }
    if (::sigaction(SIGALRM, &previous_, nullptr) == -1) {
        spdlog::warn("Failed to restore SIGALRM handler: {}", std::strerror(errno));
    }
    g_tick_pending.store(false);
    g_ticker_alive.store(false);
}

auto Ticker::consume() -> bool {
    return g_tick_pending.exchange(false, std::memory_order_relaxed);
}

} // namespace progcp::infra

#pragma once

#include <chrono>
#include <memory>
#include <csignal>
#include "error_handler/error.hpp"

namespace progcp::infra {

/// Periodic SIGALRM timer that raises a flag for the copy loop.
///
/// The handler is installed without SA_RESTART, so a blocking read() is
/// interrupted with EINTR on every tick and the loop gets a chance to
/// sample and redraw even when no data arrives. Only one Ticker may be
/// alive at a time; destruction disarms the timer and restores the
/// previous SIGALRM disposition.
class Ticker {
    // Создать Ticker можно только через start()
    struct Key {
        explicit Key() = default;
    };

public:
    [[nodiscard]] static auto start(std::chrono::milliseconds interval)
        -> Result<std::unique_ptr<Ticker>>;

    explicit Ticker(Key) {}
    ~Ticker();

    Ticker(const Ticker&) = delete;
    Ticker& operator=(const Ticker&) = delete;

    // true, если с прошлого вызова был хотя бы один тик
    [[nodiscard]] auto consume() -> bool;

private:
    struct sigaction previous_{};
};

} // namespace progcp::infra

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>
#include <unistd.h>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/ticker.hpp"
#include "../display/display_renderer.hpp"
#include "../stats/stats_tracker.hpp"

namespace progcp::core {

struct CopyJob {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::optional<std::uint64_t> size;
};

struct CopyStatsSnapshot {
    std::uint64_t files_copied = 0;
    std::uint64_t bytes_copied = 0;
    std::uint64_t errors = 0;
};

/// Sequential copy loop that feeds StatsTracker and, when a renderer is
/// given, redraws the status lines on stderr at the configured interval.
class CopyEngine {
public:
    // renderer == nullptr: без отображения прогресса.
    // display_fd: куда выводятся строки статуса (по умолчанию stderr)
    CopyEngine(const infra::Config& config, DisplayRenderer* renderer,
               int display_fd = STDERR_FILENO);

    [[nodiscard]] auto run(const std::vector<std::filesystem::path>& sources,
                           const std::filesystem::path& destination)
        -> infra::Result<CopyStatsSnapshot>;

    /// Expands sources into per-file jobs in copy order.
    [[nodiscard]] auto plan(const std::vector<std::filesystem::path>& sources,
                            const std::filesystem::path& destination) const
        -> infra::Result<std::vector<CopyJob>>;

    [[nodiscard]] auto tracker() const -> const StatsTracker& { return tracker_; }

private:
    [[nodiscard]] auto copy_one_(const CopyJob& job, std::vector<char>& buffer) -> infra::VoidResult;
    [[nodiscard]] auto sample_(std::uint64_t bytes) -> infra::VoidResult;
    [[nodiscard]] auto tick_() -> infra::VoidResult;
    void redraw_();

    const infra::Config& config_;
    DisplayRenderer* renderer_;
    int display_fd_;
    std::unique_ptr<infra::Ticker> ticker_;
    StatsTracker tracker_;
    CopyStatsSnapshot stats_{};
};

} // namespace progcp::core

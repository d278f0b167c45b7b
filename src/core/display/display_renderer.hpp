#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "line.hpp"
#include "../stats/stats_tracker.hpp"
#include "../../infra/terminal/terminal.hpp"

namespace progcp::core {

struct DisplayOptions {
    std::size_t max_width = infra::kDefaultTerminalWidth;
    std::string bar_glyphs = " ▏▎▍▌▋▊▉█";
    std::vector<std::string> spinner = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
    // Бар не показывается, если ему остаётся меньше колонок
    std::size_t bar_min_width = 10;
};

/// Превращает снимок StatsTracker в одну или две строки статуса и
/// перерисовывает их на месте предыдущих.
///
/// One line when the batch holds a single file. Otherwise a per-file line
/// plus a "Total" line while a file is active, and only the "Total" line
/// once the batch is over. Not thread-safe, same contract as StatsTracker.
class DisplayRenderer {
public:
    explicit DisplayRenderer(const infra::ControlSequences& controls, DisplayOptions options = {});

    /// Text to write to the status stream for this tick, including the
    /// cursor movement over the previous render.
    [[nodiscard]] auto render_tick(const StatsTracker& tracker, std::size_t terminal_width) -> std::string;

    /// Leaves the last render on screen: the next tick starts below it.
    void finish() { lines_written_ = 0; }

    [[nodiscard]] auto lines_written() const -> std::size_t { return lines_written_; }
    [[nodiscard]] auto options() const -> const DisplayOptions& { return options_; }

private:
    [[nodiscard]] auto build_single_line_(const StatsTracker& tracker) const -> Line;
    [[nodiscard]] auto build_file_line_(const StatsTracker& tracker) const -> Line;
    [[nodiscard]] auto build_total_line_(const StatsTracker& tracker) const -> Line;

    void add_progress_(Line& line,
                       std::optional<std::uint64_t> size,
                       std::uint64_t done,
                       std::optional<double> rate) const;
    [[nodiscard]] auto spinner_glyph_() const -> std::string;

    const infra::ControlSequences& controls_;
    DisplayOptions options_;
    std::size_t lines_written_ = 0;
    std::size_t spinner_frame_ = 0;
};

} // namespace progcp::core

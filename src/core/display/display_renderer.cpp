#include "display_renderer.hpp"
#include <algorithm>
#include <utility>
#include <fmt/core.h>
#include "format.hpp"

namespace progcp::core {

namespace {

// Приоритеты сегментов: 0 выводится всегда
constexpr std::size_t kMandatory = 0;
constexpr std::size_t kInstantRate = 1;
constexpr std::size_t kEtaOrSpinner = 2;
constexpr std::size_t kPercent = 3;
constexpr std::size_t kBar = 4;

auto summary(std::uint64_t bytes, Seconds elapsed, std::optional<double> rate) -> std::string {
    return fmt::format("{} {} [{}]", format_bytes(bytes), format_duration(elapsed), format_rate(rate));
}

auto digits(std::size_t value) -> std::size_t {
    return fmt::formatted_size("{}", value);
}

} // namespace

DisplayRenderer::DisplayRenderer(const infra::ControlSequences& controls, DisplayOptions options)
    : controls_(controls)
    , options_(std::move(options))
{}

auto DisplayRenderer::render_tick(const StatsTracker& tracker, std::size_t terminal_width) -> std::string {
    if (terminal_width == 0) {
        terminal_width = infra::kDefaultTerminalWidth;
    }
    const auto width = std::min(terminal_width, options_.max_width);

    std::vector<Line> lines;
    if (tracker.file_count() == 1) {
        lines.push_back(build_single_line_(tracker));
    } else if (tracker.file_count() > 1) {
        if (tracker.has_current()) {
            lines.push_back(build_file_line_(tracker));
        }
        lines.push_back(build_total_line_(tracker));
    }
    ++spinner_frame_;

    std::string out = controls_.cursor_up(lines_written_);
    for (const auto& line : lines) {
        out += line.render(width);
        out += controls_.clear_to_eol();
        out += '\n';
    }

    // Строки прошлой отрисовки, которые больше не нужны
    const auto stale = lines_written_ > lines.size() ? lines_written_ - lines.size() : 0;
    for (std::size_t i = 0; i < stale; ++i) {
        out += controls_.clear_to_eol();
        out += '\n';
    }
    out += controls_.cursor_up(stale);

    lines_written_ = lines.size();
    return out;
}

auto DisplayRenderer::build_single_line_(const StatsTracker& tracker) const -> Line {
    // С одним файлом батч и файл совпадают, а батч переживает конец передачи
    const auto& rates = tracker.throughput();
    Line line;
    line.add(kMandatory, summary(tracker.total_bytes_done(), tracker.batch_elapsed(), rates.average));
    line.add(kInstantRate, fmt::format(" [{}]", format_rate(rates.instant)));
    add_progress_(line, tracker.total_size(), tracker.total_bytes_done(), rates.smoothed);
    return line;
}

auto DisplayRenderer::build_file_line_(const StatsTracker& tracker) const -> Line {
    const auto count = tracker.file_count();
    const auto& rates = tracker.throughput();
    Line line;
    line.add(kMandatory, fmt::format("{:>{}}/{} {}",
        tracker.current_index(), digits(count), count,
        summary(tracker.file_bytes_done(), tracker.file_elapsed(), rates.instant)));
    add_progress_(line, tracker.file_size(), tracker.file_bytes_done(), rates.smoothed);
    return line;
}

auto DisplayRenderer::build_total_line_(const StatsTracker& tracker) const -> Line {
    const auto& rates = tracker.throughput();
    Line line;
    line.add(kMandatory, fmt::format("Total {}",
        summary(tracker.total_bytes_done(), tracker.batch_elapsed(), rates.average)));
    add_progress_(line, tracker.total_size(), tracker.total_bytes_done(), rates.smoothed);
    return line;
}

void DisplayRenderer::add_progress_(Line& line,
                                    std::optional<std::uint64_t> size,
                                    std::uint64_t done,
                                    std::optional<double> rate) const {
    const auto eta = render_eta(size, done, rate);
    if (eta.empty()) {
        line.add(kEtaOrSpinner, " " + spinner_glyph_());
    } else {
        line.add(kEtaOrSpinner, " ETA " + eta);
    }

    if (!size) {
        return;
    }

    const double fraction = completion(done, *size);
    line.add(kPercent, " " + format_percent(fraction));

    line.add(kBar, " [");
    line.add_deferred(kBar, [fraction, glyphs = options_.bar_glyphs](std::size_t width) {
        return progress_bar(width, fraction, glyphs);
    }, options_.bar_min_width);
    line.add(kBar, "]");
}

auto DisplayRenderer::spinner_glyph_() const -> std::string {
    if (options_.spinner.empty()) {
        return " ";
    }
    return options_.spinner[spinner_frame_ % options_.spinner.size()];
}

} // namespace progcp::core

#include "format.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <fmt/core.h>
#include "../../infra/terminal/terminal.hpp"

namespace progcp::core {

namespace {

constexpr std::array<std::string_view, 9> kUnits = {"B", "K", "M", "G", "T", "P", "E", "Z", "Y"};
constexpr std::uint64_t kUnitStep = 1024;

auto clamp_fraction(double fraction) -> double {
    if (!(fraction > 0.0)) return 0.0; // в том числе NaN
    return std::min(fraction, 1.0);
}

auto pad_left(const std::string& text, std::size_t width) -> std::string {
    const auto used = infra::display_width(text);
    if (used >= width) return text;
    return std::string(width - used, ' ') + text;
}

// После округления до decimals знаков значение перестаёт быть меньше 1024
auto rounds_to_next_unit(double scaled, int decimals) -> bool {
    const double step = std::pow(10.0, decimals);
    return std::round(scaled * step) / step >= static_cast<double>(kUnitStep);
}

auto format_scaled(double scaled, std::size_t unit, std::size_t width) -> std::string {
    const bool has_next = unit + 1 < kUnits.size();
    for (const int decimals : {2, 1, 0}) {
        auto text = fmt::format("{:.{}f}{}", scaled, decimals, kUnits[unit]);
        if (text.size() > width) {
            continue;
        }
        if (has_next && rounds_to_next_unit(scaled, decimals)) {
            return format_scaled(scaled / static_cast<double>(kUnitStep), unit + 1, width);
        }
        return pad_left(text, width);
    }
    if (has_next && rounds_to_next_unit(scaled, 0)) {
        return format_scaled(scaled / static_cast<double>(kUnitStep), unit + 1, width);
    }
    return fmt::format("{:.0f}{}", scaled, kUnits[unit]);
}

} // namespace

auto format_bytes(std::uint64_t value, std::size_t width) -> std::string {
    std::size_t unit = 0;
    std::uint64_t scale = 1;
    // 2^64 / 1024^6 < 1024, поэтому scale не переполняется
    while (unit + 1 < kUnits.size() && value / scale >= kUnitStep) {
        scale *= kUnitStep;
        ++unit;
    }

    if (value % scale == 0) {
        return pad_left(fmt::format("{}{}", value / scale, kUnits[unit]), width);
    }

    return format_scaled(static_cast<double>(value) / static_cast<double>(scale), unit, width);
}

auto format_rate(std::optional<double> bytes_per_sec) -> std::string {
    if (!bytes_per_sec || !std::isfinite(*bytes_per_sec)) {
        return fmt::format("{:>{}}/s", "?", kBytesFieldWidth);
    }
    const auto rounded = static_cast<std::uint64_t>(std::llround(std::max(0.0, *bytes_per_sec)));
    return format_bytes(rounded) + "/s";
}

auto format_duration(Seconds duration) -> std::string {
    const double raw = duration.count();
    const auto total = (std::isfinite(raw) && raw > 0.0)
        ? static_cast<std::uint64_t>(raw)
        : std::uint64_t{0};

    const auto days = total / 86400;
    const auto hours = (total % 86400) / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;

    if (days > 0) {
        return fmt::format("{} days, {:02d}:{:02d}:{:02d}", days, hours, minutes, seconds);
    }
    return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
}

auto render_eta(std::optional<std::uint64_t> total,
                std::uint64_t done,
                std::optional<double> rate) -> std::string {
    if (!total || *total == 0) {
        return {};
    }

    const std::uint64_t remaining = *total > done ? *total - done : 0;
    if (remaining == 0) {
        return "00:00:00";
    }
    if (rate && *rate > 0.0 && std::isfinite(*rate)) {
        return format_duration(Seconds{static_cast<double>(remaining) / *rate});
    }
    return "??:??:??";
}

auto progress_bar(std::size_t width, double fraction, std::string_view ramp) -> std::string {
    const auto glyphs = infra::split_glyphs(ramp);
    if (glyphs.size() < 2 || width == 0) {
        return std::string(width, ' ');
    }

    const auto& background = glyphs.front();
    const auto& fill = glyphs.back();
    const double progress = clamp_fraction(fraction) * static_cast<double>(width);
    const auto filled = std::min(width, static_cast<std::size_t>(std::floor(progress)));

    std::string bar;
    bar.reserve(width * fill.size());
    for (std::size_t i = 0; i < filled; ++i) {
        bar += fill;
    }
    if (filled == width) {
        return bar;
    }

    // Глифы ramp[0 .. size-2] делят ячейку на size-1 ступеней
    const double within = progress - static_cast<double>(filled);
    const auto steps = glyphs.size() - 1;
    const auto index = std::min(steps - 1, static_cast<std::size_t>(within * static_cast<double>(steps)));
    bar += glyphs[index];

    for (std::size_t i = filled + 1; i < width; ++i) {
        bar += background;
    }
    return bar;
}

auto completion(std::uint64_t done, std::uint64_t size) -> double {
    if (size == 0) return 1.0;
    return clamp_fraction(static_cast<double>(done) / static_cast<double>(size));
}

auto format_percent(double fraction) -> std::string {
    const auto percent = static_cast<int>(std::floor(clamp_fraction(fraction) * 100.0));
    return fmt::format("{:3d}%", percent);
}

} // namespace progcp::core

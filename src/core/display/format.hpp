#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "../stats/stats_tracker.hpp"

namespace progcp::core {

inline constexpr std::size_t kBytesFieldWidth = 5;

/// Binary-prefixed size (B, K, M, ... Y) right-aligned in `width` columns.
/// Exact multiples of the chosen unit are printed without decimals,
/// otherwise the most precise of 2, 1 or 0 decimals that still fits.
[[nodiscard]] auto format_bytes(std::uint64_t value, std::size_t width = kBytesFieldWidth) -> std::string;

// "12.5M/s"; неизвестная скорость печатается как "?/s"
[[nodiscard]] auto format_rate(std::optional<double> bytes_per_sec) -> std::string;

/// "[N days, ]HH:MM:SS", дробная часть секунд отбрасывается.
[[nodiscard]] auto format_duration(Seconds duration) -> std::string;

/// ETA for `total - done` bytes at `rate` bytes/s.
///   - ""          total unknown or zero
///   - "00:00:00"  nothing left
///   - "??:??:??"  rate unknown or zero
[[nodiscard]] auto render_eta(std::optional<std::uint64_t> total,
                              std::uint64_t done,
                              std::optional<double> rate) -> std::string;

/// Bar of exactly `width` glyphs. `ramp` is background, intermediates, fill
/// (at least two glyphs); the cell after the filled part shows the
/// intermediate glyph matching the fractional progress inside that cell.
[[nodiscard]] auto progress_bar(std::size_t width, double fraction, std::string_view ramp) -> std::string;

// Доля выполненного, размер 0 считается завершённым
[[nodiscard]] auto completion(std::uint64_t done, std::uint64_t size) -> double;

[[nodiscard]] auto format_percent(double fraction) -> std::string;

} // namespace progcp::core

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <expected>

namespace progcp::args_parser {

struct CLIArgs
{
    std::vector<std::string> sources;           // позиционные, кроме последнего
    std::string destination;                    // последний позиционный аргумент
    bool recursive{false};                      // -r, --recursive
    bool quiet{false};                          // -q, --quiet
    bool verbose{false};                        // -v, --verbose
    bool no_progress{false};                    // --no-progress
    std::optional<std::size_t> buffer_size;     // --buffer-size=BYTES
    std::optional<std::uint32_t> interval_ms;   // --interval=MS
    std::optional<std::size_t> max_width;       // --max-width=COLUMNS
};

/// Parses command-line arguments.
/// On --help, --version or a parse error returns the process exit code
/// instead (CLI11 has already printed the message).
[[nodiscard]] auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>;

} // namespace progcp::args_parser

#include "args_parser.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <git_info.hpp>

namespace progcp::args_parser {

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int> {
    CLI::App app{"Copy files with a live progress display", "progcp"};
    app.set_version_flag("--version", fmt::format("progcp {} ({}{})",
        build_info::version,
        build_info::git_commit_short,
        build_info::git_dirty ? "-dirty" : ""));

    CLIArgs args;
    std::vector<std::string> paths;
    std::size_t buffer_size = 0;
    std::uint32_t interval_ms = 0;
    std::size_t max_width = 0;

    app.add_option("paths", paths, "SOURCE... DEST")->required();
    app.add_flag("-r,--recursive", args.recursive, "Copy directories recursively");
    app.add_flag("-q,--quiet", args.quiet, "Only report errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("--no-progress", args.no_progress, "Do not draw the progress display");
    auto* buffer_opt = app.add_option("--buffer-size", buffer_size, "Chunk size in bytes")
        ->check(CLI::PositiveNumber);
    auto* interval_opt = app.add_option("--interval", interval_ms, "Refresh interval in milliseconds")
        ->check(CLI::PositiveNumber);
    auto* width_opt = app.add_option("--max-width", max_width, "Maximum width of the display")
        ->check(CLI::Range(std::size_t{20}, std::size_t{1000}));

    try {
        app.parse(argc, argv);
        if (paths.size() < 2) {
            throw CLI::ValidationError("paths", "need at least one SOURCE and a DEST");
        }
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }

    args.destination = paths.back();
    paths.pop_back();
    args.sources = std::move(paths);

    if (*buffer_opt) args.buffer_size = buffer_size;
    if (*interval_opt) args.interval_ms = interval_ms;
    if (*width_opt) args.max_width = max_width;

    return args;
}

} // namespace progcp::args_parser

#include <cstdio>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <unistd.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/terminal/terminal.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/copy_engine/copy_engine.hpp"
#include "core/display/display_renderer.hpp"
#include "core/display/format.hpp"
#include <chrono>

using ARGS = progcp::args_parser::CLIArgs;

constexpr auto load_from_cli = progcp::infra::config_from_cli;
constexpr auto load_config_file = progcp::infra::load_config_from_file;
constexpr auto args_parser = progcp::args_parser::parse_args;

static auto
make_display_options(const progcp::infra::Config& config)
-> progcp::core::DisplayOptions {
    progcp::core::DisplayOptions options;
    if (config.max_width) options.max_width = *config.max_width;
    if (config.bar_glyphs) options.bar_glyphs = *config.bar_glyphs;
    if (!config.spinner.empty()) options.spinner = config.spinner;
    return options;
}

static auto
print_summary(const progcp::core::CopyStatsSnapshot& stats, std::chrono::milliseconds duration)
-> void {
    spdlog::info("Files copied: {}", stats.files_copied);
    spdlog::info("Bytes copied: {} ({})", stats.bytes_copied,
                 progcp::core::format_bytes(stats.bytes_copied, 0));
    spdlog::info("Errors: {}", stats.errors);
    spdlog::info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_default_logger(spdlog::stderr_color_mt("progcp"));
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        progcp::infra::install_signal_handler();

        auto args_res = args_parser(argc, argv);
        if (!args_res) {
            return args_res.error(); // --help, --version или ошибка
        }
        const ARGS& args = *args_res;

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));
        if (auto valid = config.validate(); !valid) {
            spdlog::error("Config error: {}", valid.error());
            return 1;
        }

        if (config.quiet) {
            spdlog::set_level(spdlog::level::warn);
        } else if (config.log_level) {
            spdlog::set_level(spdlog::level::from_str(*config.log_level));
        }

        std::vector<std::filesystem::path> source_paths(args.sources.begin(), args.sources.end());
        std::filesystem::path destination_path(args.destination);

        const bool show_progress = config.progress && !config.quiet
                                && progcp::infra::is_terminal(STDERR_FILENO);

        progcp::infra::AnsiControlSequences controls;
        progcp::core::DisplayRenderer renderer(controls, make_display_options(config));
        progcp::core::CopyEngine engine(config, show_progress ? &renderer : nullptr);

        const auto start_time = std::chrono::steady_clock::now();
        auto result = engine.run(source_paths, destination_path);
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (!result) {
            auto err = progcp::infra::log_and_return(std::move(result.error()));
            return err.to_exit_code();
        }

        const auto& stats = *result;
        print_summary(stats, duration);
        return stats.errors > 0 ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

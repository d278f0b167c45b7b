#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"
#include "../terminal/terminal.hpp"

namespace progcp::infra {

namespace {

constexpr std::size_t kMinWidth = 20;

auto get_config_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    // 1. Локальный файл
    paths.emplace_back(".progcp.yaml");

    // 2. Глобальный файл
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && std::filesystem::exists(config_home)) {
        paths.push_back(std::filesystem::path(config_home) / "progcp" / "config.yaml");
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "progcp" / "config.yaml");
        }
    }

    return paths;
}

} // namespace

void Config::merge_with(const Config& other) {
    if (other.buffer_size) buffer_size = other.buffer_size;
    if (other.refresh_interval_ms) refresh_interval_ms = other.refresh_interval_ms;
    if (other.max_width) max_width = other.max_width;
    if (other.bar_glyphs) bar_glyphs = other.bar_glyphs;
    if (!other.spinner.empty()) spinner = other.spinner;
    if (other.recursive) recursive = true;
    if (!other.progress) progress = false; // CLI может отключить
    if (other.quiet) quiet = true;
    if (other.log_level) log_level = other.log_level;
}

auto Config::validate() const -> std::expected<void, std::string> {
    if (buffer_size && *buffer_size == 0) {
        return std::unexpected("buffer_size must be positive");
    }
    if (refresh_interval_ms && *refresh_interval_ms == 0) {
        return std::unexpected("refresh_interval_ms must be positive");
    }
    if (max_width && *max_width < kMinWidth) {
        return std::unexpected(fmt::format("max_width must be at least {}", kMinWidth));
    }
    if (bar_glyphs && split_glyphs(*bar_glyphs).size() < 2) {
        return std::unexpected("bar_glyphs needs at least a background and a fill glyph");
    }
    if (log_level && spdlog::level::from_str(*log_level) == spdlog::level::off && *log_level != "off") {
        return std::unexpected(fmt::format("unknown log_level '{}'", *log_level));
    }
    return {};
}

auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>
{
    try {
        YAML::Node config = YAML::LoadFile(path.string());
        Config cfg{};

        if (config["buffer_size"]) cfg.buffer_size = config["buffer_size"].as<std::size_t>();
        if (config["refresh_interval_ms"]) cfg.refresh_interval_ms = config["refresh_interval_ms"].as<std::uint32_t>();
        if (config["max_width"]) cfg.max_width = config["max_width"].as<std::size_t>();
        if (config["bar_glyphs"]) cfg.bar_glyphs = config["bar_glyphs"].as<std::string>();
        if (config["spinner"]) {
            for (const auto& frame : config["spinner"]) {
                cfg.spinner.push_back(frame.as<std::string>());
            }
        }

        if (config["recursive"]) cfg.recursive = config["recursive"].as<bool>();
        if (config["progress"]) cfg.progress = config["progress"].as<bool>();
        if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
        if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

        if (auto valid = cfg.validate(); !valid) {
            return std::unexpected(fmt::format("Invalid {}: {}", path.string(), valid.error()));
        }

        spdlog::debug("Loaded config from {}", path.string());
        return cfg;

    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

auto load_config_from_file() -> std::expected<Config, std::string> {
    for (const auto& path : get_config_paths()) {
        if (!std::filesystem::exists(path)) continue;
        return load_config_from_path(path);
    }

    // Файл не найден: пустой конфиг, это не ошибка
    return Config{};
}

auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
    Config cfg{};
    cfg.buffer_size = args.buffer_size;
    cfg.refresh_interval_ms = args.interval_ms;
    cfg.max_width = args.max_width;
    cfg.recursive = args.recursive;
    cfg.progress = !args.no_progress;
    cfg.quiet = args.quiet;
    if (args.verbose) cfg.log_level = "debug";
    return cfg;
}

} // namespace progcp::infra

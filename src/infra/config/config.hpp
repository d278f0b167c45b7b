#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace progcp::args_parser {
    struct CLIArgs;
}

namespace progcp::infra {

inline constexpr std::size_t kDefaultBufferSize = 1024 * 1024;
inline constexpr std::uint32_t kDefaultRefreshIntervalMs = 500;

struct Config {
    // I/O
    std::optional<std::size_t> buffer_size;   // bytes

    // Display
    std::optional<std::uint32_t> refresh_interval_ms;
    std::optional<std::size_t> max_width;
    std::optional<std::string> bar_glyphs;    // фон, промежуточные, заполнение
    std::vector<std::string> spinner;

    // Behavior
    bool recursive = false;
    bool progress = true;
    bool quiet = false;
    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    // Проверка значений после слияния
    [[nodiscard]] auto validate() const -> std::expected<void, std::string>;
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.progcp.yaml
///   2. $XDG_CONFIG_HOME/progcp/config.yaml
///   3. ~/.config/progcp/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Parses one YAML file. The file must exist.
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

} // namespace progcp::infra

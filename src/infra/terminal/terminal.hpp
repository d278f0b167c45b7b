#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace progcp::infra {

inline constexpr std::size_t kDefaultTerminalWidth = 80;

/// Управляющие последовательности, которые рендерер вставляет в вывод.
/// Реализация передаётся рендереру, чтобы тесты могли подменить её
/// видимыми маркерами.
class ControlSequences {
public:
    virtual ~ControlSequences() = default;

    // Пустая строка при n == 0
    [[nodiscard]] virtual auto cursor_up(std::size_t n) const -> std::string = 0;
    [[nodiscard]] virtual auto clear_to_eol() const -> std::string = 0;
};

class AnsiControlSequences final : public ControlSequences {
public:
    [[nodiscard]] auto cursor_up(std::size_t n) const -> std::string override;
    [[nodiscard]] auto clear_to_eol() const -> std::string override;
};

/// Ширина терминала на дескрипторе `fd`, nullopt если это не терминал.
[[nodiscard]] auto query_terminal_width(int fd) -> std::optional<std::size_t>;

[[nodiscard]] auto is_terminal(int fd) -> bool;

/// Число колонок для UTF-8 строки: каждый code point считается за одну.
[[nodiscard]] auto display_width(std::string_view text) -> std::size_t;

// Разбивает UTF-8 строку на отдельные code point'ы
[[nodiscard]] auto split_glyphs(std::string_view text) -> std::vector<std::string>;

} // namespace progcp::infra

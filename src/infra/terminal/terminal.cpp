#include "terminal.hpp"
#include <fmt/core.h>

#include <sys/ioctl.h>
#include <unistd.h>

namespace progcp::infra {

auto AnsiControlSequences::cursor_up(std::size_t n) const -> std::string {
    // ESC[0A на части терминалов всё равно сдвигает курсор на строку
    if (n == 0) return {};
    return fmt::format("\033[{}A", n);
}

auto AnsiControlSequences::clear_to_eol() const -> std::string {
    return "\033[K";
}

auto query_terminal_width(int fd) -> std::optional<std::size_t> {
    struct ::winsize ws{};
    if (::ioctl(fd, TIOCGWINSZ, &ws) == -1 || ws.ws_col == 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(ws.ws_col);
}

auto is_terminal(int fd) -> bool {
    return ::isatty(fd) == 1;
}

auto display_width(std::string_view text) -> std::size_t {
    std::size_t width = 0;
    for (const char ch : text) {
        // continuation-байты 10xxxxxx не начинают новый символ
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

auto split_glyphs(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> glyphs;
    for (const char ch : text) {
        const bool continuation = (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
        if (continuation && !glyphs.empty()) {
            glyphs.back() += ch;
        } else {
            glyphs.emplace_back(1, ch);
        }
    }
    return glyphs;
}

} // namespace progcp::infra

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace progcp::core {

/// Кусок строки статуса. Приоритет 0 выводится всегда, чем больше номер,
/// тем раньше сегмент выбрасывается при нехватке ширины.
struct Segment {
    // Текст, зависящий от ширины, оставшейся после литеральных сегментов
    using Deferred = std::function<std::string(std::size_t width)>;

    std::size_t priority = 0;
    std::variant<std::string, Deferred> content;
    std::size_t min_width = 1;
};

/// Строка из сегментов, которая подгоняется под ширину терминала.
///
/// Tiers are admitted in ascending priority while the running width stays
/// below `width` (the last column is never written, so the terminal does
/// not auto-wrap). The first tier that does not fit is dropped together
/// with every higher tier. Deferred segments then share the columns left
/// by admitted literal segments. Admitted segments are joined in insertion
/// order.
class Line {
public:
    void add(std::size_t priority, std::string text);
    void add_deferred(std::size_t priority, Segment::Deferred render, std::size_t min_width);

    /// Highest admitted priority for `width`. Never below 0: priority 0 is
    /// admitted even when it alone overflows.
    [[nodiscard]] auto watermark(std::size_t width) const -> std::size_t;

    [[nodiscard]] auto render(std::size_t width) const -> std::string;

    [[nodiscard]] auto segments() const -> const std::vector<Segment>& { return segments_; }
    [[nodiscard]] auto empty() const -> bool { return segments_.empty(); }

private:
    std::vector<Segment> segments_;
};

} // namespace progcp::core

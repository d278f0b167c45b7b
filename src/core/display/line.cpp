#include "line.hpp"
#include <algorithm>
#include <map>
#include <utility>
#include "../../infra/terminal/terminal.hpp"

namespace progcp::core {

void Line::add(std::size_t priority, std::string text) {
    const auto width = infra::display_width(text);
    segments_.push_back(Segment{
        .priority = priority,
        .content = std::move(text),
        .min_width = width,
    });
}

void Line::add_deferred(std::size_t priority, Segment::Deferred render, std::size_t min_width) {
    segments_.push_back(Segment{
        .priority = priority,
        .content = std::move(render),
        .min_width = std::max<std::size_t>(min_width, 1),
    });
}

auto Line::watermark(std::size_t width) const -> std::size_t {
    std::map<std::size_t, std::size_t> tiers;
    for (const auto& segment : segments_) {
        tiers[segment.priority] += segment.min_width;
    }

    std::size_t used = 0;
    std::size_t mark = 0;
    for (const auto& [priority, tier_width] : tiers) {
        if (priority > 0 && used + tier_width >= width) {
            break;
        }
        used += tier_width;
        mark = priority;
    }
    return mark;
}

auto Line::render(std::size_t width) const -> std::string {
    const auto mark = watermark(width);

    std::size_t literal_width = 0;
    std::size_t deferred_count = 0;
    for (const auto& segment : segments_) {
        if (segment.priority > mark) continue;
        if (std::holds_alternative<std::string>(segment.content)) {
            literal_width += segment.min_width;
        } else {
            ++deferred_count;
        }
    }

    // Последняя колонка не используется
    const std::size_t usable = width > 0 ? width - 1 : 0;
    const std::size_t leftover = usable > literal_width ? usable - literal_width : 0;
    const std::size_t share = deferred_count > 0 ? leftover / deferred_count : 0;

    std::string out;
    for (const auto& segment : segments_) {
        if (segment.priority > mark) continue;
        if (const auto* text = std::get_if<std::string>(&segment.content)) {
            out += *text;
        } else {
            const auto& render_fn = std::get<Segment::Deferred>(segment.content);
            out += render_fn(std::max(share, segment.min_width));
        }
    }
    return out;
}

} // namespace progcp::core

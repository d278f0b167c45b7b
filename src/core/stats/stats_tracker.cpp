#include "stats_tracker.hpp"
#include <algorithm>
#include <utility>
#include <fmt/core.h>

namespace progcp::core {

void StatsTracker::register_file(std::optional<std::uint64_t> size) {
    if (!size) {
        total_size_.reset();
    } else if (total_size_) {
        *total_size_ += *size;
    }
    pending_.push_back(FileRecord{.size = size});
}

auto StatsTracker::advance(TimePoint now) -> infra::VoidResult {
    if (pending_.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NoMoreFiles,
            fmt::format("advance() called with no pending files ({} registered)", file_count())));
    }

    finish();

    if (!batch_time_start_) {
        batch_time_start_ = now;
        last_sample_time_ = now;
    }

    current_ = std::move(pending_.front());
    pending_.pop_front();
    current_->time_start = now;
    return {};
}

auto StatsTracker::record_sample(std::uint64_t bytes_new, TimePoint now) -> infra::VoidResult {
    if (!current_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NoActiveFile,
            "record_sample() called with no active file"));
    }

    current_->bytes_done += bytes_new;
    total_bytes_done_ += bytes_new;

    const Seconds elapsed = now - *last_sample_time_;
    const Seconds total_elapsed = now - *batch_time_start_;
    last_sample_time_ = now;

    // Тик без новых байт или без прошедшего времени не трогает оценки
    if (bytes_new > 0 && elapsed.count() > 0.0) {
        update_rates_(bytes_new, elapsed, total_elapsed);
    }
    return {};
}

void StatsTracker::finish() {
    if (current_) {
        done_.push_back(std::move(*current_));
        current_.reset();
    }
}

void StatsTracker::update_rates_(std::uint64_t bytes_new, Seconds elapsed, Seconds total_elapsed) {
    const double instant = static_cast<double>(bytes_new) / elapsed.count();
    throughput_.instant = instant;
    // total_elapsed >= elapsed > 0
    throughput_.average = static_cast<double>(total_bytes_done_) / total_elapsed.count();

    if (!throughput_.smoothed) {
        throughput_.smoothed = throughput_.average;
    } else {
        throughput_.smoothed = kSmoothingFactor * *throughput_.smoothed
                             + (1.0 - kSmoothingFactor) * instant;
    }
}

auto StatsTracker::file_count() const -> std::size_t {
    return done_.size() + pending_.size() + (current_ ? 1 : 0);
}

auto StatsTracker::current_index() const -> std::size_t {
    return current_ ? done_.size() + 1 : 0;
}

auto StatsTracker::since_(std::optional<TimePoint> start) const -> Seconds {
    if (!start || !last_sample_time_) return Seconds{0.0};
    return std::max(Seconds{0.0}, Seconds{*last_sample_time_ - *start});
}

auto StatsTracker::file_elapsed() const -> Seconds {
    return current_ ? since_(current_->time_start) : Seconds{0.0};
}

auto StatsTracker::batch_elapsed() const -> Seconds {
    return since_(batch_time_start_);
}

auto StatsTracker::file_bytes_done() const -> std::uint64_t {
    return current_ ? current_->bytes_done : 0;
}

auto StatsTracker::file_size() const -> std::optional<std::uint64_t> {
    return current_ ? current_->size : std::nullopt;
}

} // namespace progcp::core

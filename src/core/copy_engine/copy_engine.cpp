#include "copy_engine.hpp"
#include <algorithm>
#include <span>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <unistd.h>
#include "../../adapters/fs.hpp"
#include "../../infra/interrupt.hpp"
#include "../../infra/terminal/terminal.hpp"

namespace progcp::core {

namespace {

namespace stdfs = std::filesystem;

// "dir/" и "dir" должны давать одно и то же имя
auto base_name(const stdfs::path& path) -> stdfs::path {
    auto normal = path.lexically_normal();
    if (normal.filename().empty()) {
        normal = normal.parent_path();
    }
    return normal.filename();
}

void discard_partial(const stdfs::path& path) {
    std::error_code ec;
    stdfs::remove(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove partial file {}: {}", path.string(), ec.message());
    }
}

auto collect_tree(const stdfs::path& root, const stdfs::path& target, std::vector<CopyJob>& jobs)
    -> infra::VoidResult
{
    std::vector<stdfs::path> files;
    std::error_code ec;
    for (stdfs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot scan {}: {}", root.string(), ec.message())));
    }

    std::sort(files.begin(), files.end());
    for (auto& file : files) {
        auto dst = target / file.lexically_relative(root);
        auto size = adapters::fs::probe_size(file);
        jobs.push_back(CopyJob{.source = std::move(file), .destination = std::move(dst), .size = size});
    }
    return {};
}

} // namespace

CopyEngine::CopyEngine(const infra::Config& config, DisplayRenderer* renderer, int display_fd)
    : config_(config), renderer_(renderer), display_fd_(display_fd) {}

auto CopyEngine::plan(const std::vector<stdfs::path>& sources,
                      const stdfs::path& destination) const
    -> infra::Result<std::vector<CopyJob>>
{
    std::error_code ec;
    const bool dest_is_dir = stdfs::is_directory(destination, ec);
    const bool single_file = sources.size() == 1 && !stdfs::is_directory(sources.front(), ec);

    // Несколько источников или каталог: назначение всегда каталог
    if (!dest_is_dir && !single_file) {
        stdfs::create_directories(destination, ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                fmt::format("Cannot create destination: {}", ec.message())));
        }
    }

    std::vector<CopyJob> jobs;
    for (const auto& src : sources) {
        if (!stdfs::exists(src, ec)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                fmt::format("Source does not exist: {}", src.string())));
        }

        if (stdfs::is_directory(src, ec)) {
            if (!config_.recursive) {
                spdlog::warn("Skipping directory {} (use -r)", src.string());
                continue;
            }
            if (auto res = collect_tree(src, destination / base_name(src), jobs); !res) {
                return std::unexpected(std::move(res.error()));
            }
            continue;
        }

        auto dst = (single_file && !dest_is_dir) ? destination : destination / base_name(src);
        if (stdfs::exists(dst, ec) && stdfs::equivalent(src, dst, ec)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                fmt::format("{} and {} are the same file", src.string(), dst.string())));
        }
        jobs.push_back(CopyJob{.source = src, .destination = std::move(dst), .size = adapters::fs::probe_size(src)});
    }
    return jobs;
}

auto CopyEngine::run(const std::vector<stdfs::path>& sources,
                     const stdfs::path& destination)
    -> infra::Result<CopyStatsSnapshot>
{
    auto jobs = plan(sources, destination);
    if (!jobs) {
        return std::unexpected(std::move(jobs.error()));
    }

    for (const auto& job : *jobs) {
        tracker_.register_file(job.size);
    }
    spdlog::debug("Planned {} file(s)", jobs->size());

    if (renderer_) {
        const std::chrono::milliseconds interval{
            config_.refresh_interval_ms.value_or(infra::kDefaultRefreshIntervalMs)};
        auto ticker = infra::Ticker::start(interval);
        if (ticker) {
            ticker_ = std::move(*ticker);
        } else {
            spdlog::warn("Progress display disabled: {}", ticker.error().message);
            renderer_ = nullptr;
        }
    }

    std::vector<char> buffer(config_.buffer_size.value_or(infra::kDefaultBufferSize));

    for (const auto& job : *jobs) {
        if (auto res = tracker_.advance(Clock::now()); !res) {
            ticker_.reset();
            return std::unexpected(std::move(res.error()));
        }
        spdlog::debug("Copying {} -> {}", job.source.string(), job.destination.string());

        auto res = copy_one_(job, buffer);
        if (res) {
            stats_.files_copied += 1;
            stats_.bytes_copied += tracker_.file_bytes_done();
            continue;
        }

        if (res.error().is_internal() || res.error().code == infra::ErrorCode::Interrupted) {
            ticker_.reset();
            if (renderer_) renderer_->finish();
            return std::unexpected(std::move(res.error()));
        }

        // Ошибка одного файла не останавливает батч
        if (renderer_) renderer_->finish();
        stats_.errors += 1;
        (void)infra::log_and_return(std::move(res.error()));
    }

    ticker_.reset();
    tracker_.finish();
    redraw_();
    if (renderer_) renderer_->finish();
    return stats_;
}

auto CopyEngine::copy_one_(const CopyJob& job, std::vector<char>& buffer) -> infra::VoidResult {
    std::error_code ec;
    if (const auto parent = job.destination.parent_path(); !parent.empty()) {
        stdfs::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                fmt::format("Cannot create {}: {}", parent.string(), ec.message())));
        }
    }

    auto src = adapters::fs::open_source(job.source);
    if (!src) return std::unexpected(std::move(src.error()));
    auto dst = adapters::fs::open_destination(job.destination);
    if (!dst) return std::unexpected(std::move(dst.error()));

    auto fail = [&](infra::Error&& err) -> infra::VoidResult {
        discard_partial(job.destination);
        return std::unexpected(std::move(err));
    };

    while (true) {
        if (infra::is_interrupted()) {
            return fail(infra::make_error(infra::ErrorCode::Interrupted,
                fmt::format("Interrupted while copying {}", job.source.string())));
        }

        auto chunk = adapters::fs::read_chunk(*src, buffer);
        if (!chunk) return fail(std::move(chunk.error()));

        if (chunk->interrupted) {
            // Сигнал таймера прервал read(): данных нет, но время идёт
            if (auto res = tick_(); !res) return fail(std::move(res.error()));
            continue;
        }
        if (chunk->bytes == 0) {
            break; // EOF
        }

        const std::span<const char> data(buffer.data(), chunk->bytes);
        if (auto res = adapters::fs::write_all(*dst, data); !res) {
            return fail(std::move(res.error()));
        }
        if (auto res = sample_(chunk->bytes); !res) return fail(std::move(res.error()));

        if (ticker_ && ticker_->consume()) {
            redraw_();
        }
    }

    if (auto res = dst->close(); !res) {
        return fail(std::move(res.error()));
    }

    // Финальный сэмпл и отрисовка для каждого файла
    if (auto res = sample_(0); !res) return std::unexpected(std::move(res.error()));
    redraw_();
    return {};
}

auto CopyEngine::sample_(std::uint64_t bytes) -> infra::VoidResult {
    return tracker_.record_sample(bytes, Clock::now());
}

auto CopyEngine::tick_() -> infra::VoidResult {
    if (!ticker_ || !ticker_->consume()) {
        return {};
    }
    if (auto res = sample_(0); !res) {
        return res;
    }
    redraw_();
    return {};
}

void CopyEngine::redraw_() {
    if (!renderer_) return;

    // Тикер прерывает и блокирующую запись (терминал на паузе, медленный читатель),
    // поэтому кадр пишется в обход stdio с повтором после EINTR
    const auto width = infra::query_terminal_width(display_fd_).value_or(infra::kDefaultTerminalWidth);
    const auto text = renderer_->render_tick(tracker_, width);
    if (auto res = adapters::fs::write_all(display_fd_, text); !res) {
        spdlog::debug("Status redraw failed: {}", res.error().message);
    }
}

} // namespace progcp::core

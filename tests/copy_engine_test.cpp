#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>
#include <fmt/core.h>
#include <fcntl.h>
#include <unistd.h>
#include "core/copy_engine/copy_engine.hpp"

namespace fs = std::filesystem;
using progcp::core::CopyEngine;
using progcp::infra::Config;
using progcp::infra::ErrorCode;

namespace {

class CopyEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() / (std::string("progcp_engine_") + info->name());
        fs::remove_all(root_);
        fs::create_directories(root_ / "src");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    auto make_file(const fs::path& relative, std::size_t size) -> fs::path {
        const auto path = root_ / "src" / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        for (std::size_t i = 0; i < size; ++i) {
            out.put(static_cast<char>('a' + i % 26));
        }
        return path;
    }

    static auto read_all(const fs::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    fs::path root_;
};

} // namespace

TEST_F(CopyEngineTest, CopiesSingleFileToNewPath)
{
    const auto src = make_file("one.bin", 1000);
    Config config;
    config.buffer_size = 64;
    CopyEngine engine(config, nullptr);

    auto result = engine.run({src}, root_ / "copy.bin");
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->files_copied, 1u);
    EXPECT_EQ(result->bytes_copied, 1000u);
    EXPECT_EQ(result->errors, 0u);
    EXPECT_EQ(read_all(root_ / "copy.bin"), read_all(src));

    const auto& tracker = engine.tracker();
    EXPECT_EQ(tracker.total_bytes_done(), 1000u);
    EXPECT_EQ(tracker.total_size(), 1000u);
    EXPECT_EQ(tracker.done_count(), 1u);
    EXPECT_FALSE(tracker.has_current());
}

TEST_F(CopyEngineTest, CopiesSeveralFilesIntoDirectory)
{
    const auto a = make_file("a.txt", 10);
    const auto b = make_file("b.txt", 0);
    const auto c = make_file("c.txt", 5000);
    Config config;
    config.buffer_size = 1000;
    CopyEngine engine(config, nullptr);

    auto result = engine.run({a, b, c}, root_ / "out");
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->files_copied, 3u);
    EXPECT_EQ(result->bytes_copied, 5010u);
    EXPECT_EQ(read_all(root_ / "out" / "c.txt"), read_all(c));
    EXPECT_TRUE(fs::exists(root_ / "out" / "b.txt"));
    EXPECT_EQ(engine.tracker().done_count(), 3u);
}

TEST_F(CopyEngineTest, DirectoryNeedsRecursive)
{
    make_file("tree/x.txt", 3);
    make_file("tree/sub/y.txt", 4);

    Config config;
    {
        CopyEngine engine(config, nullptr);
        auto result = engine.run({root_ / "src" / "tree"}, root_ / "flat");
        ASSERT_TRUE(result);
        EXPECT_EQ(result->files_copied, 0u);
    }

    config.recursive = true;
    CopyEngine engine(config, nullptr);
    auto result = engine.run({root_ / "src" / "tree"}, root_ / "deep");
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->files_copied, 2u);
    EXPECT_EQ(read_all(root_ / "deep" / "tree" / "sub" / "y.txt"), "abcd");
}

TEST_F(CopyEngineTest, PlanKeepsSourceOrderAndSizes)
{
    const auto b = make_file("b.txt", 7);
    const auto a = make_file("a.txt", 3);
    Config config;
    CopyEngine engine(config, nullptr);

    auto jobs = engine.plan({b, a}, root_ / "dst");
    ASSERT_TRUE(jobs);
    ASSERT_EQ(jobs->size(), 2u);
    EXPECT_EQ((*jobs)[0].source, b);
    EXPECT_EQ((*jobs)[0].destination, root_ / "dst" / "b.txt");
    EXPECT_EQ((*jobs)[0].size, 7u);
    EXPECT_EQ((*jobs)[1].size, 3u);
}

TEST_F(CopyEngineTest, MissingSourceIsReported)
{
    Config config;
    CopyEngine engine(config, nullptr);
    auto result = engine.run({root_ / "src" / "nope"}, root_ / "dst");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::FileNotFound);
}

TEST_F(CopyEngineTest, CopyOntoItselfIsRejected)
{
    const auto src = make_file("same.txt", 5);
    Config config;
    CopyEngine engine(config, nullptr);
    auto result = engine.run({src}, src);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidPath);
    EXPECT_EQ(read_all(src), "abcde");
}

TEST_F(CopyEngineTest, UnwritableDestinationCountsAsFileError)
{
    const auto a = make_file("a.txt", 10);
    const auto b = make_file("b.txt", 20);
    // Каталог с именем файла назначения: open() на запись упадёт
    fs::create_directories(root_ / "out" / "a.txt");

    Config config;
    CopyEngine engine(config, nullptr);
    auto result = engine.run({a, b}, root_ / "out");
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->files_copied, 1u);
    EXPECT_EQ(result->errors, 1u);
    EXPECT_EQ(read_all(root_ / "out" / "b.txt"), read_all(b));
    // трекер прошёл оба файла
    EXPECT_EQ(engine.tracker().done_count(), 2u);
}

TEST_F(CopyEngineTest, RendersWhileCopying)
{
    const auto src = make_file("big.bin", 256 * 1024);
    Config config;
    config.buffer_size = 4096;
    config.refresh_interval_ms = 1;

    progcp::infra::AnsiControlSequences controls;
    progcp::core::DisplayRenderer renderer(controls);
    CopyEngine engine(config, &renderer);

    auto result = engine.run({src}, root_ / "big.copy");
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(read_all(root_ / "big.copy"), read_all(src));
    // finish() оставляет последний кадр на экране
    EXPECT_EQ(renderer.lines_written(), 0u);
}

TEST_F(CopyEngineTest, RedrawSurvivesBlockedStatusOutput)
{
    std::vector<fs::path> sources;
    for (int i = 0; i < 100; ++i) {
        sources.push_back(make_file(fmt::format("f{:03}.bin", i), 2048));
    }
    Config config;
    config.buffer_size = 512;
    config.refresh_interval_ms = 1;

    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    // Маленький канал быстро заполняется, и запись кадра блокируется под тикером
    (void)::fcntl(fds[1], F_SETPIPE_SZ, 4096);

    std::string drawn;
    std::thread reader([&drawn, fd = fds[0]] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        char chunk[1024];
        while (true) {
            const auto n = ::read(fd, chunk, sizeof(chunk));
            if (n > 0) {
                drawn.append(chunk, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                break;
            }
        }
    });

    progcp::infra::AnsiControlSequences controls;
    progcp::core::DisplayRenderer renderer(controls);
    CopyEngine engine(config, &renderer, fds[1]);
    auto result = engine.run(sources, root_ / "out");

    ::close(fds[1]);
    reader.join();
    ::close(fds[0]);

    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->files_copied, 100u);
    EXPECT_EQ(result->errors, 0u);
    EXPECT_EQ(read_all(root_ / "out" / "f099.bin"), read_all(sources.back()));
    EXPECT_GT(drawn.size(), 4096u);
    EXPECT_NE(drawn.find("Total"), std::string::npos);
}

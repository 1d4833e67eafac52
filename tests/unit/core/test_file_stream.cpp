/**
 * @file test_file_stream.cpp
 * @brief Unit tests for file-backed streams and format helpers
 */

#include <gtest/gtest.h>

#include <kcenon/tree_transfer/core/format_utils.h>
#include <kcenon/tree_transfer/core/io_stream.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <random>
#include <span>
#include <sstream>
#include <string>

namespace kcenon::tree_transfer::test {

class FileStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("tree_trans_stream_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(dir_);
        std::ofstream(dir_ / "input.txt", std::ios::binary) << "hello tree transfer";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    static auto as_string(std::span<const std::byte> data) -> std::string {
        return std::string(reinterpret_cast<const char*>(data.data()), data.size());
    }

    std::filesystem::path dir_;
};

TEST_F(FileStreamTest, ReadUntilEof) {
    auto stream = file_read_stream::open(dir_ / "input.txt");
    ASSERT_TRUE(stream.has_value());

    std::array<std::byte, 8> buffer{};
    std::string collected;
    for (;;) {
        auto n = stream.value()->read(buffer);
        ASSERT_TRUE(n.has_value());
        if (n.value() == 0) {
            break;
        }
        collected += as_string(std::span<const std::byte>(buffer.data(), n.value()));
    }

    EXPECT_EQ(collected, "hello tree transfer");
}

TEST_F(FileStreamTest, SeekBackToStart) {
    auto stream = file_read_stream::open(dir_ / "input.txt");
    ASSERT_TRUE(stream.has_value());

    std::array<std::byte, 5> buffer{};
    ASSERT_TRUE(stream.value()->read(buffer).has_value());

    auto pos = stream.value()->seek(0, seek_origin::begin);
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos.value(), 0u);

    auto end = stream.value()->seek(0, seek_origin::end);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(end.value(), 19u);
}

TEST_F(FileStreamTest, OpenMissingFile) {
    auto stream = file_read_stream::open(dir_ / "missing.txt");

    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code, error_code::no_such_file_or_directory);
}

TEST_F(FileStreamTest, OpenDirectoryForRead) {
    auto stream = file_read_stream::open(dir_);

    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code, error_code::is_a_directory);
}

TEST_F(FileStreamTest, WriteTruncatesAndFlushes) {
    {
        auto stream = file_write_stream::create(dir_ / "input.txt");
        ASSERT_TRUE(stream.has_value());

        std::string text = "new";
        auto written = stream.value()->write(
            std::as_bytes(std::span<const char>(text.data(), text.size())));
        ASSERT_TRUE(written.has_value());
        EXPECT_EQ(written.value(), 3u);
        EXPECT_TRUE(stream.value()->flush().has_value());
    }

    std::ifstream in(dir_ / "input.txt", std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    EXPECT_EQ(oss.str(), "new");
}

TEST_F(FileStreamTest, CreateInMissingDirectory) {
    auto stream = file_write_stream::create(dir_ / "nope" / "out.txt");

    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code, error_code::no_such_file_or_directory);
}

// =============================================================================
// Format helper Tests
// =============================================================================

class FormatUtilsTest : public ::testing::Test {};

TEST_F(FormatUtilsTest, FormatBytes) {
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1536), "1.50 KB");
    EXPECT_EQ(format_bytes(5 * sizes::MB), "5.00 MB");
    EXPECT_EQ(format_bytes(2 * sizes::GB), "2.00 GB");
}

TEST_F(FormatUtilsTest, FormatThroughput) {
    EXPECT_EQ(format_throughput(100.0), "100.00 B/s");
    EXPECT_EQ(format_throughput(2.5 * sizes::MB), "2.50 MB/s");
}

TEST_F(FormatUtilsTest, FormatSeconds) {
    EXPECT_EQ(format_seconds(std::chrono::milliseconds(1250)), "1.250");
    EXPECT_EQ(format_seconds(std::chrono::milliseconds(0)), "0.000");
}

}  // namespace kcenon::tree_transfer::test

/**
 * @file test_destination_file.cpp
 * @brief Unit tests for destination_file
 */

#include <gtest/gtest.h>

#include <kcenon/delta_fetch/core/destination_file.h>

#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::delta_fetch::test {

namespace {

auto bytes_of(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> out(text.size());
    if (!text.empty()) {
        std::memcpy(out.data(), text.data(), text.size());
    }
    return out;
}

auto read_all(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

class DestinationFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("delta_fetch_test_destination_" +
                     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
};

TEST_F(DestinationFileTest, OpenCreatesParentsAndSizesFile) {
    auto path = test_dir_ / "a" / "b" / "file.dfpart";
    auto file = destination_file::open(path, 4096, false);
    ASSERT_TRUE(file.has_value());
    EXPECT_TRUE(file.value()->is_open());
    EXPECT_EQ(file.value()->size(), 4096u);
    EXPECT_EQ(std::filesystem::file_size(path), 4096u);
}

TEST_F(DestinationFileTest, WritesLandAtTheirOffsets) {
    auto path = test_dir_ / "file.dfpart";
    auto file = destination_file::open(path, 8, false);
    ASSERT_TRUE(file.has_value());

    ASSERT_TRUE(file.value()->write_at(4, bytes_of("EFGH")).has_value());
    ASSERT_TRUE(file.value()->write_at(0, bytes_of("ABCD")).has_value());
    ASSERT_TRUE(file.value()->close().has_value());

    EXPECT_EQ(read_all(path), "ABCDEFGH");
}

TEST_F(DestinationFileTest, ReopenKeepsExistingContent) {
    auto path = test_dir_ / "file.dfpart";
    {
        auto file = destination_file::open(path, 8, false);
        ASSERT_TRUE(file.has_value());
        ASSERT_TRUE(file.value()->write_at(0, bytes_of("ABCD")).has_value());
        ASSERT_TRUE(file.value()->close().has_value());
    }

    auto reopened = destination_file::open(path, 8, false);
    ASSERT_TRUE(reopened.has_value());
    ASSERT_TRUE(reopened.value()->write_at(4, bytes_of("WXYZ")).has_value());
    ASSERT_TRUE(reopened.value()->close().has_value());

    EXPECT_EQ(read_all(path), "ABCDWXYZ");
}

TEST_F(DestinationFileTest, OpenTruncatesToNewSize) {
    auto path = test_dir_ / "file.dfpart";
    {
        std::ofstream out(path, std::ios::binary);
        out << "0123456789";
    }
    auto file = destination_file::open(path, 4, false);
    ASSERT_TRUE(file.has_value());
    ASSERT_TRUE(file.value()->close().has_value());
    EXPECT_EQ(read_all(path), "0123");
}

TEST_F(DestinationFileTest, WritePastEndIsRejected) {
    auto file = destination_file::open(test_dir_ / "file.dfpart", 4, false);
    ASSERT_TRUE(file.has_value());

    auto written = file.value()->write_at(2, bytes_of("ABCD"));
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, error_code::invalid_range);
}

TEST_F(DestinationFileTest, WriteAfterCloseFails) {
    auto file = destination_file::open(test_dir_ / "file.dfpart", 4, true);
    ASSERT_TRUE(file.has_value());
    ASSERT_TRUE(file.value()->close().has_value());
    EXPECT_FALSE(file.value()->is_open());

    auto written = file.value()->write_at(0, bytes_of("AB"));
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, error_code::file_write_error);

    // Closing twice is harmless
    EXPECT_TRUE(file.value()->close().has_value());
}

TEST_F(DestinationFileTest, ConcurrentDisjointWrites) {
    constexpr std::size_t block = 4096;
    constexpr std::size_t blocks = 16;
    auto path = test_dir_ / "file.dfpart";
    auto opened = destination_file::open(path, block * blocks, false);
    ASSERT_TRUE(opened.has_value());
    auto file = opened.value();

    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < blocks; ++i) {
        threads.emplace_back([file, i] {
            std::vector<std::byte> data(block, static_cast<std::byte>('a' + i));
            EXPECT_TRUE(file->write_at(i * block, data).has_value());
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    ASSERT_TRUE(file->close().has_value());

    auto content = read_all(path);
    ASSERT_EQ(content.size(), block * blocks);
    for (std::size_t i = 0; i < blocks; ++i) {
        EXPECT_EQ(content[i * block], static_cast<char>('a' + i));
        EXPECT_EQ(content[i * block + block - 1], static_cast<char>('a' + i));
    }
}

TEST_F(DestinationFileTest, OpenFailsWhenParentIsAFile) {
    auto blocker = test_dir_ / "blocker";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    auto file = destination_file::open(blocker / "file.dfpart", 4, false);
    ASSERT_FALSE(file.has_value());
    EXPECT_EQ(file.error().code, error_code::directory_create_failed);
}

}  // namespace kcenon::delta_fetch::test

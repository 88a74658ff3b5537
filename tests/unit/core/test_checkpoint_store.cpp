/**
 * @file test_checkpoint_store.cpp
 * @brief Unit tests for checkpoint_store
 */

#include <gtest/gtest.h>

#include <kcenon/delta_fetch/core/checkpoint_store.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace kcenon::delta_fetch::test {

class CheckpointStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("delta_fetch_test_checkpoint_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        std::filesystem::create_directories(test_dir_);
        state_dir_ = test_dir_ / "state";
        destination_ = test_dir_ / "out" / "file.bin";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto make_store(bool sync = false) -> checkpoint_store {
        checkpoint_store_config config(state_dir_);
        config.sync_on_commit = sync;
        return checkpoint_store(config);
    }

    auto record_files() const -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(state_dir_)) {
            if (entry.path().extension() == ".json") {
                files.push_back(entry.path());
            }
        }
        return files;
    }

    static constexpr uint64_t CHUNK = 1024;

    std::filesystem::path test_dir_;
    std::filesystem::path state_dir_;
    std::filesystem::path destination_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(CheckpointStoreTest, LoadWithoutRecordIsNotFound) {
    auto store = make_store();
    auto loaded = store.load(destination_);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::checkpoint_not_found);
    EXPECT_FALSE(store.has_checkpoint(destination_));
}

TEST_F(CheckpointStoreTest, BeginCreatesEmptyRecord) {
    auto store = make_store();
    ASSERT_TRUE(store.begin(destination_, "4096:1", 4096, CHUNK).has_value());

    auto loaded = store.load(destination_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value().destination, destination_);
    EXPECT_EQ(loaded.value().fingerprint, "4096:1");
    EXPECT_EQ(loaded.value().file_size, 4096u);
    EXPECT_EQ(loaded.value().chunk_size, CHUNK);
    EXPECT_TRUE(loaded.value().committed_offsets.empty());
    EXPECT_EQ(loaded.value().state, checkpoint_state::in_progress);
    EXPECT_EQ(loaded.value().expected_chunk_count(), 4u);
    EXPECT_TRUE(store.has_checkpoint(destination_));
}

TEST_F(CheckpointStoreTest, CommitsSurviveReopen) {
    {
        auto store = make_store(true);
        ASSERT_TRUE(store.begin(destination_, "4096:1", 4096, CHUNK).has_value());
        ASSERT_TRUE(store.commit(destination_, 0).has_value());
        ASSERT_TRUE(store.commit(destination_, 2 * CHUNK).has_value());
    }

    auto reopened = make_store();
    auto loaded = reopened.load(destination_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value().committed_offsets, (std::set<uint64_t>{0, 2 * CHUNK}));
    EXPECT_FALSE(loaded.value().all_chunks_committed());
}

TEST_F(CheckpointStoreTest, CommitIsIdempotent) {
    auto store = make_store();
    ASSERT_TRUE(store.begin(destination_, "fp", 4096, CHUNK).has_value());
    ASSERT_TRUE(store.commit(destination_, CHUNK).has_value());
    ASSERT_TRUE(store.commit(destination_, CHUNK).has_value());
    EXPECT_EQ(store.load(destination_).value().committed_offsets.size(), 1u);
}

TEST_F(CheckpointStoreTest, CommitRejectsOffGridOffset) {
    auto store = make_store();
    ASSERT_TRUE(store.begin(destination_, "fp", 4096, CHUNK).has_value());

    auto off_grid = store.commit(destination_, 100);
    ASSERT_FALSE(off_grid.has_value());
    EXPECT_EQ(off_grid.error().code, error_code::invalid_chunk_offset);

    auto past_end = store.commit(destination_, 4 * CHUNK);
    ASSERT_FALSE(past_end.has_value());
    EXPECT_EQ(past_end.error().code, error_code::invalid_chunk_offset);
}

TEST_F(CheckpointStoreTest, CommitWithoutBeginFails) {
    auto store = make_store();
    auto committed = store.commit(destination_, 0);
    ASSERT_FALSE(committed.has_value());
    EXPECT_EQ(committed.error().code, error_code::checkpoint_not_found);
}

TEST_F(CheckpointStoreTest, FinalizeRequiresEveryChunk) {
    auto store = make_store();
    ASSERT_TRUE(store.begin(destination_, "fp", 3000, CHUNK).has_value());
    ASSERT_TRUE(store.commit(destination_, 0).has_value());

    auto early = store.finalize(destination_);
    ASSERT_FALSE(early.has_value());
    EXPECT_EQ(early.error().code, error_code::missing_chunks);

    ASSERT_TRUE(store.commit(destination_, CHUNK).has_value());
    ASSERT_TRUE(store.commit(destination_, 2 * CHUNK).has_value());
    ASSERT_TRUE(store.finalize(destination_).has_value());

    auto loaded = store.load(destination_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded.value().is_complete());
}

TEST_F(CheckpointStoreTest, MarkCompleteCoversEveryChunk) {
    auto store = make_store();
    ASSERT_TRUE(store.mark_complete(destination_, "fp", 10 * CHUNK, CHUNK).has_value());

    auto loaded = store.load(destination_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded.value().is_complete());
    EXPECT_EQ(loaded.value().committed_offsets.size(), 10u);
    EXPECT_EQ(*loaded.value().committed_offsets.rbegin(), 9 * CHUNK);
}

TEST_F(CheckpointStoreTest, ZeroByteFileIsCompleteWithoutCommits) {
    auto store = make_store();
    ASSERT_TRUE(store.begin(destination_, "0:1", 0, CHUNK).has_value());
    ASSERT_TRUE(store.finalize(destination_).has_value());
    EXPECT_TRUE(store.load(destination_).value().is_complete());
}

TEST_F(CheckpointStoreTest, InvalidateRemovesRecord) {
    auto store = make_store();
    ASSERT_TRUE(store.begin(destination_, "fp", 4096, CHUNK).has_value());
    ASSERT_TRUE(store.invalidate(destination_).has_value());

    EXPECT_FALSE(store.has_checkpoint(destination_));
    EXPECT_TRUE(record_files().empty());

    auto reopened = make_store();
    EXPECT_FALSE(reopened.load(destination_).has_value());
}

TEST_F(CheckpointStoreTest, CorruptedRecordIsReported) {
    {
        auto store = make_store();
        ASSERT_TRUE(store.begin(destination_, "fp", 4096, CHUNK).has_value());
    }
    auto files = record_files();
    ASSERT_EQ(files.size(), 1u);
    {
        std::ofstream out(files[0], std::ios::trunc);
        out << "{ not json";
    }

    auto reopened = make_store();
    auto loaded = reopened.load(destination_);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::checkpoint_corrupted);

    ASSERT_TRUE(reopened.invalidate(destination_).has_value());
    EXPECT_EQ(reopened.load(destination_).error().code, error_code::checkpoint_not_found);
}

TEST_F(CheckpointStoreTest, ListAndCleanupExpired) {
    checkpoint_store_config config(state_dir_);
    config.sync_on_commit = false;
    config.state_ttl = std::chrono::seconds(0);
    checkpoint_store store(config);

    auto done = test_dir_ / "out" / "done.bin";
    ASSERT_TRUE(store.begin(destination_, "fp", 4096, CHUNK).has_value());
    ASSERT_TRUE(store.mark_complete(done, "fp", 4096, CHUNK).has_value());
    EXPECT_EQ(store.list_checkpoints().size(), 2u);

    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    EXPECT_EQ(store.cleanup_expired(), 1u);
    EXPECT_FALSE(store.has_checkpoint(destination_));
    EXPECT_TRUE(store.has_checkpoint(done));
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(CheckpointStoreTest, ConcurrentCommitsNeverLoseUpdates) {
    constexpr uint64_t chunk_count = 64;
    constexpr int thread_count = 8;

    auto store = make_store(true);
    ASSERT_TRUE(store.begin(destination_, "fp", chunk_count * CHUNK, CHUNK).has_value());

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&, t] {
            for (uint64_t i = static_cast<uint64_t>(t); i < chunk_count; i += thread_count) {
                if (!store.commit(destination_, i * CHUNK)) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(failures.load(), 0);

    auto reopened = make_store();
    auto loaded = reopened.load(destination_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value().committed_offsets.size(), chunk_count);
    EXPECT_TRUE(loaded.value().all_chunks_committed());
}

TEST_F(CheckpointStoreTest, DifferentDestinationsCommitIndependently) {
    auto store = make_store();
    auto other = test_dir_ / "out" / "other.bin";
    ASSERT_TRUE(store.begin(destination_, "fp", 4 * CHUNK, CHUNK).has_value());
    ASSERT_TRUE(store.begin(other, "fp", 4 * CHUNK, CHUNK).has_value());

    std::thread a([&] {
        for (uint64_t i = 0; i < 4; ++i) {
            EXPECT_TRUE(store.commit(destination_, i * CHUNK).has_value());
        }
    });
    std::thread b([&] {
        for (uint64_t i = 0; i < 2; ++i) {
            EXPECT_TRUE(store.commit(other, i * CHUNK).has_value());
        }
    });
    a.join();
    b.join();

    EXPECT_EQ(store.load(destination_).value().committed_offsets.size(), 4u);
    EXPECT_EQ(store.load(other).value().committed_offsets.size(), 2u);
}

}  // namespace kcenon::delta_fetch::test

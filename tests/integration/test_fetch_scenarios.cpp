/**
 * @file test_fetch_scenarios.cpp
 * @brief Whole-run scenarios against a scripted remote
 */

#include "test_fixtures.h"

#include <kcenon/delta_fetch/core/checksum.h>

#include <fstream>

namespace kcenon::delta_fetch::test {

// ============================================================================
// Plain fetches
// ============================================================================

class FetchScenarioTest : public CoordinatorFixture {};

TEST_F(FetchScenarioTest, TenMegabyteFileInOneMegabyteChunks) {
    constexpr std::size_t MiB = 1024 * 1024;
    auto content = make_content(10 * MiB);
    remote_->add_file("data/big.bin", content);

    auto config = fast_config(4);
    config.chunk_size = MiB;
    auto summary = run_once(config);

    ASSERT_EQ(summary.total_files(), 1u);
    EXPECT_EQ(summary.committed, 1u);
    EXPECT_EQ(summary.bytes_fetched, 10 * MiB);
    EXPECT_EQ(summary.exit_status(), 0);

    const auto* report = find_report(summary, "data/big.bin");
    ASSERT_NE(report, nullptr);
    EXPECT_EQ(report->outcome, file_outcome::committed);
    EXPECT_EQ(report->chunks_total, 10u);
    EXPECT_EQ(report->chunks_fetched, 10u);
    EXPECT_EQ(report->sha256, checksum::sha256(content));

    EXPECT_EQ(remote_->range_calls(), 10u);
    for (std::size_t i = 0; i < 10; ++i) {
        EXPECT_EQ(remote_->range_calls_at("data/big.bin", i * MiB), 1u);
    }
    EXPECT_EQ(read_file(local_root_ / "big.bin"), content);
    EXPECT_FALSE(std::filesystem::exists(local_root_ / "big.bin.dfpart"));
}

TEST_F(FetchScenarioTest, ZeroByteFileNeedsNoRangeReads) {
    remote_->add_file("data/empty.txt", "");

    auto summary = run_once(fast_config());

    EXPECT_EQ(summary.committed, 1u);
    EXPECT_EQ(remote_->range_calls(), 0u);
    ASSERT_TRUE(std::filesystem::exists(local_root_ / "empty.txt"));
    EXPECT_EQ(std::filesystem::file_size(local_root_ / "empty.txt"), 0u);

    auto store = state_store();
    auto cp = store.load(local_root_ / "empty.txt");
    ASSERT_TRUE(cp.has_value());
    EXPECT_TRUE(cp.value().is_complete());
}

TEST_F(FetchScenarioTest, SingleFileRemotePath) {
    auto content = make_content(3 * CHUNK + 5);
    remote_->add_file("data/one.bin", content);

    auto summary = run_once(fast_config(), "data/one.bin");
    EXPECT_EQ(summary.committed, 1u);
    EXPECT_EQ(read_file(local_root_ / "one.bin"), content);
}

TEST_F(FetchScenarioTest, NestedDirectoriesAreRecreated) {
    remote_->add_file("data/a.txt", "alpha");
    remote_->add_file("data/sub/b.txt", "bravo");
    remote_->add_file("data/sub/deeper/c.txt", "charlie");
    remote_->add_directory("data/empty_dir");

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.committed, 3u);
    EXPECT_EQ(read_file(local_root_ / "a.txt"), "alpha");
    EXPECT_EQ(read_file(local_root_ / "sub" / "b.txt"), "bravo");
    EXPECT_EQ(read_file(local_root_ / "sub" / "deeper" / "c.txt"), "charlie");
    EXPECT_TRUE(std::filesystem::is_directory(local_root_ / "empty_dir"));
}

TEST_F(FetchScenarioTest, DestinationTakesRemoteModificationTime) {
    remote_->add_file("data/a.txt", "alpha", 1600000000000);
    run_once(fast_config());

    auto mtime = std::filesystem::last_write_time(local_root_ / "a.txt");
    EXPECT_EQ(detail::to_epoch_ms(detail::to_system_time(mtime)), 1600000000000);
}

TEST_F(FetchScenarioTest, WorkerCountBoundsConcurrentReads) {
    constexpr std::size_t workers = 3;
    for (int i = 0; i < 5; ++i) {
        remote_->add_file("data/f" + std::to_string(i) + ".bin",
                          make_content(8 * CHUNK, static_cast<uint32_t>(i)));
    }
    remote_->set_read_latency(std::chrono::milliseconds(2));

    auto summary = run_once(fast_config(workers));
    EXPECT_EQ(summary.committed, 5u);
    EXPECT_EQ(remote_->range_calls(), 40u);
    EXPECT_LE(remote_->peak_concurrent_reads(), workers);
    EXPECT_GE(remote_->peak_concurrent_reads(), 1u);
}

TEST_F(FetchScenarioTest, RunReportIsWritten) {
    remote_->add_file("data/a.txt", "alpha");
    run_once(fast_config());

    auto report = read_file(local_root_ / "fetch_report.json");
    EXPECT_NE(report.find("\"committed\": 1"), std::string::npos);
    EXPECT_NE(report.find("data/a.txt"), std::string::npos);
}

TEST_F(FetchScenarioTest, PathFilterSkipsExcludedItems) {
    remote_->add_file("data/keep.txt", "keep");
    remote_->add_file("data/skip.tmp", "skip");
    remote_->add_file("data/cache/inner.txt", "inner");

    auto built = transfer_coordinator::builder()
        .with_config(fast_config())
        .with_logger(logger_)
        .with_path_filter(std::make_shared<glob_path_filter>(
            std::vector<std::string>{}, std::vector<std::string>{"*.tmp", "cache"}))
        .build(remote_);
    ASSERT_TRUE(built.has_value());

    auto summary = built.value().run("data", local_root_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().total_files(), 1u);
    EXPECT_TRUE(std::filesystem::exists(local_root_ / "keep.txt"));
    EXPECT_FALSE(std::filesystem::exists(local_root_ / "skip.tmp"));
    EXPECT_FALSE(std::filesystem::exists(local_root_ / "cache"));
    EXPECT_EQ(remote_->range_calls_for("data/skip.tmp"), 0u);
}

TEST_F(FetchScenarioTest, RemoteNamesResemblingLocalBookkeepingAreFetched) {
    remote_->add_file("data/draft.dfpart", "draft");
    remote_->add_file("data/.delta_fetch/notes.txt", "notes");
    remote_->add_file("data/plain.txt", "plain");

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.total_files(), 3u);
    EXPECT_EQ(summary.committed, 3u);
    EXPECT_EQ(read_file(local_root_ / "draft.dfpart"), "draft");
    EXPECT_EQ(read_file(local_root_ / ".delta_fetch" / "notes.txt"), "notes");
    EXPECT_EQ(read_file(local_root_ / "plain.txt"), "plain");

    // Checkpoints still live beside the fetched notes
    EXPECT_TRUE(state_store().load(local_root_ / "plain.txt").has_value());
}

TEST_F(FetchScenarioTest, RemoteNamesCollidingWithLocalBookkeepingFail) {
    auto content = make_content(2 * CHUNK);
    remote_->add_file("data/x.bin", content);
    remote_->add_file("data/x.bin.dfpart", "sibling");
    remote_->add_file("data/.delta_fetch/state/other.json", "{}");

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.committed, 1u);
    EXPECT_EQ(summary.failed, 2u);
    EXPECT_EQ(read_file(local_root_ / "x.bin"), content);

    const auto* sibling = find_report(summary, "data/x.bin.dfpart");
    ASSERT_NE(sibling, nullptr);
    ASSERT_TRUE(sibling->failure.has_value());
    EXPECT_EQ(sibling->failure->code, error_code::invalid_remote_item);
    EXPECT_EQ(remote_->range_calls_for("data/x.bin.dfpart"), 0u);

    const auto* state = find_report(summary, "data/.delta_fetch/state");
    ASSERT_NE(state, nullptr);
    ASSERT_TRUE(state->failure.has_value());
    EXPECT_EQ(state->failure->code, error_code::invalid_remote_item);
    EXPECT_FALSE(std::filesystem::exists(local_root_ / ".delta_fetch" / "state" / "other.json"));
}

// ============================================================================
// Incremental behaviour
// ============================================================================

TEST_F(FetchScenarioTest, UnchangedRerunFetchesNothing) {
    remote_->add_file("data/a.bin", make_content(5 * CHUNK));
    remote_->add_file("data/b.bin", make_content(2 * CHUNK, 9));

    auto first = run_once(fast_config());
    EXPECT_EQ(first.committed, 2u);

    remote_->reset_counters();
    auto second = run_once(fast_config());
    EXPECT_EQ(second.skipped, 2u);
    EXPECT_EQ(second.committed, 0u);
    EXPECT_EQ(second.bytes_fetched, 0u);
    EXPECT_EQ(remote_->range_calls(), 0u);
    EXPECT_EQ(second.exit_status(), 0);
}

TEST_F(FetchScenarioTest, IdenticalLocalFileIsAdoptedWithoutState) {
    remote_->add_file("data/a.bin", make_content(3 * CHUNK));
    run_once(fast_config());

    std::filesystem::remove_all(local_root_ / ".delta_fetch");
    remote_->reset_counters();

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(remote_->range_calls(), 0u);

    auto cp = state_store().load(local_root_ / "a.bin");
    ASSERT_TRUE(cp.has_value());
    EXPECT_TRUE(cp.value().is_complete());
}

TEST_F(FetchScenarioTest, LocalCopyMatchingRemoteHashIsAdopted) {
    auto content = make_content(3 * CHUNK);
    remote_->add_file("data/a.bin", content, 1700000000000, checksum::sha256(content));
    run_once(fast_config());

    std::filesystem::remove_all(local_root_ / ".delta_fetch");
    remote_->reset_counters();

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(remote_->range_calls(), 0u);
}

TEST_F(FetchScenarioTest, LocalCopyDifferingFromRemoteHashIsFetched) {
    auto content = make_content(3 * CHUNK);
    remote_->add_file("data/a.bin", content, 1700000000000, checksum::sha256(content));
    run_once(fast_config());

    // Same size and mtime, different bytes
    auto destination = local_root_ / "a.bin";
    auto mtime = std::filesystem::last_write_time(destination);
    write_file(destination, make_content(3 * CHUNK, 7));
    std::filesystem::last_write_time(destination, mtime);
    std::filesystem::remove_all(local_root_ / ".delta_fetch");
    remote_->reset_counters();

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.committed, 1u);
    EXPECT_EQ(remote_->range_calls(), 3u);
    EXPECT_EQ(read_file(destination), content);
}

TEST_F(FetchScenarioTest, ChangedRemoteIsFetchedAgain) {
    remote_->add_file("data/a.bin", make_content(3 * CHUNK));
    run_once(fast_config());

    auto updated = make_content(4 * CHUNK, 77);
    remote_->add_file("data/a.bin", updated, 1700000500000);
    remote_->reset_counters();

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.committed, 1u);
    EXPECT_EQ(remote_->range_calls(), 4u);
    EXPECT_EQ(read_file(local_root_ / "a.bin"), updated);
}

TEST_F(FetchScenarioTest, ResumeFetchesOnlyMissingChunks) {
    constexpr std::size_t total = 10;
    constexpr std::size_t committed_before = 4;
    auto content = make_content(total * CHUNK);
    remote_->add_file("data/r.bin", content);
    for (std::size_t i = committed_before; i < total; ++i) {
        remote_->fail_range_always("data/r.bin", i * CHUNK, error_code::connection_lost);
    }

    auto first = run_once(fast_config(2));
    EXPECT_EQ(first.failed, 1u);
    EXPECT_EQ(first.exit_status(), 1);
    EXPECT_FALSE(std::filesystem::exists(local_root_ / "r.bin"));
    EXPECT_TRUE(std::filesystem::exists(local_root_ / "r.bin.dfpart"));

    auto cp = state_store().load(local_root_ / "r.bin");
    ASSERT_TRUE(cp.has_value());
    EXPECT_EQ(cp.value().committed_offsets.size(), committed_before);

    remote_->clear_failures();
    remote_->reset_counters();

    auto second = run_once(fast_config(2));
    EXPECT_EQ(second.committed, 1u);
    EXPECT_EQ(remote_->range_calls(), total - committed_before);
    for (std::size_t i = 0; i < committed_before; ++i) {
        EXPECT_EQ(remote_->range_calls_at("data/r.bin", i * CHUNK), 0u);
    }
    EXPECT_EQ(read_file(local_root_ / "r.bin"), content);

    const auto* report = find_report(second, "data/r.bin");
    ASSERT_NE(report, nullptr);
    EXPECT_EQ(report->chunks_fetched, total - committed_before);
}

TEST_F(FetchScenarioTest, MissingStagingFileRestartsFromScratch) {
    remote_->add_file("data/r.bin", make_content(4 * CHUNK));
    remote_->fail_range_always("data/r.bin", 3 * CHUNK, error_code::connection_lost);
    run_once(fast_config());

    std::filesystem::remove(local_root_ / "r.bin.dfpart");
    remote_->clear_failures();
    remote_->reset_counters();

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.committed, 1u);
    EXPECT_EQ(remote_->range_calls(), 4u);
}

TEST_F(FetchScenarioTest, UncommittedStagedBytesAreFetchedAgain) {
    auto content = make_content(4 * CHUNK);
    remote_->add_file("data/r.bin", content);
    remote_->fail_range_always("data/r.bin", 3 * CHUNK, error_code::connection_lost);
    run_once(fast_config());

    auto staging = local_root_ / "r.bin.dfpart";
    ASSERT_TRUE(std::filesystem::exists(staging));
    auto cp = state_store().load(local_root_ / "r.bin");
    ASSERT_TRUE(cp.has_value());
    ASSERT_EQ(cp.value().committed_offsets.size(), 3u);

    // Bytes that reached the staging file without a committed offset
    {
        std::fstream out(staging, std::ios::in | std::ios::out | std::ios::binary);
        ASSERT_TRUE(out.is_open());
        auto stray = make_content(CHUNK, 99);
        out.seekp(static_cast<std::streamoff>(3 * CHUNK));
        out.write(stray.data(), static_cast<std::streamsize>(stray.size()));
    }

    remote_->clear_failures();
    remote_->reset_counters();

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.committed, 1u);
    EXPECT_EQ(remote_->range_calls(), 1u);
    EXPECT_EQ(remote_->range_calls_at("data/r.bin", 3 * CHUNK), 1u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(remote_->range_calls_at("data/r.bin", i * CHUNK), 0u);
    }
    EXPECT_EQ(read_file(local_root_ / "r.bin"), content);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(FetchScenarioTest, ExhaustedChunkFailsOnlyItsFile) {
    remote_->add_file("data/a.bin", make_content(5 * CHUNK));
    remote_->add_file("data/b.bin", make_content(3 * CHUNK, 5));
    remote_->fail_range_always("data/a.bin", CHUNK, error_code::remote_unavailable);

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.committed, 1u);
    EXPECT_FALSE(summary.succeeded());
    EXPECT_EQ(summary.exit_status(), 1);

    const auto* a = find_report(summary, "data/a.bin");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->outcome, file_outcome::failed);
    EXPECT_EQ(a->chunks_failed, 1u);
    EXPECT_EQ(a->chunks_fetched, 4u);
    ASSERT_TRUE(a->failure.has_value());
    EXPECT_EQ(a->failure->code, error_code::retries_exhausted);
    EXPECT_EQ(remote_->range_calls_at("data/a.bin", CHUNK), 3u);

    // Siblings of the failed chunk are durable for the next run
    auto cp = state_store().load(local_root_ / "a.bin");
    ASSERT_TRUE(cp.has_value());
    EXPECT_EQ(cp.value().committed_offsets.size(), 4u);

    EXPECT_FALSE(std::filesystem::exists(local_root_ / "a.bin"));
    EXPECT_TRUE(std::filesystem::exists(local_root_ / "b.bin"));
}

TEST_F(FetchScenarioTest, FatalErrorDiscardsFileState) {
    remote_->add_file("data/a.bin", make_content(4 * CHUNK));
    remote_->fail_range_always("data/a.bin", 0, error_code::remote_access_denied);

    auto summary = run_once(fast_config(1));
    EXPECT_EQ(summary.failed, 1u);

    const auto* a = find_report(summary, "data/a.bin");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->failure.has_value());
    EXPECT_EQ(a->failure->code, error_code::remote_access_denied);
    EXPECT_EQ(remote_->range_calls_at("data/a.bin", 0), 1u);

    EXPECT_FALSE(state_store().has_checkpoint(local_root_ / "a.bin"));
    EXPECT_FALSE(std::filesystem::exists(local_root_ / "a.bin.dfpart"));
}

TEST_F(FetchScenarioTest, RemoteHashMismatchFailsAfterReplan) {
    auto content = make_content(2 * CHUNK);
    remote_->add_file("data/a.bin", content, 1700000000000,
                      checksum::sha256(std::string("something else")));

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.failed, 1u);

    const auto* a = find_report(summary, "data/a.bin");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->failure.has_value());
    EXPECT_EQ(a->failure->code, error_code::content_hash_mismatch);
    EXPECT_EQ(a->replans, 1u);
    EXPECT_EQ(remote_->range_calls(), 4u);
    EXPECT_FALSE(std::filesystem::exists(local_root_ / "a.bin"));
}

TEST_F(FetchScenarioTest, MatchingRemoteHashIsAccepted) {
    auto content = make_content(2 * CHUNK);
    remote_->add_file("data/a.bin", content, 1700000000000, checksum::sha256(content));

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.committed, 1u);
}

TEST_F(FetchScenarioTest, RemoteChangeMidTransferTriggersReplan) {
    remote_->add_file("data/a.bin", make_content(6 * CHUNK));
    auto replacement = make_content(5 * CHUNK, 1234);
    remote_->change_after_reads("data/a.bin", 2, replacement, 1700000900000);

    auto summary = run_once(fast_config(1));
    EXPECT_EQ(summary.committed, 1u);

    const auto* a = find_report(summary, "data/a.bin");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->replans, 1u);
    EXPECT_EQ(a->size, 5 * CHUNK);
    EXPECT_EQ(read_file(local_root_ / "a.bin"), replacement);
}

TEST_F(FetchScenarioTest, ReplanBudgetExhausted) {
    remote_->add_file("data/a.bin", make_content(6 * CHUNK));
    remote_->change_after_reads("data/a.bin", 1, make_content(6 * CHUNK, 3), 1700000900000);

    auto config = fast_config(1);
    config.max_replans = 0;
    auto summary = run_once(config);
    EXPECT_EQ(summary.failed, 1u);

    const auto* a = find_report(summary, "data/a.bin");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->failure.has_value());
    EXPECT_EQ(a->failure->code, error_code::remote_content_changed);
    EXPECT_FALSE(state_store().has_checkpoint(local_root_ / "a.bin"));
}

TEST_F(FetchScenarioTest, AuthenticationFailureStopsRun) {
    remote_->add_file("data/a.bin", "x");
    remote_->set_auth_failure(true);

    auto auth_seen = std::make_shared<std::optional<bool>>();
    auto observer = std::make_shared<callback_observer>("auth");
    observer->on_auth([auth_seen](const auth_event& e) { *auth_seen = e.success; });

    auto built = transfer_coordinator::builder()
        .with_config(fast_config())
        .with_logger(logger_)
        .with_observer(observer)
        .build(remote_);
    ASSERT_TRUE(built.has_value());

    auto summary = built.value().run("data", local_root_);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::auth_failed);
    ASSERT_TRUE(auth_seen->has_value());
    EXPECT_FALSE(**auth_seen);
    EXPECT_EQ(remote_->range_calls(), 0u);
}

TEST_F(FetchScenarioTest, MissingRemoteRoot) {
    auto coordinator = make_coordinator(fast_config());
    auto summary = coordinator.run("nowhere", local_root_);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::remote_not_found);
}

TEST_F(FetchScenarioTest, InvalidConfigurationIsRejected) {
    auto config = fast_config();
    config.chunk_size = 16;
    auto built = transfer_coordinator::builder().with_config(config).build(remote_);
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_chunk_size);

    auto no_session = transfer_coordinator::builder().build(nullptr);
    ASSERT_FALSE(no_session.has_value());
}

// ============================================================================
// Archiving
// ============================================================================

TEST_F(FetchScenarioTest, ReplacedFileIsArchived) {
    write_file(local_root_ / "a.txt", "previous local version");
    remote_->add_file("data/a.txt", "new remote version");

    auto summary = run_once(fast_config());
    EXPECT_EQ(summary.committed, 1u);

    const auto* a = find_report(summary, "data/a.txt");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->archived_to.has_value());
    EXPECT_EQ(read_file(*a->archived_to), "previous local version");
    EXPECT_EQ(a->archived_to->lexically_relative(local_root_ / ".versions").parent_path(),
              std::filesystem::path());
    EXPECT_EQ(read_file(local_root_ / "a.txt"), "new remote version");
}

TEST_F(FetchScenarioTest, ArchivePolicyNeverOverwrites) {
    write_file(local_root_ / "a.txt", "previous local version");
    remote_->add_file("data/a.txt", "new remote version");

    auto config = fast_config();
    config.archive = archive_policy::never;
    auto summary = run_once(config);

    const auto* a = find_report(summary, "data/a.txt");
    ASSERT_NE(a, nullptr);
    EXPECT_FALSE(a->archived_to.has_value());
    EXPECT_FALSE(std::filesystem::exists(local_root_ / ".versions"));
    EXPECT_EQ(read_file(local_root_ / "a.txt"), "new remote version");
}

TEST_F(FetchScenarioTest, CustomHistoryDirectory) {
    write_file(local_root_ / "sub" / "a.txt", "old");
    remote_->add_file("data/sub/a.txt", "new");

    auto config = fast_config();
    config.history_directory = test_dir_ / "history";
    auto summary = run_once(config);

    const auto* a = find_report(summary, "data/sub/a.txt");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->archived_to.has_value());
    EXPECT_EQ(a->archived_to->parent_path(), test_dir_ / "history" / "sub");
}

// ============================================================================
// Cancellation and events
// ============================================================================

TEST_F(FetchScenarioTest, CancelKeepsCommittedChunksForNextRun) {
    constexpr std::size_t total = 40;
    auto content = make_content(total * CHUNK);
    remote_->add_file("data/c.bin", content);
    remote_->set_read_latency(std::chrono::milliseconds(5));

    auto coordinator = make_coordinator(fast_config(1));
    auto* target = &coordinator;
    auto fired = std::make_shared<std::atomic<bool>>(false);
    auto observer = std::make_shared<callback_observer>("canceller");
    observer->on_progress([target, fired](const progress_event& e) {
        if (e.chunks_committed >= 3 && !fired->exchange(true)) {
            target->cancel();
        }
    });
    coordinator.events().register_observer(observer);

    auto first = coordinator.run("data", local_root_);
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first.value().was_cancelled);
    EXPECT_EQ(first.value().exit_status(), 130);
    const auto* c = find_report(first.value(), "data/c.bin");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->outcome, file_outcome::cancelled);

    auto cp = state_store().load(local_root_ / "c.bin");
    ASSERT_TRUE(cp.has_value());
    auto kept = cp.value().committed_offsets.size();
    EXPECT_GE(kept, 3u);
    EXPECT_LT(kept, total);

    remote_->set_read_latency(std::chrono::milliseconds(0));
    remote_->reset_counters();

    auto second = coordinator.run("data", local_root_);
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(second.value().was_cancelled);
    EXPECT_EQ(second.value().committed, 1u);
    EXPECT_EQ(remote_->range_calls(), total - kept);
    EXPECT_EQ(read_file(local_root_ / "c.bin"), content);
}

TEST_F(FetchScenarioTest, LifecycleEventsArriveInOrder) {
    remote_->add_file("data/a.bin", make_content(2 * CHUNK));

    auto log = std::make_shared<std::vector<std::string>>();
    auto mutex = std::make_shared<std::mutex>();
    auto push = [log, mutex](const std::string& name) {
        std::lock_guard<std::mutex> lock(*mutex);
        log->push_back(name);
    };

    auto observer = std::make_shared<callback_observer>("recorder");
    observer->on_auth([push](const auth_event&) { push("auth"); });
    observer->on_listing([push](const listing_event&) { push("listing"); });
    observer->on_start([push](const start_event&) { push("start"); });
    observer->on_progress([push](const progress_event&) { push("progress"); });
    observer->on_complete([push](const complete_event& e) {
        push(e.success ? "complete" : "complete-failed");
    });
    observer->on_session_complete([push](const session_event&) { push("session"); });

    auto built = transfer_coordinator::builder()
        .with_config(fast_config(1))
        .with_logger(logger_)
        .with_observer(observer)
        .build(remote_);
    ASSERT_TRUE(built.has_value());
    ASSERT_TRUE(built.value().run("data", local_root_).has_value());

    std::vector<std::string> expected{
        "auth", "listing", "start", "progress", "progress", "complete", "session"};
    EXPECT_EQ(*log, expected);
}

TEST_F(FetchScenarioTest, ThrowingObserverDoesNotBreakTheRun) {
    remote_->add_file("data/a.bin", make_content(2 * CHUNK));

    auto observer = std::make_shared<callback_observer>("thrower");
    observer->on_progress([](const progress_event&) {
        throw std::runtime_error("observer failure");
    });

    auto built = transfer_coordinator::builder()
        .with_config(fast_config())
        .with_logger(logger_)
        .with_observer(observer)
        .build(remote_);
    ASSERT_TRUE(built.has_value());

    auto summary = built.value().run("data", local_root_);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().committed, 1u);
}

TEST_F(FetchScenarioTest, ListContentsFiresListingEvent) {
    remote_->add_file("data/a.bin", "a");
    remote_->add_file("data/b.bin", "b");

    auto coordinator = make_coordinator(fast_config());
    std::size_t seen = 0;
    auto observer = std::make_shared<callback_observer>("listing");
    observer->on_listing([&seen](const listing_event& e) { seen = e.children.size(); });
    coordinator.events().register_observer(observer);

    auto children = coordinator.list_contents("data");
    ASSERT_TRUE(children.has_value());
    EXPECT_EQ(children.value().size(), 2u);
    EXPECT_EQ(seen, 2u);
}

}  // namespace kcenon::delta_fetch::test

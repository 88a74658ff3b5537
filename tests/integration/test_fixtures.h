/**
 * @file test_fixtures.h
 * @brief Test fixtures and a scripted remote for engine and integration tests
 */

#ifndef KCENON_DELTA_FETCH_TEST_FIXTURES_H
#define KCENON_DELTA_FETCH_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/delta_fetch/core/checkpoint_store.h>
#include <kcenon/delta_fetch/core/json_utils.h>
#include <kcenon/delta_fetch/delta_fetch.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::delta_fetch::test {

/**
 * @brief Deterministic pseudo-random content
 */
inline auto make_content(std::size_t size, uint32_t seed = 42) -> std::string {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    std::string content(size, '\0');
    for (auto& c : content) {
        c = static_cast<char>(dis(gen));
    }
    return content;
}

inline auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

/**
 * @brief In-memory remote whose failures are scripted per chunk
 *
 * Paths are '/' separated; "" is the root directory. Thread-safe.
 */
class scripted_remote_session : public remote_session {
public:
    using range_hook = std::function<void(const std::string& path, uint64_t offset)>;

    void add_file(const std::string& path, std::string content,
                  int64_t mtime_ms = 1700000000000,
                  std::optional<std::string> sha256 = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        ensure_parents(path);
        node n;
        n.kind = item_kind::file;
        n.content = std::move(content);
        n.mtime_ms = mtime_ms;
        n.sha256 = std::move(sha256);
        nodes_[path] = std::move(n);
    }

    void add_directory(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        ensure_parents(path);
        node n;
        n.kind = item_kind::directory;
        nodes_[path] = std::move(n);
    }

    /**
     * @brief Fail the next `times` reads of the chunk at offset with code
     */
    void fail_range(const std::string& path, uint64_t offset, error_code code,
                    std::size_t times) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[{path, offset}] = failure{code, times};
    }

    /**
     * @brief Fail every read of the chunk at offset with code
     */
    void fail_range_always(const std::string& path, uint64_t offset, error_code code) {
        fail_range(path, offset, code, static_cast<std::size_t>(-1));
    }

    void clear_failures() {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.clear();
    }

    /**
     * @brief Replace the content of path after `reads` successful reads of it
     */
    void change_after_reads(const std::string& path, std::size_t reads,
                            std::string new_content, int64_t new_mtime_ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_changes_[path] = change{reads, std::move(new_content), new_mtime_ms};
    }

    void set_auth_failure(bool fail) { auth_fails_ = fail; }

    void set_read_latency(std::chrono::milliseconds latency) { latency_ = latency; }

    /**
     * @brief Called before every read, outside the session lock
     */
    void set_range_hook(range_hook hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = std::move(hook);
    }

    auto authenticate() -> result<session_info> override {
        ++auth_calls_;
        if (auth_fails_) {
            return unexpected(error(error_code::auth_failed, "scripted authentication failure"));
        }
        session_info info;
        info.account = "scripted";
        info.session_id = "session-" + std::to_string(auth_calls_.load());
        info.authenticated_at = std::chrono::system_clock::now();
        return info;
    }

    auto stat(const std::string& remote_path) -> result<remote_item> override {
        ++stat_calls_;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(remote_path);
        if (remote_path.empty()) {
            return describe("", node{});
        }
        if (it == nodes_.end()) {
            return unexpected(error(error_code::remote_not_found,
                "scripted remote has no " + remote_path));
        }
        return describe(remote_path, it->second);
    }

    auto list_children(const std::string& remote_path)
        -> result<std::vector<remote_item>> override {
        ++list_calls_;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!remote_path.empty()) {
            auto it = nodes_.find(remote_path);
            if (it == nodes_.end()) {
                return unexpected(error(error_code::remote_not_found,
                    "scripted remote has no " + remote_path));
            }
            if (it->second.kind != item_kind::directory) {
                return unexpected(error(error_code::invalid_remote_item,
                    remote_path + " is not a directory"));
            }
        }

        std::vector<remote_item> children;
        for (const auto& [path, n] : nodes_) {
            if (parent_of(path) == remote_path && !path.empty()) {
                children.push_back(describe(path, n));
            }
        }
        return children;
    }

    auto open_range(const remote_item& item, uint64_t offset, uint64_t length)
        -> result<std::vector<std::byte>> override {
        range_hook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook = hook_;
        }
        if (hook) {
            hook(item.path, offset);
        }

        auto now_active = ++active_reads_;
        auto previous = peak_reads_.load();
        while (previous < now_active && !peak_reads_.compare_exchange_weak(previous, now_active)) {
        }
        if (latency_.count() > 0) {
            std::this_thread::sleep_for(latency_);
        }
        auto read = read_range(item, offset, length);
        --active_reads_;
        return read;
    }

    // ------------------------------------------------------------------------
    // Observations
    // ------------------------------------------------------------------------

    [[nodiscard]] auto range_calls() const -> std::size_t { return range_calls_.load(); }

    [[nodiscard]] auto range_calls_for(const std::string& path) const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_by_path_.find(path);
        return it == calls_by_path_.end() ? 0 : it->second;
    }

    [[nodiscard]] auto range_calls_at(const std::string& path, uint64_t offset) const
        -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_by_chunk_.find({path, offset});
        return it == calls_by_chunk_.end() ? 0 : it->second;
    }

    [[nodiscard]] auto auth_calls() const -> std::size_t { return auth_calls_.load(); }
    [[nodiscard]] auto stat_calls() const -> std::size_t { return stat_calls_.load(); }
    [[nodiscard]] auto list_calls() const -> std::size_t { return list_calls_.load(); }
    [[nodiscard]] auto peak_concurrent_reads() const -> std::size_t { return peak_reads_.load(); }

    void reset_counters() {
        std::lock_guard<std::mutex> lock(mutex_);
        range_calls_ = 0;
        calls_by_path_.clear();
        calls_by_chunk_.clear();
        peak_reads_ = 0;
    }

    [[nodiscard]] auto content_of(const std::string& path) const -> std::string {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(path);
        return it == nodes_.end() ? std::string{} : it->second.content;
    }

private:
    struct node {
        item_kind kind = item_kind::directory;
        std::string content;
        int64_t mtime_ms = 1700000000000;
        std::optional<std::string> sha256;
    };

    struct failure {
        error_code code = error_code::connection_lost;
        std::size_t remaining = 0;
    };

    struct change {
        std::size_t after_reads = 0;
        std::string content;
        int64_t mtime_ms = 0;
    };

    static auto parent_of(const std::string& path) -> std::string {
        auto slash = path.find_last_of('/');
        return slash == std::string::npos ? std::string{} : path.substr(0, slash);
    }

    static auto name_of(const std::string& path) -> std::string {
        auto slash = path.find_last_of('/');
        return slash == std::string::npos ? path : path.substr(slash + 1);
    }

    void ensure_parents(const std::string& path) {
        for (auto parent = parent_of(path); !parent.empty(); parent = parent_of(parent)) {
            if (nodes_.find(parent) == nodes_.end()) {
                nodes_[parent] = node{};
            }
        }
    }

    static auto describe(const std::string& path, const node& n) -> remote_item {
        remote_item item;
        item.path = path;
        item.name = name_of(path);
        item.kind = n.kind;
        item.size = n.kind == item_kind::file ? n.content.size() : 0;
        item.modified = detail::from_epoch_ms(n.mtime_ms);
        item.sha256 = n.sha256;
        return item;
    }

    auto read_range(const remote_item& item, uint64_t offset, uint64_t length)
        -> result<std::vector<std::byte>> {
        std::lock_guard<std::mutex> lock(mutex_);
        ++range_calls_;
        ++calls_by_path_[item.path];
        ++calls_by_chunk_[{item.path, offset}];

        auto failed = failures_.find({item.path, offset});
        if (failed != failures_.end() && failed->second.remaining > 0) {
            --failed->second.remaining;
            return unexpected(error(failed->second.code,
                "scripted failure at " + item.path + ":" + std::to_string(offset)));
        }

        auto it = nodes_.find(item.path);
        if (it == nodes_.end() || it->second.kind != item_kind::file) {
            return unexpected(error(error_code::remote_not_found, "no file " + item.path));
        }
        auto& n = it->second;
        if (n.content.size() != item.size ||
            n.mtime_ms != detail::to_epoch_ms(item.modified)) {
            return unexpected(error(error_code::remote_content_changed,
                item.path + " changed since it was listed"));
        }
        if (offset > n.content.size() || length > n.content.size() - offset) {
            return unexpected(error(error_code::invalid_range, "range outside " + item.path));
        }

        std::vector<std::byte> data(static_cast<std::size_t>(length));
        if (length > 0) {
            std::memcpy(data.data(), n.content.data() + offset, static_cast<std::size_t>(length));
        }

        auto pending = pending_changes_.find(item.path);
        if (pending != pending_changes_.end()) {
            if (pending->second.after_reads > 0) {
                --pending->second.after_reads;
            }
            if (pending->second.after_reads == 0) {
                n.content = std::move(pending->second.content);
                n.mtime_ms = pending->second.mtime_ms;
                pending_changes_.erase(pending);
            }
        }
        return data;
    }

    mutable std::mutex mutex_;
    std::map<std::string, node> nodes_;
    std::map<std::pair<std::string, uint64_t>, failure> failures_;
    std::map<std::string, change> pending_changes_;
    range_hook hook_;

    std::map<std::string, std::size_t> calls_by_path_;
    std::map<std::pair<std::string, uint64_t>, std::size_t> calls_by_chunk_;
    std::atomic<std::size_t> range_calls_{0};
    std::atomic<std::size_t> auth_calls_{0};
    std::atomic<std::size_t> stat_calls_{0};
    std::atomic<std::size_t> list_calls_{0};
    std::atomic<std::size_t> active_reads_{0};
    std::atomic<std::size_t> peak_reads_{0};
    std::atomic<bool> auth_fails_{false};
    std::chrono::milliseconds latency_{0};
};

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("delta_fetch_test_" + std::to_string(std::random_device{}()) + "_" +
                     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(test_dir_);
        local_root_ = test_dir_ / "local";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
    std::filesystem::path local_root_;
};

/**
 * @brief Fixture for whole-run tests against a scripted remote
 */
class CoordinatorFixture : public TempDirectoryFixture {
protected:
    static constexpr std::size_t CHUNK = 64 * 1024;

    void SetUp() override {
        TempDirectoryFixture::SetUp();
        remote_ = std::make_shared<scripted_remote_session>();
        logger_ = std::make_shared<fetch_logger>(log_level::debug);
        logger_->set_console_output(false);
    }

    /**
     * @brief Config with short backoff so retry paths finish quickly
     */
    auto fast_config(std::size_t workers = 4) -> coordinator_config {
        coordinator_config config;
        config.worker_count = workers;
        config.chunk_size = CHUNK;
        config.retry.max_attempts = 3;
        config.retry.base_delay = std::chrono::milliseconds(1);
        config.retry.max_delay = std::chrono::milliseconds(10);
        config.sync_writes = false;
        return config;
    }

    auto make_coordinator(coordinator_config config) -> transfer_coordinator {
        auto built = transfer_coordinator::builder()
            .with_config(std::move(config))
            .with_logger(logger_)
            .build(remote_);
        EXPECT_TRUE(built.has_value());
        return std::move(built.value());
    }

    auto run_once(coordinator_config config, const std::string& remote_path = "data")
        -> run_summary {
        auto coordinator = make_coordinator(std::move(config));
        auto summary = coordinator.run(remote_path, local_root_);
        EXPECT_TRUE(summary.has_value());
        return summary ? summary.value() : run_summary{};
    }

    auto state_store() -> checkpoint_store {
        checkpoint_store_config config(local_root_ / ".delta_fetch" / "state");
        config.sync_on_commit = false;
        return checkpoint_store(config);
    }

    static auto find_report(const run_summary& summary, const std::string& remote_path)
        -> const file_report* {
        for (const auto& report : summary.files) {
            if (report.remote_path == remote_path) {
                return &report;
            }
        }
        return nullptr;
    }

    std::shared_ptr<scripted_remote_session> remote_;
    std::shared_ptr<fetch_logger> logger_;
};

}  // namespace kcenon::delta_fetch::test

#endif  // KCENON_DELTA_FETCH_TEST_FIXTURES_H

/**
 * @file delta_fetch_cli.cpp
 * @brief Command-line front end for delta_fetch
 *
 * Serves a mounted directory as the remote and pulls a path from it into a
 * local directory. Rerunning the same command resumes an interrupted run.
 *
 * Exit status: 0 when every file was committed or skipped, 1 when a file
 * failed or the run could not start, 130 when interrupted.
 */

#include <kcenon/delta_fetch/delta_fetch.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

using namespace kcenon::delta_fetch;

namespace {

std::atomic<transfer_coordinator*> active_coordinator{nullptr};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (auto* coordinator = active_coordinator.load()) {
            coordinator->cancel();
        }
    }
}

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Parse a size such as "4M", "512K" or "1048576"
 */
auto parse_size(const std::string& text) -> std::optional<std::size_t> {
    if (text.empty()) {
        return std::nullopt;
    }
    std::size_t multiplier = 1;
    auto digits = text;
    switch (text.back()) {
        case 'K': case 'k': multiplier = 1024; digits.pop_back(); break;
        case 'M': case 'm': multiplier = 1024 * 1024; digits.pop_back(); break;
        case 'G': case 'g': multiplier = 1024 * 1024 * 1024; digits.pop_back(); break;
        default: break;
    }
    try {
        std::size_t used = 0;
        auto value = std::stoull(digits, &used);
        if (used != digits.size()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(value) * multiplier;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto parse_count(const std::string& text) -> std::optional<std::size_t> {
    try {
        std::size_t used = 0;
        auto value = std::stoull(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/**
 * @brief Appends the destination of every committed file to an index file
 */
class index_file_observer final : public fetch_observer {
public:
    explicit index_file_observer(std::filesystem::path path) : path_(std::move(path)) {}

    [[nodiscard]] auto name() const -> std::string override { return "index-file"; }

    [[nodiscard]] auto capabilities() const -> observer_capability override {
        return observer_capability::complete;
    }

    void on_complete(const complete_event& event) override {
        if (event.outcome != file_outcome::committed) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::ofstream out(path_, std::ios::app);
        if (!out) {
            throw std::runtime_error("cannot append to " + path_.string());
        }
        out << event.destination.string() << '\n';
    }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

/**
 * @brief Prints one line per finished file and a summary line
 */
auto make_console_observer(bool verbose) -> std::shared_ptr<callback_observer> {
    auto observer = std::make_shared<callback_observer>("console");

    observer->on_complete([verbose](const complete_event& e) {
        if (e.outcome == file_outcome::skipped && !verbose) {
            return;
        }
        std::cout << "[" << to_string(e.outcome) << "] " << e.item.path;
        if (e.error_message) {
            std::cout << ": " << *e.error_message;
        }
        std::cout << std::endl;
    });

    if (verbose) {
        observer->on_start([](const start_event& e) {
            std::cout << "[start] " << e.item.path << " (" << format_bytes(e.item.size)
                      << ", " << e.chunks_pending << "/" << e.chunks_total << " chunks)"
                      << std::endl;
        });
    }
    return observer;
}

void print_usage(const char* program) {
    std::cout << "delta_fetch - resumable chunked copy of a remote tree" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <remote_root> [remote_path] [local_dir]"
              << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --workers <n>               Concurrent chunk fetches (default: 4)" << std::endl;
    std::cout << "  --retries <n>               Attempts per chunk (default: 3)" << std::endl;
    std::cout << "  --chunk-size <size>         Chunk size, e.g. 4M (default: 1M)" << std::endl;
    std::cout << "  --backoff-ms <ms>           Initial retry delay (default: 1000)" << std::endl;
    std::cout << "  --history-dir <dir>         Where replaced versions are kept" << std::endl;
    std::cout << "  --archive <policy>          always | if-changed | never" << std::endl;
    std::cout << "  --profile <name>            Filter profile to apply" << std::endl;
    std::cout << "  --profile-file <file>       Profile file (default: profiles.json)" << std::endl;
    std::cout << "  --list                      List remote_path and exit" << std::endl;
    std::cout << "  --log-file <file>           Append log records to a file" << std::endl;
    std::cout << "  --json-logs                 Emit log records as JSON" << std::endl;
    std::cout << "  --verbose                   Debug logging and per-file output" << std::endl;
    std::cout << "  --index-file <file>         Append committed destinations to a file"
              << std::endl;
    std::cout << "  --help                      Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " /mnt/share reports ./reports" << std::endl;
    std::cout << "  " << program << " --workers 8 --chunk-size 4M /mnt/share" << std::endl;
    std::cout << "  " << program << " --profile docs --profile-file p.json /mnt/share" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    coordinator_config config;
    std::optional<std::string> profile_name;
    std::filesystem::path profile_file = "profiles.json";
    std::optional<std::filesystem::path> log_file;
    std::optional<std::filesystem::path> index_file;
    bool list_only = false;
    bool json_logs = false;
    bool verbose = false;
    std::vector<std::string> positional;

    auto require_value = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (++i >= argc) {
            std::cerr << "Error: " << flag << " requires an argument" << std::endl;
            return std::nullopt;
        }
        return std::string(argv[i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--workers" || arg == "--retries") {
            auto value = require_value(i, arg);
            auto count = value ? parse_count(*value) : std::nullopt;
            if (!count) {
                std::cerr << "Error: " << arg << " expects a number" << std::endl;
                return 1;
            }
            if (arg == "--workers") {
                config.worker_count = *count;
            } else {
                config.retry.max_attempts = *count;
            }
        } else if (arg == "--chunk-size") {
            auto value = require_value(i, arg);
            auto size = value ? parse_size(*value) : std::nullopt;
            if (!size) {
                std::cerr << "Error: --chunk-size expects a size such as 1M" << std::endl;
                return 1;
            }
            config.chunk_size = *size;
        } else if (arg == "--backoff-ms") {
            auto value = require_value(i, arg);
            auto ms = value ? parse_count(*value) : std::nullopt;
            if (!ms) {
                std::cerr << "Error: --backoff-ms expects a number" << std::endl;
                return 1;
            }
            config.retry.base_delay = std::chrono::milliseconds{static_cast<int64_t>(*ms)};
        } else if (arg == "--history-dir") {
            auto value = require_value(i, arg);
            if (!value) return 1;
            config.history_directory = *value;
        } else if (arg == "--archive") {
            auto value = require_value(i, arg);
            if (!value) return 1;
            auto policy = parse_archive_policy(*value);
            if (!policy) {
                std::cerr << "Error: " << policy.error().message << std::endl;
                return 1;
            }
            config.archive = policy.value();
        } else if (arg == "--profile") {
            auto value = require_value(i, arg);
            if (!value) return 1;
            profile_name = *value;
        } else if (arg == "--profile-file") {
            auto value = require_value(i, arg);
            if (!value) return 1;
            profile_file = *value;
        } else if (arg == "--log-file") {
            auto value = require_value(i, arg);
            if (!value) return 1;
            log_file = *value;
        } else if (arg == "--index-file") {
            auto value = require_value(i, arg);
            if (!value) return 1;
            index_file = *value;
        } else if (arg == "--list") {
            list_only = true;
        } else if (arg == "--json-logs") {
            json_logs = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 3) {
        print_usage(argv[0]);
        return 1;
    }
    const std::filesystem::path remote_root = positional[0];
    const std::string remote_path = positional.size() > 1 ? positional[1] : "";
    const std::filesystem::path local_dir = positional.size() > 2 ? positional[2] : ".";

    auto logger = std::make_shared<fetch_logger>(verbose ? log_level::debug : log_level::info);
    logger->enable_json_output(json_logs);
    if (log_file && !logger->open_log_file(*log_file)) {
        std::cerr << "Error: cannot open log file " << log_file->string() << std::endl;
        return 1;
    }

    auto builder = transfer_coordinator::builder();
    builder.with_config(config)
        .with_logger(logger)
        .with_observer(make_console_observer(verbose));

    if (profile_name) {
        auto filter = load_filter_profile(profile_file, *profile_name);
        if (!filter) {
            std::cerr << "Error: " << filter.error().message << std::endl;
            return 1;
        }
        builder.with_path_filter(std::make_shared<glob_path_filter>(std::move(filter.value())));
    }
    if (index_file) {
        builder.with_observer(std::make_shared<index_file_observer>(*index_file));
    }

    auto session = std::make_shared<directory_remote_session>(remote_root);
    auto built = builder.build(session);
    if (!built) {
        std::cerr << "Error: " << built.error().message << std::endl;
        return 1;
    }
    auto& coordinator = built.value();

    if (list_only) {
        auto children = coordinator.list_contents(remote_path);
        if (!children) {
            std::cerr << "Error: " << children.error().message << std::endl;
            return 1;
        }
        for (const auto& child : children.value()) {
            std::cout << (child.is_directory() ? "d " : "f ") << std::setw(12)
                      << (child.is_directory() ? std::string("-") : format_bytes(child.size))
                      << "  " << child.name << std::endl;
        }
        return 0;
    }

    active_coordinator.store(&coordinator);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto summary = coordinator.run(remote_path, local_dir);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    active_coordinator.store(nullptr);

    if (!summary) {
        std::cerr << "Error: " << summary.error().message << std::endl;
        return 1;
    }

    const auto& s = summary.value();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        s.finished_at - s.started_at);
    std::cout << std::endl;
    std::cout << s.total_files() << " files: " << s.committed << " committed, "
              << s.skipped << " skipped, " << s.failed << " failed, "
              << s.cancelled << " cancelled" << std::endl;
    std::cout << "Fetched " << format_bytes(s.bytes_fetched) << " in " << s.chunks_fetched
              << " chunks (" << elapsed.count() << " ms)" << std::endl;
    if (s.was_cancelled) {
        std::cout << "Interrupted; rerun the same command to resume." << std::endl;
    }

    logger->shutdown();
    return s.exit_status();
}

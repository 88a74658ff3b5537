/**
 * @file transfer_types.cpp
 * @brief Implementation of the run summary
 */

#include "kcenon/delta_fetch/core/transfer_types.h"
#include "kcenon/delta_fetch/core/json_utils.h"

#include <fstream>
#include <sstream>

namespace kcenon::delta_fetch {

void run_summary::add(file_report report) {
    switch (report.outcome) {
        case file_outcome::committed: ++committed; break;
        case file_outcome::skipped: ++skipped; break;
        case file_outcome::failed: ++failed; break;
        case file_outcome::cancelled: ++cancelled; break;
    }
    bytes_fetched += report.bytes_fetched;
    chunks_fetched += report.chunks_fetched;
    files.push_back(std::move(report));
}

auto run_summary::exit_status() const -> int {
    if (was_cancelled) {
        return 130;
    }
    return failed == 0 ? 0 : 1;
}

auto run_summary::to_json() const -> std::string {
    using detail::escape_json_string;

    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"started_at\": \"" << detail::iso8601_timestamp(started_at) << "\",\n";
    oss << "  \"finished_at\": \"" << detail::iso8601_timestamp(finished_at) << "\",\n";
    oss << "  \"total_files\": " << files.size() << ",\n";
    oss << "  \"committed\": " << committed << ",\n";
    oss << "  \"skipped\": " << skipped << ",\n";
    oss << "  \"failed\": " << failed << ",\n";
    oss << "  \"cancelled\": " << cancelled << ",\n";
    oss << "  \"bytes_fetched\": " << bytes_fetched << ",\n";
    oss << "  \"chunks_fetched\": " << chunks_fetched << ",\n";
    oss << "  \"details\": [";

    for (std::size_t i = 0; i < files.size(); ++i) {
        const auto& f = files[i];
        oss << (i == 0 ? "\n" : ",\n");
        oss << "    {\"remote_path\": \"" << escape_json_string(f.remote_path) << "\""
            << ", \"destination\": \"" << escape_json_string(f.destination.string()) << "\""
            << ", \"outcome\": \"" << to_string(f.outcome) << "\""
            << ", \"size\": " << f.size
            << ", \"bytes_fetched\": " << f.bytes_fetched
            << ", \"chunks_total\": " << f.chunks_total
            << ", \"chunks_fetched\": " << f.chunks_fetched
            << ", \"chunks_failed\": " << f.chunks_failed
            << ", \"retries\": " << f.retries;
        if (!f.sha256.empty()) {
            oss << ", \"sha256\": \"" << f.sha256 << "\"";
        }
        if (f.archived_to) {
            oss << ", \"archived_to\": \"" << escape_json_string(f.archived_to->string()) << "\"";
        }
        if (f.failure) {
            oss << ", \"error\": \"" << escape_json_string(f.failure->message) << "\"";
        }
        oss << "}";
    }

    oss << (files.empty() ? "]\n" : "\n  ]\n");
    oss << "}\n";
    return oss.str();
}

auto run_summary::write_json(const std::filesystem::path& path) const -> result<void> {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return unexpected(error(error_code::file_write_error,
            "failed to open report " + path.string()));
    }
    file << to_json();
    if (!file) {
        return unexpected(error(error_code::file_write_error,
            "failed to write report " + path.string()));
    }
    return {};
}

}  // namespace kcenon::delta_fetch

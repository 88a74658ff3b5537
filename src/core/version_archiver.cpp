/**
 * @file version_archiver.cpp
 * @brief Implementation of version_archiver
 */

#include "kcenon/delta_fetch/core/version_archiver.h"
#include "kcenon/delta_fetch/core/checksum.h"
#include "kcenon/delta_fetch/core/json_utils.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <sstream>

namespace kcenon::delta_fetch {

namespace {

constexpr const char* META_SUFFIX = ".meta.json";

auto serialize_version(const archived_version& v) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"original_path\": \"" << detail::escape_json_string(v.original_path.string()) << "\",\n";
    oss << "  \"archived_path\": \"" << detail::escape_json_string(v.archived_path.string()) << "\",\n";
    oss << "  \"version\": " << v.version << ",\n";
    oss << "  \"checksum\": \"" << v.checksum << "\",\n";
    oss << "  \"original_mtime\": " << detail::to_epoch_ms(v.original_mtime) << ",\n";
    oss << "  \"archived_at\": " << detail::to_epoch_ms(v.archived_at) << "\n";
    oss << "}\n";
    return oss.str();
}

auto deserialize_version(const std::string& json) -> std::optional<archived_version> {
    auto original = detail::extract_json_value(json, "original_path");
    auto archived = detail::extract_json_value(json, "archived_path");
    auto version = detail::extract_json_value(json, "version");
    if (!original || !archived || !version) {
        return std::nullopt;
    }

    archived_version v;
    v.original_path = *original;
    v.archived_path = *archived;
    v.checksum = detail::extract_json_value(json, "checksum").value_or("");
    try {
        v.version = static_cast<uint32_t>(std::stoul(*version));
        v.original_mtime = detail::from_epoch_ms(
            std::stoll(detail::extract_json_value(json, "original_mtime").value_or("0")));
        v.archived_at = detail::from_epoch_ms(
            std::stoll(detail::extract_json_value(json, "archived_at").value_or("0")));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return v;
}

auto is_under(const std::filesystem::path& path, const std::filesystem::path& root) -> bool {
    auto rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    return !rel.empty() && *rel.begin() != "..";
}

auto same_digest(const std::string& a, const std::string& b) -> bool {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

}  // namespace

version_archiver::version_archiver(archive_config config, std::shared_ptr<fetch_logger> logger)
    : config_(std::move(config))
    , logger_(logger ? std::move(logger) : make_quiet_logger()) {
}

auto version_archiver::relative_name(const std::filesystem::path& destination) const
    -> std::filesystem::path {
    if (!config_.tree_root.empty() && is_under(destination, config_.tree_root)) {
        return destination.lexically_normal().lexically_relative(
            config_.tree_root.lexically_normal());
    }
    return destination.filename();
}

auto version_archiver::move_into_history(const std::filesystem::path& source,
                                         const std::filesystem::path& target) -> result<void> {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return unexpected(error(error_code::directory_create_failed,
            "failed to create " + target.parent_path().string() + ": " + ec.message()));
    }

    std::filesystem::rename(source, target, ec);
    if (!ec) {
        return {};
    }

    if (ec != std::errc::cross_device_link) {
        return unexpected(error(error_code::archive_failed,
            "failed to move " + source.string() + " to " + target.string() + ": " + ec.message()));
    }

    // History on another filesystem: copy with timestamps, then drop the source.
    ec.clear();
    std::filesystem::copy_file(source, target, std::filesystem::copy_options::none, ec);
    if (ec) {
        return unexpected(error(error_code::archive_failed,
            "failed to copy " + source.string() + " to " + target.string() + ": " + ec.message()));
    }
    auto mtime = std::filesystem::last_write_time(source, ec);
    if (!ec) {
        std::filesystem::last_write_time(target, mtime, ec);
    }
    ec.clear();
    std::filesystem::remove(source, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(target, cleanup_ec);
        return unexpected(error(error_code::archive_failed,
            "failed to remove " + source.string() + " after copy: " + ec.message()));
    }
    return {};
}

auto version_archiver::archive_if_needed(const std::filesystem::path& destination,
                                         const std::optional<std::string>& incoming_sha256)
    -> result<std::optional<archived_version>> {
    if (config_.policy == archive_policy::never) {
        return std::optional<archived_version>{};
    }

    std::lock_guard lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::exists(destination, ec)) {
        return std::optional<archived_version>{};
    }
    if (!std::filesystem::is_regular_file(destination, ec)) {
        return unexpected(error(error_code::archive_failed,
            "destination is not a regular file: " + destination.string()));
    }

    auto existing_hash = checksum::sha256_file(destination);
    if (!existing_hash) {
        return unexpected(existing_hash.error());
    }

    if (config_.policy == archive_policy::if_changed && incoming_sha256 &&
        same_digest(existing_hash.value(), *incoming_sha256)) {
        DF_LOG_DEBUG(*logger_, log_category::archiver,
            "Content unchanged, not archiving " + destination.string());
        return std::optional<archived_version>{};
    }

    archived_version version;
    version.original_path = destination;
    version.checksum = existing_hash.value();
    version.archived_at = std::chrono::system_clock::now();
    version.version = static_cast<uint32_t>(versions(destination).size() + 1);

    auto mtime = std::filesystem::last_write_time(destination, ec);
    version.original_mtime = ec ? version.archived_at : detail::to_system_time(mtime);

    auto base = config_.history_root / relative_name(destination);
    auto stem = base.string() + "." + detail::compact_timestamp(version.archived_at);
    std::filesystem::path target = stem;
    for (int n = 1; std::filesystem::exists(target, ec); ++n) {
        target = stem + "-" + std::to_string(n);
    }
    version.archived_path = target;

    auto moved = move_into_history(destination, target);
    if (!moved) {
        DF_LOG_ERROR(*logger_, log_category::archiver, moved.error().message);
        return unexpected(moved.error());
    }

    auto meta_path = target;
    meta_path += META_SUFFIX;
    std::ofstream meta(meta_path, std::ios::trunc);
    meta << serialize_version(version);
    if (!meta) {
        DF_LOG_WARN(*logger_, log_category::archiver,
            "Archived " + destination.string() + " but failed to write " + meta_path.string());
    }

    fetch_log_context ctx;
    ctx.destination = destination.string();
    ctx.outcome = "archived";
    DF_LOG_INFO_CTX(*logger_, log_category::archiver,
        "Archived previous version to " + target.string() +
        " (v" + std::to_string(version.version) + ")", ctx);

    return std::optional<archived_version>{std::move(version)};
}

auto version_archiver::versions(const std::filesystem::path& destination) const
    -> std::vector<archived_version> {
    std::vector<archived_version> found;

    auto base = config_.history_root / relative_name(destination);
    auto directory = base.parent_path();
    auto prefix = base.filename().string() + ".";

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return found;
    }

    auto normalized = destination.lexically_normal();
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        auto name = entry.path().filename().string();
        if (name.rfind(prefix, 0) != 0 || name.size() <= std::string(META_SUFFIX).size() ||
            name.compare(name.size() - std::string(META_SUFFIX).size(), std::string::npos,
                         META_SUFFIX) != 0) {
            continue;
        }

        std::ifstream file(entry.path());
        std::ostringstream oss;
        oss << file.rdbuf();
        auto parsed = deserialize_version(oss.str());
        if (parsed && parsed->original_path.lexically_normal() == normalized) {
            found.push_back(std::move(*parsed));
        }
    }

    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        return a.version < b.version;
    });
    return found;
}

}  // namespace kcenon::delta_fetch

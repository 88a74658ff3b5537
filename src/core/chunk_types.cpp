/**
 * @file chunk_types.cpp
 * @brief Implementation of remote item and chunk plan types
 */

#include "kcenon/delta_fetch/core/chunk_types.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iterator>

namespace kcenon::delta_fetch {

namespace {

auto equals_ignore_case(const std::string& a, const std::string& b) -> bool {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

}  // namespace

// ============================================================================
// item_fingerprint
// ============================================================================

auto item_fingerprint::to_string() const -> std::string {
    auto text = std::to_string(size) + ":" + std::to_string(mtime_ms);
    if (!content_hash.empty()) {
        text += ":" + content_hash;
    }
    return text;
}

auto item_fingerprint::from_string(const std::string& text)
    -> std::optional<item_fingerprint> {
    auto first = text.find(':');
    if (first == std::string::npos || first == 0) {
        return std::nullopt;
    }
    auto second = text.find(':', first + 1);

    item_fingerprint fp;
    try {
        fp.size = std::stoull(text.substr(0, first));
        auto mtime = text.substr(first + 1,
                                 second == std::string::npos ? std::string::npos
                                                             : second - first - 1);
        if (mtime.empty()) {
            return std::nullopt;
        }
        fp.mtime_ms = std::stoll(mtime);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (second != std::string::npos) {
        fp.content_hash = text.substr(second + 1);
    }
    return fp;
}

auto item_fingerprint::matches(const item_fingerprint& other) const -> bool {
    if (size != other.size || mtime_ms != other.mtime_ms) {
        return false;
    }
    if (!content_hash.empty() && !other.content_hash.empty()) {
        return equals_ignore_case(content_hash, other.content_hash);
    }
    return true;
}

// ============================================================================
// remote_item
// ============================================================================

auto remote_item::fingerprint() const -> item_fingerprint {
    item_fingerprint fp;
    fp.size = size;
    fp.mtime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        modified.time_since_epoch()).count();
    if (sha256) {
        fp.content_hash = *sha256;
    }
    return fp;
}

// ============================================================================
// chunk_plan
// ============================================================================

chunk_plan::chunk_plan(uint64_t file_size, std::size_t chunk_size,
                       std::vector<chunk_spec> chunks)
    : file_size_(file_size)
    , chunk_size_(chunk_size)
    , chunks_(std::move(chunks)) {
}

auto chunk_plan::pending_chunks() const -> std::vector<chunk_spec> {
    std::vector<chunk_spec> pending;
    std::copy_if(chunks_.begin(), chunks_.end(), std::back_inserter(pending),
                 [](const chunk_spec& c) { return c.status == chunk_status::pending; });
    return pending;
}

auto chunk_plan::count_status(chunk_status status) const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(
        chunks_.begin(), chunks_.end(),
        [status](const chunk_spec& c) { return c.status == status; }));
}

auto chunk_plan::pending_count() const -> std::size_t {
    return count_status(chunk_status::pending);
}

auto chunk_plan::committed_count() const -> std::size_t {
    return count_status(chunk_status::committed);
}

auto chunk_plan::failed_count() const -> std::size_t {
    return count_status(chunk_status::failed);
}

auto chunk_plan::committed_bytes() const -> uint64_t {
    uint64_t total = 0;
    for (const auto& c : chunks_) {
        if (c.status == chunk_status::committed) {
            total += c.length;
        }
    }
    return total;
}

auto chunk_plan::is_complete() const -> bool {
    return committed_count() == chunks_.size();
}

auto chunk_plan::is_incomplete() const -> bool {
    return failed_count() > 0;
}

auto chunk_plan::covers_file() const -> bool {
    uint64_t expected_offset = 0;
    for (const auto& c : chunks_) {
        if (c.offset != expected_offset || c.length == 0) {
            return false;
        }
        expected_offset = c.end();
    }
    return expected_offset == file_size_;
}

auto chunk_plan::set_status(uint64_t offset, chunk_status status) -> bool {
    auto it = std::lower_bound(chunks_.begin(), chunks_.end(), offset,
                               [](const chunk_spec& c, uint64_t value) {
                                   return c.offset < value;
                               });
    if (it == chunks_.end() || it->offset != offset) {
        return false;
    }
    it->status = status;
    return true;
}

}  // namespace kcenon::delta_fetch

/**
 * @file chunk_planner.cpp
 * @brief Implementation of chunk_planner
 */

#include "kcenon/delta_fetch/core/chunk_planner.h"

#include <algorithm>
#include <vector>

namespace kcenon::delta_fetch {

chunk_planner::chunk_planner(std::size_t chunk_size)
    : chunk_size_(chunk_size == 0 ? 1 : chunk_size) {
}

auto chunk_planner::chunk_count(uint64_t file_size) const -> uint64_t {
    if (file_size == 0) return 0;
    return (file_size + chunk_size_ - 1) / chunk_size_;
}

auto chunk_planner::is_reusable(const remote_item& item, const checkpoint& prior) const -> bool {
    if (prior.chunk_size != chunk_size_ || prior.file_size != item.size) {
        return false;
    }

    auto recorded = item_fingerprint::from_string(prior.fingerprint);
    if (!recorded || !recorded->matches(item.fingerprint())) {
        return false;
    }

    return std::all_of(prior.committed_offsets.begin(), prior.committed_offsets.end(),
                       [&](uint64_t offset) {
                           return offset % chunk_size_ == 0 && offset < item.size;
                       });
}

auto chunk_planner::plan(const remote_item& item, const std::optional<checkpoint>& prior) const
    -> result<chunk_plan> {
    if (!item.is_file()) {
        return unexpected(error{error_code::invalid_remote_item,
                                "cannot plan a directory: " + item.path});
    }

    const bool reuse = prior && is_reusable(item, *prior);

    std::vector<chunk_spec> chunks;
    chunks.reserve(static_cast<std::size_t>(chunk_count(item.size)));

    for (uint64_t offset = 0; offset < item.size; offset += chunk_size_) {
        chunk_spec spec;
        spec.offset = offset;
        spec.length = std::min<uint64_t>(chunk_size_, item.size - offset);
        spec.status = chunk_status::pending;
        if (reuse && prior->committed_offsets.count(offset) != 0) {
            spec.status = chunk_status::committed;
        }
        chunks.push_back(spec);
    }

    return chunk_plan(item.size, chunk_size_, std::move(chunks));
}

}  // namespace kcenon::delta_fetch

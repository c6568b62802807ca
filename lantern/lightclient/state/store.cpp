// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "store.hpp"

#include <algorithm>
#include <utility>

#include <lantern/infra/common/ensure.hpp>

namespace lantern::cl {

HeaderArena::Index HeaderArena::insert(const LightClientHeader& header) {
    const auto root = header.beacon.hash_tree_root();
    if (const auto it = index_by_root_.find(root); it != index_by_root_.end()) {
        return it->second;
    }
    const Index index{headers_.size()};
    headers_.push_back(header);
    roots_.push_back(root);
    index_by_root_.emplace(root, index);
    return index;
}

std::optional<HeaderArena::Index> HeaderArena::find(const Hash32& beacon_root) const {
    const auto it = index_by_root_.find(beacon_root);
    if (it == index_by_root_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const LightClientHeader* HeaderArena::find_by_block_number(BlockNum block_number) const {
    // Newest first: with competing branches the latest verified header wins
    for (auto it = headers_.rbegin(); it != headers_.rend(); ++it) {
        if (it->execution.block_number == block_number) {
            return &*it;
        }
    }
    return nullptr;
}

void HeaderArena::prune(size_t max_size, std::span<Index* const> pinned) {
    if (headers_.size() <= max_size) {
        return;
    }
    const size_t first_kept{headers_.size() - max_size};
    std::vector<bool> keep(headers_.size(), false);
    for (size_t i{first_kept}; i < headers_.size(); ++i) {
        keep[i] = true;
    }
    for (const Index* index : pinned) {
        ensure_invariant(*index < headers_.size(), "pinned header index out of range");
        keep[*index] = true;
    }

    std::vector<Index> new_index(headers_.size(), 0);
    std::vector<LightClientHeader> headers;
    std::vector<Hash32> roots;
    index_by_root_.clear();
    for (Index i{0}; i < headers_.size(); ++i) {
        if (!keep[i]) continue;
        new_index[i] = headers.size();
        index_by_root_.emplace(roots_[i], headers.size());
        headers.push_back(std::move(headers_[i]));
        roots.push_back(roots_[i]);
    }
    headers_ = std::move(headers);
    roots_ = std::move(roots);
    for (Index* index : pinned) {
        *index = new_index[*index];
    }
}

bool operator==(const LightClientStore& lhs, const LightClientStore& rhs) {
    return lhs.finalized_header() == rhs.finalized_header() &&
           lhs.optimistic_header() == rhs.optimistic_header() &&
           lhs.current_sync_committee == rhs.current_sync_committee &&
           lhs.next_sync_committee == rhs.next_sync_committee &&
           lhs.previous_max_active_participants == rhs.previous_max_active_participants &&
           lhs.current_max_active_participants == rhs.current_max_active_participants;
}

}  // namespace lantern::cl

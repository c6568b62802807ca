// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <lantern/core/common/hash_maps.hpp>
#include <lantern/lightclient/types/types.hpp>

namespace lantern::cl {

//! Append-mostly storage of verified headers indexed by beacon block root
class HeaderArena {
  public:
    using Index = size_t;

    //! \brief Stores header unless a header with the same beacon root is already there
    //! \return the index of the stored header
    Index insert(const LightClientHeader& header);

    const LightClientHeader& at(Index index) const { return headers_.at(index); }

    std::optional<Index> find(const Hash32& beacon_root) const;

    //! \brief Finds a stored header by execution block number
    const LightClientHeader* find_by_block_number(BlockNum block_number) const;

    size_t size() const noexcept { return headers_.size(); }

    //! \brief Drops the oldest headers keeping at most max_size of them and every index in pinned
    //! \remarks pinned indices are rewritten to their new positions
    void prune(size_t max_size, std::span<Index* const> pinned);

  private:
    std::vector<LightClientHeader> headers_;
    std::vector<Hash32> roots_;
    FlatHashMap<Hash32, Index> index_by_root_;
};

//! State of the light client: the trusted headers and the sync committees needed to verify the next updates
struct LightClientStore {
    HeaderArena headers;
    HeaderArena::Index finalized_index{0};
    HeaderArena::Index optimistic_index{0};
    SyncCommittee current_sync_committee;
    std::optional<SyncCommittee> next_sync_committee;
    // Participation counters used by the safety threshold of optimistic updates
    uint64_t previous_max_active_participants{0};
    uint64_t current_max_active_participants{0};

    const LightClientHeader& finalized_header() const { return headers.at(finalized_index); }
    const LightClientHeader& optimistic_header() const { return headers.at(optimistic_index); }

    //! \brief Stores equal when they trust the same headers and committees, whatever their arena layout
    friend bool operator==(const LightClientStore& lhs, const LightClientStore& rhs);
};

}  // namespace lantern::cl

// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include <lantern/infra/concurrency/awaitable_condition_variable.hpp>
#include <lantern/infra/concurrency/task.hpp>
#include <lantern/lightclient/state/store.hpp>
#include <lantern/lightclient/types/types.hpp>

namespace lantern::cl {

enum class SyncState {
    kUnsynced,      // no trusted checkpoint yet
    kBootstrapped,  // trusting the checkpoint only
    kOptimistic,    // optimistic head ahead of the finalized one
    kFinalized,     // optimistic head is finalized
};

std::string_view to_string(SyncState state) noexcept;

//! Immutable view of the trusted heads at some point in time
struct HeadSnapshot {
    uint64_t version{0};
    SyncState state{SyncState::kUnsynced};
    LightClientHeader finalized;
    LightClientHeader optimistic;
    //! Every header still held by the store, oldest first
    std::vector<LightClientHeader> history;

    //! \brief The newest trusted header carrying the given execution block, if still held
    const LightClientHeader* find_by_block_number(BlockNum block_number) const;
};

//! Latest-value feed of trusted heads: the writer publishes whole snapshots, readers take shared copies
class HeadFeed {
  public:
    //! \brief Publishes the heads of store as a new snapshot
    void publish(const LightClientStore& store, SyncState state);

    //! \brief The latest snapshot, nullptr before the first publish
    std::shared_ptr<const HeadSnapshot> latest() const;

    //! \brief Waits for a snapshot with version greater than the given one
    Task<std::shared_ptr<const HeadSnapshot>> wait_newer(uint64_t version);

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<const HeadSnapshot> latest_;
    concurrency::AwaitableConditionVariable published_;
};

}  // namespace lantern::cl

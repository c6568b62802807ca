// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "head_feed.hpp"

#include <utility>

#include <magic_enum.hpp>

namespace lantern::cl {

std::string_view to_string(SyncState state) noexcept {
    return magic_enum::enum_name(state);
}

const LightClientHeader* HeadSnapshot::find_by_block_number(BlockNum block_number) const {
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        if (it->execution.block_number == block_number) {
            return &*it;
        }
    }
    return nullptr;
}

void HeadFeed::publish(const LightClientStore& store, SyncState state) {
    auto snapshot = std::make_shared<HeadSnapshot>();
    snapshot->state = state;
    snapshot->finalized = store.finalized_header();
    snapshot->optimistic = store.optimistic_header();
    snapshot->history.reserve(store.headers.size());
    for (HeaderArena::Index i{0}; i < store.headers.size(); ++i) {
        snapshot->history.push_back(store.headers.at(i));
    }

    std::scoped_lock lock{mutex_};
    snapshot->version = latest_ ? latest_->version + 1 : 1;
    latest_ = std::move(snapshot);
    published_.notify_all();
}

std::shared_ptr<const HeadSnapshot> HeadFeed::latest() const {
    std::scoped_lock lock{mutex_};
    return latest_;
}

Task<std::shared_ptr<const HeadSnapshot>> HeadFeed::wait_newer(uint64_t version) {
    while (true) {
        std::unique_lock lock{mutex_};
        if (latest_ && latest_->version > version) {
            co_return latest_;
        }
        auto waiter = published_.waiter();
        lock.unlock();
        co_await waiter();
    }
}

}  // namespace lantern::cl

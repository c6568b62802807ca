// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <lantern/core/chain/config.hpp>
#include <lantern/core/common/base.hpp>
#include <lantern/core/common/bytes.hpp>
#include <lantern/core/execution/evm.hpp>
#include <lantern/core/types/block_env.hpp>
#include <lantern/core/types/call_request.hpp>
#include <lantern/execution/block_tag.hpp>
#include <lantern/execution/proof_cache.hpp>
#include <lantern/execution/provider.hpp>
#include <lantern/execution/verified_state.hpp>
#include <lantern/infra/concurrency/async_task.hpp>
#include <lantern/infra/concurrency/task.hpp>
#include <lantern/lightclient/sync/head_feed.hpp>

namespace lantern::execution {

//! Outcome of a call: reverts, out of gas and the like are results, not errors
using ExecutionResult = CallResult;

//! Upper bound of the gas used by estimate_gas, whatever the call or block limit
inline constexpr uint64_t kGasCap{50'000'000};

struct ExecutionSettings {
    BlockTagPolicy block_tags;
    ProofCacheSettings proof_cache;
};

struct CurrentHead {
    cl::LightClientHeader finalized;
    cl::LightClientHeader optimistic;
};

struct SyncStatus {
    cl::SyncState state{cl::SyncState::kUnsynced};
    BlockNum finalized_block{0};
    BlockNum optimistic_block{0};
    //! Number of trusted headers whose state can be queried by number
    size_t available_blocks{0};
};

//! Read-only JSON-RPC style execution API whose every answer is proven against a trusted head
//! published by the consensus client. Faults are reported as ExecutionError.
class ExecutionClient {
  public:
    ExecutionClient(ChainConfig chain_config, cl::HeadFeed& heads, std::shared_ptr<ExecutionProvider> provider,
                    concurrency::WorkerPool& workers, const ExecutionSettings& settings = {});

    // Not copyable nor movable
    ExecutionClient(const ExecutionClient&) = delete;
    ExecutionClient& operator=(const ExecutionClient&) = delete;

    Task<intx::uint256> get_balance(const evmc::address& address, BlockTag tag);

    Task<uint64_t> get_transaction_count(const evmc::address& address, BlockTag tag);

    Task<evmc::bytes32> get_storage_at(const evmc::address& address, const evmc::bytes32& slot, BlockTag tag);

    Task<Bytes> get_code(const evmc::address& address, BlockTag tag);

    //! \brief Executes request on top of the trusted block without committing anything
    Task<ExecutionResult> call(CallRequest request, BlockTag tag);

    //! \brief Smallest gas limit for which request succeeds, found by bisection
    //! \throws EstimateGasError if the call fails even with the maximum gas
    Task<uint64_t> estimate_gas(CallRequest request, BlockTag tag);

    //! \throws ExecutionError kHeaderNotSynced before the first trusted head
    CurrentHead get_current_head() const;

    //! Execution block number of the latest head
    BlockNum get_block_number() const;

    ChainId get_chain_id() const { return chain_config_.chain_id; }

    SyncStatus sync_status() const;

    const ProofCache& proof_cache() const { return cache_; }

  private:
    struct Target {
        std::shared_ptr<const cl::HeadSnapshot> snapshot;
        cl::ExecutionPayloadHeader header;
    };

    //! Resolves tag on the latest snapshot, evicting cached proofs of state roots no longer held
    Target resolve(const BlockTag& tag);

    BlockEnv block_env(const Target& target) const;
    static std::map<BlockNum, evmc::bytes32> known_hashes(const Target& target);

    Task<void> prefetch(VerifiedStateView& view, const CallRequest& request, BlockNum block_number);

    ChainConfig chain_config_;
    cl::HeadFeed& heads_;
    std::shared_ptr<ExecutionProvider> provider_;
    concurrency::WorkerPool& workers_;
    BlockTagPolicy block_tags_;
    ProofCache cache_;
    std::atomic<uint64_t> pruned_version_{0};
};

}  // namespace lantern::execution

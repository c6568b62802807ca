// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "execution_client.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/this_coro.hpp>
#include <evmc/helpers.h>
#include <magic_enum.hpp>

#include <lantern/core/state/call_state.hpp>
#include <lantern/core/types/address.hpp>
#include <lantern/execution/errors.hpp>
#include <lantern/execution/verified_state.hpp>
#include <lantern/infra/common/log.hpp>
#include <lantern/rpc/common/provider_error.hpp>

namespace lantern::execution {

//! Gas of a plain value transfer, the lower bound of any estimate
static constexpr uint64_t kTxGas{21'000};

static std::string describe_failure(const ExecutionResult& result) {
    if (result.pre_check != PreCheckResult::kOk) {
        return std::string{magic_enum::enum_name(result.pre_check)};
    }
    if (result.status == EVMC_REVERT) {
        return "execution reverted";
    }
    return evmc_status_code_to_string(result.status);
}

ExecutionClient::ExecutionClient(ChainConfig chain_config, cl::HeadFeed& heads,
                                 std::shared_ptr<ExecutionProvider> provider, concurrency::WorkerPool& workers,
                                 const ExecutionSettings& settings)
    : chain_config_{std::move(chain_config)},
      heads_{heads},
      provider_{std::move(provider)},
      workers_{workers},
      block_tags_{settings.block_tags},
      cache_{settings.proof_cache} {}

ExecutionClient::Target ExecutionClient::resolve(const BlockTag& tag) {
    auto snapshot = heads_.latest();
    const cl::LightClientHeader& header = resolve_block_tag(snapshot.get(), tag, block_tags_);

    uint64_t pruned{pruned_version_.load()};
    if (snapshot->version > pruned && pruned_version_.compare_exchange_strong(pruned, snapshot->version)) {
        std::set<evmc::bytes32> state_roots;
        for (const auto& held : snapshot->history) {
            state_roots.insert(held.execution.state_root);
        }
        cache_.retain(state_roots);
    }
    return {std::move(snapshot), header.execution};
}

BlockEnv ExecutionClient::block_env(const Target& target) const {
    const cl::ExecutionPayloadHeader& header{target.header};
    BlockEnv env{
        .number = header.block_number,
        .timestamp = header.timestamp,
        .hash = header.block_hash,
        .parent_hash = header.parent_hash,
        .state_root = header.state_root,
        .coinbase = header.fee_recipient,
        .gas_limit = header.gas_limit,
        .base_fee_per_gas = header.base_fee_per_gas,
        .prev_randao = header.prev_randao,
        .excess_blob_gas = header.excess_blob_gas,
    };
    if (chain_config_.revision(env.number, env.timestamp) < EVMC_SHANGHAI) {
        throw ExecutionError{ExecutionErrorCode::kUnsupportedFork,
                             "block " + std::to_string(env.number) + " predates Shanghai on chain " +
                                 std::to_string(chain_config_.chain_id)};
    }
    return env;
}

std::map<BlockNum, evmc::bytes32> ExecutionClient::known_hashes(const Target& target) {
    std::map<BlockNum, evmc::bytes32> hashes;
    for (const auto& held : target.snapshot->history) {
        if (held.execution.block_number < target.header.block_number) {
            hashes[held.execution.block_number] = held.execution.block_hash;
        }
    }
    if (target.header.block_number > 0) {
        hashes[target.header.block_number - 1] = target.header.parent_hash;
    }
    return hashes;
}

Task<intx::uint256> ExecutionClient::get_balance(const evmc::address& address, BlockTag tag) {
    const Target target{resolve(tag)};
    VerifiedStateView view{*provider_, cache_, target.header.block_number, target.header.state_root};
    const auto account = co_await view.read_account(address);
    co_return account ? account->balance : intx::uint256{0};
}

Task<uint64_t> ExecutionClient::get_transaction_count(const evmc::address& address, BlockTag tag) {
    const Target target{resolve(tag)};
    VerifiedStateView view{*provider_, cache_, target.header.block_number, target.header.state_root};
    const auto account = co_await view.read_account(address);
    co_return account ? account->nonce : 0;
}

Task<evmc::bytes32> ExecutionClient::get_storage_at(const evmc::address& address, const evmc::bytes32& slot,
                                                    BlockTag tag) {
    const Target target{resolve(tag)};
    VerifiedStateView view{*provider_, cache_, target.header.block_number, target.header.state_root};
    co_return co_await view.read_storage(address, slot);
}

Task<Bytes> ExecutionClient::get_code(const evmc::address& address, BlockTag tag) {
    const Target target{resolve(tag)};
    VerifiedStateView view{*provider_, cache_, target.header.block_number, target.header.state_root};
    const auto account = co_await view.read_account(address);
    if (!account) {
        co_return Bytes{};
    }
    co_return co_await view.read_code(address, account->code_hash);
}

//! Adds entry to access_list, merging the storage keys of an account already listed
static void merge_into(std::vector<AccessListEntry>& access_list, const AccessListEntry& entry) {
    auto it = std::find_if(access_list.begin(), access_list.end(),
                           [&](const AccessListEntry& listed) { return listed.account == entry.account; });
    if (it == access_list.end()) {
        access_list.push_back(entry);
        return;
    }
    for (const auto& key : entry.storage_keys) {
        if (std::find(it->storage_keys.begin(), it->storage_keys.end(), key) == it->storage_keys.end()) {
            it->storage_keys.push_back(key);
        }
    }
}

Task<void> ExecutionClient::prefetch(VerifiedStateView& view, const CallRequest& request, BlockNum block_number) {
    std::vector<AccessListEntry> access_list;
    merge_into(access_list, {.account = request.from.value_or(evmc::address{})});
    if (request.to) {
        merge_into(access_list, {.account = *request.to});
    }
    for (const auto& entry : request.access_list) {
        merge_into(access_list, entry);
    }
    try {
        const auto suggested = co_await provider_->create_access_list(request, block_number);
        for (const auto& entry : suggested) {
            merge_into(access_list, entry);
        }
    } catch (const rpc::ProviderError& e) {
        LANTERN_DEBUG << "ExecutionClient: no access list for block " << block_number << ": " << e.what();
    }
    co_await view.prefetch(access_list);
}

Task<ExecutionResult> ExecutionClient::call(CallRequest request, BlockTag tag) {
    const Target target{resolve(tag)};
    const BlockEnv env{block_env(target)};
    VerifiedStateView view{*provider_, cache_, env.number, env.state_root};
    co_await prefetch(view, request, env.number);

    auto this_executor = co_await boost::asio::this_coro::executor;
    VerifiedStateReader reader{this_executor, view, known_hashes(target)};
    ExecutionResult result = co_await concurrency::async_task(workers_.get_executor(), [&]() {
        CallState state{reader};
        EVM evm{env, state, chain_config_};
        return evm.execute(request);
    });
    reader.rethrow_if_faulted();

    LANTERN_DEBUG << "ExecutionClient::call block=" << env.number << " tag=" << to_string(tag)
                  << " success=" << result.success() << " gas_used=" << result.gas_used;
    co_return result;
}

Task<uint64_t> ExecutionClient::estimate_gas(CallRequest request, BlockTag tag) {
    const Target target{resolve(tag)};
    const BlockEnv env{block_env(target)};
    VerifiedStateView view{*provider_, cache_, env.number, env.state_root};

    uint64_t hi{request.gas.value_or(0) >= kTxGas ? *request.gas : env.gas_limit};
    if (hi > kGasCap) {
        LANTERN_WARN << "ExecutionClient: caller gas above allowance, capping: requested " << hi << ", cap " << kGasCap;
        hi = kGasCap;
    }
    if (request.gas_price != 0) {
        const auto sender = co_await view.read_account(request.from.value_or(evmc::address{}));
        const intx::uint256 balance{sender ? sender->balance : 0};
        if (request.value > balance) {
            throw EstimateGasError{"insufficient funds for transfer", {}};
        }
        const intx::uint256 allowance{(balance - request.value) / request.gas_price};
        if (hi > allowance) {
            LANTERN_WARN << "ExecutionClient: gas estimation capped by limited funds: original " << hi
                         << ", allowance " << intx::to_string(allowance);
            hi = static_cast<uint64_t>(allowance);
        }
    }
    co_await prefetch(view, request, env.number);

    auto this_executor = co_await boost::asio::this_coro::executor;
    VerifiedStateReader reader{this_executor, view, known_hashes(target)};
    const auto [result, gas] = co_await concurrency::async_task(workers_.get_executor(), [&]() {
        const auto try_execution = [&](uint64_t gas_limit) {
            CallState state{reader};
            EVM evm{env, state, chain_config_};
            CallRequest attempt{request};
            attempt.gas = gas_limit;
            return evm.execute(attempt);
        };
        uint64_t upper{hi};
        ExecutionResult outcome{try_execution(upper)};
        if (!outcome.success()) {
            return std::make_pair(outcome, upper);
        }
        // Any limit below the gas consumed before refunds fails; a run using less gas than the unlimited one
        // took another branch and does not count as a success
        const uint64_t true_gas{outcome.gas_used};
        uint64_t lower{std::max(true_gas + outcome.gas_refund - 1, kTxGas - 1)};
        while (lower + 1 < upper && !reader.faulted()) {
            const uint64_t mid{(upper + lower) / 2};
            const ExecutionResult attempt{try_execution(mid)};
            if (!attempt.success() || attempt.gas_used < true_gas) {
                lower = mid;
            } else {
                upper = mid;
            }
        }
        return std::make_pair(outcome, upper);
    });
    reader.rethrow_if_faulted();

    if (!result.success()) {
        if (result.pre_check == PreCheckResult::kOk && result.status == EVMC_OUT_OF_GAS) {
            throw EstimateGasError{"gas required exceeds allowance (" + std::to_string(gas) + ")", {}};
        }
        throw EstimateGasError{describe_failure(result), result.data};
    }
    LANTERN_DEBUG << "ExecutionClient::estimate_gas block=" << env.number << " gas=" << gas;
    co_return gas;
}

CurrentHead ExecutionClient::get_current_head() const {
    const auto snapshot = heads_.latest();
    if (!snapshot) {
        throw ExecutionError{ExecutionErrorCode::kHeaderNotSynced, "no trusted head yet"};
    }
    return {.finalized = snapshot->finalized, .optimistic = snapshot->optimistic};
}

BlockNum ExecutionClient::get_block_number() const {
    const auto snapshot = heads_.latest();
    return resolve_block_tag(snapshot.get(), NamedBlock::kLatest, block_tags_).execution.block_number;
}

SyncStatus ExecutionClient::sync_status() const {
    const auto snapshot = heads_.latest();
    if (!snapshot) {
        return {};
    }
    return {
        .state = snapshot->state,
        .finalized_block = snapshot->finalized.execution.block_number,
        .optimistic_block = snapshot->optimistic.execution.block_number,
        .available_blocks = snapshot->history.size(),
    };
}

}  // namespace lantern::execution

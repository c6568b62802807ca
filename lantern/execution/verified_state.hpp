// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <evmc/evmc.hpp>

#include <lantern/core/common/base.hpp>
#include <lantern/core/common/bytes.hpp>
#include <lantern/core/state/state_reader.hpp>
#include <lantern/core/types/account.hpp>
#include <lantern/core/types/account_proof.hpp>
#include <lantern/core/types/call_request.hpp>
#include <lantern/execution/proof_cache.hpp>
#include <lantern/execution/provider.hpp>
#include <lantern/infra/concurrency/task.hpp>

namespace lantern::execution {

//! State of one trusted block served from an untrusted provider: every value is proven against the
//! trusted state root before being returned or cached.
//! \throws ExecutionError from every read when the value cannot be fetched or proven
class VerifiedStateView {
  public:
    VerifiedStateView(ExecutionProvider& provider, ProofCache& cache, BlockNum block_number,
                      const evmc::bytes32& state_root)
        : provider_{provider}, cache_{cache}, block_number_{block_number}, state_root_{state_root} {}

    BlockNum block_number() const { return block_number_; }
    const evmc::bytes32& state_root() const { return state_root_; }

    //! std::nullopt when the account is proven absent
    Task<std::optional<Account>> read_account(const evmc::address& address);

    Task<evmc::bytes32> read_storage(const evmc::address& address, const evmc::bytes32& slot);

    //! Code accepted only if it hashes to code_hash
    Task<Bytes> read_code(const evmc::address& address, const evmc::bytes32& code_hash);

    //! \brief Proves the listed accounts together with their slots, one provider request per uncached account
    Task<void> prefetch(const std::vector<AccessListEntry>& access_list);

  private:
    Task<AccountProof> fetch_proof(const evmc::address& address, std::vector<evmc::bytes32> storage_keys);
    Account verify(const AccountProof& proof) const;

    ExecutionProvider& provider_;
    ProofCache& cache_;
    BlockNum block_number_;
    evmc::bytes32 state_root_;
};

//! Blocking StateReader on top of a VerifiedStateView for the EVM, which reads state synchronously.
//! Reads must happen outside the threads running executor: each one waits for a task spawned there.
//! The first failure is recorded and later reads return empty values, so that the call completes
//! and the caller can throw the failure with rethrow_if_faulted().
class VerifiedStateReader : public StateReader {
  public:
    VerifiedStateReader(boost::asio::any_io_executor executor, VerifiedStateView& view,
                        std::map<BlockNum, evmc::bytes32> known_hashes = {})
        : executor_{std::move(executor)}, view_{view}, known_hashes_{std::move(known_hashes)} {}

    std::optional<Account> read_account(const evmc::address& address) const noexcept override;

    ByteView read_code(const evmc::address& address, const evmc::bytes32& code_hash) const noexcept override;

    evmc::bytes32 read_storage(const evmc::address& address, const evmc::bytes32& location) const noexcept override;

    std::optional<evmc::bytes32> canonical_hash(BlockNum block_num) const noexcept override;

    bool faulted() const;
    void rethrow_if_faulted() const;

  private:
    template <typename T>
    std::optional<T> wait_for(Task<T> task, std::string_view what) const noexcept;

    boost::asio::any_io_executor executor_;
    VerifiedStateView& view_;
    std::map<BlockNum, evmc::bytes32> known_hashes_;

    mutable std::mutex mutex_;
    mutable std::exception_ptr fault_;
    mutable std::map<evmc::bytes32, Bytes> code_;
};

}  // namespace lantern::execution

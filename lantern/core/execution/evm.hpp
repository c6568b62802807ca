// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <lantern/core/chain/config.hpp>
#include <lantern/core/common/base.hpp>
#include <lantern/core/common/bytes.hpp>
#include <lantern/core/state/call_state.hpp>
#include <lantern/core/types/block_env.hpp>
#include <lantern/core/types/call_request.hpp>
#include <lantern/core/types/log.hpp>

namespace lantern {

//! Checks done before any code runs; a failed one means the call never executed
enum class [[nodiscard]] PreCheckResult {
    kOk,
    kIntrinsicGasTooLow,
    kInsufficientFunds,
    kGasLimitExceeded,
    kMaxInitCodeSizeExceeded,
};

struct CallResult {
    PreCheckResult pre_check{PreCheckResult::kOk};
    evmc_status_code status{EVMC_SUCCESS};
    uint64_t gas_used{0};  // after refunds
    uint64_t gas_refund{0};
    Bytes data;
    std::vector<Log> logs;

    bool success() const noexcept { return pre_check == PreCheckResult::kOk && status == EVMC_SUCCESS; }
};

class EVM {
  public:
    // Not copyable nor movable
    EVM(const EVM&) = delete;
    EVM& operator=(const EVM&) = delete;

    EVM(const BlockEnv& block, CallState& state, const ChainConfig& config) noexcept;

    const BlockEnv& block() const noexcept { return block_; }
    const ChainConfig& config() const noexcept { return config_; }

    CallState& state() noexcept { return state_; }
    const CallState& state() const noexcept { return state_; }

    evmc_revision revision() const noexcept;

    //! Runs call as a transaction on top of the block, without committing anything.
    //! Gas defaults to the block gas limit and the sender to the zero address.
    CallResult execute(const CallRequest& call) noexcept;

  private:
    friend class EvmHost;

    evmc::Result create(const evmc_message& message) noexcept;

    evmc::Result call(const evmc_message& message) noexcept;

    evmc::Result execute_code(const evmc_message& message, ByteView code) noexcept;

    evmc::bytes32 get_block_hash(int64_t block_num) const noexcept;

    PreCheckResult pre_check(const CallRequest& call, const evmc::address& sender, uint64_t gas) const noexcept;

    void warm_up(const CallRequest& call, const evmc::address& sender) noexcept;

    const BlockEnv& block_;
    CallState& state_;
    const ChainConfig& config_;
    const CallRequest* call_{nullptr};
    evmc::address origin_;

    // evmone is not thread safe, hence one instance per thread
    LANTERN_THREAD_LOCAL static evmc::VM evm1_;
};

class EvmHost : public evmc::Host {
  public:
    explicit EvmHost(EVM& evm) noexcept : evm_{evm} {}

    bool account_exists(const evmc::address& address) const noexcept override;

    evmc_access_status access_account(const evmc::address& address) noexcept override;

    evmc_access_status access_storage(const evmc::address& address, const evmc::bytes32& key) noexcept override;

    evmc::bytes32 get_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept override;

    evmc_storage_status set_storage(const evmc::address& address, const evmc::bytes32& key,
                                    const evmc::bytes32& value) noexcept override;

    evmc::uint256be get_balance(const evmc::address& address) const noexcept override;

    size_t get_code_size(const evmc::address& address) const noexcept override;

    evmc::bytes32 get_code_hash(const evmc::address& address) const noexcept override;

    size_t copy_code(const evmc::address& address, size_t code_offset, uint8_t* buffer_data,
                     size_t buffer_size) const noexcept override;

    bool selfdestruct(const evmc::address& address, const evmc::address& beneficiary) noexcept override;

    evmc::Result call(const evmc_message& message) noexcept override;

    evmc_tx_context get_tx_context() const noexcept override;

    evmc::bytes32 get_block_hash(int64_t block_num) const noexcept override;

    void emit_log(const evmc::address& address, const uint8_t* data, size_t data_size, const evmc::bytes32 topics[],
                  size_t num_topics) noexcept override;

    evmc::bytes32 get_transient_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept override;

    void set_transient_storage(const evmc::address& address, const evmc::bytes32& key,
                               const evmc::bytes32& value) noexcept override;

  private:
    EVM& evm_;
};

}  // namespace lantern

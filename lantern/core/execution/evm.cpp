// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "evm.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <utility>

#include <ethash/keccak.hpp>
#include <evmone/evmone.h>

#include <lantern/core/common/empty_hashes.hpp>
#include <lantern/core/execution/precompile.hpp>
#include <lantern/core/protocol/blob_gas.hpp>
#include <lantern/core/protocol/intrinsic_gas.hpp>
#include <lantern/core/protocol/param.hpp>
#include <lantern/core/types/address.hpp>

namespace lantern {

LANTERN_THREAD_LOCAL evmc::VM EVM::evm1_{evmc_create_evmone()};

static bool is_zero(const evmc::bytes32& value) noexcept { return value == evmc::bytes32{}; }

EVM::EVM(const BlockEnv& block, CallState& state, const ChainConfig& config) noexcept
    : block_{block}, state_{state}, config_{config} {}

evmc_revision EVM::revision() const noexcept { return config_.revision(block_.number, block_.timestamp); }

PreCheckResult EVM::pre_check(const CallRequest& call, const evmc::address& sender, uint64_t gas) const noexcept {
    const evmc_revision rev{revision()};
    if (gas > block_.gas_limit) {
        return PreCheckResult::kGasLimitExceeded;
    }
    if (protocol::intrinsic_gas(call, rev) > gas) {
        return PreCheckResult::kIntrinsicGasTooLow;
    }
    // EIP-3860: Limit and meter initcode
    if (call.is_create() && rev >= EVMC_SHANGHAI && call.data.size() > protocol::kMaxInitCodeSize) {
        return PreCheckResult::kMaxInitCodeSizeExceeded;
    }
    const intx::uint512 max_cost{intx::umul(intx::uint256{gas}, call.gas_price) + call.value};
    if (state_.get_balance(sender) < max_cost) {
        return PreCheckResult::kInsufficientFunds;
    }
    return PreCheckResult::kOk;
}

void EVM::warm_up(const CallRequest& call, const evmc::address& sender) noexcept {
    const evmc_revision rev{revision()};
    // EIP-2929: Gas cost increases for state access opcodes
    if (rev < EVMC_BERLIN) {
        return;
    }
    state_.access_account(sender);
    if (call.to) {
        state_.access_account(*call.to);
    }
    for (uint8_t i{1}; i <= precompile::kMaxContractNumber; ++i) {
        evmc::address address{};
        address.bytes[kAddressLength - 1] = i;
        if (precompile::is_precompile(address, rev)) {
            state_.access_account(address);
        }
    }
    for (const AccessListEntry& entry : call.access_list) {
        state_.access_account(entry.account);
        for (const evmc::bytes32& key : entry.storage_keys) {
            state_.access_storage(entry.account, key);
        }
    }
    // EIP-3651: Warm COINBASE
    if (rev >= EVMC_SHANGHAI) {
        state_.access_account(block_.coinbase);
    }
}

CallResult EVM::execute(const CallRequest& call) noexcept {
    call_ = &call;
    origin_ = call.from.value_or(evmc::address{});
    const uint64_t gas{call.gas.value_or(block_.gas_limit)};

    CallResult result;
    result.pre_check = pre_check(call, origin_, gas);
    if (result.pre_check != PreCheckResult::kOk) {
        return result;
    }

    const evmc_revision rev{revision()};
    const auto intrinsic_gas{static_cast<uint64_t>(protocol::intrinsic_gas(call, rev))};
    state_.subtract_from_balance(origin_, intx::uint256{gas} * call.gas_price);
    warm_up(call, origin_);

    const bool contract_creation{call.is_create()};
    if (!contract_creation) {
        // Nonce of creations is bumped in create
        state_.set_nonce(origin_, state_.get_nonce(origin_) + 1);
    }
    const evmc::address destination{contract_creation ? evmc::address{} : *call.to};
    const evmc_message message{
        .kind = contract_creation ? EVMC_CREATE : EVMC_CALL,
        .gas = static_cast<int64_t>(gas - intrinsic_gas),
        .recipient = destination,
        .sender = origin_,
        .input_data = call.data.data(),
        .input_size = call.data.size(),
        .value = intx::be::store<evmc::uint256be>(call.value),
        .code_address = destination,
    };

    const evmc::Result res{contract_creation ? create(message) : call(message)};

    const uint64_t gas_used{gas - static_cast<uint64_t>(res.gas_left)};
    // EIP-3529: Reduction in refunds
    const uint64_t max_refund_quotient{rev >= EVMC_LONDON ? protocol::kMaxRefundQuotientLondon
                                                          : protocol::kMaxRefundQuotientFrontier};
    result.gas_refund = std::min(static_cast<uint64_t>(res.gas_refund), gas_used / max_refund_quotient);
    result.gas_used = gas_used - result.gas_refund;
    result.status = res.status_code;
    result.data.assign(res.output_data, res.output_size);
    result.logs = state_.logs();
    return result;
}

evmc::Result EVM::create(const evmc_message& message) noexcept {
    evmc::Result res{EVMC_SUCCESS, message.gas, 0};

    const auto value{intx::be::load<intx::uint256>(message.value)};
    if (state_.get_balance(message.sender) < value) {
        res.status_code = EVMC_INSUFFICIENT_BALANCE;
        return res;
    }

    const uint64_t nonce{state_.get_nonce(message.sender)};
    if (nonce + 1 < nonce) {
        // EIP-2681: Limit account nonce to 2^64-1
        res.status_code = EVMC_ARGUMENT_OUT_OF_RANGE;
        return res;
    }
    state_.set_nonce(message.sender, nonce + 1);

    evmc::address contract_address;
    if (message.kind == EVMC_CREATE2) {
        const ethash::hash256 init_code_hash{ethash::keccak256(message.input_data, message.input_size)};
        contract_address = create2_address(message.sender, message.create2_salt, init_code_hash.bytes);
    } else {
        contract_address = create_address(message.sender, nonce);
    }

    state_.access_account(contract_address);

    if (state_.get_nonce(contract_address) != 0 || state_.get_code_hash(contract_address) != kEmptyHash) {
        // https://github.com/ethereum/EIPs/issues/684
        res.status_code = EVMC_INVALID_INSTRUCTION;
        res.gas_left = 0;
        return res;
    }

    const auto snapshot{state_.take_snapshot()};

    state_.create_contract(contract_address);

    const evmc_revision rev{revision()};
    if (rev >= EVMC_SPURIOUS_DRAGON) {
        state_.set_nonce(contract_address, 1);
    }

    state_.subtract_from_balance(message.sender, value);
    state_.add_to_balance(contract_address, value);

    const evmc_message deploy_message{
        .kind = message.depth > 0 ? message.kind : EVMC_CALL,
        .depth = message.depth,
        .gas = message.gas,
        .recipient = contract_address,
        .sender = message.sender,
        .value = message.value,
        .create2_salt = message.create2_salt,
    };

    evmc::Result evm_res{execute_code(deploy_message, ByteView{message.input_data, message.input_size})};

    if (evm_res.status_code == EVMC_SUCCESS) {
        const size_t code_len{evm_res.output_size};
        const uint64_t code_deploy_gas{code_len * protocol::fee::kGCodeDeposit};

        if (rev >= EVMC_SPURIOUS_DRAGON && code_len > protocol::kMaxCodeSize) {
            // EIP-170: Contract code size limit
            evm_res.status_code = EVMC_ARGUMENT_OUT_OF_RANGE;
        } else if (rev >= EVMC_LONDON && code_len > 0 && evm_res.output_data[0] == 0xEF) {
            // EIP-3541: Reject new contract code starting with the 0xEF byte
            evm_res.status_code = EVMC_CONTRACT_VALIDATION_FAILURE;
        } else if (std::cmp_greater_equal(evm_res.gas_left, code_deploy_gas)) {
            evm_res.gas_left -= static_cast<int64_t>(code_deploy_gas);
            state_.set_code(contract_address, {evm_res.output_data, evm_res.output_size});
        } else if (rev >= EVMC_HOMESTEAD) {
            evm_res.status_code = EVMC_OUT_OF_GAS;
        }
    }

    if (evm_res.status_code == EVMC_SUCCESS) {
        evm_res.create_address = contract_address;
    } else {
        state_.revert_to_snapshot(snapshot);
        evm_res.gas_refund = 0;
        if (evm_res.status_code != EVMC_REVERT) {
            evm_res.gas_left = 0;
        }
    }
    return evm_res;
}

evmc::Result EVM::call(const evmc_message& message) noexcept {
    evmc::Result res{EVMC_SUCCESS, message.gas};

    const auto value{intx::be::load<intx::uint256>(message.value)};
    if (message.kind != EVMC_DELEGATECALL && state_.get_balance(message.sender) < value) {
        res.status_code = EVMC_INSUFFICIENT_BALANCE;
        return res;
    }

    const auto snapshot{state_.take_snapshot()};

    if (message.kind == EVMC_CALL && !(message.flags & EVMC_STATIC)) {
        state_.subtract_from_balance(message.sender, value);
        state_.add_to_balance(message.recipient, value);
    }

    const evmc_revision rev{revision()};
    if (const precompile::Contract* contract{precompile::find(message.code_address, rev)}; contract) {
        const ByteView input{message.input_data, message.input_size};
        const uint64_t gas{contract->gas(input, rev)};
        if (std::cmp_greater(gas, message.gas)) {
            res.status_code = EVMC_OUT_OF_GAS;
        } else if (const precompile::Output output{contract->run(input)}; output) {
            res = evmc::Result{EVMC_SUCCESS, message.gas - static_cast<int64_t>(gas), 0, output->data(),
                               output->size()};
        } else {
            res.status_code = EVMC_PRECOMPILE_FAILURE;
        }
    } else {
        const ByteView code{state_.get_code(message.code_address)};
        if (code.empty()) {
            return res;
        }
        res = execute_code(message, code);
    }

    if (res.status_code != EVMC_SUCCESS) {
        state_.revert_to_snapshot(snapshot);
        res.gas_refund = 0;
        if (res.status_code != EVMC_REVERT) {
            res.gas_left = 0;
        }
    }
    return res;
}

evmc::Result EVM::execute_code(const evmc_message& message, ByteView code) noexcept {
    EvmHost host{*this};
    return evm1_.execute(host, revision(), message, code.data(), code.size());
}

evmc::bytes32 EVM::get_block_hash(int64_t block_num) const noexcept {
    // The interpreter only asks for one of the 256 most recent ancestors
    const auto number{static_cast<BlockNum>(block_num)};
    if (number + 1 == block_.number) {
        return block_.parent_hash;
    }
    return state_.reader().canonical_hash(number).value_or(evmc::bytes32{});
}

bool EvmHost::account_exists(const evmc::address& address) const noexcept {
    if (evm_.revision() >= EVMC_SPURIOUS_DRAGON) {
        return !evm_.state().is_dead(address);
    }
    return evm_.state().exists(address);
}

evmc_access_status EvmHost::access_account(const evmc::address& address) noexcept {
    if (precompile::is_precompile(address, evm_.revision())) {
        return EVMC_ACCESS_WARM;
    }
    return evm_.state().access_account(address);
}

evmc_access_status EvmHost::access_storage(const evmc::address& address, const evmc::bytes32& key) noexcept {
    return evm_.state().access_storage(address, key);
}

evmc::bytes32 EvmHost::get_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept {
    return evm_.state().get_current_storage(address, key);
}

// https://eips.ethereum.org/EIPS/eip-2200
evmc_storage_status EvmHost::set_storage(const evmc::address& address, const evmc::bytes32& key,
                                         const evmc::bytes32& value) noexcept {
    const evmc::bytes32 current{evm_.state().get_current_storage(address, key)};
    if (current == value) {
        return EVMC_STORAGE_ASSIGNED;
    }
    evm_.state().set_storage(address, key, value);

    const evmc::bytes32 original{evm_.state().get_original_storage(address, key)};
    if (original == current) {
        if (is_zero(original)) {
            return EVMC_STORAGE_ADDED;
        }
        return is_zero(value) ? EVMC_STORAGE_DELETED : EVMC_STORAGE_MODIFIED;
    }
    if (is_zero(original)) {
        return original == value ? EVMC_STORAGE_ADDED_DELETED : EVMC_STORAGE_ASSIGNED;
    }
    if (is_zero(current)) {
        return original == value ? EVMC_STORAGE_DELETED_RESTORED : EVMC_STORAGE_DELETED_ADDED;
    }
    if (is_zero(value)) {
        return EVMC_STORAGE_MODIFIED_DELETED;
    }
    return original == value ? EVMC_STORAGE_MODIFIED_RESTORED : EVMC_STORAGE_ASSIGNED;
}

evmc::uint256be EvmHost::get_balance(const evmc::address& address) const noexcept {
    return intx::be::store<evmc::uint256be>(evm_.state().get_balance(address));
}

size_t EvmHost::get_code_size(const evmc::address& address) const noexcept {
    return evm_.state().get_code(address).size();
}

evmc::bytes32 EvmHost::get_code_hash(const evmc::address& address) const noexcept {
    if (evm_.state().is_dead(address)) {
        return {};
    }
    return evm_.state().get_code_hash(address);
}

size_t EvmHost::copy_code(const evmc::address& address, size_t code_offset, uint8_t* buffer_data,
                          size_t buffer_size) const noexcept {
    const ByteView code{evm_.state().get_code(address)};
    if (code_offset >= code.size()) {
        return 0;
    }
    const size_t n{std::min(buffer_size, code.size() - code_offset)};
    std::copy_n(&code[code_offset], n, buffer_data);
    return n;
}

bool EvmHost::selfdestruct(const evmc::address& address, const evmc::address& beneficiary) noexcept {
    CallState& state{evm_.state()};
    const intx::uint256 balance{state.get_balance(address)};
    state.add_to_balance(beneficiary, balance);
    // EIP-6780: SELFDESTRUCT only in same transaction
    if (evm_.revision() >= EVMC_CANCUN && !state.is_created(address)) {
        state.subtract_from_balance(address, balance);
        return false;
    }
    state.set_balance(address, 0);
    return state.record_self_destruct(address);
}

evmc::Result EvmHost::call(const evmc_message& message) noexcept {
    if (message.kind == EVMC_CREATE || message.kind == EVMC_CREATE2) {
        evmc::Result res{evm_.create(message)};
        // https://eips.ethereum.org/EIPS/eip-211
        // CREATE output is only returned on REVERT
        if (res.status_code == EVMC_REVERT) {
            return res;
        }
        return evmc::Result{res.status_code, res.gas_left, res.gas_refund, res.create_address};
    }
    return evm_.call(message);
}

evmc_tx_context EvmHost::get_tx_context() const noexcept {
    const BlockEnv& block{evm_.block_};
    evmc_tx_context context{};
    intx::be::store(context.tx_gas_price.bytes, evm_.call_->gas_price);
    context.tx_origin = evm_.origin_;
    context.block_coinbase = block.coinbase;
    context.block_number = static_cast<int64_t>(block.number);
    context.block_timestamp = static_cast<int64_t>(block.timestamp);
    context.block_gas_limit = static_cast<int64_t>(block.gas_limit);
    // EIP-4399: Supplant DIFFICULTY opcode with PREVRANDAO
    std::memcpy(context.block_prev_randao.bytes, block.prev_randao.bytes, kHashLength);
    intx::be::store(context.chain_id.bytes, intx::uint256{evm_.config().chain_id});
    intx::be::store(context.block_base_fee.bytes, block.base_fee_per_gas);
    if (block.excess_blob_gas) {
        intx::be::store(context.blob_base_fee.bytes,
                        protocol::calc_blob_gas_price(*block.excess_blob_gas, evm_.revision()));
    }
    return context;
}

evmc::bytes32 EvmHost::get_block_hash(int64_t block_num) const noexcept { return evm_.get_block_hash(block_num); }

void EvmHost::emit_log(const evmc::address& address, const uint8_t* data, size_t data_size,
                       const evmc::bytes32 topics[], size_t num_topics) noexcept {
    Log log{.address = address};
    std::copy_n(topics, num_topics, std::back_inserter(log.topics));
    log.data.assign(data, data_size);
    evm_.state().add_log(log);
}

evmc::bytes32 EvmHost::get_transient_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept {
    return evm_.state().get_transient_storage(address, key);
}

void EvmHost::set_transient_storage(const evmc::address& address, const evmc::bytes32& key,
                                    const evmc::bytes32& value) noexcept {
    evm_.state().set_transient_storage(address, key, value);
}

}  // namespace lantern

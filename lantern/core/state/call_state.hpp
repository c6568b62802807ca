// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <variant>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <lantern/core/common/bytes.hpp>
#include <lantern/core/common/hash_maps.hpp>
#include <lantern/core/state/state_reader.hpp>
#include <lantern/core/types/account.hpp>
#include <lantern/core/types/log.hpp>

namespace lantern {

//! Journaled in-memory overlay of the state seen by a single call. Nothing is ever written back:
//! the overlay is thrown away together with the call.
class CallState {
  public:
    class Snapshot {
      public:
        // Only movable
        Snapshot(Snapshot&&) = default;
        Snapshot& operator=(Snapshot&&) = default;

      private:
        friend class CallState;

        Snapshot() = default;

        size_t journal_size_{0};
        size_t log_size_{0};
    };

    // Not copyable nor movable
    CallState(const CallState&) = delete;
    CallState& operator=(const CallState&) = delete;

    explicit CallState(const StateReader& reader) noexcept : reader_{reader} {}

    const StateReader& reader() const noexcept { return reader_; }

    bool exists(const evmc::address& address) const noexcept;

    // See EIP-161: State trie clearing (invariant-preserving alternative)
    bool is_dead(const evmc::address& address) const noexcept;

    //! Turns address into a fresh contract account keeping its balance, with empty storage
    void create_contract(const evmc::address& address) noexcept;
    bool is_created(const evmc::address& address) const noexcept { return created_.contains(address); }

    //! Returns false if address already self-destructed in this call
    bool record_self_destruct(const evmc::address& address) noexcept;
    bool is_self_destructed(const evmc::address& address) const noexcept;

    intx::uint256 get_balance(const evmc::address& address) const noexcept;
    void set_balance(const evmc::address& address, const intx::uint256& value) noexcept;
    void add_to_balance(const evmc::address& address, const intx::uint256& addend) noexcept;
    void subtract_from_balance(const evmc::address& address, const intx::uint256& subtrahend) noexcept;

    uint64_t get_nonce(const evmc::address& address) const noexcept;
    void set_nonce(const evmc::address& address, uint64_t nonce) noexcept;

    ByteView get_code(const evmc::address& address) const noexcept;
    evmc::bytes32 get_code_hash(const evmc::address& address) const noexcept;
    void set_code(const evmc::address& address, ByteView code) noexcept;

    // EIP-2929: Gas cost increases for state access opcodes
    evmc_access_status access_account(const evmc::address& address) noexcept;
    evmc_access_status access_storage(const evmc::address& address, const evmc::bytes32& key) noexcept;

    evmc::bytes32 get_current_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept;

    // https://eips.ethereum.org/EIPS/eip-2200
    evmc::bytes32 get_original_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept;

    void set_storage(const evmc::address& address, const evmc::bytes32& key, const evmc::bytes32& value) noexcept;

    // EIP-1153: Transient storage opcodes
    evmc::bytes32 get_transient_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept;
    void set_transient_storage(const evmc::address& address, const evmc::bytes32& key,
                               const evmc::bytes32& value) noexcept;

    Snapshot take_snapshot() const noexcept;
    void revert_to_snapshot(const Snapshot& snapshot) noexcept;

    void add_log(const Log& log) noexcept { logs_.push_back(log); }
    const std::vector<Log>& logs() const noexcept { return logs_; }

  private:
    struct Storage {
        FlatHashMap<evmc::bytes32, evmc::bytes32> original;  // value at the beginning of the call
        FlatHashMap<evmc::bytes32, evmc::bytes32> current;
    };

    // Journal entries, each holding what is needed to undo one change
    struct AccountUpdated {
        evmc::address address;
        std::optional<Account> previous;
    };
    struct ContractCreated {
        evmc::address address;
        std::optional<Account> previous;
        Storage previous_storage;
        bool was_created{false};
    };
    struct StorageChanged {
        evmc::address address;
        evmc::bytes32 key;
        evmc::bytes32 previous;
    };
    struct TransientStorageChanged {
        evmc::address address;
        evmc::bytes32 key;
        evmc::bytes32 previous;
    };
    struct SelfDestructed {
        evmc::address address;
    };
    struct AccountAccessed {
        evmc::address address;
    };
    struct StorageAccessed {
        evmc::address address;
        evmc::bytes32 key;
    };
    using JournalEntry = std::variant<AccountUpdated, ContractCreated, StorageChanged, TransientStorageChanged,
                                      SelfDestructed, AccountAccessed, StorageAccessed>;

    void revert(JournalEntry& entry) noexcept;

    //! The current account at address, read through on first access; std::nullopt if it does not exist
    const std::optional<Account>& get_account(const evmc::address& address) const noexcept;

    //! The account at address for modification, created empty if needed; the previous value is journaled
    Account& update_account(const evmc::address& address) noexcept;

    const StateReader& reader_;

    mutable FlatHashMap<evmc::address, std::optional<Account>> accounts_;
    mutable FlatHashMap<evmc::address, Storage> storage_;

    mutable FlatHashMap<evmc::bytes32, ByteView> existing_code_;
    FlatHashMap<evmc::bytes32, Bytes> new_code_;

    std::vector<JournalEntry> journal_;

    // substate
    FlatHashSet<evmc::address> self_destructs_;
    FlatHashSet<evmc::address> created_;  // required for EIP-6780
    std::vector<Log> logs_;
    FlatHashSet<evmc::address> accessed_addresses_;
    FlatHashMap<evmc::address, FlatHashSet<evmc::bytes32>> accessed_storage_keys_;
    FlatHashMap<evmc::address, FlatHashMap<evmc::bytes32, evmc::bytes32>> transient_storage_;
};

}  // namespace lantern

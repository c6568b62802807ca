// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <tuple>
#include <utility>

#include <evmc/evmc.hpp>

#include <lantern/core/common/bytes.hpp>
#include <lantern/core/types/account.hpp>
#include <lantern/infra/concurrency/single_flight.hpp>
#include <lantern/infra/concurrency/task.hpp>

namespace lantern::execution {

struct ProofCacheSettings {
    size_t max_accounts{16'384};
    size_t max_storage_slots{65'536};
    size_t max_code_entries{1'024};
};

//! Shared cache of verified state, keyed by the trusted state root it was proven against.
//! Only verified values enter it: fetch functions verify before returning.
class ProofCache {
  public:
    using AccountKey = std::pair<evmc::bytes32, evmc::address>;
    using StorageKey = std::tuple<evmc::bytes32, evmc::address, evmc::bytes32>;

    explicit ProofCache(const ProofCacheSettings& settings = {});

    //! std::nullopt for an account proven absent
    Task<std::optional<Account>> account(const evmc::bytes32& state_root, const evmc::address& address,
                                         concurrency::SingleFlightMap<AccountKey, std::optional<Account>>::Fetch fetch);

    Task<evmc::bytes32> storage(const evmc::bytes32& state_root, const evmc::address& address,
                                const evmc::bytes32& slot,
                                concurrency::SingleFlightMap<StorageKey, evmc::bytes32>::Fetch fetch);

    //! Code is content addressed, hence shared across state roots
    Task<Bytes> code(const evmc::bytes32& code_hash, concurrency::SingleFlightMap<evmc::bytes32, Bytes>::Fetch fetch);

    //! \brief Evicts the accounts and slots proven against state roots other than the given ones
    void retain(const std::set<evmc::bytes32>& state_roots);

    struct Stats {
        size_t accounts{0};
        size_t storage_slots{0};
        size_t code_entries{0};
        uint64_t fetches{0};
    };
    Stats stats() const;

  private:
    concurrency::SingleFlightMap<AccountKey, std::optional<Account>> accounts_;
    concurrency::SingleFlightMap<StorageKey, evmc::bytes32> storage_;
    concurrency::SingleFlightMap<evmc::bytes32, Bytes> code_;
};

}  // namespace lantern::execution

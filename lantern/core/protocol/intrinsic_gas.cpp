// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "intrinsic_gas.hpp"

#include <algorithm>

#include "param.hpp"

namespace lantern::protocol {

intx::uint128 intrinsic_gas(const CallRequest& call, const evmc_revision rev) noexcept {
    intx::uint128 gas{fee::kGTransaction};

    const bool contract_creation{call.is_create()};
    if (contract_creation && rev >= EVMC_HOMESTEAD) {
        gas += fee::kGTxCreate;
    }

    // EIP-2930: Optional access lists
    gas += intx::uint128{call.access_list.size()} * fee::kAccessListAddressCost;
    intx::uint128 total_num_of_storage_keys{0};
    for (const AccessListEntry& e : call.access_list) {
        total_num_of_storage_keys += e.storage_keys.size();
    }
    gas += total_num_of_storage_keys * fee::kAccessListStorageKeyCost;

    const uint64_t data_len{call.data.size()};
    if (data_len == 0) {
        return gas;
    }

    const uint64_t non_zero_bytes{static_cast<uint64_t>(std::ranges::count_if(call.data, [](uint8_t c) { return c != 0; }))};
    const uint64_t non_zero_gas{rev >= EVMC_ISTANBUL ? fee::kGTxDataNonZeroIstanbul : fee::kGTxDataNonZeroFrontier};
    gas += intx::uint128{non_zero_bytes} * non_zero_gas;
    gas += intx::uint128{data_len - non_zero_bytes} * fee::kGTxDataZero;

    // EIP-3860: Limit and meter initcode
    if (contract_creation && rev >= EVMC_SHANGHAI) {
        gas += intx::uint128{num_words(data_len)} * fee::kInitCodeWordCost;
    }

    return gas;
}

}  // namespace lantern::protocol

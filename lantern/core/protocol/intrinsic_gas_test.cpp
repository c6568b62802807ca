// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "intrinsic_gas.hpp"

#include <catch2/catch_test_macros.hpp>

#include "param.hpp"

namespace lantern::protocol {

using namespace evmc::literals;

TEST_CASE("Intrinsic gas of a call") {
    CallRequest call{.to = 0x5df9b87991262f6ba471f09758cde1c0fc1de734_address};
    CHECK(intrinsic_gas(call, EVMC_CANCUN) == fee::kGTransaction);

    call.data = Bytes{0x00, 0x01, 0x00, 0x02};
    CHECK(intrinsic_gas(call, EVMC_CANCUN) == fee::kGTransaction + 2 * fee::kGTxDataZero + 2 * fee::kGTxDataNonZeroIstanbul);
    CHECK(intrinsic_gas(call, EVMC_BYZANTIUM) == fee::kGTransaction + 2 * fee::kGTxDataZero + 2 * fee::kGTxDataNonZeroFrontier);

    call.access_list = {
        {0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae_address, {0x01_bytes32, 0x02_bytes32}},
        {0xbb9bc244d798123fde783fcc1c72d3bb8c189413_address, {}},
    };
    CHECK(intrinsic_gas(call, EVMC_CANCUN) == fee::kGTransaction + 2 * fee::kGTxDataZero +
                                                  2 * fee::kGTxDataNonZeroIstanbul + 2 * fee::kAccessListAddressCost +
                                                  2 * fee::kAccessListStorageKeyCost);
}

TEST_CASE("Intrinsic gas of a contract creation") {
    const CallRequest create{.data = Bytes(33, 0x01)};
    const uint64_t data_gas{33 * fee::kGTxDataNonZeroIstanbul};
    CHECK(intrinsic_gas(create, EVMC_LONDON) == fee::kGTransaction + fee::kGTxCreate + data_gas);
    // Two words of initcode
    CHECK(intrinsic_gas(create, EVMC_SHANGHAI) == fee::kGTransaction + fee::kGTxCreate + data_gas + 2 * fee::kInitCodeWordCost);
}

}  // namespace lantern::protocol

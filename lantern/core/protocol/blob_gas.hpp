// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.h>
#include <intx/intx.hpp>

namespace lantern::protocol {

// EIP-4844: Shard Blob Transactions, repriced by EIP-7691 from Prague
intx::uint256 calc_blob_gas_price(uint64_t excess_blob_gas, evmc_revision rev);

}  // namespace lantern::protocol

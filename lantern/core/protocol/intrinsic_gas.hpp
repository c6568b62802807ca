// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.h>
#include <intx/intx.hpp>

#include <lantern/core/types/call_request.hpp>

namespace lantern {

// Words in EVM are 32-bytes long
constexpr uint64_t num_words(uint64_t num_bytes) noexcept {
    return num_bytes / 32 + static_cast<uint64_t>(num_bytes % 32 != 0);
}

namespace protocol {

    // Returns the intrinsic gas of a call.
    // Refer to g0 in Section 6.2 "Execution" of the Yellow Paper
    // and EIP-3860 "Limit and meter initcode".
    intx::uint128 intrinsic_gas(const CallRequest& call, evmc_revision rev) noexcept;

}  // namespace protocol

}  // namespace lantern

// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "blob_gas.hpp"

#include "param.hpp"

namespace lantern::protocol {

// Approximates factor * e ** (numerator / denominator) using Taylor expansion
static intx::uint256 fake_exponential(const intx::uint256& factor, const intx::uint256& numerator,
                                      const intx::uint256& denominator) {
    intx::uint256 output{0};
    intx::uint256 numerator_accum{factor * denominator};
    for (unsigned i{1}; numerator_accum > 0; ++i) {
        output += numerator_accum;
        numerator_accum = (numerator_accum * numerator) / (denominator * i);
    }
    return output / denominator;
}

intx::uint256 calc_blob_gas_price(uint64_t excess_blob_gas, evmc_revision rev) {
    const uint64_t update_fraction{rev >= EVMC_PRAGUE ? kBlobGasPriceUpdateFractionPrague
                                                      : kBlobGasPriceUpdateFraction};
    return fake_exponential(kMinBlobGasPrice, excess_blob_gas, update_fraction);
}

}  // namespace lantern::protocol

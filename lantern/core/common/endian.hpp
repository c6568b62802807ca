// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
Facilities to deal with byte order/endianness
Execution layer encodings (RLP) are big endian, consensus layer encodings (SSZ) are little endian
*/

#include <cstdint>
#include <cstring>

#include <intx/intx.hpp>

#include <lantern/core/common/base.hpp>
#include <lantern/core/common/bytes.hpp>
#include <lantern/core/common/decoding_result.hpp>

namespace lantern::endian {

// NOLINTBEGIN(readability-identifier-naming)
const auto load_big_u32 = intx::be::unsafe::load<uint32_t>;
const auto load_big_u64 = intx::be::unsafe::load<uint64_t>;
const auto load_little_u64 = intx::le::unsafe::load<uint64_t>;
const auto store_big_u32 = intx::be::unsafe::store<uint32_t>;
const auto store_big_u64 = intx::be::unsafe::store<uint64_t>;
const auto store_little_u64 = intx::le::unsafe::store<uint64_t>;
// NOLINTEND(readability-identifier-naming)

//! \brief Transforms a uint64_t stored in memory with native endianness to its compacted big endian byte form
//! \return A ByteView into an internal static buffer (thread specific) of the function
//! \remarks each function call overwrites the buffer, therefore invalidating a previously returned result
//! \remarks A "compact" big endian form strips leftmost bytes valued to zero
ByteView to_big_compact(uint64_t value);

//! \brief Transforms a uint256 stored in memory with native endianness to its compacted big endian byte form
//! \see to_big_compact(uint64_t)
ByteView to_big_compact(const intx::uint256& value);

//! \brief Parses unsigned integer from a compacted big endian byte form.
//! \param [in] data : byte view of a compacted value.
//! Its length must not be greater than the sizeof the UnsignedIntegral type; otherwise, kOverflow is returned.
//! \param [out] out: the corresponding integer with native endianness.
//! \return Success or kOverflow or kLeadingZero.
template <UnsignedIntegral T>
static DecodingResult from_big_compact(ByteView data, T& out) {
    if (data.size() > sizeof(T)) {
        return tl::unexpected{DecodingError::kOverflow};
    }

    out = 0;
    if (data.empty()) {
        return {};
    }

    if (data[0] == 0) {
        return tl::unexpected{DecodingError::kLeadingZero};
    }

    auto* ptr{reinterpret_cast<uint8_t*>(&out)};
    std::memcpy(ptr + (sizeof(T) - data.size()), &data[0], data.size());

    out = intx::to_big_endian(out);
    return {};
}

}  // namespace lantern::endian

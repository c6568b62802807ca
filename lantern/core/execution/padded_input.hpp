// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>

#include <intx/intx.hpp>

#include <lantern/core/common/bytes.hpp>

namespace lantern::precompile {

//! Precompile input as seen by the contracts: infinitely right-padded with zeros
class PaddedInput {
  public:
    explicit PaddedInput(ByteView data) : data_{data} {}

    //! len bytes starting at offset, zero-filled past the end of the input
    Bytes slice(uint64_t offset, uint64_t len) const {
        Bytes out(static_cast<size_t>(len), 0);
        if (offset < data_.size()) {
            const size_t available{std::min(static_cast<size_t>(len), data_.size() - static_cast<size_t>(offset))};
            std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset), available, out.begin());
        }
        return out;
    }

    //! The big-endian 256-bit word at offset
    intx::uint256 word(uint64_t offset) const {
        const Bytes bytes{slice(offset, 32)};
        return intx::be::unsafe::load<intx::uint256>(bytes.data());
    }

    size_t size() const { return data_.size(); }

  private:
    ByteView data_;
};

}  // namespace lantern::precompile

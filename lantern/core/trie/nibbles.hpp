// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <lantern/core/common/bytes.hpp>

namespace lantern::trie {

//! \brief Expands each byte of the input into two nibbles, high nibble first
Bytes unpack_nibbles(ByteView data);

//! \brief Path of a leaf or extension node, decoded from its hex-prefix (compact) encoding
struct CompactPath {
    Bytes nibbles;
    bool is_leaf{false};
};

//! \brief Decodes the hex-prefix encoding of Yellow Paper Appendix C
//! \return std::nullopt when the flag nibble is not one of 0-3 or an even path carries a non-zero padding nibble
std::optional<CompactPath> decode_compact(ByteView encoded);

//! \brief Encodes nibbles into their hex-prefix (compact) form
Bytes encode_compact(ByteView nibbles, bool is_leaf);

}  // namespace lantern::trie

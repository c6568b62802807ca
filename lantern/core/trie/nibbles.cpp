// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "nibbles.hpp"

namespace lantern::trie {

Bytes unpack_nibbles(ByteView data) {
    Bytes out(2 * data.size(), '\0');
    for (size_t i{0}; i < data.size(); ++i) {
        out[2 * i] = static_cast<uint8_t>(data[i] >> 4);
        out[2 * i + 1] = static_cast<uint8_t>(data[i] & 0xF);
    }
    return out;
}

std::optional<CompactPath> decode_compact(ByteView encoded) {
    if (encoded.empty()) {
        return std::nullopt;
    }
    const uint8_t flag{static_cast<uint8_t>(encoded[0] >> 4)};
    if (flag > 3) {
        return std::nullopt;
    }
    const bool odd{(flag & 1) != 0};
    if (!odd && (encoded[0] & 0xF) != 0) {
        return std::nullopt;
    }

    CompactPath path{.is_leaf = (flag & 2) != 0};
    path.nibbles.reserve(2 * encoded.size());
    if (odd) {
        path.nibbles.push_back(static_cast<uint8_t>(encoded[0] & 0xF));
    }
    for (size_t i{1}; i < encoded.size(); ++i) {
        path.nibbles.push_back(static_cast<uint8_t>(encoded[i] >> 4));
        path.nibbles.push_back(static_cast<uint8_t>(encoded[i] & 0xF));
    }
    return path;
}

Bytes encode_compact(ByteView nibbles, bool is_leaf) {
    const bool odd{(nibbles.size() & 1) != 0};
    Bytes out;
    out.reserve(nibbles.size() / 2 + 1);

    uint8_t first{static_cast<uint8_t>((is_leaf ? 0x20 : 0x00) | (odd ? 0x10 : 0x00))};
    if (odd) {
        first |= nibbles[0];
        nibbles.remove_prefix(1);
    }
    out.push_back(first);
    for (size_t i{0}; i < nibbles.size(); i += 2) {
        out.push_back(static_cast<uint8_t>((nibbles[i] << 4) | nibbles[i + 1]));
    }
    return out;
}

}  // namespace lantern::trie

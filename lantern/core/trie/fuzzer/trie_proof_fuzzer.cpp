// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <lantern/core/common/bytes.hpp>
#include <lantern/core/common/empty_hashes.hpp>
#include <lantern/core/common/util.hpp>
#include <lantern/core/trie/proof.hpp>

using namespace lantern;

// Input layout: 32-byte root, 32-byte key, then nodes each prefixed by a 2-byte big-endian length.
// A proof that verifies must start with a node hashing to the root.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 64) {
        return -1;
    }
    evmc::bytes32 root;
    std::memcpy(root.bytes, data, 32);
    const ByteView key{data + 32, 32};

    std::vector<Bytes> proof;
    size_t pos{64};
    while (pos + 2 <= size) {
        const size_t length{static_cast<size_t>(data[pos]) << 8 | data[pos + 1]};
        pos += 2;
        if (pos + length > size) {
            return -1;
        }
        proof.emplace_back(data + pos, length);
        pos += length;
    }

    const auto result = trie::verify(root, key, proof);
    if (result && !proof.empty() && std::memcmp(keccak256(proof.front()).bytes, root.bytes, 32) != 0) {
        std::abort();
    }

    evmc::bytes32 slot;
    std::memcpy(slot.bytes, key.data(), 32);
    const auto word = trie::verify_storage(root, slot, proof);
    if (word && proof.empty() && root != kEmptyRoot) {
        std::abort();
    }
    return 0;
}

// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "trie_builder.hpp"

#include <algorithm>
#include <span>
#include <utility>

#include <lantern/core/common/empty_hashes.hpp>
#include <lantern/core/common/util.hpp>
#include <lantern/core/rlp/encode.hpp>
#include <lantern/core/trie/nibbles.hpp>
#include <lantern/core/types/evmc_bytes32.hpp>

namespace lantern::test_util {

namespace {

    using Entry = std::pair<const Bytes, Bytes>;

    struct BuiltNode {
        Bytes rlp;
        std::vector<Bytes> proof;  // nodes below this one on the path to the target key
    };

    Bytes encode_string(ByteView payload) {
        Bytes out;
        rlp::encode(out, payload);
        return out;
    }

    Bytes reference(const Bytes& node_rlp) {
        if (node_rlp.size() < kHashLength) {
            return node_rlp;
        }
        const ethash::hash256 hash{keccak256(node_rlp)};
        return encode_string(ByteView{hash.bytes});
    }

    // Builds the node covering entries, which all share their first depth nibbles.
    // When on_path is set, target shares those nibbles too and the nodes towards it are collected.
    BuiltNode build(std::span<const Entry*> entries, size_t depth, ByteView target, bool on_path) {
        BuiltNode built;
        if (entries.size() == 1 && entries[0]->first.size() >= depth) {
            const ByteView remaining{ByteView{entries[0]->first}.substr(depth)};
            built.rlp = rlp::encode_list({encode_string(trie::encode_compact(remaining, /*is_leaf=*/true)),
                                          encode_string(entries[0]->second)});
            return built;
        }

        size_t common{entries.front()->first.size() - depth};
        for (const Entry* entry : entries) {
            common = std::min(common, prefix_length(ByteView{entries.front()->first}.substr(depth),
                                                    ByteView{entry->first}.substr(depth)));
        }
        if (common > 0) {
            const ByteView shared{ByteView{entries.front()->first}.substr(depth, common)};
            const bool child_on_path{on_path && target.substr(depth).starts_with(shared)};
            BuiltNode child{build(entries, depth + common, target, child_on_path)};
            built.rlp = rlp::encode_list({encode_string(trie::encode_compact(shared, /*is_leaf=*/false)),
                                          reference(child.rlp)});
            if (child_on_path) {
                if (child.rlp.size() >= kHashLength) {
                    built.proof.push_back(child.rlp);
                }
                built.proof.insert(built.proof.end(), child.proof.begin(), child.proof.end());
            }
            return built;
        }

        std::vector<Bytes> items(17, Bytes{rlp::kEmptyStringCode});
        size_t begin{0};
        if (entries[0]->first.size() == depth) {
            items[16] = encode_string(entries[0]->second);
            begin = 1;
        }
        while (begin < entries.size()) {
            const uint8_t nibble{entries[begin]->first[depth]};
            size_t end{begin + 1};
            while (end < entries.size() && entries[end]->first[depth] == nibble) {
                ++end;
            }
            const bool child_on_path{on_path && target.size() > depth && target[depth] == nibble};
            BuiltNode child{build(entries.subspan(begin, end - begin), depth + 1, target, child_on_path)};
            items[nibble] = reference(child.rlp);
            if (child_on_path) {
                if (child.rlp.size() >= kHashLength) {
                    built.proof.push_back(child.rlp);
                }
                built.proof.insert(built.proof.end(), child.proof.begin(), child.proof.end());
            }
            begin = end;
        }
        built.rlp = rlp::encode_list(items);
        return built;
    }

}  // namespace

void TrieBuilder::put(ByteView key, ByteView value) {
    entries_.insert_or_assign(trie::unpack_nibbles(key), Bytes{value});
}

evmc::bytes32 TrieBuilder::root() const {
    if (entries_.empty()) {
        return kEmptyRoot;
    }
    std::vector<const Entry*> sorted;
    for (const auto& entry : entries_) {
        sorted.push_back(&entry);
    }
    const BuiltNode node{build(sorted, 0, {}, false)};
    const ethash::hash256 hash{keccak256(node.rlp)};
    return to_bytes32(ByteView{hash.bytes});
}

std::vector<Bytes> TrieBuilder::proof(ByteView key) const {
    if (entries_.empty()) {
        return {};
    }
    std::vector<const Entry*> sorted;
    for (const auto& entry : entries_) {
        sorted.push_back(&entry);
    }
    const Bytes target{trie::unpack_nibbles(key)};
    BuiltNode node{build(sorted, 0, target, true)};
    std::vector<Bytes> nodes{std::move(node.rlp)};
    nodes.insert(nodes.end(), node.proof.begin(), node.proof.end());
    return nodes;
}

void StateTrieBuilder::put(const evmc::address& address, const Account& account) {
    const ethash::hash256 key{keccak256(ByteView{address.bytes})};
    trie_.put(ByteView{key.bytes}, account.rlp());
}

std::vector<Bytes> StateTrieBuilder::proof(const evmc::address& address) const {
    const ethash::hash256 key{keccak256(ByteView{address.bytes})};
    return trie_.proof(ByteView{key.bytes});
}

void StorageTrieBuilder::put(const evmc::bytes32& slot, const evmc::bytes32& value) {
    const ethash::hash256 key{keccak256(ByteView{slot.bytes})};
    Bytes encoded;
    rlp::encode(encoded, zeroless_view(ByteView{value.bytes}));
    trie_.put(ByteView{key.bytes}, encoded);
}

std::vector<Bytes> StorageTrieBuilder::proof(const evmc::bytes32& slot) const {
    const ethash::hash256 key{keccak256(ByteView{slot.bytes})};
    return trie_.proof(ByteView{key.bytes});
}

}  // namespace lantern::test_util

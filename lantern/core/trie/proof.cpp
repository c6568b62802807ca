// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof.hpp"

#include <vector>

#include <magic_enum.hpp>

#include <lantern/core/common/util.hpp>
#include <lantern/core/rlp/decode.hpp>
#include <lantern/core/trie/nibbles.hpp>
#include <lantern/core/types/evmc_bytes32.hpp>

namespace lantern::trie {

namespace {

    constexpr size_t kBranchItemCount{17};
    constexpr size_t kShortNodeItemCount{2};

    evmc::bytes32 node_hash(ByteView node) {
        const ethash::hash256 hash{keccak256(node)};
        return to_bytes32(ByteView{hash.bytes});
    }

    // Walks the nodes of one proof, consuming a proof entry for each hashed child
    class ProofWalker {
      public:
        ProofWalker(ByteView key_nibbles, std::span<const Bytes> proof) : path_{key_nibbles}, proof_{proof} {}

        ProofResult walk(const evmc::bytes32& root) {
            if (proof_.empty()) {
                if (root == kEmptyRoot) {
                    return ProofValue{};
                }
                return tl::unexpected{ProofError::kIncompleteProof};
            }
            ByteView node{proof_[0]};
            next_ = 1;
            if (node_hash(node) != root) {
                return tl::unexpected{ProofError::kRootMismatch};
            }
            // An empty trie is committed to by the empty string node
            if (node.size() == 1 && node[0] == rlp::kEmptyStringCode) {
                return finish(ProofValue{});
            }

            while (true) {
                std::vector<ByteView> items;
                if (!rlp::decode_raw_items(node, items)) {
                    return tl::unexpected{ProofError::kMalformedNode};
                }

                ByteView child;
                if (items.size() == kBranchItemCount) {
                    if (path_.empty()) {
                        return terminal_value(items[16]);
                    }
                    child = items[path_[0]];
                    path_.remove_prefix(1);
                } else if (items.size() == kShortNodeItemCount) {
                    ByteView encoded_path{items[0]};
                    const auto compact{rlp::decode_string_view(encoded_path)};
                    if (!compact) {
                        return tl::unexpected{ProofError::kMalformedNode};
                    }
                    const auto decoded{decode_compact(*compact)};
                    if (!decoded) {
                        return tl::unexpected{ProofError::kMalformedNode};
                    }
                    const ByteView node_path{decoded->nibbles};
                    if (decoded->is_leaf) {
                        if (node_path != path_) {
                            return finish(ProofValue{});
                        }
                        return terminal_value(items[1]);
                    }
                    if (node_path.empty()) {
                        return tl::unexpected{ProofError::kMalformedNode};
                    }
                    if (!path_.starts_with(node_path)) {
                        return finish(ProofValue{});
                    }
                    path_.remove_prefix(node_path.size());
                    child = items[1];
                } else {
                    return tl::unexpected{ProofError::kMalformedNode};
                }

                const auto next_node{resolve(child)};
                if (!next_node) {
                    return tl::unexpected{next_node.error()};
                }
                if (!*next_node) {
                    return finish(ProofValue{});
                }
                node = **next_node;
            }
        }

      private:
        // Resolves a child reference into the node it points to; std::nullopt for an empty slot
        tl::expected<std::optional<ByteView>, ProofError> resolve(ByteView reference) {
            if (reference.empty()) {
                return tl::unexpected{ProofError::kMalformedNode};
            }
            if (reference[0] >= rlp::kEmptyListCode) {
                // Nodes whose encoding is shorter than a hash are embedded in their parent
                if (reference.size() >= kHashLength) {
                    return tl::unexpected{ProofError::kMalformedNode};
                }
                return reference;
            }
            const auto payload{rlp::decode_string_view(reference)};
            if (!payload) {
                return tl::unexpected{ProofError::kMalformedNode};
            }
            if (payload->empty()) {
                return std::optional<ByteView>{};
            }
            if (payload->size() != kHashLength) {
                return tl::unexpected{ProofError::kMalformedNode};
            }
            if (next_ >= proof_.size()) {
                return tl::unexpected{ProofError::kIncompleteProof};
            }
            const ByteView node{proof_[next_++]};
            if (node_hash(node) != to_bytes32(*payload)) {
                return tl::unexpected{ProofError::kRootMismatch};
            }
            return node;
        }

        ProofResult terminal_value(ByteView item) {
            const auto value{rlp::decode_string_view(item)};
            if (!value) {
                return tl::unexpected{ProofError::kMalformedNode};
            }
            if (value->empty()) {
                return finish(ProofValue{});
            }
            return finish(Bytes{*value});
        }

        ProofResult finish(ProofValue value) const {
            if (next_ != proof_.size()) {
                return tl::unexpected{ProofError::kUnexpectedNode};
            }
            return value;
        }

        ByteView path_;
        std::span<const Bytes> proof_;
        size_t next_{0};
    };

}  // namespace

std::string_view to_string(ProofError error) noexcept {
    return magic_enum::enum_name(error);
}

ProofResult verify(const evmc::bytes32& root, ByteView key, std::span<const Bytes> proof) {
    const Bytes nibbles{unpack_nibbles(key)};
    ProofWalker walker{nibbles, proof};
    return walker.walk(root);
}

tl::expected<Account, ProofError> verify_account(const evmc::bytes32& state_root, const evmc::address& address,
                                                 std::span<const Bytes> proof) {
    const ethash::hash256 key{keccak256(ByteView{address.bytes})};
    const auto value{verify(state_root, ByteView{key.bytes}, proof)};
    if (!value) {
        return tl::unexpected{value.error()};
    }
    if (!*value) {
        return Account{};
    }
    const auto account{decode_account(**value)};
    if (!account) {
        return tl::unexpected{ProofError::kMalformedNode};
    }
    return *account;
}

tl::expected<evmc::bytes32, ProofError> verify_storage(const evmc::bytes32& storage_root, const evmc::bytes32& slot,
                                                       std::span<const Bytes> proof) {
    const ethash::hash256 key{keccak256(ByteView{slot.bytes})};
    const auto value{verify(storage_root, ByteView{key.bytes}, proof)};
    if (!value) {
        return tl::unexpected{value.error()};
    }
    if (!*value) {
        return evmc::bytes32{};
    }
    // Storage leaves hold the RLP encoding of the word stripped of its leading zeros
    ByteView encoded{**value};
    const auto word{rlp::decode_string_view(encoded)};
    if (!word || word->size() > kHashLength) {
        return tl::unexpected{ProofError::kMalformedNode};
    }
    return to_bytes32(*word);
}

tl::expected<Account, ProofError> verify_account_proof(const evmc::bytes32& state_root, const AccountProof& proof) {
    const auto account{verify_account(state_root, proof.address, proof.account_proof)};
    if (!account) {
        return tl::unexpected{account.error()};
    }
    if (*account != proof.account) {
        return tl::unexpected{ProofError::kValueMismatch};
    }
    for (const auto& storage : proof.storage_proof) {
        const auto word{verify_storage(account->storage_root, storage.key, storage.proof)};
        if (!word) {
            return tl::unexpected{word.error()};
        }
        if (intx::be::load<intx::uint256>(*word) != storage.value) {
            return tl::unexpected{ProofError::kValueMismatch};
        }
    }
    return *account;
}

}  // namespace lantern::trie

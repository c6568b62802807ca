// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <span>
#include <string_view>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <lantern/core/common/bytes.hpp>
#include <lantern/core/types/account.hpp>
#include <lantern/core/types/account_proof.hpp>

// Verification of Merkle-Patricia trie proofs, see Yellow Paper Appendix D
// and https://ethereum.org/en/developers/docs/data-structures-and-encoding/patricia-merkle-trie/
namespace lantern::trie {

enum class [[nodiscard]] ProofError {
    kRootMismatch,      // a node does not hash to the reference held by its parent (or to the root)
    kMalformedNode,     // a node is not a valid branch, extension or leaf
    kIncompleteProof,   // the proof ends before the key path is resolved
    kUnexpectedNode,    // the proof carries nodes after the terminal one
    kValueMismatch,     // the proven value differs from the one claimed by the provider
};

std::string_view to_string(ProofError error) noexcept;

//! The proven value for a key, or std::nullopt when the proof shows the key is absent from the trie
using ProofValue = std::optional<Bytes>;

using ProofResult = tl::expected<ProofValue, ProofError>;

//! \brief Walks the proof nodes from the root following the nibbles of key
//! \param root the trusted root hash of the trie
//! \param key the trie path (already hashed for secure tries)
//! \param proof RLP-encoded nodes from the root towards the key; nodes embedded in their parent are not listed
ProofResult verify(const evmc::bytes32& root, ByteView key, std::span<const Bytes> proof);

//! \brief Verifies the account of address against the state root; an absent account is an empty one
tl::expected<Account, ProofError> verify_account(const evmc::bytes32& state_root, const evmc::address& address,
                                                 std::span<const Bytes> proof);

//! \brief Verifies the storage word at slot against the storage root; an absent slot is the zero word
tl::expected<evmc::bytes32, ProofError> verify_storage(const evmc::bytes32& storage_root, const evmc::bytes32& slot,
                                                       std::span<const Bytes> proof);

//! \brief Verifies an EIP-1186 proof: the account against the state root, the claimed account fields
//! against the proven ones and every storage proof against the proven storage root
tl::expected<Account, ProofError> verify_account_proof(const evmc::bytes32& state_root, const AccountProof& proof);

}  // namespace lantern::trie

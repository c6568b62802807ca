// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <vector>

#include <evmc/evmc.hpp>

#include <lantern/core/common/bytes.hpp>
#include <lantern/core/types/account.hpp>

namespace lantern::test_util {

//! In-memory Merkle-Patricia trie producing roots and EIP-1186 style proofs
class TrieBuilder {
  public:
    //! Insert a raw key (no hashing) with its already encoded value
    void put(ByteView key, ByteView value);

    evmc::bytes32 root() const;

    //! The nodes from the root to key that are referenced by hash (embedded nodes are left out)
    std::vector<Bytes> proof(ByteView key) const;

  private:
    std::map<Bytes, Bytes> entries_;  // key nibbles -> value
};

//! Secure trie of accounts, keyed by keccak(address)
class StateTrieBuilder {
  public:
    void put(const evmc::address& address, const Account& account);
    evmc::bytes32 root() const { return trie_.root(); }
    std::vector<Bytes> proof(const evmc::address& address) const;

  private:
    TrieBuilder trie_;
};

//! Secure trie of storage words, keyed by keccak(slot)
class StorageTrieBuilder {
  public:
    void put(const evmc::bytes32& slot, const evmc::bytes32& value);
    evmc::bytes32 root() const { return trie_.root(); }
    std::vector<Bytes> proof(const evmc::bytes32& slot) const;

  private:
    TrieBuilder trie_;
};

}  // namespace lantern::test_util

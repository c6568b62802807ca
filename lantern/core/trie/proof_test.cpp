// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof.hpp"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <lantern/core/common/empty_hashes.hpp>
#include <lantern/core/common/util.hpp>
#include <lantern/core/rlp/encode.hpp>
#include <lantern/core/test_util/trie_builder.hpp>

namespace lantern::trie {

using namespace evmc::literals;

static ByteView string_view_to_byte_view(std::string_view s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

static test_util::TrieBuilder build_trie(const std::vector<std::pair<std::string, std::string>>& entries) {
    test_util::TrieBuilder trie;
    for (const auto& [key, value] : entries) {
        trie.put(string_view_to_byte_view(key), string_view_to_byte_view(value));
    }
    return trie;
}

static evmc::address make_address(uint8_t seed) {
    evmc::address address{};
    for (size_t i{0}; i < kAddressLength; ++i) {
        address.bytes[i] = static_cast<uint8_t>(seed * 7 + i);
    }
    return address;
}

TEST_CASE("Trie builder roots", "[core][trie]") {
    SECTION("dogs") {
        const auto trie{build_trie({{"doe", "reindeer"}, {"dog", "puppy"}, {"dogglesworth", "cat"}})};
        CHECK(trie.root() == 0x8aad789dff2f538bca5d8ea56e8abe10f4c7ba3a5dea95fea4cd6e7c3a1168d3_bytes32);
    }
    SECTION("puppy") {
        const auto trie{build_trie({{"do", "verb"}, {"horse", "stallion"}, {"doge", "coin"}, {"dog", "puppy"}})};
        CHECK(trie.root() == 0x5991bb8c6514148a29db676a14ac506cd2cd5775ace63c30a4fe457715e9ac84_bytes32);
    }
    SECTION("empty") {
        test_util::TrieBuilder trie;
        CHECK(trie.root() == kEmptyRoot);
    }
}

TEST_CASE("Verify inclusion and exclusion", "[core][trie]") {
    const std::vector<std::pair<std::string, std::string>> entries{
        {"do", "verb"}, {"horse", "stallion"}, {"doge", "coin"}, {"dog", "puppy"}};
    const auto trie{build_trie(entries)};
    const auto root{trie.root()};

    SECTION("present keys") {
        for (const auto& [key, value] : entries) {
            const auto proof{trie.proof(string_view_to_byte_view(key))};
            const auto result{verify(root, string_view_to_byte_view(key), proof)};
            REQUIRE(result);
            REQUIRE(result->has_value());
            CHECK(**result == Bytes{string_view_to_byte_view(value)});
        }
    }

    SECTION("absent keys") {
        for (const std::string key : {"d", "dot", "doges", "horses", "cat", "hors"}) {
            const auto proof{trie.proof(string_view_to_byte_view(key))};
            const auto result{verify(root, string_view_to_byte_view(key), proof)};
            REQUIRE(result);
            CHECK_FALSE(result->has_value());
        }
    }

    SECTION("proof of another key") {
        const auto proof{trie.proof(string_view_to_byte_view("horse"))};
        const auto result{verify(root, string_view_to_byte_view("doge"), proof)};
        CHECK_FALSE(result);
    }
}

TEST_CASE("Verify empty trie", "[core][trie]") {
    const Bytes key(32, 0xab);
    SECTION("empty proof") {
        const auto result{verify(kEmptyRoot, key, {})};
        REQUIRE(result);
        CHECK_FALSE(result->has_value());
    }
    SECTION("empty string node") {
        const std::vector<Bytes> proof{Bytes{rlp::kEmptyStringCode}};
        const auto result{verify(kEmptyRoot, key, proof)};
        REQUIRE(result);
        CHECK_FALSE(result->has_value());
    }
    SECTION("empty proof for a non-empty root") {
        const auto result{verify(0x01_bytes32, key, {})};
        REQUIRE_FALSE(result);
        CHECK(result.error() == ProofError::kIncompleteProof);
    }
}

TEST_CASE("Verify account", "[core][trie]") {
    test_util::StateTrieBuilder state;
    std::vector<Account> accounts;
    for (uint8_t i{0}; i < 64; ++i) {
        Account account{.nonce = i, .balance = intx::uint256{1000u * (i + 1u)}};
        if (i % 5 == 0) {
            account.storage_root = 0x7d1ae5d0f5e02ae84b8feaf8ee4be5b9e12c9be00b6ccd8ee9eec6eacb1bc5e4_bytes32;
            account.code_hash = 0xb5e1d7ca3f9c3f3bde1c7d94b40b4cd1c1e5cfe5f3a7b91ab0bd5e94a62e8d3f_bytes32;
        }
        state.put(make_address(i), account);
        accounts.push_back(account);
    }
    const auto state_root{state.root()};

    SECTION("round trip of every account") {
        for (uint8_t i{0}; i < 64; ++i) {
            const auto account{verify_account(state_root, make_address(i), state.proof(make_address(i)))};
            REQUIRE(account);
            CHECK(*account == accounts[i]);
        }
    }

    SECTION("absent account is empty") {
        const auto address{0xdeadbeef00000000000000000000000000000001_address};
        const auto account{verify_account(state_root, address, state.proof(address))};
        REQUIRE(account);
        CHECK(*account == Account{});
    }

    SECTION("substituted state root") {
        const auto account{verify_account(kEmptyRoot, make_address(3), state.proof(make_address(3)))};
        REQUIRE_FALSE(account);
        CHECK(account.error() == ProofError::kRootMismatch);
    }

    SECTION("tampering with any byte of any node") {
        const auto address{make_address(42)};
        const auto proof{state.proof(address)};
        REQUIRE(proof.size() > 1);
        for (size_t n{0}; n < proof.size(); ++n) {
            for (size_t i{0}; i < proof[n].size(); ++i) {
                auto tampered{proof};
                tampered[n][i] ^= 0x01;
                const auto account{verify_account(state_root, address, tampered)};
                REQUIRE_FALSE(account);
                CHECK((account.error() == ProofError::kRootMismatch || account.error() == ProofError::kMalformedNode));
            }
        }
    }

    SECTION("truncated proof") {
        auto proof{state.proof(make_address(7))};
        proof.pop_back();
        const auto account{verify_account(state_root, make_address(7), proof)};
        REQUIRE_FALSE(account);
        CHECK(account.error() == ProofError::kIncompleteProof);
    }

    SECTION("trailing node") {
        auto proof{state.proof(make_address(7))};
        proof.push_back(proof.front());
        const auto account{verify_account(state_root, make_address(7), proof)};
        REQUIRE_FALSE(account);
        CHECK(account.error() == ProofError::kUnexpectedNode);
    }
}

TEST_CASE("Verify malformed node", "[core][trie]") {
    const Bytes node{rlp::encode_list({Bytes{0x01}, Bytes{0x02}, Bytes{0x03}})};
    const ethash::hash256 hash{keccak256(node)};
    const auto root{to_bytes32(ByteView{hash.bytes})};
    const auto result{verify(root, Bytes(32, 0x00), std::vector<Bytes>{node})};
    REQUIRE_FALSE(result);
    CHECK(result.error() == ProofError::kMalformedNode);
    CHECK(to_string(result.error()) == "kMalformedNode");
}

TEST_CASE("Verify storage", "[core][trie]") {
    test_util::StorageTrieBuilder storage;
    for (uint8_t i{1}; i <= 20; ++i) {
        evmc::bytes32 slot{};
        slot.bytes[31] = i;
        evmc::bytes32 value{};
        value.bytes[30] = i;
        value.bytes[31] = 0xff;
        storage.put(slot, value);
    }
    const auto storage_root{storage.root()};

    SECTION("present slot is left padded") {
        evmc::bytes32 slot{};
        slot.bytes[31] = 9;
        const auto word{verify_storage(storage_root, slot, storage.proof(slot))};
        REQUIRE(word);
        CHECK(*word == 0x00000000000000000000000000000000000000000000000000000000000009ff_bytes32);
    }

    SECTION("absent slot is zero") {
        const auto slot{0x1000000000000000000000000000000000000000000000000000000000000000_bytes32};
        const auto word{verify_storage(storage_root, slot, storage.proof(slot))};
        REQUIRE(word);
        CHECK(*word == evmc::bytes32{});
    }

    SECTION("empty storage") {
        const auto word{verify_storage(kEmptyRoot, 0x01_bytes32, {})};
        REQUIRE(word);
        CHECK(*word == evmc::bytes32{});
    }
}

TEST_CASE("Verify account proof", "[core][trie]") {
    test_util::StorageTrieBuilder storage;
    const auto slot{0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
    storage.put(slot, 0x00000000000000000000000000000000000000000000000000000000000003e8_bytes32);

    const auto address{0x71562b71999873db5b286df957af199ec94617f7_address};
    const Account account{.nonce = 3, .balance = 1000, .storage_root = storage.root()};
    test_util::StateTrieBuilder state;
    state.put(address, account);
    state.put(make_address(1), Account{.nonce = 1});
    state.put(make_address(2), Account{.balance = 5});

    AccountProof proof{
        .address = address,
        .account = account,
        .account_proof = state.proof(address),
        .storage_proof = {StorageProof{.key = slot, .value = 1000, .proof = storage.proof(slot)}},
    };

    SECTION("valid") {
        const auto verified{verify_account_proof(state.root(), proof)};
        REQUIRE(verified);
        CHECK(*verified == account);
    }
    SECTION("claimed balance differs") {
        proof.account.balance = 1001;
        const auto verified{verify_account_proof(state.root(), proof)};
        REQUIRE_FALSE(verified);
        CHECK(verified.error() == ProofError::kValueMismatch);
    }
    SECTION("claimed storage value differs") {
        proof.storage_proof[0].value = 999;
        const auto verified{verify_account_proof(state.root(), proof)};
        REQUIRE_FALSE(verified);
        CHECK(verified.error() == ProofError::kValueMismatch);
    }
}

}  // namespace lantern::trie

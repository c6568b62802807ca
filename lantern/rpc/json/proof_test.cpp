// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof.hpp"

#include <catch2/catch_test_macros.hpp>

#include <lantern/core/test_util/trie_builder.hpp>
#include <lantern/core/trie/proof.hpp>
#include <lantern/rpc/json/types.hpp>

namespace lantern {

using namespace evmc::literals;

TEST_CASE("AccountProof from json", "[rpc][json]") {
    const auto json = R"({
        "address": "0x7f0d15c7faae65896648c8273b6d7e43f58fa842",
        "accountProof": ["0xf90211a0", "0xf90211a1"],
        "balance": "0x0",
        "codeHash": "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470",
        "nonce": "0x2a",
        "storageHash": "0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421",
        "storageProof": [
            {
                "key": "0x0",
                "proof": ["0xe5a0"],
                "value": "0x3e8"
            }
        ]
    })"_json;

    const auto proof = json.get<AccountProof>();
    CHECK(proof.address == 0x7f0d15c7faae65896648c8273b6d7e43f58fa842_address);
    CHECK(proof.account_proof == std::vector<Bytes>{Bytes{0xf9, 0x02, 0x11, 0xa0}, Bytes{0xf9, 0x02, 0x11, 0xa1}});
    CHECK(proof.account.balance == 0);
    CHECK(proof.account.nonce == 42);
    CHECK(proof.account.code_hash == kEmptyHash);
    CHECK(proof.account.storage_root == kEmptyRoot);
    REQUIRE(proof.storage_proof.size() == 1);
    CHECK(proof.storage_proof[0].key == evmc::bytes32{});
    CHECK(proof.storage_proof[0].value == 1000);
    CHECK(proof.storage_proof[0].proof == std::vector<Bytes>{Bytes{0xe5, 0xa0}});
}

TEST_CASE("AccountProof from json missing field", "[rpc][json]") {
    const auto json = R"({
        "address": "0x7f0d15c7faae65896648c8273b6d7e43f58fa842",
        "accountProof": [],
        "balance": "0x0",
        "nonce": "0x0",
        "storageHash": "0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421",
        "storageProof": []
    })"_json;
    CHECK_THROWS_AS(json.get<AccountProof>(), nlohmann::json::out_of_range);
}

TEST_CASE("AccountProof served as json verifies", "[rpc][json]") {
    const auto address = 0x00000000000000000000000000000000000000aa_address;
    const auto slot = 0x0000000000000000000000000000000000000000000000000000000000000001_bytes32;
    const auto word = 0x00000000000000000000000000000000000000000000000000000000000003e8_bytes32;

    test_util::StorageTrieBuilder storage;
    storage.put(slot, word);
    const Account account{.nonce = 1, .balance = 1000, .storage_root = storage.root()};
    test_util::StateTrieBuilder state;
    state.put(address, account);
    state.put(0x00000000000000000000000000000000000000bb_address, Account{.balance = 5});

    AccountProof served{
        .address = address,
        .account = account,
        .account_proof = state.proof(address),
        .storage_proof = {StorageProof{.key = slot, .value = 1000, .proof = storage.proof(slot)}},
    };
    const nlohmann::json json = served;
    CHECK(json["balance"] == "0x3e8");
    CHECK(json["storageProof"][0]["value"] == "0x3e8");

    const auto parsed = json.get<AccountProof>();
    CHECK(parsed == served);
    const auto verified = trie::verify_account_proof(state.root(), parsed);
    REQUIRE(verified);
    CHECK(verified->balance == 1000);
}

}  // namespace lantern

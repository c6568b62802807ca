// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "precompile.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

#include <lantern/core/common/util.hpp>

namespace lantern::precompile {

using namespace evmc::literals;

static Bytes hex(std::string_view s) { return *from_hex(s); }

TEST_CASE("Precompile lookup", "[core][execution]") {
    CHECK_FALSE(is_precompile(0x0000000000000000000000000000000000000000_address, EVMC_CANCUN));
    CHECK(is_precompile(0x0000000000000000000000000000000000000001_address, EVMC_FRONTIER));
    CHECK_FALSE(is_precompile(0x0000000000000000000000000000000000000005_address, EVMC_HOMESTEAD));
    CHECK(is_precompile(0x0000000000000000000000000000000000000005_address, EVMC_BYZANTIUM));
    CHECK_FALSE(is_precompile(0x000000000000000000000000000000000000000a_address, EVMC_SHANGHAI));
    CHECK(is_precompile(0x000000000000000000000000000000000000000a_address, EVMC_CANCUN));
    CHECK_FALSE(is_precompile(0x000000000000000000000000000000000000000b_address, EVMC_PRAGUE));
    CHECK_FALSE(is_precompile(0x0100000000000000000000000000000000000001_address, EVMC_CANCUN));

    const Contract* contract{find(0x0000000000000000000000000000000000000009_address, EVMC_CANCUN)};
    REQUIRE(contract);
    CHECK(contract->name == "BLAKE2F");
}

TEST_CASE("ECRECOVER", "[core][execution]") {
    Bytes in{hex(
        "18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c"
        "000000000000000000000000000000000000000000000000000000000000001c"
        "73b1693892219d736caba55bdb67216e485557ea6b6af75f37096c9aa6a5a75f"
        "eeb940b1d03b21e36b0e47e79769f095fe2ab855bd91e3a38756b7d75a9c4549")};
    Output out{ecrecover_run(in)};
    REQUIRE(out);
    CHECK(to_hex(*out) == "000000000000000000000000a94f5374fce5edbc8e2a8697c15331677e6ebf0b");

    SECTION("invalid v gives empty output") {
        in[63] = 0x1d;
        out = ecrecover_run(in);
        REQUIRE(out);
        CHECK(out->empty());
    }
    SECTION("short input is padded") {
        out = ecrecover_run(ByteView{in}.substr(0, 64));
        REQUIRE(out);
        CHECK(out->empty());
    }
    CHECK(ecrecover_gas(in, EVMC_CANCUN) == 3'000);
}

TEST_CASE("Hash precompiles", "[core][execution]") {
    const Bytes in{hex(
        "38d18acb67d25c8bb9942764b62f18e17054f66a817bd4295423adf9ed98873e"
        "000000000000000000000000000000000000000000000000000000000000001b"
        "38d18acb67d25c8bb9942764b62f18e17054f66a817bd4295423adf9ed98873e"
        "789d1dd423d25f0772d2748d60f7e4b81bb14d086eba8e8e8efb6dcff8a4ae02")};

    SECTION("SHA256") {
        const Output out{sha256_run(in)};
        REQUIRE(out);
        CHECK(to_hex(*out) == "811c7003375852fabd0d362e40e68607a12bdabae61a7d068fe5fdd1dbbf2a5d");
        CHECK(sha256_gas(in, EVMC_CANCUN) == 60 + 12 * 4);
    }
    SECTION("RIPEMD160") {
        const Output out{ripemd160_run(in)};
        REQUIRE(out);
        CHECK(to_hex(*out) == "0000000000000000000000009215b8d9882ff46f0dfde6684d78e831467f65e6");
        CHECK(ripemd160_gas(in, EVMC_CANCUN) == 600 + 120 * 4);
    }
    SECTION("ID") {
        const Output out{identity_run(in)};
        REQUIRE(out);
        CHECK(*out == in);
        CHECK(identity_gas(ByteView{in}.substr(0, 33), EVMC_CANCUN) == 15 + 3 * 2);
    }
}

TEST_CASE("MODEXP", "[core][execution]") {
    // 3^5 mod 7
    const Bytes in{hex(
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "030507")};
    const Output out{modexp_run(in)};
    REQUIRE(out);
    CHECK(to_hex(*out) == "05");
    CHECK(modexp_gas(in, EVMC_CANCUN) == 200);

    SECTION("zero modulus") {
        Bytes zero_mod{in};
        zero_mod.back() = 0;
        const Output res{modexp_run(zero_mod)};
        REQUIRE(res);
        CHECK(to_hex(*res) == "00");
    }
    SECTION("operands past the input are zero") {
        // base 3, exponent and modulus missing
        const Output res{modexp_run(ByteView{in}.substr(0, 97))};
        REQUIRE(res);
        CHECK(to_hex(*res) == "00");
    }
    SECTION("huge lengths are priced out") {
        Bytes huge{in};
        huge[0] = 0x01;
        CHECK(modexp_gas(huge, EVMC_CANCUN) == UINT64_MAX);
        CHECK_FALSE(modexp_run(huge));
    }
}

TEST_CASE("BN254", "[core][execution]") {
    SECTION("add") {
        const Bytes in{hex(
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000002")};
        const Output out{bn254_add_run(in)};
        REQUIRE(out);
        CHECK(to_hex(*out) ==
              "030644e72e131a029b85045b68181585d97816a916871ca8d3c208c16d87cfd3"
              "15ed738c0e0a7c92e7845f96b2ae9c0a68a6a449e3538fc7ff3ebf7a5a18a2c4");
        CHECK(bn254_add_gas(in, EVMC_CANCUN) == 150);
    }
    SECTION("add of a point off the curve") {
        const Bytes in{hex(
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000003")};
        CHECK_FALSE(bn254_add_run(in));
    }
    SECTION("mul") {
        const Bytes in{hex(
            "1a87b0584ce92f4593d161480614f2989035225609f08058ccfa3d0f940febe3"
            "1a2f3c951f6dadcc7ee9007dff81504b0fcd6d7cf59996efdc33d92bf7f9f8f6"
            "0000000000000000000000000000000000000000000000000000000000000009")};
        const Output out{bn254_mul_run(in)};
        REQUIRE(out);
        CHECK(to_hex(*out) ==
              "1dbad7d39dbc56379f78fac1bca147dc8e66de1b9d183c7b167351bfe0aeab74"
              "2cd757d51289cd8dbd0acf9e673ad67d0f0a89f912af47ed1be53664f5692575");
    }
    SECTION("pairing") {
        Output out{bn254_pairing_run({})};
        REQUIRE(out);
        CHECK(to_hex(*out) == "0000000000000000000000000000000000000000000000000000000000000001");

        CHECK_FALSE(bn254_pairing_run(hex("ab")));

        const Bytes in{hex(
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "198e9393920d483a7260bfb731fb5d25f1aa493335a9e71297e485b7aef312c2"
            "1800deef121f1e76426a00665e5c4479674322d4f75edadd46debd5cd992f6ed"
            "090689d0585ff075ec9e99ad690c3395bc4b313370b38ef355acdadcd122975b"
            "12c85ea5db8c6deb4aab71808dcb408fe3d1e7690c43d37b4ce6cc0166fa7daa")};
        out = bn254_pairing_run(in);
        REQUIRE(out);
        CHECK(to_hex(*out) == "0000000000000000000000000000000000000000000000000000000000000000");
        CHECK(bn254_pairing_gas(in, EVMC_CANCUN) == 34'000 + 45'000);
    }
}

TEST_CASE("BLAKE2F", "[core][execution]") {
    // BLAKE2b-512("abc") as a single final block of 12 rounds
    const std::string in_hex{std::string{"0000000c"} +
                             "48c9bdf267e6096a3ba7ca8485ae67bb2bf894fe72f36e3cf1361d5f3af54fa5"
                             "d182e6ad7f520e511f6c3e2b8c68059b6bbd41fbabd9831f79217e1319cde05b" +
                             "616263" + std::string(250, '0') + "0300000000000000" + "0000000000000000" + "01"};
    Bytes in{hex(in_hex)};
    REQUIRE(in.size() == 213);
    CHECK(blake2f_gas(in, EVMC_CANCUN) == 12);

    const Output out{blake2f_run(in)};
    REQUIRE(out);
    CHECK(to_hex(*out) ==
          "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
          "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");

    SECTION("invalid final flag") {
        in.back() = 0x02;
        CHECK_FALSE(blake2f_run(in));
    }
    SECTION("wrong length") {
        in.pop_back();
        CHECK_FALSE(blake2f_run(in));
    }
}

TEST_CASE("Point evaluation rejects malformed input", "[core][execution]") {
    CHECK_FALSE(point_evaluation_run(Bytes(191, 0)));
    CHECK(point_evaluation_gas({}, EVMC_CANCUN) == 50'000);
}

}  // namespace lantern::precompile

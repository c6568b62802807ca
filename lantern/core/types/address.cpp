// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <algorithm>
#include <cstring>

#include <ethash/keccak.hpp>

#include <lantern/core/common/base.hpp>
#include <lantern/core/common/util.hpp>
#include <lantern/core/rlp/encode.hpp>
#include <lantern/core/types/evmc_bytes32.hpp>

namespace lantern {

evmc::address create_address(const evmc::address& caller, uint64_t nonce) noexcept {
    rlp::Header h{true, 1 + kAddressLength};
    h.payload_length += rlp::length(nonce);

    Bytes rlp{};
    rlp::encode_header(rlp, h);
    rlp::encode(rlp, ByteView{caller.bytes});
    rlp::encode(rlp, nonce);

    ethash::hash256 hash{keccak256(rlp)};

    evmc::address address{};
    std::memcpy(address.bytes, hash.bytes + 12, kAddressLength);
    return address;
}

evmc::address create2_address(const evmc::address& caller, const evmc::bytes32& salt,
                              const uint8_t (&code_hash)[32]) noexcept {
    static constexpr size_t kN{1 + kAddressLength + 2 * kHashLength};
    uint8_t buf[kN];

    buf[0] = 0xff;
    std::memcpy(buf + 1, caller.bytes, kAddressLength);
    std::memcpy(buf + 1 + kAddressLength, salt.bytes, kHashLength);
    std::memcpy(buf + 1 + kAddressLength + kHashLength, code_hash, kHashLength);

    ethash::hash256 hash{ethash::keccak256(buf, kN)};

    evmc::address address{};
    std::memcpy(address.bytes, hash.bytes + 12, kAddressLength);
    return address;
}

evmc::address bytes_to_address(ByteView bytes) {
    evmc::address out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kAddressLength)};
        std::memcpy(out.bytes + kAddressLength - n, bytes.data(), n);
    }
    return out;
}

std::optional<evmc::address> hex_to_address(std::string_view hex) {
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes || bytes->size() != kAddressLength) {
        return std::nullopt;
    }
    return bytes_to_address(*bytes);
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(ByteView{address.bytes}, true);
}

}  // namespace lantern

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    return out << lantern::address_to_hex(address);
}

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& value) {
    return out << lantern::to_hex(value, true);
}

}  // namespace evmc

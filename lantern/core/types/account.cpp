// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "account.hpp"

#include <sstream>

#include <lantern/core/common/util.hpp>
#include <lantern/core/rlp/decode.hpp>
#include <lantern/core/rlp/encode.hpp>

namespace lantern {

Bytes Account::rlp() const {
    rlp::Header h{true, 0};
    h.payload_length += rlp::length(nonce);
    h.payload_length += rlp::length(balance);
    h.payload_length += kHashLength + 1;
    h.payload_length += kHashLength + 1;

    Bytes to;

    rlp::encode_header(to, h);
    rlp::encode(to, nonce);
    rlp::encode(to, balance);
    rlp::encode(to, storage_root);
    rlp::encode(to, code_hash);

    return to;
}

std::string Account::to_string() const {
    std::stringstream out;
    out << "nonce: " << nonce;
    out << " balance: 0x" << intx::hex(balance);
    out << " storage_root: " << lantern::to_hex(storage_root, true);
    out << " code_hash: " << lantern::to_hex(code_hash, true);
    return out.str();
}

tl::expected<Account, DecodingError> decode_account(ByteView encoded) noexcept {
    const auto header{rlp::decode_header(encoded)};
    if (!header) {
        return tl::unexpected{header.error()};
    }
    if (!header->list) {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }
    if (encoded.size() != header->payload_length) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }

    Account account;
    if (DecodingResult res{rlp::decode(encoded, account.nonce, rlp::Leftover::kAllow)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{rlp::decode(encoded, account.balance, rlp::Leftover::kAllow)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{rlp::decode(encoded, account.storage_root, rlp::Leftover::kAllow)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{rlp::decode(encoded, account.code_hash, rlp::Leftover::kProhibit)}; !res) {
        return tl::unexpected{res.error() == DecodingError::kInputTooLong ? DecodingError::kUnexpectedListElements : res.error()};
    }
    return account;
}

}  // namespace lantern

// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "provider.hpp"

#include <string>
#include <utility>

#include <lantern/core/types/address.hpp>

namespace lantern::execution {

FallbackExecutionProvider::FallbackExecutionProvider(std::vector<std::shared_ptr<ExecutionProvider>> providers,
                                                     concurrency::RetryPolicy policy)
    : fallback_{std::move(providers), policy} {}

Task<AccountProof> FallbackExecutionProvider::get_proof(const evmc::address& address,
                                                        std::vector<evmc::bytes32> storage_keys,
                                                        BlockNum block_number) {
    const std::string description{"get_proof " + address_to_hex(address) + " keys=" +
                                  std::to_string(storage_keys.size()) + " block=" + std::to_string(block_number)};
    co_return co_await fallback_.request<AccountProof>(
        [&](ExecutionProvider& provider) { return provider.get_proof(address, storage_keys, block_number); },
        description);
}

Task<Bytes> FallbackExecutionProvider::get_code(const evmc::address& address, BlockNum block_number) {
    co_return co_await fallback_.request<Bytes>(
        [&](ExecutionProvider& provider) { return provider.get_code(address, block_number); },
        "get_code " + address_to_hex(address) + " block=" + std::to_string(block_number));
}

Task<std::vector<AccessListEntry>> FallbackExecutionProvider::create_access_list(const CallRequest& call,
                                                                                 BlockNum block_number) {
    co_return co_await fallback_.request<std::vector<AccessListEntry>>(
        [&](ExecutionProvider& provider) { return provider.create_access_list(call, block_number); },
        "create_access_list block=" + std::to_string(block_number));
}

}  // namespace lantern::execution

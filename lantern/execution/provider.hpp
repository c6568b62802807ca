// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include <evmc/evmc.hpp>

#include <lantern/core/common/base.hpp>
#include <lantern/core/common/bytes.hpp>
#include <lantern/core/types/account_proof.hpp>
#include <lantern/core/types/call_request.hpp>
#include <lantern/infra/concurrency/retry.hpp>
#include <lantern/infra/concurrency/task.hpp>
#include <lantern/rpc/common/fallback.hpp>

namespace lantern::execution {

//! Untrusted source of execution layer state, e.g. a JSON-RPC endpoint
//! Nothing it returns is trusted before verification against a trusted state root
class ExecutionProvider {
  public:
    virtual ~ExecutionProvider() = default;

    //! eth_getProof: the account of address and the given storage slots at block_number
    virtual Task<AccountProof> get_proof(const evmc::address& address, std::vector<evmc::bytes32> storage_keys,
                                         BlockNum block_number) = 0;

    //! eth_getCode
    virtual Task<Bytes> get_code(const evmc::address& address, BlockNum block_number) = 0;

    //! eth_createAccessList: the accounts and slots the call is expected to touch, a hint only
    virtual Task<std::vector<AccessListEntry>> create_access_list(const CallRequest& call, BlockNum block_number) = 0;
};

//! ExecutionProvider trying each of several endpoints with retries
class FallbackExecutionProvider : public ExecutionProvider {
  public:
    FallbackExecutionProvider(std::vector<std::shared_ptr<ExecutionProvider>> providers,
                              concurrency::RetryPolicy policy);

    Task<AccountProof> get_proof(const evmc::address& address, std::vector<evmc::bytes32> storage_keys,
                                 BlockNum block_number) override;
    Task<Bytes> get_code(const evmc::address& address, BlockNum block_number) override;
    Task<std::vector<AccessListEntry>> create_access_list(const CallRequest& call, BlockNum block_number) override;

  private:
    rpc::ProviderFallback<ExecutionProvider> fallback_;
};

}  // namespace lantern::execution

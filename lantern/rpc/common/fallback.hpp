// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <lantern/infra/common/log.hpp>
#include <lantern/infra/concurrency/retry.hpp>
#include <lantern/infra/concurrency/task.hpp>
#include <lantern/rpc/common/provider_error.hpp>

namespace lantern::rpc {

//! Sends each request to an ordered list of equivalent untrusted providers, retrying every provider
//! with backoff before moving to the next one. The provider that last served a request is tried first.
template <typename Provider>
class ProviderFallback {
  public:
    ProviderFallback(std::vector<std::shared_ptr<Provider>> providers, concurrency::RetryPolicy policy)
        : providers_{std::move(providers)}, policy_{policy} {
        if (providers_.empty()) {
            throw std::invalid_argument{"ProviderFallback: no provider"};
        }
    }

    size_t size() const noexcept { return providers_.size(); }

    //! \throws ProviderError when every provider failed
    template <typename T>
    Task<T> request(std::function<Task<T>(Provider&)> send, std::string description) {
        const size_t first{preferred_.load()};
        for (size_t i{0}; i < providers_.size(); ++i) {
            const size_t index{(first + i) % providers_.size()};
            Provider& provider = *providers_[index];
            try {
                std::function<Task<T>()> attempt = [&]() { return send(provider); };
                if constexpr (std::is_void_v<T>) {
                    co_await concurrency::retry<T>(policy_, std::move(attempt), description);
                    preferred_ = index;
                    co_return;
                } else {
                    auto result = co_await concurrency::retry<T>(policy_, std::move(attempt), description);
                    preferred_ = index;
                    co_return result;
                }
            } catch (const boost::system::system_error& se) {
                if (se.code() == boost::asio::error::operation_aborted) {
                    throw;
                }
                LANTERN_WARN << description << " provider #" << index << " unavailable: " << se.what();
            } catch (const std::exception& e) {
                LANTERN_WARN << description << " provider #" << index << " unavailable: " << e.what();
            }
        }
        throw ProviderError{description + ": all " + std::to_string(providers_.size()) + " providers failed"};
    }

  private:
    std::vector<std::shared_ptr<Provider>> providers_;
    concurrency::RetryPolicy policy_;
    std::atomic<size_t> preferred_{0};
};

}  // namespace lantern::rpc

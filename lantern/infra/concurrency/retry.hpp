// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <lantern/infra/common/log.hpp>
#include <lantern/infra/concurrency/sleep.hpp>
#include <lantern/infra/concurrency/task.hpp>

namespace lantern::concurrency {

//! Exponential backoff between attempts of a failing request
struct RetryPolicy {
    uint32_t max_attempts{100};
    std::chrono::milliseconds initial_backoff{50};
    std::chrono::milliseconds max_backoff{5'000};
    double multiplier{2.0};

    //! \brief The pause after the given failed attempt, counting from 1
    std::chrono::milliseconds backoff(uint32_t failed_attempt) const {
        double pause = static_cast<double>(initial_backoff.count());
        for (uint32_t i{1}; i < failed_attempt && pause < static_cast<double>(max_backoff.count()); ++i) {
            pause *= multiplier;
        }
        const auto pause_ms = static_cast<std::chrono::milliseconds::rep>(pause);
        return std::min(std::chrono::milliseconds{pause_ms}, max_backoff);
    }
};

//! \brief Runs attempt until it succeeds or policy.max_attempts have failed, sleeping between attempts
//! \throws the exception of the last failed attempt
//! \remarks cancellation (operation_aborted) is never retried
template <typename T>
Task<T> retry(RetryPolicy policy, std::function<Task<T>()> attempt, std::string description) {
    for (uint32_t n{1};; ++n) {
        std::exception_ptr failure;
        std::string reason;
        try {
            co_return co_await attempt();
        } catch (const boost::system::system_error& se) {
            if (se.code() == boost::asio::error::operation_aborted) {
                throw;
            }
            failure = std::current_exception();
            reason = se.what();
        } catch (const std::exception& e) {
            failure = std::current_exception();
            reason = e.what();
        }
        if (n >= policy.max_attempts) {
            LANTERN_WARN << description << " failed after " << n << " attempts: " << reason;
            std::rethrow_exception(failure);
        }
        const auto pause = policy.backoff(n);
        LANTERN_DEBUG << description << " attempt " << n << " failed: " << reason << " (retry in " << pause.count()
                      << "ms)";
        co_await sleep(pause);
    }
}

}  // namespace lantern::concurrency

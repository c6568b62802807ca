// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "light_client.hpp"

#include <exception>
#include <future>
#include <stdexcept>
#include <utility>

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/system_error.hpp>

#include <lantern/infra/common/log.hpp>
#include <lantern/infra/concurrency/context_pool.hpp>

namespace lantern::cl {

using namespace boost::asio;

static ConsensusConfig select_config(const Settings& settings) {
    if (settings.consensus_config) {
        return *settings.consensus_config;
    }
    const ConsensusConfig* config = lookup_consensus_config(settings.network);
    if (!config) {
        throw std::invalid_argument{"unknown network: " + settings.network};
    }
    return *config;
}

static bool is_cancellation(const std::exception_ptr& ex_ptr) {
    try {
        std::rethrow_exception(ex_ptr);
    } catch (const boost::system::system_error& e) {
        return e.code() == boost::asio::error::operation_aborted ||
               e.code() == boost::system::errc::operation_canceled;
    } catch (const std::exception&) {
        return false;
    }
}

class LightClientImpl final {
  public:
    LightClientImpl(Settings&& settings, std::vector<std::shared_ptr<ConsensusProvider>> consensus_providers,
                    std::vector<std::shared_ptr<execution::ExecutionProvider>> execution_providers);

    void start();
    void stop();
    void join();

    ConsensusClient& consensus() { return consensus_; }
    execution::ExecutionClient& execution() { return execution_; }

  private:
    void spawn_tasks();

    Settings settings_;
    ConsensusConfig config_;
    ConsensusClient consensus_;
    concurrency::WorkerPool workers_;
    execution::ExecutionClient execution_;

    std::promise<void> stop_tasks_;
    boost::asio::cancellation_signal stop_signal_;
    concurrency::ContextPool context_pool_;
    io_context* tasks_ioc_{nullptr};
};

LightClientImpl::LightClientImpl(Settings&& settings,
                                 std::vector<std::shared_ptr<ConsensusProvider>> consensus_providers,
                                 std::vector<std::shared_ptr<execution::ExecutionProvider>> execution_providers)
    : settings_{std::move(settings)},
      config_{select_config(settings_)},
      consensus_{config_,
                 std::make_shared<FallbackConsensusProvider>(std::move(consensus_providers), settings_.retry_policy),
                 SyncSettings{
                     .checkpoint_root = settings_.checkpoint_root,
                     .strict_checkpoint_age = settings_.strict_checkpoint_age,
                     .max_checkpoint_age = settings_.max_checkpoint_age,
                     .header_history_size = settings_.header_history_size,
                     .max_request_updates = settings_.max_request_updates,
                 },
                 SlotClock{config_.genesis_config.genesis_time, config_.beacon_chain_config.seconds_per_slot,
                           settings_.now}},
      workers_{settings_.num_workers},
      execution_{config_.chain_config, consensus_.head_feed(),
                 std::make_shared<execution::FallbackExecutionProvider>(std::move(execution_providers),
                                                                        settings_.retry_policy),
                 workers_,
                 execution::ExecutionSettings{.block_tags = settings_.block_tags, .proof_cache = settings_.proof_cache}},
      context_pool_{settings_.num_contexts} {}

void LightClientImpl::start() {
    spawn_tasks();
    context_pool_.start();
}

void LightClientImpl::stop() {
    if (!tasks_ioc_) {
        return;
    }
    // The cancellation signal belongs to the sync task executor
    post(*tasks_ioc_, [this]() { stop_signal_.emit(cancellation_type::all); });
}

void LightClientImpl::join() {
    auto tasks = stop_tasks_.get_future();
    tasks.wait();

    context_pool_.stop();
    context_pool_.join();
    workers_.join();
    tasks.get();
}

void LightClientImpl::spawn_tasks() {
    auto tasks_completion = [this](const std::exception_ptr& ex_ptr) {
        if (ex_ptr && !is_cancellation(ex_ptr)) {
            LANTERN_ERROR << "[LightClient] Sync task failed";
            stop_tasks_.set_exception(ex_ptr);
            return;
        }
        LANTERN_INFO << "[LightClient] Sync task stopped";
        stop_tasks_.set_value();
    };
    tasks_ioc_ = &context_pool_.next_ioc();
    co_spawn(*tasks_ioc_, consensus_.run(), bind_cancellation_slot(stop_signal_.slot(), tasks_completion));
}

LightClient::LightClient(Settings settings, std::vector<std::shared_ptr<ConsensusProvider>> consensus_providers,
                         std::vector<std::shared_ptr<execution::ExecutionProvider>> execution_providers)
    : p_impl_{std::make_unique<LightClientImpl>(std::move(settings), std::move(consensus_providers),
                                                std::move(execution_providers))} {}

// Must be here (not in header) because LightClientImpl size is necessary for std::unique_ptr in PIMPL idiom
LightClient::~LightClient() = default;

void LightClient::start() { p_impl_->start(); }

void LightClient::stop() { p_impl_->stop(); }

void LightClient::join() { p_impl_->join(); }

ConsensusClient& LightClient::consensus() { return p_impl_->consensus(); }

execution::ExecutionClient& LightClient::execution() { return p_impl_->execution(); }

}  // namespace lantern::cl

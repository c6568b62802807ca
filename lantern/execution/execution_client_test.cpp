// Copyright 2025 The Lantern Authors
// SPDX-License-Identifier: Apache-2.0

#include "execution_client.hpp"

#include <chrono>
#include <functional>
#include <future>

#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <lantern/core/common/util.hpp>
#include <lantern/execution/errors.hpp>
#include <lantern/execution/test_util/mock_execution_provider.hpp>
#include <lantern/execution/test_util/proven_state.hpp>
#include <lantern/infra/concurrency/awaitable_condition_variable.hpp>
#include <lantern/infra/test_util/log.hpp>
#include <lantern/infra/test_util/task_runner.hpp>
#include <lantern/lightclient/sync/processor.hpp>
#include <lantern/lightclient/test_util/mock_beacon_chain.hpp>
#include <lantern/rpc/common/provider_error.hpp>

namespace lantern::execution {

using namespace evmc::literals;
using namespace std::chrono_literals;
using testing::_;
using testing::Invoke;
using testing::InvokeWithoutArgs;
using testing::NiceMock;

static constexpr auto kAlice{0x00000000000000000000000000000000000a11ce_address};
static constexpr auto kBob{0x0000000000000000000000000000000000000b0b_address};
static constexpr auto kContract{0x5df9b87991262f6ba471f09758cde1c0fc1de734_address};
static constexpr auto kReverter{0x00000000000000000000000000000000000000ff_address};
static constexpr auto kClearer{0x00000000000000000000000000000000000c1ea5_address};
static constexpr auto kSlot0{0x0000000000000000000000000000000000000000000000000000000000000000_bytes32};

// PUSH1 0 SLOAD PUSH1 0 MSTORE PUSH1 0x20 PUSH1 0 RETURN
static const Bytes kReturnSlot0Code{*from_hex("60005460005260206000f3")};
// PUSH1 0 PUSH1 0 SSTORE STOP
static const Bytes kClearSlot0Code{*from_hex("600060005500")};
// PUSH1 0 PUSH1 0 REVERT
static const Bytes kRevertCode{*from_hex("60006000fd")};

static ExecutionErrorCode error_code(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ExecutionError& e) {
        return e.code();
    }
    FAIL("no ExecutionError thrown");
    return ExecutionErrorCode::kProofUnavailable;
}

class ExecutionClientTest : public test_util::TaskRunner {
  protected:
    ExecutionClientTest() {
        state_.set_account(kAlice, Account{.nonce = 3, .balance = 1000});
        state_.set_code(kContract, kReturnSlot0Code);
        state_.set_storage(kContract, kSlot0, 0x03e8_bytes32);
        state_.set_code(kReverter, kRevertCode);
        state_.set_code(kClearer, kClearSlot0Code);
        state_.set_storage(kClearer, kSlot0, 0x01_bytes32);

        ON_CALL(*provider_, get_proof(_, _, _)).WillByDefault(serve_proof());
        ON_CALL(*provider_, get_code(_, _)).WillByDefault(Invoke([this](evmc::address address, BlockNum) -> Task<Bytes> {
            co_return state_.code(address);
        }));
        ON_CALL(*provider_, create_access_list(_, _))
            .WillByDefault(InvokeWithoutArgs([]() -> Task<std::vector<AccessListEntry>> { co_return std::vector<AccessListEntry>{}; }));
    }

    auto serve_proof() {
        return Invoke([this](evmc::address address, std::vector<evmc::bytes32> keys, BlockNum) -> Task<AccountProof> {
            co_return state_.get_proof(address, keys);
        });
    }

    //! Publishes a trusted head at slot committing to the current state, bootstrapped from it
    cl::LightClientStore publish_head(Slot slot) {
        const auto block = chain_.make_block(slot, {}, state_.state_root());
        auto store = cl::bootstrap(block.root(), chain_.make_bootstrap(block), chain_.config());
        REQUIRE(store);
        heads_.publish(*store, cl::SyncState::kBootstrapped);
        return *store;
    }

    test_util::SetLogVerbosityGuard log_guard_{log::Level::kNone};
    test_util::MockBeaconChain chain_;
    test_util::ProvenState state_;
    cl::HeadFeed heads_;
    std::shared_ptr<NiceMock<test_util::MockExecutionProvider>> provider_{
        std::make_shared<NiceMock<test_util::MockExecutionProvider>>()};
    concurrency::WorkerPool workers_{1};
    ExecutionClient client_{chain_.config().chain_config, heads_, provider_, workers_};
};

TEST_CASE_METHOD(ExecutionClientTest, "ExecutionClient account queries", "[execution][client]") {
    publish_head(8);

    CHECK(run(client_.get_balance(kAlice, NamedBlock::kLatest)) == 1000);
    CHECK(run(client_.get_transaction_count(kAlice, NamedBlock::kLatest)) == 3);
    CHECK(run(client_.get_storage_at(kContract, kSlot0, NamedBlock::kLatest)) == 0x03e8_bytes32);
    CHECK(run(client_.get_code(kContract, NamedBlock::kLatest)) == kReturnSlot0Code);

    CHECK(run(client_.get_balance(kBob, NamedBlock::kLatest)) == 0);
    CHECK(run(client_.get_transaction_count(kBob, NamedBlock::kLatest)) == 0);
    CHECK(run(client_.get_code(kBob, NamedBlock::kLatest)).empty());
}

TEST_CASE_METHOD(ExecutionClientTest, "ExecutionClient rejects tampered state", "[execution][client]") {
    publish_head(8);

    SECTION("inflated balance") {
        EXPECT_CALL(*provider_, get_proof(kAlice, _, _))
            .WillOnce(Invoke([this](evmc::address address, std::vector<evmc::bytes32> keys, BlockNum) -> Task<AccountProof> {
                auto proof = state_.get_proof(address, keys);
                proof.account.balance = 1'000'000;
                co_return proof;
            }));
        CHECK(error_code([&] { run(client_.get_balance(kAlice, NamedBlock::kLatest)); }) ==
              ExecutionErrorCode::kInvalidProof);
    }

    SECTION("flipped byte in a proof node") {
        EXPECT_CALL(*provider_, get_proof(kAlice, _, _))
            .WillOnce(Invoke([this](evmc::address address, std::vector<evmc::bytes32> keys, BlockNum) -> Task<AccountProof> {
                auto proof = state_.get_proof(address, keys);
                auto& leaf = proof.account_proof.back();
                leaf[leaf.size() / 2] ^= 0x01;
                co_return proof;
            }));
        CHECK(error_code([&] { run(client_.get_balance(kAlice, NamedBlock::kLatest)); }) ==
              ExecutionErrorCode::kInvalidProof);
    }

    SECTION("proof against another state") {
        test_util::ProvenState forged{state_};
        forged.set_account(kAlice, Account{.nonce = 3, .balance = 1'000'000});
        EXPECT_CALL(*provider_, get_proof(kAlice, _, _))
            .WillOnce(Invoke([&](evmc::address address, std::vector<evmc::bytes32> keys, BlockNum) -> Task<AccountProof> {
                co_return forged.get_proof(address, keys);
            }));
        CHECK(error_code([&] { run(client_.get_balance(kAlice, NamedBlock::kLatest)); }) ==
              ExecutionErrorCode::kInvalidProof);
    }

    SECTION("unreachable providers") {
        EXPECT_CALL(*provider_, get_proof(kAlice, _, _)).WillOnce(InvokeWithoutArgs([]() -> Task<AccountProof> {
            throw rpc::ProviderError{"get_proof: all 2 providers failed"};
            co_return AccountProof{};
        }));
        CHECK(error_code([&] { run(client_.get_balance(kAlice, NamedBlock::kLatest)); }) ==
              ExecutionErrorCode::kProviderExhausted);
    }
}

TEST_CASE_METHOD(ExecutionClientTest, "ExecutionClient heads", "[execution][client]") {
    SECTION("before the first trusted head") {
        CHECK(error_code([&] { run(client_.get_balance(kAlice, NamedBlock::kLatest)); }) ==
              ExecutionErrorCode::kHeaderNotSynced);
        CHECK(error_code([&] { client_.get_current_head(); }) == ExecutionErrorCode::kHeaderNotSynced);
        CHECK(client_.sync_status().state == cl::SyncState::kUnsynced);
    }

    SECTION("finalized and optimistic heads") {
        auto store = publish_head(8);
        const auto block16 = chain_.make_block(16, {}, state_.state_root());
        REQUIRE(cl::apply_update(store, chain_.make_update(block16, 17, chain_.committee_size()), chain_.config(), 17));
        heads_.publish(store, cl::SyncState::kOptimistic);

        const CurrentHead head{client_.get_current_head()};
        CHECK(head.finalized.beacon.slot == 8);
        CHECK(head.optimistic.beacon.slot == 16);
        CHECK(client_.get_block_number() == 16);
        CHECK(client_.get_chain_id() == kSepoliaConfig.chain_id);

        const SyncStatus status{client_.sync_status()};
        CHECK(status.state == cl::SyncState::kOptimistic);
        CHECK(status.finalized_block == 8);
        CHECK(status.optimistic_block == 16);
        CHECK(status.available_blocks == 2);

        EXPECT_CALL(*provider_, get_proof(kAlice, _, 16)).WillOnce(serve_proof());
        EXPECT_CALL(*provider_, get_proof(kAlice, _, 8)).Times(0);
        CHECK(run(client_.get_balance(kAlice, NamedBlock::kLatest)) == 1000);
        // Both blocks commit to the same state root, hence to the same cached proof
        CHECK(run(client_.get_balance(kAlice, NamedBlock::kFinalized)) == 1000);
        CHECK(run(client_.get_balance(kAlice, BlockNum{8})) == 1000);
        CHECK(error_code([&] { run(client_.get_balance(kAlice, BlockNum{12})); }) ==
              ExecutionErrorCode::kBlockNotAvailable);
    }
}

TEST_CASE_METHOD(ExecutionClientTest, "ExecutionClient::call", "[execution][client]") {
    publish_head(8);

    SECTION("returns a storage word") {
        const auto result = run(client_.call({.from = kAlice, .to = kContract}, NamedBlock::kLatest));
        REQUIRE(result.success());
        CHECK(to_hex(result.data) == "00000000000000000000000000000000000000000000000000000000000003e8");
    }

    SECTION("prefetches the suggested access list") {
        EXPECT_CALL(*provider_, create_access_list(_, 8))
            .WillOnce(InvokeWithoutArgs([]() -> Task<std::vector<AccessListEntry>> {
                co_return std::vector<AccessListEntry>{{.account = kContract, .storage_keys = {kSlot0}}};
            }));
        EXPECT_CALL(*provider_, get_proof(kContract, std::vector<evmc::bytes32>{kSlot0}, 8)).WillOnce(serve_proof());
        EXPECT_CALL(*provider_, get_proof(kContract, std::vector<evmc::bytes32>{}, _)).Times(0);
        const auto result = run(client_.call({.to = kContract}, NamedBlock::kLatest));
        CHECK(result.success());
    }

    SECTION("access list failure is not fatal") {
        EXPECT_CALL(*provider_, create_access_list(_, _))
            .WillOnce(InvokeWithoutArgs([]() -> Task<std::vector<AccessListEntry>> {
                throw rpc::ProviderError{"create_access_list: all 1 providers failed"};
                co_return std::vector<AccessListEntry>{};
            }));
        CHECK(run(client_.call({.to = kContract}, NamedBlock::kLatest)).success());
    }

    SECTION("revert is a result") {
        const auto result = run(client_.call({.from = kAlice, .to = kReverter}, NamedBlock::kLatest));
        CHECK_FALSE(result.success());
        CHECK(result.pre_check == PreCheckResult::kOk);
        CHECK(result.status == EVMC_REVERT);
    }

    SECTION("insufficient funds is a result") {
        const auto result = run(client_.call({.from = kBob, .to = kAlice, .value = 1}, NamedBlock::kLatest));
        CHECK(result.pre_check == PreCheckResult::kInsufficientFunds);
    }

    SECTION("substituted code faults") {
        EXPECT_CALL(*provider_, get_code(kContract, _)).WillOnce(InvokeWithoutArgs([]() -> Task<Bytes> {
            co_return kRevertCode;
        }));
        CHECK(error_code([&] { run(client_.call({.to = kContract}, NamedBlock::kLatest)); }) ==
              ExecutionErrorCode::kInvalidCode);
    }

    SECTION("invalid proof during execution faults") {
        EXPECT_CALL(*provider_, get_proof(kContract, std::vector<evmc::bytes32>{kSlot0}, _))
            .WillOnce(Invoke([this](evmc::address address, std::vector<evmc::bytes32> keys, BlockNum) -> Task<AccountProof> {
                auto proof = state_.get_proof(address, keys);
                proof.storage_proof[0].value = 7;
                co_return proof;
            }));
        CHECK(error_code([&] { run(client_.call({.to = kContract}, NamedBlock::kLatest)); }) ==
              ExecutionErrorCode::kInvalidProof);
    }

    SECTION("block before Shanghai") {
        ChainConfig config{chain_.config().chain_config};
        config.shanghai_time = std::nullopt;
        config.cancun_time = std::nullopt;
        config.prague_time = std::nullopt;
        ExecutionClient client{config, heads_, provider_, workers_};
        CHECK(error_code([&] { run(client.call({.to = kContract}, NamedBlock::kLatest)); }) ==
              ExecutionErrorCode::kUnsupportedFork);
    }
}

TEST_CASE_METHOD(ExecutionClientTest, "ExecutionClient::estimate_gas", "[execution][client]") {
    publish_head(8);

    SECTION("value transfer") {
        CHECK(run(client_.estimate_gas({.from = kAlice, .to = kBob, .value = 1}, NamedBlock::kLatest)) == 21'000);
    }

    SECTION("contract call") {
        const CallRequest request{.from = kAlice, .to = kContract};
        const uint64_t gas{run(client_.estimate_gas(request, NamedBlock::kLatest))};
        CHECK(gas > 21'000);

        CallRequest limited{request};
        limited.gas = gas;
        CHECK(run(client_.call(limited, NamedBlock::kLatest)).success());
        limited.gas = gas - 1;
        CHECK_FALSE(run(client_.call(limited, NamedBlock::kLatest)).success());
    }

    SECTION("call earning a storage refund") {
        const CallRequest request{.from = kAlice, .to = kClearer};
        const auto unlimited = run(client_.call(request, NamedBlock::kLatest));
        REQUIRE(unlimited.success());
        REQUIRE(unlimited.gas_refund > 0);

        const uint64_t gas{run(client_.estimate_gas(request, NamedBlock::kLatest))};
        CHECK(gas >= unlimited.gas_used + unlimited.gas_refund);

        CallRequest limited{request};
        limited.gas = gas;
        CHECK(run(client_.call(limited, NamedBlock::kLatest)).success());
        limited.gas = gas - 1;
        CHECK_FALSE(run(client_.call(limited, NamedBlock::kLatest)).success());
    }

    SECTION("reverting call") {
        CHECK_THROWS_AS(run(client_.estimate_gas({.from = kAlice, .to = kReverter}, NamedBlock::kLatest)),
                        EstimateGasError);
    }

    SECTION("value above balance") {
        CHECK_THROWS_AS(run(client_.estimate_gas({.from = kAlice, .to = kBob, .gas_price = 1, .value = 1001},
                                                 NamedBlock::kLatest)),
                        EstimateGasError);
    }
}

TEST_CASE_METHOD(ExecutionClientTest, "ExecutionClient concurrent requests share proofs", "[execution][client]") {
    publish_head(8);
    concurrency::AwaitableConditionVariable gate;
    auto waiter = gate.waiter();
    EXPECT_CALL(*provider_, get_proof(kAlice, _, _))
        .WillOnce(Invoke([&, this](evmc::address address, std::vector<evmc::bytes32> keys, BlockNum) -> Task<AccountProof> {
            co_await waiter();
            co_return state_.get_proof(address, keys);
        }));

    auto balance = spawn_future(client_.get_balance(kAlice, NamedBlock::kLatest));
    auto nonce = spawn_future(client_.get_transaction_count(kAlice, NamedBlock::kLatest));
    poll_until_idle();
    CHECK(balance.wait_for(0s) == std::future_status::timeout);

    gate.notify_all();
    poll_context_until_future_is_ready(balance);
    poll_context_until_future_is_ready(nonce);
    CHECK(balance.get() == 1000);
    CHECK(nonce.get() == 3);
}

TEST_CASE_METHOD(ExecutionClientTest, "ExecutionClient evicts proofs of superseded heads", "[execution][client]") {
    publish_head(8);
    EXPECT_CALL(*provider_, get_proof(kAlice, _, _)).Times(2).WillRepeatedly(serve_proof());
    CHECK(run(client_.get_balance(kAlice, NamedBlock::kLatest)) == 1000);
    CHECK(run(client_.get_balance(kAlice, NamedBlock::kLatest)) == 1000);
    CHECK(client_.proof_cache().stats().accounts == 1);

    state_.set_account(kBob, Account{.balance = 5});
    publish_head(9);
    CHECK(run(client_.get_balance(kBob, NamedBlock::kLatest)) == 5);
    CHECK(client_.proof_cache().stats().accounts == 1);
    CHECK(run(client_.get_balance(kAlice, NamedBlock::kLatest)) == 1000);
}

}  // namespace lantern::execution

#include "mocks.hpp"

using namespace txgate;
using namespace txgate::tests;

namespace
{
    constexpr const char * ADDRESS = "0xabc";

    struct CoordinatorHarness
    {
        CoordinatorHarness()
        : chain("ethereum", "sepolia", 11155111),
          oracle(io_context, gas::OracleConfig{.ttl = std::chrono::seconds(10)}, clock.clock()),
          pending(io_context, store, pending::PendingConfig{}, clock.clock()),
          nonces(io_context, "ethereum:sepolia", store,
              [this](const std::string & address) { return chain.reportedNonce(address); },
              nonce::NonceConfig{}, clock.clock()),
          coordinator(chain, nonces, pending, oracle, nullptr, clock.clock())
        {
            runAwaitable(io_context, oracle.registerSource("ethereum", "sepolia", [this]() { return chain.feeEstimate(); }));
            EXPECT_TRUE(runAwaitable(io_context, nonces.init()).has_value());
        }

        gateway::BuildFn signer()
        {
            return [this](std::uint64_t nonce, double fee) -> asio::awaitable<Result<gateway::SignedTransaction>>
            {
                built.emplace_back(nonce, fee);
                co_await yieldOnce();
                co_return gateway::SignedTransaction{.raw = std::format("f8{:02x}", nonce), .fee = std::nullopt};
            };
        }

        asio::io_context io_context{};
        ManualClock clock;
        storage::MemoryStore store;
        MockChain chain;
        gas::GasPriceOracle oracle;
        pending::PendingTransactionStore pending;
        nonce::NonceManager nonces;
        gateway::TransactionCoordinator coordinator;

        std::vector<std::pair<std::uint64_t, double>> built;
    };
}

TEST_F(UnitTest, Coordinator_SubmissionIsClassifiedAsFeesMove)
{
    CoordinatorHarness h;
    h.chain.remote_nonce = 5;
    h.chain.base_fee = 20.0;

    const auto tx_hash = runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer()));
    ASSERT_TRUE(tx_hash.has_value());
    ASSERT_EQ(h.built.size(), 1u);
    EXPECT_EQ(h.built[0].first, 5u);
    EXPECT_DOUBLE_EQ(h.built[0].second, 20.0);
    EXPECT_EQ(h.chain.submitted.back(), "f805");

    const auto recorded = runAwaitable(h.io_context, h.pending.get("ethereum", *tx_hash));
    ASSERT_TRUE(recorded.has_value());
    EXPECT_EQ(recorded->nonce, 5u);
    EXPECT_DOUBLE_EQ(recorded->fee_at_submission, 20.0);
    EXPECT_EQ(recorded->chain_id, 11155111u);
    EXPECT_EQ(recorded->status, pending::TxStatus::PENDING);

    h.chain.statuses[*tx_hash] = chain::TxStatusReport{.status = chain::ReceiptStatus::IN_MEMPOOL, .block_number = std::nullopt, .data = nullptr};

    h.clock.advance(std::chrono::minutes(2));
    h.chain.base_fee = 25.0;
    const auto at_two_minutes = runAwaitable(h.io_context, h.coordinator.getStatus(*tx_hash));
    ASSERT_TRUE(at_two_minutes.has_value());
    EXPECT_EQ(at_two_minutes->status, pending::TxStatus::MEMPOOL_LIKELY_SUCCEED);

    h.clock.advance(std::chrono::minutes(2));
    h.chain.base_fee = 30.0;
    const auto at_four_minutes = runAwaitable(h.io_context, h.coordinator.getStatus(*tx_hash));
    ASSERT_TRUE(at_four_minutes.has_value());
    EXPECT_EQ(at_four_minutes->status, pending::TxStatus::MEMPOOL_LIKELY_FAIL);
    EXPECT_EQ(runAwaitable(h.io_context, h.pending.get("ethereum", *tx_hash))->status, pending::TxStatus::MEMPOOL_LIKELY_FAIL);

    h.chain.statuses[*tx_hash] = chain::TxStatusReport{.status = chain::ReceiptStatus::CONFIRMED, .block_number = 99, .data = nullptr};
    const auto confirmed = runAwaitable(h.io_context, h.coordinator.getStatus(*tx_hash));
    ASSERT_TRUE(confirmed.has_value());
    EXPECT_EQ(confirmed->status, pending::TxStatus::CONFIRMED);
    EXPECT_FALSE(runAwaitable(h.io_context, h.pending.get("ethereum", *tx_hash)).has_value());
}

TEST_F(UnitTest, Coordinator_ConsecutiveSubmissionsUseConsecutiveNonces)
{
    CoordinatorHarness h;
    h.chain.remote_nonce = 5;

    ASSERT_TRUE(runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer())).has_value());
    ASSERT_TRUE(runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer())).has_value());

    ASSERT_EQ(h.built.size(), 2u);
    EXPECT_EQ(h.built[0].first, 5u);
    EXPECT_EQ(h.built[1].first, 6u);
    EXPECT_EQ(runAwaitable(h.io_context, h.pending.list("ethereum")).size(), 2u);
}

TEST_F(UnitTest, Coordinator_BuildFailureKeepsNonce)
{
    CoordinatorHarness h;
    h.chain.remote_nonce = 5;

    const auto failed = runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS,
        [](std::uint64_t, double) -> asio::awaitable<Result<gateway::SignedTransaction>>
        {
            co_return makeError(GatewayError::Kind::INVALID_INPUT, "signer refused", true);
        }));
    ASSERT_FALSE(failed.has_value());
    EXPECT_FALSE(failed.error().submission_attempted);
    EXPECT_TRUE(h.chain.submitted.empty());

    ASSERT_TRUE(runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer())).has_value());
    EXPECT_EQ(h.built.back().first, 5u);
}

TEST_F(UnitTest, Coordinator_FeeUnavailableKeepsNonce)
{
    CoordinatorHarness h;
    h.chain.remote_nonce = 5;
    h.chain.fee_error = GatewayError{.kind = GatewayError::Kind::REMOTE_UNAVAILABLE, .message = "down", .submission_attempted = true};

    const auto failed = runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer()));
    ASSERT_FALSE(failed.has_value());
    EXPECT_FALSE(failed.error().submission_attempted);
    EXPECT_TRUE(h.built.empty());

    h.chain.fee_error.reset();
    ASSERT_TRUE(runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer())).has_value());
    EXPECT_EQ(h.built.back().first, 5u);
}

TEST_F(UnitTest, Coordinator_AmbiguousSubmissionConsumesNonce)
{
    CoordinatorHarness h;
    h.chain.remote_nonce = 5;
    h.chain.submit_results.push_back(makeError(GatewayError::Kind::REMOTE_UNAVAILABLE, "timeout", true));

    const auto failed = runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer()));
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, GatewayError::Kind::REMOTE_UNAVAILABLE);

    ASSERT_TRUE(runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer())).has_value());
    EXPECT_EQ(h.built.back().first, 6u);
}

TEST_F(UnitTest, Coordinator_SignerReportedFeeIsRecorded)
{
    CoordinatorHarness h;

    const auto tx_hash = runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS,
        [](std::uint64_t, double fee) -> asio::awaitable<Result<gateway::SignedTransaction>>
        {
            co_return gateway::SignedTransaction{.raw = "f800", .fee = fee + 3.0};
        }));
    ASSERT_TRUE(tx_hash.has_value());
    EXPECT_DOUBLE_EQ(runAwaitable(h.io_context, h.pending.get("ethereum", *tx_hash))->fee_at_submission, 23.0);
}

TEST_F(UnitTest, Coordinator_CancelReplacesStuckTransaction)
{
    CoordinatorHarness h;
    h.chain.remote_nonce = 5;

    const auto stuck = runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer()));
    ASSERT_TRUE(stuck.has_value());
    const auto last_before = runAwaitable(h.io_context, h.nonces.lastAllocated(ADDRESS));

    const auto too_low = runAwaitable(h.io_context, h.coordinator.cancelPending(ADDRESS, 5, 20.0, h.signer()));
    ASSERT_FALSE(too_low.has_value());
    EXPECT_EQ(too_low.error().kind, GatewayError::Kind::INVALID_INPUT);

    const auto cancelled = runAwaitable(h.io_context, h.coordinator.cancelPending(ADDRESS, 5, 24.0, h.signer()));
    ASSERT_TRUE(cancelled.has_value());
    ASSERT_TRUE(cancelled->tx_hash.has_value());
    EXPECT_FALSE(cancelled->already_confirmed);

    EXPECT_EQ(h.built.back().first, 5u);
    EXPECT_DOUBLE_EQ(h.built.back().second, 24.0);

    EXPECT_FALSE(runAwaitable(h.io_context, h.pending.get("ethereum", *stuck)).has_value());
    const auto replacement = runAwaitable(h.io_context, h.pending.findByNonce("ethereum", 11155111, ADDRESS, 5));
    ASSERT_TRUE(replacement.has_value());
    EXPECT_EQ(replacement->tx_hash, *cancelled->tx_hash);
    EXPECT_DOUBLE_EQ(replacement->fee_at_submission, 24.0);

    EXPECT_EQ(runAwaitable(h.io_context, h.nonces.lastAllocated(ADDRESS)), last_before);
}

TEST_F(UnitTest, Coordinator_CancelLosingRaceReportsConfirmation)
{
    CoordinatorHarness h;
    h.chain.remote_nonce = 5;

    const auto stuck = runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer()));
    ASSERT_TRUE(stuck.has_value());

    // the stuck transaction is mined while the cancel is in flight
    h.chain.submit_results.push_back(makeError(GatewayError::Kind::NONCE_CONFLICT, "nonce too low"));
    h.chain.statuses[*stuck] = chain::TxStatusReport{.status = chain::ReceiptStatus::CONFIRMED, .block_number = 10, .data = nullptr};

    const auto outcome = runAwaitable(h.io_context, h.coordinator.cancelPending(ADDRESS, 5, 30.0, h.signer()));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->already_confirmed);
    EXPECT_FALSE(outcome->tx_hash.has_value());
    EXPECT_FALSE(runAwaitable(h.io_context, h.pending.get("ethereum", *stuck)).has_value());
}

TEST_F(UnitTest, Coordinator_CancelAfterEvictionChecksMinedNonce)
{
    CoordinatorHarness h;
    h.chain.remote_nonce = 5;

    const auto stuck = runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer()));
    ASSERT_TRUE(stuck.has_value());

    // a status query settles and evicts the entry before the cancel arrives
    h.chain.statuses[*stuck] = chain::TxStatusReport{.status = chain::ReceiptStatus::CONFIRMED, .block_number = 10, .data = nullptr};
    const auto settled = runAwaitable(h.io_context, h.coordinator.getStatus(*stuck));
    ASSERT_TRUE(settled.has_value());
    EXPECT_EQ(settled->status, pending::TxStatus::CONFIRMED);
    ASSERT_FALSE(runAwaitable(h.io_context, h.pending.findByNonce("ethereum", 11155111, ADDRESS, 5)).has_value());

    h.chain.confirmed_nonce = 6;
    h.chain.submit_results.push_back(makeError(GatewayError::Kind::NONCE_CONFLICT, "nonce too low"));
    const auto outcome = runAwaitable(h.io_context, h.coordinator.cancelPending(ADDRESS, 5, 30.0, h.signer()));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->already_confirmed);
    EXPECT_FALSE(outcome->tx_hash.has_value());

    // the node still holds nonce 7 only in its mempool
    h.chain.submit_results.push_back(makeError(GatewayError::Kind::NONCE_CONFLICT, "already known"));
    const auto conflict = runAwaitable(h.io_context, h.coordinator.cancelPending(ADDRESS, 7, 30.0, h.signer()));
    ASSERT_FALSE(conflict.has_value());
    EXPECT_EQ(conflict.error().kind, GatewayError::Kind::NONCE_CONFLICT);
}

TEST_F(UnitTest, Coordinator_CancelFailureIsReturned)
{
    CoordinatorHarness h;
    h.chain.remote_nonce = 5;

    const auto stuck = runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer()));
    ASSERT_TRUE(stuck.has_value());

    h.chain.submit_results.push_back(makeError(GatewayError::Kind::SUBMISSION_FAILED, "replacement rejected"));
    h.chain.statuses[*stuck] = chain::TxStatusReport{.status = chain::ReceiptStatus::IN_MEMPOOL, .block_number = std::nullopt, .data = nullptr};

    const auto outcome = runAwaitable(h.io_context, h.coordinator.cancelPending(ADDRESS, 5, 30.0, h.signer()));
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, GatewayError::Kind::SUBMISSION_FAILED);
    EXPECT_TRUE(runAwaitable(h.io_context, h.pending.get("ethereum", *stuck)).has_value());
}

TEST_F(UnitTest, Coordinator_StatusOfUntrackedAndDroppedTransactions)
{
    CoordinatorHarness h;

    const auto unknown = runAwaitable(h.io_context, h.coordinator.getStatus("0xdead"));
    ASSERT_TRUE(unknown.has_value());
    EXPECT_EQ(unknown->status, pending::TxStatus::MEMPOOL_UNKNOWN);

    h.chain.statuses["0xbeef"] = chain::TxStatusReport{.status = chain::ReceiptStatus::IN_MEMPOOL, .block_number = std::nullopt, .data = nullptr};
    const auto foreign = runAwaitable(h.io_context, h.coordinator.getStatus("0xbeef"));
    ASSERT_TRUE(foreign.has_value());
    EXPECT_EQ(foreign->status, pending::TxStatus::PENDING);

    const auto tx_hash = runAwaitable(h.io_context, h.coordinator.submitWithNonce(ADDRESS, h.signer()));
    ASSERT_TRUE(tx_hash.has_value());

    const auto fresh = runAwaitable(h.io_context, h.coordinator.getStatus(*tx_hash));
    ASSERT_TRUE(fresh.has_value());
    EXPECT_EQ(fresh->status, pending::TxStatus::MEMPOOL_UNKNOWN);
    EXPECT_TRUE(runAwaitable(h.io_context, h.pending.get("ethereum", *tx_hash)).has_value());

    h.clock.advance(std::chrono::minutes(4));
    const auto dropped = runAwaitable(h.io_context, h.coordinator.getStatus(*tx_hash));
    ASSERT_TRUE(dropped.has_value());
    EXPECT_EQ(dropped->status, pending::TxStatus::FAILED);
    EXPECT_FALSE(runAwaitable(h.io_context, h.pending.get("ethereum", *tx_hash)).has_value());
}

TEST_F(UnitTest, Coordinator_WatchWithoutWatcherIsNotConnected)
{
    CoordinatorHarness h;
    const auto res = runAwaitable(h.io_context, h.coordinator.watchConfirmation("0x01", std::chrono::seconds(1)));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, GatewayError::Kind::NOT_CONNECTED);

    EXPECT_DOUBLE_EQ(*runAwaitable(h.io_context, h.coordinator.currentFee()), 20.0);
    EXPECT_EQ(*runAwaitable(h.io_context, h.coordinator.allocateNonce(ADDRESS)), 0u);
}

TEST_F(UnitTest, Coordinator_WatchSettlesConfirmedTransaction)
{
    CoordinatorHarness h;

    auto owned = std::make_unique<MockLiveChannel>(h.io_context);
    MockLiveChannel * channel = owned.get();
    watcher::ConfirmationWatcher watcher(h.io_context, std::move(owned));
    gateway::TransactionCoordinator coordinator(h.chain, h.nonces, h.pending, h.oracle, &watcher, h.clock.clock());

    ASSERT_TRUE(runAwaitable(h.io_context, watcher.connect()).has_value());
    channel->on_send = [channel](const nlohmann::json & message)
    {
        if(message.value("method", "") == "signatureSubscribe")
        {
            channel->push(nlohmann::json{{"id", message["id"]}, {"result", 3}});
            channel->push(nlohmann::json{
                {"method", "signatureNotification"},
                {"params", {{"subscription", 3}, {"result", {{"value", {{"err", nullptr}}}}}}}
            });
        }
    };

    const auto tx_hash = runAwaitable(h.io_context, coordinator.submitWithNonce(ADDRESS, h.signer()));
    ASSERT_TRUE(tx_hash.has_value());

    const auto res = runAwaitable(h.io_context, coordinator.watchConfirmation(*tx_hash, std::chrono::seconds(5)));
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->confirmed);
    EXPECT_FALSE(runAwaitable(h.io_context, h.pending.get("ethereum", *tx_hash)).has_value());

    runAwaitable(h.io_context, watcher.disconnect());
    h.io_context.restart();
    h.io_context.run_for(std::chrono::milliseconds(20));
}

TEST_F(UnitTest, Registry_ContextsAreKeyedByChainAndNetwork)
{
    asio::io_context io_context{};
    storage::MemoryStore store;
    gas::GasPriceOracle oracle(io_context, gas::OracleConfig{});
    pending::PendingTransactionStore pending(io_context, store, pending::PendingConfig{});
    gateway::ChainContextRegistry registry(io_context, store, oracle, pending, nullptr);

    auto sepolia = std::make_unique<MockChain>("ethereum", "sepolia", 11155111);
    sepolia->remote_nonce = 3;
    auto mainnet = std::make_unique<MockChain>("ethereum", "mainnet", 1);
    mainnet->nonce_error = GatewayError{.kind = GatewayError::Kind::REMOTE_UNAVAILABLE, .message = "down", .submission_attempted = false};
    MockChain * mainnet_ptr = mainnet.get();

    ASSERT_TRUE(runAwaitable(io_context, registry.add(std::move(sepolia), gas::FeePolicy{.include_priority_fee = true, .min_fee = 0.0, .multiplier = 2.0})).has_value());
    ASSERT_TRUE(runAwaitable(io_context, registry.add(std::move(mainnet), gas::FeePolicy{})).has_value());

    const auto duplicate = runAwaitable(io_context, registry.add(std::make_unique<MockChain>("ethereum", "sepolia", 11155111), gas::FeePolicy{}));
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().kind, GatewayError::Kind::INVALID_CONFIG);

    auto * context = runAwaitable(io_context, registry.find("ethereum", "sepolia"));
    ASSERT_NE(context, nullptr);
    EXPECT_EQ(context->id(), "ethereum:sepolia");
    EXPECT_EQ(runAwaitable(io_context, registry.find("solana", "devnet")), nullptr);
    EXPECT_EQ(runAwaitable(io_context, registry.contexts()).size(), 2u);

    // an empty nonce store reconciles nothing, so both come up ready
    EXPECT_TRUE(runAwaitable(io_context, registry.initAll()).has_value());

    EXPECT_EQ(*runAwaitable(io_context, context->coordinator().allocateNonce(ADDRESS)), 3u);
    EXPECT_DOUBLE_EQ(*runAwaitable(io_context, context->coordinator().currentFee()), 40.0);

    auto * mainnet_context = runAwaitable(io_context, registry.find("ethereum", "mainnet"));
    ASSERT_NE(mainnet_context, nullptr);
    const auto allocation = runAwaitable(io_context, mainnet_context->coordinator().allocateNonce(ADDRESS));
    ASSERT_FALSE(allocation.has_value());
    EXPECT_EQ(allocation.error().kind, GatewayError::Kind::REMOTE_UNAVAILABLE);
    EXPECT_EQ(mainnet_ptr->nonce_calls, 1u);
}

TEST_F(UnitTest, Registry_InitAllReportsUnreachableChain)
{
    asio::io_context io_context{};
    storage::MemoryStore store;
    ASSERT_TRUE(store.put(nonce::NonceManager::STORE_NAMESPACE, "ethereum:mainnet/0xabc",
        nonce::toJson(nonce::NonceRecord{.address = "0xabc", .chain = "ethereum:mainnet", .last_allocated = 1, .synced_at = {}})).has_value());

    gas::GasPriceOracle oracle(io_context, gas::OracleConfig{});
    pending::PendingTransactionStore pending(io_context, store, pending::PendingConfig{});
    gateway::ChainContextRegistry registry(io_context, store, oracle, pending, nullptr);

    auto mainnet = std::make_unique<MockChain>("ethereum", "mainnet", 1);
    mainnet->nonce_error = GatewayError{.kind = GatewayError::Kind::REMOTE_UNAVAILABLE, .message = "down", .submission_attempted = false};
    ASSERT_TRUE(runAwaitable(io_context, registry.add(std::move(mainnet), gas::FeePolicy{})).has_value());
    ASSERT_TRUE(runAwaitable(io_context, registry.add(std::make_unique<MockChain>("ethereum", "sepolia", 11155111), gas::FeePolicy{})).has_value());

    const auto res = runAwaitable(io_context, registry.initAll());
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, GatewayError::Kind::REMOTE_UNAVAILABLE);

    EXPECT_FALSE(runAwaitable(io_context, registry.find("ethereum", "mainnet"))->nonces().ready());
    EXPECT_TRUE(runAwaitable(io_context, registry.find("ethereum", "sepolia"))->nonces().ready());
}

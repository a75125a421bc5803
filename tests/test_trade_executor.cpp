#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "execution/trade_executor.hpp"

using namespace fcast;

namespace {

class FlakyRepository : public MarketRepository {
public:
    bool fail_trades{false};
    int trades_saved{0};

    void save_market(const Market&, const nlohmann::json&) override {}
    void save_trade(const Market&, const Position&, const nlohmann::json&) override {
        if (fail_trades) throw std::runtime_error("disk full");
        trades_saved++;
    }
    void save_resolution(const Market&, const std::vector<Position>&) override {}
    std::vector<StoredMarket> load_markets() override { return {}; }
};

} // namespace

class TradeExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MarketStore>();
        wallet_ = std::make_shared<LedgerWallet>(clock_);
        repository_ = std::make_shared<FlakyRepository>();
        executor_ = std::make_unique<TradeExecutor>(store_, wallet_, repository_, clock_, config_);

        add_market("m1");
        wallet_->deposit("alice", 1000.0);
        wallet_->deposit("bob", 1000.0);
    }

    void add_market(const std::string& id, MarketStatus status = MarketStatus::ACTIVE) {
        Market m;
        m.id = id;
        m.title = "Test market " + id;
        m.status = status;
        m.liquidity = 100.0;
        m.outcomes = {{"yes", "Yes"}, {"no", "No"}};
        auto model = std::make_unique<RiskWeightedLmsr>(2, 100.0, config_);
        refresh_outcomes(m, model->current_probability());
        store_->insert(MarketState(m, std::move(model)));
    }

    TradeRequest request(const std::string& user, const std::string& outcome, Amount stake,
                         const std::string& market = "m1") {
        TradeRequest r;
        r.user_id = user;
        r.market_id = market;
        r.outcome_id = outcome;
        r.stake = stake;
        return r;
    }

    ManualClock clock_{from_epoch_ms(1700000000000)};
    PricingConfig config_;
    std::shared_ptr<MarketStore> store_;
    std::shared_ptr<LedgerWallet> wallet_;
    std::shared_ptr<FlakyRepository> repository_;
    std::unique_ptr<TradeExecutor> executor_;
};

// ============================================================================
// Placement
// ============================================================================

TEST_F(TradeExecutorTest, PlacesTradeAtomically) {
    auto r = executor_->execute(request("alice", "yes", 100.0));
    ASSERT_TRUE(r.ok) << r.error.message;

    EXPECT_DOUBLE_EQ(r.position.odds_at_prediction, 50.0);
    EXPECT_NEAR(r.position.potential_return, 149.5, 1e-9);
    EXPECT_NEAR(r.position.loss_refund, 50.0, 1e-9);
    EXPECT_NEAR(r.position.platform_fee, 0.5, 1e-9);
    EXPECT_EQ(r.position.status, PositionStatus::ACTIVE);
    EXPECT_EQ(r.probabilities, (std::vector<int>{62, 38}));
    EXPECT_DOUBLE_EQ(r.market_volume, 100.0);

    auto snap = store_->snapshot("m1");
    ASSERT_TRUE(snap.has_value());
    EXPECT_DOUBLE_EQ(snap->market.total_volume, 100.0);
    EXPECT_DOUBLE_EQ(snap->market.outcomes[0].total_stake, 100.0);
    EXPECT_EQ(snap->market.outcomes[0].probability, 62);
    EXPECT_DOUBLE_EQ(snap->market.outcomes[0].stake_share, 100.0);
    EXPECT_EQ(snap->positions.size(), 1u);
    EXPECT_DOUBLE_EQ(wallet_->get_balance("alice"), 900.0);
    EXPECT_EQ(repository_->trades_saved, 1);
}

TEST_F(TradeExecutorTest, RejectsUnknownMarketAndOutcome) {
    EXPECT_EQ(executor_->execute(request("alice", "yes", 10.0, "nope")).error.code,
              ErrorCode::MARKET_NOT_FOUND);
    EXPECT_EQ(executor_->execute(request("alice", "maybe", 10.0)).error.code,
              ErrorCode::OUTCOME_NOT_FOUND);
}

TEST_F(TradeExecutorTest, RejectsNonPositiveStake) {
    auto r = executor_->execute(request("alice", "yes", 0.0));
    EXPECT_EQ(r.error.code, ErrorCode::INVALID_STAKE);
    EXPECT_EQ(r.error.kind(), ErrorKind::VALIDATION);
}

TEST_F(TradeExecutorTest, RejectsInactiveMarket) {
    add_market("closed", MarketStatus::CLOSED);
    auto r = executor_->execute(request("alice", "yes", 10.0, "closed"));
    EXPECT_EQ(r.error.code, ErrorCode::MARKET_INACTIVE);
    EXPECT_EQ(r.error.kind(), ErrorKind::STATE_CONFLICT);
}

TEST_F(TradeExecutorTest, InsufficientBalanceChangesNothing) {
    auto r = executor_->execute(request("carol", "yes", 10.0));
    EXPECT_EQ(r.error.code, ErrorCode::INSUFFICIENT_BALANCE);

    auto snap = store_->snapshot("m1");
    EXPECT_DOUBLE_EQ(snap->market.total_volume, 0.0);
    EXPECT_TRUE(snap->positions.empty());
    EXPECT_NEAR(snap->probabilities[0], 0.5, 1e-12);
}

TEST_F(TradeExecutorTest, PersistFailureReversesDebitAndKeepsState) {
    repository_->fail_trades = true;

    EXPECT_THROW(executor_->execute(request("alice", "yes", 100.0)), std::runtime_error);

    EXPECT_DOUBLE_EQ(wallet_->get_balance("alice"), 1000.0);
    auto snap = store_->snapshot("m1");
    EXPECT_DOUBLE_EQ(snap->market.total_volume, 0.0);
    EXPECT_TRUE(snap->positions.empty());
    EXPECT_NEAR(snap->probabilities[0], 0.5, 1e-12);

    auto history = wallet_->history("alice");
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[1].type, LedgerEntryType::STAKE);
    EXPECT_EQ(history[2].type, LedgerEntryType::REFUND);
}

TEST_F(TradeExecutorTest, QuoteDoesNotMutate) {
    auto q = executor_->quote("m1", "yes", 100.0);
    ASSERT_TRUE(q.has_value());
    EXPECT_DOUBLE_EQ(q->probability, 0.5);
    EXPECT_FALSE(executor_->quote("m1", "maybe", 100.0).has_value());
    EXPECT_DOUBLE_EQ(store_->snapshot("m1")->market.total_volume, 0.0);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(TradeExecutorTest, ConcurrentTradesOnOneOutcomeAreBothApplied) {
    std::vector<std::thread> threads;
    std::vector<TradeResult> results(2);
    threads.emplace_back([&] { results[0] = executor_->execute(request("alice", "yes", 50.0)); });
    threads.emplace_back([&] { results[1] = executor_->execute(request("bob", "yes", 50.0)); });
    for (auto& t : threads) t.join();

    ASSERT_TRUE(results[0].ok);
    ASSERT_TRUE(results[1].ok);

    auto snap = store_->snapshot("m1");
    EXPECT_DOUBLE_EQ(snap->market.outcomes[0].total_stake, 100.0);
    EXPECT_DOUBLE_EQ(snap->market.total_volume, 100.0);
    EXPECT_EQ(snap->positions.size(), 2u);

    // Same final state as applying the two stakes sequentially
    RiskWeightedLmsr sequential(2, 100.0, config_);
    sequential.apply_stake(0, 50.0);
    sequential.apply_stake(0, 50.0);
    EXPECT_NEAR(snap->probabilities[0], sequential.current_probability()[0], 1e-12);
}

TEST_F(TradeExecutorTest, ManyConcurrentTradesKeepVolumeConsistent) {
    add_market("m2");
    for (int i = 0; i < 8; i++) {
        wallet_->deposit("user" + std::to_string(i), 1000.0);
    }

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&, i] {
            for (int k = 0; k < 10; k++) {
                auto r = executor_->execute(request("user" + std::to_string(i),
                                                    (k % 2) ? "yes" : "no", 5.0,
                                                    (i % 2) ? "m1" : "m2"));
                EXPECT_TRUE(r.ok);
            }
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& id : {"m1", "m2"}) {
        auto snap = store_->snapshot(id);
        Amount sum = snap->market.outcomes[0].total_stake + snap->market.outcomes[1].total_stake;
        EXPECT_DOUBLE_EQ(snap->market.total_volume, 200.0);
        EXPECT_DOUBLE_EQ(sum, snap->market.total_volume);
        EXPECT_EQ(snap->positions.size(), 40u);
    }
}

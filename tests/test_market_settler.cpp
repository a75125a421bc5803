#include <gtest/gtest.h>
#include "execution/trade_executor.hpp"
#include "settlement/market_settler.hpp"

using namespace fcast;

namespace {

class CountingRepository : public MarketRepository {
public:
    bool fail_resolution{false};
    int resolutions_saved{0};
    std::vector<Position> last_saved;

    void save_market(const Market&, const nlohmann::json&) override {}
    void save_trade(const Market&, const Position&, const nlohmann::json&) override {}
    void save_resolution(const Market&, const std::vector<Position>& positions) override {
        if (fail_resolution) throw std::runtime_error("database locked");
        resolutions_saved++;
        last_saved = positions;
    }
    std::vector<StoredMarket> load_markets() override { return {}; }
};

// Fails the Nth settlement credit (payout or refund), once
class FlakyJournal : public LedgerJournal {
public:
    int fail_on_credit{0};
    int credits_seen{0};
    std::vector<LedgerEntry> entries;

    void append_ledger_entry(const LedgerEntry& entry) override {
        if (entry.type == LedgerEntryType::PAYOUT || entry.type == LedgerEntryType::REFUND) {
            credits_seen++;
            if (credits_seen == fail_on_credit) {
                throw std::runtime_error("journal unavailable");
            }
        }
        entries.push_back(entry);
    }
    std::vector<LedgerEntry> load_ledger_entries() override { return entries; }
};

} // namespace

class MarketSettlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MarketStore>();
        wallet_ = std::make_shared<LedgerWallet>(clock_);
        repository_ = std::make_shared<CountingRepository>();
        risk_ = std::make_shared<RiskControlEvaluator>(RiskConfig{},
                                                       std::make_shared<InMemoryRiskStateStore>(),
                                                       wallet_, clock_);
        executor_ = std::make_unique<TradeExecutor>(store_, wallet_, repository_, clock_, PricingConfig{});
        settler_ = std::make_unique<MarketSettler>(store_, wallet_, repository_, risk_, clock_);

        Market m;
        m.id = "election";
        m.title = "Who wins?";
        m.outcomes = {{"a", "Candidate A"}, {"b", "Candidate B"}, {"c", "Candidate C"}};
        auto model = std::make_unique<RiskWeightedLmsr>(3, 100.0, PricingConfig{});
        refresh_outcomes(m, model->current_probability());
        store_->insert(MarketState(m, std::move(model)));

        fund_users();
    }

    void fund_users() {
        for (const auto& user : {"alice", "bob", "carol"}) {
            wallet_->deposit(user, 1000.0);
        }
    }

    // Rebuild the money path around a journaled wallet
    void attach_journal(std::shared_ptr<LedgerJournal> journal) {
        wallet_ = std::make_shared<LedgerWallet>(clock_, std::move(journal));
        risk_ = std::make_shared<RiskControlEvaluator>(RiskConfig{},
                                                       std::make_shared<InMemoryRiskStateStore>(),
                                                       wallet_, clock_);
        executor_ = std::make_unique<TradeExecutor>(store_, wallet_, repository_, clock_, PricingConfig{});
        settler_ = std::make_unique<MarketSettler>(store_, wallet_, repository_, risk_, clock_);
        fund_users();
    }

    Position trade(const std::string& user, const std::string& outcome, Amount stake) {
        TradeRequest r;
        r.market_id = "election";
        r.outcome_id = outcome;
        r.user_id = user;
        r.stake = stake;
        auto result = executor_->execute(r);
        EXPECT_TRUE(result.ok) << result.error.message;
        return result.position;
    }

    ManualClock clock_{from_epoch_ms(1700000000000)};
    std::shared_ptr<MarketStore> store_;
    std::shared_ptr<LedgerWallet> wallet_;
    std::shared_ptr<CountingRepository> repository_;
    std::shared_ptr<RiskControlEvaluator> risk_;
    std::unique_ptr<TradeExecutor> executor_;
    std::unique_ptr<MarketSettler> settler_;
};

// ============================================================================
// Resolution
// ============================================================================

TEST_F(MarketSettlerTest, ResolvesAndPaysOut) {
    auto a1 = trade("alice", "a", 50.0);
    auto b1 = trade("bob", "b", 40.0);
    auto c1 = trade("carol", "a", 30.0);

    clock_.advance(std::chrono::hours(1));
    auto r = settler_->resolve("election", "a");
    ASSERT_TRUE(r.ok) << r.error.message;

    EXPECT_EQ(r.market.status, MarketStatus::RESOLVED);
    EXPECT_EQ(r.market.winning_outcome_id, "a");
    EXPECT_TRUE(r.market.resolution_date.has_value());
    EXPECT_EQ(r.winners, 2);
    EXPECT_EQ(r.losers, 1);
    EXPECT_NEAR(r.total_payout, a1.potential_return + c1.potential_return, 1e-9);
    EXPECT_NEAR(r.total_refund, b1.loss_refund, 1e-9);
    EXPECT_NEAR(r.platform_revenue, a1.platform_fee + c1.platform_fee, 1e-9);

    EXPECT_NEAR(wallet_->get_balance("alice"), 950.0 + a1.potential_return, 1e-9);
    EXPECT_NEAR(wallet_->get_balance("bob"), 960.0 + b1.loss_refund, 1e-9);

    auto snap = store_->snapshot("election");
    for (const auto& p : snap->positions) {
        EXPECT_TRUE(is_terminal(p.status));
        ASSERT_TRUE(p.resolved_at.has_value());
        if (p.status == PositionStatus::WON) {
            EXPECT_DOUBLE_EQ(p.actual_return, p.potential_return);
        } else {
            EXPECT_DOUBLE_EQ(p.actual_return, p.loss_refund);
        }
    }
    EXPECT_EQ(repository_->resolutions_saved, 1);
    EXPECT_EQ(repository_->last_saved.size(), 3u);
}

TEST_F(MarketSettlerTest, LedgerTypesDistinguishPayoutAndRefund) {
    trade("alice", "a", 20.0);
    trade("bob", "b", 20.0);
    settler_->resolve("election", "a");

    EXPECT_EQ(wallet_->history("alice").back().type, LedgerEntryType::PAYOUT);
    EXPECT_EQ(wallet_->history("bob").back().type, LedgerEntryType::REFUND);
}

TEST_F(MarketSettlerTest, SecondResolutionFailsWithoutMutation) {
    trade("alice", "a", 50.0);
    ASSERT_TRUE(settler_->resolve("election", "a").ok);

    auto before = store_->snapshot("election");
    Amount balance = wallet_->get_balance("alice");

    auto again = settler_->resolve("election", "b");
    EXPECT_FALSE(again.ok);
    EXPECT_EQ(again.error.code, ErrorCode::MARKET_ALREADY_RESOLVED);
    EXPECT_EQ(again.error.kind(), ErrorKind::STATE_CONFLICT);

    auto after = store_->snapshot("election");
    EXPECT_EQ(after->market.winning_outcome_id, "a");
    EXPECT_EQ(after->positions[0].status, before->positions[0].status);
    EXPECT_DOUBLE_EQ(after->positions[0].actual_return, before->positions[0].actual_return);
    EXPECT_DOUBLE_EQ(wallet_->get_balance("alice"), balance);
    EXPECT_EQ(repository_->resolutions_saved, 1);
}

TEST_F(MarketSettlerTest, RejectsUnknownMarketAndOutcome) {
    EXPECT_EQ(settler_->resolve("nope", "a").error.code, ErrorCode::MARKET_NOT_FOUND);
    EXPECT_EQ(settler_->resolve("election", "z").error.code, ErrorCode::INVALID_WINNING_OUTCOME);
    EXPECT_EQ(store_->snapshot("election")->market.status, MarketStatus::ACTIVE);
}

TEST_F(MarketSettlerTest, ResolvedMarketRejectsTrades) {
    settler_->resolve("election", "c");

    TradeRequest r;
    r.market_id = "election";
    r.outcome_id = "a";
    r.user_id = "alice";
    r.stake = 10.0;
    EXPECT_EQ(executor_->execute(r).error.code, ErrorCode::MARKET_INACTIVE);
}

TEST_F(MarketSettlerTest, PersistFailureCommitsNothing) {
    trade("alice", "a", 50.0);
    repository_->fail_resolution = true;

    EXPECT_THROW(settler_->resolve("election", "a"), std::runtime_error);

    auto snap = store_->snapshot("election");
    EXPECT_EQ(snap->market.status, MarketStatus::ACTIVE);
    EXPECT_EQ(snap->positions[0].status, PositionStatus::ACTIVE);
    EXPECT_NEAR(wallet_->get_balance("alice"), 950.0, 1e-9);
    EXPECT_EQ(wallet_->history("alice").back().type, LedgerEntryType::REVERSAL);
    EXPECT_EQ(risk_->forecaster_stats("alice").total_predictions, 0);
}

TEST_F(MarketSettlerTest, FailedCreditReversesEarlierCredits) {
    auto journal = std::make_shared<FlakyJournal>();
    attach_journal(journal);
    for (const auto& user : {"alice", "bob", "carol"}) {
        trade(user, "a", 50.0);
    }

    journal->fail_on_credit = 2;
    EXPECT_THROW(settler_->resolve("election", "a"), std::runtime_error);

    auto snap = store_->snapshot("election");
    EXPECT_EQ(snap->market.status, MarketStatus::ACTIVE);
    EXPECT_TRUE(snap->market.winning_outcome_id.empty());
    for (const auto& p : snap->positions) {
        EXPECT_EQ(p.status, PositionStatus::ACTIVE);
    }
    for (const auto& user : {"alice", "bob", "carol"}) {
        EXPECT_NEAR(wallet_->get_balance(user), 950.0, 1e-9) << user;
        EXPECT_EQ(risk_->forecaster_stats(user).total_predictions, 0) << user;
    }
    EXPECT_EQ(wallet_->history("alice").back().type, LedgerEntryType::REVERSAL);
    EXPECT_EQ(repository_->resolutions_saved, 0);

    // The failure was transient; settling again pays everyone once
    auto r = settler_->resolve("election", "a");
    ASSERT_TRUE(r.ok) << r.error.message;
    EXPECT_EQ(r.winners, 3);
    for (const auto& p : r.settled) {
        EXPECT_NEAR(wallet_->get_balance(p.user_id), 950.0 + p.potential_return, 1e-9);
    }
    EXPECT_EQ(risk_->forecaster_stats("bob").total_predictions, 1);
}

TEST_F(MarketSettlerTest, FailedVoidRefundLeavesMarketActive) {
    auto journal = std::make_shared<FlakyJournal>();
    attach_journal(journal);
    trade("alice", "a", 40.0);
    trade("bob", "b", 40.0);

    journal->fail_on_credit = 2;
    EXPECT_THROW(settler_->void_market("election"), std::runtime_error);
    EXPECT_EQ(store_->snapshot("election")->market.status, MarketStatus::ACTIVE);
    EXPECT_NEAR(wallet_->get_balance("alice"), 960.0, 1e-9);
    EXPECT_NEAR(wallet_->get_balance("bob"), 960.0, 1e-9);
}

TEST_F(MarketSettlerTest, RecordsAccuracyForEachPosition) {
    trade("alice", "a", 50.0);
    trade("bob", "b", 50.0);
    settler_->resolve("election", "a");

    EXPECT_EQ(risk_->forecaster_stats("alice").total_predictions, 1);
    EXPECT_EQ(risk_->forecaster_stats("bob").total_predictions, 1);
    EXPECT_TRUE(risk_->state_for("bob").last_loss_time.has_value());
    EXPECT_FALSE(risk_->state_for("alice").last_loss_time.has_value());
}

// ============================================================================
// Voiding
// ============================================================================

TEST_F(MarketSettlerTest, VoidRefundsStakesInFull) {
    trade("alice", "a", 50.0);
    trade("bob", "c", 25.0);

    auto r = settler_->void_market("election");
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.market.status, MarketStatus::CLOSED);
    EXPECT_TRUE(r.market.winning_outcome_id.empty());
    EXPECT_EQ(r.refunded, 2);
    EXPECT_DOUBLE_EQ(r.total_refund, 75.0);
    EXPECT_DOUBLE_EQ(wallet_->get_balance("alice"), 1000.0);
    EXPECT_DOUBLE_EQ(wallet_->get_balance("bob"), 1000.0);

    auto resolve = settler_->resolve("election", "a");
    EXPECT_EQ(resolve.error.code, ErrorCode::MARKET_INACTIVE);
    EXPECT_EQ(settler_->void_market("election").error.code, ErrorCode::MARKET_INACTIVE);
}

// ============================================================================
// Verification
// ============================================================================

TEST_F(MarketSettlerTest, VerificationCatchesActivePosition) {
    Market m;
    m.id = "x";
    m.status = MarketStatus::RESOLVED;
    m.winning_outcome_id = "a";

    Position p;
    p.id = "p1";
    p.status = PositionStatus::ACTIVE;
    EXPECT_THROW(MarketSettler::verify_settlement(m, {p}), ConsistencyViolation);
}

TEST_F(MarketSettlerTest, VerificationCatchesWrongPayout) {
    Market m;
    m.id = "x";
    m.status = MarketStatus::RESOLVED;
    m.winning_outcome_id = "a";

    Position won;
    won.id = "p1";
    won.status = PositionStatus::WON;
    won.potential_return = 120.0;
    won.actual_return = 119.0;
    EXPECT_THROW(MarketSettler::verify_settlement(m, {won}), ConsistencyViolation);

    won.actual_return = 120.0;
    EXPECT_NO_THROW(MarketSettler::verify_settlement(m, {won}));
}

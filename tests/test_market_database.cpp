#include <gtest/gtest.h>
#include "persistence/market_database.hpp"
#include "utils/uuid.hpp"
#include <filesystem>
#include <cstdio>

using namespace fcast;

class MarketDatabaseTest : public ::testing::Test {
protected:
    std::string test_db_path_;

    void SetUp() override {
        // Create a unique test database file
        test_db_path_ = "/tmp/test_market_db_" + generate_uuid() + ".db";
    }

    void TearDown() override {
        if (std::filesystem::exists(test_db_path_)) {
            std::filesystem::remove(test_db_path_);
        }
        // Also remove WAL and SHM files if they exist
        std::filesystem::remove(test_db_path_ + "-wal");
        std::filesystem::remove(test_db_path_ + "-shm");
    }

    Market make_market(const std::string& id) {
        Market m;
        m.id = id;
        m.title = "Market " + id;
        m.description = "desc";
        m.category = "science";
        m.liquidity = 150.0;
        m.created_at = from_epoch_ms(1700000000000);
        m.close_date = from_epoch_ms(1800000000000);
        m.outcomes = {{"yes", "Yes", 50, 0.0, 50.0}, {"no", "No", 50, 0.0, 50.0}};
        return m;
    }

    Position make_position(const std::string& id, const std::string& market_id, const std::string& user) {
        Position p;
        p.id = id;
        p.market_id = market_id;
        p.outcome_id = "yes";
        p.user_id = user;
        p.stake_amount = 25.0;
        p.odds_at_prediction = 50.0;
        p.potential_return = 37.375;
        p.loss_refund = 12.5;
        p.platform_fee = 0.125;
        p.created_at = from_epoch_ms(1700000100000);
        return p;
    }
};

// ============================================================================
// Schema
// ============================================================================

TEST_F(MarketDatabaseTest, OpensAndInitializesSchema) {
    MarketDatabase db(test_db_path_);
    EXPECT_TRUE(db.is_open());
    db.initialize_schema();
    EXPECT_EQ(db.get_schema_version(), MarketDatabase::SCHEMA_VERSION);

    // Idempotent
    db.initialize_schema();
    EXPECT_EQ(db.count_rows("markets"), 0);
}

TEST_F(MarketDatabaseTest, CountRowsRejectsUnknownTable) {
    MarketDatabase db(test_db_path_);
    db.initialize_schema();
    EXPECT_THROW(db.count_rows("sqlite_master; DROP TABLE markets"), std::invalid_argument);
}

// ============================================================================
// Markets and trades
// ============================================================================

TEST_F(MarketDatabaseTest, SaveAndLoadMarket) {
    MarketDatabase db(test_db_path_);
    db.initialize_schema();

    Market m = make_market("m1");
    nlohmann::json state = {{"liquidity", 150.0}, {"accumulators", {0.0, 0.0}}};
    db.save_market(m, state);

    auto loaded = db.load_markets();
    ASSERT_EQ(loaded.size(), 1u);
    const Market& back = loaded[0].market;
    EXPECT_EQ(back.id, "m1");
    EXPECT_EQ(back.title, "Market m1");
    EXPECT_EQ(back.category, "science");
    EXPECT_EQ(back.status, MarketStatus::ACTIVE);
    EXPECT_DOUBLE_EQ(back.liquidity, 150.0);
    EXPECT_EQ(back.created_at, m.created_at);
    ASSERT_TRUE(back.close_date.has_value());
    EXPECT_EQ(*back.close_date, *m.close_date);
    EXPECT_FALSE(back.resolution_date.has_value());
    ASSERT_EQ(back.outcomes.size(), 2u);
    EXPECT_EQ(back.outcomes[0].id, "yes");
    EXPECT_EQ(back.outcomes[1].id, "no");
    EXPECT_EQ(loaded[0].model_state, state);
}

TEST_F(MarketDatabaseTest, SaveTradeUpdatesMarketAndAddsPosition) {
    MarketDatabase db(test_db_path_);
    db.initialize_schema();

    Market m = make_market("m1");
    db.save_market(m, nlohmann::json::object());

    m.total_volume = 25.0;
    m.outcomes[0].total_stake = 25.0;
    m.outcomes[0].probability = 56;
    m.outcomes[1].probability = 44;
    nlohmann::json state = {{"liquidity", 150.0}, {"accumulators", {12.5, 0.0}}};
    db.save_trade(m, make_position("p1", "m1", "alice"), state);

    auto loaded = db.load_markets();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_DOUBLE_EQ(loaded[0].market.total_volume, 25.0);
    EXPECT_EQ(loaded[0].market.outcomes[0].probability, 56);
    ASSERT_EQ(loaded[0].positions.size(), 1u);
    EXPECT_DOUBLE_EQ(loaded[0].positions[0].potential_return, 37.375);
    EXPECT_EQ(loaded[0].positions[0].status, PositionStatus::ACTIVE);
    EXPECT_FALSE(loaded[0].positions[0].resolved_at.has_value());
    EXPECT_EQ(loaded[0].model_state["accumulators"][0].get<double>(), 12.5);
}

TEST_F(MarketDatabaseTest, TradeForUnknownMarketRollsBack) {
    MarketDatabase db(test_db_path_);
    db.initialize_schema();

    // Position references a market that has no row; foreign key fails
    Market m = make_market("m1");
    db.save_market(m, nlohmann::json::object());
    Position orphan = make_position("p1", "ghost", "alice");
    EXPECT_THROW(db.save_trade(m, orphan, nlohmann::json::object()), std::runtime_error);

    EXPECT_EQ(db.count_rows("positions"), 0);

    // Connection still usable after rollback
    db.save_trade(m, make_position("p2", "m1", "alice"), nlohmann::json::object());
    EXPECT_EQ(db.count_rows("positions"), 1);
}

TEST_F(MarketDatabaseTest, SaveResolutionMarksPositions) {
    MarketDatabase db(test_db_path_);
    db.initialize_schema();

    Market m = make_market("m1");
    db.save_market(m, nlohmann::json::object());
    Position p = make_position("p1", "m1", "alice");
    db.save_trade(m, p, nlohmann::json::object());

    m.status = MarketStatus::RESOLVED;
    m.winning_outcome_id = "yes";
    m.resolution_date = from_epoch_ms(1700500000000);
    p.status = PositionStatus::WON;
    p.actual_return = p.potential_return;
    p.resolved_at = m.resolution_date;
    db.save_resolution(m, {p});

    auto loaded = db.load_markets();
    EXPECT_EQ(loaded[0].market.status, MarketStatus::RESOLVED);
    EXPECT_EQ(loaded[0].market.winning_outcome_id, "yes");
    EXPECT_EQ(loaded[0].positions[0].status, PositionStatus::WON);
    EXPECT_DOUBLE_EQ(loaded[0].positions[0].actual_return, 37.375);
    ASSERT_TRUE(loaded[0].positions[0].resolved_at.has_value());

    auto by_user = db.get_positions_for_user("alice");
    ASSERT_EQ(by_user.size(), 1u);
    EXPECT_EQ(by_user[0].id, "p1");
}

// ============================================================================
// Risk state, ledger, snapshots
// ============================================================================

TEST_F(MarketDatabaseTest, RiskStateRoundTrip) {
    MarketDatabase db(test_db_path_);
    db.initialize_schema();

    EXPECT_FALSE(db.load_risk_state("alice").has_value());

    UserRiskState s;
    s.user_id = "alice";
    s.daily_limit = 50.0;
    s.daily_spent = 40.0;
    s.last_daily_reset = "2024-01-17";
    s.recent_trades = {1, 2, 3};
    s.calibration[60] = {5, 4};
    db.save_risk_state(s);

    s.daily_spent = 45.0;
    db.save_risk_state(s);

    auto back = db.load_risk_state("alice");
    ASSERT_TRUE(back.has_value());
    EXPECT_DOUBLE_EQ(back->daily_spent, 45.0);
    EXPECT_EQ(back->daily_limit, std::optional<Amount>(50.0));
    EXPECT_EQ(back->recent_trades.size(), 3u);
    EXPECT_EQ(back->calibration.at(60).correct, 4);
    EXPECT_EQ(db.count_rows("risk_state"), 1);
}

TEST_F(MarketDatabaseTest, LedgerEntriesKeepOrder) {
    MarketDatabase db(test_db_path_);
    db.initialize_schema();

    for (int i = 0; i < 5; i++) {
        LedgerEntry e;
        e.id = "e" + std::to_string(i);
        e.user_id = "alice";
        e.type = (i == 0) ? LedgerEntryType::DEPOSIT : LedgerEntryType::STAKE;
        e.amount = 10.0;
        e.balance_after = 100.0 - i * 10.0;
        e.created_at = from_epoch_ms(1700000000000);   // Same timestamp
        db.append_ledger_entry(e);
    }

    auto entries = db.load_ledger_entries();
    ASSERT_EQ(entries.size(), 5u);
    for (int i = 0; i < 5; i++) {
        EXPECT_EQ(entries[i].id, "e" + std::to_string(i));
    }
    EXPECT_EQ(entries[0].type, LedgerEntryType::DEPOSIT);
    EXPECT_DOUBLE_EQ(entries[4].balance_after, 60.0);
}

TEST_F(MarketDatabaseTest, DuplicateLedgerEntryRejected) {
    MarketDatabase db(test_db_path_);
    db.initialize_schema();

    LedgerEntry e;
    e.id = "dup";
    e.user_id = "alice";
    db.append_ledger_entry(e);
    EXPECT_THROW(db.append_ledger_entry(e), std::runtime_error);
}

TEST_F(MarketDatabaseTest, DailySnapshotUpsertsPerDay) {
    MarketDatabase db(test_db_path_);
    db.initialize_schema();
    db.save_market(make_market("m1"), nlohmann::json::object());

    DailySnapshot s;
    s.market_id = "m1";
    s.day = "2024-01-17";
    s.probabilities = {{"yes", 55}, {"no", 45}};
    s.total_volume = 10.0;
    s.taken_at = from_epoch_ms(1705492800000);
    db.save_daily_snapshot(s);

    s.probabilities["yes"] = 60;
    db.save_daily_snapshot(s);

    auto loaded = db.load_daily_snapshots();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].probabilities.at("yes"), 60);
    EXPECT_EQ(loaded[0].day, "2024-01-17");
}

TEST_F(MarketDatabaseTest, DataSurvivesReopen) {
    {
        MarketDatabase db(test_db_path_);
        db.initialize_schema();
        db.save_market(make_market("m1"), nlohmann::json::object());
    }

    MarketDatabase db(test_db_path_);
    db.initialize_schema();
    EXPECT_EQ(db.load_markets().size(), 1u);
}

#include <gtest/gtest.h>
#include <cmath>
#include "analytics/trend_engine.hpp"

using namespace fcast;

class TrendEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = from_epoch_ms(1700000000000);

        market_.id = "m1";
        market_.title = "Will it ship?";
        market_.outcomes = {{"y", "Yes", 60, 0.0, 50.0}, {"n", "No", 40, 0.0, 50.0}};
    }

    AnalyticsInput input() const {
        AnalyticsInput in;
        in.market = market_;
        in.now = now_;
        return in;
    }

    Position position(const std::string& user, Amount stake, WallClock t,
                      PositionStatus status = PositionStatus::ACTIVE) const {
        Position p;
        p.id = user + std::to_string(to_epoch_ms(t));
        p.market_id = "m1";
        p.outcome_id = "y";
        p.user_id = user;
        p.stake_amount = stake;
        p.status = status;
        p.created_at = t;
        return p;
    }

    SignalEvent event(const std::string& type, const std::string& source, double confidence,
                      double impact, const std::string& title = "") const {
        SignalEvent e;
        e.type = type;
        e.source = source;
        e.title = title;
        e.confidence = confidence;
        e.impact_estimate = impact;
        e.mapped_markets = {"m1"};
        e.t = now_;
        return e;
    }

    AnalyticsConfig config_;
    Market market_;
    WallClock now_;
};

// ============================================================================
// Primary outcome
// ============================================================================

TEST_F(TrendEngineTest, BinaryMarketUsesYesOutcome) {
    market_.outcomes[1].total_stake = 500.0;
    EXPECT_EQ(TrendEngine::primary_outcome_id(market_), "y");
}

TEST_F(TrendEngineTest, MultiOutcomeUsesLargestStake) {
    market_.outcomes.push_back({"z", "Maybe", 0, 0.0, 0.0});
    market_.outcomes[0].total_stake = 10.0;
    market_.outcomes[2].total_stake = 30.0;
    EXPECT_EQ(TrendEngine::primary_outcome_id(market_), "z");
}

// ============================================================================
// Score components
// ============================================================================

TEST_F(TrendEngineTest, EmptyInputScoresZero) {
    TrendEngine engine(config_);
    auto s = engine.compute(input());

    EXPECT_EQ(s.primary_outcome_id, "y");
    EXPECT_DOUBLE_EQ(s.implied_probability, 0.6);
    EXPECT_EQ(s.price, 60);
    EXPECT_EQ(s.trend_score, 0);
    EXPECT_EQ(s.sentiment.decision_grade, "noise");
    EXPECT_EQ(s.sentiment.uncertainty, "high_disagreement");
    EXPECT_EQ(s.catalyst_summary, "No catalyst detected");
}

TEST_F(TrendEngineTest, DeltaIsCappedAtTwentyPoints) {
    TrendEngine engine(config_);
    auto in = input();

    DailySnapshot snap;
    snap.market_id = "m1";
    snap.probabilities = {{"y", 50}, {"n", 50}};
    in.daily_snapshot = snap;
    auto s = engine.compute(in);
    EXPECT_NEAR(s.change_24h, 0.10, 1e-12);
    EXPECT_NEAR(s.components.delta24h_norm, 0.5, 1e-12);
    EXPECT_EQ(s.trend_score, 20);

    in.daily_snapshot->probabilities["y"] = 20;
    s = engine.compute(in);
    EXPECT_DOUBLE_EQ(s.components.delta24h_norm, 1.0);
}

TEST_F(TrendEngineTest, InformedVolumeWeightsByAccuracy) {
    TrendEngine engine(config_);
    auto in = input();
    in.positions = {
        position("sharp", 100.0, now_ - std::chrono::hours(1)),
        position("new", 100.0, now_ - std::chrono::hours(2)),
        position("old", 500.0, now_ - std::chrono::hours(30))   // Outside window
    };
    in.user_accuracy = {{"sharp", 1.0}};

    auto s = engine.compute(in);
    EXPECT_DOUBLE_EQ(s.volume24h, 200.0);
    EXPECT_DOUBLE_EQ(s.informed_volume24h, 100.0 + 50.0);
    EXPECT_NEAR(s.components.informed_volume24h_norm,
                std::log1p(150.0) / std::log1p(2000.0), 1e-12);
}

TEST_F(TrendEngineTest, EventImpactIsConfidenceWeighted) {
    TrendEngine engine(config_);
    auto in = input();
    in.events = {event("news", "wire", 0.5, 0.4), event("filing", "sec", 1.0, 0.3)};

    auto s = engine.compute(in);
    EXPECT_NEAR(s.components.info_event_impact_norm, 0.5 * 0.4 + 1.0 * 0.3, 1e-12);

    in.events.push_back(event("news", "wire", 1.0, 1.0));
    EXPECT_DOUBLE_EQ(engine.compute(in).components.info_event_impact_norm, 1.0);
}

TEST_F(TrendEngineTest, ScoreUsesConfiguredWeights) {
    config_.weight_delta = 1.0;
    config_.weight_volume = 0.0;
    config_.weight_events = 0.0;
    config_.weight_sentiment = 0.0;
    TrendEngine engine(config_);

    auto in = input();
    DailySnapshot snap;
    snap.probabilities = {{"y", 45}};
    in.daily_snapshot = snap;
    in.events = {event("news", "wire", 0.9, 0.9)};

    auto s = engine.compute(in);
    EXPECT_EQ(s.trend_score, 75);
    EXPECT_DOUBLE_EQ(s.parameters.weight_delta, 1.0);
}

// ============================================================================
// Sentiment
// ============================================================================

TEST_F(TrendEngineTest, SentimentLayersByKeyword) {
    std::vector<SignalEvent> events = {
        event("analyst_note", "research desk", 0.8, 0.1),
        event("filing", "bank", 0.5, 0.1),
        event("post", "social", 0.2, 0.1)
    };
    EXPECT_EQ(classify_layer(events[0]), SentimentLayer::EXPERT);
    EXPECT_EQ(classify_layer(events[1]), SentimentLayer::INSTITUTIONAL);
    EXPECT_EQ(classify_layer(events[2]), SentimentLayer::MASS);

    auto s = TrendEngine::sentiment_layers(events);
    EXPECT_DOUBLE_EQ(s.expert, 0.8);
    EXPECT_DOUBLE_EQ(s.institutional, 0.5);
    EXPECT_DOUBLE_EQ(s.mass, 0.2);
    EXPECT_NEAR(s.average_confidence, 0.5, 1e-12);
    EXPECT_EQ(s.decision_grade, "overreaction");
    EXPECT_EQ(s.uncertainty, "fragile_consensus");
}

TEST_F(TrendEngineTest, EmptyLayerFallsBackToMean) {
    auto s = TrendEngine::sentiment_layers({event("post", "social", 0.9, 0.0),
                                            event("post", "forum", 0.85, 0.0)});
    EXPECT_NEAR(s.expert, 0.875, 1e-12);
    EXPECT_NEAR(s.institutional, 0.875, 1e-12);
    EXPECT_EQ(s.decision_grade, "signal");
    EXPECT_EQ(s.uncertainty, "late_stage_optimism");
}

TEST_F(TrendEngineTest, LowConfidenceIsNoise) {
    auto s = TrendEngine::sentiment_layers({event("post", "social", 0.1, 0.0)});
    EXPECT_EQ(s.decision_grade, "noise");
    EXPECT_EQ(s.uncertainty, "high_disagreement");
}

// ============================================================================
// Sparkline and summaries
// ============================================================================

TEST_F(TrendEngineTest, SparklineWithoutSamplesIsFlat) {
    TrendEngine engine(config_);
    auto points = engine.build_sparkline({}, "y", 0.6, now_);

    ASSERT_EQ(points.size(), 60u);
    EXPECT_EQ(points.back().t, now_);
    EXPECT_EQ(points.front().t, now_ - std::chrono::minutes(5 * 59));
    for (const auto& pt : points) {
        EXPECT_DOUBLE_EQ(pt.p, 0.6);
    }
}

TEST_F(TrendEngineTest, SparklineCarriesSamplesForward) {
    TrendEngine engine(config_);
    std::vector<IntradaySample> samples = {
        {now_ - std::chrono::minutes(100), {{"y", 0.4}}},
        {now_ - std::chrono::minutes(30), {{"y", 0.55}}}
    };
    auto points = engine.build_sparkline(samples, "y", 0.6, now_);

    // Before the first sample the earliest value is used
    EXPECT_DOUBLE_EQ(points.front().p, 0.4);
    // t = now - 60min
    EXPECT_DOUBLE_EQ(points[59 - 12].p, 0.4);
    // t = now - 30min
    EXPECT_DOUBLE_EQ(points[59 - 6].p, 0.55);
    EXPECT_DOUBLE_EQ(points.back().p, 0.55);
}

TEST_F(TrendEngineTest, CatalystSummaryUsesFirstTwoTitles) {
    std::vector<SignalEvent> events = {
        event("news", "wire", 0.5, 0.1, "Rate cut"),
        event("news", "wire", 0.5, 0.1, "Jobs beat"),
        event("news", "wire", 0.5, 0.1, "Ignored")
    };
    EXPECT_EQ(TrendEngine::catalyst_summary(events), "Rate cut • Jobs beat");
}

TEST_F(TrendEngineTest, ScenarioBandsStayInRange) {
    market_.outcomes[0].probability = 95;
    TrendEngine engine(config_);
    auto s = engine.compute(input());
    EXPECT_NEAR(s.scenario_bands.p10, 0.85, 1e-12);
    EXPECT_DOUBLE_EQ(s.scenario_bands.p50, 0.95);
    EXPECT_DOUBLE_EQ(s.scenario_bands.p90, 1.0);
}

TEST_F(TrendEngineTest, UserAccuracyFromResolvedPositions) {
    std::vector<Position> positions = {
        position("a", 10, now_, PositionStatus::WON),
        position("a", 10, now_ + std::chrono::seconds(1), PositionStatus::LOST),
        position("b", 10, now_, PositionStatus::ACTIVE),
        position("c", 10, now_, PositionStatus::REFUNDED)
    };
    auto acc = TrendEngine::user_accuracy(positions);
    EXPECT_DOUBLE_EQ(acc.at("a"), 0.5);
    EXPECT_EQ(acc.count("b"), 0u);
    EXPECT_EQ(acc.count("c"), 0u);
}

TEST_F(TrendEngineTest, SnapshotSerializesSentimentOnSignedScale) {
    TrendEngine engine(config_);
    auto in = input();
    in.events = {event("analyst_note", "research", 1.0, 0.2)};

    nlohmann::json j = engine.compute(in);
    EXPECT_DOUBLE_EQ(j["sentiment"]["expert"].get<double>(), 1.0);
    EXPECT_EQ(j["sparkline"]["points"].size(), 60u);
    EXPECT_EQ(j["trend"]["parameters"]["weight_delta"].get<double>(), 0.4);
}

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analytics/signal_feed.hpp"
#include "analytics/snapshot_cache.hpp"
#include "common/types.hpp"
#include "config/config.hpp"

namespace fcast {

/**
 * Everything the trend engine reads. Built by the caller from the market
 * store, snapshot cache and signal feed; the engine itself does no I/O.
 */
struct AnalyticsInput {
    Market market;
    std::vector<Position> positions;                 // Positions of this market
    std::map<std::string, double> user_accuracy;     // user_id -> resolved win rate
    std::optional<DailySnapshot> daily_snapshot;
    std::vector<IntradaySample> intraday_samples;
    std::vector<SignalEvent> events;                 // Already mapped to this market
    WallClock now;
};

struct TrendComponents {
    double delta24h_norm{0.0};
    double informed_volume24h_norm{0.0};
    double info_event_impact_norm{0.0};
    double sentiment_consensus_norm{0.0};
};

struct SentimentSummary {
    // Mean event confidence per layer, 0-1
    double expert{0.0};
    double institutional{0.0};
    double mass{0.0};
    double average_confidence{0.0};
    std::string decision_grade{"noise"};         // signal, overreaction, noise
    std::string uncertainty{"high_disagreement"};   // high_disagreement, fragile_consensus, late_stage_optimism
};

struct SparklinePoint {
    WallClock t;
    Probability p{0.0};
};

struct ScenarioBands {
    Probability p10{0.0};
    Probability p50{0.0};
    Probability p90{0.0};
};

/**
 * Derived view of a market. Never fed back into pricing.
 */
struct AnalyticsSnapshot {
    std::string market_id;
    std::string primary_outcome_id;
    Probability implied_probability{0.0};
    int price{0};                         // implied_probability as integer %

    double change_24h{0.0};               // Signed, against the daily snapshot
    Amount total_volume{0.0};
    Amount volume24h{0.0};
    Amount informed_volume24h{0.0};

    int trend_score{0};                   // 0-100
    TrendComponents components;
    AnalyticsConfig parameters;           // Weights and caps used

    SentimentSummary sentiment;
    std::vector<SparklinePoint> sparkline;
    std::string catalyst_summary;
    ScenarioBands scenario_bands;
    size_t event_count{0};
    WallClock computed_at;
};

void to_json(nlohmann::json& j, const AnalyticsSnapshot& s);

double clamp01(double x);

// ln(1 + x) / ln(1 + max(1, cap)), clamped to [0, 1]
double log_norm(double x, double cap);

/**
 * Trend score, sentiment and sparkline for one market.
 */
class TrendEngine {
public:
    static constexpr double SCENARIO_BAND_WIDTH = 0.10;
    static constexpr size_t CATALYST_TITLES = 2;

    explicit TrendEngine(const AnalyticsConfig& config);

    AnalyticsSnapshot compute(const AnalyticsInput& input) const;

    // "yes" in a binary market, otherwise the outcome with the largest stake
    static std::string primary_outcome_id(const Market& market);

    static Probability implied_probability(const Market& market, const std::string& outcome_id);

    // Win rate over won/lost positions per user
    static std::map<std::string, double> user_accuracy(const std::vector<Position>& positions);

    static SentimentSummary sentiment_layers(const std::vector<SignalEvent>& events);

    static std::string catalyst_summary(const std::vector<SignalEvent>& events);

    std::vector<SparklinePoint> build_sparkline(const std::vector<IntradaySample>& samples,
                                                const std::string& outcome_id,
                                                Probability current,
                                                WallClock now) const;

    const AnalyticsConfig& config() const { return config_; }

private:
    AnalyticsConfig config_;
};

} // namespace fcast

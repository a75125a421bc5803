#include "analytics/trend_engine.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <spdlog/spdlog.h>
#include "utils/time_utils.hpp"

namespace fcast {

double clamp01(double x) {
    if (std::isnan(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

double log_norm(double x, double cap) {
    double v = std::log1p(std::max(0.0, x));
    double c = std::log1p(std::max(1.0, cap));
    return clamp01(v / c);
}

void to_json(nlohmann::json& j, const AnalyticsSnapshot& s) {
    nlohmann::json sparkline = nlohmann::json::array();
    for (const auto& pt : s.sparkline) {
        sparkline.push_back({{"t", time_utils::to_iso8601(pt.t)}, {"p", pt.p}});
    }

    j = nlohmann::json{
        {"market_id", s.market_id},
        {"core", {
            {"price", s.price},
            {"implied_probability", s.implied_probability},
            {"primary_outcome_id", s.primary_outcome_id},
            {"volume", {{"total", s.total_volume}, {"volume24h", s.volume24h}}}
        }},
        {"informed_volume", {{"volume24h_weighted", s.informed_volume24h}}},
        {"trend", {
            {"score", s.trend_score},
            {"components", {
                {"delta24h_norm", s.components.delta24h_norm},
                {"informed_volume24h_norm", s.components.informed_volume24h_norm},
                {"info_event_impact_norm", s.components.info_event_impact_norm},
                {"sentiment_consensus_norm", s.components.sentiment_consensus_norm}
            }},
            {"change_24h", s.change_24h},
            {"parameters", s.parameters}
        }},
        {"sentiment", {
            // Reported on a -1..1 scale
            {"expert", s.sentiment.expert * 2.0 - 1.0},
            {"institutional", s.sentiment.institutional * 2.0 - 1.0},
            {"mass", s.sentiment.mass * 2.0 - 1.0},
            {"decision_grade", s.sentiment.decision_grade},
            {"uncertainty", s.sentiment.uncertainty}
        }},
        {"catalyst_summary", s.catalyst_summary},
        {"risk", {
            {"scenario_bands", {
                {"p10", s.scenario_bands.p10},
                {"p50", s.scenario_bands.p50},
                {"p90", s.scenario_bands.p90}
            }},
            {"expected_value_delta", s.change_24h}
        }},
        {"sparkline", {
            {"points", sparkline},
            {"resolution_ms", s.parameters.sparkline_resolution_ms}
        }},
        {"event_count", s.event_count},
        {"computed_at", time_utils::to_iso8601(s.computed_at)}
    };
}

TrendEngine::TrendEngine(const AnalyticsConfig& config)
    : config_(config)
{
}

std::string TrendEngine::primary_outcome_id(const Market& market) {
    if (market.outcomes.empty()) {
        return "";
    }

    if (market.outcomes.size() == 2) {
        for (const auto& o : market.outcomes) {
            std::string title = o.title;
            title.erase(0, title.find_first_not_of(" \t"));
            title.erase(title.find_last_not_of(" \t") + 1);
            std::transform(title.begin(), title.end(), title.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (title == "yes") {
                return o.id;
            }
        }
    }

    // First outcome wins ties
    const Outcome* best = &market.outcomes.front();
    for (const auto& o : market.outcomes) {
        if (o.total_stake > best->total_stake) {
            best = &o;
        }
    }
    return best->id;
}

Probability TrendEngine::implied_probability(const Market& market, const std::string& outcome_id) {
    const Outcome* o = market.find_outcome(outcome_id);
    if (!o) {
        return 0.5;
    }
    return clamp01(o->probability / 100.0);
}

std::map<std::string, double> TrendEngine::user_accuracy(const std::vector<Position>& positions) {
    std::map<std::string, std::pair<int, int>> counts;   // total, wins
    for (const auto& p : positions) {
        if (p.status != PositionStatus::WON && p.status != PositionStatus::LOST) continue;
        auto& c = counts[p.user_id];
        c.first++;
        if (p.status == PositionStatus::WON) c.second++;
    }

    std::map<std::string, double> result;
    for (const auto& [user, c] : counts) {
        result[user] = c.first > 0 ? static_cast<double>(c.second) / c.first : 0.0;
    }
    return result;
}

SentimentSummary TrendEngine::sentiment_layers(const std::vector<SignalEvent>& events) {
    SentimentSummary s;
    if (events.empty()) {
        return s;
    }

    double total = 0.0;
    double sums[3] = {0.0, 0.0, 0.0};
    int counts[3] = {0, 0, 0};
    for (const auto& e : events) {
        double c = clamp01(e.confidence);
        total += c;
        int layer = static_cast<int>(classify_layer(e));
        sums[layer] += c;
        counts[layer]++;
    }

    double mean = clamp01(total / events.size());
    auto layer_mean = [&](SentimentLayer l) {
        int i = static_cast<int>(l);
        return counts[i] > 0 ? clamp01(sums[i] / counts[i]) : mean;
    };

    s.expert = layer_mean(SentimentLayer::EXPERT);
    s.institutional = layer_mean(SentimentLayer::INSTITUTIONAL);
    s.mass = layer_mean(SentimentLayer::MASS);
    s.average_confidence = mean;

    if (mean > 0.6) {
        s.decision_grade = "signal";
    } else if (mean < 0.3) {
        s.decision_grade = "noise";
    } else {
        s.decision_grade = "overreaction";
    }

    if (mean < 0.4) {
        s.uncertainty = "high_disagreement";
    } else if (mean > 0.8) {
        s.uncertainty = "late_stage_optimism";
    } else {
        s.uncertainty = "fragile_consensus";
    }

    return s;
}

std::string TrendEngine::catalyst_summary(const std::vector<SignalEvent>& events) {
    std::string summary;
    size_t used = 0;
    for (const auto& e : events) {
        if (used == CATALYST_TITLES) break;
        const std::string& label = e.title.empty() ? e.type : e.title;
        if (label.empty()) continue;
        if (!summary.empty()) summary += " • ";
        summary += label;
        used++;
    }
    return summary.empty() ? "No catalyst detected" : summary;
}

std::vector<SparklinePoint> TrendEngine::build_sparkline(const std::vector<IntradaySample>& samples,
                                                         const std::string& outcome_id,
                                                         Probability current,
                                                         WallClock now) const {
    const int count = config_.sparkline_points;
    const auto step = std::chrono::milliseconds(config_.sparkline_resolution_ms);

    std::vector<SparklinePoint> points;
    points.reserve(static_cast<size_t>(count));

    // Samples of this outcome, oldest first
    std::vector<std::pair<WallClock, Probability>> series;
    for (const auto& s : samples) {
        auto it = s.probabilities.find(outcome_id);
        if (it != s.probabilities.end()) {
            series.emplace_back(s.t, it->second);
        }
    }
    std::sort(series.begin(), series.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    size_t next = 0;
    Probability value = series.empty() ? current : series.front().second;
    for (int i = count - 1; i >= 0; i--) {
        WallClock t = now - step * i;
        while (next < series.size() && series[next].first <= t) {
            value = series[next].second;
            next++;
        }
        points.push_back({t, value});
    }

    return points;
}

AnalyticsSnapshot TrendEngine::compute(const AnalyticsInput& input) const {
    const Market& market = input.market;

    AnalyticsSnapshot out;
    out.market_id = market.id;
    out.parameters = config_;
    out.computed_at = input.now;
    out.total_volume = market.total_volume;
    out.event_count = input.events.size();

    out.primary_outcome_id = primary_outcome_id(market);
    out.implied_probability = implied_probability(market, out.primary_outcome_id);
    out.price = static_cast<int>(std::lround(out.implied_probability * 100.0));

    // Change against the daily snapshot
    if (input.daily_snapshot) {
        auto it = input.daily_snapshot->probabilities.find(out.primary_outcome_id);
        if (it != input.daily_snapshot->probabilities.end()) {
            out.change_24h = out.implied_probability - clamp01(it->second / 100.0);
        }
    }
    out.components.delta24h_norm =
        std::min(std::abs(out.change_24h), config_.delta_cap) / config_.delta_cap;

    // Stakes inside the volume window, weighted by the trader's track record
    WallClock since = input.now - std::chrono::milliseconds(config_.volume_window_ms);
    for (const auto& p : input.positions) {
        if (p.market_id != market.id || p.created_at < since) continue;
        auto it = input.user_accuracy.find(p.user_id);
        double acc = it != input.user_accuracy.end() ? it->second : 0.0;
        out.volume24h += p.stake_amount;
        out.informed_volume24h += p.stake_amount * (0.5 + acc * 0.5);
    }
    out.components.informed_volume24h_norm = log_norm(out.informed_volume24h, config_.volume_cap);

    double impact = 0.0;
    for (const auto& e : input.events) {
        impact += e.impact_estimate * e.confidence;
    }
    out.components.info_event_impact_norm = clamp01(impact);

    out.sentiment = sentiment_layers(input.events);
    out.components.sentiment_consensus_norm =
        clamp01((out.sentiment.expert + out.sentiment.institutional + out.sentiment.mass) / 3.0);

    double score = 100.0 * (config_.weight_delta * out.components.delta24h_norm +
                            config_.weight_volume * out.components.informed_volume24h_norm +
                            config_.weight_events * out.components.info_event_impact_norm +
                            config_.weight_sentiment * out.components.sentiment_consensus_norm);
    out.trend_score = std::clamp(static_cast<int>(std::lround(score)), 0, 100);

    out.sparkline = build_sparkline(input.intraday_samples, out.primary_outcome_id,
                                    out.implied_probability, input.now);
    out.catalyst_summary = catalyst_summary(input.events);

    out.scenario_bands.p10 = std::max(0.0, out.implied_probability - SCENARIO_BAND_WIDTH);
    out.scenario_bands.p50 = out.implied_probability;
    out.scenario_bands.p90 = std::min(1.0, out.implied_probability + SCENARIO_BAND_WIDTH);

    spdlog::debug("Analytics: market={} score={} delta={:.3f} vol={:.3f} events={:.3f} sent={:.3f}",
                  market.id, out.trend_score, out.components.delta24h_norm,
                  out.components.informed_volume24h_norm, out.components.info_event_impact_norm,
                  out.components.sentiment_consensus_norm);

    return out;
}

} // namespace fcast

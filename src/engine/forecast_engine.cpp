#include "engine/forecast_engine.hpp"
#include <cmath>
#include <set>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "pricing/probability_model.hpp"
#include "utils/uuid.hpp"

namespace fcast {

ForecastEngine::ForecastEngine(const Config& config, const Clock& clock, EngineDependencies deps)
    : config_(config)
    , clock_(clock)
    , repository_(deps.repository ? std::move(deps.repository)
                                   : std::make_shared<NullMarketRepository>())
    , journal_(std::move(deps.journal))
    , snapshot_store_(std::move(deps.snapshot_store))
    , feed_(deps.feed ? std::move(deps.feed) : std::make_shared<InMemorySignalFeed>())
    , store_(std::make_shared<MarketStore>())
    , wallet_(std::make_shared<LedgerWallet>(clock, journal_))
    , trend_(config.analytics)
    , cache_(static_cast<int64_t>(config.analytics.sparkline_points) *
             config.analytics.sparkline_resolution_ms)
{
    auto risk_store = deps.risk_store ? std::move(deps.risk_store)
                                      : std::make_shared<InMemoryRiskStateStore>();
    risk_ = std::make_shared<RiskControlEvaluator>(config.risk, risk_store, wallet_, clock_);
    executor_ = std::make_unique<TradeExecutor>(store_, wallet_, repository_, clock_, config.pricing);
    settler_ = std::make_unique<MarketSettler>(store_, wallet_, repository_, risk_, clock_);
}

// ============================================================================
// MARKETS
// ============================================================================

std::optional<Error> ForecastEngine::validate_spec(const MarketSpec& spec) const {
    if (spec.title.empty()) {
        return make_error(ErrorCode::INVALID_MARKET, "Market title is required");
    }
    if (spec.outcome_titles.size() < 2) {
        return make_error(ErrorCode::INVALID_MARKET, "A market needs at least two outcomes");
    }
    for (const auto& t : spec.outcome_titles) {
        if (t.empty()) {
            return make_error(ErrorCode::INVALID_MARKET, "Outcome titles must not be empty");
        }
    }

    if (!spec.outcome_ids.empty()) {
        if (spec.outcome_ids.size() != spec.outcome_titles.size()) {
            return make_error(ErrorCode::INVALID_MARKET,
                fmt::format("{} outcome ids for {} outcomes",
                            spec.outcome_ids.size(), spec.outcome_titles.size()));
        }
        std::set<std::string> seen;
        for (const auto& id : spec.outcome_ids) {
            if (id.empty() || !seen.insert(id).second) {
                return make_error(ErrorCode::INVALID_MARKET, "Outcome ids must be unique and non-empty");
            }
        }
    }

    if (!spec.initial_probabilities.empty()) {
        if (spec.initial_probabilities.size() != spec.outcome_titles.size()) {
            return make_error(ErrorCode::INVALID_MARKET,
                fmt::format("{} initial probabilities for {} outcomes",
                            spec.initial_probabilities.size(), spec.outcome_titles.size()));
        }
        for (double p : spec.initial_probabilities) {
            if (!std::isfinite(p) || p < 0.0 || p > 100.0) {
                return make_error(ErrorCode::INVALID_MARKET,
                    fmt::format("Initial probability {} out of range", p));
            }
        }
    }

    if (spec.liquidity && (!std::isfinite(*spec.liquidity) || *spec.liquidity <= 0.0)) {
        return make_error(ErrorCode::INVALID_MARKET, "Liquidity must be positive");
    }

    return std::nullopt;
}

MarketResult ForecastEngine::create_market(const MarketSpec& spec) {
    MarketResult result;

    if (auto err = validate_spec(spec)) {
        result.error = *err;
        spdlog::debug("Market rejected: {}", result.error.message);
        return result;
    }

    Market market;
    market.id = spec.id.empty() ? generate_uuid() : spec.id;
    market.title = spec.title;
    market.description = spec.description;
    market.category = spec.category;
    market.status = MarketStatus::ACTIVE;
    market.liquidity = spec.liquidity.value_or(config_.pricing.default_liquidity);
    market.created_at = clock_.now();
    market.close_date = spec.close_date;

    for (size_t i = 0; i < spec.outcome_titles.size(); i++) {
        Outcome o;
        o.id = spec.outcome_ids.empty() ? generate_uuid() : spec.outcome_ids[i];
        o.title = spec.outcome_titles[i];
        market.outcomes.push_back(o);
    }

    std::unique_ptr<ProbabilityModel> model;
    if (spec.initial_probabilities.empty()) {
        model = std::make_unique<RiskWeightedLmsr>(market.outcomes.size(), market.liquidity,
                                                   config_.pricing);
    } else {
        model = RiskWeightedLmsr::seeded(spec.initial_probabilities, market.liquidity,
                                         config_.pricing);
    }
    refresh_outcomes(market, model->current_probability());

    std::lock_guard<std::mutex> lock(create_mutex_);
    if (store_->contains(market.id)) {
        result.error = make_error(ErrorCode::INVALID_MARKET,
                                  fmt::format("Market {} already exists", market.id));
        return result;
    }

    repository_->save_market(market, model->state());
    store_->insert(MarketState(market, std::move(model)));
    cache_.record_sample(market, market.created_at);

    spdlog::info("Market created: {} \"{}\" ({} outcomes, b={:.1f})",
                 market.id, market.title, market.outcomes.size(), market.liquidity);

    result.ok = true;
    result.market = std::move(market);
    return result;
}

std::optional<MarketSnapshot> ForecastEngine::market(const std::string& market_id) const {
    return store_->snapshot(market_id);
}

std::vector<MarketSnapshot> ForecastEngine::markets() const {
    return store_->snapshot_all();
}

// ============================================================================
// TRADING
// ============================================================================

TradeResult ForecastEngine::place_trade(const TradeRequest& request) {
    TradeResult result;

    if (!(request.stake > 0.0) || !std::isfinite(request.stake)) {
        result.error = make_error(ErrorCode::INVALID_STAKE, "Stake must be a positive amount");
        return result;
    }
    auto snap = store_->snapshot(request.market_id);
    if (!snap) {
        result.error = make_error(ErrorCode::MARKET_NOT_FOUND,
                                  fmt::format("Market {} not found", request.market_id));
        return result;
    }
    // Trade validation is reported ahead of risk blocks. The executor checks
    // again under the market lock in case the market settles in between.
    if (!snap->market.is_active()) {
        result.error = make_error(ErrorCode::MARKET_INACTIVE,
            fmt::format("Market {} is {}", request.market_id,
                        market_status_to_string(snap->market.status)));
        return result;
    }
    if (!snap->market.find_outcome(request.outcome_id)) {
        result.error = make_error(ErrorCode::OUTCOME_NOT_FOUND,
            fmt::format("Outcome {} not in market {}", request.outcome_id, request.market_id));
        return result;
    }

    RiskEvaluation eval = risk_->admit(request.user_id, request.stake, [&] {
        result = executor_->execute(request);
        return result.ok;
    });

    if (!eval.allowed) {
        result = TradeResult{};
        result.error = make_error(ErrorCode::RISK_BLOCKED, eval.blocked.front());
        result.error.details = eval.blocked;
        return result;
    }

    result.warnings = eval.warnings;
    if (result.ok) {
        if (auto after = store_->snapshot(request.market_id)) {
            cache_.record_sample(after->market, clock_.now());
        }
    }
    return result;
}

std::optional<TradeBreakdown> ForecastEngine::quote(const std::string& market_id,
                                                    const std::string& outcome_id,
                                                    Amount stake) const {
    return executor_->quote(market_id, outcome_id, stake);
}

ResolutionResult ForecastEngine::resolve_market(const std::string& market_id,
                                                const std::string& winning_outcome_id) {
    return settler_->resolve(market_id, winning_outcome_id);
}

ResolutionResult ForecastEngine::void_market(const std::string& market_id) {
    return settler_->void_market(market_id);
}

RiskEvaluation ForecastEngine::evaluate_risk(const std::string& user_id, Amount amount) {
    return risk_->evaluate(user_id, amount);
}

// ============================================================================
// ANALYTICS
// ============================================================================

std::optional<AnalyticsSnapshot> ForecastEngine::compute_analytics(const std::string& market_id) const {
    auto snap = store_->snapshot(market_id);
    if (!snap) {
        return std::nullopt;
    }

    // Track records span every market
    std::vector<Position> all_positions;
    for (const auto& s : store_->snapshot_all()) {
        all_positions.insert(all_positions.end(), s.positions.begin(), s.positions.end());
    }

    AnalyticsInput input;
    input.market = snap->market;
    input.positions = snap->positions;
    input.user_accuracy = TrendEngine::user_accuracy(all_positions);
    input.daily_snapshot = cache_.latest_daily(market_id);
    input.intraday_samples = cache_.samples(market_id);
    input.events = feed_->events_for_market(market_id);
    input.now = clock_.now();

    return trend_.compute(input);
}

std::vector<DailySnapshot> ForecastEngine::capture_daily_snapshots() {
    std::vector<DailySnapshot> captured;
    WallClock now = clock_.now();

    for (const auto& snap : store_->snapshot_all()) {
        DailySnapshot daily = cache_.capture_daily(snap.market, now);
        if (snapshot_store_ && config_.storage.persist_enabled) {
            snapshot_store_->save_daily_snapshot(daily);
        }
        captured.push_back(std::move(daily));
    }

    spdlog::info("Captured {} daily snapshots", captured.size());
    return captured;
}

// ============================================================================
// RECOVERY
// ============================================================================

std::unique_ptr<ProbabilityModel> ForecastEngine::restore_model(const StoredMarket& stored) const {
    if (!stored.model_state.is_null()) {
        return RiskWeightedLmsr::from_state(stored.model_state, config_.pricing);
    }

    // No saved accumulators: reseed from the last reported probabilities
    spdlog::warn("Market {} has no model state, reseeding from outcome probabilities",
                 stored.market.id);
    std::vector<double> seeds;
    for (const auto& o : stored.market.outcomes) {
        seeds.push_back(o.probability / 100.0);
    }
    return RiskWeightedLmsr::seeded(seeds, stored.market.liquidity, config_.pricing);
}

size_t ForecastEngine::restore() {
    size_t loaded = 0;

    for (auto& stored : repository_->load_markets()) {
        if (stored.market.outcomes.size() < 2) {
            throw ConsistencyViolation(fmt::format("stored market {} has {} outcomes",
                                                   stored.market.id, stored.market.outcomes.size()));
        }
        auto model = restore_model(stored);
        if (model->outcome_count() != stored.market.outcomes.size()) {
            throw ConsistencyViolation(fmt::format("stored market {} model has {} outcomes, market {}",
                                                   stored.market.id, model->outcome_count(),
                                                   stored.market.outcomes.size()));
        }

        if (store_->insert(MarketState(stored.market, std::move(model), std::move(stored.positions)))) {
            loaded++;
        }
    }

    if (journal_) {
        wallet_->restore(journal_->load_ledger_entries());
    }
    if (snapshot_store_) {
        cache_.restore_daily(snapshot_store_->load_daily_snapshots());
    }

    spdlog::info("Restored {} markets", loaded);
    return loaded;
}

} // namespace fcast

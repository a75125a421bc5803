#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "analytics/signal_feed.hpp"
#include "analytics/snapshot_cache.hpp"
#include "analytics/trend_engine.hpp"
#include "common/errors.hpp"
#include "common/types.hpp"
#include "config/config.hpp"
#include "execution/trade_executor.hpp"
#include "ledger/wallet.hpp"
#include "market/market_repository.hpp"
#include "market/market_store.hpp"
#include "risk/risk_controls.hpp"
#include "settlement/market_settler.hpp"
#include "utils/clock.hpp"

namespace fcast {

/**
 * Collaborators of the engine. Anything left null gets an in-memory
 * default (no persistence, empty feed).
 */
struct EngineDependencies {
    std::shared_ptr<MarketRepository> repository;
    std::shared_ptr<RiskStateStore> risk_store;
    std::shared_ptr<LedgerJournal> journal;
    std::shared_ptr<SnapshotStore> snapshot_store;
    std::shared_ptr<SignalFeed> feed;
};

struct MarketResult {
    bool ok{false};
    Error error;
    Market market;
};

/**
 * Forecast engine
 *
 * Wires the data flow of the marketplace core:
 *   trade request -> risk admission -> trade executor -> wallet + repository
 *   resolution    -> market settler -> wallet + repository -> risk bookkeeping
 *   analytics     -> store + snapshot cache + signal feed -> trend engine
 *
 * Analytics only read; nothing they compute feeds back into pricing.
 */
class ForecastEngine {
public:
    ForecastEngine(const Config& config, const Clock& clock, EngineDependencies deps = {});

    // Errors: INVALID_MARKET
    MarketResult create_market(const MarketSpec& spec);

    /**
     * Validate, admit against the user's risk controls and execute. A
     * blocked trade returns RISK_BLOCKED with every violated policy in
     * error.details and changes nothing.
     */
    TradeResult place_trade(const TradeRequest& request);

    std::optional<TradeBreakdown> quote(const std::string& market_id,
                                        const std::string& outcome_id,
                                        Amount stake) const;

    ResolutionResult resolve_market(const std::string& market_id, const std::string& winning_outcome_id);
    ResolutionResult void_market(const std::string& market_id);

    RiskEvaluation evaluate_risk(const std::string& user_id, Amount amount);

    std::optional<AnalyticsSnapshot> compute_analytics(const std::string& market_id) const;

    // Capture today's snapshot of every market; persisted when a store is attached
    std::vector<DailySnapshot> capture_daily_snapshots();

    // Reload markets, ledger balances and daily snapshots. Returns markets loaded.
    size_t restore();

    std::optional<MarketSnapshot> market(const std::string& market_id) const;
    std::vector<MarketSnapshot> markets() const;

    RiskControlEvaluator& risk() { return *risk_; }
    LedgerWallet& wallet() { return *wallet_; }
    MarketStore& store() { return *store_; }
    SnapshotCache& snapshots() { return cache_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    const Clock& clock_;

    std::shared_ptr<MarketRepository> repository_;
    std::shared_ptr<LedgerJournal> journal_;
    std::shared_ptr<SnapshotStore> snapshot_store_;
    std::shared_ptr<SignalFeed> feed_;

    std::shared_ptr<MarketStore> store_;
    std::shared_ptr<LedgerWallet> wallet_;
    std::shared_ptr<RiskControlEvaluator> risk_;
    std::unique_ptr<TradeExecutor> executor_;
    std::unique_ptr<MarketSettler> settler_;
    TrendEngine trend_;
    SnapshotCache cache_;

    // Serializes create_market so an id is checked, persisted and inserted once
    std::mutex create_mutex_;

    std::optional<Error> validate_spec(const MarketSpec& spec) const;
    std::unique_ptr<ProbabilityModel> restore_model(const StoredMarket& stored) const;
};

} // namespace fcast

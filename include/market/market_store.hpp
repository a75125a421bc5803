#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>
#include "common/types.hpp"
#include "pricing/probability_model.hpp"

namespace fcast {

/**
 * Everything owned by one market: its record, its probability model and
 * its positions.
 */
struct MarketState {
    Market market;
    std::unique_ptr<ProbabilityModel> model;
    std::vector<Position> positions;

    MarketState() = default;
    MarketState(Market m, std::unique_ptr<ProbabilityModel> mdl, std::vector<Position> pos = {})
        : market(std::move(m)), model(std::move(mdl)), positions(std::move(pos)) {}

    // Deep copy, model included
    MarketState copy() const;
};

/**
 * Read-only copy of a market taken under its lock.
 */
struct MarketSnapshot {
    Market market;
    std::vector<Position> positions;
    std::vector<Probability> probabilities;   // Reported, one per outcome
};

/**
 * Set outcome probabilities (integer %) from reported model probabilities and
 * recompute the display-only stake shares.
 */
void refresh_outcomes(Market& market, const std::vector<Probability>& probabilities);

/**
 * Keyed store of per-market state.
 *
 * Each market has its own mutex; operations on different markets never
 * contend. The map itself sits behind a shared mutex taken exclusively only
 * to insert.
 */
class MarketStore {
public:
    MarketStore() = default;

    // False if a market with this id already exists
    bool insert(MarketState state);

    bool contains(const std::string& market_id) const;
    size_t size() const;

    /**
     * Run fn with exclusive access to one market. Returns false if the market
     * is unknown. Exceptions from fn propagate with the lock released.
     */
    bool with_market(const std::string& market_id, const std::function<void(MarketState&)>& fn);

    std::optional<MarketSnapshot> snapshot(const std::string& market_id) const;
    std::vector<MarketSnapshot> snapshot_all() const;

private:
    struct Slot {
        std::mutex mutex;
        MarketState state;
    };

    mutable std::shared_mutex map_mutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;

    std::shared_ptr<Slot> find_slot(const std::string& market_id) const;
    static MarketSnapshot make_snapshot(const MarketState& state);
};

} // namespace fcast

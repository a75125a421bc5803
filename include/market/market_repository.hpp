#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace fcast {

/**
 * Market as loaded back from durable storage.
 */
struct StoredMarket {
    Market market;
    std::vector<Position> positions;
    nlohmann::json model_state;
};

/**
 * Durable record of markets, outcomes and positions.
 *
 * Each save is one transaction: it either commits entirely or throws
 * std::runtime_error leaving storage untouched.
 */
class MarketRepository {
public:
    virtual ~MarketRepository() = default;

    virtual void save_market(const Market& market, const nlohmann::json& model_state) = 0;

    // Updated market (outcome stakes, volume, probabilities), new position and model state
    virtual void save_trade(const Market& market, const Position& position,
                            const nlohmann::json& model_state) = 0;

    // Terminal market state plus every position that changed status
    virtual void save_resolution(const Market& market, const std::vector<Position>& positions) = 0;

    virtual std::vector<StoredMarket> load_markets() = 0;
};

/**
 * Repository that keeps nothing. Used when persistence is disabled.
 */
class NullMarketRepository final : public MarketRepository {
public:
    void save_market(const Market&, const nlohmann::json&) override {}
    void save_trade(const Market&, const Position&, const nlohmann::json&) override {}
    void save_resolution(const Market&, const std::vector<Position>&) override {}
    std::vector<StoredMarket> load_markets() override { return {}; }
};

} // namespace fcast

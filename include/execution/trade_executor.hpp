#pragma once

#include <memory>
#include <vector>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "config/config.hpp"
#include "ledger/wallet.hpp"
#include "market/market_repository.hpp"
#include "market/market_store.hpp"
#include "pricing/trade_pricer.hpp"
#include "utils/clock.hpp"

namespace fcast {

struct TradeResult {
    bool ok{false};
    Error error;

    Position position;
    TradeBreakdown breakdown;
    std::vector<int> probabilities;   // Post-trade, per outcome, integer %
    Amount market_volume{0.0};
    std::vector<std::string> warnings;   // Risk warnings; the trade still went through
};

/**
 * Places trades as one atomic unit per market: pricing, model update,
 * outcome stake, market volume, position, wallet debit and persistence.
 *
 * All work happens on a copy of the market state under the market's lock;
 * the copy replaces the live state only after the wallet debit and the
 * repository write both succeed.
 */
class TradeExecutor {
public:
    TradeExecutor(std::shared_ptr<MarketStore> store,
                  std::shared_ptr<Wallet> wallet,
                  std::shared_ptr<MarketRepository> repository,
                  const Clock& clock,
                  const PricingConfig& config);

    /**
     * Errors: MARKET_NOT_FOUND, INVALID_STAKE, MARKET_INACTIVE,
     * OUTCOME_NOT_FOUND, INSUFFICIENT_BALANCE. Repository failures throw
     * std::runtime_error after the debit has been reversed.
     */
    TradeResult execute(const TradeRequest& request);

    // Price without placing, at the current probability
    std::optional<TradeBreakdown> quote(const std::string& market_id,
                                        const std::string& outcome_id,
                                        Amount stake) const;

    const PricingConfig& config() const { return config_; }

private:
    std::shared_ptr<MarketStore> store_;
    std::shared_ptr<Wallet> wallet_;
    std::shared_ptr<MarketRepository> repository_;
    const Clock& clock_;
    PricingConfig config_;
};

} // namespace fcast

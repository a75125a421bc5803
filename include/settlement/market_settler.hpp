#pragma once

#include <memory>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "ledger/wallet.hpp"
#include "market/market_repository.hpp"
#include "market/market_store.hpp"
#include "risk/risk_controls.hpp"
#include "utils/clock.hpp"

namespace fcast {

struct ResolutionResult {
    bool ok{false};
    Error error;

    Market market;                   // Terminal state
    std::vector<Position> settled;   // Positions moved to a terminal status

    int winners{0};
    int losers{0};
    int refunded{0};
    Amount total_payout{0.0};        // Credited to winners
    Amount total_refund{0.0};        // Loss rebates and void refunds
    Amount platform_revenue{0.0};
};

/**
 * Moves a market to its terminal state and settles every active position.
 *
 * Settlement is computed on a copy under the market's lock and checked. The
 * credits are then paid and the resolution written in one repository
 * transaction; if either fails, credits already paid are reversed and the
 * market is left as it was. Only then is the copy swapped in. Risk
 * bookkeeping runs after the market lock is released.
 */
class MarketSettler {
public:
    MarketSettler(std::shared_ptr<MarketStore> store,
                  std::shared_ptr<Wallet> wallet,
                  std::shared_ptr<MarketRepository> repository,
                  std::shared_ptr<RiskControlEvaluator> risk,
                  const Clock& clock);

    /**
     * Errors: MARKET_NOT_FOUND, MARKET_ALREADY_RESOLVED, MARKET_INACTIVE
     * (voided market), INVALID_WINNING_OUTCOME. Throws ConsistencyViolation
     * if the settled state fails verification; nothing is committed then.
     */
    ResolutionResult resolve(const std::string& market_id, const std::string& winning_outcome_id);

    /**
     * Close an active market without a winner and refund every active
     * position in full.
     */
    ResolutionResult void_market(const std::string& market_id);

    // Throws ConsistencyViolation describing the first broken invariant
    static void verify_settlement(const Market& market, const std::vector<Position>& positions);

private:
    std::shared_ptr<MarketStore> store_;
    std::shared_ptr<Wallet> wallet_;
    std::shared_ptr<MarketRepository> repository_;
    std::shared_ptr<RiskControlEvaluator> risk_;
    const Clock& clock_;

    void commit(MarketState& state, MarketState& next, ResolutionResult& result);

    // Throws ConsistencyViolation if a credit cannot be taken back
    void reverse_credits(const std::vector<const Position*>& credited);

    static LedgerEntryType credit_type(const Position& pos);
};

} // namespace fcast

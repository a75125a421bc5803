#pragma once

#include <string>
#include "common/types.hpp"

namespace fcast {

/**
 * Payouts for a single trade at the probability in force when it was placed.
 *
 * Win branch: the trader gets the stake back plus the risked portion
 * stake * (1 - p), minus the platform fee on that portion.
 * Loss branch: only the risked portion is lost; the rest is rebated.
 */
struct TradeBreakdown {
    Amount stake{0.0};
    Probability probability{0.0};   // Normalized to [0, 1]
    double fee_rate{0.0};

    // Win branch
    Amount win_profit{0.0};
    Amount win_return{0.0};         // stake + win_profit
    double win_return_pct{0.0};     // win_return / stake * 100
    Amount platform_revenue{0.0};   // Earned only if the trade wins

    // Loss branch
    Amount loss_amount{0.0};        // stake * (1 - p)
    Amount loss_refund{0.0};        // stake - loss_amount
    double loss_return_pct{0.0};    // loss_refund / stake * 100

    double risk_reward{0.0};        // loss_amount / win_profit, 0 when nothing can be won
};

struct SettlementAmount {
    Amount total_return{0.0};       // Credited to the trader
    Amount net{0.0};                // total_return - stake
    Amount platform_revenue{0.0};
};

/**
 * Read values above 1 as percentages; clamp the result into [0, 1].
 */
Probability normalize_probability(double p);

/**
 * Price a trade. Stake must be positive and finite, fee in [0, 1].
 * Throws std::invalid_argument otherwise.
 */
TradeBreakdown price_trade(Amount stake, double probability_at_entry, double fee_rate);

/**
 * Resolve one branch of a priced trade.
 */
SettlementAmount settle(const TradeBreakdown& breakdown, bool did_win);

/**
 * "1:x" form of the risk/reward ratio, x with two decimals; "-" when the
 * trade cannot profit.
 */
std::string format_risk_reward(const TradeBreakdown& breakdown);

} // namespace fcast

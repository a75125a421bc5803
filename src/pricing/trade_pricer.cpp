#include "pricing/trade_pricer.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>

namespace fcast {

Probability normalize_probability(double p) {
    if (!std::isfinite(p)) {
        throw std::invalid_argument("Probability must be finite");
    }
    if (p > 1.0) p /= 100.0;
    return std::clamp(p, 0.0, 1.0);
}

TradeBreakdown price_trade(Amount stake, double probability_at_entry, double fee_rate) {
    if (!(stake > 0.0) || !std::isfinite(stake)) {
        throw std::invalid_argument("Stake must be positive and finite");
    }
    if (!(fee_rate >= 0.0 && fee_rate <= 1.0)) {
        throw std::invalid_argument("Fee rate must be in [0, 1]");
    }

    TradeBreakdown b;
    b.stake = stake;
    b.probability = normalize_probability(probability_at_entry);
    b.fee_rate = fee_rate;

    double risked = stake * (1.0 - b.probability);

    b.win_profit = risked * (1.0 - fee_rate);
    b.win_return = stake + b.win_profit;
    b.platform_revenue = risked * fee_rate;
    b.win_return_pct = b.win_return / stake * 100.0;

    b.loss_amount = risked;
    b.loss_refund = stake - b.loss_amount;
    b.loss_return_pct = b.loss_refund / stake * 100.0;

    b.risk_reward = b.win_profit > 0.0 ? b.loss_amount / b.win_profit : 0.0;

    return b;
}

SettlementAmount settle(const TradeBreakdown& breakdown, bool did_win) {
    SettlementAmount s;
    if (did_win) {
        s.total_return = breakdown.win_return;
        s.platform_revenue = breakdown.platform_revenue;
    } else {
        s.total_return = breakdown.loss_refund;
    }
    s.net = s.total_return - breakdown.stake;
    return s;
}

std::string format_risk_reward(const TradeBreakdown& breakdown) {
    if (breakdown.win_profit <= 0.0) return "-";
    return fmt::format("1:{:.2f}", breakdown.risk_reward);
}

} // namespace fcast

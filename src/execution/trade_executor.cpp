#include "execution/trade_executor.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "utils/uuid.hpp"

namespace fcast {

namespace {

// Outcome stakes must add up to the market volume
void verify_volume(const Market& market) {
    Amount sum = 0.0;
    for (const auto& o : market.outcomes) {
        sum += o.total_stake;
    }
    if (std::abs(sum - market.total_volume) > 1e-6 * std::max(1.0, market.total_volume)) {
        throw ConsistencyViolation(fmt::format(
            "market {} outcome stakes ${:.6f} != volume ${:.6f}",
            market.id, sum, market.total_volume));
    }
}

} // namespace

TradeExecutor::TradeExecutor(std::shared_ptr<MarketStore> store,
                             std::shared_ptr<Wallet> wallet,
                             std::shared_ptr<MarketRepository> repository,
                             const Clock& clock,
                             const PricingConfig& config)
    : store_(std::move(store))
    , wallet_(std::move(wallet))
    , repository_(std::move(repository))
    , clock_(clock)
    , config_(config)
{
}

TradeResult TradeExecutor::execute(const TradeRequest& request) {
    TradeResult result;

    bool found = store_->with_market(request.market_id, [&](MarketState& state) {
        if (!(request.stake > 0.0) || !std::isfinite(request.stake)) {
            result.error = make_error(ErrorCode::INVALID_STAKE, "Stake must be a positive amount");
            return;
        }

        if (!state.market.is_active()) {
            result.error = make_error(ErrorCode::MARKET_INACTIVE,
                fmt::format("Market {} is {}", state.market.id,
                            market_status_to_string(state.market.status)));
            return;
        }

        int idx = state.market.outcome_index(request.outcome_id);
        if (idx < 0) {
            result.error = make_error(ErrorCode::OUTCOME_NOT_FOUND,
                fmt::format("Outcome {} not in market {}", request.outcome_id, state.market.id));
            return;
        }
        size_t outcome = static_cast<size_t>(idx);

        // Price at the pre-trade reported probability
        Probability p_entry = state.model->current_probability()[outcome];
        auto breakdown = price_trade(request.stake, p_entry, config_.platform_fee);

        Position pos;
        pos.id = generate_uuid();
        pos.market_id = state.market.id;
        pos.outcome_id = request.outcome_id;
        pos.user_id = request.user_id;
        pos.stake_amount = request.stake;
        pos.odds_at_prediction = p_entry * 100.0;
        pos.potential_return = breakdown.win_return;
        pos.loss_refund = breakdown.loss_refund;
        pos.platform_fee = breakdown.platform_revenue;
        pos.status = PositionStatus::ACTIVE;
        pos.created_at = clock_.now();

        MarketState next = state.copy();
        auto new_probs = next.model->apply_stake(outcome, request.stake);
        next.market.outcomes[outcome].total_stake += request.stake;
        next.market.total_volume += request.stake;
        refresh_outcomes(next.market, new_probs);
        next.positions.push_back(pos);

        verify_volume(next.market);

        if (!wallet_->debit(request.user_id, request.stake, LedgerEntryType::STAKE, pos.id)) {
            result.error = make_error(ErrorCode::INSUFFICIENT_BALANCE,
                fmt::format("Insufficient balance for ${:.2f} stake", request.stake));
            return;
        }

        try {
            repository_->save_trade(next.market, pos, next.model->state());
        } catch (const std::exception& e) {
            spdlog::error("Trade persist failed for market {}: {}, reversing debit",
                          state.market.id, e.what());
            wallet_->credit(request.user_id, request.stake, LedgerEntryType::REFUND, pos.id);
            throw;
        }

        state = std::move(next);

        result.ok = true;
        result.position = pos;
        result.breakdown = breakdown;
        result.probabilities = to_percentages(new_probs);
        result.market_volume = state.market.total_volume;
    });

    if (!found) {
        result.error = make_error(ErrorCode::MARKET_NOT_FOUND,
            fmt::format("Market {} not found", request.market_id));
    }

    if (result.ok) {
        spdlog::info("Trade placed: market={} outcome={} user={} stake=${:.2f} p={:.1f}% "
                     "win_return=${:.2f} loss_refund=${:.2f}",
                     request.market_id, request.outcome_id, request.user_id, request.stake,
                     result.position.odds_at_prediction, result.position.potential_return,
                     result.position.loss_refund);
    } else {
        spdlog::debug("Trade rejected: market={} user={} {}: {}",
                      request.market_id, request.user_id,
                      error_code_to_string(result.error.code), result.error.message);
    }

    return result;
}

std::optional<TradeBreakdown> TradeExecutor::quote(const std::string& market_id,
                                                   const std::string& outcome_id,
                                                   Amount stake) const {
    auto snap = store_->snapshot(market_id);
    if (!snap) {
        return std::nullopt;
    }
    int idx = snap->market.outcome_index(outcome_id);
    if (idx < 0 || !(stake > 0.0) || !std::isfinite(stake)) {
        return std::nullopt;
    }
    return price_trade(stake, snap->probabilities[static_cast<size_t>(idx)], config_.platform_fee);
}

} // namespace fcast

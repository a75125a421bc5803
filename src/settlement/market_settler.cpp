#include "settlement/market_settler.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fcast {

namespace {

constexpr double AMOUNT_EPSILON = 1e-9;

bool nearly_equal(Amount a, Amount b) {
    return std::abs(a - b) <= AMOUNT_EPSILON * std::max({1.0, std::abs(a), std::abs(b)});
}

} // namespace

MarketSettler::MarketSettler(std::shared_ptr<MarketStore> store,
                             std::shared_ptr<Wallet> wallet,
                             std::shared_ptr<MarketRepository> repository,
                             std::shared_ptr<RiskControlEvaluator> risk,
                             const Clock& clock)
    : store_(std::move(store))
    , wallet_(std::move(wallet))
    , repository_(std::move(repository))
    , risk_(std::move(risk))
    , clock_(clock)
{
}

void MarketSettler::verify_settlement(const Market& market, const std::vector<Position>& positions) {
    if (market.status == MarketStatus::RESOLVED && market.winning_outcome_id.empty()) {
        throw ConsistencyViolation(fmt::format("market {} resolved without a winner", market.id));
    }
    if (market.status != MarketStatus::RESOLVED && !market.winning_outcome_id.empty()) {
        throw ConsistencyViolation(fmt::format("market {} has a winner but is {}",
                                               market.id, market_status_to_string(market.status)));
    }

    Amount winners_actual = 0.0, winners_potential = 0.0;
    Amount losers_actual = 0.0, losers_refund = 0.0;
    Amount refunded_actual = 0.0, refunded_stake = 0.0;

    for (const auto& pos : positions) {
        switch (pos.status) {
            case PositionStatus::ACTIVE:
                throw ConsistencyViolation(fmt::format(
                    "position {} still active in settled market {}", pos.id, market.id));
            case PositionStatus::WON:
                winners_actual += pos.actual_return;
                winners_potential += pos.potential_return;
                break;
            case PositionStatus::LOST:
                losers_actual += pos.actual_return;
                losers_refund += pos.loss_refund;
                break;
            case PositionStatus::REFUNDED:
                refunded_actual += pos.actual_return;
                refunded_stake += pos.stake_amount;
                break;
        }
    }

    if (!nearly_equal(winners_actual, winners_potential)) {
        throw ConsistencyViolation(fmt::format(
            "market {} winners paid ${:.6f}, expected ${:.6f}", market.id, winners_actual, winners_potential));
    }
    if (!nearly_equal(losers_actual, losers_refund)) {
        throw ConsistencyViolation(fmt::format(
            "market {} losers refunded ${:.6f}, expected ${:.6f}", market.id, losers_actual, losers_refund));
    }
    if (!nearly_equal(refunded_actual, refunded_stake)) {
        throw ConsistencyViolation(fmt::format(
            "market {} void refunds ${:.6f}, expected ${:.6f}", market.id, refunded_actual, refunded_stake));
    }
}

LedgerEntryType MarketSettler::credit_type(const Position& pos) {
    return pos.status == PositionStatus::WON ? LedgerEntryType::PAYOUT : LedgerEntryType::REFUND;
}

void MarketSettler::reverse_credits(const std::vector<const Position*>& credited) {
    for (auto it = credited.rbegin(); it != credited.rend(); ++it) {
        const Position& pos = **it;
        bool reversed = false;
        try {
            reversed = wallet_->debit(pos.user_id, pos.actual_return, LedgerEntryType::REVERSAL, pos.id);
        } catch (const std::exception& e) {
            spdlog::critical("Reversal of {} for {} failed: {}", pos.id, pos.user_id, e.what());
        }
        if (!reversed) {
            throw ConsistencyViolation(fmt::format(
                "settlement credit ${:.6f} to {} for position {} could not be reversed",
                pos.actual_return, pos.user_id, pos.id));
        }
    }
}

void MarketSettler::commit(MarketState& state, MarketState& next, ResolutionResult& result) {
    try {
        verify_settlement(next.market, next.positions);
    } catch (const ConsistencyViolation& e) {
        spdlog::critical("{}", e.what());
        throw;
    }

    // Credits and the stored resolution land together or not at all
    std::vector<const Position*> credited;
    credited.reserve(result.settled.size());
    try {
        for (const auto& pos : result.settled) {
            if (pos.actual_return <= 0.0) continue;
            wallet_->credit(pos.user_id, pos.actual_return, credit_type(pos), pos.id);
            credited.push_back(&pos);
        }
        repository_->save_resolution(next.market, result.settled);
    } catch (const std::exception& e) {
        spdlog::error("Settlement of market {} failed after {} of {} credits: {}, reversing",
                      next.market.id, credited.size(), result.settled.size(), e.what());
        reverse_credits(credited);
        throw;
    }

    state = std::move(next);

    result.ok = true;
    result.market = state.market;
}

ResolutionResult MarketSettler::resolve(const std::string& market_id,
                                        const std::string& winning_outcome_id) {
    ResolutionResult result;

    bool found = store_->with_market(market_id, [&](MarketState& state) {
        if (state.market.status == MarketStatus::RESOLVED) {
            result.error = make_error(ErrorCode::MARKET_ALREADY_RESOLVED,
                fmt::format("Market {} already resolved to {}", market_id, state.market.winning_outcome_id));
            return;
        }
        if (state.market.status != MarketStatus::ACTIVE) {
            result.error = make_error(ErrorCode::MARKET_INACTIVE,
                fmt::format("Market {} is {}", market_id, market_status_to_string(state.market.status)));
            return;
        }
        if (!state.market.find_outcome(winning_outcome_id)) {
            result.error = make_error(ErrorCode::INVALID_WINNING_OUTCOME,
                fmt::format("Outcome {} not in market {}", winning_outcome_id, market_id));
            return;
        }

        WallClock now = clock_.now();
        MarketState next = state.copy();
        next.market.status = MarketStatus::RESOLVED;
        next.market.winning_outcome_id = winning_outcome_id;
        next.market.resolution_date = now;

        for (auto& pos : next.positions) {
            if (pos.status != PositionStatus::ACTIVE) continue;

            if (pos.outcome_id == winning_outcome_id) {
                pos.status = PositionStatus::WON;
                pos.actual_return = pos.potential_return;
                result.winners++;
                result.total_payout += pos.actual_return;
                result.platform_revenue += pos.platform_fee;
            } else {
                pos.status = PositionStatus::LOST;
                pos.actual_return = pos.loss_refund;
                result.losers++;
                result.total_refund += pos.actual_return;
            }
            pos.resolved_at = now;
            result.settled.push_back(pos);
        }

        commit(state, next, result);
    });

    if (!found) {
        result.error = make_error(ErrorCode::MARKET_NOT_FOUND, fmt::format("Market {} not found", market_id));
    }

    if (!result.ok) {
        spdlog::warn("Resolve rejected: market={} {}: {}", market_id,
                     error_code_to_string(result.error.code), result.error.message);
        return result;
    }

    spdlog::info("Market resolved: {} winner={} winners={} losers={} payout=${:.2f} "
                 "refunds=${:.2f} revenue=${:.2f}",
                 market_id, winning_outcome_id, result.winners, result.losers,
                 result.total_payout, result.total_refund, result.platform_revenue);

    // Market lock released; user locks are safe to take now
    if (risk_) {
        for (const auto& pos : result.settled) {
            risk_->record_resolution(pos.user_id, pos.odds_at_prediction,
                                     pos.status == PositionStatus::WON);
        }
    }

    return result;
}

ResolutionResult MarketSettler::void_market(const std::string& market_id) {
    ResolutionResult result;

    bool found = store_->with_market(market_id, [&](MarketState& state) {
        if (state.market.status == MarketStatus::RESOLVED) {
            result.error = make_error(ErrorCode::MARKET_ALREADY_RESOLVED,
                fmt::format("Market {} already resolved", market_id));
            return;
        }
        if (state.market.status != MarketStatus::ACTIVE) {
            result.error = make_error(ErrorCode::MARKET_INACTIVE,
                fmt::format("Market {} is {}", market_id, market_status_to_string(state.market.status)));
            return;
        }

        WallClock now = clock_.now();
        MarketState next = state.copy();
        next.market.status = MarketStatus::CLOSED;
        next.market.resolution_date = now;

        for (auto& pos : next.positions) {
            if (pos.status != PositionStatus::ACTIVE) continue;
            pos.status = PositionStatus::REFUNDED;
            pos.actual_return = pos.stake_amount;
            pos.resolved_at = now;
            result.refunded++;
            result.total_refund += pos.actual_return;
            result.settled.push_back(pos);
        }

        commit(state, next, result);
    });

    if (!found) {
        result.error = make_error(ErrorCode::MARKET_NOT_FOUND, fmt::format("Market {} not found", market_id));
    }

    if (result.ok) {
        spdlog::info("Market voided: {} refunded={} total=${:.2f}",
                     market_id, result.refunded, result.total_refund);
    } else {
        spdlog::warn("Void rejected: market={} {}: {}", market_id,
                     error_code_to_string(result.error.code), result.error.message);
    }

    return result;
}

} // namespace fcast

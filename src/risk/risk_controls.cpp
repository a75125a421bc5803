#include "risk/risk_controls.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "utils/time_utils.hpp"

namespace fcast {

// ============================================================================
// JSON
// ============================================================================

void to_json(nlohmann::json& j, const UserRiskState& s) {
    nlohmann::json calibration = nlohmann::json::object();
    for (const auto& [bucket, data] : s.calibration) {
        calibration[std::to_string(bucket)] = {{"total", data.total}, {"correct", data.correct}};
    }

    j = nlohmann::json{
        {"user_id", s.user_id},
        {"daily_limit", s.daily_limit ? nlohmann::json(*s.daily_limit) : nlohmann::json(nullptr)},
        {"weekly_limit", s.weekly_limit ? nlohmann::json(*s.weekly_limit) : nlohmann::json(nullptr)},
        {"daily_spent", s.daily_spent},
        {"weekly_spent", s.weekly_spent},
        {"last_daily_reset", s.last_daily_reset},
        {"last_weekly_reset", s.last_weekly_reset},
        {"observe_only", s.observe_only},
        {"trading_paused", s.trading_paused},
        {"recent_trades", s.recent_trades},
        {"last_loss_time", s.last_loss_time ? nlohmann::json(*s.last_loss_time) : nlohmann::json(nullptr)},
        {"total_accuracy_score", s.total_accuracy_score},
        {"total_predictions", s.total_predictions},
        {"calibration", calibration}
    };
}

void from_json(const nlohmann::json& j, UserRiskState& s) {
    if (j.contains("user_id")) j.at("user_id").get_to(s.user_id);
    if (j.contains("daily_limit") && !j.at("daily_limit").is_null()) {
        s.daily_limit = j.at("daily_limit").get<Amount>();
    }
    if (j.contains("weekly_limit") && !j.at("weekly_limit").is_null()) {
        s.weekly_limit = j.at("weekly_limit").get<Amount>();
    }
    if (j.contains("daily_spent")) j.at("daily_spent").get_to(s.daily_spent);
    if (j.contains("weekly_spent")) j.at("weekly_spent").get_to(s.weekly_spent);
    if (j.contains("last_daily_reset")) j.at("last_daily_reset").get_to(s.last_daily_reset);
    if (j.contains("last_weekly_reset")) j.at("last_weekly_reset").get_to(s.last_weekly_reset);
    if (j.contains("observe_only")) j.at("observe_only").get_to(s.observe_only);
    if (j.contains("trading_paused")) j.at("trading_paused").get_to(s.trading_paused);
    if (j.contains("recent_trades")) j.at("recent_trades").get_to(s.recent_trades);
    if (j.contains("last_loss_time") && !j.at("last_loss_time").is_null()) {
        s.last_loss_time = j.at("last_loss_time").get<int64_t>();
    }
    if (j.contains("total_accuracy_score")) j.at("total_accuracy_score").get_to(s.total_accuracy_score);
    if (j.contains("total_predictions")) j.at("total_predictions").get_to(s.total_predictions);
    if (j.contains("calibration")) {
        for (const auto& [key, value] : j.at("calibration").items()) {
            CalibrationBucket b;
            if (value.contains("total")) value.at("total").get_to(b.total);
            if (value.contains("correct")) value.at("correct").get_to(b.correct);
            s.calibration[std::stoi(key)] = b;
        }
    }
}

// ============================================================================
// IN-MEMORY STORE
// ============================================================================

std::optional<UserRiskState> InMemoryRiskStateStore::load_risk_state(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(user_id);
    if (it != states_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void InMemoryRiskStateStore::save_risk_state(const UserRiskState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_[state.user_id] = state;
}

// ============================================================================
// EVALUATOR
// ============================================================================

RiskControlEvaluator::RiskControlEvaluator(const RiskConfig& config,
                                           std::shared_ptr<RiskStateStore> store,
                                           std::shared_ptr<Wallet> wallet,
                                           const Clock& clock)
    : config_(config)
    , store_(std::move(store))
    , wallet_(std::move(wallet))
    , clock_(clock)
{
    spdlog::info("RiskControlEvaluator initialized: max_position={:.1f}%, warn={:.1f}%, "
                 "cooldown={}, rapid={} trades/{}",
                 config_.max_position_pct, config_.warn_position_pct,
                 time_utils::format_duration_ms(config_.loss_cooldown_ms),
                 config_.max_trades_in_window,
                 time_utils::format_duration_ms(config_.rapid_trade_window_ms));
}

std::shared_ptr<RiskControlEvaluator::UserSlot> RiskControlEvaluator::slot_for(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(users_mutex_);
    auto& slot = users_[user_id];
    if (!slot) {
        slot = std::make_shared<UserSlot>();
    }
    return slot;
}

UserRiskState& RiskControlEvaluator::load_locked(UserSlot& slot, const std::string& user_id) {
    if (!slot.loaded) {
        auto stored = store_->load_risk_state(user_id);
        if (stored) {
            slot.state = std::move(*stored);
        } else {
            WallClock now = clock_.now();
            slot.state = UserRiskState{};
            slot.state.last_daily_reset = time_utils::day_key(now);
            slot.state.last_weekly_reset = time_utils::week_key(now);
        }
        slot.state.user_id = user_id;
        slot.loaded = true;
    }

    // A reset that fails to persist is recomputed from the stored keys on the next load
    if (reset_limits_locked(slot.state)) {
        persist_committed_locked(slot.state);
    }
    return slot.state;
}

bool RiskControlEvaluator::reset_limits_locked(UserRiskState& state) const {
    WallClock now = clock_.now();
    std::string today = time_utils::day_key(now);
    std::string week = time_utils::week_key(now);

    bool updated = false;
    if (state.last_daily_reset != today) {
        state.daily_spent = 0.0;
        state.last_daily_reset = today;
        updated = true;
    }
    if (state.last_weekly_reset != week) {
        state.weekly_spent = 0.0;
        state.last_weekly_reset = week;
        updated = true;
    }

    if (updated) {
        spdlog::debug("Risk counters reset for {}: day={} week={}", state.user_id, today, week);
    }
    return updated;
}

RiskEvaluation RiskControlEvaluator::evaluate_locked(const UserRiskState& state, Amount amount) const {
    RiskEvaluation result;

    Amount balance = wallet_->get_balance(state.user_id);
    result.capital_at_risk = balance <= 0.0 ? 100.0 : amount / balance * 100.0;

    if (state.trading_paused) {
        result.blocked.push_back("Trading is currently paused. Resume trading in risk settings to continue.");
    }

    if (state.observe_only) {
        result.blocked.push_back("Observe-only mode is active. Disable it in risk settings to trade.");
    }

    int64_t now_ms = to_epoch_ms(clock_.now());
    if (state.last_loss_time) {
        int64_t since_loss = now_ms - *state.last_loss_time;
        if (since_loss < config_.loss_cooldown_ms) {
            auto remaining_s = static_cast<int64_t>(
                std::ceil((config_.loss_cooldown_ms - since_loss) / 1000.0));
            result.warnings.push_back(fmt::format(
                "Reflection period: {}s remaining since your last resolved position.", remaining_s));
        }
    }

    if (result.capital_at_risk > config_.max_position_pct) {
        result.blocked.push_back(fmt::format(
            "Position size exceeds {:.0f}% of your capital. Consider a smaller position.",
            config_.max_position_pct));
    } else if (result.capital_at_risk > config_.warn_position_pct) {
        result.warnings.push_back(fmt::format(
            "This position represents {:.1f}% of your capital.", result.capital_at_risk));
    }

    if (state.daily_limit) {
        Amount remaining = std::max(0.0, *state.daily_limit - state.daily_spent);
        result.daily_remaining = remaining;
        if (state.daily_spent + amount > *state.daily_limit) {
            result.blocked.push_back(fmt::format(
                "Daily allocation limit reached. Remaining: ${:.2f}", remaining));
        }
    }

    if (state.weekly_limit) {
        Amount remaining = std::max(0.0, *state.weekly_limit - state.weekly_spent);
        result.weekly_remaining = remaining;
        if (state.weekly_spent + amount > *state.weekly_limit) {
            result.blocked.push_back(fmt::format(
                "Weekly allocation limit reached. Remaining: ${:.2f}", remaining));
        }
    }

    auto recent = std::count_if(state.recent_trades.begin(), state.recent_trades.end(),
        [&](int64_t t) { return now_ms - t < config_.rapid_trade_window_ms; });
    if (recent >= config_.max_trades_in_window) {
        result.warnings.push_back(
            "Multiple trades detected in quick succession. Take a moment to review your strategy.");
    }

    result.allowed = result.blocked.empty();
    return result;
}

RiskEvaluation RiskControlEvaluator::evaluate(const std::string& user_id, Amount amount) {
    auto slot = slot_for(user_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    return evaluate_locked(load_locked(*slot, user_id), amount);
}

RiskEvaluation RiskControlEvaluator::admit(const std::string& user_id, Amount amount,
                                           const std::function<bool()>& action) {
    auto slot = slot_for(user_id);
    std::lock_guard<std::mutex> lock(slot->mutex);

    UserRiskState& state = load_locked(*slot, user_id);
    RiskEvaluation result = evaluate_locked(state, amount);
    if (!result.allowed) {
        spdlog::info("Trade blocked for {}: {}", user_id, result.blocked.front());
        return result;
    }

    if (action()) {
        record_trade_locked(state, amount);
        persist_committed_locked(state);
    }
    return result;
}

void RiskControlEvaluator::persist_committed_locked(const UserRiskState& state) {
    try {
        store_->save_risk_state(state);
    } catch (const std::exception& e) {
        spdlog::error("Risk state for {} not persisted, kept in memory: {}", state.user_id, e.what());
    }
}

void RiskControlEvaluator::record_trade_locked(UserRiskState& state, Amount amount) const {
    int64_t now_ms = to_epoch_ms(clock_.now());

    state.daily_spent += amount;
    state.weekly_spent += amount;
    state.recent_trades.push_back(now_ms);

    int64_t keep_window = config_.rapid_trade_window_ms * 2;
    state.recent_trades.erase(
        std::remove_if(state.recent_trades.begin(), state.recent_trades.end(),
                       [&](int64_t t) { return now_ms - t >= keep_window; }),
        state.recent_trades.end());

    spdlog::debug("Risk trade recorded: user={} ${:.2f} daily=${:.2f} weekly=${:.2f}",
                  state.user_id, amount, state.daily_spent, state.weekly_spent);
}

void RiskControlEvaluator::record_trade(const std::string& user_id, Amount amount) {
    record_committed(user_id, [&](UserRiskState& s) { record_trade_locked(s, amount); });
}

void RiskControlEvaluator::record_loss(const std::string& user_id) {
    record_committed(user_id, [&](UserRiskState& s) {
        s.last_loss_time = to_epoch_ms(clock_.now());
    });
}

void RiskControlEvaluator::record_resolution(const std::string& user_id,
                                             double entry_probability, bool won) {
    record_committed(user_id, [&](UserRiskState& s) {
        double p = entry_probability / 100.0;
        double outcome = won ? 1.0 : 0.0;
        double brier = (p - outcome) * (p - outcome);

        s.total_predictions += 1;
        s.total_accuracy_score += 1.0 - brier;

        int bucket = static_cast<int>(std::floor(entry_probability / 10.0)) * 10;
        bucket = std::clamp(bucket, 0, 90);
        auto& data = s.calibration[bucket];
        data.total += 1;
        if (won) {
            data.correct += 1;
        } else {
            s.last_loss_time = to_epoch_ms(clock_.now());
        }
    });
}

ForecasterStats RiskControlEvaluator::forecaster_stats(const std::string& user_id) {
    UserRiskState state = state_for(user_id);

    ForecasterStats stats;
    stats.total_predictions = state.total_predictions;
    stats.calibration = state.calibration;
    stats.accuracy_score = state.total_predictions > 0
        ? state.total_accuracy_score / state.total_predictions * 100.0
        : 0.0;

    double error = 0.0;
    int buckets = 0;
    for (const auto& [bucket, data] : state.calibration) {
        if (data.total >= config_.calibration_min_samples) {
            double expected = (bucket + 5) / 100.0;
            double actual = static_cast<double>(data.correct) / data.total;
            error += std::abs(expected - actual);
            buckets++;
        }
    }
    stats.calibration_score = buckets > 0 ? 100.0 - (error / buckets * 100.0) : 0.0;

    return stats;
}

void RiskControlEvaluator::set_daily_limit(const std::string& user_id, Amount amount) {
    mutate(user_id, [&](UserRiskState& s) {
        s.daily_limit = amount > 0.0 ? std::optional<Amount>(amount) : std::nullopt;
    });
    spdlog::info("Daily limit for {}: {}", user_id,
                 amount > 0.0 ? fmt::format("${:.2f}", amount) : std::string("none"));
}

void RiskControlEvaluator::set_weekly_limit(const std::string& user_id, Amount amount) {
    mutate(user_id, [&](UserRiskState& s) {
        s.weekly_limit = amount > 0.0 ? std::optional<Amount>(amount) : std::nullopt;
    });
    spdlog::info("Weekly limit for {}: {}", user_id,
                 amount > 0.0 ? fmt::format("${:.2f}", amount) : std::string("none"));
}

void RiskControlEvaluator::set_observe_only(const std::string& user_id, bool enabled) {
    mutate(user_id, [&](UserRiskState& s) { s.observe_only = enabled; });
    spdlog::info("Observe-only for {}: {}", user_id, enabled);
}

void RiskControlEvaluator::pause_trading(const std::string& user_id) {
    mutate(user_id, [&](UserRiskState& s) { s.trading_paused = true; });
    spdlog::info("Trading paused for {}", user_id);
}

void RiskControlEvaluator::resume_trading(const std::string& user_id) {
    mutate(user_id, [&](UserRiskState& s) { s.trading_paused = false; });
    spdlog::info("Trading resumed for {}", user_id);
}

UserRiskState RiskControlEvaluator::state_for(const std::string& user_id) {
    auto slot = slot_for(user_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    return load_locked(*slot, user_id);
}

} // namespace fcast

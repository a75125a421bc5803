#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "ledger/wallet.hpp"
#include "utils/clock.hpp"

namespace fcast {

struct CalibrationBucket {
    int total{0};
    int correct{0};
};

/**
 * Responsible-trading state of one user.
 */
struct UserRiskState {
    std::string user_id;

    // Self-imposed caps, unset means no cap
    std::optional<Amount> daily_limit;
    std::optional<Amount> weekly_limit;

    Amount daily_spent{0.0};
    Amount weekly_spent{0.0};
    std::string last_daily_reset;     // UTC day key
    std::string last_weekly_reset;    // UTC Monday key

    bool observe_only{false};
    bool trading_paused{false};

    std::vector<int64_t> recent_trades;     // Epoch ms
    std::optional<int64_t> last_loss_time;  // Epoch ms

    double total_accuracy_score{0.0};       // Sum of Brier complements
    int total_predictions{0};
    std::map<int, CalibrationBucket> calibration;   // Keyed by decile 0, 10, ..., 90
};

void to_json(nlohmann::json& j, const UserRiskState& s);
void from_json(const nlohmann::json& j, UserRiskState& s);

/**
 * Result of a pre-trade evaluation. Permitted iff nothing is blocked.
 */
struct RiskEvaluation {
    bool allowed{false};
    std::vector<std::string> warnings;
    std::vector<std::string> blocked;
    double capital_at_risk{0.0};              // Percent of balance
    std::optional<Amount> daily_remaining;
    std::optional<Amount> weekly_remaining;
};

struct ForecasterStats {
    int total_predictions{0};
    double accuracy_score{0.0};      // 0-100
    double calibration_score{0.0};   // 0-100, 0 with no qualifying buckets
    std::map<int, CalibrationBucket> calibration;
};

/**
 * Durable per-user risk state. Implementations throw std::runtime_error on
 * storage failure.
 */
class RiskStateStore {
public:
    virtual ~RiskStateStore() = default;
    virtual std::optional<UserRiskState> load_risk_state(const std::string& user_id) = 0;
    virtual void save_risk_state(const UserRiskState& state) = 0;
};

class InMemoryRiskStateStore final : public RiskStateStore {
public:
    std::optional<UserRiskState> load_risk_state(const std::string& user_id) override;
    void save_risk_state(const UserRiskState& state) override;

private:
    std::mutex mutex_;
    std::map<std::string, UserRiskState> states_;
};

/**
 * Per-user trading guard: position size, self-imposed caps, pause and
 * observe-only switches, loss cooldown and rapid-trading detection, plus
 * accuracy and calibration bookkeeping.
 *
 * Each user has a mutex; evaluation and the bookkeeping that follows a
 * trade happen inside it, so two trades of one user cannot both pass a cap
 * they would jointly exceed.
 */
class RiskControlEvaluator {
public:
    RiskControlEvaluator(const RiskConfig& config,
                         std::shared_ptr<RiskStateStore> store,
                         std::shared_ptr<Wallet> wallet,
                         const Clock& clock);

    RiskEvaluation evaluate(const std::string& user_id, Amount amount);

    /**
     * Evaluate and, when permitted, run action inside the user's critical
     * section. If action returns true the trade is recorded against the
     * caps. Exceptions from action propagate and nothing is recorded.
     * A failure to persist the recorded state is logged, not thrown: the
     * trade has happened and the in-memory caps already count it.
     */
    RiskEvaluation admit(const std::string& user_id, Amount amount,
                         const std::function<bool()>& action);

    // Bookkeeping for events that already happened; the store is best effort
    void record_trade(const std::string& user_id, Amount amount);
    void record_loss(const std::string& user_id);

    // entry_probability in percent (0-100)
    void record_resolution(const std::string& user_id, double entry_probability, bool won);

    ForecasterStats forecaster_stats(const std::string& user_id);

    // Self-control settings; a limit <= 0 clears it
    void set_daily_limit(const std::string& user_id, Amount amount);
    void set_weekly_limit(const std::string& user_id, Amount amount);
    void set_observe_only(const std::string& user_id, bool enabled);
    void pause_trading(const std::string& user_id);
    void resume_trading(const std::string& user_id);

    UserRiskState state_for(const std::string& user_id);

    const RiskConfig& config() const { return config_; }

private:
    struct UserSlot {
        std::mutex mutex;
        bool loaded{false};
        UserRiskState state;
    };

    RiskConfig config_;
    std::shared_ptr<RiskStateStore> store_;
    std::shared_ptr<Wallet> wallet_;
    const Clock& clock_;

    std::mutex users_mutex_;
    std::map<std::string, std::shared_ptr<UserSlot>> users_;

    std::shared_ptr<UserSlot> slot_for(const std::string& user_id);

    // Callers hold slot->mutex
    UserRiskState& load_locked(UserSlot& slot, const std::string& user_id);
    bool reset_limits_locked(UserRiskState& state) const;
    RiskEvaluation evaluate_locked(const UserRiskState& state, Amount amount) const;
    void record_trade_locked(UserRiskState& state, Amount amount) const;
    void persist_committed_locked(const UserRiskState& state);

    template <typename Fn>
    void mutate(const std::string& user_id, Fn&& fn) {
        auto slot = slot_for(user_id);
        std::lock_guard<std::mutex> lock(slot->mutex);
        UserRiskState& state = load_locked(*slot, user_id);
        UserRiskState next = state;
        fn(next);
        store_->save_risk_state(next);
        state = std::move(next);
    }

    template <typename Fn>
    void record_committed(const std::string& user_id, Fn&& fn) {
        auto slot = slot_for(user_id);
        std::lock_guard<std::mutex> lock(slot->mutex);
        UserRiskState& state = load_locked(*slot, user_id);
        fn(state);
        persist_committed_locked(state);
    }
};

} // namespace fcast

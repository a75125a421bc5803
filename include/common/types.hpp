#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace fcast {

// Time types
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::milliseconds;

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

inline int64_t to_epoch_ms(WallClock t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()
    ).count();
}

inline WallClock from_epoch_ms(int64_t ms) {
    return WallClock(std::chrono::milliseconds(ms));
}

// Money amounts (dollars)
using Amount = double;

// Probability in [0, 1]
using Probability = double;

// Market lifecycle
enum class MarketStatus {
    ACTIVE,
    RESOLVED,
    CLOSED    // Voided: trading stopped, stakes refunded
};

inline std::string market_status_to_string(MarketStatus s) {
    switch (s) {
        case MarketStatus::ACTIVE: return "active";
        case MarketStatus::RESOLVED: return "resolved";
        case MarketStatus::CLOSED: return "closed";
    }
    return "unknown";
}

inline MarketStatus market_status_from_string(const std::string& s) {
    if (s == "resolved") return MarketStatus::RESOLVED;
    if (s == "closed") return MarketStatus::CLOSED;
    return MarketStatus::ACTIVE;
}

// Position lifecycle
enum class PositionStatus {
    ACTIVE,
    WON,
    LOST,
    REFUNDED
};

inline std::string position_status_to_string(PositionStatus s) {
    switch (s) {
        case PositionStatus::ACTIVE: return "active";
        case PositionStatus::WON: return "won";
        case PositionStatus::LOST: return "lost";
        case PositionStatus::REFUNDED: return "refunded";
    }
    return "unknown";
}

inline PositionStatus position_status_from_string(const std::string& s) {
    if (s == "won") return PositionStatus::WON;
    if (s == "lost") return PositionStatus::LOST;
    if (s == "refunded") return PositionStatus::REFUNDED;
    return PositionStatus::ACTIVE;
}

inline bool is_terminal(PositionStatus s) {
    return s != PositionStatus::ACTIVE;
}

// Outcome of a market
struct Outcome {
    std::string id;
    std::string title;
    int probability{0};          // 0-100, derived from the probability model
    Amount total_stake{0.0};
    double stake_share{0.0};     // 0-100, stake ratio; display only
};

struct Market {
    std::string id;
    std::string title;
    std::string description;
    std::string category;
    MarketStatus status{MarketStatus::ACTIVE};
    std::vector<Outcome> outcomes;
    Amount total_volume{0.0};
    std::string winning_outcome_id;   // Non-empty iff RESOLVED
    double liquidity{100.0};          // LMSR b parameter
    WallClock created_at;
    std::optional<WallClock> close_date;
    std::optional<WallClock> resolution_date;

    const Outcome* find_outcome(const std::string& outcome_id) const {
        for (const auto& o : outcomes) {
            if (o.id == outcome_id) return &o;
        }
        return nullptr;
    }

    Outcome* find_outcome(const std::string& outcome_id) {
        for (auto& o : outcomes) {
            if (o.id == outcome_id) return &o;
        }
        return nullptr;
    }

    int outcome_index(const std::string& outcome_id) const {
        for (size_t i = 0; i < outcomes.size(); i++) {
            if (outcomes[i].id == outcome_id) return static_cast<int>(i);
        }
        return -1;
    }

    bool is_active() const { return status == MarketStatus::ACTIVE; }
};

/**
 * A user's trade on one outcome of one market.
 */
struct Position {
    std::string id;
    std::string market_id;
    std::string outcome_id;
    std::string user_id;

    Amount stake_amount{0.0};
    double odds_at_prediction{0.0};   // 0-100 probability at entry
    Amount potential_return{0.0};     // Total returned on a win (stake + profit)
    Amount loss_refund{0.0};          // Rebate returned on a loss
    Amount platform_fee{0.0};         // Platform revenue if the position wins
    Amount actual_return{0.0};        // Set once, on the terminal transition

    PositionStatus status{PositionStatus::ACTIVE};
    WallClock created_at;
    std::optional<WallClock> resolved_at;
};

/**
 * Incoming trade request from the service layer.
 */
struct TradeRequest {
    std::string market_id;
    std::string outcome_id;
    std::string user_id;
    Amount stake{0.0};
};

/**
 * Parameters for creating a market.
 */
struct MarketSpec {
    std::string id;                      // Generated when empty
    std::string title;
    std::string description;
    std::string category;
    std::vector<std::string> outcome_titles;
    std::vector<std::string> outcome_ids;    // Optional, generated when empty
    std::vector<double> initial_probabilities;  // Optional, 0-1 or 0-100
    std::optional<double> liquidity;
    std::optional<WallClock> close_date;
};

} // namespace fcast

#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace fcast {

/**
 * Outcome probabilities of a market captured once per day.
 */
struct DailySnapshot {
    std::string market_id;
    std::string day;                               // UTC YYYY-MM-DD
    std::map<std::string, int> probabilities;      // outcome_id -> %
    Amount total_volume{0.0};
    WallClock taken_at;
};

struct IntradaySample {
    WallClock t;
    std::map<std::string, Probability> probabilities;   // outcome_id -> 0-1
};

class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;
    virtual void save_daily_snapshot(const DailySnapshot& snapshot) = 0;
    virtual std::vector<DailySnapshot> load_daily_snapshots() = 0;
};

/**
 * Daily snapshots and a bounded window of intraday samples per market.
 */
class SnapshotCache {
public:
    explicit SnapshotCache(int64_t sample_retention_ms);

    DailySnapshot capture_daily(const Market& market, WallClock now);

    // Most recent daily snapshot of the market
    std::optional<DailySnapshot> latest_daily(const std::string& market_id) const;

    void record_sample(const Market& market, WallClock now);
    std::vector<IntradaySample> samples(const std::string& market_id) const;

    void restore_daily(const std::vector<DailySnapshot>& snapshots);

private:
    int64_t sample_retention_ms_;

    mutable std::mutex mutex_;
    std::map<std::string, DailySnapshot> daily_;              // Latest per market
    std::map<std::string, std::deque<IntradaySample>> intraday_;
};

} // namespace fcast

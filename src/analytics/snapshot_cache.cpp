#include "analytics/snapshot_cache.hpp"
#include <spdlog/spdlog.h>
#include "utils/time_utils.hpp"

namespace fcast {

SnapshotCache::SnapshotCache(int64_t sample_retention_ms)
    : sample_retention_ms_(sample_retention_ms)
{
}

DailySnapshot SnapshotCache::capture_daily(const Market& market, WallClock now) {
    DailySnapshot snap;
    snap.market_id = market.id;
    snap.day = time_utils::day_key(now);
    snap.total_volume = market.total_volume;
    snap.taken_at = now;
    for (const auto& o : market.outcomes) {
        snap.probabilities[o.id] = o.probability;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    daily_[market.id] = snap;
    spdlog::debug("Daily snapshot: market={} day={}", market.id, snap.day);
    return snap;
}

std::optional<DailySnapshot> SnapshotCache::latest_daily(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = daily_.find(market_id);
    if (it != daily_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void SnapshotCache::record_sample(const Market& market, WallClock now) {
    IntradaySample sample;
    sample.t = now;
    for (const auto& o : market.outcomes) {
        sample.probabilities[o.id] = o.probability / 100.0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& samples = intraday_[market.id];
    samples.push_back(std::move(sample));

    while (!samples.empty() &&
           time_utils::millis_between(samples.front().t, now) > sample_retention_ms_) {
        samples.pop_front();
    }
}

std::vector<IntradaySample> SnapshotCache::samples(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = intraday_.find(market_id);
    if (it == intraday_.end()) {
        return {};
    }
    return std::vector<IntradaySample>(it->second.begin(), it->second.end());
}

void SnapshotCache::restore_daily(const std::vector<DailySnapshot>& snapshots) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& s : snapshots) {
        auto it = daily_.find(s.market_id);
        if (it == daily_.end() || it->second.taken_at <= s.taken_at) {
            daily_[s.market_id] = s;
        }
    }
}

} // namespace fcast

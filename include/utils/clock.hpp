#pragma once

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include "common/types.hpp"

namespace fcast {

/**
 * Source of wall-clock time for day/week resets, cooldowns and analytics
 * windows. Components hold a reference; the clock outlives them.
 *
 * Implementations must be safe for concurrent reads.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual WallClock now() const = 0;
};

/**
 * Delegates to std::chrono::system_clock.
 */
class SystemClock final : public Clock {
public:
    WallClock now() const override { return wall_now(); }
};

/**
 * Clock driven explicitly by the caller (tests, script replay). It only
 * moves when told to, and advance() never moves it backwards.
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(WallClock start = WallClock{})
        : now_ms_(to_epoch_ms(start)) {}

    WallClock now() const override { return from_epoch_ms(now_ms_.load()); }

    void set(WallClock t) { now_ms_.store(to_epoch_ms(t)); }
    void advance(Duration d) {
        if (d.count() < 0) {
            throw std::invalid_argument("Clock cannot be advanced by a negative duration");
        }
        now_ms_.fetch_add(d.count());
    }

private:
    std::atomic<int64_t> now_ms_;
};

} // namespace fcast

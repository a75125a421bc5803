#pragma once

#include <string>
#include <chrono>
#include "common/types.hpp"

namespace fcast {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string (UTC, millisecond precision).
 */
std::string to_iso8601(WallClock t);

/**
 * Parse ISO 8601 string to timestamp.
 */
WallClock from_iso8601(const std::string& s);

/**
 * UTC calendar day of t, formatted YYYY-MM-DD.
 */
std::string day_key(WallClock t);

/**
 * UTC date of the Monday starting the week containing t, formatted YYYY-MM-DD.
 */
std::string week_key(WallClock t);

/**
 * Format duration for display.
 */
std::string format_duration_ms(int64_t ms);

/**
 * Milliseconds from `from` to `to`, negative if `to` is earlier.
 */
int64_t millis_between(WallClock from, WallClock to);

} // namespace time_utils
} // namespace fcast

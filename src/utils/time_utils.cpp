#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>

namespace fcast {
namespace time_utils {

namespace {

std::tm utc_tm(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    return tm;
}

std::string format_date(const std::tm& tm) {
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d");
    return ss.str();
}

} // namespace

std::string to_iso8601(WallClock t) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;
    if (ms.count() < 0) ms += std::chrono::milliseconds(1000);

    std::tm tm = utc_tm(t);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

WallClock from_iso8601(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Invalid ISO 8601 timestamp: " + s);
    }

    auto time_t = timegm(&tm);
    auto tp = std::chrono::system_clock::from_time_t(time_t);

    // Parse milliseconds if present
    size_t dot_pos = s.find('.');
    if (dot_pos != std::string::npos && dot_pos + 1 < s.length()) {
        std::string ms_str = s.substr(dot_pos + 1, 3);
        int ms = std::stoi(ms_str);
        tp += std::chrono::milliseconds(ms);
    }

    return std::chrono::time_point_cast<WallClock::duration>(tp);
}

std::string day_key(WallClock t) {
    return format_date(utc_tm(t));
}

std::string week_key(WallClock t) {
    std::tm tm = utc_tm(t);
    // tm_wday: 0 = Sunday; weeks start on Monday
    int days_since_monday = (tm.tm_wday + 6) % 7;
    auto monday = t - std::chrono::hours(24 * days_since_monday);
    return format_date(utc_tm(monday));
}

std::string format_duration_ms(int64_t ms) {
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        double sec = ms / 1000.0;
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << sec << "s";
        return ss.str();
    } else {
        int64_t min = ms / 60000;
        int64_t sec = (ms % 60000) / 1000;
        return std::to_string(min) + "m" + std::to_string(sec) + "s";
    }
}

int64_t millis_between(WallClock from, WallClock to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

} // namespace time_utils
} // namespace fcast

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace fcast {

struct PricingConfig {
    double platform_fee{0.01};               // 1% of the risk-weighted profit
    double default_liquidity{100.0};         // LMSR b when a market gives none
    double min_reported_probability{0.05};   // Quotes never reach 0%
    double max_reported_probability{0.95};   // ... or 100%
    double accumulator_cap{30.0};            // |q_i| <= cap * b
};

struct RiskConfig {
    double max_position_pct{10.0};           // Block above 10% of balance
    double warn_position_pct{5.0};           // Warn above 5%
    int64_t loss_cooldown_ms{30000};         // Reflection period after a loss
    int64_t rapid_trade_window_ms{60000};    // Rapid-trading detection window
    int max_trades_in_window{3};
    int calibration_min_samples{5};          // Per decile bucket
};

struct AnalyticsConfig {
    double weight_delta{0.4};
    double weight_volume{0.25};
    double weight_events{0.25};
    double weight_sentiment{0.1};
    double delta_cap{0.20};                  // 20 percentage points
    double volume_cap{2000.0};               // Informed volume saturating the log scale
    int64_t volume_window_ms{24 * 60 * 60 * 1000};
    int sparkline_points{60};
    int64_t sparkline_resolution_ms{5 * 60 * 1000};
};

struct StorageConfig {
    std::string database_path{"./data/forecast.db"};
    bool persist_enabled{true};
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{false};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    PricingConfig pricing;
    RiskConfig risk;
    AnalyticsConfig analytics;
    StorageConfig storage;
    LoggingConfig logging;

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const PricingConfig& c);
void from_json(const nlohmann::json& j, PricingConfig& c);
void to_json(nlohmann::json& j, const RiskConfig& c);
void from_json(const nlohmann::json& j, RiskConfig& c);
void to_json(nlohmann::json& j, const AnalyticsConfig& c);
void from_json(const nlohmann::json& j, AnalyticsConfig& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void from_json(const nlohmann::json& j, StorageConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace fcast

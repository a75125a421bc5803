#include "config/config.hpp"
#include <fstream>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace fcast {

void to_json(nlohmann::json& j, const PricingConfig& c) {
    j = nlohmann::json{
        {"platform_fee", c.platform_fee},
        {"default_liquidity", c.default_liquidity},
        {"min_reported_probability", c.min_reported_probability},
        {"max_reported_probability", c.max_reported_probability},
        {"accumulator_cap", c.accumulator_cap}
    };
}

void from_json(const nlohmann::json& j, PricingConfig& c) {
    if (j.contains("platform_fee")) j.at("platform_fee").get_to(c.platform_fee);
    if (j.contains("default_liquidity")) j.at("default_liquidity").get_to(c.default_liquidity);
    if (j.contains("min_reported_probability")) j.at("min_reported_probability").get_to(c.min_reported_probability);
    if (j.contains("max_reported_probability")) j.at("max_reported_probability").get_to(c.max_reported_probability);
    if (j.contains("accumulator_cap")) j.at("accumulator_cap").get_to(c.accumulator_cap);
}

void to_json(nlohmann::json& j, const RiskConfig& c) {
    j = nlohmann::json{
        {"max_position_pct", c.max_position_pct},
        {"warn_position_pct", c.warn_position_pct},
        {"loss_cooldown_ms", c.loss_cooldown_ms},
        {"rapid_trade_window_ms", c.rapid_trade_window_ms},
        {"max_trades_in_window", c.max_trades_in_window},
        {"calibration_min_samples", c.calibration_min_samples}
    };
}

void from_json(const nlohmann::json& j, RiskConfig& c) {
    if (j.contains("max_position_pct")) j.at("max_position_pct").get_to(c.max_position_pct);
    if (j.contains("warn_position_pct")) j.at("warn_position_pct").get_to(c.warn_position_pct);
    if (j.contains("loss_cooldown_ms")) j.at("loss_cooldown_ms").get_to(c.loss_cooldown_ms);
    if (j.contains("rapid_trade_window_ms")) j.at("rapid_trade_window_ms").get_to(c.rapid_trade_window_ms);
    if (j.contains("max_trades_in_window")) j.at("max_trades_in_window").get_to(c.max_trades_in_window);
    if (j.contains("calibration_min_samples")) j.at("calibration_min_samples").get_to(c.calibration_min_samples);
}

void to_json(nlohmann::json& j, const AnalyticsConfig& c) {
    j = nlohmann::json{
        {"weight_delta", c.weight_delta},
        {"weight_volume", c.weight_volume},
        {"weight_events", c.weight_events},
        {"weight_sentiment", c.weight_sentiment},
        {"delta_cap", c.delta_cap},
        {"volume_cap", c.volume_cap},
        {"volume_window_ms", c.volume_window_ms},
        {"sparkline_points", c.sparkline_points},
        {"sparkline_resolution_ms", c.sparkline_resolution_ms}
    };
}

void from_json(const nlohmann::json& j, AnalyticsConfig& c) {
    if (j.contains("weight_delta")) j.at("weight_delta").get_to(c.weight_delta);
    if (j.contains("weight_volume")) j.at("weight_volume").get_to(c.weight_volume);
    if (j.contains("weight_events")) j.at("weight_events").get_to(c.weight_events);
    if (j.contains("weight_sentiment")) j.at("weight_sentiment").get_to(c.weight_sentiment);
    if (j.contains("delta_cap")) j.at("delta_cap").get_to(c.delta_cap);
    if (j.contains("volume_cap")) j.at("volume_cap").get_to(c.volume_cap);
    if (j.contains("volume_window_ms")) j.at("volume_window_ms").get_to(c.volume_window_ms);
    if (j.contains("sparkline_points")) j.at("sparkline_points").get_to(c.sparkline_points);
    if (j.contains("sparkline_resolution_ms")) j.at("sparkline_resolution_ms").get_to(c.sparkline_resolution_ms);
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = nlohmann::json{
        {"database_path", c.database_path},
        {"persist_enabled", c.persist_enabled}
    };
}

void from_json(const nlohmann::json& j, StorageConfig& c) {
    if (j.contains("database_path")) j.at("database_path").get_to(c.database_path);
    if (j.contains("persist_enabled")) j.at("persist_enabled").get_to(c.persist_enabled);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"pricing", c.pricing},
        {"risk", c.risk},
        {"analytics", c.analytics},
        {"storage", c.storage},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("pricing")) j.at("pricing").get_to(c.pricing);
    if (j.contains("risk")) j.at("risk").get_to(c.risk);
    if (j.contains("analytics")) j.at("analytics").get_to(c.analytics);
    if (j.contains("storage")) j.at("storage").get_to(c.storage);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    Config config;
    from_json(j, config);

    std::string db_override = get_env("FORECAST_DB_PATH");
    if (!db_override.empty()) {
        config.storage.database_path = db_override;
    }

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (pricing.platform_fee < 0.0 || pricing.platform_fee > 1.0) {
        spdlog::error("pricing.platform_fee must be in [0, 1]");
        return false;
    }

    if (pricing.default_liquidity <= 0.0) {
        spdlog::error("pricing.default_liquidity must be positive");
        return false;
    }

    if (pricing.min_reported_probability <= 0.0 ||
        pricing.max_reported_probability >= 1.0 ||
        pricing.min_reported_probability >= pricing.max_reported_probability) {
        spdlog::error("reported probability bounds must satisfy 0 < min < max < 1");
        return false;
    }

    if (pricing.accumulator_cap <= 0.0) {
        spdlog::error("pricing.accumulator_cap must be positive");
        return false;
    }

    if (risk.max_position_pct <= 0.0 || risk.warn_position_pct <= 0.0) {
        spdlog::error("risk position thresholds must be positive");
        return false;
    }

    if (risk.warn_position_pct > risk.max_position_pct) {
        spdlog::warn("risk.warn_position_pct exceeds max_position_pct, warnings will never fire");
    }

    if (risk.max_trades_in_window <= 0 || risk.rapid_trade_window_ms <= 0) {
        spdlog::error("rapid trade detection parameters must be positive");
        return false;
    }

    double weight_sum = analytics.weight_delta + analytics.weight_volume +
                        analytics.weight_events + analytics.weight_sentiment;
    if (analytics.weight_delta < 0 || analytics.weight_volume < 0 ||
        analytics.weight_events < 0 || analytics.weight_sentiment < 0) {
        spdlog::error("analytics weights must be non-negative");
        return false;
    }
    if (std::abs(weight_sum - 1.0) > 1e-6) {
        spdlog::warn("analytics weights sum to {:.3f}, trend scores will not span [0, 100]", weight_sum);
    }

    if (analytics.delta_cap <= 0.0 || analytics.volume_cap <= 0.0) {
        spdlog::error("analytics caps must be positive");
        return false;
    }

    if (analytics.sparkline_points <= 0 || analytics.sparkline_resolution_ms <= 0) {
        spdlog::error("sparkline length and resolution must be positive");
        return false;
    }

    return true;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace fcast

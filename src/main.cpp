#include <iostream>
#include <fstream>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "engine/forecast_engine.hpp"
#include "persistence/market_database.hpp"
#include "pricing/trade_pricer.hpp"
#include "utils/clock.hpp"
#include "utils/time_utils.hpp"

using namespace fcast;
using nlohmann::json;

/**
 * Forecast engine command runner.
 *
 * Reads one JSON command per line (from --script or stdin) and prints one
 * JSON result per line:
 *
 *   {"cmd":"create_market","id":"m1","title":"Rain?","outcomes":["Yes","No"],"outcome_ids":["y","n"]}
 *   {"cmd":"deposit","user":"alice","amount":1000}
 *   {"cmd":"trade","user":"alice","market":"m1","outcome":"y","stake":50}
 *   {"cmd":"advance_clock","minutes":5}      (with --manual-clock or --start)
 *   {"cmd":"resolve","market":"m1","outcome":"y"}
 */

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // stdout carries results; logs go to stderr
    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/forecast_engine.log",
            config.max_log_file_size_mb * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("forecast", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

// ============================================================================
// RESULT SERIALIZATION
// ============================================================================

json error_json(const Error& e) {
    json j = {
        {"ok", false},
        {"error", error_code_to_string(e.code)},
        {"kind", error_kind_to_string(e.kind())},
        {"message", e.message}
    };
    if (!e.details.empty()) {
        j["details"] = e.details;
    }
    return j;
}

json optional_time_json(const std::optional<WallClock>& t) {
    return t ? json(time_utils::to_iso8601(*t)) : json(nullptr);
}

json market_json(const Market& m) {
    json outcomes = json::array();
    for (const auto& o : m.outcomes) {
        outcomes.push_back({
            {"id", o.id},
            {"title", o.title},
            {"probability", o.probability},
            {"total_stake", o.total_stake},
            {"stake_share", o.stake_share}
        });
    }
    return {
        {"id", m.id},
        {"title", m.title},
        {"category", m.category},
        {"status", market_status_to_string(m.status)},
        {"outcomes", outcomes},
        {"total_volume", m.total_volume},
        {"liquidity", m.liquidity},
        {"winning_outcome_id", m.winning_outcome_id.empty() ? json(nullptr) : json(m.winning_outcome_id)},
        {"created_at", time_utils::to_iso8601(m.created_at)},
        {"close_date", optional_time_json(m.close_date)},
        {"resolution_date", optional_time_json(m.resolution_date)}
    };
}

json position_json(const Position& p) {
    return {
        {"id", p.id},
        {"market_id", p.market_id},
        {"outcome_id", p.outcome_id},
        {"user_id", p.user_id},
        {"stake_amount", p.stake_amount},
        {"odds_at_prediction", p.odds_at_prediction},
        {"potential_return", p.potential_return},
        {"loss_refund", p.loss_refund},
        {"platform_fee", p.platform_fee},
        {"actual_return", p.actual_return},
        {"status", position_status_to_string(p.status)},
        {"created_at", time_utils::to_iso8601(p.created_at)},
        {"resolved_at", optional_time_json(p.resolved_at)}
    };
}

json breakdown_json(const TradeBreakdown& b) {
    return {
        {"stake", b.stake},
        {"probability", b.probability},
        {"win", {
            {"profit", b.win_profit},
            {"total_return", b.win_return},
            {"return_pct", b.win_return_pct},
            {"platform_revenue", b.platform_revenue}
        }},
        {"loss", {
            {"amount", b.loss_amount},
            {"refund", b.loss_refund},
            {"return_pct", b.loss_return_pct}
        }},
        {"risk_reward", format_risk_reward(b)}
    };
}

json evaluation_json(const RiskEvaluation& e) {
    return {
        {"ok", true},
        {"allowed", e.allowed},
        {"warnings", e.warnings},
        {"blocked", e.blocked},
        {"capital_at_risk", e.capital_at_risk},
        {"daily_remaining", e.daily_remaining ? json(*e.daily_remaining) : json(nullptr)},
        {"weekly_remaining", e.weekly_remaining ? json(*e.weekly_remaining) : json(nullptr)}
    };
}

json resolution_json(const ResolutionResult& r) {
    if (!r.ok) {
        return error_json(r.error);
    }
    json settled = json::array();
    for (const auto& p : r.settled) {
        settled.push_back(position_json(p));
    }
    return {
        {"ok", true},
        {"market", market_json(r.market)},
        {"winners", r.winners},
        {"losers", r.losers},
        {"refunded", r.refunded},
        {"total_payout", r.total_payout},
        {"total_refund", r.total_refund},
        {"platform_revenue", r.platform_revenue},
        {"positions", settled}
    };
}

json wallet_json(const WalletResult& r) {
    if (!r.ok) {
        return error_json(r.error);
    }
    return {
        {"ok", true},
        {"balance", r.balance},
        {"entry_id", r.entry.id},
        {"type", ledger_entry_type_to_string(r.entry.type)}
    };
}

// ============================================================================
// COMMANDS
// ============================================================================

std::optional<WallClock> optional_time_field(const json& cmd, const char* key) {
    if (cmd.contains(key) && !cmd.at(key).is_null()) {
        return time_utils::from_iso8601(cmd.at(key).get<std::string>());
    }
    return std::nullopt;
}

// manual_clock is null when the session runs on the system clock
json run_command(const json& cmd, ForecastEngine& engine, const Clock& clock,
                 ManualClock* manual_clock, InMemorySignalFeed& feed) {
    const std::string name = cmd.at("cmd").get<std::string>();

    if (name == "create_market") {
        MarketSpec spec;
        spec.id = cmd.value("id", "");
        spec.title = cmd.value("title", "");
        spec.description = cmd.value("description", "");
        spec.category = cmd.value("category", "");
        if (cmd.contains("outcomes")) cmd.at("outcomes").get_to(spec.outcome_titles);
        if (cmd.contains("outcome_ids")) cmd.at("outcome_ids").get_to(spec.outcome_ids);
        if (cmd.contains("probabilities")) cmd.at("probabilities").get_to(spec.initial_probabilities);
        if (cmd.contains("liquidity")) spec.liquidity = cmd.at("liquidity").get<double>();
        spec.close_date = optional_time_field(cmd, "close_date");

        MarketResult r = engine.create_market(spec);
        if (!r.ok) return error_json(r.error);
        return {{"ok", true}, {"market", market_json(r.market)}};
    }

    if (name == "deposit") {
        return wallet_json(engine.wallet().deposit(cmd.at("user").get<std::string>(),
                                                   cmd.at("amount").get<double>()));
    }

    if (name == "withdraw") {
        return wallet_json(engine.wallet().withdraw(cmd.at("user").get<std::string>(),
                                                    cmd.at("amount").get<double>()));
    }

    if (name == "trade") {
        TradeRequest req;
        req.user_id = cmd.at("user").get<std::string>();
        req.market_id = cmd.at("market").get<std::string>();
        req.outcome_id = cmd.at("outcome").get<std::string>();
        req.stake = cmd.at("stake").get<double>();

        TradeResult r = engine.place_trade(req);
        if (!r.ok) return error_json(r.error);
        return {
            {"ok", true},
            {"position", position_json(r.position)},
            {"breakdown", breakdown_json(r.breakdown)},
            {"probabilities", r.probabilities},
            {"market_volume", r.market_volume},
            {"warnings", r.warnings},
            {"balance", engine.wallet().get_balance(req.user_id)}
        };
    }

    if (name == "quote") {
        auto b = engine.quote(cmd.at("market").get<std::string>(),
                              cmd.at("outcome").get<std::string>(),
                              cmd.at("stake").get<double>());
        if (!b) return error_json(make_error(ErrorCode::OUTCOME_NOT_FOUND, "Nothing to quote"));
        return {{"ok", true}, {"breakdown", breakdown_json(*b)}};
    }

    if (name == "resolve") {
        return resolution_json(engine.resolve_market(cmd.at("market").get<std::string>(),
                                                     cmd.at("outcome").get<std::string>()));
    }

    if (name == "void") {
        return resolution_json(engine.void_market(cmd.at("market").get<std::string>()));
    }

    if (name == "market") {
        auto snap = engine.market(cmd.at("market").get<std::string>());
        if (!snap) return error_json(make_error(ErrorCode::MARKET_NOT_FOUND, "Market not found"));
        json positions = json::array();
        for (const auto& p : snap->positions) positions.push_back(position_json(p));
        return {{"ok", true}, {"market", market_json(snap->market)}, {"positions", positions}};
    }

    if (name == "signal") {
        SignalEvent event = cmd.at("event").get<SignalEvent>();
        if (!cmd.at("event").contains("t")) {
            event.t = clock.now();
        }
        feed.publish(event);
        return {{"ok", true}, {"events", feed.size()}};
    }

    if (name == "snapshot") {
        auto captured = engine.capture_daily_snapshots();
        return {{"ok", true}, {"captured", captured.size()}};
    }

    if (name == "analytics") {
        auto a = engine.compute_analytics(cmd.at("market").get<std::string>());
        if (!a) return error_json(make_error(ErrorCode::MARKET_NOT_FOUND, "Market not found"));
        return {{"ok", true}, {"analytics", *a}};
    }

    if (name == "evaluate_risk") {
        return evaluation_json(engine.evaluate_risk(cmd.at("user").get<std::string>(),
                                                    cmd.at("amount").get<double>()));
    }

    if (name == "risk_settings") {
        const std::string user = cmd.at("user").get<std::string>();
        RiskControlEvaluator& risk = engine.risk();
        if (cmd.contains("daily_limit")) {
            risk.set_daily_limit(user, cmd.at("daily_limit").is_null() ? 0.0 : cmd.at("daily_limit").get<double>());
        }
        if (cmd.contains("weekly_limit")) {
            risk.set_weekly_limit(user, cmd.at("weekly_limit").is_null() ? 0.0 : cmd.at("weekly_limit").get<double>());
        }
        if (cmd.contains("observe_only")) {
            risk.set_observe_only(user, cmd.at("observe_only").get<bool>());
        }
        if (cmd.contains("paused")) {
            if (cmd.at("paused").get<bool>()) {
                risk.pause_trading(user);
            } else {
                risk.resume_trading(user);
            }
        }
        return {{"ok", true}, {"state", risk.state_for(user)}};
    }

    if (name == "stats") {
        const std::string user = cmd.at("user").get<std::string>();
        ForecasterStats s = engine.risk().forecaster_stats(user);
        json buckets = json::object();
        for (const auto& [bucket, c] : s.calibration) {
            buckets[std::to_string(bucket)] = {{"total", c.total}, {"correct", c.correct}};
        }
        return {
            {"ok", true},
            {"user", user},
            {"balance", engine.wallet().get_balance(user)},
            {"total_predictions", s.total_predictions},
            {"accuracy_score", s.accuracy_score},
            {"calibration_score", s.calibration_score},
            {"calibration", buckets}
        };
    }

    if (name == "advance_clock") {
        if (!manual_clock) {
            return {{"ok", false}, {"error", "INVALID_COMMAND"},
                    {"message", "advance_clock needs --manual-clock or --start"}};
        }
        int64_t ms = cmd.value("ms", int64_t{0});
        ms += cmd.value("minutes", int64_t{0}) * 60 * 1000;
        ms += cmd.value("hours", int64_t{0}) * 60 * 60 * 1000;
        ms += cmd.value("days", int64_t{0}) * 24 * 60 * 60 * 1000;
        manual_clock->advance(Duration(ms));
        return {{"ok", true}, {"now", time_utils::to_iso8601(manual_clock->now())}};
    }

    return {{"ok", false}, {"error", "UNKNOWN_COMMAND"}, {"message", "Unknown command: " + name}};
}

int run_script(std::istream& in, ForecastEngine& engine, const Clock& clock,
               ManualClock* manual_clock, InMemorySignalFeed& feed) {
    int line_no = 0;
    int failures = 0;
    std::string line;

    while (std::getline(in, line)) {
        line_no++;
        if (line.empty() || line[0] == '#') continue;

        json result;
        try {
            result = run_command(json::parse(line), engine, clock, manual_clock, feed);
        } catch (const json::exception& e) {
            spdlog::warn("Line {}: malformed command: {}", line_no, e.what());
            result = {{"ok", false}, {"error", "INVALID_COMMAND"}, {"message", e.what()}};
        } catch (const ConsistencyViolation& e) {
            spdlog::critical("Line {}: {}", line_no, e.what());
            std::cout << json{{"ok", false}, {"error", "CONSISTENCY_VIOLATION"}, {"message", e.what()}}.dump()
                      << std::endl;
            return 2;
        } catch (const std::invalid_argument& e) {
            spdlog::warn("Line {}: {}", line_no, e.what());
            result = {{"ok", false}, {"error", "INVALID_COMMAND"}, {"message", e.what()}};
        } catch (const std::runtime_error& e) {
            spdlog::error("Line {}: {}", line_no, e.what());
            result = {{"ok", false}, {"error", "STORAGE_ERROR"}, {"message", e.what()}};
        }

        if (!result.value("ok", false)) {
            failures++;
        }
        result["line"] = line_no;
        std::cout << result.dump() << std::endl;
    }

    spdlog::info("Processed {} lines, {} failed", line_no, failures);
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"Forecast Engine - prediction market pricing, risk and settlement core"};

    std::string config_path = "configs/engine.json";
    std::string db_path;
    std::string script_path;
    std::string log_level;
    std::string start_time;
    bool in_memory = false;
    bool manual = false;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("--db", db_path, "SQLite database path (overrides config)");
    app.add_option("-s,--script", script_path, "JSON-lines command file (default: stdin)")
        ->check(CLI::ExistingFile);
    app.add_option("--log-level", log_level, "debug, info, warn, error");
    app.add_flag("--manual-clock", manual, "Freeze time; it moves only on advance_clock commands");
    app.add_option("--start", start_time, "Manual clock start time, ISO 8601 (implies --manual-clock)");
    app.add_flag("--in-memory", in_memory, "Run without persistence");
    app.add_flag("-v,--version", show_version, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "forecast_engine v1.0.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    // Load config
    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    if (!db_path.empty()) {
        config.storage.database_path = db_path;
    }
    if (in_memory) {
        config.storage.persist_enabled = false;
    }
    if (!log_level.empty()) {
        config.logging.log_level = log_level;
    }

    setup_logging(config.logging);

    if (!config.validate()) {
        spdlog::error("Invalid configuration");
        return 1;
    }

    SystemClock system_clock;
    std::unique_ptr<ManualClock> manual_clock;
    if (manual || !start_time.empty()) {
        manual_clock = std::make_unique<ManualClock>(wall_now());
        if (!start_time.empty()) {
            try {
                manual_clock->set(time_utils::from_iso8601(start_time));
            } catch (const std::exception& e) {
                spdlog::error("Invalid --start: {}", e.what());
                return 1;
            }
        }
        spdlog::info("Manual clock at {}", time_utils::to_iso8601(manual_clock->now()));
    }
    const Clock& clock = manual_clock ? static_cast<const Clock&>(*manual_clock) : system_clock;

    auto feed = std::make_shared<InMemorySignalFeed>();
    EngineDependencies deps;
    deps.feed = feed;

    std::shared_ptr<MarketDatabase> db;
    if (config.storage.persist_enabled) {
        try {
            std::filesystem::path p(config.storage.database_path);
            if (p.has_parent_path()) {
                std::filesystem::create_directories(p.parent_path());
            }
            db = std::make_shared<MarketDatabase>(config.storage.database_path);
            db->initialize_schema();
        } catch (const std::exception& e) {
            spdlog::error("Failed to open database: {}", e.what());
            return 1;
        }
        deps.repository = db;
        deps.risk_store = db;
        deps.journal = db;
        deps.snapshot_store = db;
    }

    ForecastEngine engine(config, clock, deps);

    try {
        if (db) {
            engine.restore();
        }
    } catch (const std::exception& e) {
        spdlog::critical("Failed to restore state: {}", e.what());
        return 1;
    }

    spdlog::info("Forecast engine ready ({} markets, persistence {})",
                 engine.store().size(), db ? "on" : "off");

    int rc = 0;
    if (script_path.empty()) {
        rc = run_script(std::cin, engine, clock, manual_clock.get(), *feed);
    } else {
        std::ifstream file(script_path);
        if (!file.is_open()) {
            spdlog::error("Failed to open script: {}", script_path);
            return 1;
        }
        rc = run_script(file, engine, clock, manual_clock.get(), *feed);
    }

    if (db) {
        db->close();
    }
    return rc;
}

#include "persistence/market_database.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace fcast {

// ============================================================================
// DATABASE IMPLEMENTATION
// ============================================================================

MarketDatabase::MarketDatabase(const std::string& db_path)
    : db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Enable foreign keys
    execute("PRAGMA foreign_keys = ON;");

    // WAL mode for better concurrent access
    execute("PRAGMA journal_mode = WAL;");

    spdlog::info("MarketDatabase opened: {}", db_path);
}

MarketDatabase::~MarketDatabase() {
    close();
}

bool MarketDatabase::is_open() const {
    return db_ != nullptr;
}

void MarketDatabase::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        spdlog::debug("MarketDatabase closed: {}", db_path_);
    }
}

void MarketDatabase::execute(const std::string& sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw std::runtime_error("SQL error: " + error + " in: " + sql);
    }
}

void MarketDatabase::begin_transaction() {
    if (!in_transaction_) {
        execute("BEGIN TRANSACTION;");
        in_transaction_ = true;
    }
}

void MarketDatabase::commit_transaction() {
    if (in_transaction_) {
        execute("COMMIT;");
        in_transaction_ = false;
    }
}

void MarketDatabase::rollback_transaction() {
    if (in_transaction_) {
        in_transaction_ = false;
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &errmsg) != SQLITE_OK) {
            spdlog::error("Rollback failed: {}", errmsg ? errmsg : "Unknown error");
            sqlite3_free(errmsg);
        }
    }
}

sqlite3_stmt* MarketDatabase::prepare(const std::string& sql) {
    if (!db_) {
        throw std::runtime_error("Database is closed: " + db_path_);
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void MarketDatabase::bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void MarketDatabase::bind_int64(sqlite3_stmt* stmt, int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
}

void MarketDatabase::bind_double(sqlite3_stmt* stmt, int index, double value) {
    sqlite3_bind_double(stmt, index, value);
}

void MarketDatabase::bind_optional_time(sqlite3_stmt* stmt, int index,
                                        const std::optional<WallClock>& t) {
    if (t) {
        sqlite3_bind_int64(stmt, index, to_epoch_ms(*t));
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void MarketDatabase::step_done(sqlite3_stmt* stmt, const std::string& what) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        finalize(stmt);
        throw std::runtime_error("Failed to " + what + ": " + error);
    }
    finalize(stmt);
}

void MarketDatabase::finalize(sqlite3_stmt* stmt) {
    sqlite3_finalize(stmt);
}

std::string MarketDatabase::get_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

int64_t MarketDatabase::get_int64(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);
}

double MarketDatabase::get_double(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_double(stmt, col);
}

std::optional<WallClock> MarketDatabase::get_optional_time(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return from_epoch_ms(sqlite3_column_int64(stmt, col));
}

// ============================================================================
// SCHEMA
// ============================================================================

void MarketDatabase::initialize_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    in_transaction([&] {
        create_tables();
        create_indexes();
    });
    spdlog::info("Database schema initialized");
}

void MarketDatabase::create_tables() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS markets (
            market_id TEXT PRIMARY KEY,
            title TEXT NOT NULL,
            description TEXT,
            category TEXT,
            status TEXT NOT NULL,
            total_volume REAL NOT NULL DEFAULT 0,
            winning_outcome_id TEXT,
            liquidity REAL NOT NULL,
            created_at INTEGER NOT NULL,
            close_date INTEGER,
            resolution_date INTEGER
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS outcomes (
            outcome_id TEXT NOT NULL,
            market_id TEXT NOT NULL,
            outcome_index INTEGER NOT NULL,
            title TEXT NOT NULL,
            probability INTEGER NOT NULL,
            total_stake REAL NOT NULL DEFAULT 0,
            stake_share REAL NOT NULL DEFAULT 0,
            PRIMARY KEY (market_id, outcome_id),
            FOREIGN KEY (market_id) REFERENCES markets(market_id)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS positions (
            position_id TEXT PRIMARY KEY,
            market_id TEXT NOT NULL,
            outcome_id TEXT NOT NULL,
            user_id TEXT NOT NULL,
            stake_amount REAL NOT NULL CHECK (stake_amount > 0),
            odds_at_prediction REAL NOT NULL,
            potential_return REAL NOT NULL,
            loss_refund REAL NOT NULL,
            platform_fee REAL NOT NULL,
            actual_return REAL NOT NULL DEFAULT 0,
            status TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            resolved_at INTEGER,
            FOREIGN KEY (market_id) REFERENCES markets(market_id)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS model_state (
            market_id TEXT PRIMARY KEY,
            state_json TEXT NOT NULL,
            FOREIGN KEY (market_id) REFERENCES markets(market_id)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS risk_state (
            user_id TEXT PRIMARY KEY,
            state_json TEXT NOT NULL
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS ledger_entries (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            entry_id TEXT NOT NULL UNIQUE,
            user_id TEXT NOT NULL,
            type TEXT NOT NULL,
            amount REAL NOT NULL,
            balance_after REAL NOT NULL,
            reference TEXT,
            created_at INTEGER NOT NULL
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS daily_snapshots (
            market_id TEXT NOT NULL,
            day TEXT NOT NULL,
            probabilities_json TEXT NOT NULL,
            total_volume REAL NOT NULL,
            taken_at INTEGER NOT NULL,
            PRIMARY KEY (market_id, day),
            FOREIGN KEY (market_id) REFERENCES markets(market_id)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY
        );
    )");

    execute("INSERT OR IGNORE INTO schema_version (version) VALUES (" +
            std::to_string(SCHEMA_VERSION) + ");");
}

void MarketDatabase::create_indexes() {
    execute("CREATE INDEX IF NOT EXISTS idx_outcomes_market ON outcomes(market_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_positions_market ON positions(market_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_positions_user ON positions(user_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_ledger_user ON ledger_entries(user_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_markets_created ON markets(created_at);");
}

int MarketDatabase::get_schema_version() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare("SELECT MAX(version) FROM schema_version;");
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = static_cast<int>(get_int64(stmt, 0));
    }
    finalize(stmt);
    return version;
}

// ============================================================================
// ROW WRITERS
// ============================================================================

void MarketDatabase::upsert_market_row(const Market& market) {
    auto stmt = prepare(R"(
        INSERT INTO markets (
            market_id, title, description, category, status, total_volume,
            winning_outcome_id, liquidity, created_at, close_date, resolution_date
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(market_id) DO UPDATE SET
            title = excluded.title,
            description = excluded.description,
            category = excluded.category,
            status = excluded.status,
            total_volume = excluded.total_volume,
            winning_outcome_id = excluded.winning_outcome_id,
            liquidity = excluded.liquidity,
            close_date = excluded.close_date,
            resolution_date = excluded.resolution_date;
    )");

    bind_text(stmt, 1, market.id);
    bind_text(stmt, 2, market.title);
    bind_text(stmt, 3, market.description);
    bind_text(stmt, 4, market.category);
    bind_text(stmt, 5, market_status_to_string(market.status));
    bind_double(stmt, 6, market.total_volume);
    bind_text(stmt, 7, market.winning_outcome_id);
    bind_double(stmt, 8, market.liquidity);
    bind_int64(stmt, 9, to_epoch_ms(market.created_at));
    bind_optional_time(stmt, 10, market.close_date);
    bind_optional_time(stmt, 11, market.resolution_date);

    step_done(stmt, "save market " + market.id);
}

void MarketDatabase::upsert_outcome_rows(const Market& market) {
    for (size_t i = 0; i < market.outcomes.size(); i++) {
        const auto& o = market.outcomes[i];
        auto stmt = prepare(R"(
            INSERT INTO outcomes (
                outcome_id, market_id, outcome_index, title, probability, total_stake, stake_share
            ) VALUES (?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(market_id, outcome_id) DO UPDATE SET
                title = excluded.title,
                probability = excluded.probability,
                total_stake = excluded.total_stake,
                stake_share = excluded.stake_share;
        )");

        bind_text(stmt, 1, o.id);
        bind_text(stmt, 2, market.id);
        bind_int64(stmt, 3, static_cast<int64_t>(i));
        bind_text(stmt, 4, o.title);
        bind_int64(stmt, 5, o.probability);
        bind_double(stmt, 6, o.total_stake);
        bind_double(stmt, 7, o.stake_share);

        step_done(stmt, "save outcome " + o.id);
    }
}

void MarketDatabase::upsert_position_row(const Position& pos) {
    auto stmt = prepare(R"(
        INSERT INTO positions (
            position_id, market_id, outcome_id, user_id, stake_amount, odds_at_prediction,
            potential_return, loss_refund, platform_fee, actual_return, status,
            created_at, resolved_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(position_id) DO UPDATE SET
            actual_return = excluded.actual_return,
            status = excluded.status,
            resolved_at = excluded.resolved_at;
    )");

    bind_text(stmt, 1, pos.id);
    bind_text(stmt, 2, pos.market_id);
    bind_text(stmt, 3, pos.outcome_id);
    bind_text(stmt, 4, pos.user_id);
    bind_double(stmt, 5, pos.stake_amount);
    bind_double(stmt, 6, pos.odds_at_prediction);
    bind_double(stmt, 7, pos.potential_return);
    bind_double(stmt, 8, pos.loss_refund);
    bind_double(stmt, 9, pos.platform_fee);
    bind_double(stmt, 10, pos.actual_return);
    bind_text(stmt, 11, position_status_to_string(pos.status));
    bind_int64(stmt, 12, to_epoch_ms(pos.created_at));
    bind_optional_time(stmt, 13, pos.resolved_at);

    step_done(stmt, "save position " + pos.id);
}

void MarketDatabase::upsert_model_state(const std::string& market_id, const nlohmann::json& state) {
    auto stmt = prepare(R"(
        INSERT INTO model_state (market_id, state_json) VALUES (?, ?)
        ON CONFLICT(market_id) DO UPDATE SET state_json = excluded.state_json;
    )");
    bind_text(stmt, 1, market_id);
    bind_text(stmt, 2, state.dump());
    step_done(stmt, "save model state for " + market_id);
}

Position MarketDatabase::read_position(sqlite3_stmt* stmt) {
    Position p;
    p.id = get_text(stmt, 0);
    p.market_id = get_text(stmt, 1);
    p.outcome_id = get_text(stmt, 2);
    p.user_id = get_text(stmt, 3);
    p.stake_amount = get_double(stmt, 4);
    p.odds_at_prediction = get_double(stmt, 5);
    p.potential_return = get_double(stmt, 6);
    p.loss_refund = get_double(stmt, 7);
    p.platform_fee = get_double(stmt, 8);
    p.actual_return = get_double(stmt, 9);
    p.status = position_status_from_string(get_text(stmt, 10));
    p.created_at = from_epoch_ms(get_int64(stmt, 11));
    p.resolved_at = get_optional_time(stmt, 12);
    return p;
}

// ============================================================================
// MARKET REPOSITORY
// ============================================================================

void MarketDatabase::save_market(const Market& market, const nlohmann::json& model_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_transaction([&] {
        upsert_market_row(market);
        upsert_outcome_rows(market);
        upsert_model_state(market.id, model_state);
    });
    spdlog::debug("Saved market {}", market.id);
}

void MarketDatabase::save_trade(const Market& market, const Position& position,
                                const nlohmann::json& model_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_transaction([&] {
        upsert_market_row(market);
        upsert_outcome_rows(market);
        upsert_position_row(position);
        upsert_model_state(market.id, model_state);
    });
}

void MarketDatabase::save_resolution(const Market& market, const std::vector<Position>& positions) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_transaction([&] {
        upsert_market_row(market);
        for (const auto& p : positions) {
            upsert_position_row(p);
        }
    });
    spdlog::debug("Saved resolution of {} ({} positions)", market.id, positions.size());
}

std::vector<StoredMarket> MarketDatabase::load_markets() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StoredMarket> result;

    auto stmt = prepare(R"(
        SELECT market_id, title, description, category, status, total_volume,
               winning_outcome_id, liquidity, created_at, close_date, resolution_date
        FROM markets ORDER BY created_at, market_id;
    )");
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        StoredMarket sm;
        Market& m = sm.market;
        m.id = get_text(stmt, 0);
        m.title = get_text(stmt, 1);
        m.description = get_text(stmt, 2);
        m.category = get_text(stmt, 3);
        m.status = market_status_from_string(get_text(stmt, 4));
        m.total_volume = get_double(stmt, 5);
        m.winning_outcome_id = get_text(stmt, 6);
        m.liquidity = get_double(stmt, 7);
        m.created_at = from_epoch_ms(get_int64(stmt, 8));
        m.close_date = get_optional_time(stmt, 9);
        m.resolution_date = get_optional_time(stmt, 10);
        result.push_back(std::move(sm));
    }
    finalize(stmt);

    for (auto& sm : result) {
        stmt = prepare(R"(
            SELECT outcome_id, title, probability, total_stake, stake_share
            FROM outcomes WHERE market_id = ? ORDER BY outcome_index;
        )");
        bind_text(stmt, 1, sm.market.id);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            Outcome o;
            o.id = get_text(stmt, 0);
            o.title = get_text(stmt, 1);
            o.probability = static_cast<int>(get_int64(stmt, 2));
            o.total_stake = get_double(stmt, 3);
            o.stake_share = get_double(stmt, 4);
            sm.market.outcomes.push_back(o);
        }
        finalize(stmt);

        stmt = prepare(R"(
            SELECT position_id, market_id, outcome_id, user_id, stake_amount, odds_at_prediction,
                   potential_return, loss_refund, platform_fee, actual_return, status,
                   created_at, resolved_at
            FROM positions WHERE market_id = ? ORDER BY created_at, rowid;
        )");
        bind_text(stmt, 1, sm.market.id);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            sm.positions.push_back(read_position(stmt));
        }
        finalize(stmt);

        stmt = prepare("SELECT state_json FROM model_state WHERE market_id = ?;");
        bind_text(stmt, 1, sm.market.id);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            std::string text = get_text(stmt, 0);
            finalize(stmt);
            try {
                sm.model_state = nlohmann::json::parse(text);
            } catch (const nlohmann::json::exception& e) {
                throw std::runtime_error("Corrupt model state for " + sm.market.id + ": " + e.what());
            }
        } else {
            finalize(stmt);
        }
    }

    spdlog::info("Loaded {} markets from {}", result.size(), db_path_);
    return result;
}

// ============================================================================
// RISK STATE
// ============================================================================

std::optional<UserRiskState> MarketDatabase::load_risk_state(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare("SELECT state_json FROM risk_state WHERE user_id = ?;");
    bind_text(stmt, 1, user_id);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        finalize(stmt);
        return std::nullopt;
    }

    std::string text = get_text(stmt, 0);
    finalize(stmt);

    try {
        UserRiskState state = nlohmann::json::parse(text).get<UserRiskState>();
        state.user_id = user_id;
        return state;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Corrupt risk state for " + user_id + ": " + e.what());
    }
}

void MarketDatabase::save_risk_state(const UserRiskState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        INSERT INTO risk_state (user_id, state_json) VALUES (?, ?)
        ON CONFLICT(user_id) DO UPDATE SET state_json = excluded.state_json;
    )");
    nlohmann::json j = state;
    bind_text(stmt, 1, state.user_id);
    bind_text(stmt, 2, j.dump());
    step_done(stmt, "save risk state for " + state.user_id);
}

// ============================================================================
// LEDGER
// ============================================================================

void MarketDatabase::append_ledger_entry(const LedgerEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        INSERT INTO ledger_entries (
            entry_id, user_id, type, amount, balance_after, reference, created_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?);
    )");
    bind_text(stmt, 1, entry.id);
    bind_text(stmt, 2, entry.user_id);
    bind_text(stmt, 3, ledger_entry_type_to_string(entry.type));
    bind_double(stmt, 4, entry.amount);
    bind_double(stmt, 5, entry.balance_after);
    bind_text(stmt, 6, entry.reference);
    bind_int64(stmt, 7, to_epoch_ms(entry.created_at));
    step_done(stmt, "append ledger entry " + entry.id);
}

std::vector<LedgerEntry> MarketDatabase::load_ledger_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT entry_id, user_id, type, amount, balance_after, reference, created_at
        FROM ledger_entries ORDER BY seq;
    )");

    std::vector<LedgerEntry> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        LedgerEntry e;
        e.id = get_text(stmt, 0);
        e.user_id = get_text(stmt, 1);
        e.type = ledger_entry_type_from_string(get_text(stmt, 2));
        e.amount = get_double(stmt, 3);
        e.balance_after = get_double(stmt, 4);
        e.reference = get_text(stmt, 5);
        e.created_at = from_epoch_ms(get_int64(stmt, 6));
        result.push_back(e);
    }
    finalize(stmt);
    return result;
}

// ============================================================================
// DAILY SNAPSHOTS
// ============================================================================

void MarketDatabase::save_daily_snapshot(const DailySnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        INSERT INTO daily_snapshots (market_id, day, probabilities_json, total_volume, taken_at)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT(market_id, day) DO UPDATE SET
            probabilities_json = excluded.probabilities_json,
            total_volume = excluded.total_volume,
            taken_at = excluded.taken_at;
    )");
    nlohmann::json probs = snapshot.probabilities;
    bind_text(stmt, 1, snapshot.market_id);
    bind_text(stmt, 2, snapshot.day);
    bind_text(stmt, 3, probs.dump());
    bind_double(stmt, 4, snapshot.total_volume);
    bind_int64(stmt, 5, to_epoch_ms(snapshot.taken_at));
    step_done(stmt, "save daily snapshot for " + snapshot.market_id);
}

std::vector<DailySnapshot> MarketDatabase::load_daily_snapshots() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT market_id, day, probabilities_json, total_volume, taken_at
        FROM daily_snapshots ORDER BY taken_at;
    )");

    std::vector<DailySnapshot> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        DailySnapshot s;
        s.market_id = get_text(stmt, 0);
        s.day = get_text(stmt, 1);
        std::string text = get_text(stmt, 2);
        s.total_volume = get_double(stmt, 3);
        s.taken_at = from_epoch_ms(get_int64(stmt, 4));
        try {
            s.probabilities = nlohmann::json::parse(text).get<std::map<std::string, int>>();
        } catch (const nlohmann::json::exception& e) {
            finalize(stmt);
            throw std::runtime_error("Corrupt daily snapshot for " + s.market_id + ": " + e.what());
        }
        result.push_back(std::move(s));
    }
    finalize(stmt);
    return result;
}

// ============================================================================
// QUERIES
// ============================================================================

std::vector<Position> MarketDatabase::get_positions_for_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT position_id, market_id, outcome_id, user_id, stake_amount, odds_at_prediction,
               potential_return, loss_refund, platform_fee, actual_return, status,
               created_at, resolved_at
        FROM positions WHERE user_id = ? ORDER BY created_at, rowid;
    )");
    bind_text(stmt, 1, user_id);

    std::vector<Position> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.push_back(read_position(stmt));
    }
    finalize(stmt);
    return result;
}

int MarketDatabase::count_rows(const std::string& table) {
    static const std::vector<std::string> allowed = {
        "markets", "outcomes", "positions", "model_state",
        "risk_state", "ledger_entries", "daily_snapshots"
    };
    if (std::find(allowed.begin(), allowed.end(), table) == allowed.end()) {
        throw std::invalid_argument("Unknown table: " + table);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare("SELECT COUNT(*) FROM " + table + ";");
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<int>(get_int64(stmt, 0));
    }
    finalize(stmt);
    return count;
}

} // namespace fcast

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analytics/snapshot_cache.hpp"
#include "common/types.hpp"
#include "ledger/wallet.hpp"
#include "market/market_repository.hpp"
#include "risk/risk_controls.hpp"

// Forward declare sqlite3
struct sqlite3;
struct sqlite3_stmt;

namespace fcast {

// ============================================================================
// MARKET DATABASE
//
// Durable record of markets, outcomes, positions, model state, per-user risk
// state, the wallet ledger and daily snapshots.
//
// 1. Every write that spans rows runs in one transaction
// 2. Every statement result is checked; failures throw std::runtime_error
// 3. Timestamps are UTC epoch milliseconds
// ============================================================================

class MarketDatabase final : public MarketRepository,
                             public RiskStateStore,
                             public LedgerJournal,
                             public SnapshotStore {
public:
    static constexpr int SCHEMA_VERSION = 1;

    explicit MarketDatabase(const std::string& db_path);
    ~MarketDatabase() override;

    // Non-copyable
    MarketDatabase(const MarketDatabase&) = delete;
    MarketDatabase& operator=(const MarketDatabase&) = delete;

    // Connection management
    bool is_open() const;
    void close();

    // Schema management
    void initialize_schema();
    int get_schema_version();

    // MarketRepository
    void save_market(const Market& market, const nlohmann::json& model_state) override;
    void save_trade(const Market& market, const Position& position,
                    const nlohmann::json& model_state) override;
    void save_resolution(const Market& market, const std::vector<Position>& positions) override;
    std::vector<StoredMarket> load_markets() override;

    // RiskStateStore
    std::optional<UserRiskState> load_risk_state(const std::string& user_id) override;
    void save_risk_state(const UserRiskState& state) override;

    // LedgerJournal
    void append_ledger_entry(const LedgerEntry& entry) override;
    std::vector<LedgerEntry> load_ledger_entries() override;

    // SnapshotStore
    void save_daily_snapshot(const DailySnapshot& snapshot) override;
    std::vector<DailySnapshot> load_daily_snapshots() override;

    // Queries
    std::vector<Position> get_positions_for_user(const std::string& user_id);
    int count_rows(const std::string& table);

private:
    sqlite3* db_{nullptr};
    std::string db_path_;
    bool in_transaction_{false};
    std::mutex mutex_;

    // Callers hold mutex_
    void execute(const std::string& sql);
    void begin_transaction();
    void commit_transaction();
    void rollback_transaction();

    template <typename Fn>
    void in_transaction(Fn&& fn) {
        begin_transaction();
        try {
            fn();
            commit_transaction();
        } catch (...) {
            rollback_transaction();
            throw;
        }
    }

    // Statement preparation helpers
    sqlite3_stmt* prepare(const std::string& sql);
    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value);
    void bind_int64(sqlite3_stmt* stmt, int index, int64_t value);
    void bind_double(sqlite3_stmt* stmt, int index, double value);
    void bind_optional_time(sqlite3_stmt* stmt, int index, const std::optional<WallClock>& t);
    void step_done(sqlite3_stmt* stmt, const std::string& what);
    void finalize(sqlite3_stmt* stmt);

    // Result extraction helpers
    std::string get_text(sqlite3_stmt* stmt, int col);
    int64_t get_int64(sqlite3_stmt* stmt, int col);
    double get_double(sqlite3_stmt* stmt, int col);
    std::optional<WallClock> get_optional_time(sqlite3_stmt* stmt, int col);

    // Row writers
    void upsert_market_row(const Market& market);
    void upsert_outcome_rows(const Market& market);
    void upsert_position_row(const Position& position);
    void upsert_model_state(const std::string& market_id, const nlohmann::json& state);

    Position read_position(sqlite3_stmt* stmt);

    // Schema creation
    void create_tables();
    void create_indexes();
};

} // namespace fcast

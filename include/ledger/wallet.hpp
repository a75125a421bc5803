#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "utils/clock.hpp"

namespace fcast {

enum class LedgerEntryType {
    DEPOSIT,
    WITHDRAWAL,
    STAKE,
    PAYOUT,
    REFUND,
    REVERSAL     // Takes back a settlement credit that could not be committed
};

std::string ledger_entry_type_to_string(LedgerEntryType t);
LedgerEntryType ledger_entry_type_from_string(const std::string& s);

struct LedgerEntry {
    std::string id;
    std::string user_id;
    LedgerEntryType type{LedgerEntryType::DEPOSIT};
    Amount amount{0.0};           // Always positive; type gives the direction
    Amount balance_after{0.0};
    std::string reference;        // Position or market id
    WallClock created_at;
};

/**
 * Durable sink for ledger entries. Appends throw std::runtime_error on failure.
 */
class LedgerJournal {
public:
    virtual ~LedgerJournal() = default;
    virtual void append_ledger_entry(const LedgerEntry& entry) = 0;
    virtual std::vector<LedgerEntry> load_ledger_entries() = 0;
};

/**
 * User balances as seen by the trading core.
 */
class Wallet {
public:
    virtual ~Wallet() = default;

    virtual Amount get_balance(const std::string& user_id) const = 0;

    virtual void credit(const std::string& user_id, Amount amount,
                        LedgerEntryType type, const std::string& reference) = 0;

    // False, with nothing changed, if the balance cannot cover the amount
    virtual bool debit(const std::string& user_id, Amount amount,
                       LedgerEntryType type, const std::string& reference) = 0;
};

struct WalletResult {
    bool ok{false};
    Error error;
    Amount balance{0.0};
    LedgerEntry entry;
};

/**
 * In-memory wallet that records every balance change as a ledger entry.
 * With a journal attached, an entry is journaled before the balance moves;
 * a failed append leaves the balance untouched.
 */
class LedgerWallet final : public Wallet {
public:
    static constexpr Amount MAX_DEPOSIT = 10000.0;

    explicit LedgerWallet(const Clock& clock, std::shared_ptr<LedgerJournal> journal = nullptr);

    Amount get_balance(const std::string& user_id) const override;
    void credit(const std::string& user_id, Amount amount,
                LedgerEntryType type, const std::string& reference) override;
    bool debit(const std::string& user_id, Amount amount,
               LedgerEntryType type, const std::string& reference) override;

    WalletResult deposit(const std::string& user_id, Amount amount);
    WalletResult withdraw(const std::string& user_id, Amount amount);

    std::vector<LedgerEntry> history(const std::string& user_id) const;

    // Rebuild balances from journaled entries, last entry per user wins
    void restore(const std::vector<LedgerEntry>& entries);

private:
    const Clock& clock_;
    std::shared_ptr<LedgerJournal> journal_;

    mutable std::mutex mutex_;
    std::map<std::string, Amount> balances_;
    std::vector<LedgerEntry> entries_;

    // Caller holds mutex_
    LedgerEntry apply(const std::string& user_id, Amount delta, Amount amount,
                      LedgerEntryType type, const std::string& reference);
};

} // namespace fcast

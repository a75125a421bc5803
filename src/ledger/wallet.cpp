#include "ledger/wallet.hpp"
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "utils/uuid.hpp"

namespace fcast {

std::string ledger_entry_type_to_string(LedgerEntryType t) {
    switch (t) {
        case LedgerEntryType::DEPOSIT: return "deposit";
        case LedgerEntryType::WITHDRAWAL: return "withdrawal";
        case LedgerEntryType::STAKE: return "stake";
        case LedgerEntryType::PAYOUT: return "payout";
        case LedgerEntryType::REFUND: return "refund";
        case LedgerEntryType::REVERSAL: return "reversal";
    }
    return "unknown";
}

LedgerEntryType ledger_entry_type_from_string(const std::string& s) {
    if (s == "withdrawal") return LedgerEntryType::WITHDRAWAL;
    if (s == "stake") return LedgerEntryType::STAKE;
    if (s == "payout") return LedgerEntryType::PAYOUT;
    if (s == "refund") return LedgerEntryType::REFUND;
    if (s == "reversal") return LedgerEntryType::REVERSAL;
    return LedgerEntryType::DEPOSIT;
}

LedgerWallet::LedgerWallet(const Clock& clock, std::shared_ptr<LedgerJournal> journal)
    : clock_(clock)
    , journal_(std::move(journal))
{
}

Amount LedgerWallet::get_balance(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(user_id);
    return (it != balances_.end()) ? it->second : 0.0;
}

LedgerEntry LedgerWallet::apply(const std::string& user_id, Amount delta, Amount amount,
                                LedgerEntryType type, const std::string& reference) {
    LedgerEntry entry;
    entry.id = generate_uuid();
    entry.user_id = user_id;
    entry.type = type;
    entry.amount = amount;
    entry.balance_after = balances_[user_id] + delta;
    entry.reference = reference;
    entry.created_at = clock_.now();

    if (journal_) {
        journal_->append_ledger_entry(entry);
    }

    balances_[user_id] = entry.balance_after;
    entries_.push_back(entry);
    return entry;
}

void LedgerWallet::credit(const std::string& user_id, Amount amount,
                          LedgerEntryType type, const std::string& reference) {
    if (!(amount >= 0.0) || !std::isfinite(amount)) {
        throw std::invalid_argument("Credit amount must be non-negative and finite");
    }
    if (amount == 0.0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = apply(user_id, amount, amount, type, reference);
    spdlog::debug("Wallet credit: user={} {} ${:.2f} balance=${:.2f} ref={}",
                  user_id, ledger_entry_type_to_string(type), amount, entry.balance_after, reference);
}

bool LedgerWallet::debit(const std::string& user_id, Amount amount,
                         LedgerEntryType type, const std::string& reference) {
    if (!(amount > 0.0) || !std::isfinite(amount)) {
        throw std::invalid_argument("Debit amount must be positive and finite");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Amount balance = balances_[user_id];
    if (amount > balance) {
        spdlog::debug("Wallet debit refused: user={} need ${:.2f} have ${:.2f}",
                      user_id, amount, balance);
        return false;
    }

    auto entry = apply(user_id, -amount, amount, type, reference);
    spdlog::debug("Wallet debit: user={} {} ${:.2f} balance=${:.2f} ref={}",
                  user_id, ledger_entry_type_to_string(type), amount, entry.balance_after, reference);
    return true;
}

WalletResult LedgerWallet::deposit(const std::string& user_id, Amount amount) {
    WalletResult result;

    if (!(amount > 0.0) || !std::isfinite(amount) || amount > MAX_DEPOSIT) {
        result.error = make_error(ErrorCode::INVALID_AMOUNT,
            fmt::format("Deposit must be between $0 and ${:.0f}", MAX_DEPOSIT));
        result.balance = get_balance(user_id);
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    result.entry = apply(user_id, amount, amount, LedgerEntryType::DEPOSIT, "");
    result.balance = result.entry.balance_after;
    result.ok = true;

    spdlog::info("Deposit: user={} ${:.2f} balance=${:.2f}", user_id, amount, result.balance);
    return result;
}

WalletResult LedgerWallet::withdraw(const std::string& user_id, Amount amount) {
    WalletResult result;

    if (!(amount > 0.0) || !std::isfinite(amount)) {
        result.error = make_error(ErrorCode::INVALID_AMOUNT, "Withdrawal amount must be positive");
        result.balance = get_balance(user_id);
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Amount balance = balances_[user_id];
    if (amount > balance) {
        result.error = make_error(ErrorCode::INSUFFICIENT_BALANCE,
            fmt::format("Insufficient balance: need ${:.2f}, have ${:.2f}", amount, balance));
        result.balance = balance;
        return result;
    }

    result.entry = apply(user_id, -amount, amount, LedgerEntryType::WITHDRAWAL, "");
    result.balance = result.entry.balance_after;
    result.ok = true;

    spdlog::info("Withdrawal: user={} ${:.2f} balance=${:.2f}", user_id, amount, result.balance);
    return result;
}

std::vector<LedgerEntry> LedgerWallet::history(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LedgerEntry> result;
    for (const auto& e : entries_) {
        if (e.user_id == user_id) {
            result.push_back(e);
        }
    }
    return result;
}

void LedgerWallet::restore(const std::vector<LedgerEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_.clear();
    entries_ = entries;
    for (const auto& e : entries) {
        balances_[e.user_id] = e.balance_after;
    }
    spdlog::info("Wallet restored: {} entries, {} users", entries_.size(), balances_.size());
}

} // namespace fcast

#pragma once

#include <string>
#include <vector>
#include <stdexcept>

namespace fcast {

/**
 * Error classes callers map to distinct user-facing behavior.
 */
enum class ErrorKind {
    NONE,
    VALIDATION,      // Bad input, nothing mutated
    POLICY,          // Risk-control block
    STATE_CONFLICT,  // Operation not allowed in the current lifecycle state
    CONSISTENCY      // Invariant breach, fatal to the operation
};

enum class ErrorCode {
    NONE,
    INVALID_STAKE,
    INVALID_AMOUNT,
    MARKET_NOT_FOUND,
    OUTCOME_NOT_FOUND,
    INVALID_MARKET,
    INSUFFICIENT_BALANCE,
    RISK_BLOCKED,
    MARKET_INACTIVE,
    MARKET_ALREADY_RESOLVED,
    INVALID_WINNING_OUTCOME,
    CONSISTENCY_VIOLATION
};

inline ErrorKind kind_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return ErrorKind::NONE;
        case ErrorCode::INVALID_STAKE:
        case ErrorCode::INVALID_AMOUNT:
        case ErrorCode::MARKET_NOT_FOUND:
        case ErrorCode::OUTCOME_NOT_FOUND:
        case ErrorCode::INVALID_MARKET:
        case ErrorCode::INSUFFICIENT_BALANCE:
            return ErrorKind::VALIDATION;
        case ErrorCode::RISK_BLOCKED:
            return ErrorKind::POLICY;
        case ErrorCode::MARKET_INACTIVE:
        case ErrorCode::MARKET_ALREADY_RESOLVED:
        case ErrorCode::INVALID_WINNING_OUTCOME:
            return ErrorKind::STATE_CONFLICT;
        case ErrorCode::CONSISTENCY_VIOLATION:
            return ErrorKind::CONSISTENCY;
    }
    return ErrorKind::NONE;
}

inline std::string error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::POLICY: return "policy";
        case ErrorKind::STATE_CONFLICT: return "state_conflict";
        case ErrorKind::CONSISTENCY: return "consistency";
    }
    return "unknown";
}

inline std::string error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::INVALID_STAKE: return "INVALID_STAKE";
        case ErrorCode::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case ErrorCode::MARKET_NOT_FOUND: return "MARKET_NOT_FOUND";
        case ErrorCode::OUTCOME_NOT_FOUND: return "OUTCOME_NOT_FOUND";
        case ErrorCode::INVALID_MARKET: return "INVALID_MARKET";
        case ErrorCode::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case ErrorCode::RISK_BLOCKED: return "RISK_BLOCKED";
        case ErrorCode::MARKET_INACTIVE: return "MARKET_INACTIVE";
        case ErrorCode::MARKET_ALREADY_RESOLVED: return "MARKET_ALREADY_RESOLVED";
        case ErrorCode::INVALID_WINNING_OUTCOME: return "INVALID_WINNING_OUTCOME";
        case ErrorCode::CONSISTENCY_VIOLATION: return "CONSISTENCY_VIOLATION";
    }
    return "UNKNOWN";
}

struct Error {
    ErrorCode code{ErrorCode::NONE};
    std::string message;
    std::vector<std::string> details;   // Violated policies for RISK_BLOCKED

    ErrorKind kind() const { return kind_of(code); }
    explicit operator bool() const { return code != ErrorCode::NONE; }
};

inline Error make_error(ErrorCode code, std::string message) {
    Error e;
    e.code = code;
    e.message = std::move(message);
    return e;
}

/**
 * Thrown when a structural invariant is found broken. Never caught inside the
 * core; the operation that detected it commits nothing.
 */
class ConsistencyViolation : public std::runtime_error {
public:
    explicit ConsistencyViolation(const std::string& what)
        : std::runtime_error("Consistency violation: " + what) {}
};

} // namespace fcast

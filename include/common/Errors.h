#pragma once

#include <stdexcept>
#include <string>

namespace tradesync {

// Failure taxonomy shared by every operation result
enum class ErrorKind {
    NONE,
    TRANSIENT,            // network/timeout/storage; retried before surfacing
    INVARIANT_VIOLATION,  // duplicate open, missing intent record, backward transition
    DRIFT_ANOMALY,        // ledger disagrees with the exchange
    REJECTED              // exchange or precondition refused the request
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::TRANSIENT: return "TRANSIENT";
        case ErrorKind::INVARIANT_VIOLATION: return "INVARIANT_VIOLATION";
        case ErrorKind::DRIFT_ANOMALY: return "DRIFT_ANOMALY";
        case ErrorKind::REJECTED: return "REJECTED";
    }
    return "NONE";
}

class TradeSyncError : public std::runtime_error {
public:
    TradeSyncError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    bool isTransient() const { return kind_ == ErrorKind::TRANSIENT; }

private:
    ErrorKind kind_;
};

// Raised by exchange gateways. Transient errors are safe to retry because
// every order carries an idempotent client order id.
class GatewayError : public TradeSyncError {
public:
    GatewayError(bool transient, const std::string& message)
        : TradeSyncError(transient ? ErrorKind::TRANSIENT : ErrorKind::REJECTED, message) {}
};

struct OperationResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::NONE;
    std::string reason;
    std::string trade_id;

    static OperationResult success(const std::string& trade_id, const std::string& reason = "") {
        return {true, ErrorKind::NONE, reason, trade_id};
    }
    static OperationResult failure(ErrorKind kind, const std::string& reason,
                                   const std::string& trade_id = "") {
        return {false, kind, reason, trade_id};
    }
};

} // namespace tradesync

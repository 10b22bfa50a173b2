#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace tradesync {
namespace core {

enum class JournalEventType {
    ANOMALY,
    EMERGENCY_WRITE,
    TRADE_ARCHIVED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::ANOMALY;
    std::string symbol;
    std::string entity_id;
    nlohmann::json payload;
};

enum class SignalType { BUY, SELL };

// Entry request produced by a strategy
struct TradeSignal {
    SignalType type = SignalType::BUY;
    std::string symbol;
    double entry_price = 0.0;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
    double confidence = 0.0;
    std::string reason;
};

inline PositionSide toPositionSide(SignalType type) {
    return (type == SignalType::BUY) ? PositionSide::LONG : PositionSide::SHORT;
}

// Exit request for the strategy's current position
struct ExitDecision {
    std::string reason;
    std::optional<double> price;
};

struct StrategyInstruction {
    enum class Kind { ENTRY, EXIT };

    Kind kind = Kind::ENTRY;
    TradeSignal signal;
    ExitDecision exit;
};

struct OrderRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    bool reduce_only = false;
    std::string client_order_id;
    double reference_price = 0.0;   // expected fill, used by the paper venue
};

struct OrderStatusReport {
    std::string order_ref;
    std::string client_order_id;
    std::string symbol;
    OrderStatus status = OrderStatus::SUBMITTED;
    double filled_quantity = 0.0;
    double avg_price = 0.0;
    bool terminal = false;
    long long update_time_ms = 0;
};

// One row of the exchange position snapshot
struct LivePosition {
    std::string symbol;
    PositionSide side = PositionSide::LONG;
    double quantity = 0.0;
    double entry_price = 0.0;
    double mark_price = 0.0;
    double leverage = 1.0;
};

struct Fill {
    std::string order_ref;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double price = 0.0;
    double realized_pnl = 0.0;
    long long time_ms = 0;
    bool liquidation = false;
};

struct ReconciliationSnapshot {
    long long taken_at_ms = 0;
    std::vector<LivePosition> positions;
};

enum class AnomalyType {
    ORPHAN_DETECTED,
    ORPHAN_CLEARED,
    GHOST_DETECTED,
    GHOST_CLEARED,
    STALE_CLOSED,
    LEDGER_CONFLICT,
    RETRY_EXHAUSTED,
    WRITE_DEGRADED
};

inline const char* toString(AnomalyType type) {
    switch (type) {
        case AnomalyType::ORPHAN_DETECTED: return "ORPHAN_DETECTED";
        case AnomalyType::ORPHAN_CLEARED: return "ORPHAN_CLEARED";
        case AnomalyType::GHOST_DETECTED: return "GHOST_DETECTED";
        case AnomalyType::GHOST_CLEARED: return "GHOST_CLEARED";
        case AnomalyType::STALE_CLOSED: return "STALE_CLOSED";
        case AnomalyType::LEDGER_CONFLICT: return "LEDGER_CONFLICT";
        case AnomalyType::RETRY_EXHAUSTED: return "RETRY_EXHAUSTED";
        case AnomalyType::WRITE_DEGRADED: return "WRITE_DEGRADED";
    }
    return "LEDGER_CONFLICT";
}

} // namespace core
} // namespace tradesync

#pragma once

#include <algorithm>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace tradesync {
namespace core {

// Owner of ghost positions that no configured strategy could claim
inline constexpr const char* kUnattributedStrategy = "unattributed";

// One attempted position, from intent to close. trade_id is never reused.
struct TradeRecord {
    std::string trade_id;
    std::string strategy_name;
    std::string symbol;
    PositionSide side = PositionSide::LONG;

    double quantity = 0.0;
    double entry_price = 0.0;
    double leverage = 1.0;
    double margin_used = 0.0;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;

    TradeStatus status = TradeStatus::PENDING;
    long long entry_time = 0;

    std::optional<long long> exit_time;
    std::optional<double> exit_price;
    std::string exit_reason;
    std::optional<double> pnl_absolute;
    std::optional<double> pnl_percentage;
    std::optional<long long> duration_ms;
    // Set when the exit filled less than quantity; PnL covers this amount only
    std::optional<double> closed_quantity;

    std::optional<std::string> exchange_order_ref;
    // Record this one continues after a partial exit
    std::optional<std::string> parent_trade_id;
    bool emergency = false;

    // Latest of entry and exit time
    long long lastActivityMs() const {
        return exit_time ? std::max(entry_time, *exit_time) : entry_time;
    }
};

bool operator==(const TradeRecord& lhs, const TradeRecord& rhs);
inline bool operator!=(const TradeRecord& lhs, const TradeRecord& rhs) { return !(lhs == rhs); }

// Partial update; unset fields are left untouched
struct TradeUpdate {
    std::optional<TradeStatus> status;
    std::optional<double> quantity;
    std::optional<double> entry_price;
    std::optional<double> margin_used;
    std::optional<long long> entry_time;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
    std::optional<long long> exit_time;
    std::optional<double> exit_price;
    std::optional<std::string> exit_reason;
    std::optional<double> pnl_absolute;
    std::optional<double> pnl_percentage;
    std::optional<long long> duration_ms;
    std::optional<double> closed_quantity;
    std::optional<std::string> exchange_order_ref;
};

nlohmann::json toJson(const TradeRecord& record);

// Throws std::invalid_argument on a missing trade_id or an unknown enum value
TradeRecord tradeRecordFromJson(const nlohmann::json& raw);

// trade_id, strategy_name, symbol, side, status, emergency=true
nlohmann::json toMinimalJson(const TradeRecord& record);

} // namespace core
} // namespace tradesync

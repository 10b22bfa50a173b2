#include "core/model/TradeRecord.h"

#include <stdexcept>

namespace tradesync {
namespace core {

namespace {
template<typename T>
void putOptional(nlohmann::json& raw, const char* key, const std::optional<T>& value) {
    if (value) {
        raw[key] = *value;
    } else {
        raw[key] = nullptr;
    }
}

template<typename T>
std::optional<T> getOptional(const nlohmann::json& raw, const char* key) {
    auto it = raw.find(key);
    if (it == raw.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}
}

bool operator==(const TradeRecord& lhs, const TradeRecord& rhs) {
    return lhs.trade_id == rhs.trade_id &&
           lhs.strategy_name == rhs.strategy_name &&
           lhs.symbol == rhs.symbol &&
           lhs.side == rhs.side &&
           lhs.quantity == rhs.quantity &&
           lhs.entry_price == rhs.entry_price &&
           lhs.leverage == rhs.leverage &&
           lhs.margin_used == rhs.margin_used &&
           lhs.stop_loss == rhs.stop_loss &&
           lhs.take_profit == rhs.take_profit &&
           lhs.status == rhs.status &&
           lhs.entry_time == rhs.entry_time &&
           lhs.exit_time == rhs.exit_time &&
           lhs.exit_price == rhs.exit_price &&
           lhs.exit_reason == rhs.exit_reason &&
           lhs.pnl_absolute == rhs.pnl_absolute &&
           lhs.pnl_percentage == rhs.pnl_percentage &&
           lhs.duration_ms == rhs.duration_ms &&
           lhs.closed_quantity == rhs.closed_quantity &&
           lhs.exchange_order_ref == rhs.exchange_order_ref &&
           lhs.parent_trade_id == rhs.parent_trade_id &&
           lhs.emergency == rhs.emergency;
}

nlohmann::json toJson(const TradeRecord& record) {
    nlohmann::json raw;
    raw["trade_id"] = record.trade_id;
    raw["strategy_name"] = record.strategy_name;
    raw["symbol"] = record.symbol;
    raw["side"] = toString(record.side);
    raw["quantity"] = record.quantity;
    raw["entry_price"] = record.entry_price;
    raw["leverage"] = record.leverage;
    raw["margin_used"] = record.margin_used;
    putOptional(raw, "stop_loss", record.stop_loss);
    putOptional(raw, "take_profit", record.take_profit);
    raw["status"] = toString(record.status);
    raw["entry_time"] = record.entry_time;
    putOptional(raw, "exit_time", record.exit_time);
    putOptional(raw, "exit_price", record.exit_price);
    raw["exit_reason"] = record.exit_reason;
    putOptional(raw, "pnl_absolute", record.pnl_absolute);
    putOptional(raw, "pnl_percentage", record.pnl_percentage);
    putOptional(raw, "duration_ms", record.duration_ms);
    putOptional(raw, "closed_quantity", record.closed_quantity);
    putOptional(raw, "exchange_order_ref", record.exchange_order_ref);
    putOptional(raw, "parent_trade_id", record.parent_trade_id);
    raw["emergency"] = record.emergency;
    return raw;
}

TradeRecord tradeRecordFromJson(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        throw std::invalid_argument("trade record is not an object");
    }

    TradeRecord record;
    record.trade_id = raw.value("trade_id", std::string());
    if (record.trade_id.empty()) {
        throw std::invalid_argument("trade record without trade_id");
    }
    record.strategy_name = raw.value("strategy_name", std::string());
    record.symbol = raw.value("symbol", std::string());

    const auto side = parsePositionSide(raw.value("side", std::string("LONG")));
    if (!side) {
        throw std::invalid_argument("trade " + record.trade_id + ": unknown side");
    }
    record.side = *side;

    const auto status = parseTradeStatus(raw.value("status", std::string("PENDING")));
    if (!status) {
        throw std::invalid_argument("trade " + record.trade_id + ": unknown status");
    }
    record.status = *status;

    record.quantity = raw.value("quantity", 0.0);
    record.entry_price = raw.value("entry_price", 0.0);
    record.leverage = raw.value("leverage", 1.0);
    record.margin_used = raw.value("margin_used", 0.0);
    record.stop_loss = getOptional<double>(raw, "stop_loss");
    record.take_profit = getOptional<double>(raw, "take_profit");
    record.entry_time = raw.value("entry_time", 0LL);
    record.exit_time = getOptional<long long>(raw, "exit_time");
    record.exit_price = getOptional<double>(raw, "exit_price");
    record.exit_reason = raw.value("exit_reason", std::string());
    record.pnl_absolute = getOptional<double>(raw, "pnl_absolute");
    record.pnl_percentage = getOptional<double>(raw, "pnl_percentage");
    record.duration_ms = getOptional<long long>(raw, "duration_ms");
    record.closed_quantity = getOptional<double>(raw, "closed_quantity");
    record.exchange_order_ref = getOptional<std::string>(raw, "exchange_order_ref");
    record.parent_trade_id = getOptional<std::string>(raw, "parent_trade_id");
    record.emergency = raw.value("emergency", false);
    return record;
}

nlohmann::json toMinimalJson(const TradeRecord& record) {
    nlohmann::json raw;
    raw["trade_id"] = record.trade_id;
    raw["strategy_name"] = record.strategy_name;
    raw["symbol"] = record.symbol;
    raw["side"] = toString(record.side);
    raw["status"] = toString(record.status);
    raw["emergency"] = true;
    return raw;
}

} // namespace core
} // namespace tradesync

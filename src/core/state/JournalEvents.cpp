#include "core/state/JournalEvents.h"

#include <stdexcept>

namespace tradesync {
namespace core {

namespace {
constexpr AnomalyType kAnomalyTypes[] = {
    AnomalyType::ORPHAN_DETECTED, AnomalyType::ORPHAN_CLEARED,
    AnomalyType::GHOST_DETECTED, AnomalyType::GHOST_CLEARED,
    AnomalyType::STALE_CLOSED, AnomalyType::LEDGER_CONFLICT,
    AnomalyType::RETRY_EXHAUSTED, AnomalyType::WRITE_DEGRADED
};

std::string stringField(const nlohmann::json& payload, const char* key) {
    if (!payload.is_object()) {
        return "";
    }
    auto it = payload.find(key);
    return (it != payload.end() && it->is_string()) ? it->get<std::string>() : "";
}
} // namespace

const char* toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::ANOMALY: return "ANOMALY";
        case JournalEventType::EMERGENCY_WRITE: return "EMERGENCY_WRITE";
        case JournalEventType::TRADE_ARCHIVED: return "TRADE_ARCHIVED";
    }
    return "ANOMALY";
}

std::optional<JournalEventType> parseJournalEventType(const std::string& value) {
    if (value == "ANOMALY") return JournalEventType::ANOMALY;
    if (value == "EMERGENCY_WRITE") return JournalEventType::EMERGENCY_WRITE;
    if (value == "TRADE_ARCHIVED") return JournalEventType::TRADE_ARCHIVED;
    return std::nullopt;
}

std::optional<AnomalyType> parseAnomalyType(const std::string& value) {
    for (const auto type : kAnomalyTypes) {
        if (value == toString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

JournalEvent emergencyWriteEvent(const TradeRecord& record, const std::string& reason, long long ts_ms) {
    JournalEvent event;
    event.ts_ms = ts_ms;
    event.type = JournalEventType::EMERGENCY_WRITE;
    event.symbol = record.symbol;
    event.entity_id = record.trade_id;
    event.payload["reason"] = reason;
    event.payload["record"] = toJson(record);
    return event;
}

JournalEvent anomalyEvent(AnomalyType type, const nlohmann::json& detail, long long ts_ms) {
    JournalEvent event;
    event.ts_ms = ts_ms;
    event.type = JournalEventType::ANOMALY;
    event.symbol = stringField(detail, "symbol");
    event.entity_id = stringField(detail, "trade_id");
    if (event.entity_id.empty()) {
        event.entity_id = stringField(detail, "key");
    }
    event.payload["anomaly"] = toString(type);
    event.payload["detail"] = detail;
    return event;
}

JournalEvent archivedTradeEvent(const TradeRecord& record, long long ts_ms) {
    JournalEvent event;
    event.ts_ms = ts_ms;
    event.type = JournalEventType::TRADE_ARCHIVED;
    event.symbol = record.symbol;
    event.entity_id = record.trade_id;
    event.payload["record"] = toJson(record);
    return event;
}

std::optional<TradeRecord> tradeFromEvent(const JournalEvent& event) {
    if (event.type == JournalEventType::ANOMALY || !event.payload.is_object()) {
        return std::nullopt;
    }
    auto it = event.payload.find("record");
    if (it == event.payload.end()) {
        return std::nullopt;
    }
    try {
        TradeRecord record = tradeRecordFromJson(*it);
        if (record.trade_id != event.entity_id) {
            return std::nullopt;
        }
        return record;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<AnomalyType> anomalyFromEvent(const JournalEvent& event) {
    if (event.type != JournalEventType::ANOMALY) {
        return std::nullopt;
    }
    return parseAnomalyType(stringField(event.payload, "anomaly"));
}

} // namespace core
} // namespace tradesync

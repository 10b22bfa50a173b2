#pragma once

#include <optional>
#include <string>

#include "core/model/PlaneTypes.h"
#include "core/model/TradeRecord.h"

namespace tradesync {
namespace core {

const char* toString(JournalEventType type);
std::optional<JournalEventType> parseJournalEventType(const std::string& value);
std::optional<AnomalyType> parseAnomalyType(const std::string& value);

// Full record as it stood when storage refused it; payload {reason, record}
JournalEvent emergencyWriteEvent(const TradeRecord& record, const std::string& reason, long long ts_ms);

// payload {anomaly, detail}; entity is the trade id, else the anomaly key
JournalEvent anomalyEvent(AnomalyType type, const nlohmann::json& detail, long long ts_ms);

// Terminal record leaving the ledger; payload {record}
JournalEvent archivedTradeEvent(const TradeRecord& record, long long ts_ms);

// Record carried by an EMERGENCY_WRITE or TRADE_ARCHIVED event
std::optional<TradeRecord> tradeFromEvent(const JournalEvent& event);

std::optional<AnomalyType> anomalyFromEvent(const JournalEvent& event);

} // namespace core
} // namespace tradesync

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Errors.h"
#include "common/TimeUtils.h"
#include "core/contracts/IAnomalyNotifier.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/ILedgerStorage.h"
#include "core/model/TradeRecord.h"

namespace tradesync {
namespace core {

struct LedgerOptions {
    int verify_retries = 3;
    int retry_backoff_ms = 50;
    double match_rel_tolerance = 0.01;
    double match_quantity_floor = 0.001;
    double match_price_floor = 0.01;
    int stale_trade_hours = 6;
    int retention_days = 30;
};

struct LedgerWriteResult {
    bool ok = false;
    bool degraded = false;     // only the minimal emergency record reached storage
    ErrorKind kind = ErrorKind::NONE;
    std::string reason;
};

// Durable store of TradeRecords. Every mutation is written through to storage
// and read back; the in-memory copy is what callers observe.
class TradeLedger {
public:
    TradeLedger(std::shared_ptr<ILedgerStorage> storage,
                LedgerOptions options,
                std::shared_ptr<IEventJournal> emergency_journal = nullptr,
                std::shared_ptr<IEventJournal> archive_journal = nullptr,
                utils::ClockFn clock = utils::systemClock());

    void setNotifier(std::shared_ptr<IAnomalyNotifier> notifier);

    // Never throws. An unusable document is quarantined and the ledger starts empty.
    void load();

    LedgerWriteResult put(const TradeRecord& record);
    std::optional<TradeRecord> get(const std::string& trade_id) const;
    LedgerWriteResult update(const std::string& trade_id, const TradeUpdate& partial);

    // Tolerant match for reconciliation; an empty strategy matches any strategy.
    // Newest entry first.
    std::vector<TradeRecord> find(const std::string& strategy,
                                  const std::string& symbol,
                                  PositionSide side,
                                  double quantity,
                                  double price,
                                  const std::vector<TradeStatus>& statuses) const;

    std::vector<TradeRecord> all() const;
    std::vector<TradeRecord> byStatus(const std::vector<TradeStatus>& statuses) const;
    std::vector<TradeRecord> activeForStrategy(const std::string& strategy) const;

    // Most recent entry or exit on symbol+side across all records, 0 if none
    long long lastActivityMs(const std::string& symbol, PositionSide side) const;

    // OPEN records older than stale_trade_hours become CLOSED "stale-auto-closed"
    std::vector<TradeRecord> closeStaleTrades();

    // Terminal records past retention_days go to the archive journal and leave the store
    std::size_t archiveExpired();

    std::string lastQuarantinePath() const;
    const LedgerOptions& options() const { return options_; }

private:
    LedgerWriteResult persistVerified(const TradeRecord& record);
    bool storedCopyMatches(const TradeRecord& record);
    bool writeEmergency(const TradeRecord& record, const std::string& reason);
    // Swaps minimal emergency entries for the full copies the journal holds
    std::size_t restoreFromEmergencyJournal();
    nlohmann::json buildDocument() const;
    bool matches(const TradeRecord& record, double quantity, double price) const;

    std::shared_ptr<ILedgerStorage> storage_;
    LedgerOptions options_;
    std::shared_ptr<IEventJournal> emergency_journal_;
    std::shared_ptr<IEventJournal> archive_journal_;
    std::shared_ptr<IAnomalyNotifier> notifier_;
    utils::ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<std::string, TradeRecord> trades_;
    std::string last_quarantine_path_;
};

} // namespace core
} // namespace tradesync

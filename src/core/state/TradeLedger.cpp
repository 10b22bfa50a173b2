#include "core/state/TradeLedger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

#include "common/Logger.h"
#include "core/execution/PositionLifecycleStateMachine.h"
#include "core/state/JournalEvents.h"

namespace tradesync {
namespace core {

namespace {
constexpr long long kHourMs = 60LL * 60LL * 1000LL;
constexpr long long kDayMs = 24LL * kHourMs;

bool hasStatus(const std::vector<TradeStatus>& statuses, TradeStatus status) {
    return statuses.empty() || std::find(statuses.begin(), statuses.end(), status) != statuses.end();
}

void applyUpdate(TradeRecord& record, const TradeUpdate& partial) {
    if (partial.status) record.status = *partial.status;
    if (partial.quantity) record.quantity = *partial.quantity;
    if (partial.entry_price) record.entry_price = *partial.entry_price;
    if (partial.margin_used) record.margin_used = *partial.margin_used;
    if (partial.entry_time) record.entry_time = *partial.entry_time;
    if (partial.stop_loss) record.stop_loss = partial.stop_loss;
    if (partial.take_profit) record.take_profit = partial.take_profit;
    if (partial.exit_time) record.exit_time = partial.exit_time;
    if (partial.exit_price) record.exit_price = partial.exit_price;
    if (partial.exit_reason) record.exit_reason = *partial.exit_reason;
    if (partial.pnl_absolute) record.pnl_absolute = partial.pnl_absolute;
    if (partial.pnl_percentage) record.pnl_percentage = partial.pnl_percentage;
    if (partial.duration_ms) record.duration_ms = partial.duration_ms;
    if (partial.closed_quantity) record.closed_quantity = partial.closed_quantity;
    if (partial.exchange_order_ref) record.exchange_order_ref = partial.exchange_order_ref;
}

LedgerWriteResult rejected(const std::string& reason) {
    LedgerWriteResult result;
    result.ok = false;
    result.kind = ErrorKind::INVARIANT_VIOLATION;
    result.reason = reason;
    return result;
}

void sortNewestFirst(std::vector<TradeRecord>& records) {
    std::sort(records.begin(), records.end(), [](const TradeRecord& a, const TradeRecord& b) {
        return a.entry_time > b.entry_time;
    });
}
} // namespace

TradeLedger::TradeLedger(std::shared_ptr<ILedgerStorage> storage,
                         LedgerOptions options,
                         std::shared_ptr<IEventJournal> emergency_journal,
                         std::shared_ptr<IEventJournal> archive_journal,
                         utils::ClockFn clock)
    : storage_(std::move(storage))
    , options_(options)
    , emergency_journal_(std::move(emergency_journal))
    , archive_journal_(std::move(archive_journal))
    , clock_(std::move(clock)) {}

void TradeLedger::setNotifier(std::shared_ptr<IAnomalyNotifier> notifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    notifier_ = std::move(notifier);
}

void TradeLedger::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    trades_.clear();

    std::optional<nlohmann::json> document;
    try {
        document = storage_->load();
    } catch (const std::exception& e) {
        last_quarantine_path_ = storage_->quarantine();
        LOG_ERROR("Trade ledger unreadable ({}), moved to '{}', starting empty",
                  e.what(), last_quarantine_path_);
        return;
    }

    if (!document) {
        LOG_INFO("Trade ledger not found, starting empty");
        return;
    }

    const auto trades = document->find("trades");
    if (trades == document->end() || !trades->is_object()) {
        last_quarantine_path_ = storage_->quarantine();
        LOG_ERROR("Trade ledger has no trades map, moved to '{}', starting empty", last_quarantine_path_);
        return;
    }

    int skipped = 0;
    for (auto it = trades->begin(); it != trades->end(); ++it) {
        try {
            TradeRecord record = tradeRecordFromJson(it.value());
            trades_[record.trade_id] = std::move(record);
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Trade ledger: skipping entry '{}': {}", it.key(), e.what());
        }
    }

    LOG_INFO("Trade ledger loaded: {} records ({} skipped)", trades_.size(), skipped);

    if (restoreFromEmergencyJournal() > 0) {
        bool saved = false;
        try {
            saved = storage_->save(buildDocument());
        } catch (const std::exception& e) {
            LOG_ERROR("Trade ledger save after emergency restore failed: {}", e.what());
        }
        if (!saved) {
            LOG_WARN("Trade ledger: restored records stay in memory until the next successful write");
        }
    }
}

LedgerWriteResult TradeLedger::put(const TradeRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (record.trade_id.empty()) {
        return rejected("trade_id is empty");
    }

    auto existing = trades_.find(record.trade_id);
    if (existing != trades_.end()) {
        if (existing->second != record) {
            return rejected("trade_id " + record.trade_id + " already exists");
        }
        if (storedCopyMatches(record)) {
            LedgerWriteResult result;
            result.ok = true;
            return result;
        }
        return persistVerified(record);
    }

    if (isActiveStatus(record.status) && record.strategy_name != kUnattributedStrategy) {
        for (const auto& [id, other] : trades_) {
            if (other.strategy_name == record.strategy_name && isActiveStatus(other.status)) {
                return rejected("strategy " + record.strategy_name + " already has active trade " + id);
            }
        }
    }

    return persistVerified(record);
}

std::optional<TradeRecord> TradeLedger::get(const std::string& trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        return std::nullopt;
    }
    return it->second;
}

LedgerWriteResult TradeLedger::update(const std::string& trade_id, const TradeUpdate& partial) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        return rejected("unknown trade " + trade_id);
    }

    const TradeRecord& stored = it->second;
    TradeRecord candidate = stored;
    applyUpdate(candidate, partial);

    if (!execution::PositionLifecycleStateMachine::canTransition(stored.status, candidate.status)) {
        return rejected(std::string("transition ") + toString(stored.status) + " -> " +
                        toString(candidate.status) + " not allowed for " + trade_id);
    }

    // Closed and orphaned records are final; only an identical write passes
    if (isTerminalStatus(stored.status) && !stored.emergency && candidate != stored) {
        return rejected(std::string(toString(stored.status)) + " record " + trade_id + " is final");
    }

    // Emergency records lost their economics and may be backfilled
    if (stored.status != TradeStatus::PENDING && !stored.emergency) {
        if (candidate.quantity != stored.quantity ||
            candidate.entry_price != stored.entry_price ||
            candidate.margin_used != stored.margin_used) {
            return rejected("quantity, entry_price and margin_used are immutable once " +
                            std::string(toString(stored.status)) + " (" + trade_id + ")");
        }
    }

    // A backfilled record is whole again and loses its exemption
    if (candidate.emergency && candidate.quantity > 0.0 && candidate.entry_price > 0.0) {
        candidate.emergency = false;
    }

    if (candidate == stored && storedCopyMatches(stored)) {
        LedgerWriteResult result;
        result.ok = true;
        return result;
    }

    return persistVerified(candidate);
}

std::vector<TradeRecord> TradeLedger::find(const std::string& strategy,
                                           const std::string& symbol,
                                           PositionSide side,
                                           double quantity,
                                           double price,
                                           const std::vector<TradeStatus>& statuses) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TradeRecord> out;
    for (const auto& [id, record] : trades_) {
        if (!strategy.empty() && record.strategy_name != strategy) continue;
        if (record.symbol != symbol || record.side != side) continue;
        if (!hasStatus(statuses, record.status)) continue;
        if (!matches(record, quantity, price)) continue;
        out.push_back(record);
    }
    sortNewestFirst(out);
    return out;
}

std::vector<TradeRecord> TradeLedger::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TradeRecord> out;
    out.reserve(trades_.size());
    for (const auto& [id, record] : trades_) {
        out.push_back(record);
    }
    sortNewestFirst(out);
    return out;
}

std::vector<TradeRecord> TradeLedger::byStatus(const std::vector<TradeStatus>& statuses) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TradeRecord> out;
    for (const auto& [id, record] : trades_) {
        if (hasStatus(statuses, record.status)) {
            out.push_back(record);
        }
    }
    sortNewestFirst(out);
    return out;
}

std::vector<TradeRecord> TradeLedger::activeForStrategy(const std::string& strategy) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TradeRecord> out;
    for (const auto& [id, record] : trades_) {
        if (record.strategy_name == strategy && isActiveStatus(record.status)) {
            out.push_back(record);
        }
    }
    sortNewestFirst(out);
    return out;
}

long long TradeLedger::lastActivityMs(const std::string& symbol, PositionSide side) const {
    std::lock_guard<std::mutex> lock(mutex_);
    long long latest = 0;
    for (const auto& [id, record] : trades_) {
        if (record.symbol == symbol && record.side == side) {
            latest = std::max(latest, record.lastActivityMs());
        }
    }
    return latest;
}

std::vector<TradeRecord> TradeLedger::closeStaleTrades() {
    std::vector<std::string> stale_ids;
    const long long now = clock_();
    const long long threshold = now - static_cast<long long>(options_.stale_trade_hours) * kHourMs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, record] : trades_) {
            if (record.status == TradeStatus::OPEN && record.entry_time < threshold) {
                stale_ids.push_back(id);
            }
        }
    }

    std::vector<TradeRecord> closed;
    for (const auto& id : stale_ids) {
        auto record = get(id);
        if (!record) {
            continue;
        }

        TradeUpdate close;
        close.status = TradeStatus::CLOSED;
        close.exit_time = now;
        close.exit_reason = std::string("stale-auto-closed");
        close.pnl_absolute = 0.0;
        close.pnl_percentage = 0.0;
        close.duration_ms = now - record->entry_time;

        const auto result = update(id, close);
        if (!result.ok && !result.degraded) {
            LOG_ERROR("Stale close of {} failed: {}", id, result.reason);
            continue;
        }
        LOG_WARN("Stale trade {} ({} {} {}) opened {} auto-closed after {}h",
                 id, record->strategy_name, record->symbol, toString(record->side),
                 utils::formatIsoUtc(record->entry_time), (now - record->entry_time) / kHourMs);

        std::shared_ptr<IAnomalyNotifier> notifier;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            notifier = notifier_;
        }
        if (notifier) {
            nlohmann::json payload;
            payload["trade_id"] = id;
            payload["strategy"] = record->strategy_name;
            payload["symbol"] = record->symbol;
            payload["side"] = toString(record->side);
            payload["entry_time"] = record->entry_time;
            notifier->notify(AnomalyType::STALE_CLOSED, payload);
        }
        if (auto updated = get(id)) {
            closed.push_back(*updated);
        }
    }
    return closed;
}

std::size_t TradeLedger::archiveExpired() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (options_.retention_days <= 0) {
        return 0;
    }

    const long long now = clock_();
    const long long threshold = now - static_cast<long long>(options_.retention_days) * kDayMs;

    std::vector<std::string> expired;
    for (const auto& [id, record] : trades_) {
        if (isTerminalStatus(record.status) && record.lastActivityMs() < threshold) {
            expired.push_back(id);
        }
    }
    if (expired.empty()) {
        return 0;
    }
    if (!archive_journal_) {
        LOG_WARN("Retention: {} expired records kept, no archive configured", expired.size());
        return 0;
    }

    std::size_t archived = 0;
    for (const auto& id : expired) {
        const auto& record = trades_.at(id);
        if (!archive_journal_->append(archivedTradeEvent(record, now))) {
            LOG_ERROR("Retention: archive append failed for {}, record kept", id);
            continue;
        }
        trades_.erase(id);
        ++archived;
    }

    bool saved = false;
    try {
        saved = storage_->save(buildDocument());
    } catch (const std::exception& e) {
        LOG_ERROR("Retention: ledger save failed: {}", e.what());
    }
    if (!saved) {
        // Archived copies stay in the journal; the next successful write drops them from storage.
        LOG_WARN("Retention: ledger save after archiving did not complete");
    }

    LOG_INFO("Retention: archived {} records older than {} days", archived, options_.retention_days);
    return archived;
}

std::string TradeLedger::lastQuarantinePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_quarantine_path_;
}

LedgerWriteResult TradeLedger::persistVerified(const TradeRecord& record) {
    trades_[record.trade_id] = record;

    const int attempts = std::max(1, options_.verify_retries);
    auto backoff = std::chrono::milliseconds(std::max(0, options_.retry_backoff_ms));
    std::string reason;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            if (!storage_->save(buildDocument())) {
                reason = "save failed";
            } else if (storedCopyMatches(record)) {
                LedgerWriteResult result;
                result.ok = true;
                return result;
            } else {
                reason = "read-back mismatch";
            }
        } catch (const std::exception& e) {
            reason = e.what();
        }

        LOG_WARN("Ledger write of {} failed (attempt {}/{}): {}", record.trade_id, attempt, attempts, reason);
        if (attempt < attempts && backoff.count() > 0) {
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }

    const bool journaled = writeEmergency(record, reason);

    LedgerWriteResult result;
    result.ok = false;
    result.degraded = true;
    result.kind = ErrorKind::TRANSIENT;
    result.reason = "ledger write degraded: " + reason + (journaled ? "" : " (emergency journal failed)");
    return result;
}

bool TradeLedger::storedCopyMatches(const TradeRecord& record) {
    try {
        const auto stored = storage_->load();
        if (!stored) {
            return false;
        }
        const auto trades = stored->find("trades");
        if (trades == stored->end() || !trades->is_object()) {
            return false;
        }
        const auto entry = trades->find(record.trade_id);
        if (entry == trades->end()) {
            return false;
        }
        return tradeRecordFromJson(*entry) == record;
    } catch (const std::exception& e) {
        LOG_WARN("Ledger read-back of {} failed: {}", record.trade_id, e.what());
        return false;
    }
}

bool TradeLedger::writeEmergency(const TradeRecord& record, const std::string& reason) {
    LOG_ERROR("Ledger write of {} exhausted retries ({}), writing emergency record", record.trade_id, reason);

    nlohmann::json document = buildDocument();
    document["trades"][record.trade_id] = toMinimalJson(record);
    try {
        if (!storage_->save(document)) {
            LOG_ERROR("Emergency ledger save failed for {}", record.trade_id);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Emergency ledger save failed for {}: {}", record.trade_id, e.what());
    }

    bool journaled = false;
    if (emergency_journal_) {
        journaled = emergency_journal_->append(emergencyWriteEvent(record, reason, clock_()));
    }

    if (notifier_) {
        nlohmann::json payload;
        payload["trade_id"] = record.trade_id;
        payload["strategy"] = record.strategy_name;
        payload["symbol"] = record.symbol;
        payload["status"] = toString(record.status);
        payload["reason"] = reason;
        payload["journaled"] = journaled;
        notifier_->notify(AnomalyType::WRITE_DEGRADED, payload);
    }
    return journaled;
}

std::size_t TradeLedger::restoreFromEmergencyJournal() {
    if (!emergency_journal_) {
        return 0;
    }
    const bool any_emergency = std::any_of(trades_.begin(), trades_.end(), [](const auto& entry) {
        return entry.second.emergency;
    });
    if (!any_emergency) {
        return 0;
    }

    // Later events win; each one reflects the newest write storage refused
    std::map<std::string, TradeRecord> journaled;
    for (const auto& event : emergency_journal_->readFrom(0)) {
        if (event.type != JournalEventType::EMERGENCY_WRITE) {
            continue;
        }
        if (auto record = tradeFromEvent(event)) {
            journaled[record->trade_id] = std::move(*record);
        }
    }

    std::size_t restored = 0;
    for (auto& [id, record] : trades_) {
        if (!record.emergency) {
            continue;
        }
        auto it = journaled.find(id);
        if (it == journaled.end() || it->second.status != record.status) {
            LOG_WARN("Trade ledger: emergency record {} has no matching journal copy", id);
            continue;
        }
        record = it->second;
        record.emergency = false;
        ++restored;
        LOG_INFO("Trade ledger: restored {} {} from the emergency journal", id, toString(record.status));
    }
    return restored;
}

nlohmann::json TradeLedger::buildDocument() const {
    nlohmann::json document;
    document["trades"] = nlohmann::json::object();
    for (const auto& [id, record] : trades_) {
        document["trades"][id] = toJson(record);
    }
    document["last_updated"] = clock_();
    return document;
}

bool TradeLedger::matches(const TradeRecord& record, double quantity, double price) const {
    const double quantity_tolerance = std::max(std::abs(quantity) * options_.match_rel_tolerance,
                                               options_.match_quantity_floor);
    const double price_tolerance = std::max(std::abs(price) * options_.match_rel_tolerance,
                                            options_.match_price_floor);
    return std::abs(record.quantity - quantity) <= quantity_tolerance &&
           std::abs(record.entry_price - price) <= price_tolerance;
}

} // namespace core
} // namespace tradesync

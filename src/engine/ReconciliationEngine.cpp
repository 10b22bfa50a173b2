#include "engine/ReconciliationEngine.h"

#include <algorithm>

#include "common/Logger.h"
#include "common/Uuid.h"
#include "core/execution/PnlCalculator.h"

namespace tradesync {
namespace engine {

using core::AnomalyType;
using core::TradeRecord;
using core::execution::PnlCalculator;

namespace {
constexpr const char* kOrphanPrefix = "orphan:";
constexpr const char* kGhostPrefix = "ghost:";

std::string ghostKey(const std::string& symbol, PositionSide side) {
    return std::string(kGhostPrefix) + symbol + ":" + toString(side);
}

bool hasOpenRecordOn(const core::TradeLedger& ledger, const std::string& symbol, PositionSide side) {
    for (const auto& record : ledger.byStatus({TradeStatus::OPEN, TradeStatus::GHOST_ADOPTED})) {
        if (record.symbol == symbol && record.side == side) {
            return true;
        }
    }
    return false;
}

AnomalyType clearedTypeFor(AnomalyType detected) {
    return (detected == AnomalyType::GHOST_DETECTED) ? AnomalyType::GHOST_CLEARED : AnomalyType::ORPHAN_CLEARED;
}
} // namespace

ReconciliationEngine::ReconciliationEngine(std::shared_ptr<core::TradeLedger> ledger,
                                           std::shared_ptr<risk::PositionSlotRegistry> registry,
                                           std::shared_ptr<core::IExchangeGateway> gateway,
                                           std::shared_ptr<core::IAnomalyNotifier> notifier,
                                           std::vector<StrategyConfig> strategies,
                                           ReconciliationOptions options,
                                           utils::ClockFn clock)
    : ledger_(std::move(ledger))
    , registry_(std::move(registry))
    , gateway_(std::move(gateway))
    , notifier_(std::move(notifier))
    , strategies_(std::move(strategies))
    , options_(options)
    , clock_(std::move(clock)) {}

ReconciliationReport ReconciliationEngine::runCycle() {
    std::unique_lock<std::mutex> guard(cycle_mutex_, std::try_to_lock);
    if (!guard.owns_lock()) {
        ReconciliationReport busy;
        busy.skipped = true;
        busy.error = "cycle already running";
        LOG_WARN("Reconciliation: previous cycle still running, skipping");
        return busy;
    }

    const auto started = std::chrono::steady_clock::now();
    CycleState cycle;
    cycle.now = clock_();
    cycle.deadline = started + std::chrono::seconds(std::max(1, options_.cycle_timeout_seconds));

    std::vector<core::LivePosition> positions;
    try {
        positions = retryWithBackoff(options_.gateway_retry, "getLivePositions",
                                     [&]() { return gateway_->getLivePositions(); });
    } catch (const GatewayError& e) {
        if (e.isTransient()) {
            reportRetryExhausted("getLivePositions", e.what());
        }
        LOG_ERROR("Reconciliation: position snapshot unavailable, cycle skipped: {}", e.what());
        cycle.report.skipped = true;
        cycle.report.error = e.what();
        return cycle.report;
    }

    for (const auto& position : positions) {
        cycle.live[{position.symbol, position.side}] = position;
    }
    cycle.report.live_positions = static_cast<int>(cycle.live.size());

    for (const auto& record : ledger_->byStatus({TradeStatus::PENDING, TradeStatus::OPEN,
                                                 TradeStatus::GHOST_ADOPTED})) {
        if (pastDeadline(cycle)) {
            break;
        }
        reconcileRecord(cycle, record);
    }

    if (!cycle.report.timed_out) {
        for (const auto& [key, position] : cycle.live) {
            if (pastDeadline(cycle)) {
                break;
            }
            reconcileGhost(cycle, position);
        }
    }

    // A partial pass cannot tell resolved conditions from unvisited ones
    if (!pastDeadline(cycle)) {
        clearResolved(cycle);
    }

    cycle.report.completed = !cycle.report.timed_out;
    cycle.report.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    const auto& r = cycle.report;
    if (r.orphans_detected || r.ghosts_detected || r.promoted || r.timed_out) {
        LOG_INFO("Reconciliation: live={} orphans={}/{} ghosts={}/{} promoted={} busy={} recent={} ({}ms{})",
                 r.live_positions, r.orphans_healed, r.orphans_detected, r.ghosts_adopted, r.ghosts_detected,
                 r.promoted, r.busy_skipped, r.recent_skipped, r.duration_ms, r.timed_out ? ", timed out" : "");
    } else {
        LOG_DEBUG("Reconciliation: in sync, live={} busy={} recent={} ({}ms)",
                  r.live_positions, r.busy_skipped, r.recent_skipped, r.duration_ms);
    }
    return cycle.report;
}

ReconciliationReport ReconciliationEngine::recoverOnStartup() {
    std::set<std::string> restored;
    int conflicts = 0;

    // Newest first, so the most recent active record keeps the slot
    for (const auto& record : ledger_->byStatus({TradeStatus::PENDING, TradeStatus::OPEN,
                                                 TradeStatus::GHOST_ADOPTED})) {
        if (record.strategy_name == core::kUnattributedStrategy) {
            continue;
        }
        if (restored.count(record.strategy_name) ||
            !registry_->restore(record.strategy_name, record.trade_id, record.entry_time)) {
            ++conflicts;
            reportConflict(record.trade_id, "strategy " + record.strategy_name + " has more than one active trade");
            continue;
        }
        restored.insert(record.strategy_name);
        LOG_INFO("Recovery: {} restored {} ({} {} {})", record.strategy_name, record.trade_id,
                 toString(record.status), record.symbol, toString(record.side));
    }

    LOG_INFO("Recovery: {} slots restored, {} conflicts", restored.size(), conflicts);
    return runCycle();
}

bool ReconciliationEngine::isAnomalyActive(const std::string& key) const {
    std::lock_guard<std::mutex> lock(anomaly_mutex_);
    return active_anomalies_.count(key) > 0;
}

std::size_t ReconciliationEngine::activeAnomalyCount() const {
    std::lock_guard<std::mutex> lock(anomaly_mutex_);
    return active_anomalies_.size();
}

bool ReconciliationEngine::pastDeadline(CycleState& cycle) const {
    if (cycle.report.timed_out) {
        return true;
    }
    if (std::chrono::steady_clock::now() > cycle.deadline) {
        cycle.report.timed_out = true;
        LOG_WARN("Reconciliation: cycle exceeded {}s, stopping early", options_.cycle_timeout_seconds);
        return true;
    }
    return false;
}

bool ReconciliationEngine::withinGrace(long long activity_ms, long long now) const {
    return activity_ms > 0 &&
           now - activity_ms < static_cast<long long>(options_.recent_trade_grace_seconds) * 1000LL;
}

void ReconciliationEngine::reconcileRecord(CycleState& cycle, const TradeRecord& candidate) {
    if (cycle.live.count({candidate.symbol, candidate.side})) {
        if (candidate.status == TradeStatus::GHOST_ADOPTED) {
            promoteGhost(cycle, candidate);
        }
        return;
    }

    const std::string key = kOrphanPrefix + candidate.trade_id;
    if (withinGrace(candidate.lastActivityMs(), cycle.now)) {
        ++cycle.report.recent_skipped;
        carry(cycle, key);
        return;
    }

    auto lock = registry_->tryLockStrategy(candidate.strategy_name);
    if (!lock.owns_lock()) {
        ++cycle.report.busy_skipped;
        carry(cycle, key);
        LOG_DEBUG("Reconciliation: {} busy, orphan check of {} deferred", candidate.strategy_name, candidate.trade_id);
        return;
    }

    // The controller may have finished the trade before the lock was taken
    const auto record = ledger_->get(candidate.trade_id);
    if (!record || !isActiveStatus(record->status)) {
        return;
    }

    cycle.observed.insert(key);
    ++cycle.report.orphans_detected;

    nlohmann::json payload;
    payload["trade_id"] = record->trade_id;
    payload["strategy"] = record->strategy_name;
    payload["symbol"] = record->symbol;
    payload["side"] = toString(record->side);
    payload["status"] = toString(record->status);
    payload["entry_time"] = record->entry_time;
    report(AnomalyType::ORPHAN_DETECTED, key, payload);

    healOrphan(cycle, *record);
}

void ReconciliationEngine::promoteGhost(CycleState& cycle, const TradeRecord& candidate) {
    auto lock = registry_->tryLockStrategy(candidate.strategy_name);
    if (!lock.owns_lock()) {
        ++cycle.report.busy_skipped;
        return;
    }

    const auto record = ledger_->get(candidate.trade_id);
    if (!record || record->status != TradeStatus::GHOST_ADOPTED) {
        return;
    }

    core::TradeUpdate promote;
    promote.status = TradeStatus::OPEN;
    const auto written = ledger_->update(record->trade_id, promote);
    if (!written.ok && !written.degraded) {
        reportConflict(record->trade_id, written.reason);
        return;
    }

    if (record->strategy_name != core::kUnattributedStrategy && !registry_->isOccupied(record->strategy_name)) {
        registry_->restore(record->strategy_name, record->trade_id, record->entry_time);
    }
    ++cycle.report.promoted;
    LOG_INFO("Reconciliation: adopted trade {} ({} {} {}) promoted to OPEN",
             record->trade_id, record->strategy_name, record->symbol, toString(record->side));
}

void ReconciliationEngine::healOrphan(CycleState& cycle, const TradeRecord& record) {
    const long long now = cycle.now;
    core::TradeUpdate heal;

    if (record.status == TradeStatus::PENDING) {
        heal.status = TradeStatus::ORPHANED;
        heal.exit_time = now;
        heal.exit_reason = std::string("orphan-pending-unconfirmed");
        heal.pnl_absolute = 0.0;
        heal.pnl_percentage = 0.0;
        heal.duration_ms = now - record.entry_time;
    } else {
        const long long lookback_ms = static_cast<long long>(options_.orphan_fill_lookback_minutes) * 60LL * 1000LL;
        const long long since = std::max(record.entry_time, now - lookback_ms);

        std::vector<core::Fill> fills;
        try {
            fills = retryWithBackoff(options_.gateway_retry, "getRecentFills " + record.symbol,
                                     [&]() { return gateway_->getRecentFills(record.symbol, since); });
        } catch (const GatewayError& e) {
            if (e.isTransient()) {
                // Healing without the fill history would guess the exit; try next cycle
                reportRetryExhausted("getRecentFills", e.what());
                return;
            }
            LOG_WARN("Reconciliation: fill history for {} unavailable: {}", record.symbol, e.what());
        }

        // A split remainder owns only the fills after its parent's exit
        long long owned_after = record.entry_time - 1;
        if (record.parent_trade_id) {
            const auto parent = ledger_->get(*record.parent_trade_id);
            if (parent && parent->exit_time) {
                owned_after = std::max(owned_after, *parent->exit_time);
            }
        }

        const OrderSide closing_side = exitOrderSide(record.side);
        double volume = 0.0;
        double notional = 0.0;
        long long latest = 0;
        bool liquidated = false;
        for (const auto& fill : fills) {
            if (fill.side != closing_side || fill.time_ms <= owned_after || !(fill.quantity > 0.0)) {
                continue;
            }
            volume += fill.quantity;
            notional += fill.quantity * fill.price;
            latest = std::max(latest, fill.time_ms);
            liquidated = liquidated || fill.liquidation;
        }

        double exit_price = record.entry_price;
        long long exit_time = now;
        std::string reason;
        if (volume > 0.0) {
            exit_price = notional / volume;
            exit_time = latest;
            reason = liquidated ? "liquidation" : "orphan-recovered";
        } else {
            reason = "orphan-unresolved";
            try {
                const double mark = retryWithBackoff(options_.gateway_retry, "getMarkPrice " + record.symbol,
                                                     [&]() { return gateway_->getMarkPrice(record.symbol); });
                if (mark > 0.0) {
                    exit_price = mark;
                }
            } catch (const GatewayError& e) {
                LOG_WARN("Reconciliation: no mark price for {}, closing {} at zero PnL: {}",
                         record.symbol, record.trade_id, e.what());
            }
        }

        const auto pnl = PnlCalculator::compute(record.side, record.entry_price, exit_price,
                                                record.quantity, record.margin_used);
        heal.status = TradeStatus::CLOSED;
        heal.exit_time = exit_time;
        heal.exit_price = exit_price;
        heal.exit_reason = reason;
        heal.pnl_absolute = pnl.absolute;
        heal.pnl_percentage = pnl.percentage;
        heal.duration_ms = exit_time - record.entry_time;
    }

    const auto written = ledger_->update(record.trade_id, heal);
    if (!written.ok && !written.degraded) {
        reportConflict(record.trade_id, written.reason);
        return;
    }

    const bool was_open = (record.status != TradeStatus::PENDING);
    registry_->releaseIfBound(record.strategy_name, record.trade_id, was_open);
    ++cycle.report.orphans_healed;

    if (was_open) {
        Logger::getInstance().logTrade(record.trade_id, record.strategy_name, record.symbol, toString(record.side),
                                       record.entry_price, heal.exit_price.value_or(record.entry_price),
                                       record.quantity, heal.pnl_absolute.value_or(0.0), *heal.exit_reason);
    }
    LOG_WARN("Reconciliation: orphan {} ({} {} {}) -> {} reason={} pnl={:.4f}",
             record.trade_id, record.strategy_name, record.symbol, toString(record.side),
             toString(*heal.status), *heal.exit_reason, heal.pnl_absolute.value_or(0.0));
}

void ReconciliationEngine::reconcileGhost(CycleState& cycle, const core::LivePosition& position) {
    if (hasOpenRecordOn(*ledger_, position.symbol, position.side)) {
        return;
    }

    const std::string key = ghostKey(position.symbol, position.side);
    if (withinGrace(ledger_->lastActivityMs(position.symbol, position.side), cycle.now)) {
        ++cycle.report.recent_skipped;
        carry(cycle, key);
        return;
    }

    const auto matched = attribute(position, cycle.now);
    std::string strategy = matched ? matched->strategy_name : strategyForSymbol(position.symbol);
    if (strategy.empty()) {
        strategy = core::kUnattributedStrategy;
    }

    auto lock = registry_->tryLockStrategy(strategy);
    if (!lock.owns_lock()) {
        ++cycle.report.busy_skipped;
        carry(cycle, key);
        return;
    }
    if (hasOpenRecordOn(*ledger_, position.symbol, position.side)) {
        return;
    }

    cycle.observed.insert(key);
    ++cycle.report.ghosts_detected;

    nlohmann::json payload;
    payload["key"] = key;
    payload["symbol"] = position.symbol;
    payload["side"] = toString(position.side);
    payload["quantity"] = position.quantity;
    payload["entry_price"] = position.entry_price;
    payload["strategy"] = strategy;
    payload["matched_trade_id"] = matched ? matched->trade_id : "";

    bool ambiguous = false;
    if (strategy != core::kUnattributedStrategy) {
        for (const auto& active : ledger_->activeForStrategy(strategy)) {
            if (!matched || active.trade_id != matched->trade_id) {
                ambiguous = true;
            }
        }
        const auto slot = registry_->slot(strategy);
        if (slot && slot->occupied && (!matched || slot->trade_id != matched->trade_id)) {
            ambiguous = true;
        }
    }

    if (ambiguous) {
        payload["adopted"] = false;
        payload["ambiguous"] = true;
        report(AnomalyType::GHOST_DETECTED, key, payload);
        LOG_WARN("Reconciliation: ghost {} {} qty={:.6f} left unadopted, {} already holds a position",
                 position.symbol, toString(position.side), position.quantity, strategy);
        return;
    }

    payload["adopted"] = true;
    report(AnomalyType::GHOST_DETECTED, key, payload);

    std::optional<std::string> order_ref;
    if (matched) {
        order_ref = matched->exchange_order_ref;
        if (matched->status == TradeStatus::PENDING) {
            const auto current = ledger_->get(matched->trade_id);
            if (!current || current->status != TradeStatus::PENDING) {
                return;
            }

            core::TradeUpdate superseded;
            superseded.status = TradeStatus::ORPHANED;
            superseded.exit_time = cycle.now;
            superseded.exit_reason = std::string("adopted-as-ghost");
            superseded.pnl_absolute = 0.0;
            superseded.pnl_percentage = 0.0;
            superseded.duration_ms = cycle.now - current->entry_time;
            const auto written = ledger_->update(current->trade_id, superseded);
            if (!written.ok && !written.degraded) {
                reportConflict(current->trade_id, written.reason);
                return;
            }
            registry_->releaseIfBound(strategy, current->trade_id, false);
        }
    }

    TradeRecord adopted;
    adopted.trade_id = utils::generateUUID();
    adopted.strategy_name = strategy;
    adopted.symbol = position.symbol;
    adopted.side = position.side;
    adopted.quantity = position.quantity;
    adopted.entry_price = position.entry_price;
    adopted.leverage = std::max(1.0, position.leverage);
    adopted.margin_used = PnlCalculator::marginUsed(position.entry_price, position.quantity, adopted.leverage);
    if (matched) {
        adopted.stop_loss = matched->stop_loss;
        adopted.take_profit = matched->take_profit;
    }
    adopted.status = TradeStatus::GHOST_ADOPTED;
    adopted.entry_time = cycle.now;
    adopted.exchange_order_ref = order_ref;

    const auto written = ledger_->put(adopted);
    if (!written.ok && !written.degraded) {
        reportConflict(adopted.trade_id, written.reason);
        return;
    }
    if (strategy != core::kUnattributedStrategy) {
        registry_->restore(strategy, adopted.trade_id, adopted.entry_time);
    }

    ++cycle.report.ghosts_adopted;
    LOG_WARN("Reconciliation: ghost {} {} qty={:.6f} @ {:.4f} adopted as {} for {}{}",
             position.symbol, toString(position.side), position.quantity, position.entry_price,
             adopted.trade_id, strategy, matched ? " (matched " + matched->trade_id + ")" : std::string());
}

std::optional<TradeRecord> ReconciliationEngine::attribute(const core::LivePosition& position, long long now) const {
    const auto pending = ledger_->find("", position.symbol, position.side, position.quantity,
                                       position.entry_price, {TradeStatus::PENDING});
    if (!pending.empty()) {
        return pending.front();
    }

    const long long lookback_ms = static_cast<long long>(options_.orphan_fill_lookback_minutes) * 60LL * 1000LL;
    for (const auto& record : ledger_->find("", position.symbol, position.side, position.quantity,
                                            position.entry_price, {TradeStatus::ORPHANED})) {
        if (record.exit_time && now - *record.exit_time <= lookback_ms) {
            return record;
        }
    }
    return std::nullopt;
}

std::string ReconciliationEngine::strategyForSymbol(const std::string& symbol) const {
    std::string found;
    for (const auto& strategy : strategies_) {
        if (!strategy.enabled || strategy.symbol != symbol) {
            continue;
        }
        if (!found.empty()) {
            // Several strategies trade the symbol; none can claim the position
            return "";
        }
        found = strategy.name;
    }
    return found;
}

void ReconciliationEngine::report(AnomalyType type, const std::string& key, const nlohmann::json& payload) {
    {
        std::lock_guard<std::mutex> lock(anomaly_mutex_);
        if (!active_anomalies_.emplace(key, type).second) {
            return;
        }
    }
    if (notifier_) {
        notifier_->notify(type, payload);
    }
}

void ReconciliationEngine::clearResolved(const CycleState& cycle) {
    std::vector<std::pair<std::string, AnomalyType>> cleared;
    {
        std::lock_guard<std::mutex> lock(anomaly_mutex_);
        for (auto it = active_anomalies_.begin(); it != active_anomalies_.end();) {
            if (cycle.observed.count(it->first) || cycle.carried.count(it->first)) {
                ++it;
                continue;
            }
            cleared.emplace_back(it->first, clearedTypeFor(it->second));
            it = active_anomalies_.erase(it);
        }
    }

    for (const auto& [key, type] : cleared) {
        LOG_INFO("Reconciliation: {} cleared", key);
        if (notifier_) {
            nlohmann::json payload;
            payload["key"] = key;
            if (key.rfind(kOrphanPrefix, 0) == 0) {
                payload["trade_id"] = key.substr(std::string(kOrphanPrefix).size());
            }
            notifier_->notify(type, payload);
        }
    }
}

void ReconciliationEngine::carry(CycleState& cycle, const std::string& key) {
    cycle.carried.insert(key);
}

void ReconciliationEngine::reportConflict(const std::string& trade_id, const std::string& reason) {
    LOG_ERROR("Reconciliation: ledger conflict on {}: {}", trade_id, reason);
    if (!notifier_) {
        return;
    }
    nlohmann::json payload;
    payload["trade_id"] = trade_id;
    payload["reason"] = reason;
    notifier_->notify(AnomalyType::LEDGER_CONFLICT, payload);
}

void ReconciliationEngine::reportRetryExhausted(const std::string& operation, const std::string& error) {
    LOG_ERROR("Reconciliation: {} retries exhausted: {}", operation, error);
    if (!notifier_) {
        return;
    }
    nlohmann::json payload;
    payload["operation"] = operation;
    payload["error"] = error;
    notifier_->notify(AnomalyType::RETRY_EXHAUSTED, payload);
}

} // namespace engine
} // namespace tradesync

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/Retry.h"
#include "common/TimeUtils.h"
#include "core/contracts/IAnomalyNotifier.h"
#include "core/contracts/IExchangeGateway.h"
#include "core/state/TradeLedger.h"
#include "engine/EngineConfig.h"
#include "risk/PositionSlotRegistry.h"

namespace tradesync {
namespace engine {

struct ReconciliationOptions {
    int cycle_timeout_seconds = 30;
    int recent_trade_grace_seconds = 120;
    int orphan_fill_lookback_minutes = 360;
    RetryPolicy gateway_retry;
};

struct ReconciliationReport {
    bool completed = false;
    bool skipped = false;          // overlapping cycle or no snapshot
    bool timed_out = false;
    std::string error;

    int live_positions = 0;
    int orphans_detected = 0;
    int orphans_healed = 0;
    int ghosts_detected = 0;
    int ghosts_adopted = 0;
    int promoted = 0;
    int busy_skipped = 0;          // strategy lock held by its controller
    int recent_skipped = 0;        // inside the grace window
    long long duration_ms = 0;
};

// Diffs the ledger and the slot registry against the exchange snapshot and
// heals what it safely can. Orphans are handled before ghosts.
class ReconciliationEngine {
public:
    ReconciliationEngine(std::shared_ptr<core::TradeLedger> ledger,
                         std::shared_ptr<risk::PositionSlotRegistry> registry,
                         std::shared_ptr<core::IExchangeGateway> gateway,
                         std::shared_ptr<core::IAnomalyNotifier> notifier,
                         std::vector<StrategyConfig> strategies,
                         ReconciliationOptions options,
                         utils::ClockFn clock = utils::systemClock());

    // One pass. Never overlaps with itself; a concurrent call returns skipped.
    ReconciliationReport runCycle();

    // Rebuilds registry slots from the ledger, then runs one cycle
    ReconciliationReport recoverOnStartup();

    bool isAnomalyActive(const std::string& key) const;
    std::size_t activeAnomalyCount() const;

private:
    using PositionKey = std::pair<std::string, PositionSide>;

    struct CycleState {
        long long now = 0;
        std::chrono::steady_clock::time_point deadline;
        std::map<PositionKey, core::LivePosition> live;
        std::set<std::string> observed;
        std::set<std::string> carried;
        ReconciliationReport report;
    };

    bool pastDeadline(CycleState& cycle) const;
    bool withinGrace(long long activity_ms, long long now) const;

    void reconcileRecord(CycleState& cycle, const core::TradeRecord& candidate);
    void promoteGhost(CycleState& cycle, const core::TradeRecord& record);
    void healOrphan(CycleState& cycle, const core::TradeRecord& record);
    void reconcileGhost(CycleState& cycle, const core::LivePosition& position);

    std::optional<core::TradeRecord> attribute(const core::LivePosition& position, long long now) const;
    std::string strategyForSymbol(const std::string& symbol) const;

    void report(core::AnomalyType type, const std::string& key, const nlohmann::json& payload);
    void clearResolved(const CycleState& cycle);
    void carry(CycleState& cycle, const std::string& key);
    void reportConflict(const std::string& trade_id, const std::string& reason);
    void reportRetryExhausted(const std::string& operation, const std::string& error);

    std::shared_ptr<core::TradeLedger> ledger_;
    std::shared_ptr<risk::PositionSlotRegistry> registry_;
    std::shared_ptr<core::IExchangeGateway> gateway_;
    std::shared_ptr<core::IAnomalyNotifier> notifier_;
    std::vector<StrategyConfig> strategies_;
    ReconciliationOptions options_;
    utils::ClockFn clock_;

    std::mutex cycle_mutex_;
    mutable std::mutex anomaly_mutex_;
    std::map<std::string, core::AnomalyType> active_anomalies_;
};

} // namespace engine
} // namespace tradesync

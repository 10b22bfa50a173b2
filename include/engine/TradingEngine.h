#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "common/TimeUtils.h"
#include "core/contracts/IAnomalyNotifier.h"
#include "core/contracts/IExchangeGateway.h"
#include "core/contracts/ISignalSource.h"
#include "core/state/TradeLedger.h"
#include "engine/EngineConfig.h"
#include "engine/PositionLifecycleController.h"
#include "engine/ReconciliationEngine.h"
#include "risk/PositionSlotRegistry.h"

namespace tradesync {
namespace engine {

core::LedgerOptions ledgerOptionsFrom(const EngineConfig& config);
ControllerOptions controllerOptionsFrom(const EngineConfig& config);
ReconciliationOptions reconciliationOptionsFrom(const EngineConfig& config);

// Supervisor: one assessment thread per enabled strategy plus one
// reconciliation thread.
class TradingEngine {
public:
    TradingEngine(
        const EngineConfig& config,
        std::shared_ptr<core::TradeLedger> ledger,
        std::shared_ptr<risk::PositionSlotRegistry> registry,
        std::shared_ptr<core::IExchangeGateway> gateway,
        std::shared_ptr<core::IAnomalyNotifier> notifier,
        std::shared_ptr<core::ISignalSource> signals,
        utils::ClockFn clock = utils::systemClock()
    );

    ~TradingEngine();

    TradingEngine(const TradingEngine&) = delete;
    TradingEngine& operator=(const TradingEngine&) = delete;

    // Slot restore and first reconciliation; call before start()
    ReconciliationReport recover();

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // One assessment pass: pending instructions, then the exit checks
    void assessOnce(PositionLifecycleController& controller);

    PositionLifecycleController* controller(const std::string& name);
    ReconciliationEngine& reconciler() { return *reconciler_; }

private:
    void strategyLoop(PositionLifecycleController* controller);
    void reconcileLoop();

    // false once stop() was called
    bool waitFor(std::chrono::milliseconds duration);

    EngineConfig config_;
    std::shared_ptr<core::TradeLedger> ledger_;
    std::shared_ptr<risk::PositionSlotRegistry> registry_;
    std::shared_ptr<core::IExchangeGateway> gateway_;
    std::shared_ptr<core::IAnomalyNotifier> notifier_;
    std::shared_ptr<core::ISignalSource> signals_;

    std::vector<std::unique_ptr<PositionLifecycleController>> controllers_;
    std::unique_ptr<ReconciliationEngine> reconciler_;

    std::atomic<bool> running_;
    std::vector<std::thread> workers_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

} // namespace engine
} // namespace tradesync

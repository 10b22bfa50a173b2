#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "common/Errors.h"
#include "common/Retry.h"
#include "common/TimeUtils.h"
#include "core/contracts/IAnomalyNotifier.h"
#include "core/contracts/IExchangeGateway.h"
#include "core/execution/PositionLifecycleStateMachine.h"
#include "core/state/TradeLedger.h"
#include "engine/EngineConfig.h"
#include "risk/PositionSlotRegistry.h"

namespace tradesync {
namespace engine {

struct ControllerOptions {
    int confirm_timeout_ms = 10000;
    int confirm_poll_ms = 500;
    int exit_order_attempts = 3;
    RetryPolicy gateway_retry;
};

// Drives one strategy's position from signal to close. All mutations go
// through the ledger and the slot registry under the strategy's operation lock.
class PositionLifecycleController {
public:
    PositionLifecycleController(StrategyConfig config,
                                std::shared_ptr<core::TradeLedger> ledger,
                                std::shared_ptr<risk::PositionSlotRegistry> registry,
                                std::shared_ptr<core::IExchangeGateway> gateway,
                                std::shared_ptr<core::IAnomalyNotifier> notifier,
                                ControllerOptions options,
                                utils::ClockFn clock = utils::systemClock());

    // NONE -> PENDING -> OPEN, or back to NONE when the order does not fill
    OperationResult onSignal(const core::TradeSignal& signal);

    // OPEN -> CLOSING -> CLOSED
    OperationResult close(const core::ExitDecision& decision);

    // Failsafe and stop-loss/take-profit check at the current mark price
    OperationResult monitor();

    // Exit reason when the mark price breaches a limit, nullopt otherwise
    std::optional<std::string> exitTrigger(const core::TradeRecord& record, double mark_price) const;

    // Unplaced intents are rolled back from now on; placed orders still confirm
    void requestStop() { stop_requested_ = true; }

    core::execution::LifecycleState state();
    std::optional<core::TradeRecord> currentTrade();

    const StrategyConfig& config() const { return config_; }
    const std::string& name() const { return config_.name; }

private:
    struct ConfirmOutcome {
        bool known = false;                 // false when the exchange could not be reached
        core::OrderStatusReport report;
    };

    void syncFromLedger();
    void apply(core::execution::LifecycleEvent event);

    OperationResult confirmEntry(const core::TradeRecord& record);
    OperationResult markOpen(const core::TradeRecord& record, const core::OrderStatusReport& report);
    OperationResult abortEntry(const core::TradeRecord& record, const std::string& reason, ErrorKind kind);
    OperationResult closeLocked(const core::ExitDecision& decision);
    OperationResult splitRemainder(const core::TradeRecord& record, const std::string& reason,
                                   double closed_quantity, double exit_price, long long exit_time);

    ConfirmOutcome awaitTerminal(const std::string& client_order_id);
    void reportRetryExhausted(const std::string& operation, const std::string& trade_id, const std::string& error);
    void reportConflict(const std::string& trade_id, const std::string& reason);

    // x-<trade id without hyphens>, with -<attempt> appended from the second exit order on
    static std::string exitClientOrderId(const std::string& trade_id, int attempt = 1);

    StrategyConfig config_;
    std::shared_ptr<core::TradeLedger> ledger_;
    std::shared_ptr<risk::PositionSlotRegistry> registry_;
    std::shared_ptr<core::IExchangeGateway> gateway_;
    std::shared_ptr<core::IAnomalyNotifier> notifier_;
    ControllerOptions options_;
    utils::ClockFn clock_;

    std::atomic<bool> stop_requested_{false};
    core::execution::LifecycleState state_ = core::execution::LifecycleState::NONE;
    std::string trade_id_;
};

} // namespace engine
} // namespace tradesync

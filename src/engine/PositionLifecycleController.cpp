#include "engine/PositionLifecycleController.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

#include "common/Logger.h"
#include "common/Uuid.h"
#include "core/execution/PnlCalculator.h"

namespace tradesync {
namespace engine {

using core::execution::LifecycleEvent;
using core::execution::LifecycleState;
using core::execution::PnlCalculator;
using core::execution::PositionLifecycleStateMachine;

namespace {
constexpr double kExitDustRatio = 0.001;

bool hasFill(const core::OrderStatusReport& report) {
    return report.filled_quantity > 0.0 &&
           (report.status == OrderStatus::FILLED || report.status == OrderStatus::PARTIALLY_FILLED);
}
} // namespace

PositionLifecycleController::PositionLifecycleController(
    StrategyConfig config,
    std::shared_ptr<core::TradeLedger> ledger,
    std::shared_ptr<risk::PositionSlotRegistry> registry,
    std::shared_ptr<core::IExchangeGateway> gateway,
    std::shared_ptr<core::IAnomalyNotifier> notifier,
    ControllerOptions options,
    utils::ClockFn clock
)
    : config_(std::move(config))
    , ledger_(std::move(ledger))
    , registry_(std::move(registry))
    , gateway_(std::move(gateway))
    , notifier_(std::move(notifier))
    , options_(options)
    , clock_(std::move(clock))
{
    registry_->configureCooldown(config_.name, config_.cooldown_seconds);
}

OperationResult PositionLifecycleController::onSignal(const core::TradeSignal& signal) {
    auto lock = registry_->lockStrategy(config_.name);
    syncFromLedger();

    if (stop_requested_) {
        return OperationResult::failure(ErrorKind::REJECTED, "shutting down");
    }
    if (state_ == LifecycleState::PENDING || state_ == LifecycleState::OPEN ||
        state_ == LifecycleState::CLOSING) {
        LOG_WARN("[{}] duplicate open rejected, trade {} is {}",
                 config_.name, trade_id_, core::execution::toString(state_));
        return OperationResult::failure(ErrorKind::INVARIANT_VIOLATION, "position already active", trade_id_);
    }

    const std::string symbol = signal.symbol.empty() ? config_.symbol : signal.symbol;
    if (symbol != config_.symbol) {
        return OperationResult::failure(ErrorKind::REJECTED,
            "signal symbol " + symbol + " does not match " + config_.symbol);
    }
    if (!(signal.entry_price > 0.0) || !std::isfinite(signal.entry_price)) {
        return OperationResult::failure(ErrorKind::REJECTED, "invalid entry price");
    }
    const double quantity = PnlCalculator::quantityForMargin(config_.margin, config_.leverage, signal.entry_price);
    if (!(quantity > 0.0)) {
        return OperationResult::failure(ErrorKind::REJECTED, "order quantity is zero");
    }

    if (!registry_->tryAcquire(config_.name)) {
        if (registry_->isOccupied(config_.name)) {
            LOG_WARN("[{}] duplicate open rejected, slot occupied", config_.name);
            return OperationResult::failure(ErrorKind::INVARIANT_VIOLATION, "position slot occupied");
        }
        const long long remaining = registry_->cooldownRemainingMs(config_.name);
        LOG_INFO("[{}] signal ignored, cooldown {}s left", config_.name, remaining / 1000);
        return OperationResult::failure(ErrorKind::REJECTED, "cooldown active");
    }

    core::TradeRecord record;
    record.trade_id = utils::generateUUID();
    record.strategy_name = config_.name;
    record.symbol = symbol;
    record.side = core::toPositionSide(signal.type);
    record.quantity = quantity;
    record.entry_price = signal.entry_price;
    record.leverage = config_.leverage;
    record.margin_used = PnlCalculator::marginUsed(signal.entry_price, quantity, config_.leverage);
    record.stop_loss = signal.stop_loss;
    record.take_profit = signal.take_profit;
    record.status = TradeStatus::PENDING;
    record.entry_time = clock_();

    const auto put = ledger_->put(record);
    if (!put.ok) {
        LOG_ERROR("[{}] intent record not persisted: {}", config_.name, put.reason);
        if (put.degraded) {
            // The record is live in memory; close it out so the strategy is not wedged
            trade_id_ = record.trade_id;
            state_ = LifecycleState::PENDING;
            return abortEntry(record, "ledger write failed", put.kind);
        }
        registry_->release(config_.name, false);
        return OperationResult::failure(put.kind, "intent record not persisted: " + put.reason);
    }

    registry_->bindTrade(config_.name, record.trade_id);
    trade_id_ = record.trade_id;
    apply(LifecycleEvent::SIGNAL_ACCEPTED);

    LOG_INFO("[{}] PENDING {} {} {} qty={:.6f} @ {:.4f} ({})",
             config_.name, record.trade_id, record.symbol, toString(record.side),
             record.quantity, record.entry_price, signal.reason);

    if (stop_requested_) {
        return abortEntry(record, "aborted-shutdown", ErrorKind::REJECTED);
    }
    return confirmEntry(record);
}

OperationResult PositionLifecycleController::close(const core::ExitDecision& decision) {
    auto lock = registry_->lockStrategy(config_.name);
    syncFromLedger();

    if (state_ != LifecycleState::OPEN) {
        return OperationResult::failure(ErrorKind::INVARIANT_VIOLATION,
            std::string("no open position (state ") + core::execution::toString(state_) + ")", trade_id_);
    }
    return closeLocked(decision);
}

OperationResult PositionLifecycleController::monitor() {
    auto lock = registry_->lockStrategy(config_.name);
    syncFromLedger();

    if (state_ != LifecycleState::OPEN) {
        return OperationResult::success("", "no open position");
    }

    const auto record = ledger_->get(trade_id_);
    if (!record) {
        return OperationResult::success("", "no open position");
    }

    double mark_price = 0.0;
    try {
        mark_price = retryWithBackoff(options_.gateway_retry, "getMarkPrice " + record->symbol,
                                      [&]() { return gateway_->getMarkPrice(record->symbol); });
    } catch (const GatewayError& e) {
        if (e.isTransient()) {
            reportRetryExhausted("getMarkPrice", record->trade_id, e.what());
        }
        return OperationResult::failure(e.kind(), std::string("mark price unavailable: ") + e.what(), trade_id_);
    }

    const auto trigger = exitTrigger(*record, mark_price);
    if (!trigger) {
        return OperationResult::success(trade_id_, "holding");
    }

    LOG_WARN("[{}] {} triggered at {:.4f} for {}", config_.name, *trigger, mark_price, trade_id_);
    core::ExitDecision decision;
    decision.reason = *trigger;
    decision.price = mark_price;
    return closeLocked(decision);
}

std::optional<std::string> PositionLifecycleController::exitTrigger(const core::TradeRecord& record,
                                                                    double mark_price) const {
    if (!(mark_price > 0.0)) {
        return std::nullopt;
    }

    const auto pnl = PnlCalculator::compute(record.side, record.entry_price, mark_price,
                                            record.quantity, record.margin_used);
    if (record.margin_used > 0.0 && -pnl.percentage >= config_.max_loss_pct) {
        return std::string("max-loss-failsafe");
    }

    const bool is_long = (record.side == PositionSide::LONG);
    if (record.stop_loss) {
        if ((is_long && mark_price <= *record.stop_loss) || (!is_long && mark_price >= *record.stop_loss)) {
            return std::string("stop-loss");
        }
    }
    if (record.take_profit) {
        if ((is_long && mark_price >= *record.take_profit) || (!is_long && mark_price <= *record.take_profit)) {
            return std::string("take-profit");
        }
    }
    return std::nullopt;
}

LifecycleState PositionLifecycleController::state() {
    auto lock = registry_->lockStrategy(config_.name);
    syncFromLedger();
    return state_;
}

std::optional<core::TradeRecord> PositionLifecycleController::currentTrade() {
    auto lock = registry_->lockStrategy(config_.name);
    syncFromLedger();
    if (trade_id_.empty()) {
        return std::nullopt;
    }
    return ledger_->get(trade_id_);
}

void PositionLifecycleController::syncFromLedger() {
    const auto active = ledger_->activeForStrategy(config_.name);
    if (!active.empty()) {
        const auto& record = active.front();
        trade_id_ = record.trade_id;
        state_ = PositionLifecycleStateMachine::fromTradeStatus(record.status);
        return;
    }

    // Reconciliation finished the trade out of band
    if (state_ == LifecycleState::PENDING || state_ == LifecycleState::OPEN ||
        state_ == LifecycleState::CLOSING) {
        LOG_INFO("[{}] trade {} was closed by reconciliation", config_.name, trade_id_);
        apply(LifecycleEvent::HEALED);
    }
}

void PositionLifecycleController::apply(LifecycleEvent event) {
    const auto result = PositionLifecycleStateMachine::transition(state_, event);
    if (!result.allowed) {
        LOG_WARN("[{}] ignoring {} in state {}", config_.name,
                 core::execution::toString(event), core::execution::toString(state_));
        return;
    }
    state_ = result.next;
}

OperationResult PositionLifecycleController::confirmEntry(const core::TradeRecord& record) {
    core::OrderRequest request;
    request.symbol = record.symbol;
    request.side = entryOrderSide(record.side);
    request.quantity = record.quantity;
    request.reduce_only = false;
    request.client_order_id = record.trade_id;
    request.reference_price = record.entry_price;

    core::OrderStatusReport report;
    bool placed = false;
    try {
        report = retryWithBackoff(options_.gateway_retry, "placeOrder " + record.trade_id,
                                  [&]() { return gateway_->placeOrder(request); });
        placed = true;
    } catch (const GatewayError& e) {
        if (!e.isTransient()) {
            LOG_WARN("[{}] entry order rejected: {}", config_.name, e.what());
            return abortEntry(record, "order rejected", ErrorKind::REJECTED);
        }
        reportRetryExhausted("placeOrder", record.trade_id, e.what());
    }

    if (!placed) {
        // The order may or may not have reached the exchange; ask by client id
        try {
            report = gateway_->getOrderStatus(record.symbol, record.trade_id);
        } catch (const GatewayError& e) {
            if (!e.isTransient()) {
                return abortEntry(record, "order not placed", ErrorKind::TRANSIENT);
            }
            LOG_ERROR("[{}] entry outcome unknown for {}, left PENDING for reconciliation",
                      config_.name, record.trade_id);
            return OperationResult::failure(ErrorKind::TRANSIENT, "order outcome unknown", record.trade_id);
        }
    }

    if (!report.order_ref.empty()) {
        core::TradeUpdate ref;
        ref.exchange_order_ref = report.order_ref;
        const auto written = ledger_->update(record.trade_id, ref);
        if (!written.ok && !written.degraded) {
            reportConflict(record.trade_id, written.reason);
        }
    }

    ConfirmOutcome outcome;
    if (report.terminal) {
        outcome.known = true;
        outcome.report = report;
    } else {
        outcome = awaitTerminal(record.trade_id);
    }

    if (!outcome.known || !outcome.report.terminal) {
        LOG_WARN("[{}] entry {} not confirmed within {}ms, cancelling",
                 config_.name, record.trade_id, options_.confirm_timeout_ms);
        try {
            gateway_->cancelOrder(record.symbol, record.trade_id);
        } catch (const GatewayError& e) {
            LOG_WARN("[{}] cancel of {} failed: {}", config_.name, record.trade_id, e.what());
        }

        try {
            outcome.report = gateway_->getOrderStatus(record.symbol, record.trade_id);
            outcome.known = true;
        } catch (const GatewayError& e) {
            LOG_ERROR("[{}] entry outcome unknown for {} ({}), left PENDING for reconciliation",
                      config_.name, record.trade_id, e.what());
            return OperationResult::failure(ErrorKind::TRANSIENT, "order outcome unknown", record.trade_id);
        }

        if (hasFill(outcome.report)) {
            return markOpen(record, outcome.report);
        }
        if (!outcome.report.terminal) {
            LOG_ERROR("[{}] entry {} still working after cancel, left PENDING for reconciliation",
                      config_.name, record.trade_id);
            return OperationResult::failure(ErrorKind::TRANSIENT, "order outcome unknown", record.trade_id);
        }
        return abortEntry(record, "confirmation timeout", ErrorKind::TRANSIENT);
    }

    if (hasFill(outcome.report)) {
        return markOpen(record, outcome.report);
    }
    if (outcome.report.status == OrderStatus::REJECTED) {
        return abortEntry(record, "order rejected", ErrorKind::REJECTED);
    }
    return abortEntry(record, "order cancelled", ErrorKind::REJECTED);
}

OperationResult PositionLifecycleController::markOpen(const core::TradeRecord& record,
                                                      const core::OrderStatusReport& report) {
    const double fill_price = (report.avg_price > 0.0) ? report.avg_price : record.entry_price;
    const double fill_quantity = (report.filled_quantity > 0.0) ? report.filled_quantity : record.quantity;

    core::TradeUpdate opened;
    opened.status = TradeStatus::OPEN;
    opened.entry_price = fill_price;
    opened.quantity = fill_quantity;
    opened.margin_used = PnlCalculator::marginUsed(fill_price, fill_quantity, record.leverage);
    if (!report.order_ref.empty()) {
        opened.exchange_order_ref = report.order_ref;
    }

    const auto written = ledger_->update(record.trade_id, opened);
    if (!written.ok && !written.degraded) {
        reportConflict(record.trade_id, written.reason);
        return OperationResult::failure(ErrorKind::INVARIANT_VIOLATION, written.reason, record.trade_id);
    }

    apply(LifecycleEvent::ORDER_FILLED);
    LOG_INFO("[{}] OPEN {} {} qty={:.6f} @ {:.4f} margin={:.2f}",
             config_.name, record.trade_id, record.symbol, fill_quantity, fill_price, *opened.margin_used);
    return OperationResult::success(record.trade_id, written.degraded ? "opened (ledger degraded)" : "opened");
}

OperationResult PositionLifecycleController::abortEntry(const core::TradeRecord& record,
                                                        const std::string& reason,
                                                        ErrorKind kind) {
    const long long now = clock_();

    core::TradeUpdate aborted;
    aborted.status = TradeStatus::CLOSED;
    aborted.exit_time = now;
    aborted.exit_reason = reason;
    aborted.pnl_absolute = 0.0;
    aborted.pnl_percentage = 0.0;
    aborted.duration_ms = now - record.entry_time;

    const auto written = ledger_->update(record.trade_id, aborted);
    if (!written.ok && !written.degraded) {
        reportConflict(record.trade_id, written.reason);
    }

    registry_->releaseIfBound(config_.name, record.trade_id, false);
    apply(LifecycleEvent::ORDER_ABORTED);

    LOG_WARN("[{}] entry {} aborted: {}", config_.name, record.trade_id, reason);
    return OperationResult::failure(kind, reason, record.trade_id);
}

OperationResult PositionLifecycleController::closeLocked(const core::ExitDecision& decision) {
    const auto record = ledger_->get(trade_id_);
    if (!record) {
        reportConflict(trade_id_, "active trade missing from ledger");
        return OperationResult::failure(ErrorKind::INVARIANT_VIOLATION, "trade record missing", trade_id_);
    }
    if (!(record->quantity > 0.0)) {
        reportConflict(record->trade_id, "open trade has no quantity");
        return OperationResult::failure(ErrorKind::INVARIANT_VIOLATION, "trade has no quantity", record->trade_id);
    }

    apply(LifecycleEvent::EXIT_REQUESTED);

    // Remainders below this are exchange rounding, not open exposure
    const double dust = record->quantity * kExitDustRatio;
    const int attempts = std::max(1, options_.exit_order_attempts);
    double filled = 0.0;
    double notional = 0.0;
    long long exit_time = 0;

    for (int attempt = 1; attempt <= attempts && record->quantity - filled > dust; ++attempt) {
        core::OrderRequest request;
        request.symbol = record->symbol;
        request.side = exitOrderSide(record->side);
        request.quantity = record->quantity - filled;
        request.reduce_only = true;
        request.client_order_id = exitClientOrderId(record->trade_id, attempt);
        request.reference_price = decision.price.value_or(0.0);

        core::OrderStatusReport report;
        try {
            report = retryWithBackoff(options_.gateway_retry, "exit order " + request.client_order_id,
                                      [&]() { return gateway_->placeOrder(request); });
        } catch (const GatewayError& e) {
            if (e.isTransient()) {
                reportRetryExhausted("placeOrder", record->trade_id, e.what());
            }
            LOG_ERROR("[{}] exit order for {} failed: {}", config_.name, record->trade_id, e.what());
            if (filled > 0.0) {
                break;
            }
            apply(LifecycleEvent::EXIT_FAILED);
            return OperationResult::failure(e.kind(), std::string("exit order failed: ") + e.what(), record->trade_id);
        }

        if (!report.terminal) {
            const auto outcome = awaitTerminal(request.client_order_id);
            if (outcome.known) {
                report = outcome.report;
            }
        }
        if (!report.terminal) {
            try {
                gateway_->cancelOrder(record->symbol, request.client_order_id);
                report = gateway_->getOrderStatus(record->symbol, request.client_order_id);
            } catch (const GatewayError& e) {
                LOG_WARN("[{}] exit cancel/recheck for {} failed: {}", config_.name, record->trade_id, e.what());
            }
        }
        if (!hasFill(report)) {
            LOG_ERROR("[{}] exit order {} did not fill ({})", config_.name, request.client_order_id,
                      toString(report.status));
            if (filled > 0.0) {
                break;
            }
            apply(LifecycleEvent::EXIT_FAILED);
            return OperationResult::failure(ErrorKind::TRANSIENT, "exit order not filled", record->trade_id);
        }

        const double price = (report.avg_price > 0.0)
            ? report.avg_price
            : decision.price.value_or(record->entry_price);
        const double quantity = std::min(report.filled_quantity, request.quantity);
        filled += quantity;
        notional += price * quantity;
        exit_time = (report.update_time_ms > 0) ? report.update_time_ms : clock_();

        if (record->quantity - filled > dust) {
            LOG_WARN("[{}] exit of {} filled {:.6f} of {:.6f} (order {}/{})",
                     config_.name, record->trade_id, filled, record->quantity, attempt, attempts);
        }
    }

    const double exit_price = notional / filled;
    if (record->quantity - filled > dust) {
        return splitRemainder(*record, decision.reason, filled, exit_price, exit_time);
    }

    const auto pnl = PnlCalculator::compute(record->side, record->entry_price, exit_price,
                                            record->quantity, record->margin_used);

    core::TradeUpdate closed;
    closed.status = TradeStatus::CLOSED;
    closed.exit_time = exit_time;
    closed.exit_price = exit_price;
    closed.exit_reason = decision.reason;
    closed.pnl_absolute = pnl.absolute;
    closed.pnl_percentage = pnl.percentage;
    closed.duration_ms = exit_time - record->entry_time;

    const auto written = ledger_->update(record->trade_id, closed);
    if (!written.ok && !written.degraded) {
        reportConflict(record->trade_id, written.reason);
    }

    registry_->releaseIfBound(config_.name, record->trade_id, true);
    apply(LifecycleEvent::EXIT_FILLED);

    Logger::getInstance().logTrade(record->trade_id, config_.name, record->symbol, toString(record->side),
                                   record->entry_price, exit_price, record->quantity,
                                   pnl.absolute, decision.reason);
    LOG_INFO("[{}] CLOSED {} @ {:.4f} pnl={:.4f} ({:.2f}%) reason={}",
             config_.name, record->trade_id, exit_price, pnl.absolute, pnl.percentage, decision.reason);
    return OperationResult::success(record->trade_id, decision.reason);
}

OperationResult PositionLifecycleController::splitRemainder(const core::TradeRecord& record,
                                                            const std::string& reason,
                                                            double closed_quantity,
                                                            double exit_price,
                                                            long long exit_time) {
    const double remaining = record.quantity - closed_quantity;
    const double closed_margin = record.margin_used * closed_quantity / record.quantity;
    const auto pnl = PnlCalculator::compute(record.side, record.entry_price, exit_price,
                                            closed_quantity, closed_margin);

    core::TradeUpdate closed;
    closed.status = TradeStatus::CLOSED;
    closed.exit_time = exit_time;
    closed.exit_price = exit_price;
    closed.exit_reason = reason;
    closed.pnl_absolute = pnl.absolute;
    closed.pnl_percentage = pnl.percentage;
    closed.duration_ms = exit_time - record.entry_time;
    closed.closed_quantity = closed_quantity;

    const auto written = ledger_->update(record.trade_id, closed);
    if (!written.ok && !written.degraded) {
        reportConflict(record.trade_id, written.reason);
        apply(LifecycleEvent::EXIT_FAILED);
        return OperationResult::failure(ErrorKind::INVARIANT_VIOLATION, written.reason, record.trade_id);
    }

    Logger::getInstance().logTrade(record.trade_id, config_.name, record.symbol, toString(record.side),
                                   record.entry_price, exit_price, closed_quantity, pnl.absolute, reason);

    core::TradeRecord rest;
    rest.trade_id = utils::generateUUID();
    rest.strategy_name = record.strategy_name;
    rest.symbol = record.symbol;
    rest.side = record.side;
    rest.quantity = remaining;
    rest.entry_price = record.entry_price;
    rest.leverage = record.leverage;
    rest.margin_used = PnlCalculator::marginUsed(record.entry_price, remaining, record.leverage);
    rest.stop_loss = record.stop_loss;
    rest.take_profit = record.take_profit;
    rest.status = TradeStatus::OPEN;
    rest.entry_time = record.entry_time;
    rest.exchange_order_ref = record.exchange_order_ref;
    rest.parent_trade_id = record.trade_id;

    const auto put = ledger_->put(rest);
    if (!put.ok && !put.degraded) {
        // The remainder is still on the exchange; reconciliation adopts it as a ghost
        reportConflict(rest.trade_id, put.reason);
        registry_->releaseIfBound(config_.name, record.trade_id, false);
        apply(LifecycleEvent::EXIT_FILLED);
        return OperationResult::failure(ErrorKind::INVARIANT_VIOLATION,
                                        "remainder not recorded: " + put.reason, record.trade_id);
    }

    registry_->rebindTrade(config_.name, record.trade_id, rest.trade_id);
    trade_id_ = rest.trade_id;
    apply(LifecycleEvent::EXIT_FAILED);

    LOG_WARN("[{}] PARTIAL CLOSE {} {:.6f} @ {:.4f} pnl={:.4f} reason={}, remainder {:.6f} continues as {}",
             config_.name, record.trade_id, closed_quantity, exit_price, pnl.absolute, reason,
             remaining, rest.trade_id);
    return OperationResult::failure(ErrorKind::TRANSIENT, "exit partially filled", rest.trade_id);
}

PositionLifecycleController::ConfirmOutcome PositionLifecycleController::awaitTerminal(
    const std::string& client_order_id
) {
    ConfirmOutcome outcome;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(std::max(0, options_.confirm_timeout_ms));
    const auto poll = std::chrono::milliseconds(std::max(1, options_.confirm_poll_ms));

    while (true) {
        try {
            outcome.report = gateway_->getOrderStatus(config_.symbol, client_order_id);
            outcome.known = true;
            if (outcome.report.terminal) {
                return outcome;
            }
        } catch (const GatewayError& e) {
            LOG_WARN("[{}] order status for {} failed: {}", config_.name, client_order_id, e.what());
            if (!e.isTransient()) {
                return outcome;
            }
        }

        if (std::chrono::steady_clock::now() + poll > deadline) {
            return outcome;
        }
        std::this_thread::sleep_for(poll);
    }
}

void PositionLifecycleController::reportRetryExhausted(const std::string& operation,
                                                       const std::string& trade_id,
                                                       const std::string& error) {
    LOG_ERROR("[{}] {} retries exhausted for {}: {}", config_.name, operation, trade_id, error);
    if (!notifier_) {
        return;
    }
    nlohmann::json payload;
    payload["strategy"] = config_.name;
    payload["symbol"] = config_.symbol;
    payload["trade_id"] = trade_id;
    payload["operation"] = operation;
    payload["error"] = error;
    notifier_->notify(core::AnomalyType::RETRY_EXHAUSTED, payload);
}

void PositionLifecycleController::reportConflict(const std::string& trade_id, const std::string& reason) {
    LOG_ERROR("[{}] ledger conflict on {}: {}", config_.name, trade_id, reason);
    if (!notifier_) {
        return;
    }
    nlohmann::json payload;
    payload["strategy"] = config_.name;
    payload["trade_id"] = trade_id;
    payload["reason"] = reason;
    notifier_->notify(core::AnomalyType::LEDGER_CONFLICT, payload);
}

std::string PositionLifecycleController::exitClientOrderId(const std::string& trade_id, int attempt) {
    std::string compact = trade_id;
    compact.erase(std::remove(compact.begin(), compact.end(), '-'), compact.end());
    if (attempt > 1) {
        return "x-" + compact + "-" + std::to_string(attempt);
    }
    return "x-" + compact;
}

} // namespace engine
} // namespace tradesync

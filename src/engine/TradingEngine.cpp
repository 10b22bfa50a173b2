#include "engine/TradingEngine.h"

#include <algorithm>

#include "common/Logger.h"

namespace tradesync {
namespace engine {

namespace {
RetryPolicy gatewayRetry(const EngineConfig& config) {
    RetryPolicy policy;
    policy.max_attempts = std::max(1, config.gateway_retry_attempts);
    policy.initial_backoff = std::chrono::milliseconds(std::max(0, config.gateway_retry_backoff_ms));
    return policy;
}
} // namespace

core::LedgerOptions ledgerOptionsFrom(const EngineConfig& config) {
    core::LedgerOptions options;
    options.verify_retries = config.ledger_verify_retries;
    options.retry_backoff_ms = config.ledger_retry_backoff_ms;
    options.match_rel_tolerance = config.match_rel_tolerance;
    options.match_quantity_floor = config.match_quantity_floor;
    options.match_price_floor = config.match_price_floor;
    options.stale_trade_hours = config.stale_trade_hours;
    options.retention_days = config.retention_days;
    return options;
}

ControllerOptions controllerOptionsFrom(const EngineConfig& config) {
    ControllerOptions options;
    options.confirm_timeout_ms = config.confirm_timeout_ms;
    options.confirm_poll_ms = config.confirm_poll_ms;
    options.exit_order_attempts = config.exit_order_attempts;
    options.gateway_retry = gatewayRetry(config);
    return options;
}

ReconciliationOptions reconciliationOptionsFrom(const EngineConfig& config) {
    ReconciliationOptions options;
    options.cycle_timeout_seconds = config.cycle_timeout_seconds;
    options.recent_trade_grace_seconds = config.recent_trade_grace_seconds;
    options.orphan_fill_lookback_minutes = config.orphan_fill_lookback_minutes;
    options.gateway_retry = gatewayRetry(config);
    return options;
}

TradingEngine::TradingEngine(
    const EngineConfig& config,
    std::shared_ptr<core::TradeLedger> ledger,
    std::shared_ptr<risk::PositionSlotRegistry> registry,
    std::shared_ptr<core::IExchangeGateway> gateway,
    std::shared_ptr<core::IAnomalyNotifier> notifier,
    std::shared_ptr<core::ISignalSource> signals,
    utils::ClockFn clock
)
    : config_(config)
    , ledger_(std::move(ledger))
    , registry_(std::move(registry))
    , gateway_(std::move(gateway))
    , notifier_(std::move(notifier))
    , signals_(std::move(signals))
    , running_(false)
{
    LOG_INFO("TradingEngine initializing");
    LOG_INFO("Mode: {}", config_.mode == TradingMode::LIVE ? "LIVE" : "PAPER");

    const auto controller_options = controllerOptionsFrom(config_);
    for (const auto& strategy : config_.strategies) {
        if (!strategy.enabled) {
            LOG_INFO("Strategy {} disabled, skipped", strategy.name);
            continue;
        }
        controllers_.push_back(std::make_unique<PositionLifecycleController>(
            strategy, ledger_, registry_, gateway_, notifier_, controller_options, clock));
        LOG_INFO("Strategy {} registered: {} margin={:.2f} x{:.0f} max_loss={:.1f}% cooldown={}s",
                 strategy.name, strategy.symbol, strategy.margin, strategy.leverage,
                 strategy.max_loss_pct, strategy.cooldown_seconds);
    }

    reconciler_ = std::make_unique<ReconciliationEngine>(
        ledger_, registry_, gateway_, notifier_, config_.strategies,
        reconciliationOptionsFrom(config_), clock);
}

TradingEngine::~TradingEngine() {
    stop();
}

ReconciliationReport TradingEngine::recover() {
    return reconciler_->recoverOnStartup();
}

bool TradingEngine::start() {
    if (running_) {
        LOG_WARN("Engine is already running");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("Engine starting: {} strategies, reconcile every {}s",
             controllers_.size(), config_.reconcile_interval_seconds);
    LOG_INFO("========================================");

    running_ = true;
    for (auto& controller : controllers_) {
        workers_.emplace_back(&TradingEngine::strategyLoop, this, controller.get());
    }
    workers_.emplace_back(&TradingEngine::reconcileLoop, this);
    return true;
}

void TradingEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("========================================");
    LOG_INFO("Engine stopping");
    LOG_INFO("========================================");

    for (auto& controller : controllers_) {
        controller->requestStop();
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    LOG_INFO("Engine stopped");
}

void TradingEngine::assessOnce(PositionLifecycleController& controller) {
    if (signals_) {
        for (const auto& instruction : signals_->poll(controller.name())) {
            if (instruction.kind == core::StrategyInstruction::Kind::EXIT) {
                const auto result = controller.close(instruction.exit);
                if (!result.ok) {
                    LOG_WARN("[{}] exit '{}' not executed: {} ({})", controller.name(),
                             instruction.exit.reason, result.reason, toString(result.kind));
                }
                continue;
            }
            const auto result = controller.onSignal(instruction.signal);
            if (!result.ok) {
                LOG_WARN("[{}] entry signal not executed: {} ({})", controller.name(),
                         result.reason, toString(result.kind));
            }
        }
    }

    const auto monitored = controller.monitor();
    if (!monitored.ok) {
        LOG_WARN("[{}] position check failed: {}", controller.name(), monitored.reason);
    }
}

PositionLifecycleController* TradingEngine::controller(const std::string& name) {
    for (auto& controller : controllers_) {
        if (controller->name() == name) {
            return controller.get();
        }
    }
    return nullptr;
}

void TradingEngine::strategyLoop(PositionLifecycleController* controller) {
    LOG_INFO("[{}] assessment loop started", controller->name());
    const auto interval = std::chrono::seconds(std::max(1, controller->config().assessment_interval_seconds));

    while (running_) {
        try {
            assessOnce(*controller);
        } catch (const std::exception& e) {
            LOG_ERROR("[{}] assessment failed: {}", controller->name(), e.what());
        }
        if (!waitFor(interval)) {
            break;
        }
    }
    LOG_INFO("[{}] assessment loop finished", controller->name());
}

void TradingEngine::reconcileLoop() {
    LOG_INFO("Reconciliation loop started");
    const auto interval = std::chrono::seconds(std::max(1, config_.reconcile_interval_seconds));

    while (waitFor(interval)) {
        try {
            reconciler_->runCycle();
        } catch (const std::exception& e) {
            LOG_ERROR("Reconciliation cycle failed: {}", e.what());
        }
    }
    LOG_INFO("Reconciliation loop finished");
}

bool TradingEngine::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, duration, [this]() { return !running_.load(); });
    return running_;
}

} // namespace engine
} // namespace tradesync

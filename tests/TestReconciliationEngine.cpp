#include "engine/PositionLifecycleController.h"
#include "engine/ReconciliationEngine.h"
#include "execution/PaperExchangeGateway.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace tradesync;
using namespace tradesync::engine;

namespace {
constexpr long long kMinute = 60'000;

class MemoryStorage : public core::ILedgerStorage {
public:
    std::optional<nlohmann::json> load() override { return document; }
    bool save(const nlohmann::json& doc) override {
        document = doc;
        return true;
    }
    std::string quarantine() override { return ""; }

    std::optional<nlohmann::json> document;
};

class RecordingNotifier : public core::IAnomalyNotifier {
public:
    void notify(core::AnomalyType type, const nlohmann::json& payload) override {
        ++counts[type];
        last[type] = payload;
    }
    std::map<core::AnomalyType, int> counts;
    std::map<core::AnomalyType, nlohmann::json> last;
};

StrategyConfig strategy(const std::string& name, const std::string& symbol) {
    StrategyConfig config;
    config.name = name;
    config.symbol = symbol;
    config.margin = 200.0;
    config.leverage = 5.0;
    config.cooldown_seconds = 300;
    return config;
}

// Paper venue that can fill exits partially and answer fill queries slowly
class ScriptedGateway : public execution::PaperExchangeGateway {
public:
    using PaperExchangeGateway::PaperExchangeGateway;

    core::OrderStatusReport placeOrder(const core::OrderRequest& request) override {
        if (request.reduce_only && partial_exits > 0) {
            --partial_exits;
            auto half = request;
            half.quantity = request.quantity / 2.0;
            return PaperExchangeGateway::placeOrder(half);
        }
        return PaperExchangeGateway::placeOrder(request);
    }

    std::vector<core::Fill> getRecentFills(const std::string& symbol, long long since_ms) override {
        if (fills_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(fills_delay_ms.load()));
        }
        return PaperExchangeGateway::getRecentFills(symbol, since_ms);
    }

    std::atomic<int> partial_exits{0};
    std::atomic<int> fills_delay_ms{0};
};

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

struct Fixture {
    long long now = 1'700'000'000'000;
    std::shared_ptr<MemoryStorage> storage = std::make_shared<MemoryStorage>();
    std::shared_ptr<core::TradeLedger> ledger;
    std::shared_ptr<risk::PositionSlotRegistry> registry;
    std::shared_ptr<ScriptedGateway> gateway;
    std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
    std::vector<StrategyConfig> strategies{strategy("alpha", "BTCUSDT"), strategy("beta", "ETHUSDT")};
    std::unique_ptr<ReconciliationEngine> engine;
    int cycle_timeout_seconds = 30;

    Fixture() {
        auto clock = [this]() { return now; };
        core::LedgerOptions ledger_options;
        ledger_options.retry_backoff_ms = 0;
        ledger = std::make_shared<core::TradeLedger>(storage, ledger_options, nullptr, nullptr, clock);
        ledger->load();
        registry = std::make_shared<risk::PositionSlotRegistry>(clock);
        gateway = std::make_shared<ScriptedGateway>(clock);
        for (const auto& s : strategies) {
            registry->configureCooldown(s.name, s.cooldown_seconds);
        }
        rebuildEngine();
    }

    void rebuildEngine() {
        ReconciliationOptions options;
        options.cycle_timeout_seconds = cycle_timeout_seconds;
        options.recent_trade_grace_seconds = 120;
        options.orphan_fill_lookback_minutes = 360;
        options.gateway_retry.max_attempts = 2;
        options.gateway_retry.initial_backoff = std::chrono::milliseconds(0);
        engine = std::make_unique<ReconciliationEngine>(ledger, registry, gateway, notifier, strategies, options,
                                                        [this]() { return now; });
    }

    std::unique_ptr<PositionLifecycleController> controller(const std::string& name) {
        ControllerOptions options;
        options.confirm_timeout_ms = 20;
        options.confirm_poll_ms = 5;
        options.gateway_retry.initial_backoff = std::chrono::milliseconds(0);
        for (const auto& s : strategies) {
            if (s.name == name) {
                return std::make_unique<PositionLifecycleController>(
                    s, ledger, registry, gateway, notifier, options, [this]() { return now; });
            }
        }
        return nullptr;
    }

    std::string open(const std::string& name, const std::string& symbol, double price) {
        auto c = controller(name);
        core::TradeSignal signal;
        signal.type = core::SignalType::BUY;
        signal.symbol = symbol;
        signal.entry_price = price;
        signal.stop_loss = price * 0.9;
        const auto result = c->onSignal(signal);
        assert(result.ok);
        return result.trade_id;
    }

    core::TradeRecord pending(const std::string& name, const std::string& symbol, double quantity, double price) {
        core::TradeRecord record;
        record.trade_id = "pending-" + name;
        record.strategy_name = name;
        record.symbol = symbol;
        record.side = PositionSide::LONG;
        record.quantity = quantity;
        record.entry_price = price;
        record.leverage = 5.0;
        record.margin_used = price * quantity / 5.0;
        record.stop_loss = price * 0.95;
        record.status = TradeStatus::PENDING;
        record.entry_time = now;
        record.exchange_order_ref = std::string("991");
        assert(ledger->put(record).ok);
        registry->restore(name, record.trade_id, record.entry_time);
        return record;
    }

    void reduce(const std::string& symbol, double quantity, double price, const std::string& id) {
        core::OrderRequest request;
        request.symbol = symbol;
        request.side = OrderSide::SELL;
        request.quantity = quantity;
        request.reduce_only = true;
        request.client_order_id = id;
        request.reference_price = price;
        gateway->placeOrder(request);
    }
};
} // namespace

int main() {
    // Externally closed position heals to CLOSED at the fill VWAP
    {
        Fixture f;
        const auto id = f.open("alpha", "BTCUSDT", 100.0);
        const long long entry_time = f.now;

        f.now += 10 * kMinute;
        f.reduce("BTCUSDT", 4.0, 104.0, "ext-1");
        f.now += 1000;
        f.reduce("BTCUSDT", 6.0, 106.0, "ext-2");
        const long long last_fill = f.now;
        f.now += kMinute;

        const auto report = f.engine->runCycle();
        assert(report.completed);
        assert(report.orphans_detected == 1 && report.orphans_healed == 1);
        const auto record = *f.ledger->get(id);
        assert(record.status == TradeStatus::CLOSED);
        assert(record.exit_reason == "orphan-recovered");
        assert(near(*record.exit_price, 105.2));
        assert(near(*record.pnl_absolute, 52.0));
        assert(*record.exit_time == last_fill);
        assert(*record.duration_ms == last_fill - entry_time);

        assert(!f.registry->isOccupied("alpha"));
        assert(f.registry->cooldownRemainingMs("alpha") == 300'000);
        assert(f.notifier->counts[core::AnomalyType::ORPHAN_DETECTED] == 1);
        assert(f.engine->isAnomalyActive("orphan:" + id));

        const auto next = f.engine->runCycle();
        assert(next.orphans_detected == 0);
        assert(f.notifier->counts[core::AnomalyType::ORPHAN_DETECTED] == 1);
        assert(f.notifier->counts[core::AnomalyType::ORPHAN_CLEARED] == 1);
        assert(f.engine->activeAnomalyCount() == 0);
    }

    // Liquidation and unresolved exits
    {
        Fixture f;
        const auto liquidated = f.open("alpha", "BTCUSDT", 100.0);
        const auto vanished = f.open("beta", "ETHUSDT", 50.0);

        f.now += 5 * kMinute;
        f.gateway->closePositionExternally("BTCUSDT", PositionSide::LONG, 81.0, true);
        f.gateway->dropPosition("ETHUSDT", PositionSide::LONG);
        f.gateway->setMarkPrice("ETHUSDT", 45.0);
        f.now += 5 * kMinute;

        const auto report = f.engine->runCycle();
        assert(report.orphans_healed == 2);

        const auto liq = *f.ledger->get(liquidated);
        assert(liq.exit_reason == "liquidation");
        assert(*liq.exit_price == 81.0);
        assert(*liq.pnl_absolute < 0.0);

        const auto gone = *f.ledger->get(vanished);
        assert(gone.status == TradeStatus::CLOSED);
        assert(gone.exit_reason == "orphan-unresolved");
        assert(*gone.exit_price == 45.0);
        assert(*gone.exit_time == f.now);
    }

    // PENDING intent with no position becomes ORPHANED, no cooldown
    {
        Fixture f;
        const auto record = f.pending("alpha", "BTCUSDT", 10.0, 100.0);
        f.now += 3 * kMinute;

        const auto report = f.engine->runCycle();
        assert(report.orphans_healed == 1);
        const auto stored = *f.ledger->get(record.trade_id);
        assert(stored.status == TradeStatus::ORPHANED);
        assert(stored.exit_reason == "orphan-pending-unconfirmed");
        assert(*stored.pnl_absolute == 0.0);
        assert(!f.registry->isBlocked("alpha"));
    }

    // Ghosts: adopted for the strategy trading the symbol, then promoted
    {
        Fixture f;
        f.gateway->injectPosition("BTCUSDT", PositionSide::LONG, 0.5, 30000.0);
        f.gateway->injectPosition("DOGEUSDT", PositionSide::SHORT, 1000.0, 0.1);

        const auto first = f.engine->runCycle();
        assert(first.ghosts_detected == 2 && first.ghosts_adopted == 2);
        assert(f.notifier->counts[core::AnomalyType::GHOST_DETECTED] == 2);
        assert(f.engine->isAnomalyActive("ghost:BTCUSDT:LONG"));

        const auto adopted = f.ledger->activeForStrategy("alpha");
        assert(adopted.size() == 1);
        assert(adopted[0].status == TradeStatus::GHOST_ADOPTED);
        assert(adopted[0].quantity == 0.5);
        assert(adopted[0].entry_price == 30000.0);
        assert(f.registry->slot("alpha")->trade_id == adopted[0].trade_id);

        const auto orphaned = f.ledger->activeForStrategy(core::kUnattributedStrategy);
        assert(orphaned.size() == 1 && orphaned[0].symbol == "DOGEUSDT");
        assert(orphaned[0].side == PositionSide::SHORT);

        f.now += kMinute;
        const auto second = f.engine->runCycle();
        assert(second.ghosts_detected == 0);
        assert(second.promoted == 2);
        assert(f.ledger->get(adopted[0].trade_id)->status == TradeStatus::OPEN);
        assert(f.notifier->counts[core::AnomalyType::GHOST_CLEARED] == 2);

        // An adopted position can be exited by its strategy
        f.gateway->setMarkPrice("BTCUSDT", 30100.0);
        auto alpha = f.controller("alpha");
        const auto exit = alpha->close({"signal-exit", 30100.0});
        assert(exit.ok);
        assert(near(*f.ledger->get(adopted[0].trade_id)->pnl_absolute, 50.0));
    }

    // A ghost matching an unconfirmed intent supersedes it
    {
        Fixture f;
        const auto intent = f.pending("alpha", "BTCUSDT", 10.0, 100.0);
        f.gateway->injectPosition("BTCUSDT", PositionSide::LONG, 10.0, 100.2);
        f.now += 10 * kMinute;

        const auto report = f.engine->runCycle();
        assert(report.orphans_detected == 0);
        assert(report.ghosts_adopted == 1);

        const auto old = *f.ledger->get(intent.trade_id);
        assert(old.status == TradeStatus::ORPHANED);
        assert(old.exit_reason == "adopted-as-ghost");

        const auto active = f.ledger->activeForStrategy("alpha");
        assert(active.size() == 1);
        assert(active[0].status == TradeStatus::GHOST_ADOPTED);
        assert(active[0].exchange_order_ref && *active[0].exchange_order_ref == "991");
        assert(active[0].stop_loss == intent.stop_loss);
        assert(f.registry->slot("alpha")->trade_id == active[0].trade_id);
        assert(f.notifier->last[core::AnomalyType::GHOST_DETECTED].value("matched_trade_id", "") == intent.trade_id);
    }

    // Ambiguous ghost is reported once and left alone
    {
        Fixture f;
        f.open("alpha", "BTCUSDT", 100.0);
        f.gateway->injectPosition("BTCUSDT", PositionSide::SHORT, 2.0, 101.0);
        f.now += 10 * kMinute;

        const auto report = f.engine->runCycle();
        assert(report.ghosts_detected == 1);
        assert(report.ghosts_adopted == 0);
        const auto payload = f.notifier->last[core::AnomalyType::GHOST_DETECTED];
        assert(payload.value("ambiguous", false));
        assert(!payload.value("adopted", true));

        f.engine->runCycle();
        assert(f.notifier->counts[core::AnomalyType::GHOST_DETECTED] == 1);
        assert(f.engine->isAnomalyActive("ghost:BTCUSDT:SHORT"));
        assert(f.ledger->activeForStrategy("alpha").size() == 1);

        f.gateway->dropPosition("BTCUSDT", PositionSide::SHORT);
        f.engine->runCycle();
        assert(!f.engine->isAnomalyActive("ghost:BTCUSDT:SHORT"));
        assert(f.notifier->counts[core::AnomalyType::GHOST_CLEARED] == 1);
    }

    // Fresh trades are inside the grace window
    {
        Fixture f;
        const auto id = f.open("alpha", "BTCUSDT", 100.0);
        f.gateway->closePositionExternally("BTCUSDT", PositionSide::LONG, 101.0, false);
        f.now += 30'000;

        auto report = f.engine->runCycle();
        assert(report.recent_skipped == 1);
        assert(report.orphans_detected == 0);
        assert(f.ledger->get(id)->status == TradeStatus::OPEN);

        f.now += 120'000;
        report = f.engine->runCycle();
        assert(report.orphans_healed == 1);
        assert(f.ledger->get(id)->exit_reason == "orphan-recovered");
    }

    // A cycle past its deadline stops early and clears nothing
    {
        Fixture f;
        f.cycle_timeout_seconds = 1;
        f.rebuildEngine();
        const auto id = f.open("alpha", "BTCUSDT", 100.0);
        f.gateway->injectPosition("BTCUSDT", PositionSide::SHORT, 2.0, 101.0);
        f.now += 10 * kMinute;

        const auto first = f.engine->runCycle();
        assert(first.completed && !first.timed_out);
        assert(f.engine->isAnomalyActive("ghost:BTCUSDT:SHORT"));

        // both conditions go away, but the fill lookup outlasts the deadline
        f.gateway->dropPosition("BTCUSDT", PositionSide::SHORT);
        f.gateway->dropPosition("BTCUSDT", PositionSide::LONG);
        f.gateway->fills_delay_ms = 1100;

        const auto slow = f.engine->runCycle();
        assert(slow.timed_out);
        assert(!slow.completed);
        assert(slow.orphans_healed == 1);
        assert(f.ledger->get(id)->status == TradeStatus::CLOSED);
        assert(f.engine->isAnomalyActive("ghost:BTCUSDT:SHORT"));
        assert(f.notifier->counts[core::AnomalyType::GHOST_CLEARED] == 0);

        f.gateway->fills_delay_ms = 0;
        const auto full = f.engine->runCycle();
        assert(full.completed && !full.timed_out);
        assert(!f.engine->isAnomalyActive("ghost:BTCUSDT:SHORT"));
        assert(f.notifier->counts[core::AnomalyType::GHOST_CLEARED] == 1);
        assert(f.notifier->counts[core::AnomalyType::ORPHAN_CLEARED] == 1);
        assert(f.engine->activeAnomalyCount() == 0);
    }

    // A partially filled exit is re-issued for the remainder
    {
        Fixture f;
        const auto id = f.open("alpha", "BTCUSDT", 100.0);
        f.gateway->partial_exits = 1;
        const int orders_before = f.gateway->placeOrderCalls();

        f.now += 5 * kMinute;
        auto alpha = f.controller("alpha");
        const auto exit = alpha->close({"signal-exit", 110.0});
        assert(exit.ok);
        assert(f.gateway->placeOrderCalls() == orders_before + 2);

        const auto record = *f.ledger->get(id);
        assert(record.status == TradeStatus::CLOSED);
        assert(*record.exit_price == 110.0);
        assert(near(*record.pnl_absolute, 100.0));
        assert(!record.closed_quantity.has_value());
        assert(f.gateway->getLivePositions().empty());
        assert(f.registry->cooldownRemainingMs("alpha") == 300'000);
        assert(!f.ledger->get(id)->parent_trade_id.has_value());
    }

    // An exit that keeps filling partially splits the record, so PnL is booked once
    {
        Fixture f;
        const auto id = f.open("alpha", "BTCUSDT", 100.0);
        f.gateway->partial_exits = 100;

        f.now += 5 * kMinute;
        auto alpha = f.controller("alpha");
        const auto exit = alpha->close({"signal-exit", 110.0});
        assert(!exit.ok);
        assert(exit.reason == "exit partially filled");

        // three exit orders sold 5 + 2.5 + 1.25
        const auto closed = *f.ledger->get(id);
        assert(closed.status == TradeStatus::CLOSED);
        assert(closed.closed_quantity && near(*closed.closed_quantity, 8.75));
        assert(near(*closed.pnl_absolute, 87.5));
        assert(near(*closed.pnl_percentage, 50.0));

        const auto rest = *f.ledger->get(exit.trade_id);
        assert(rest.status == TradeStatus::OPEN);
        assert(rest.parent_trade_id && *rest.parent_trade_id == id);
        assert(near(rest.quantity, 1.25));
        assert(near(rest.margin_used, 25.0));
        assert(rest.entry_price == 100.0);
        assert(f.registry->slot("alpha")->trade_id == rest.trade_id);
        assert(f.registry->cooldownRemainingMs("alpha") == 0);
        assert(alpha->state() == core::execution::LifecycleState::OPEN);

        const auto live = f.gateway->getLivePositions();
        assert(live.size() == 1 && near(live[0].quantity, 1.25));

        // the remainder has a record, so reconciliation sees no ghost
        f.now += 10 * kMinute;
        const auto report = f.engine->runCycle();
        assert(report.ghosts_detected == 0);
        assert(report.orphans_detected == 0);
        assert(f.ledger->activeForStrategy("alpha").size() == 1);

        // healing the remainder ignores the fills already booked on its parent
        f.gateway->closePositionExternally("BTCUSDT", PositionSide::LONG, 108.0, false);
        f.now += 10 * kMinute;
        const auto healed = f.engine->runCycle();
        assert(healed.orphans_healed == 1);
        const auto rest_closed = *f.ledger->get(rest.trade_id);
        assert(rest_closed.exit_reason == "orphan-recovered");
        assert(*rest_closed.exit_price == 108.0);
        assert(near(*rest_closed.pnl_absolute, 10.0));
        assert(!f.registry->isOccupied("alpha"));
    }

    // A strategy busy with its own operation is left for the next cycle
    {
        Fixture f;
        const auto id = f.open("alpha", "BTCUSDT", 100.0);
        f.gateway->dropPosition("BTCUSDT", PositionSide::LONG);
        f.now += 10 * kMinute;

        std::atomic<bool> held{false};
        std::atomic<bool> done{false};
        std::thread holder([&]() {
            auto lock = f.registry->lockStrategy("alpha");
            held = true;
            while (!done) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        });
        while (!held) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        const auto busy = f.engine->runCycle();
        done = true;
        holder.join();

        assert(busy.busy_skipped == 1);
        assert(f.ledger->get(id)->status == TradeStatus::OPEN);
        assert(f.notifier->counts[core::AnomalyType::ORPHAN_DETECTED] == 0);

        const auto healed = f.engine->runCycle();
        assert(healed.orphans_healed == 1);
    }

    // No snapshot, no decisions
    {
        Fixture f;
        const auto id = f.open("alpha", "BTCUSDT", 100.0);
        f.gateway->dropPosition("BTCUSDT", PositionSide::LONG);
        f.now += 10 * kMinute;
        f.gateway->failNext("getLivePositions", 2);

        const auto report = f.engine->runCycle();
        assert(report.skipped);
        assert(!report.completed);
        assert(f.notifier->counts[core::AnomalyType::RETRY_EXHAUSTED] == 1);
        assert(f.ledger->get(id)->status == TradeStatus::OPEN);
    }

    // Startup recovery restores slots and flags duplicate active records
    {
        Fixture f;
        core::TradeRecord first;
        first.trade_id = "beta-1";
        first.strategy_name = "beta";
        first.symbol = "ETHUSDT";
        first.quantity = 1.0;
        first.entry_price = 50.0;
        first.margin_used = 10.0;
        first.leverage = 5.0;
        first.status = TradeStatus::OPEN;
        first.entry_time = f.now - 20 * kMinute;
        auto second = first;
        second.trade_id = "beta-2";
        second.entry_time = f.now - 10 * kMinute;
        second.status = TradeStatus::PENDING;

        nlohmann::json document;
        document["trades"][first.trade_id] = core::toJson(first);
        document["trades"][second.trade_id] = core::toJson(second);
        f.storage->document = document;
        f.ledger->load();
        f.gateway->injectPosition("ETHUSDT", PositionSide::LONG, 1.0, 50.0);

        const auto report = f.engine->recoverOnStartup();
        assert(report.completed);
        assert(f.notifier->counts[core::AnomalyType::LEDGER_CONFLICT] == 1);
        assert(f.registry->isOccupied("beta"));
        assert(f.registry->slot("beta")->trade_id == "beta-2");
        assert(!f.registry->isOccupied("alpha"));
    }

    std::cout << "[TEST] ReconciliationEngine PASSED\n";
    return 0;
}

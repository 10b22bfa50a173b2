#include "common/Config.h"

#include <cassert>
#include <cmath>
#include <cstdlib>
#include <iostream>

int main() {
    using namespace tradesync;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // Defaults
    {
        config.loadFromJson(nlohmann::json::object());
        const auto c = config.getEngineConfig();
        assert(c.mode == engine::TradingMode::PAPER);
        assert(c.reconcile_interval_seconds == 60);
        assert(c.stale_trade_hours == 6);
        assert(c.retention_days == 30);
        assert(std::abs(c.match_rel_tolerance - 0.01) < 1e-12);
        assert(c.strategies.empty());
        assert(config.getValidationErrors().empty());
    }

    // Full document, with one invalid and one duplicate strategy
    {
        setenv("BINANCE_API_KEY", "  key-from-env ", 1);
        setenv("BINANCE_API_SECRET", "secret-from-env", 1);

        nlohmann::json j = nlohmann::json::parse(R"({
            "engine": {
                "mode": "LIVE",
                "log_level": "debug",
                "reconcile_interval_seconds": 15,
                "confirm_timeout_ms": 20000,
                "recent_trade_grace_seconds": 5,
                "ledger_verify_retries": 5
            },
            "exchange": {
                "base_url": "https://testnet.binancefuture.com",
                "api_key": "ignored"
            },
            "strategies": [
                {"name": "BTC_Trend", "symbol": "btcusdt", "margin": 100, "leverage": 10,
                 "max_loss_pct": 20, "cooldown_seconds": 60},
                {"name": "bad", "symbol": "ETHUSDT", "margin": -5, "leverage": 3},
                {"name": "btc_trend", "symbol": "BTCUSDT", "margin": 50, "leverage": 2}
            ]
        })");
        config.loadFromJson(j);

        const auto c = config.getEngineConfig();
        assert(c.mode == engine::TradingMode::LIVE);
        assert(c.log_level == "debug");
        assert(c.reconcile_interval_seconds == 15);
        assert(c.ledger_verify_retries == 5);
        // grace covers a full confirmation wait
        assert(c.recent_trade_grace_seconds == 21);
        assert(c.exchange.base_url == "https://testnet.binancefuture.com");
        assert(c.exchange.api_key == "key-from-env");
        assert(c.exchange.api_secret == "secret-from-env");

        assert(c.strategies.size() == 1);
        const auto& s = c.strategies.front();
        assert(s.name == "btc_trend");
        assert(s.symbol == "BTCUSDT");
        assert(s.margin == 100.0);
        assert(s.leverage == 10.0);
        assert(s.cooldown_seconds == 60);

        // margin error plus the duplicate name
        assert(config.getValidationErrors().size() == 2);

        auto found = config.getStrategy("BTC_TREND");
        assert(found.has_value());
        assert(found->max_loss_pct == 20.0);
        assert(!config.getStrategy("bad").has_value());
    }

    // StrategyConfig validation
    {
        engine::StrategyConfig sc;
        sc.name = "x";
        sc.symbol = "BTCUSDT";
        sc.margin = 10.0;
        assert(sc.validate().empty());

        sc.leverage = 0.5;
        sc.max_loss_pct = 0.0;
        sc.assessment_interval_seconds = 0;
        assert(sc.validate().size() == 3);
    }

    // Missing file keeps defaults
    {
        assert(!config.load("/nonexistent/tradesync/config.json"));
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}

#pragma once

#include <string>
#include <vector>

namespace tradesync {
namespace engine {

enum class TradingMode {
    LIVE,   // orders go to the exchange
    PAPER   // orders go to the in-memory paper venue
};

// Per-strategy settings handed to its PositionLifecycleController
struct StrategyConfig {
    std::string name;
    std::string symbol;
    double margin = 0.0;                 // target margin per trade
    double leverage = 1.0;
    double max_loss_pct = 10.0;          // failsafe: loss as % of margin_used
    int cooldown_seconds = 300;          // re-entry block after a close
    int assessment_interval_seconds = 60;
    bool enabled = true;

    // Empty when valid, otherwise one entry per problem
    std::vector<std::string> validate() const;
};

struct ExchangeConfig {
    std::string base_url = "https://fapi.binance.com";
    std::string api_key;
    std::string api_secret;
    long long recv_window_ms = 5000;
    long timeout_seconds = 10;
};

struct EngineConfig {
    TradingMode mode;
    std::string data_dir;
    std::string log_dir;
    std::string log_level;

    // Reconciliation
    int reconcile_interval_seconds;
    int cycle_timeout_seconds;
    int recent_trade_grace_seconds;      // in-flight protection for fresh opens/closes
    int orphan_fill_lookback_minutes;

    // Ledger
    int stale_trade_hours;
    int retention_days;
    int ledger_verify_retries;
    int ledger_retry_backoff_ms;
    double match_rel_tolerance;
    double match_quantity_floor;
    double match_price_floor;

    // Order confirmation and gateway retries
    int confirm_timeout_ms;
    int confirm_poll_ms;
    int exit_order_attempts;             // exit orders per close before the remainder is split off
    int gateway_retry_attempts;
    int gateway_retry_backoff_ms;

    ExchangeConfig exchange;
    std::vector<StrategyConfig> strategies;

    EngineConfig()
        : mode(TradingMode::PAPER)
        , data_dir("data")
        , log_dir("logs")
        , log_level("info")
        , reconcile_interval_seconds(60)
        , cycle_timeout_seconds(30)
        , recent_trade_grace_seconds(120)
        , orphan_fill_lookback_minutes(360)
        , stale_trade_hours(6)
        , retention_days(30)
        , ledger_verify_retries(3)
        , ledger_retry_backoff_ms(50)
        , match_rel_tolerance(0.01)
        , match_quantity_floor(0.001)
        , match_price_floor(0.01)
        , confirm_timeout_ms(10000)
        , confirm_poll_ms(500)
        , exit_order_attempts(3)
        , gateway_retry_attempts(3)
        , gateway_retry_backoff_ms(500)
    {}
};

} // namespace engine
} // namespace tradesync

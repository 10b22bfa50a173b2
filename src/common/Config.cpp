#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

namespace tradesync {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeStrategyName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return trimCopy(name);
}

std::string normalizeSymbol(std::string symbol) {
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimCopy(symbol);
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute() || std::filesystem::exists(path)) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return false;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: config file could not be opened." << std::endl;
            return false;
        }

        nlohmann::json j;
        file >> j;
        loadFromJson(j);

        std::cout << "Config loaded: mode="
                  << (engine_config_.mode == engine::TradingMode::LIVE ? "LIVE" : "PAPER")
                  << ", strategies=" << engine_config_.strategies.size() << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
        return false;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    engine_config_ = engine::EngineConfig();
    validation_errors_.clear();

    if (j.contains("engine")) {
        parseEngine(j["engine"]);
    }
    if (j.contains("exchange")) {
        parseExchange(j["exchange"]);
    }

    engine_config_.exchange.api_key = readEnvVar("BINANCE_API_KEY");
    engine_config_.exchange.api_secret = readEnvVar("BINANCE_API_SECRET");
    if (engine_config_.mode == engine::TradingMode::LIVE &&
        (engine_config_.exchange.api_key.empty() || engine_config_.exchange.api_secret.empty())) {
        std::cout << "Warning: BINANCE_API_KEY or BINANCE_API_SECRET is empty." << std::endl;
    }

    if (j.contains("strategies")) {
        parseStrategies(j["strategies"]);
    }
}

std::optional<engine::StrategyConfig> Config::getStrategy(const std::string& name) const {
    const std::string key = normalizeStrategyName(name);
    for (const auto& s : engine_config_.strategies) {
        if (s.name == key) {
            return s;
        }
    }
    return std::nullopt;
}

void Config::parseEngine(const nlohmann::json& e) {
    auto& c = engine_config_;

    const std::string mode_str = e.value("mode", std::string("PAPER"));
    c.mode = (mode_str == "LIVE") ? engine::TradingMode::LIVE : engine::TradingMode::PAPER;
    c.data_dir = e.value("data_dir", c.data_dir);
    c.log_dir = e.value("log_dir", c.log_dir);
    c.log_level = e.value("log_level", c.log_level);

    c.reconcile_interval_seconds = e.value("reconcile_interval_seconds", c.reconcile_interval_seconds);
    c.cycle_timeout_seconds = e.value("cycle_timeout_seconds", c.cycle_timeout_seconds);
    c.recent_trade_grace_seconds = e.value("recent_trade_grace_seconds", c.recent_trade_grace_seconds);
    c.orphan_fill_lookback_minutes = e.value("orphan_fill_lookback_minutes", c.orphan_fill_lookback_minutes);

    c.stale_trade_hours = e.value("stale_trade_hours", c.stale_trade_hours);
    c.retention_days = e.value("retention_days", c.retention_days);
    c.ledger_verify_retries = e.value("ledger_verify_retries", c.ledger_verify_retries);
    c.ledger_retry_backoff_ms = e.value("ledger_retry_backoff_ms", c.ledger_retry_backoff_ms);
    c.match_rel_tolerance = e.value("match_rel_tolerance", c.match_rel_tolerance);
    c.match_quantity_floor = e.value("match_quantity_floor", c.match_quantity_floor);
    c.match_price_floor = e.value("match_price_floor", c.match_price_floor);

    c.confirm_timeout_ms = e.value("confirm_timeout_ms", c.confirm_timeout_ms);
    c.confirm_poll_ms = e.value("confirm_poll_ms", c.confirm_poll_ms);
    // Suffixed exit client ids must stay within 36 characters
    c.exit_order_attempts = std::min(9, std::max(1, e.value("exit_order_attempts", c.exit_order_attempts)));
    c.gateway_retry_attempts = e.value("gateway_retry_attempts", c.gateway_retry_attempts);
    c.gateway_retry_backoff_ms = e.value("gateway_retry_backoff_ms", c.gateway_retry_backoff_ms);

    // The grace window must cover a full confirmation wait, otherwise an
    // in-flight PENDING record could be healed as an orphan.
    const int min_grace = c.confirm_timeout_ms / 1000 + 1;
    if (c.recent_trade_grace_seconds < min_grace) {
        std::cout << "Warning: recent_trade_grace_seconds raised to " << min_grace << std::endl;
        c.recent_trade_grace_seconds = min_grace;
    }
}

void Config::parseExchange(const nlohmann::json& x) {
    auto& ex = engine_config_.exchange;
    ex.base_url = x.value("base_url", ex.base_url);
    ex.recv_window_ms = x.value("recv_window_ms", ex.recv_window_ms);
    ex.timeout_seconds = x.value("timeout_seconds", ex.timeout_seconds);

    if (x.contains("api_key") || x.contains("api_secret")) {
        std::cout << "Warning: api keys in the config file are ignored. "
                     "Use BINANCE_API_KEY/BINANCE_API_SECRET." << std::endl;
    }
}

void Config::parseStrategies(const nlohmann::json& list) {
    if (!list.is_array()) {
        validation_errors_.push_back("strategies: expected an array");
        return;
    }

    std::set<std::string> seen;
    for (const auto& s : list) {
        engine::StrategyConfig sc;
        try {
            sc.name = normalizeStrategyName(s.value("name", std::string()));
            sc.symbol = normalizeSymbol(s.value("symbol", std::string()));
            sc.margin = s.value("margin", sc.margin);
            sc.leverage = s.value("leverage", sc.leverage);
            sc.max_loss_pct = s.value("max_loss_pct", sc.max_loss_pct);
            sc.cooldown_seconds = s.value("cooldown_seconds", sc.cooldown_seconds);
            sc.assessment_interval_seconds = s.value("assessment_interval_seconds", sc.assessment_interval_seconds);
            sc.enabled = s.value("enabled", sc.enabled);
        } catch (const nlohmann::json::exception& e) {
            validation_errors_.push_back("strategy '" + sc.name + "': " + e.what());
            continue;
        }

        auto errors = sc.validate();
        if (!seen.insert(sc.name).second) {
            errors.push_back("duplicate strategy name");
        }
        if (!errors.empty()) {
            for (const auto& err : errors) {
                validation_errors_.push_back("strategy '" + sc.name + "': " + err);
                std::cerr << "Config: strategy '" << sc.name << "' rejected: " << err << std::endl;
            }
            continue;
        }
        engine_config_.strategies.push_back(sc);
    }
}

} // namespace tradesync

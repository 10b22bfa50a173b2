#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "core/adapters/JournaledAnomalyNotifier.h"
#include "core/adapters/JsonlSignalSource.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/LedgerStorageJson.h"
#include "core/state/TradeLedger.h"
#include "engine/TradingEngine.h"
#include "execution/BinanceFuturesGateway.h"
#include "execution/PaperExchangeGateway.h"
#include "network/BinanceHttpClient.h"
#include "risk/PositionSlotRegistry.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace tradesync;

namespace {
std::atomic<bool> g_shutdown_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

std::filesystem::path resolveDir(const std::string& dir) {
    std::filesystem::path path(dir);
    if (path.is_relative()) {
        path = utils::PathUtils::resolveRelativePath(dir);
    }
    std::filesystem::create_directories(path);
    return path;
}

std::shared_ptr<core::IExchangeGateway> buildGateway(const engine::EngineConfig& config) {
    auto http = std::make_shared<network::BinanceHttpClient>(config.exchange);

    if (config.mode == engine::TradingMode::LIVE) {
        if (!http->hasCredentials()) {
            throw std::runtime_error("LIVE mode needs BINANCE_API_KEY and BINANCE_API_SECRET");
        }
        return std::make_shared<execution::BinanceFuturesGateway>(http);
    }

    // Paper fills at the public mark price
    auto market = std::make_shared<execution::BinanceFuturesGateway>(http);
    auto paper = std::make_shared<execution::PaperExchangeGateway>();
    paper->setSlippageBps(2.0);
    paper->setPriceSource([market](const std::string& symbol) { return market->getMarkPrice(symbol); });
    for (const auto& strategy : config.strategies) {
        paper->setLeverage(strategy.symbol, strategy.leverage);
    }
    return paper;
}
} // namespace

int main(int argc, char* argv[]) {
    const std::string config_path = (argc > 1) ? argv[1] : "config/config.json";

    auto& config_loader = Config::getInstance();
    const bool config_loaded = config_loader.load(config_path);
    const auto config = config_loader.getEngineConfig();

    try {
        Logger::getInstance().initialize(resolveDir(config.log_dir).string(), config.log_level);
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        return 1;
    }

    LOG_INFO("========================================");
    LOG_INFO("TradeSync position lifecycle engine");
    LOG_INFO("========================================");
    if (!config_loaded) {
        LOG_WARN("Config '{}' not loaded, running with defaults", config_path);
    }
    for (const auto& error : config_loader.getValidationErrors()) {
        LOG_ERROR("Config: {}", error);
    }
    if (config.strategies.empty()) {
        LOG_ERROR("No valid strategies configured, nothing to do");
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        const auto data_dir = resolveDir(config.data_dir);

        auto anomaly_journal = std::make_shared<core::EventJournalJsonl>(data_dir / "anomalies.jsonl");
        auto emergency_journal = std::make_shared<core::EventJournalJsonl>(data_dir / "emergency_writes.jsonl");
        auto archive_journal = std::make_shared<core::EventJournalJsonl>(data_dir / "trade_archive.jsonl");
        auto notifier = std::make_shared<core::JournaledAnomalyNotifier>(anomaly_journal);

        auto storage = std::make_shared<core::LedgerStorageJson>(data_dir / "trades.json");
        auto ledger = std::make_shared<core::TradeLedger>(
            storage, engine::ledgerOptionsFrom(config), emergency_journal, archive_journal);
        ledger->setNotifier(notifier);
        ledger->load();

        const auto stale = ledger->closeStaleTrades();
        const auto archived = ledger->archiveExpired();
        LOG_INFO("Ledger ready: {} stale closed, {} archived", stale.size(), archived);

        std::vector<std::string> strategy_names;
        for (const auto& strategy : config.strategies) {
            strategy_names.push_back(strategy.name);
        }
        auto signals = std::make_shared<core::JsonlSignalSource>(data_dir / "inbox", strategy_names);

        auto registry = std::make_shared<risk::PositionSlotRegistry>();
        auto gateway = buildGateway(config);

        engine::TradingEngine engine(config, ledger, registry, gateway, notifier, signals);

        const auto recovery = engine.recover();
        if (!recovery.completed) {
            LOG_WARN("Startup reconciliation incomplete: {}",
                     recovery.error.empty() ? std::string("timed out") : recovery.error);
        }

        if (!engine.start()) {
            return 1;
        }

        LOG_INFO("Running. Press Ctrl+C to stop.");
        while (!g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Shutdown signal received");
        engine.stop();
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        return 1;
    }

    LOG_INFO("TradeSync stopped");
    return 0;
}

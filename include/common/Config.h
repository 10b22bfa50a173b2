#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace tradesync {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults; returns false when the file could not be used
    bool load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    std::optional<engine::StrategyConfig> getStrategy(const std::string& name) const;

    // Strategies dropped during the last load, with the reason
    const std::vector<std::string>& getValidationErrors() const { return validation_errors_; }

private:
    Config() = default;

    void parseEngine(const nlohmann::json& e);
    void parseExchange(const nlohmann::json& x);
    void parseStrategies(const nlohmann::json& list);

    engine::EngineConfig engine_config_;
    std::vector<std::string> validation_errors_;
};

} // namespace tradesync

#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/contracts/ISignalSource.h"

namespace tradesync {
namespace core {

// Reads <inbox>/<strategy>.jsonl. Only lines appended after the strategy was
// primed are delivered; an incomplete last line waits for the next poll.
//
// Entry: {"signalType":"BUY","symbol":"BTCUSDT","entryPrice":100,"stopLoss":95,
//         "takeProfit":110,"confidence":0.7,"reason":"..."}
// Exit:  {"action":"exit","reason":"...","price":105}
class JsonlSignalSource : public ISignalSource {
public:
    JsonlSignalSource(std::filesystem::path inbox_dir, const std::vector<std::string>& strategies);

    std::vector<StrategyInstruction> poll(const std::string& strategy) override;

    // Parses one inbox line; nullopt when it is not a valid instruction
    static std::optional<StrategyInstruction> parseLine(const std::string& line);

private:
    std::filesystem::path fileFor(const std::string& strategy) const;
    std::uintmax_t currentSize(const std::string& strategy) const;

    std::filesystem::path inbox_dir_;
    std::mutex mutex_;
    std::map<std::string, std::uintmax_t> offsets_;
};

} // namespace core
} // namespace tradesync

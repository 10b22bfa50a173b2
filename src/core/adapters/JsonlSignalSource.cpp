#include "core/adapters/JsonlSignalSource.h"

#include <fstream>

#include "common/Logger.h"

namespace tradesync {
namespace core {
namespace {
std::optional<double> optionalNumber(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}
}

JsonlSignalSource::JsonlSignalSource(std::filesystem::path inbox_dir, const std::vector<std::string>& strategies)
    : inbox_dir_(std::move(inbox_dir)) {
    std::error_code ec;
    std::filesystem::create_directories(inbox_dir_, ec);
    if (ec) {
        LOG_WARN("signal inbox {} unavailable: {}", inbox_dir_.string(), ec.message());
    }
    for (const auto& strategy : strategies) {
        offsets_[strategy] = currentSize(strategy);
    }
}

std::vector<StrategyInstruction> JsonlSignalSource::poll(const std::string& strategy) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StrategyInstruction> out;

    auto it = offsets_.find(strategy);
    if (it == offsets_.end()) {
        offsets_[strategy] = currentSize(strategy);
        return out;
    }

    const std::uintmax_t size = currentSize(strategy);
    if (size < it->second) {
        // Inbox was truncated or replaced
        it->second = 0;
    }
    if (size == it->second) {
        return out;
    }

    std::ifstream in(fileFor(strategy), std::ios::binary);
    if (!in.is_open()) {
        return out;
    }
    in.seekg(static_cast<std::streamoff>(it->second));

    std::string line;
    std::uintmax_t consumed = it->second;
    while (std::getline(in, line)) {
        if (in.eof()) {
            // no trailing newline yet
            break;
        }
        consumed += line.size() + 1;
        if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto instruction = parseLine(line);
        if (!instruction) {
            LOG_WARN("[{}] ignoring malformed signal line: {}", strategy, line);
            continue;
        }
        out.push_back(*instruction);
    }
    it->second = consumed;
    return out;
}

std::optional<StrategyInstruction> JsonlSignalSource::parseLine(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
    if (!j.is_object()) {
        return std::nullopt;
    }

    try {
        StrategyInstruction instruction;
        if (j.value("action", "entry") == "exit") {
            instruction.kind = StrategyInstruction::Kind::EXIT;
            instruction.exit.reason = j.value("reason", "signal-exit");
            instruction.exit.price = optionalNumber(j, "price");
            return instruction;
        }

        const std::string type = j.value("signalType", "");
        if (type != "BUY" && type != "SELL") {
            return std::nullopt;
        }
        instruction.kind = StrategyInstruction::Kind::ENTRY;
        instruction.signal.type = (type == "BUY") ? SignalType::BUY : SignalType::SELL;
        instruction.signal.symbol = j.value("symbol", "");
        instruction.signal.entry_price = j.value("entryPrice", 0.0);
        instruction.signal.stop_loss = optionalNumber(j, "stopLoss");
        instruction.signal.take_profit = optionalNumber(j, "takeProfit");
        instruction.signal.confidence = j.value("confidence", 0.0);
        instruction.signal.reason = j.value("reason", "");
        if (!(instruction.signal.entry_price > 0.0)) {
            return std::nullopt;
        }
        return instruction;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::filesystem::path JsonlSignalSource::fileFor(const std::string& strategy) const {
    return inbox_dir_ / (strategy + ".jsonl");
}

std::uintmax_t JsonlSignalSource::currentSize(const std::string& strategy) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(fileFor(strategy), ec);
    return ec ? 0 : size;
}

} // namespace core
} // namespace tradesync

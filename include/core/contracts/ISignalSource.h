#pragma once

#include <string>
#include <vector>

#include "core/model/PlaneTypes.h"

namespace tradesync {
namespace core {

class ISignalSource {
public:
    virtual ~ISignalSource() = default;

    // Instructions that arrived for the strategy since the previous poll, oldest first
    virtual std::vector<StrategyInstruction> poll(const std::string& strategy) = 0;
};

} // namespace core
} // namespace tradesync

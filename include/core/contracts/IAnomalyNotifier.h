#pragma once

#include <nlohmann/json.hpp>

#include "core/model/PlaneTypes.h"

namespace tradesync {
namespace core {

class IAnomalyNotifier {
public:
    virtual ~IAnomalyNotifier() = default;

    virtual void notify(AnomalyType type, const nlohmann::json& payload) = 0;
};

} // namespace core
} // namespace tradesync

#include "engine/EngineConfig.h"

#include <cmath>

namespace tradesync {
namespace engine {

std::vector<std::string> StrategyConfig::validate() const {
    std::vector<std::string> errors;
    if (name.empty()) {
        errors.push_back("name is empty");
    }
    if (symbol.empty()) {
        errors.push_back("symbol is empty");
    }
    if (!(margin > 0.0) || !std::isfinite(margin)) {
        errors.push_back("margin must be positive");
    }
    if (!(leverage >= 1.0) || leverage > 125.0) {
        errors.push_back("leverage must be within [1, 125]");
    }
    if (!(max_loss_pct > 0.0) || max_loss_pct > 100.0) {
        errors.push_back("max_loss_pct must be within (0, 100]");
    }
    if (cooldown_seconds < 0) {
        errors.push_back("cooldown_seconds must not be negative");
    }
    if (assessment_interval_seconds <= 0) {
        errors.push_back("assessment_interval_seconds must be positive");
    }
    return errors;
}

} // namespace engine
} // namespace tradesync

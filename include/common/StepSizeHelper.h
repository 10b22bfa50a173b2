#pragma once

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace tradesync {
namespace common {

// Binance LOT_SIZE filter: quantities must be a multiple of stepSize.

// Decimal places implied by a step such as 0.001 -> 3
inline int stepDecimals(double step) {
    int decimals = 0;
    while (decimals < 12 && std::fabs(step * std::pow(10.0, decimals) - std::round(step * std::pow(10.0, decimals))) > 1e-9) {
        ++decimals;
    }
    return decimals;
}

// Rounds down so the order never exceeds the intended size
inline double floorToStep(double quantity, double step) {
    if (step <= 0.0) return quantity;
    return std::floor(quantity / step + 1e-9) * step;
}

inline std::string formatQuantity(double quantity, double step) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(step > 0.0 ? stepDecimals(step) : 8) << floorToStep(quantity, step);
    return oss.str();
}

} // namespace common
} // namespace tradesync

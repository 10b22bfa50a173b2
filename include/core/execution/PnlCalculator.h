#pragma once

#include "common/Types.h"

namespace tradesync {
namespace core {
namespace execution {

struct PnlResult {
    double absolute = 0.0;
    double percentage = 0.0;   // of margin_used
};

// Single PnL formula shared by the controller, healing and the failsafe
class PnlCalculator {
public:
    static PnlResult compute(PositionSide side, double entry_price, double exit_price,
                             double quantity, double margin_used);

    // entry_price * quantity / leverage
    static double marginUsed(double entry_price, double quantity, double leverage);

    // margin * leverage / entry_price
    static double quantityForMargin(double margin, double leverage, double entry_price);
};

} // namespace execution
} // namespace core
} // namespace tradesync

#include "core/execution/PnlCalculator.h"

namespace tradesync {
namespace core {
namespace execution {

PnlResult PnlCalculator::compute(PositionSide side, double entry_price, double exit_price,
                                 double quantity, double margin_used) {
    PnlResult result;
    result.absolute = (side == PositionSide::LONG)
        ? (exit_price - entry_price) * quantity
        : (entry_price - exit_price) * quantity;
    result.percentage = (margin_used > 0.0) ? result.absolute / margin_used * 100.0 : 0.0;
    return result;
}

double PnlCalculator::marginUsed(double entry_price, double quantity, double leverage) {
    if (leverage <= 0.0) {
        return entry_price * quantity;
    }
    return entry_price * quantity / leverage;
}

double PnlCalculator::quantityForMargin(double margin, double leverage, double entry_price) {
    if (entry_price <= 0.0) {
        return 0.0;
    }
    return margin * leverage / entry_price;
}

} // namespace execution
} // namespace core
} // namespace tradesync

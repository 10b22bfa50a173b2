#pragma once

#include "common/Types.h"
#include <string>

namespace tradesync {
namespace execution {

struct ExchangeOrderStateResult {
    OrderStatus status = OrderStatus::SUBMITTED;
    double filled_quantity = 0.0;
    bool terminal = false;
};

// Binance order status (NEW, PARTIALLY_FILLED, FILLED, CANCELED, REJECTED, EXPIRED)
class OrderStateMapper {
public:
    static ExchangeOrderStateResult map(
        const std::string& exchange_state,
        double current_filled_quantity,
        double order_quantity,
        double executed_quantity
    );
};

} // namespace execution
} // namespace tradesync

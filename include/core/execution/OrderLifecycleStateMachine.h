#pragma once

#include <string>

#include "common/Types.h"

namespace tradesync {
namespace core {
namespace execution {

struct OrderLifecycleTransitionResult {
    OrderStatus status = OrderStatus::SUBMITTED;
    double filled_quantity = 0.0;
    bool terminal = false;
};

// Folds an exchange order event into the local order status
class OrderLifecycleStateMachine {
public:
    static OrderLifecycleTransitionResult transition(
        const std::string& event,
        double current_filled_quantity,
        double order_quantity,
        double executed_quantity = 0.0
    );
};

} // namespace execution
} // namespace core
} // namespace tradesync

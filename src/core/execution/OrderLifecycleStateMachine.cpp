#include "core/execution/OrderLifecycleStateMachine.h"

#include <algorithm>
#include <cctype>

namespace tradesync {
namespace core {
namespace execution {

namespace {
std::string normalizeEvent(std::string event) {
    std::transform(event.begin(), event.end(), event.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return event;
}
} // namespace

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    const std::string& event,
    double current_filled_quantity,
    double order_quantity,
    double executed_quantity
) {
    OrderLifecycleTransitionResult result;
    result.filled_quantity = std::max(current_filled_quantity, executed_quantity);

    const std::string normalized_event = normalizeEvent(event);

    if (normalized_event == "FILLED") {
        result.status = OrderStatus::FILLED;
        result.filled_quantity = (result.filled_quantity > 0.0) ? result.filled_quantity : order_quantity;
        result.terminal = true;
        return result;
    }

    // A cancelled or expired order keeps whatever it filled before it died
    if (normalized_event == "CANCELED" || normalized_event == "CANCELLED" ||
        normalized_event == "EXPIRED" || normalized_event == "EXPIRED_IN_MATCH") {
        result.status = (result.filled_quantity > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::CANCELLED;
        result.terminal = true;
        return result;
    }

    if (normalized_event == "REJECTED") {
        result.status = OrderStatus::REJECTED;
        result.terminal = true;
        return result;
    }

    if (normalized_event == "PARTIALLY_FILLED") {
        if (order_quantity > 0.0 && result.filled_quantity >= order_quantity - 1e-8) {
            result.status = OrderStatus::FILLED;
            result.terminal = true;
        } else {
            result.status = (result.filled_quantity > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::SUBMITTED;
        }
        return result;
    }

    if (normalized_event == "NEW" || normalized_event == "PENDING_NEW") {
        result.status = (result.filled_quantity > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::SUBMITTED;
        return result;
    }

    result.status = (result.filled_quantity > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::PENDING;
    return result;
}

} // namespace execution
} // namespace core
} // namespace tradesync

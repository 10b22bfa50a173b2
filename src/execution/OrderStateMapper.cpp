#include "execution/OrderStateMapper.h"

#include "core/execution/OrderLifecycleStateMachine.h"

namespace tradesync {
namespace execution {

ExchangeOrderStateResult OrderStateMapper::map(
    const std::string& exchange_state,
    double current_filled_quantity,
    double order_quantity,
    double executed_quantity
) {
    const auto transitioned = core::execution::OrderLifecycleStateMachine::transition(
        exchange_state,
        current_filled_quantity,
        order_quantity,
        executed_quantity
    );

    ExchangeOrderStateResult result;
    result.status = transitioned.status;
    result.filled_quantity = transitioned.filled_quantity;
    result.terminal = transitioned.terminal;
    return result;
}

} // namespace execution
} // namespace tradesync

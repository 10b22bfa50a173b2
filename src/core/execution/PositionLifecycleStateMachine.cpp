#include "core/execution/PositionLifecycleStateMachine.h"

namespace tradesync {
namespace core {
namespace execution {

const char* toString(LifecycleState state) {
    switch (state) {
        case LifecycleState::NONE: return "NONE";
        case LifecycleState::PENDING: return "PENDING";
        case LifecycleState::OPEN: return "OPEN";
        case LifecycleState::CLOSING: return "CLOSING";
        case LifecycleState::CLOSED: return "CLOSED";
    }
    return "NONE";
}

const char* toString(LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::SIGNAL_ACCEPTED: return "SIGNAL_ACCEPTED";
        case LifecycleEvent::ORDER_FILLED: return "ORDER_FILLED";
        case LifecycleEvent::ORDER_ABORTED: return "ORDER_ABORTED";
        case LifecycleEvent::EXIT_REQUESTED: return "EXIT_REQUESTED";
        case LifecycleEvent::EXIT_FILLED: return "EXIT_FILLED";
        case LifecycleEvent::EXIT_FAILED: return "EXIT_FAILED";
        case LifecycleEvent::HEALED: return "HEALED";
    }
    return "HEALED";
}

LifecycleTransitionResult PositionLifecycleStateMachine::transition(
    LifecycleState current,
    LifecycleEvent event
) {
    LifecycleTransitionResult result;
    result.next = current;

    switch (current) {
        case LifecycleState::NONE:
        case LifecycleState::CLOSED:
            if (event == LifecycleEvent::SIGNAL_ACCEPTED) {
                result = {true, LifecycleState::PENDING};
            }
            break;
        case LifecycleState::PENDING:
            if (event == LifecycleEvent::ORDER_FILLED) {
                result = {true, LifecycleState::OPEN};
            } else if (event == LifecycleEvent::ORDER_ABORTED || event == LifecycleEvent::HEALED) {
                result = {true, LifecycleState::NONE};
            }
            break;
        case LifecycleState::OPEN:
            if (event == LifecycleEvent::EXIT_REQUESTED) {
                result = {true, LifecycleState::CLOSING};
            } else if (event == LifecycleEvent::HEALED) {
                result = {true, LifecycleState::CLOSED};
            }
            break;
        case LifecycleState::CLOSING:
            if (event == LifecycleEvent::EXIT_FILLED || event == LifecycleEvent::HEALED) {
                result = {true, LifecycleState::CLOSED};
            } else if (event == LifecycleEvent::EXIT_FAILED) {
                result = {true, LifecycleState::OPEN};
            }
            break;
    }
    return result;
}

bool PositionLifecycleStateMachine::canTransition(TradeStatus from, TradeStatus to) {
    if (from == to) {
        return true;
    }
    switch (from) {
        case TradeStatus::PENDING:
            return to == TradeStatus::OPEN || to == TradeStatus::CLOSED || to == TradeStatus::ORPHANED;
        case TradeStatus::GHOST_ADOPTED:
            return to == TradeStatus::OPEN || to == TradeStatus::CLOSED;
        case TradeStatus::OPEN:
            return to == TradeStatus::CLOSED;
        case TradeStatus::CLOSED:
        case TradeStatus::ORPHANED:
            return false;
    }
    return false;
}

LifecycleState PositionLifecycleStateMachine::fromTradeStatus(TradeStatus status) {
    switch (status) {
        case TradeStatus::PENDING: return LifecycleState::PENDING;
        case TradeStatus::OPEN:
        case TradeStatus::GHOST_ADOPTED: return LifecycleState::OPEN;
        case TradeStatus::CLOSED:
        case TradeStatus::ORPHANED: return LifecycleState::CLOSED;
    }
    return LifecycleState::NONE;
}

} // namespace execution
} // namespace core
} // namespace tradesync

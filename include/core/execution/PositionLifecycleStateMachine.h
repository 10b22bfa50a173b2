#pragma once

#include "common/Types.h"

namespace tradesync {
namespace core {
namespace execution {

// In-memory state of one strategy's position
enum class LifecycleState { NONE, PENDING, OPEN, CLOSING, CLOSED };

enum class LifecycleEvent {
    SIGNAL_ACCEPTED,   // slot acquired, intent persisted
    ORDER_FILLED,
    ORDER_ABORTED,     // rejected, cancelled, confirmation timeout, shutdown rollback
    EXIT_REQUESTED,
    EXIT_FILLED,
    EXIT_FAILED,
    HEALED             // reconciliation closed the position out of band
};

const char* toString(LifecycleState state);
const char* toString(LifecycleEvent event);

struct LifecycleTransitionResult {
    bool allowed = false;
    LifecycleState next = LifecycleState::NONE;
};

class PositionLifecycleStateMachine {
public:
    static LifecycleTransitionResult transition(LifecycleState current, LifecycleEvent event);

    // Persisted status moves forward only; CLOSED and ORPHANED are terminal
    static bool canTransition(TradeStatus from, TradeStatus to);

    // Controller view of a stored record
    static LifecycleState fromTradeStatus(TradeStatus status);
};

} // namespace execution
} // namespace core
} // namespace tradesync

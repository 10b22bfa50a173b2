#include "core/execution/OrderLifecycleStateMachine.h"
#include "core/execution/PositionLifecycleStateMachine.h"

#include <cassert>
#include <iostream>

using tradesync::OrderStatus;
using tradesync::TradeStatus;
using tradesync::core::execution::LifecycleEvent;
using tradesync::core::execution::LifecycleState;
using tradesync::core::execution::OrderLifecycleStateMachine;
using tradesync::core::execution::PositionLifecycleStateMachine;

int main() {
    // Position lifecycle: happy path
    {
        auto r = PositionLifecycleStateMachine::transition(LifecycleState::NONE, LifecycleEvent::SIGNAL_ACCEPTED);
        assert(r.allowed && r.next == LifecycleState::PENDING);
        r = PositionLifecycleStateMachine::transition(r.next, LifecycleEvent::ORDER_FILLED);
        assert(r.allowed && r.next == LifecycleState::OPEN);
        r = PositionLifecycleStateMachine::transition(r.next, LifecycleEvent::EXIT_REQUESTED);
        assert(r.allowed && r.next == LifecycleState::CLOSING);
        r = PositionLifecycleStateMachine::transition(r.next, LifecycleEvent::EXIT_FILLED);
        assert(r.allowed && r.next == LifecycleState::CLOSED);
        r = PositionLifecycleStateMachine::transition(r.next, LifecycleEvent::SIGNAL_ACCEPTED);
        assert(r.allowed && r.next == LifecycleState::PENDING);
    }

    // Aborted open and failed exit
    {
        auto r = PositionLifecycleStateMachine::transition(LifecycleState::PENDING, LifecycleEvent::ORDER_ABORTED);
        assert(r.allowed && r.next == LifecycleState::NONE);
        r = PositionLifecycleStateMachine::transition(LifecycleState::CLOSING, LifecycleEvent::EXIT_FAILED);
        assert(r.allowed && r.next == LifecycleState::OPEN);
        r = PositionLifecycleStateMachine::transition(LifecycleState::OPEN, LifecycleEvent::HEALED);
        assert(r.allowed && r.next == LifecycleState::CLOSED);
    }

    // No duplicate open, no skipping
    {
        auto r = PositionLifecycleStateMachine::transition(LifecycleState::OPEN, LifecycleEvent::SIGNAL_ACCEPTED);
        assert(!r.allowed && r.next == LifecycleState::OPEN);
        r = PositionLifecycleStateMachine::transition(LifecycleState::PENDING, LifecycleEvent::SIGNAL_ACCEPTED);
        assert(!r.allowed);
        r = PositionLifecycleStateMachine::transition(LifecycleState::NONE, LifecycleEvent::EXIT_REQUESTED);
        assert(!r.allowed);
        r = PositionLifecycleStateMachine::transition(LifecycleState::PENDING, LifecycleEvent::EXIT_FILLED);
        assert(!r.allowed);
    }

    // Persisted status only moves forward
    {
        assert(PositionLifecycleStateMachine::canTransition(TradeStatus::PENDING, TradeStatus::OPEN));
        assert(PositionLifecycleStateMachine::canTransition(TradeStatus::PENDING, TradeStatus::CLOSED));
        assert(PositionLifecycleStateMachine::canTransition(TradeStatus::PENDING, TradeStatus::ORPHANED));
        assert(PositionLifecycleStateMachine::canTransition(TradeStatus::OPEN, TradeStatus::CLOSED));
        assert(PositionLifecycleStateMachine::canTransition(TradeStatus::GHOST_ADOPTED, TradeStatus::OPEN));
        assert(PositionLifecycleStateMachine::canTransition(TradeStatus::GHOST_ADOPTED, TradeStatus::CLOSED));
        assert(PositionLifecycleStateMachine::canTransition(TradeStatus::OPEN, TradeStatus::OPEN));

        assert(!PositionLifecycleStateMachine::canTransition(TradeStatus::OPEN, TradeStatus::PENDING));
        assert(!PositionLifecycleStateMachine::canTransition(TradeStatus::OPEN, TradeStatus::ORPHANED));
        assert(!PositionLifecycleStateMachine::canTransition(TradeStatus::CLOSED, TradeStatus::OPEN));
        assert(!PositionLifecycleStateMachine::canTransition(TradeStatus::ORPHANED, TradeStatus::OPEN));
        assert(!PositionLifecycleStateMachine::canTransition(TradeStatus::PENDING, TradeStatus::GHOST_ADOPTED));
    }

    {
        assert(PositionLifecycleStateMachine::fromTradeStatus(TradeStatus::GHOST_ADOPTED) == LifecycleState::OPEN);
        assert(PositionLifecycleStateMachine::fromTradeStatus(TradeStatus::ORPHANED) == LifecycleState::CLOSED);
    }

    // Exchange order states
    {
        auto r = OrderLifecycleStateMachine::transition("NEW", 0.0, 1.0, 0.0);
        assert(r.status == OrderStatus::SUBMITTED);
        assert(!r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("PARTIALLY_FILLED", 0.0, 2.0, 0.5);
        assert(r.status == OrderStatus::PARTIALLY_FILLED);
        assert(!r.terminal);
        assert(r.filled_quantity > 0.49 && r.filled_quantity < 0.51);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("FILLED", 0.0, 1.0, 0.0);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);
        assert(r.filled_quantity == 1.0);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("EXPIRED", 0.0, 1.0, 0.3);
        assert(r.status == OrderStatus::PARTIALLY_FILLED);
        assert(r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("rejected", 0.0, 1.0, 0.0);
        assert(r.status == OrderStatus::REJECTED);
        assert(r.terminal);
    }

    std::cout << "[TEST] LifecycleStateMachine PASSED\n";
    return 0;
}

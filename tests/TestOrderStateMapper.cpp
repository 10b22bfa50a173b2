#include "execution/OrderStateMapper.h"

#include <cassert>
#include <iostream>

using tradesync::OrderStatus;
using tradesync::execution::OrderStateMapper;

int main() {
    {
        auto r = OrderStateMapper::map("FILLED", 0.0, 1.0, 1.0);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);
        assert(r.filled_quantity == 1.0);
    }

    {
        auto r = OrderStateMapper::map("PARTIALLY_FILLED", 0.0, 2.0, 0.4);
        assert(r.status == OrderStatus::PARTIALLY_FILLED);
        assert(!r.terminal);
        assert(r.filled_quantity > 0.39 && r.filled_quantity < 0.41);
    }

    {
        auto r = OrderStateMapper::map("CANCELED", 0.0, 1.0, 0.0);
        assert(r.status == OrderStatus::CANCELLED);
        assert(r.terminal);
    }

    {
        auto r = OrderStateMapper::map("CANCELED", 0.2, 1.0, 0.2);
        assert(r.status == OrderStatus::PARTIALLY_FILLED);
        assert(r.terminal);
    }

    {
        auto r = OrderStateMapper::map("EXPIRED_IN_MATCH", 0.0, 1.0, 0.0);
        assert(r.status == OrderStatus::CANCELLED);
        assert(r.terminal);
    }

    {
        auto r = OrderStateMapper::map("REJECTED", 0.0, 1.0, 0.0);
        assert(r.status == OrderStatus::REJECTED);
        assert(r.terminal);
    }

    std::cout << "[TEST] OrderStateMapper PASSED\n";
    return 0;
}

#include "execution/RateLimiter.h"

#include <cassert>
#include <chrono>
#include <iostream>

using namespace tradesync::execution;

int main() {
    RateLimiter limiter;

    assert(limiter.getRemaining("weight") == 2400);
    assert(limiter.getRemaining("order") == 300);

    assert(limiter.tryAcquire("weight", 5));
    assert(limiter.tryAcquire("order"));
    assert(limiter.getRemaining("weight") == 2395);
    assert(limiter.getRemaining("order") == 299);

    // Server-reported usage wins when it is higher
    limiter.updateUsed("weight", 2390);
    assert(limiter.getRemaining("weight") == 10);
    limiter.updateUsed("weight", 100);
    assert(limiter.getRemaining("weight") == 10);

    assert(limiter.tryAcquire("weight", 10));
    assert(!limiter.tryAcquire("weight", 1));

    // Unknown groups share the weight budget
    assert(limiter.getRemaining("unknown") == 0);

    // A 429 pauses every group
    limiter.handleRateLimitError(429, 1);
    assert(!limiter.tryAcquire("order"));

    const auto before = std::chrono::steady_clock::now();
    limiter.acquire("order");
    const auto waited = std::chrono::steady_clock::now() - before;
    assert(waited >= std::chrono::milliseconds(900));

    limiter.handleRateLimitError(500);
    assert(limiter.tryAcquire("order"));

    const auto stats = limiter.getStats();
    assert(stats.total_requests == 5);
    assert(stats.rejected_requests == 2);
    assert(stats.forced_waits >= 1);

    std::cout << "[TEST] RateLimiter PASSED\n";
    return 0;
}

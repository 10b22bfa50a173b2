#pragma once

#include <chrono>
#include <string>
#include <thread>

#include "common/Errors.h"
#include "common/Logger.h"

namespace tradesync {

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{500};
    double multiplier = 2.0;
};

// Runs fn until it returns, retrying only transient TradeSyncErrors.
// The last transient error is rethrown once attempts are exhausted.
template<typename Fn>
auto retryWithBackoff(const RetryPolicy& policy, const std::string& what, Fn&& fn) -> decltype(fn()) {
    auto backoff = policy.initial_backoff;
    const int attempts = (policy.max_attempts > 0) ? policy.max_attempts : 1;

    for (int attempt = 1; ; ++attempt) {
        try {
            return fn();
        } catch (const TradeSyncError& e) {
            if (!e.isTransient() || attempt >= attempts) {
                throw;
            }
            LOG_WARN("{} failed (attempt {}/{}): {} - retrying in {}ms",
                     what, attempt, attempts, e.what(), backoff.count());
            std::this_thread::sleep_for(backoff);
            backoff = std::chrono::milliseconds(
                static_cast<long long>(static_cast<double>(backoff.count()) * policy.multiplier)
            );
        }
    }
}

} // namespace tradesync

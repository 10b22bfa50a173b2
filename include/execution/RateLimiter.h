#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace tradesync {
namespace execution {

// Fixed-window budget for one Binance rate limit (request weight or order count)
struct RateLimitConfig {
    std::string group_name;
    int max_per_window;
    std::chrono::milliseconds window;
    int current_count;
    std::chrono::steady_clock::time_point window_start;

    RateLimitConfig(const std::string& name, int max_req, std::chrono::milliseconds window_len)
        : group_name(name)
        , max_per_window(max_req)
        , window(window_len)
        , current_count(0)
        , window_start(std::chrono::steady_clock::now())
    {}
};

// Thread-safe limiter for the USDT-M futures API limits
class RateLimiter {
public:
    RateLimiter();

    // Non-blocking; false when the budget or a ban would be exceeded
    bool tryAcquire(const std::string& group, int cost = 1);

    // Waits until the budget allows the request
    void acquire(const std::string& group, int cost = 1);

    int getRemaining(const std::string& group);

    // X-MBX-USED-WEIGHT-1M / X-MBX-ORDER-COUNT-10S report the server-side usage
    void updateUsed(const std::string& group, int used);

    // 429 backs off, 418 is an IP ban; Retry-After seconds when the server sent one
    void handleRateLimitError(int status_code, int retry_after_seconds = 0);

    struct Stats {
        int total_requests;
        int rejected_requests;
        int forced_waits;
        std::chrono::milliseconds total_wait_time;
    };
    Stats getStats() const;

private:
    std::map<std::string, RateLimitConfig> configs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    int total_requests_;
    int rejected_requests_;
    int forced_waits_;
    std::chrono::milliseconds total_wait_time_;

    bool is_blocked_;
    std::chrono::steady_clock::time_point block_end_time_;

    RateLimitConfig& configFor(const std::string& group);
    void resetWindowIfNeeded(RateLimitConfig& config);
};

} // namespace execution
} // namespace tradesync

#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace tradesync {
namespace execution {

RateLimiter::RateLimiter()
    : total_requests_(0)
    , rejected_requests_(0)
    , forced_waits_(0)
    , total_wait_time_(std::chrono::milliseconds(0))
    , is_blocked_(false)
{
    // USDT-M futures: 2400 request weight per minute per IP,
    // 300 orders per 10 seconds per account
    configs_.emplace("weight", RateLimitConfig("weight", 2400, std::chrono::minutes(1)));
    configs_.emplace("order", RateLimitConfig("order", 300, std::chrono::seconds(10)));

    LOG_INFO("RateLimiter initialized (weight 2400/1m, orders 300/10s)");
}

bool RateLimiter::tryAcquire(const std::string& group, int cost) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (is_blocked_) {
        auto now = std::chrono::steady_clock::now();
        if (now < block_end_time_) {
            rejected_requests_++;
            return false;
        }
        is_blocked_ = false;
        LOG_INFO("API block lifted");
        cv_.notify_all();
    }

    auto& config = configFor(group);
    resetWindowIfNeeded(config);

    if (config.current_count + cost <= config.max_per_window) {
        config.current_count += cost;
        total_requests_++;
        return true;
    }

    rejected_requests_++;
    return false;
}

void RateLimiter::acquire(const std::string& group, int cost) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& config = configFor(group);

    while (true) {
        if (is_blocked_) {
            auto status = cv_.wait_until(lock, block_end_time_);
            if (status == std::cv_status::timeout) {
                is_blocked_ = false;
            } else {
                continue;
            }
        }

        resetWindowIfNeeded(config);

        if (config.current_count + cost <= config.max_per_window) {
            config.current_count += cost;
            total_requests_++;
            return;
        }

        auto wake_time = config.window_start + config.window + std::chrono::milliseconds(1);

        forced_waits_++;
        auto wait_start = std::chrono::steady_clock::now();

        cv_.wait_until(lock, wake_time);

        total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - wait_start
        );
    }
}

int RateLimiter::getRemaining(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& config = configFor(group);
    resetWindowIfNeeded(config);
    return std::max(0, config.max_per_window - config.current_count);
}

void RateLimiter::updateUsed(const std::string& group, int used) {
    if (used < 0) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = configs_.find(group);
    if (it == configs_.end()) {
        return;
    }
    // Trust the server when it has seen more usage than we counted
    if (used > it->second.current_count) {
        it->second.current_count = used;
    }
}

void RateLimiter::handleRateLimitError(int status_code, int retry_after_seconds) {
    std::unique_lock<std::mutex> lock(mutex_);

    std::chrono::seconds pause(0);
    if (status_code == 429) {
        pause = std::chrono::seconds(retry_after_seconds > 0 ? retry_after_seconds : 1);
        LOG_WARN("429 Too Many Requests, pausing all requests for {}s", pause.count());
    } else if (status_code == 418) {
        pause = std::chrono::seconds(retry_after_seconds > 0 ? retry_after_seconds : 120);
        LOG_ERROR("418 IP ban, pausing all requests for {}s", pause.count());
    } else {
        return;
    }

    forced_waits_++;
    is_blocked_ = true;
    block_end_time_ = std::max(block_end_time_, std::chrono::steady_clock::now() + pause);
    cv_.notify_all();
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::unique_lock<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.rejected_requests = rejected_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;

    return stats;
}

RateLimitConfig& RateLimiter::configFor(const std::string& group) {
    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("weight");
    return it->second;
}

void RateLimiter::resetWindowIfNeeded(RateLimitConfig& config) {
    auto now = std::chrono::steady_clock::now();
    if (now - config.window_start >= config.window) {
        config.current_count = 0;
        config.window_start = now;
        cv_.notify_all();
    }
}

} // namespace execution
} // namespace tradesync

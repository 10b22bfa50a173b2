#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/TimeUtils.h"

namespace tradesync {
namespace risk {

struct PositionSlot {
    bool occupied = false;
    std::string trade_id;          // empty until bound to the PENDING record
    long long opened_at_ms = 0;
    long long cooldown_until_ms = 0;
};

// strategy -> at most one active position, plus re-entry cooldowns.
// Slot state is guarded per strategy; long operations additionally hold the
// strategy's operation lock so reconciliation never interleaves with them.
class PositionSlotRegistry {
public:
    explicit PositionSlotRegistry(utils::ClockFn clock = utils::systemClock());

    void configureCooldown(const std::string& strategy, int cooldown_seconds);

    // Fails when the slot is occupied or the cooldown is running
    bool tryAcquire(const std::string& strategy);
    bool bindTrade(const std::string& strategy, const std::string& trade_id);
    // Hands an occupied slot from one trade to its successor; no cooldown, opened_at kept
    bool rebindTrade(const std::string& strategy, const std::string& from_trade_id, const std::string& to_trade_id);
    void release(const std::string& strategy, bool start_cooldown = true);

    // Releases only when the slot is held by trade_id (or not yet bound)
    bool releaseIfBound(const std::string& strategy, const std::string& trade_id, bool start_cooldown);

    // Occupies a free slot for a trade found in the ledger or adopted from the
    // exchange; the cooldown does not apply. False when the slot holds another trade.
    bool restore(const std::string& strategy, const std::string& trade_id, long long opened_at_ms);

    bool isBlocked(const std::string& strategy) const;
    bool isOccupied(const std::string& strategy) const;
    long long cooldownRemainingMs(const std::string& strategy) const;
    std::optional<PositionSlot> slot(const std::string& strategy) const;
    std::vector<std::string> strategies() const;

    std::unique_lock<std::mutex> lockStrategy(const std::string& strategy);
    // owns_lock() is false when another thread holds the strategy
    std::unique_lock<std::mutex> tryLockStrategy(const std::string& strategy);

private:
    struct Entry {
        mutable std::mutex state_mutex;
        std::mutex op_mutex;
        PositionSlot slot;
        int cooldown_seconds = 0;
    };

    void releaseLocked(Entry& e, const std::string& strategy, bool start_cooldown);
    Entry& entry(const std::string& strategy);
    const Entry* findEntry(const std::string& strategy) const;

    utils::ClockFn clock_;
    mutable std::mutex map_mutex_;
    std::map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace risk
} // namespace tradesync

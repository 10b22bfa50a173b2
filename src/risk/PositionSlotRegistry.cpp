#include "risk/PositionSlotRegistry.h"

#include <algorithm>

#include "common/Logger.h"

namespace tradesync {
namespace risk {

PositionSlotRegistry::PositionSlotRegistry(utils::ClockFn clock)
    : clock_(std::move(clock)) {}

void PositionSlotRegistry::configureCooldown(const std::string& strategy, int cooldown_seconds) {
    auto& e = entry(strategy);
    std::lock_guard<std::mutex> lock(e.state_mutex);
    e.cooldown_seconds = std::max(0, cooldown_seconds);
}

bool PositionSlotRegistry::tryAcquire(const std::string& strategy) {
    auto& e = entry(strategy);
    std::lock_guard<std::mutex> lock(e.state_mutex);

    const long long now = clock_();
    if (e.slot.occupied) {
        LOG_DEBUG("{} slot busy (trade {})", strategy, e.slot.trade_id);
        return false;
    }
    if (now < e.slot.cooldown_until_ms) {
        LOG_DEBUG("{} in cooldown for {}ms", strategy, e.slot.cooldown_until_ms - now);
        return false;
    }

    e.slot.occupied = true;
    e.slot.trade_id.clear();
    e.slot.opened_at_ms = now;
    return true;
}

bool PositionSlotRegistry::bindTrade(const std::string& strategy, const std::string& trade_id) {
    auto& e = entry(strategy);
    std::lock_guard<std::mutex> lock(e.state_mutex);
    if (!e.slot.occupied) {
        return false;
    }
    if (!e.slot.trade_id.empty() && e.slot.trade_id != trade_id) {
        return false;
    }
    e.slot.trade_id = trade_id;
    return true;
}

bool PositionSlotRegistry::rebindTrade(const std::string& strategy,
                                       const std::string& from_trade_id,
                                       const std::string& to_trade_id) {
    auto& e = entry(strategy);
    std::lock_guard<std::mutex> lock(e.state_mutex);
    if (!e.slot.occupied || e.slot.trade_id != from_trade_id) {
        return false;
    }
    e.slot.trade_id = to_trade_id;
    return true;
}

void PositionSlotRegistry::release(const std::string& strategy, bool start_cooldown) {
    auto& e = entry(strategy);
    std::lock_guard<std::mutex> lock(e.state_mutex);
    releaseLocked(e, strategy, start_cooldown);
}

bool PositionSlotRegistry::releaseIfBound(const std::string& strategy,
                                          const std::string& trade_id,
                                          bool start_cooldown) {
    auto& e = entry(strategy);
    std::lock_guard<std::mutex> lock(e.state_mutex);
    if (!e.slot.occupied) {
        return false;
    }
    if (!e.slot.trade_id.empty() && e.slot.trade_id != trade_id) {
        return false;
    }
    releaseLocked(e, strategy, start_cooldown);
    return true;
}

bool PositionSlotRegistry::restore(const std::string& strategy,
                                   const std::string& trade_id,
                                   long long opened_at_ms) {
    auto& e = entry(strategy);
    std::lock_guard<std::mutex> lock(e.state_mutex);
    if (e.slot.occupied && !e.slot.trade_id.empty() && e.slot.trade_id != trade_id) {
        return false;
    }
    e.slot.occupied = true;
    e.slot.trade_id = trade_id;
    e.slot.opened_at_ms = opened_at_ms;
    return true;
}

bool PositionSlotRegistry::isBlocked(const std::string& strategy) const {
    const Entry* e = findEntry(strategy);
    if (!e) {
        return false;
    }
    std::lock_guard<std::mutex> lock(e->state_mutex);
    return e->slot.occupied || clock_() < e->slot.cooldown_until_ms;
}

bool PositionSlotRegistry::isOccupied(const std::string& strategy) const {
    const Entry* e = findEntry(strategy);
    if (!e) {
        return false;
    }
    std::lock_guard<std::mutex> lock(e->state_mutex);
    return e->slot.occupied;
}

long long PositionSlotRegistry::cooldownRemainingMs(const std::string& strategy) const {
    const Entry* e = findEntry(strategy);
    if (!e) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(e->state_mutex);
    return std::max(0LL, e->slot.cooldown_until_ms - clock_());
}

std::optional<PositionSlot> PositionSlotRegistry::slot(const std::string& strategy) const {
    const Entry* e = findEntry(strategy);
    if (!e) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(e->state_mutex);
    return e->slot;
}

std::vector<std::string> PositionSlotRegistry::strategies() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, e] : entries_) {
        out.push_back(name);
    }
    return out;
}

std::unique_lock<std::mutex> PositionSlotRegistry::lockStrategy(const std::string& strategy) {
    return std::unique_lock<std::mutex>(entry(strategy).op_mutex);
}

std::unique_lock<std::mutex> PositionSlotRegistry::tryLockStrategy(const std::string& strategy) {
    return std::unique_lock<std::mutex>(entry(strategy).op_mutex, std::try_to_lock);
}

void PositionSlotRegistry::releaseLocked(Entry& e, const std::string& strategy, bool start_cooldown) {
    e.slot.occupied = false;
    e.slot.trade_id.clear();
    e.slot.opened_at_ms = 0;
    if (start_cooldown && e.cooldown_seconds > 0) {
        e.slot.cooldown_until_ms = clock_() + static_cast<long long>(e.cooldown_seconds) * 1000LL;
        LOG_INFO("{} slot released, cooldown {}s", strategy, e.cooldown_seconds);
    } else {
        LOG_INFO("{} slot released", strategy);
    }
}

PositionSlotRegistry::Entry& PositionSlotRegistry::entry(const std::string& strategy) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto& slot = entries_[strategy];
    if (!slot) {
        slot = std::make_unique<Entry>();
    }
    return *slot;
}

const PositionSlotRegistry::Entry* PositionSlotRegistry::findEntry(const std::string& strategy) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = entries_.find(strategy);
    return (it == entries_.end()) ? nullptr : it->second.get();
}

} // namespace risk
} // namespace tradesync

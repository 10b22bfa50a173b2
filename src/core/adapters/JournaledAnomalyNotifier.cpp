#include "core/adapters/JournaledAnomalyNotifier.h"

#include "common/Logger.h"
#include "core/state/JournalEvents.h"

namespace tradesync {
namespace core {
namespace {
bool isClearing(AnomalyType type) {
    return type == AnomalyType::ORPHAN_CLEARED || type == AnomalyType::GHOST_CLEARED;
}
}

JournaledAnomalyNotifier::JournaledAnomalyNotifier(std::shared_ptr<IEventJournal> journal,
                                                   utils::ClockFn clock)
    : journal_(std::move(journal)), clock_(std::move(clock)) {}

void JournaledAnomalyNotifier::notify(AnomalyType type, const nlohmann::json& payload) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[type];
    }

    if (isClearing(type)) {
        LOG_INFO("[anomaly] {} {}", toString(type), payload.dump());
    } else {
        LOG_WARN("[anomaly] {} {}", toString(type), payload.dump());
    }

    if (!journal_) {
        return;
    }

    const JournalEvent event = anomalyEvent(type, payload, clock_());
    if (!journal_->append(event)) {
        LOG_ERROR("[anomaly] journal append failed for {}", toString(type));
    }
}

std::size_t JournaledAnomalyNotifier::count(AnomalyType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(type);
    return (it == counts_.end()) ? 0 : it->second;
}

} // namespace core
} // namespace tradesync

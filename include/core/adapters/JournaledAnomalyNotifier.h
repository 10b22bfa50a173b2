#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>

#include "common/TimeUtils.h"
#include "core/contracts/IAnomalyNotifier.h"
#include "core/contracts/IEventJournal.h"

namespace tradesync {
namespace core {

// Logs every anomaly and appends it to the anomaly journal (when one is set)
class JournaledAnomalyNotifier : public IAnomalyNotifier {
public:
    explicit JournaledAnomalyNotifier(std::shared_ptr<IEventJournal> journal = nullptr,
                                      utils::ClockFn clock = utils::systemClock());

    void notify(AnomalyType type, const nlohmann::json& payload) override;

    std::size_t count(AnomalyType type) const;

private:
    std::shared_ptr<IEventJournal> journal_;
    utils::ClockFn clock_;
    mutable std::mutex mutex_;
    std::map<AnomalyType, std::size_t> counts_;
};

} // namespace core
} // namespace tradesync

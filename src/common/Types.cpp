#include "common/Types.h"

#include <algorithm>
#include <cctype>

namespace tradesync {

namespace {
std::string upperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}
} // namespace

std::optional<PositionSide> parsePositionSide(const std::string& value) {
    const std::string normalized = upperCopy(value);
    if (normalized == "LONG" || normalized == "BUY") return PositionSide::LONG;
    if (normalized == "SHORT" || normalized == "SELL") return PositionSide::SHORT;
    return std::nullopt;
}

std::optional<TradeStatus> parseTradeStatus(const std::string& value) {
    const std::string normalized = upperCopy(value);
    if (normalized == "PENDING") return TradeStatus::PENDING;
    if (normalized == "OPEN") return TradeStatus::OPEN;
    if (normalized == "CLOSED") return TradeStatus::CLOSED;
    if (normalized == "ORPHANED") return TradeStatus::ORPHANED;
    if (normalized == "GHOST_ADOPTED") return TradeStatus::GHOST_ADOPTED;
    return std::nullopt;
}

} // namespace tradesync

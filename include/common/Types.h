#pragma once

#include <string>
#include <optional>

namespace tradesync {

// Position direction. Orders are expressed as BUY/SELL, positions as LONG/SHORT.
enum class PositionSide { LONG, SHORT };
enum class OrderSide { BUY, SELL };

// Persisted trade status
enum class TradeStatus { PENDING, OPEN, CLOSED, ORPHANED, GHOST_ADOPTED };

// Exchange-side state of a submitted order
enum class OrderStatus { PENDING, SUBMITTED, FILLED, PARTIALLY_FILLED, CANCELLED, REJECTED };

inline const char* toString(PositionSide side) {
    return (side == PositionSide::LONG) ? "LONG" : "SHORT";
}

inline const char* toString(OrderSide side) {
    return (side == OrderSide::BUY) ? "BUY" : "SELL";
}

inline const char* toString(TradeStatus status) {
    switch (status) {
        case TradeStatus::PENDING: return "PENDING";
        case TradeStatus::OPEN: return "OPEN";
        case TradeStatus::CLOSED: return "CLOSED";
        case TradeStatus::ORPHANED: return "ORPHANED";
        case TradeStatus::GHOST_ADOPTED: return "GHOST_ADOPTED";
    }
    return "PENDING";
}

inline const char* toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

// "BUY" is accepted as an alias of LONG, "SELL" of SHORT.
std::optional<PositionSide> parsePositionSide(const std::string& value);
std::optional<TradeStatus> parseTradeStatus(const std::string& value);

inline OrderSide entryOrderSide(PositionSide side) {
    return (side == PositionSide::LONG) ? OrderSide::BUY : OrderSide::SELL;
}

inline OrderSide exitOrderSide(PositionSide side) {
    return (side == PositionSide::LONG) ? OrderSide::SELL : OrderSide::BUY;
}

// Record occupies the strategy's single position slot
inline bool isActiveStatus(TradeStatus status) {
    return status == TradeStatus::PENDING ||
           status == TradeStatus::OPEN ||
           status == TradeStatus::GHOST_ADOPTED;
}

inline bool isTerminalStatus(TradeStatus status) {
    return status == TradeStatus::CLOSED || status == TradeStatus::ORPHANED;
}

} // namespace tradesync

#pragma once

#include <string>
#include <vector>

#include "common/Errors.h"
#include "core/model/PlaneTypes.h"

namespace tradesync {
namespace core {

// Narrow view of the exchange. Every call either returns or throws GatewayError;
// transient errors may be retried because orders are keyed by client_order_id.
class IExchangeGateway {
public:
    virtual ~IExchangeGateway() = default;

    virtual OrderStatusReport placeOrder(const OrderRequest& request) = 0;
    virtual OrderStatusReport cancelOrder(const std::string& symbol, const std::string& client_order_id) = 0;
    virtual OrderStatusReport getOrderStatus(const std::string& symbol, const std::string& client_order_id) = 0;

    virtual std::vector<LivePosition> getLivePositions() = 0;
    virtual std::vector<Fill> getRecentFills(const std::string& symbol, long long since_ms) = 0;
    virtual double getMarkPrice(const std::string& symbol) = 0;
};

} // namespace core
} // namespace tradesync

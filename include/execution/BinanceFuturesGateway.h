#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/contracts/IExchangeGateway.h"
#include "network/IHttpClient.h"

namespace tradesync {
namespace execution {

// USDT-M futures venue over the signed REST API (one-way position mode)
class BinanceFuturesGateway : public core::IExchangeGateway {
public:
    explicit BinanceFuturesGateway(std::shared_ptr<network::IHttpClient> http);

    core::OrderStatusReport placeOrder(const core::OrderRequest& request) override;
    core::OrderStatusReport cancelOrder(const std::string& symbol, const std::string& client_order_id) override;
    core::OrderStatusReport getOrderStatus(const std::string& symbol, const std::string& client_order_id) override;

    std::vector<core::LivePosition> getLivePositions() override;
    std::vector<core::Fill> getRecentFills(const std::string& symbol, long long since_ms) override;
    double getMarkPrice(const std::string& symbol) override;

    // LOT_SIZE step for symbol, 0 when the exchange does not list one
    double stepSize(const std::string& symbol);

private:
    core::OrderStatusReport parseOrder(const nlohmann::json& j) const;
    std::set<long long> liquidationOrderIds(const std::string& symbol, long long since_ms);

    // Throws GatewayError classified from the HTTP status and Binance error code
    [[noreturn]] void raise(const std::string& what, const network::HttpResponse& response) const;

    std::shared_ptr<network::IHttpClient> http_;
    std::mutex step_mutex_;
    std::map<std::string, double> step_sizes_;
};

} // namespace execution
} // namespace tradesync

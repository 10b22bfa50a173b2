#include "execution/BinanceFuturesGateway.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "common/Logger.h"
#include "common/StepSizeHelper.h"
#include "execution/OrderStateMapper.h"

namespace tradesync {
namespace execution {
namespace {
constexpr double kPositionEpsilon = 1e-6;

bool isSensitiveKey(const std::string& key) {
    static const std::set<std::string> kKeys = {
        "apikey", "api_key", "secret", "signature", "x-mbx-apikey"
    };
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return kKeys.find(lower) != kKeys.end();
}

void maskSensitiveJson(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (isSensitiveKey(it.key())) {
                it.value() = "***";
            } else {
                maskSensitiveJson(it.value());
            }
        }
        return;
    }
    if (node.is_array()) {
        for (auto& item : node) {
            maskSensitiveJson(item);
        }
    }
}

std::string sanitizeForLog(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);
        maskSensitiveJson(j);
        return j.dump();
    } catch (const nlohmann::json::exception&) {
        return text;
    }
}

// Binance sends most decimals as strings
double num(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return 0.0;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

long long integer(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return 0;
    if (it->is_number_integer()) return it->get<long long>();
    return static_cast<long long>(num(j, key));
}

nlohmann::json parseBody(const network::HttpResponse& response) {
    try {
        return response.json();
    } catch (const nlohmann::json::exception& e) {
        throw GatewayError(true, std::string("malformed exchange response: ") + e.what());
    }
}

int errorCode(const network::HttpResponse& response) {
    try {
        auto j = response.json();
        return j.is_object() ? j.value("code", 0) : 0;
    } catch (const nlohmann::json::exception&) {
        return 0;
    }
}
}

BinanceFuturesGateway::BinanceFuturesGateway(std::shared_ptr<network::IHttpClient> http)
    : http_(std::move(http)) {}

core::OrderStatusReport BinanceFuturesGateway::placeOrder(const core::OrderRequest& request) {
    const double step = stepSize(request.symbol);
    const std::string quantity = common::formatQuantity(request.quantity, step);
    if (!(common::floorToStep(request.quantity, step) > 0.0)) {
        throw GatewayError(false, "quantity " + std::to_string(request.quantity) +
                                  " is below the lot size of " + request.symbol);
    }

    network::QueryParams params = {
        {"symbol", request.symbol},
        {"side", toString(request.side)},
        {"type", "MARKET"},
        {"quantity", quantity},
        {"newClientOrderId", request.client_order_id},
        {"newOrderRespType", "RESULT"}
    };
    if (request.reduce_only) {
        params["reduceOnly"] = "true";
    }

    auto response = http_->post("/fapi/v1/order", params);
    if (response.isSuccess()) {
        auto report = parseOrder(parseBody(response));
        LOG_INFO("order accepted: {} {} {} qty={} -> {}", request.client_order_id, request.symbol,
                 toString(request.side), quantity, toString(report.status));
        return report;
    }

    // A duplicate client id means an earlier attempt reached the exchange
    if (!response.isServerError() && !response.isRateLimited() && !response.isBlocked()) {
        auto lookup = http_->get("/fapi/v1/order",
                                 {{"symbol", request.symbol}, {"origClientOrderId", request.client_order_id}},
                                 true);
        if (lookup.isSuccess()) {
            LOG_WARN("order {} already exists on the exchange, reusing it", request.client_order_id);
            return parseOrder(parseBody(lookup));
        }
    }

    const std::string safe_body = sanitizeForLog(response.body);
    LOG_ERROR("order failed: {} {} - {}", request.client_order_id, request.symbol, safe_body);
    raise("placeOrder", response);
}

core::OrderStatusReport BinanceFuturesGateway::cancelOrder(const std::string& symbol,
                                                           const std::string& client_order_id) {
    auto response = http_->del("/fapi/v1/order",
                               {{"symbol", symbol}, {"origClientOrderId", client_order_id}});
    if (response.isSuccess()) {
        return parseOrder(parseBody(response));
    }
    // Already terminal orders cannot be cancelled; report their final state
    if (errorCode(response) == -2011) {
        return getOrderStatus(symbol, client_order_id);
    }
    raise("cancelOrder", response);
}

core::OrderStatusReport BinanceFuturesGateway::getOrderStatus(const std::string& symbol,
                                                              const std::string& client_order_id) {
    auto response = http_->get("/fapi/v1/order",
                               {{"symbol", symbol}, {"origClientOrderId", client_order_id}},
                               true);
    if (response.isSuccess()) {
        return parseOrder(parseBody(response));
    }
    raise("getOrderStatus", response);
}

std::vector<core::LivePosition> BinanceFuturesGateway::getLivePositions() {
    auto response = http_->get("/fapi/v2/positionRisk", {}, true);
    if (!response.isSuccess()) {
        raise("getLivePositions", response);
    }

    std::vector<core::LivePosition> out;
    for (const auto& item : parseBody(response)) {
        const double amount = num(item, "positionAmt");
        if (std::fabs(amount) < kPositionEpsilon) {
            continue;
        }
        core::LivePosition pos;
        pos.symbol = item.value("symbol", "");
        pos.side = (amount > 0.0) ? PositionSide::LONG : PositionSide::SHORT;
        pos.quantity = std::fabs(amount);
        pos.entry_price = num(item, "entryPrice");
        pos.mark_price = num(item, "markPrice");
        pos.leverage = std::max(1.0, num(item, "leverage"));
        out.push_back(pos);
    }
    return out;
}

std::vector<core::Fill> BinanceFuturesGateway::getRecentFills(const std::string& symbol, long long since_ms) {
    auto response = http_->get("/fapi/v1/userTrades",
                               {{"symbol", symbol}, {"startTime", std::to_string(since_ms)}, {"limit", "500"}},
                               true);
    if (!response.isSuccess()) {
        raise("getRecentFills", response);
    }

    const auto liquidations = liquidationOrderIds(symbol, since_ms);

    std::vector<core::Fill> out;
    for (const auto& item : parseBody(response)) {
        core::Fill fill;
        const long long order_id = integer(item, "orderId");
        fill.order_ref = std::to_string(order_id);
        fill.symbol = item.value("symbol", symbol);
        fill.side = (item.value("side", "BUY") == "SELL") ? OrderSide::SELL : OrderSide::BUY;
        fill.quantity = num(item, "qty");
        fill.price = num(item, "price");
        fill.realized_pnl = num(item, "realizedPnl");
        fill.time_ms = integer(item, "time");
        fill.liquidation = liquidations.count(order_id) > 0;
        out.push_back(fill);
    }
    return out;
}

double BinanceFuturesGateway::getMarkPrice(const std::string& symbol) {
    auto response = http_->get("/fapi/v1/premiumIndex", {{"symbol", symbol}});
    if (!response.isSuccess()) {
        raise("getMarkPrice", response);
    }
    const double mark = num(parseBody(response), "markPrice");
    if (!(mark > 0.0)) {
        throw GatewayError(true, "no mark price for " + symbol);
    }
    return mark;
}

double BinanceFuturesGateway::stepSize(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(step_mutex_);
        auto it = step_sizes_.find(symbol);
        if (it != step_sizes_.end()) {
            return it->second;
        }
    }

    auto response = http_->get("/fapi/v1/exchangeInfo");
    if (!response.isSuccess()) {
        raise("exchangeInfo", response);
    }

    auto info = parseBody(response);
    std::lock_guard<std::mutex> lock(step_mutex_);
    for (const auto& item : info.value("symbols", nlohmann::json::array())) {
        double step = 0.0;
        for (const auto& filter : item.value("filters", nlohmann::json::array())) {
            if (filter.value("filterType", "") == "LOT_SIZE") {
                step = num(filter, "stepSize");
            }
        }
        step_sizes_[item.value("symbol", "")] = step;
    }
    auto it = step_sizes_.find(symbol);
    if (it == step_sizes_.end()) {
        step_sizes_[symbol] = 0.0;
        LOG_WARN("{} not listed in exchangeInfo, quantities are sent unrounded", symbol);
        return 0.0;
    }
    return it->second;
}

core::OrderStatusReport BinanceFuturesGateway::parseOrder(const nlohmann::json& j) const {
    const double orig_qty = num(j, "origQty");
    const double executed = num(j, "executedQty");
    const auto mapped = OrderStateMapper::map(j.value("status", "NEW"), 0.0, orig_qty, executed);

    core::OrderStatusReport report;
    report.order_ref = std::to_string(integer(j, "orderId"));
    report.client_order_id = j.value("clientOrderId", "");
    report.symbol = j.value("symbol", "");
    report.status = mapped.status;
    report.filled_quantity = mapped.filled_quantity;
    report.avg_price = num(j, "avgPrice");
    report.terminal = mapped.terminal;
    report.update_time_ms = integer(j, "updateTime");
    return report;
}

std::set<long long> BinanceFuturesGateway::liquidationOrderIds(const std::string& symbol, long long since_ms) {
    std::set<long long> ids;
    auto response = http_->get("/fapi/v1/forceOrders",
                               {{"symbol", symbol}, {"startTime", std::to_string(since_ms)}},
                               true);
    if (!response.isSuccess()) {
        // Fills are still usable without the liquidation flag
        LOG_WARN("forceOrders lookup failed for {}: HTTP {}", symbol, response.status_code);
        return ids;
    }
    for (const auto& item : parseBody(response)) {
        ids.insert(integer(item, "orderId"));
    }
    return ids;
}

void BinanceFuturesGateway::raise(const std::string& what, const network::HttpResponse& response) const {
    const int code = errorCode(response);
    const bool transient = response.isServerError() || response.isRateLimited() ||
                           response.isBlocked() || code == -1001 || code == -1007;
    throw GatewayError(transient, what + " failed: HTTP " + std::to_string(response.status_code) +
                                  " " + sanitizeForLog(response.body));
}

} // namespace execution
} // namespace tradesync

#include "execution/PaperExchangeGateway.h"

#include <algorithm>

#include "common/Logger.h"

namespace tradesync {
namespace execution {

PaperExchangeGateway::PaperExchangeGateway(utils::ClockFn clock)
    : clock_(std::move(clock)) {}

core::OrderStatusReport PaperExchangeGateway::placeOrder(const core::OrderRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++place_calls_;
    maybeFail("placeOrder");

    auto existing = orders_.find(request.client_order_id);
    if (existing != orders_.end()) {
        return existing->second;
    }

    if (!(request.quantity > 0.0)) {
        throw GatewayError(false, "paper: invalid quantity");
    }

    const PositionKey key{request.symbol, affectedSide(request)};
    if (request.reduce_only) {
        auto pos = positions_.find(key);
        if (pos == positions_.end() || pos->second.quantity <= 0.0) {
            throw GatewayError(false, "paper: ReduceOnly order rejected, no position");
        }
    }
    if (fill_mode_ == FillMode::REJECT) {
        throw GatewayError(false, "paper: order rejected");
    }

    double price = 0.0;
    if (fill_mode_ == FillMode::FILL) {
        price = (request.reference_price > 0.0) ? request.reference_price : markLocked(request.symbol);
        const double slip = slippage_bps_ / 10000.0;
        price = (request.side == OrderSide::BUY) ? price * (1.0 + slip) : price * (1.0 - slip);
    }

    core::OrderStatusReport report;
    report.order_ref = "paper-" + std::to_string(next_order_ref_++);
    report.client_order_id = request.client_order_id;
    report.symbol = request.symbol;
    report.status = OrderStatus::SUBMITTED;
    report.update_time_ms = clock_();

    ++accepted_orders_;
    requests_[request.client_order_id] = request;

    if (fill_mode_ == FillMode::FILL) {
        executeLocked(report, request, price);
    }

    orders_[request.client_order_id] = report;
    LOG_DEBUG("paper: {} {} {} qty={:.6f} -> {}", request.client_order_id, request.symbol,
              toString(request.side), request.quantity, toString(report.status));
    return report;
}

core::OrderStatusReport PaperExchangeGateway::cancelOrder(const std::string& symbol,
                                                          const std::string& client_order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybeFail("cancelOrder");

    auto it = orders_.find(client_order_id);
    if (it == orders_.end() || it->second.symbol != symbol) {
        throw GatewayError(false, "paper: order does not exist");
    }
    if (!it->second.terminal) {
        it->second.status = (it->second.filled_quantity > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::CANCELLED;
        it->second.terminal = true;
        it->second.update_time_ms = clock_();
    }
    return it->second;
}

core::OrderStatusReport PaperExchangeGateway::getOrderStatus(const std::string& symbol,
                                                             const std::string& client_order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybeFail("getOrderStatus");

    auto it = orders_.find(client_order_id);
    if (it == orders_.end() || it->second.symbol != symbol) {
        throw GatewayError(false, "paper: order does not exist");
    }
    return it->second;
}

std::vector<core::LivePosition> PaperExchangeGateway::getLivePositions() {
    std::lock_guard<std::mutex> lock(mutex_);
    maybeFail("getLivePositions");

    std::vector<core::LivePosition> out;
    for (const auto& [key, pos] : positions_) {
        if (pos.quantity <= 0.0) {
            continue;
        }
        core::LivePosition live;
        live.symbol = key.first;
        live.side = key.second;
        live.quantity = pos.quantity;
        live.entry_price = pos.entry_price;
        auto mark = marks_.find(key.first);
        live.mark_price = (mark != marks_.end()) ? mark->second : pos.entry_price;
        auto lev = leverage_.find(key.first);
        live.leverage = (lev != leverage_.end()) ? lev->second : 1.0;
        out.push_back(live);
    }
    return out;
}

std::vector<core::Fill> PaperExchangeGateway::getRecentFills(const std::string& symbol, long long since_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybeFail("getRecentFills");

    std::vector<core::Fill> out;
    for (const auto& fill : fills_) {
        if (fill.symbol == symbol && fill.time_ms >= since_ms) {
            out.push_back(fill);
        }
    }
    return out;
}

double PaperExchangeGateway::getMarkPrice(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybeFail("getMarkPrice");
    return markLocked(symbol);
}

void PaperExchangeGateway::setFillMode(FillMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    fill_mode_ = mode;
}

void PaperExchangeGateway::setSlippageBps(double bps) {
    std::lock_guard<std::mutex> lock(mutex_);
    slippage_bps_ = std::max(0.0, bps);
}

void PaperExchangeGateway::setMarkPrice(const std::string& symbol, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    marks_[symbol] = price;
}

void PaperExchangeGateway::setLeverage(const std::string& symbol, double leverage) {
    std::lock_guard<std::mutex> lock(mutex_);
    leverage_[symbol] = leverage;
}

void PaperExchangeGateway::setPriceSource(PriceSource source) {
    std::lock_guard<std::mutex> lock(mutex_);
    price_source_ = std::move(source);
}

void PaperExchangeGateway::failNext(const std::string& operation, int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[operation] = std::max(0, n);
}

bool PaperExchangeGateway::fillOrder(const std::string& client_order_id, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(client_order_id);
    if (it == orders_.end() || it->second.terminal) {
        return false;
    }
    executeLocked(it->second, requests_.at(client_order_id), price);
    return true;
}

void PaperExchangeGateway::injectPosition(const std::string& symbol, PositionSide side,
                                          double quantity, double entry_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_[{symbol, side}] = PaperPosition{quantity, entry_price};
    marks_.emplace(symbol, entry_price);
}

void PaperExchangeGateway::closePositionExternally(const std::string& symbol, PositionSide side,
                                                   double price, bool liquidation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find({symbol, side});
    if (it == positions_.end()) {
        return;
    }

    core::Fill fill;
    fill.order_ref = "paper-ext-" + std::to_string(next_order_ref_++);
    fill.symbol = symbol;
    fill.side = exitOrderSide(side);
    fill.quantity = it->second.quantity;
    fill.price = price;
    fill.time_ms = clock_();
    fill.liquidation = liquidation;
    fill.realized_pnl = (side == PositionSide::LONG)
        ? (price - it->second.entry_price) * it->second.quantity
        : (it->second.entry_price - price) * it->second.quantity;
    fills_.push_back(fill);
    positions_.erase(it);
}

void PaperExchangeGateway::dropPosition(const std::string& symbol, PositionSide side) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_.erase({symbol, side});
}

int PaperExchangeGateway::placeOrderCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return place_calls_;
}

int PaperExchangeGateway::acceptedOrders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepted_orders_;
}

void PaperExchangeGateway::maybeFail(const std::string& operation) {
    auto it = failures_.find(operation);
    if (it != failures_.end() && it->second > 0) {
        --it->second;
        throw GatewayError(true, "paper: simulated timeout in " + operation);
    }
}

double PaperExchangeGateway::markLocked(const std::string& symbol) const {
    if (price_source_) {
        return price_source_(symbol);
    }
    auto it = marks_.find(symbol);
    if (it == marks_.end() || !(it->second > 0.0)) {
        throw GatewayError(false, "paper: no mark price for " + symbol);
    }
    return it->second;
}

void PaperExchangeGateway::executeLocked(core::OrderStatusReport& report,
                                         const core::OrderRequest& request,
                                         double price) {
    auto& pos = positions_[{request.symbol, affectedSide(request)}];

    double filled = request.quantity;
    double realized = 0.0;
    if (request.reduce_only) {
        filled = std::min(request.quantity, pos.quantity);
        realized = (request.side == OrderSide::SELL)
            ? (price - pos.entry_price) * filled
            : (pos.entry_price - price) * filled;
        pos.quantity -= filled;
        if (pos.quantity <= 1e-12) {
            positions_.erase({request.symbol, affectedSide(request)});
        }
    } else {
        const double total = pos.quantity + filled;
        pos.entry_price = (pos.entry_price * pos.quantity + price * filled) / total;
        pos.quantity = total;
    }

    const long long now = clock_();
    report.status = OrderStatus::FILLED;
    report.filled_quantity = filled;
    report.avg_price = price;
    report.terminal = true;
    report.update_time_ms = now;

    core::Fill fill;
    fill.order_ref = report.order_ref;
    fill.symbol = request.symbol;
    fill.side = request.side;
    fill.quantity = filled;
    fill.price = price;
    fill.realized_pnl = realized;
    fill.time_ms = now;
    fills_.push_back(fill);

    marks_.emplace(request.symbol, price);
}

PositionSide PaperExchangeGateway::affectedSide(const core::OrderRequest& request) {
    if (request.reduce_only) {
        return (request.side == OrderSide::SELL) ? PositionSide::LONG : PositionSide::SHORT;
    }
    return (request.side == OrderSide::BUY) ? PositionSide::LONG : PositionSide::SHORT;
}

} // namespace execution
} // namespace tradesync

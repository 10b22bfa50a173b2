#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "common/TimeUtils.h"
#include "core/contracts/IExchangeGateway.h"

namespace tradesync {
namespace execution {

// In-memory USDT-M futures venue. Positions are netted per symbol+side.
// Fill behaviour and failures are configurable so the lifecycle and the
// reconciliation paths can be driven deterministically.
class PaperExchangeGateway : public core::IExchangeGateway {
public:
    enum class FillMode {
        FILL,      // fill immediately at the reference or mark price
        REJECT,    // exchange refuses the order
        HOLD       // order rests until fillOrder() or cancel
    };

    using PriceSource = std::function<double(const std::string&)>;

    explicit PaperExchangeGateway(utils::ClockFn clock = utils::systemClock());

    core::OrderStatusReport placeOrder(const core::OrderRequest& request) override;
    core::OrderStatusReport cancelOrder(const std::string& symbol, const std::string& client_order_id) override;
    core::OrderStatusReport getOrderStatus(const std::string& symbol, const std::string& client_order_id) override;

    std::vector<core::LivePosition> getLivePositions() override;
    std::vector<core::Fill> getRecentFills(const std::string& symbol, long long since_ms) override;
    double getMarkPrice(const std::string& symbol) override;

    void setFillMode(FillMode mode);
    void setSlippageBps(double bps);
    void setMarkPrice(const std::string& symbol, double price);
    void setLeverage(const std::string& symbol, double leverage);
    void setPriceSource(PriceSource source);

    // Next n calls of the named operation throw a transient GatewayError
    void failNext(const std::string& operation, int n);

    // Fills a resting HOLD order at price
    bool fillOrder(const std::string& client_order_id, double price);

    // Position appears without an order from this process
    void injectPosition(const std::string& symbol, PositionSide side, double quantity, double entry_price);
    // Position closed outside this process, leaving a closing fill behind
    void closePositionExternally(const std::string& symbol, PositionSide side, double price, bool liquidation);
    // Position disappears without any fill record
    void dropPosition(const std::string& symbol, PositionSide side);

    int placeOrderCalls() const;
    int acceptedOrders() const;

private:
    struct PaperPosition {
        double quantity = 0.0;
        double entry_price = 0.0;
    };
    using PositionKey = std::pair<std::string, PositionSide>;

    void maybeFail(const std::string& operation);
    double markLocked(const std::string& symbol) const;
    void executeLocked(core::OrderStatusReport& report, const core::OrderRequest& request, double price);
    static PositionSide affectedSide(const core::OrderRequest& request);

    utils::ClockFn clock_;
    mutable std::mutex mutex_;

    FillMode fill_mode_ = FillMode::FILL;
    double slippage_bps_ = 0.0;
    PriceSource price_source_;
    std::map<std::string, double> marks_;
    std::map<std::string, double> leverage_;
    std::map<std::string, int> failures_;

    std::map<PositionKey, PaperPosition> positions_;
    std::map<std::string, core::OrderStatusReport> orders_;
    std::map<std::string, core::OrderRequest> requests_;
    std::vector<core::Fill> fills_;

    int place_calls_ = 0;
    int accepted_orders_ = 0;
    long long next_order_ref_ = 1;
};

} // namespace execution
} // namespace tradesync

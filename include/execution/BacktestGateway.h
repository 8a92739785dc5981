#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IOrderGateway.h"

namespace supergrid {
namespace execution {

// Simulated venue for bar/tick replay. Orders submitted while evaluating bar N
// are crossed against bar N+1 (matchBar) or the next tick (matchTick).
class BacktestGateway : public core::IOrderGateway {
public:
    BacktestGateway() = default;

    core::GatewayMode mode() const override { return core::GatewayMode::BACKTEST; }
    std::string submit(const core::OrderIntent& intent) override;
    void cancelAll() override;
    std::vector<core::GatewayEvent> drainEvents() override;

    // LIMIT buy fills when low <= price at min(price, open), LIMIT sell when
    // high >= price at max(price, open). MARKET orders fill at open.
    void matchBar(const Candle& candle);
    // Same rules against ask (buy) / bid (sell).
    void matchTick(const Tick& tick);

    size_t getWorkingOrderCount() const { return working_orders_.size(); }

private:
    struct SimOrder {
        std::string order_id;
        core::OrderIntent intent;
    };

    void cross(double buy_cross, double buy_best, double sell_cross, double sell_best, long long ts_ms);

    std::vector<SimOrder> working_orders_;
    std::vector<core::GatewayEvent> pending_events_;
    long long order_seq_ = 0;
};

} // namespace execution
} // namespace supergrid

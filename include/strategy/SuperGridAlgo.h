#pragma once

#include "common/Types.h"
#include "core/contracts/IGridObserver.h"
#include "core/contracts/IOrderGateway.h"
#include "strategy/GridConfig.h"
#include "strategy/GridState.h"
#include "strategy/GridStateMachine.h"
#include "strategy/PositionLedger.h"

namespace supergrid {
namespace strategy {

// ===== Super Grid =====
// Hosts one grid: feeds ticks/bars to the state machine, sends the resulting
// intents through the gateway and applies gateway feedback through the ledger.
class SuperGridAlgo {
public:
    SuperGridAlgo(
        const GridConfig& config,
        core::IOrderGateway& gateway,
        core::IGridObserver* observer = nullptr     // one snapshot per evaluation and per feedback event
    );

    void start();
    void stop();
    bool isActive() const { return active_; }

    // 틱 / 봉 마감 입력
    void onTick(const Tick& tick);
    void onBar(const Candle& candle);

    // 게이트웨이 피드백
    void processGatewayEvents();
    void onOrderUpdate(const core::OrderUpdate& update);
    void onFill(const core::Fill& fill);
    void onPosition(double volume, double price);

    const GridConfig& getConfig() const { return machine_.config(); }
    const GridState& getState() const { return state_; }
    int getSleepCycleCount() const { return sleep_cycles_; }
    int getBuyOrderCount() const { return buy_orders_sent_; }
    int getSellOrderCount() const { return sell_orders_sent_; }

private:
    void onSnapshot(const market::MarketSnapshot& snapshot);
    void send(const core::OrderIntent& intent);
    void publish() const;

    GridStateMachine machine_;
    PositionLedger ledger_;
    GridState state_;
    core::IOrderGateway& gateway_;
    core::IGridObserver* observer_;

    bool active_ = false;
    int sleep_cycles_ = 0;
    int buy_orders_sent_ = 0;
    int sell_orders_sent_ = 0;
};

} // namespace strategy
} // namespace supergrid

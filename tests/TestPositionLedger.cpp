#include "strategy/PositionLedger.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace supergrid;
using namespace supergrid::strategy;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

core::Fill makeFill(const std::string& order_id, OrderSide side, double price, double volume) {
    core::Fill fill;
    fill.order_id = order_id;
    fill.side = side;
    fill.price = price;
    fill.volume = volume;
    return fill;
}

core::OrderUpdate makeUpdate(const std::string& order_id, bool active, OrderStatus status) {
    core::OrderUpdate update;
    update.order_id = order_id;
    update.active = active;
    update.status = status;
    return update;
}

GridState armedState() {
    GridState state;
    state.trigger_price = 47000.0;
    state.touch_up = true;
    state.highest_price = 48000.0;
    state.touch_dn = true;
    state.lowest_price = 46000.0;
    return state;
}
} // namespace

int main() {
    PositionLedger ledger("BTCUSDT.BINANCE");

    // Buy fill: position up, upside arm cleared, trigger re-anchored
    {
        GridState state = armedState();
        ledger.onFill(makeFill("A", OrderSide::BUY, 46500.0, 0.1), state);
        assert(near(state.position, 0.1));
        assert(!state.touch_up);
        assert(!state.highest_price);
        assert(state.touch_dn);
        assert(state.lowest_price && near(*state.lowest_price, 46000.0));
        assert(near(state.trigger_price, 46500.0));

        // Sell fill: position down, downside arm cleared
        ledger.onFill(makeFill("B", OrderSide::SELL, 47200.0, 0.05), state);
        assert(near(state.position, 0.05));
        assert(!state.touch_dn);
        assert(!state.lowest_price);
        assert(near(state.trigger_price, 47200.0));
    }

    // Malformed fills are ignored
    {
        GridState state = armedState();
        ledger.onFill(makeFill("C", OrderSide::BUY, 46500.0, 0.0), state);
        ledger.onFill(makeFill("D", OrderSide::SELL, 46500.0, -1.0), state);
        ledger.onFill(makeFill("E", OrderSide::BUY, std::nan(""), 0.1), state);
        assert(state.position == 0.0);
        assert(state.touch_up && state.touch_dn);
        assert(near(state.trigger_price, 47000.0));
    }

    // Order updates clear only the matching pending order, and only once inactive
    {
        GridState state = armedState();
        state.pending_order_id = "A";

        ledger.onOrderUpdate(makeUpdate("B", false, OrderStatus::FILLED), state);
        assert(state.pending_order_id && *state.pending_order_id == "A");

        ledger.onOrderUpdate(makeUpdate("A", true, OrderStatus::PARTIALLY_FILLED), state);
        assert(state.pending_order_id && *state.pending_order_id == "A");

        ledger.onOrderUpdate(makeUpdate("A", false, OrderStatus::REJECTED), state);
        assert(!state.pending_order_id);

        // arms and trigger are untouched by order status
        assert(state.touch_up && state.touch_dn);
        assert(near(state.trigger_price, 47000.0));
        assert(state.position == 0.0);
    }

    // Position sync overwrites position and seeds an unset trigger
    {
        GridState state = armedState();
        ledger.onPositionSync(2.5, 50000.0, state);
        assert(near(state.position, 2.5));
        assert(near(state.trigger_price, 47000.0));

        state.trigger_price = 0.0;
        ledger.onPositionSync(-1.0, 50000.0, state);
        assert(near(state.position, -1.0));
        assert(near(state.trigger_price, 50000.0));
    }

    std::cout << "[TEST] PositionLedger PASSED\n";
    return 0;
}

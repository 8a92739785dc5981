#pragma once

#include "strategy/GridConfig.h"
#include "strategy/GridState.h"

namespace supergrid {
namespace strategy {

struct OrderSizing {
    double price = 0.0;
    double volume = 0.0;
    double move_pct = 0.0;      // rise_pct (sell) / fall_pct (buy) against trigger_price
    bool suppressed = false;    // give_up_bias rejected this cycle
};

// Stateless price/volume calculation for a grid release.
class OrderSizer {
public:
    static OrderSizing sizeSell(
        const GridConfig& config,
        const GridState& state,
        double last_price,
        double bid_price
    );

    static OrderSizing sizeBuy(
        const GridConfig& config,
        const GridState& state,
        double last_price,
        double ask_price
    );

    // (last - trigger) / trigger * 100, 0 when trigger is not positive.
    static double risePct(double trigger_price, double last_price);
    // (trigger - last) / trigger * 100, 0 when trigger is not positive.
    static double fallPct(double trigger_price, double last_price);
};

} // namespace strategy
} // namespace supergrid

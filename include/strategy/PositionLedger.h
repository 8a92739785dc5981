#pragma once

#include <string>

#include "core/model/GatewayTypes.h"
#include "strategy/GridState.h"

namespace supergrid {
namespace strategy {

// Applies gateway feedback (fills, order status, position sync) to GridState.
class PositionLedger {
public:
    explicit PositionLedger(std::string vt_symbol);

    // BUY: position += volume, clears the upside arm.
    // SELL: position -= volume, clears the downside arm.
    // Both re-anchor trigger_price to the fill price.
    void onFill(const core::Fill& fill, GridState& state) const;

    // Inactive update for the pending order clears pending_order_id only.
    void onOrderUpdate(const core::OrderUpdate& update, GridState& state) const;

    void onPositionSync(double external_position, double reference_price, GridState& state) const;

private:
    std::string vt_symbol_;
};

} // namespace strategy
} // namespace supergrid

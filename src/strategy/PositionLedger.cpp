#include "strategy/PositionLedger.h"
#include "common/Logger.h"

#include <cmath>
#include <utility>

namespace supergrid {
namespace strategy {

PositionLedger::PositionLedger(std::string vt_symbol)
    : vt_symbol_(std::move(vt_symbol)) {}

void PositionLedger::onFill(const core::Fill& fill, GridState& state) const {
    if (!std::isfinite(fill.volume) || !std::isfinite(fill.price) || fill.volume <= 0.0) {
        LOG_WARN("[SuperGrid] {} ignoring malformed fill: order_id={}, price={}, volume={}",
                 vt_symbol_, fill.order_id, fill.price, fill.volume);
        return;
    }

    if (fill.side == OrderSide::BUY) {
        state.position += fill.volume;
        state.touch_up = false;
        state.highest_price.reset();
    } else {
        state.position -= fill.volume;
        state.touch_dn = false;
        state.lowest_price.reset();
    }

    // 체결가로 기준가 재설정
    if (fill.price > 0.0) {
        state.trigger_price = fill.price;
    }

    LOG_INFO("[SuperGrid] {} fill {} {}@{} -> position={}, trigger={}",
             vt_symbol_, orderSideToString(fill.side), fill.volume, fill.price,
             state.position, state.trigger_price);
}

void PositionLedger::onOrderUpdate(const core::OrderUpdate& update, GridState& state) const {
    if (update.active) {
        return;
    }
    if (state.pending_order_id && *state.pending_order_id == update.order_id) {
        state.pending_order_id.reset();
        LOG_INFO("[SuperGrid] {} order {} closed ({})",
                 vt_symbol_, update.order_id, orderStatusToString(update.status));
    }
}

void PositionLedger::onPositionSync(double external_position, double reference_price, GridState& state) const {
    if (!std::isfinite(external_position)) {
        LOG_WARN("[SuperGrid] {} ignoring non-finite position sync", vt_symbol_);
        return;
    }

    state.position = external_position;
    if (state.trigger_price <= 0.0 && std::isfinite(reference_price)) {
        state.trigger_price = reference_price;
    }
}

} // namespace strategy
} // namespace supergrid

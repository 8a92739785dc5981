#include "execution/BacktestGateway.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace supergrid {
namespace execution {

std::string BacktestGateway::submit(const core::OrderIntent& intent) {
    if (!(intent.volume > 0.0) || !std::isfinite(intent.volume) ||
        (intent.order_type == OrderType::LIMIT && !(intent.price > 0.0))) {
        LOG_WARN("Backtest order refused: side={}, price={}, volume={}",
                 orderSideToString(intent.side), intent.price, intent.volume);
        return "";
    }

    SimOrder order;
    order.order_id = "BT-" + std::to_string(++order_seq_);
    order.intent = intent;
    working_orders_.push_back(order);

    core::OrderUpdate update;
    update.order_id = order.order_id;
    update.active = true;
    update.status = OrderStatus::SUBMITTED;
    pending_events_.push_back(core::GatewayEvent::orderUpdate(update));
    return order.order_id;
}

void BacktestGateway::cancelAll() {
    for (const auto& order : working_orders_) {
        core::OrderUpdate update;
        update.order_id = order.order_id;
        update.active = false;
        update.status = OrderStatus::CANCELLED;
        pending_events_.push_back(core::GatewayEvent::orderUpdate(update));
    }
    working_orders_.clear();
}

std::vector<core::GatewayEvent> BacktestGateway::drainEvents() {
    std::vector<core::GatewayEvent> out;
    out.swap(pending_events_);
    return out;
}

void BacktestGateway::matchBar(const Candle& candle) {
    cross(candle.low, candle.open, candle.high, candle.open, candle.timestamp);
}

void BacktestGateway::matchTick(const Tick& tick) {
    cross(tick.ask_price_1, tick.ask_price_1, tick.bid_price_1, tick.bid_price_1, tick.timestamp);
}

void BacktestGateway::cross(double buy_cross, double buy_best, double sell_cross, double sell_best, long long ts_ms) {
    std::vector<SimOrder> still_working;
    still_working.reserve(working_orders_.size());

    for (const auto& order : working_orders_) {
        const auto& intent = order.intent;
        bool filled = false;
        double fill_price = 0.0;

        if (intent.side == OrderSide::BUY) {
            if (intent.order_type == OrderType::MARKET) {
                filled = buy_best > 0.0;
                fill_price = buy_best;
            } else if (buy_cross > 0.0 && buy_cross <= intent.price) {
                filled = true;
                fill_price = std::min(intent.price, buy_best);
            }
        } else {
            if (intent.order_type == OrderType::MARKET) {
                filled = sell_best > 0.0;
                fill_price = sell_best;
            } else if (sell_cross > 0.0 && sell_cross >= intent.price) {
                filled = true;
                fill_price = std::max(intent.price, sell_best);
            }
        }

        if (!filled) {
            still_working.push_back(order);
            continue;
        }

        core::Fill fill;
        fill.order_id = order.order_id;
        fill.side = intent.side;
        fill.price = fill_price;
        fill.volume = intent.volume;
        fill.ts_ms = ts_ms;
        pending_events_.push_back(core::GatewayEvent::filled(fill));

        core::OrderUpdate update;
        update.order_id = order.order_id;
        update.active = false;
        update.status = OrderStatus::FILLED;
        pending_events_.push_back(core::GatewayEvent::orderUpdate(update));
    }

    working_orders_.swap(still_working);
}

} // namespace execution
} // namespace supergrid

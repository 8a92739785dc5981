#pragma once

#include <string>

#include "common/Types.h"

namespace supergrid {
namespace core {

enum class GatewayMode {
    LIVE,
    BACKTEST
};

struct OrderIntent {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double price = 0.0;
    double volume = 0.0;
    OrderType order_type = OrderType::LIMIT;
    Offset offset = Offset::NONE;
};

struct OrderUpdate {
    std::string order_id;
    bool active = true;
    OrderStatus status = OrderStatus::SUBMITTED;
};

struct Fill {
    std::string order_id;
    OrderSide side = OrderSide::BUY;
    double price = 0.0;
    double volume = 0.0;
    long long ts_ms = 0;
};

enum class GatewayEventType {
    ORDER_UPDATE,
    FILL
};

struct GatewayEvent {
    GatewayEventType type = GatewayEventType::ORDER_UPDATE;
    OrderUpdate order;
    Fill fill;

    static GatewayEvent orderUpdate(const OrderUpdate& update) {
        GatewayEvent event;
        event.type = GatewayEventType::ORDER_UPDATE;
        event.order = update;
        return event;
    }

    static GatewayEvent filled(const Fill& fill) {
        GatewayEvent event;
        event.type = GatewayEventType::FILL;
        event.fill = fill;
        return event;
    }
};

} // namespace core
} // namespace supergrid

#pragma once

#include <string>
#include <vector>

#include "core/model/GatewayTypes.h"

namespace supergrid {
namespace core {

// Execution capability handed to the grid at construction. Implemented by
// LiveGateway (venue bridge) and BacktestGateway (in-process simulation).
class IOrderGateway {
public:
    virtual ~IOrderGateway() = default;

    virtual GatewayMode mode() const = 0;

    // Returns the order id, or an empty string when the order was refused.
    virtual std::string submit(const OrderIntent& intent) = 0;
    virtual void cancelAll() = 0;
    virtual std::vector<GatewayEvent> drainEvents() = 0;
};

// Venue side of a live deployment (exchange API client, OMS bridge...).
class IOrderRouter {
public:
    virtual ~IOrderRouter() = default;

    virtual std::string sendOrder(const OrderIntent& intent) = 0;
    virtual bool cancelOrder(const std::string& order_id) = 0;
};

} // namespace core
} // namespace supergrid

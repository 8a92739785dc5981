#pragma once

#include <string>

#include "common/Types.h"

namespace supergrid {
namespace core {
namespace execution {

struct OrderLifecycleTransitionResult {
    OrderStatus status = OrderStatus::SUBMITTED;
    double filled_volume = 0.0;     // cumulative
    bool terminal = false;
};

// Maps one venue order report onto the grid's order model. Event names are
// matched case-insensitively (Upbit "wait"/"trade"/"done", vnpy "PARTTRADED"/
// "ALLTRADED"/"CANCELLED", ...). executed_volume is cumulative; remaining_volume
// is used when the venue only reports what is left. The result never fills
// less than current_filled_volume nor more than order_volume.
class OrderLifecycleStateMachine {
public:
    static OrderLifecycleTransitionResult transition(
        const std::string& event,
        double current_filled_volume,
        double order_volume,
        double executed_volume = 0.0,
        double remaining_volume = 0.0
    );
};

} // namespace execution
} // namespace core
} // namespace supergrid

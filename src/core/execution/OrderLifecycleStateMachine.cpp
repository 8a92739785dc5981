#include "core/execution/OrderLifecycleStateMachine.h"

#include <algorithm>
#include <cctype>

namespace supergrid {
namespace core {
namespace execution {

namespace {
constexpr double kVolumeEpsilon = 1e-8;

enum class VenueEvent {
    ALL_TRADED,
    CANCELLED,
    REJECTED,
    TRADING,
    OTHER       // submitted / pending / new / nottraded, unknown names
};

struct EventAlias {
    const char* name;
    VenueEvent kind;
};

// 거래소별 상태 이름 (소문자)
constexpr EventAlias kEventAliases[] = {
    {"filled", VenueEvent::ALL_TRADED},
    {"done", VenueEvent::ALL_TRADED},
    {"alltraded", VenueEvent::ALL_TRADED},
    {"cancel", VenueEvent::CANCELLED},
    {"cancelled", VenueEvent::CANCELLED},
    {"canceled", VenueEvent::CANCELLED},
    {"rejected", VenueEvent::REJECTED},
    {"reject", VenueEvent::REJECTED},
    {"prevented", VenueEvent::REJECTED},
    {"partially_filled", VenueEvent::TRADING},
    {"partial_fill", VenueEvent::TRADING},
    {"parttraded", VenueEvent::TRADING},
    {"trade", VenueEvent::TRADING},
    {"wait", VenueEvent::TRADING},
    {"watch", VenueEvent::TRADING},
};

VenueEvent classify(const std::string& event) {
    std::string lower = event;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (const auto& alias : kEventAliases) {
        if (lower == alias.name) {
            return alias.kind;
        }
    }
    return VenueEvent::OTHER;
}

double cumulativeFilled(double current, double order_volume, double executed, double remaining) {
    double filled = std::max(0.0, current);
    if (executed > 0.0) {
        filled = std::max(filled, executed);
    }
    if (remaining > 0.0 && order_volume > remaining) {
        filled = std::max(filled, order_volume - remaining);
    }
    if (order_volume > 0.0) {
        filled = std::min(filled, order_volume);
    }
    return filled;
}
} // namespace

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    const std::string& event,
    double current_filled_volume,
    double order_volume,
    double executed_volume,
    double remaining_volume
) {
    OrderLifecycleTransitionResult result;
    result.filled_volume = cumulativeFilled(
        current_filled_volume, order_volume, executed_volume, remaining_volume);

    const bool fully_filled = order_volume > 0.0 &&
                              result.filled_volume >= order_volume - kVolumeEpsilon;

    switch (classify(event)) {
        case VenueEvent::ALL_TRADED:
            // venue said done without quantities: assume the whole order
            if (result.filled_volume <= 0.0) {
                result.filled_volume = order_volume;
            }
            result.status = OrderStatus::FILLED;
            result.terminal = true;
            break;
        case VenueEvent::CANCELLED:
            result.status = OrderStatus::CANCELLED;
            result.terminal = true;
            break;
        case VenueEvent::REJECTED:
            result.status = OrderStatus::REJECTED;
            result.terminal = true;
            break;
        case VenueEvent::TRADING:
            if (fully_filled) {
                result.status = OrderStatus::FILLED;
                result.terminal = true;
                break;
            }
            result.status = (result.filled_volume > 0.0) ? OrderStatus::PARTIALLY_FILLED
                                                         : OrderStatus::SUBMITTED;
            break;
        case VenueEvent::OTHER:
            result.status = (result.filled_volume > 0.0) ? OrderStatus::PARTIALLY_FILLED
                                                         : OrderStatus::SUBMITTED;
            break;
    }
    return result;
}

} // namespace execution
} // namespace core
} // namespace supergrid

#include "execution/LiveGateway.h"
#include "core/execution/OrderLifecycleStateMachine.h"
#include "common/Logger.h"

#include <cmath>
#include <exception>

namespace supergrid {
namespace execution {

namespace {
constexpr double kVolumeEpsilon = 1e-12;
}

LiveGateway::LiveGateway(core::IOrderRouter& router)
    : router_(router) {}

std::string LiveGateway::submit(const core::OrderIntent& intent) {
    std::string order_id;
    try {
        order_id = router_.sendOrder(intent);
    } catch (const std::exception& e) {
        LOG_ERROR("Order send failed: symbol={}, side={}, error={}",
                  intent.symbol, orderSideToString(intent.side), e.what());
        return "";
    }

    if (order_id.empty()) {
        LOG_WARN("Order refused by router: symbol={}, side={}, price={}, volume={}",
                 intent.symbol, orderSideToString(intent.side), intent.price, intent.volume);
        return "";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    WorkingOrder order;
    order.order_id = order_id;
    order.intent = intent;

    // 등록 전에 도착한 체결 보고 재적용
    bool terminal = false;
    for (auto it = early_reports_.begin(); it != early_reports_.end();) {
        if (it->order_id != order_id) {
            ++it;
            continue;
        }
        if (!terminal) {
            terminal = applyReport(order, *it);
        }
        it = early_reports_.erase(it);
    }

    if (!terminal) {
        working_orders_[order_id] = order;
    }
    return order_id;
}

void LiveGateway::cancelAll() {
    std::vector<std::string> order_ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        order_ids.reserve(working_orders_.size());
        for (const auto& entry : working_orders_) {
            order_ids.push_back(entry.first);
        }
    }

    // Router may report synchronously, so it is called without holding the lock.
    for (const auto& order_id : order_ids) {
        bool accepted = false;
        try {
            accepted = router_.cancelOrder(order_id);
        } catch (const std::exception& e) {
            LOG_ERROR("Order cancel failed: order_id={}, error={}", order_id, e.what());
            continue;
        }
        if (accepted) {
            continue;
        }

        // Refused cancel: the venue will not report this order closed, stop tracking it.
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = working_orders_.find(order_id);
        if (it == working_orders_.end()) {
            continue;   // closed by a report in the meantime
        }
        LOG_WARN("Order cancel refused, dropping working order: order_id={}", order_id);
        working_orders_.erase(it);

        core::OrderUpdate update;
        update.order_id = order_id;
        update.active = false;
        update.status = OrderStatus::CANCELLED;
        pending_events_.push_back(core::GatewayEvent::orderUpdate(update));
    }
}

std::vector<core::GatewayEvent> LiveGateway::drainEvents() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::GatewayEvent> out;
    out.swap(pending_events_);
    return out;
}

bool LiveGateway::reportExecution(
    const std::string& order_id,
    const std::string& event,
    double executed_volume,
    double avg_price,
    long long ts_ms
) {
    ExecutionReport report;
    report.order_id = order_id;
    report.event = event;
    report.executed_volume = executed_volume;
    report.avg_price = avg_price;
    report.ts_ms = ts_ms;

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = working_orders_.find(order_id);
    if (it == working_orders_.end()) {
        LOG_WARN("Execution report for unregistered order held: order_id={}, event={}", order_id, event);
        if (early_reports_.size() >= kMaxEarlyReports) {
            early_reports_.pop_front();
        }
        early_reports_.push_back(report);
        return false;
    }

    if (applyReport(it->second, report)) {
        working_orders_.erase(it);
    }
    return true;
}

bool LiveGateway::applyReport(WorkingOrder& order, const ExecutionReport& report) {
    const auto result = core::execution::OrderLifecycleStateMachine::transition(
        report.event,
        order.filled_volume,
        order.intent.volume,
        report.executed_volume
    );

    const double delta = result.filled_volume - order.filled_volume;
    if (delta > kVolumeEpsilon) {
        core::Fill fill;
        fill.order_id = order.order_id;
        fill.side = order.intent.side;
        fill.price = (report.avg_price > 0.0 && std::isfinite(report.avg_price))
                         ? report.avg_price : order.intent.price;
        fill.volume = delta;
        fill.ts_ms = report.ts_ms;
        pending_events_.push_back(core::GatewayEvent::filled(fill));
        order.filled_volume = result.filled_volume;
    }

    const bool status_changed = (result.status != order.status);
    order.status = result.status;

    if (result.terminal) {
        core::OrderUpdate update;
        update.order_id = order.order_id;
        update.active = false;
        update.status = result.status;
        pending_events_.push_back(core::GatewayEvent::orderUpdate(update));
    } else if (status_changed) {
        core::OrderUpdate update;
        update.order_id = order.order_id;
        update.active = true;
        update.status = result.status;
        pending_events_.push_back(core::GatewayEvent::orderUpdate(update));
    }

    return result.terminal;
}

size_t LiveGateway::getWorkingOrderCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return working_orders_.size();
}

} // namespace execution
} // namespace supergrid

#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "core/contracts/IOrderGateway.h"

namespace supergrid {
namespace execution {

struct WorkingOrder {
    std::string order_id;
    core::OrderIntent intent;
    double filled_volume = 0.0;
    OrderStatus status = OrderStatus::SUBMITTED;
};

// Bridges the grid to a venue router. Venue callbacks may arrive on another
// thread; they are queued and handed to the strategy thread by drainEvents().
class LiveGateway : public core::IOrderGateway {
public:
    explicit LiveGateway(core::IOrderRouter& router);

    core::GatewayMode mode() const override { return core::GatewayMode::LIVE; }
    std::string submit(const core::OrderIntent& intent) override;
    void cancelAll() override;
    std::vector<core::GatewayEvent> drainEvents() override;

    // Venue report for one order. executed_volume is cumulative.
    // Returns false for order ids not (yet) registered. Such reports are held
    // and replayed if submit() registers the id afterwards, since a router may
    // report before sendOrder() returns.
    bool reportExecution(
        const std::string& order_id,
        const std::string& event,
        double executed_volume,
        double avg_price,
        long long ts_ms = 0
    );

    size_t getWorkingOrderCount() const;

private:
    struct ExecutionReport {
        std::string order_id;
        std::string event;
        double executed_volume = 0.0;
        double avg_price = 0.0;
        long long ts_ms = 0;
    };

    // mutex_ must be held. Returns true when the order reached a terminal state.
    bool applyReport(WorkingOrder& order, const ExecutionReport& report);

    static constexpr size_t kMaxEarlyReports = 256;

    core::IOrderRouter& router_;

    mutable std::mutex mutex_;
    std::map<std::string, WorkingOrder> working_orders_;  // Key: order_id
    std::vector<core::GatewayEvent> pending_events_;
    std::deque<ExecutionReport> early_reports_;     // reports for unregistered ids
};

} // namespace execution
} // namespace supergrid

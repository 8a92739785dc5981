#pragma once

#include <vector>

#include "core/contracts/IGridObserver.h"
#include "core/model/GatewayTypes.h"
#include "market/MarketSnapshot.h"
#include "strategy/GridConfig.h"
#include "strategy/GridState.h"

namespace supergrid {
namespace strategy {

struct Evaluation {
    std::vector<core::OrderIntent> intents;   // at most one SELL followed by at most one BUY
    bool cancel_all = false;                  // price outside the corridor
    bool sleep_entered = false;
    bool sleep_exited = false;
};

class GridStateMachine {
public:
    // Throws GridConfigError if the config is invalid.
    explicit GridStateMachine(const GridConfig& config, core::IGridObserver* observer = nullptr);

    // One call per snapshot, in arrival order. Never throws.
    Evaluation evaluate(const market::MarketSnapshot& snapshot, GridState& state) const;

    const GridConfig& config() const { return config_; }

private:
    bool checkCorridor(double last_price, GridState& state, Evaluation& out) const;
    void armUp(double last_price, GridState& state) const;
    void armDown(double last_price, GridState& state) const;
    void releaseUp(const market::MarketSnapshot& snapshot, GridState& state, Evaluation& out) const;
    void releaseDown(const market::MarketSnapshot& snapshot, GridState& state, Evaluation& out) const;
    void publish(const GridState& state) const;

    GridConfig config_;
    core::IGridObserver* observer_;
};

} // namespace strategy
} // namespace supergrid

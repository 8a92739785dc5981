#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "strategy/GridConfig.h"

namespace supergrid {
namespace strategy {

// Mutable grid state. Owned by exactly one SuperGridAlgo and mutated only by
// GridStateMachine::evaluate and PositionLedger, one event at a time.
struct GridState {
    double trigger_price = 0.0;
    bool touch_up = false;
    bool touch_dn = false;
    std::optional<double> highest_price;    // set iff touch_up
    std::optional<double> lowest_price;     // set iff touch_dn
    bool grid_sleep = false;
    double position = 0.0;
    std::optional<std::string> pending_order_id;

    static GridState fromConfig(const GridConfig& config) {
        GridState state;
        state.trigger_price = config.trigger_price;
        return state;
    }
};

// 외부 표시/로그용 상태 스냅샷
struct GridStateSnapshot {
    std::uint64_t seq = 0;
    std::string vt_symbol;
    double position = 0.0;
    std::string pending_order_id;
    bool touch_up = false;
    bool touch_dn = false;
    std::optional<double> lowest_price;
    std::optional<double> highest_price;
    double trigger_price = 0.0;
    bool grid_sleep = false;
};

inline GridStateSnapshot makeSnapshot(const std::string& vt_symbol, const GridState& state) {
    GridStateSnapshot snapshot;
    snapshot.vt_symbol = vt_symbol;
    snapshot.position = state.position;
    snapshot.pending_order_id = state.pending_order_id.value_or(std::string());
    snapshot.touch_up = state.touch_up;
    snapshot.touch_dn = state.touch_dn;
    snapshot.lowest_price = state.lowest_price;
    snapshot.highest_price = state.highest_price;
    snapshot.trigger_price = state.trigger_price;
    snapshot.grid_sleep = state.grid_sleep;
    return snapshot;
}

} // namespace strategy
} // namespace supergrid

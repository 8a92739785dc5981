#include "strategy/GridStateMachine.h"
#include "strategy/OrderSizer.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <exception>

namespace supergrid {
namespace strategy {

namespace {
bool isFiniteSnapshot(const market::MarketSnapshot& snapshot) {
    return std::isfinite(snapshot.last_price) &&
           std::isfinite(snapshot.bid_price) &&
           std::isfinite(snapshot.ask_price);
}
} // namespace

GridStateMachine::GridStateMachine(const GridConfig& config, core::IGridObserver* observer)
    : config_(config)
    , observer_(observer)
{
    config_.validate();
}

Evaluation GridStateMachine::evaluate(const market::MarketSnapshot& snapshot, GridState& state) const
{
    Evaluation out;

    if (!isFiniteSnapshot(snapshot)) {
        LOG_WARN("[SuperGrid] {} non-finite snapshot skipped (last={}, bid={}, ask={})",
                 config_.vt_symbol, snapshot.last_price, snapshot.bid_price, snapshot.ask_price);
        publish(state);
        return out;
    }

    const double last_price = snapshot.last_price;

    // 그리드 범위를 벗어나면 휴면
    if (!checkCorridor(last_price, state, out)) {
        publish(state);
        return out;
    }

    armUp(last_price, state);
    armDown(last_price, state);

    releaseUp(snapshot, state, out);
    releaseDown(snapshot, state, out);

    publish(state);
    return out;
}

bool GridStateMachine::checkCorridor(double last_price, GridState& state, Evaluation& out) const
{
    if (last_price > config_.upper_price || last_price < config_.lower_price) {
        out.cancel_all = true;
        if (!state.grid_sleep) {
            state.grid_sleep = true;
            out.sleep_entered = true;
            LOG_INFO("[SuperGrid] {} sleep: last={}, upper={}, lower={}",
                     config_.vt_symbol, last_price, config_.upper_price, config_.lower_price);
        }
    } else if (state.grid_sleep) {
        state.grid_sleep = false;
        out.sleep_exited = true;
        LOG_INFO("[SuperGrid] {} resume: last={}, upper={}, lower={}",
                 config_.vt_symbol, last_price, config_.upper_price, config_.lower_price);
    }

    return !state.grid_sleep;
}

void GridStateMachine::armUp(double last_price, GridState& state) const
{
    if (last_price <= state.trigger_price) {
        return;
    }
    if (state.trigger_price <= 0.0) {
        LOG_WARN("[SuperGrid] {} trigger_price {} not positive, upside arming skipped",
                 config_.vt_symbol, state.trigger_price);
        return;
    }

    const double rise_pct = OrderSizer::risePct(state.trigger_price, last_price);
    if (rise_pct >= config_.rise_percent) {
        state.touch_up = true;
        state.highest_price = std::max(state.highest_price.value_or(last_price), last_price);
    }
}

void GridStateMachine::armDown(double last_price, GridState& state) const
{
    if (last_price >= state.trigger_price) {
        return;
    }
    if (state.trigger_price <= 0.0) {
        LOG_WARN("[SuperGrid] {} trigger_price {} not positive, downside arming skipped",
                 config_.vt_symbol, state.trigger_price);
        return;
    }

    const double fall_pct = OrderSizer::fallPct(state.trigger_price, last_price);
    if (fall_pct >= config_.fall_percent) {
        state.touch_dn = true;
        state.lowest_price = std::min(state.lowest_price.value_or(last_price), last_price);
    }
}

void GridStateMachine::releaseUp(const market::MarketSnapshot& snapshot, GridState& state, Evaluation& out) const
{
    if (!state.touch_up) {
        return;
    }
    if (!state.highest_price || *state.highest_price <= 0.0) {
        LOG_WARN("[SuperGrid] {} touch_up without a usable highest_price, sell skipped", config_.vt_symbol);
        return;
    }

    const double highest = *state.highest_price;
    const double fall_dn_pct = (highest - snapshot.last_price) / highest * 100.0;
    if (fall_dn_pct < config_.fall_down) {
        return;
    }

    const OrderSizing sizing = OrderSizer::sizeSell(config_, state, snapshot.last_price, snapshot.bid_price);
    if (sizing.suppressed) {
        LOG_DEBUG("[SuperGrid] {} sell given up: bias={:.4f}% limit={:.4f}%",
                  config_.vt_symbol, sizing.move_pct, config_.give_up_bias);
        return;
    }

    LOG_DEBUG("[SuperGrid] UP last={} trigger={} highest={} fall_dn={:.4f}%",
              snapshot.last_price, state.trigger_price, highest, fall_dn_pct);

    core::OrderIntent intent;
    intent.symbol = config_.vt_symbol;
    intent.side = OrderSide::SELL;
    intent.price = sizing.price;
    intent.volume = sizing.volume;
    intent.order_type = config_.order_type;
    intent.offset = Offset::CLOSE;
    out.intents.push_back(intent);

    state.touch_up = false;
    state.highest_price.reset();
    state.trigger_price = sizing.price;
}

void GridStateMachine::releaseDown(const market::MarketSnapshot& snapshot, GridState& state, Evaluation& out) const
{
    if (!state.touch_dn) {
        return;
    }
    if (!state.lowest_price || *state.lowest_price <= 0.0) {
        LOG_WARN("[SuperGrid] {} touch_dn without a usable lowest_price, buy skipped", config_.vt_symbol);
        return;
    }

    const double lowest = *state.lowest_price;
    const double rise_up_pct = (snapshot.last_price - lowest) / lowest * 100.0;
    if (rise_up_pct < config_.rise_up) {
        return;
    }

    const OrderSizing sizing = OrderSizer::sizeBuy(config_, state, snapshot.last_price, snapshot.ask_price);
    if (sizing.suppressed) {
        LOG_DEBUG("[SuperGrid] {} buy given up: bias={:.4f}% limit={:.4f}%",
                  config_.vt_symbol, sizing.move_pct, config_.give_up_bias);
        return;
    }

    LOG_DEBUG("[SuperGrid] DN last={} trigger={} lowest={} rise_up={:.4f}%",
              snapshot.last_price, state.trigger_price, lowest, rise_up_pct);

    core::OrderIntent intent;
    intent.symbol = config_.vt_symbol;
    intent.side = OrderSide::BUY;
    intent.price = sizing.price;
    intent.volume = sizing.volume;
    intent.order_type = config_.order_type;
    intent.offset = Offset::OPEN;
    out.intents.push_back(intent);

    state.touch_dn = false;
    state.lowest_price.reset();
    state.trigger_price = sizing.price;
}

void GridStateMachine::publish(const GridState& state) const
{
    if (!observer_) {
        return;
    }
    try {
        observer_->onGridState(makeSnapshot(config_.vt_symbol, state));
    } catch (const std::exception& e) {
        LOG_WARN("[SuperGrid] {} state observer failed: {}", config_.vt_symbol, e.what());
    }
}

} // namespace strategy
} // namespace supergrid

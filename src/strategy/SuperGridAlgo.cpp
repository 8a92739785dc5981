#include "strategy/SuperGridAlgo.h"
#include "common/Logger.h"
#include "market/MarketSnapshot.h"

#include <exception>

namespace supergrid {
namespace strategy {

// ===== Constructor =====

SuperGridAlgo::SuperGridAlgo(
    const GridConfig& config,
    core::IOrderGateway& gateway,
    core::IGridObserver* observer)
    : machine_(config)
    , ledger_(config.vt_symbol)
    , state_(GridState::fromConfig(config))
    , gateway_(gateway)
    , observer_(observer)
{
    LOG_INFO("[SuperGrid] {} initialized: corridor=[{}, {}], trigger={}, order_type={}, gateway={}",
             config.vt_symbol, config.lower_price, config.upper_price, config.trigger_price,
             orderTypeToString(config.order_type),
             gateway.mode() == core::GatewayMode::LIVE ? "LIVE" : "BACKTEST");
}

// ===== Lifecycle =====

void SuperGridAlgo::start()
{
    active_ = true;
    LOG_INFO("[SuperGrid] {} started", getConfig().vt_symbol);
    publish();
}

void SuperGridAlgo::stop()
{
    if (!active_) {
        return;
    }
    active_ = false;
    gateway_.cancelAll();
    LOG_INFO("[SuperGrid] {} stopped, position={}", getConfig().vt_symbol, state_.position);
    publish();
}

// ===== Market Data =====

void SuperGridAlgo::onTick(const Tick& tick)
{
    onSnapshot(market::SnapshotAdapter::fromTick(tick));
}

void SuperGridAlgo::onBar(const Candle& candle)
{
    onSnapshot(market::SnapshotAdapter::fromCandle(candle));
}

void SuperGridAlgo::onSnapshot(const market::MarketSnapshot& snapshot)
{
    if (!active_) {
        return;
    }

    const Evaluation result = machine_.evaluate(snapshot, state_);

    if (result.cancel_all) {
        gateway_.cancelAll();
    }
    if (state_.grid_sleep) {
        sleep_cycles_++;
    }

    for (const auto& intent : result.intents) {
        send(intent);
    }
    // one snapshot per evaluation, taken after submission so it carries the pending id
    publish();
}

void SuperGridAlgo::send(const core::OrderIntent& intent)
{
    if (!(intent.volume > 0.0)) {
        LOG_WARN("[SuperGrid] {} {} skipped: volume {} at {}",
                 intent.symbol, orderSideToString(intent.side), intent.volume, intent.price);
        return;
    }

    const std::string order_id = gateway_.submit(intent);
    if (order_id.empty()) {
        LOG_WARN("[SuperGrid] {} {} {}@{} not accepted by gateway",
                 intent.symbol, orderSideToString(intent.side), intent.volume, intent.price);
        return;
    }

    state_.pending_order_id = order_id;
    if (intent.side == OrderSide::BUY) {
        buy_orders_sent_++;
    } else {
        sell_orders_sent_++;
    }

    LOG_INFO("[SuperGrid] send {} {}: {}@{} ({}, {}) -> {}",
             orderSideToString(intent.side), intent.symbol, intent.volume, intent.price,
             orderTypeToString(intent.order_type), offsetToString(intent.offset), order_id);
}

// ===== Gateway Feedback =====

void SuperGridAlgo::processGatewayEvents()
{
    const auto events = gateway_.drainEvents();
    if (events.empty()) {
        return;
    }

    for (const auto& event : events) {
        if (event.type == core::GatewayEventType::FILL) {
            onFill(event.fill);
        } else {
            onOrderUpdate(event.order);
        }
    }
}

void SuperGridAlgo::onOrderUpdate(const core::OrderUpdate& update)
{
    const bool had_pending = state_.pending_order_id.has_value();
    ledger_.onOrderUpdate(update, state_);
    if (had_pending != state_.pending_order_id.has_value()) {
        publish();
    }
}

void SuperGridAlgo::onFill(const core::Fill& fill)
{
    ledger_.onFill(fill, state_);
    Logger::getInstance().logTrade(getConfig().vt_symbol, fill.order_id, orderSideToString(fill.side),
                                   fill.price, fill.volume, state_.position);
    publish();
}

void SuperGridAlgo::onPosition(double volume, double price)
{
    ledger_.onPositionSync(volume, price, state_);
    publish();
}

void SuperGridAlgo::publish() const
{
    if (!observer_) {
        return;
    }
    try {
        observer_->onGridState(makeSnapshot(getConfig().vt_symbol, state_));
    } catch (const std::exception& e) {
        LOG_WARN("[SuperGrid] {} state observer failed: {}", getConfig().vt_symbol, e.what());
    }
}

} // namespace strategy
} // namespace supergrid

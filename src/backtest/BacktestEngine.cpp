#include "backtest/BacktestEngine.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace supergrid {
namespace backtest {

BacktestEngine::BacktestEngine(const strategy::GridConfig& grid_config, const BacktestSettings& settings)
    : settings_(settings)
    , cash_(settings.initial_cash)
    , position_(settings.initial_position)
{
    if (!settings_.journal_path.empty()) {
        journal_ = std::make_unique<core::GridStateJournalJsonl>(settings_.journal_path);
    }
    algo_ = std::make_unique<strategy::SuperGridAlgo>(grid_config, gateway_, journal_.get());
}

void BacktestEngine::loadData(const std::string& file_path) {
    if (settings_.mode == ReplayMode::TICK) {
        ticks_ = DataHistory::loadTickCSV(file_path);
    } else if (settings_.data_format == "json") {
        candles_ = DataHistory::loadJSON(file_path);
    } else {
        candles_ = DataHistory::loadCSV(file_path);
    }
}

void BacktestEngine::run() {
    if (has_run_) {
        LOG_WARN("Backtest already executed; create a new engine to run again");
        return;
    }
    has_run_ = true;

    const bool tick_mode = (settings_.mode == ReplayMode::TICK);
    const size_t steps = tick_mode ? ticks_.size() : candles_.size();
    if (steps == 0) {
        LOG_WARN("Backtest has no data to replay");
        return;
    }

    LOG_INFO("Backtest start: {} {} for {}", steps, tick_mode ? "ticks" : "bars",
             algo_->getConfig().vt_symbol);

    const double first_price = tick_mode ? ticks_.front().last_price : candles_.front().close;
    if (position_ != 0.0) {
        algo_->onPosition(position_, first_price);
    }
    peak_equity_ = cash_ + position_ * first_price;

    algo_->start();

    for (size_t i = 0; i < steps; ++i) {
        if (tick_mode) {
            const Tick& tick = ticks_[i];
            gateway_.matchTick(tick);
            drainGateway();
            algo_->onTick(tick);
            processStep(tick.last_price);
        } else {
            const Candle& candle = candles_[i];
            gateway_.matchBar(candle);
            drainGateway();
            algo_->onBar(candle);
            processStep(candle.close);
        }
    }

    algo_->stop();
    drainGateway();

    result_.final_position = position_;
    result_.final_cash = cash_;
    result_.final_equity = cash_ + position_ * result_.last_price;
    result_.buy_orders_sent = algo_->getBuyOrderCount();
    result_.sell_orders_sent = algo_->getSellOrderCount();
    result_.sleep_cycles = algo_->getSleepCycleCount();

    LOG_INFO("Backtest done: trades={}, position={}, equity={:.2f}, fees={:.2f}, max_dd={:.2f}",
             result_.total_trades, result_.final_position, result_.final_equity,
             result_.total_fees, result_.max_drawdown);
}

void BacktestEngine::processStep(double mark_price) {
    result_.steps_processed++;
    markToMarket(mark_price);
}

void BacktestEngine::drainGateway() {
    for (const auto& event : gateway_.drainEvents()) {
        if (event.type == core::GatewayEventType::FILL) {
            const auto& fill = event.fill;
            const double notional = fill.price * fill.volume;
            const double fee = std::abs(notional) * settings_.fee_rate;

            if (fill.side == OrderSide::BUY) {
                position_ += fill.volume;
                cash_ -= notional;
                result_.buy_trades++;
            } else {
                position_ -= fill.volume;
                cash_ += notional;
                result_.sell_trades++;
            }
            cash_ -= fee;

            result_.total_trades++;
            result_.traded_volume += fill.volume;
            result_.turnover += std::abs(notional);
            result_.total_fees += fee;

            algo_->onFill(fill);
        } else {
            if (!event.order.active && event.order.status == OrderStatus::CANCELLED) {
                result_.cancelled_orders++;
            }
            algo_->onOrderUpdate(event.order);
        }
    }
}

void BacktestEngine::markToMarket(double price) {
    if (!std::isfinite(price) || price <= 0.0) {
        return;
    }
    result_.last_price = price;
    const double equity = cash_ + position_ * price;
    peak_equity_ = std::max(peak_equity_, equity);
    result_.max_drawdown = std::max(result_.max_drawdown, peak_equity_ - equity);
}

} // namespace backtest
} // namespace supergrid

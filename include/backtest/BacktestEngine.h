#pragma once

#include <memory>
#include <utility>
#include <string>
#include <vector>
#include "common/Types.h"
#include "backtest/BacktestConfig.h"
#include "backtest/DataHistory.h"
#include "core/state/GridStateJournalJsonl.h"
#include "execution/BacktestGateway.h"
#include "strategy/GridConfig.h"
#include "strategy/SuperGridAlgo.h"

namespace supergrid {
namespace backtest {

class BacktestEngine {
public:
    // Throws GridConfigError if the grid config is invalid.
    BacktestEngine(const strategy::GridConfig& grid_config, const BacktestSettings& settings);

    // Load historical data according to settings (csv/json bars or csv ticks)
    void loadData(const std::string& file_path);
    void setCandles(std::vector<Candle> candles) { candles_ = std::move(candles); }
    void setTicks(std::vector<Tick> ticks) { ticks_ = std::move(ticks); }

    // Run the backtest simulation (once)
    void run();

    struct Result {
        int steps_processed = 0;
        int total_trades = 0;
        int buy_trades = 0;
        int sell_trades = 0;
        int buy_orders_sent = 0;
        int sell_orders_sent = 0;
        int cancelled_orders = 0;
        int sleep_cycles = 0;
        double traded_volume = 0.0;
        double turnover = 0.0;
        double total_fees = 0.0;
        double final_position = 0.0;
        double final_cash = 0.0;
        double final_equity = 0.0;
        double max_drawdown = 0.0;      // absolute, from peak equity
        double last_price = 0.0;
    };
    Result getResult() const { return result_; }

    const strategy::SuperGridAlgo& getAlgo() const { return *algo_; }

private:
    void processStep(double mark_price);
    void drainGateway();
    void markToMarket(double price);

    BacktestSettings settings_;
    std::vector<Candle> candles_;
    std::vector<Tick> ticks_;

    execution::BacktestGateway gateway_;
    std::unique_ptr<core::GridStateJournalJsonl> journal_;
    std::unique_ptr<strategy::SuperGridAlgo> algo_;

    // Account State
    double cash_ = 0.0;
    double position_ = 0.0;
    double peak_equity_ = 0.0;
    bool has_run_ = false;

    Result result_;
};

} // namespace backtest
} // namespace supergrid

#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "core/state/GridStateJournalJsonl.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

using namespace supergrid;
using namespace supergrid::backtest;

namespace {
bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

strategy::GridConfig limitConfig() {
    strategy::GridConfig config;
    config.lower_price = 40000.0;
    config.upper_price = 60000.0;
    config.trigger_price = 47000.0;
    config.rise_percent = 1.0;
    config.fall_percent = 1.0;
    config.fall_down = 0.0;
    config.rise_up = 0.0;
    config.order_volume = 0.1;
    config.multiple_order = false;
    config.order_type = OrderType::LIMIT;
    return config;
}
} // namespace

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "supergrid_test_backtest";
    std::filesystem::create_directories(dir);

    // 1. Bar replay: one sell/buy cycle, a sleep episode, fees and cash accounting
    {
        const auto journal_path = dir / "grid_state.jsonl";
        std::error_code ec;
        std::filesystem::remove(journal_path, ec);

        BacktestSettings settings;
        settings.fee_rate = 0.001;
        settings.journal_path = journal_path.string();

        BacktestEngine engine(limitConfig(), settings);
        engine.setCandles({
            Candle(47000.0, 47050.0, 46950.0, 47000.0, 1.0, 1),
            Candle(47000.0, 47500.0, 46990.0, 47470.0, 1.0, 2),   // sell 0.1 @ 47470 limit
            Candle(47480.0, 47600.0, 47400.0, 47500.0, 1.0, 3),   // filled at open 47480
            Candle(47500.0, 47500.0, 46900.0, 46950.0, 1.0, 4),   // buy 0.1 @ 46950 limit
            Candle(46940.0, 47000.0, 46900.0, 46980.0, 1.0, 5),   // filled at open 46940
            Candle(46980.0, 47000.0, 38000.0, 39000.0, 1.0, 6),   // below corridor
            Candle(39000.0, 47100.0, 39000.0, 47050.0, 1.0, 7),   // back inside
        });
        engine.run();

        const auto r = engine.getResult();
        assert(r.steps_processed == 7);
        assert(r.total_trades == 2);
        assert(r.buy_trades == 1);
        assert(r.sell_trades == 1);
        assert(r.buy_orders_sent == 1);
        assert(r.sell_orders_sent == 1);
        assert(r.cancelled_orders == 0);
        assert(r.sleep_cycles == 1);
        assert(near(r.traded_volume, 0.2));
        assert(near(r.turnover, 9442.0));
        assert(near(r.total_fees, 9.442));
        assert(near(r.final_position, 0.0));
        assert(near(r.final_cash, 44.558));
        assert(near(r.final_equity, 44.558));
        assert(near(r.last_price, 47050.0));
        assert(r.max_drawdown >= 0.0);

        const auto& state = engine.getAlgo().getState();
        assert(!engine.getAlgo().isActive());
        assert(!state.grid_sleep);
        assert(!state.pending_order_id);
        assert(near(state.trigger_price, 46940.0));

        // second run is refused
        engine.run();
        assert(engine.getResult().steps_processed == 7);

        core::GridStateJournalJsonl journal(journal_path);
        assert(journal.lastSeq() > 0);
        const auto rows = journal.readFrom(journal.lastSeq());
        assert(rows.size() == 1);
        assert(near(rows.front().position, 0.0));
        assert(near(rows.front().trigger_price, 46940.0));
    }

    // 2. Unfilled order left at the end is cancelled by stop()
    {
        BacktestSettings settings;
        settings.fee_rate = 0.0;
        BacktestEngine engine(limitConfig(), settings);
        engine.setCandles({
            Candle(47000.0, 47050.0, 46950.0, 47000.0, 1.0, 1),
            Candle(47000.0, 47500.0, 46990.0, 47470.0, 1.0, 2),
        });
        engine.run();
        const auto r = engine.getResult();
        assert(r.sell_orders_sent == 1);
        assert(r.total_trades == 0);
        assert(r.cancelled_orders == 1);
        assert(!engine.getAlgo().getState().pending_order_id);
    }

    // 3. Tick replay from CSV with an initial position
    {
        const auto tick_path = dir / "ticks.csv";
        {
            std::ofstream out(tick_path, std::ios::binary | std::ios::trunc);
            out << "timestamp,last,bid,ask\n"
                << "3,47480,47475,47485\n"
                << "1,47000,46995,47005\n"
                << "2,47470,47465,47475\n";
        }

        BacktestSettings settings;
        settings.mode = ReplayMode::TICK;
        settings.fee_rate = 0.0;
        settings.initial_position = 1.0;

        BacktestEngine engine(limitConfig(), settings);
        engine.loadData(tick_path.string());
        engine.run();

        const auto r = engine.getResult();
        assert(r.steps_processed == 3);
        assert(r.total_trades == 1);
        assert(r.sell_trades == 1);
        assert(near(r.final_position, 0.9));
        assert(near(r.final_cash, 4747.5));
        assert(near(engine.getAlgo().getState().position, 0.9));
    }

    // 4. Bar CSV loading skips the header and bad rows, sorts by time
    {
        const auto bar_path = dir / "bars.csv";
        {
            std::ofstream out(bar_path, std::ios::binary | std::ios::trunc);
            out << "timestamp,open,high,low,close,volume\n"
                << "2000,2,3,1,2.5,10\n"
                << "1000,1,2,0.5,1.5,5\n"
                << "3000,x,3,1,2,1\n"
                << "4000,1,2\n";
        }
        const auto candles = DataHistory::loadCSV(bar_path.string());
        assert(candles.size() == 2);
        assert(candles[0].timestamp == 1000);
        assert(candles[1].timestamp == 2000);
        assert(candles[1].close == 2.5);

        assert(DataHistory::loadCSV((dir / "missing.csv").string()).empty());
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    std::cout << "[TEST] BacktestEngine PASSED\n";
    return 0;
}

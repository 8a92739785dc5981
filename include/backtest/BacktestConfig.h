#pragma once

#include <string>

namespace supergrid {
namespace backtest {

enum class ReplayMode {
    BAR,            // 봉 마감가 기준 (bid = ask = close)
    TICK            // 틱 기준 (timestamp,last,bid,ask)
};

struct BacktestSettings {
    std::string data_path;
    std::string data_format = "csv";    // csv | json (bar mode only)
    ReplayMode mode = ReplayMode::BAR;
    double fee_rate = 0.0005;           // per side, on notional
    double initial_position = 0.0;
    double initial_cash = 0.0;
    std::string journal_path;           // empty = no state journal
};

} // namespace backtest
} // namespace supergrid

#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace supergrid {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON array (long or short keys: open/o, close/c, ...)
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Load ticks from a CSV file
    // Expected format: timestamp,last,bid,ask
    static std::vector<Tick> loadTickCSV(const std::string& file_path);
};

} // namespace backtest
} // namespace supergrid

#pragma once

#include "common/Types.h"

namespace supergrid {
namespace market {

// Normalized price view consumed by the grid. Bar mode sets bid = ask = last.
struct MarketSnapshot {
    double last_price = 0.0;
    double bid_price = 0.0;
    double ask_price = 0.0;
};

class SnapshotAdapter {
public:
    static MarketSnapshot fromTick(const Tick& tick);
    static MarketSnapshot fromCandle(const Candle& candle);
};

} // namespace market
} // namespace supergrid

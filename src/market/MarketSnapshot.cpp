#include "market/MarketSnapshot.h"

namespace supergrid {
namespace market {

MarketSnapshot SnapshotAdapter::fromTick(const Tick& tick) {
    MarketSnapshot snapshot;
    snapshot.last_price = tick.last_price;
    snapshot.bid_price = tick.bid_price_1;
    snapshot.ask_price = tick.ask_price_1;
    return snapshot;
}

MarketSnapshot SnapshotAdapter::fromCandle(const Candle& candle) {
    MarketSnapshot snapshot;
    snapshot.last_price = candle.close;
    snapshot.bid_price = candle.close;
    snapshot.ask_price = candle.close;
    return snapshot;
}

} // namespace market
} // namespace supergrid

#include "strategy/OrderSizer.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace supergrid;
using namespace supergrid::strategy;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

GridConfig baseConfig() {
    GridConfig config;
    config.trigger_price = 47000.0;
    config.rise_percent = 1.0;
    config.fall_percent = 1.0;
    config.order_volume = 0.1;
    config.multiple_order = false;
    config.order_type = OrderType::LIMIT;
    return config;
}
} // namespace

int main() {
    GridConfig config = baseConfig();
    GridState state = GridState::fromConfig(config);

    // Percent helpers
    {
        assert(near(OrderSizer::risePct(47000.0, 47470.0), 1.0));
        assert(near(OrderSizer::fallPct(47000.0, 46530.0), 1.0));
        assert(OrderSizer::risePct(0.0, 100.0) == 0.0);
        assert(OrderSizer::fallPct(-1.0, 100.0) == 0.0);
    }

    // Price source: LIMIT = last -/+ offset, MARKET = bid / ask
    {
        config.sell_offset = 10.0;
        config.buy_offset = 5.0;
        auto sell = OrderSizer::sizeSell(config, state, 48000.0, 47990.0);
        assert(near(sell.price, 47990.0));
        auto buy = OrderSizer::sizeBuy(config, state, 45500.0, 45510.0);
        assert(near(buy.price, 45505.0));

        config.order_type = OrderType::MARKET;
        sell = OrderSizer::sizeSell(config, state, 48000.0, 47985.0);
        assert(near(sell.price, 47985.0));
        buy = OrderSizer::sizeBuy(config, state, 45500.0, 45520.0);
        assert(near(buy.price, 45520.0));
        assert(near(sell.volume, 0.1));
        assert(near(buy.volume, 0.1));
    }

    // Multiple: sell rounds down, buy rounds up
    {
        config = baseConfig();
        config.multiple_order = true;

        // rise 2.13% -> x2
        auto sell = OrderSizer::sizeSell(config, state, 48000.0, 48000.0);
        assert(near(sell.volume, 0.2));
        assert(near(sell.move_pct, 2.127659574468085));

        // fall 3.19% -> x4
        auto buy = OrderSizer::sizeBuy(config, state, 45500.0, 45500.0);
        assert(near(buy.volume, 0.4));

        // below one threshold still sizes at least one unit
        sell = OrderSizer::sizeSell(config, state, 47100.0, 47100.0);
        assert(near(sell.volume, 0.1));

        // zero threshold means multiple of one
        config.rise_percent = 0.0;
        config.fall_percent = 0.0;
        sell = OrderSizer::sizeSell(config, state, 48000.0, 48000.0);
        assert(near(sell.volume, 0.1));
        buy = OrderSizer::sizeBuy(config, state, 45500.0, 45500.0);
        assert(near(buy.volume, 0.1));
    }

    // order_amount overrides order_volume: price / order_amount
    {
        config = baseConfig();
        config.order_amount = 1000.0;
        auto sell = OrderSizer::sizeSell(config, state, 48000.0, 48000.0);
        assert(near(sell.volume, 48.0));
        auto buy = OrderSizer::sizeBuy(config, state, 46000.0, 46000.0);
        assert(near(buy.volume, 46.0));
    }

    // min_position clamp on sells
    {
        config = baseConfig();
        config.min_position = 1.0;
        GridState held = state;

        held.position = 1.05;
        auto sell = OrderSizer::sizeSell(config, held, 48000.0, 48000.0);
        assert(near(sell.volume, 0.05));

        held.position = 0.9;
        sell = OrderSizer::sizeSell(config, held, 48000.0, 48000.0);
        assert(sell.volume == 0.0);

        held.position = 5.0;
        sell = OrderSizer::sizeSell(config, held, 48000.0, 48000.0);
        assert(near(sell.volume, 0.1));
    }

    // max_position clamp on buys
    {
        config = baseConfig();
        config.max_position = 1.0;
        GridState held = state;

        held.position = 0.95;
        auto buy = OrderSizer::sizeBuy(config, held, 46000.0, 46000.0);
        assert(near(buy.volume, 0.05));

        held.position = 1.2;
        buy = OrderSizer::sizeBuy(config, held, 46000.0, 46000.0);
        assert(buy.volume == 0.0);
    }

    // Clamped volumes never cross the position limits
    {
        config = baseConfig();
        config.multiple_order = true;
        config.min_position = 0.5;
        config.max_position = 2.0;
        for (int i = 0; i <= 30; ++i) {
            GridState held = state;
            held.position = 0.1 * i;

            const auto sell = OrderSizer::sizeSell(config, held, 49000.0, 49000.0);
            assert(sell.volume >= 0.0);
            if (sell.volume > 0.0) {
                assert(held.position - sell.volume >= config.min_position - 1e-9);
            }

            const auto buy = OrderSizer::sizeBuy(config, held, 44000.0, 44000.0);
            assert(buy.volume >= 0.0);
            if (buy.volume > 0.0) {
                assert(held.position + buy.volume <= config.max_position + 1e-9);
            }
        }
    }

    // give_up_bias: only 0 < move < bias passes
    {
        config = baseConfig();
        config.give_up_bias = 0.5;

        assert(OrderSizer::sizeSell(config, state, 48000.0, 48000.0).suppressed);
        assert(!OrderSizer::sizeSell(config, state, 47100.0, 47100.0).suppressed);
        assert(OrderSizer::sizeSell(config, state, 46900.0, 46900.0).suppressed);

        assert(!OrderSizer::sizeBuy(config, state, 46900.0, 46900.0).suppressed);
        assert(OrderSizer::sizeBuy(config, state, 46000.0, 46000.0).suppressed);
        assert(OrderSizer::sizeBuy(config, state, 47000.0, 47000.0).suppressed);

        config.give_up_bias = 0.0;
        assert(!OrderSizer::sizeSell(config, state, 48000.0, 48000.0).suppressed);
        assert(!OrderSizer::sizeSell(config, state, 46900.0, 46900.0).suppressed);
    }

    std::cout << "[TEST] OrderSizer PASSED\n";
    return 0;
}

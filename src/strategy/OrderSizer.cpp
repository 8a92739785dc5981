#include "strategy/OrderSizer.h"

#include <algorithm>
#include <cmath>

namespace supergrid {
namespace strategy {

namespace {
// 기본 수량: order_amount 가 설정되면 금액 기준 수량 우선
// NOTE: price / order_amount, kept as the grid has always computed it.
double baseVolume(const GridConfig& config, double price) {
    if (config.order_amount > 0.0) {
        return price / config.order_amount;
    }
    return config.order_volume;
}

bool passesBias(const GridConfig& config, double bias) {
    if (config.give_up_bias <= 0.0) {
        return true;
    }
    return bias > 0.0 && bias < config.give_up_bias;
}
} // namespace

double OrderSizer::risePct(double trigger_price, double last_price) {
    if (trigger_price <= 0.0) {
        return 0.0;
    }
    return (last_price - trigger_price) / trigger_price * 100.0;
}

double OrderSizer::fallPct(double trigger_price, double last_price) {
    if (trigger_price <= 0.0) {
        return 0.0;
    }
    return (trigger_price - last_price) / trigger_price * 100.0;
}

OrderSizing OrderSizer::sizeSell(
    const GridConfig& config,
    const GridState& state,
    double last_price,
    double bid_price)
{
    OrderSizing sizing;

    // 기본은 시장가(매수1호가), 지정가면 최신가 - 오프셋
    sizing.price = bid_price;
    if (config.order_type == OrderType::LIMIT) {
        sizing.price = last_price - config.sell_offset;
    }

    double volume = baseVolume(config, sizing.price);
    sizing.move_pct = risePct(state.trigger_price, last_price);

    // 상승폭 배수만큼 수량 확대 (내림)
    if (config.multiple_order) {
        double multiple = 1.0;
        if (config.rise_percent > 0.0) {
            multiple = sizing.move_pct / config.rise_percent;
            multiple = (multiple < 1.0) ? 1.0 : std::floor(multiple);
        }
        volume *= multiple;
    }

    // 최소 보유 수량 아래로는 팔지 않음
    if (config.min_position > 0.0) {
        if (state.position > config.min_position) {
            volume = std::min(volume, state.position - config.min_position);
        } else {
            volume = 0.0;
        }
    }

    sizing.volume = std::max(0.0, volume);
    sizing.suppressed = !passesBias(config, sizing.move_pct);
    return sizing;
}

OrderSizing OrderSizer::sizeBuy(
    const GridConfig& config,
    const GridState& state,
    double last_price,
    double ask_price)
{
    OrderSizing sizing;

    // 기본은 시장가(매도1호가), 지정가면 최신가 + 오프셋
    sizing.price = ask_price;
    if (config.order_type == OrderType::LIMIT) {
        sizing.price = last_price + config.buy_offset;
    }

    double volume = baseVolume(config, sizing.price);
    sizing.move_pct = fallPct(state.trigger_price, last_price);

    // 하락폭 배수만큼 수량 확대 (올림)
    if (config.multiple_order) {
        double multiple = 1.0;
        if (config.fall_percent > 0.0) {
            multiple = sizing.move_pct / config.fall_percent;
            multiple = (multiple < 1.0) ? 1.0 : std::ceil(multiple);
        }
        volume *= multiple;
    }

    // 최대 보유 수량 초과 금지
    if (config.max_position > 0.0) {
        volume = std::min(volume, std::max(0.0, config.max_position - state.position));
    }

    sizing.volume = std::max(0.0, volume);
    sizing.suppressed = !passesBias(config, sizing.move_pct);
    return sizing;
}

} // namespace strategy
} // namespace supergrid

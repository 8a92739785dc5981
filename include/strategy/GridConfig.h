#pragma once

#include <stdexcept>
#include <string>

#include "common/Types.h"

namespace supergrid {
namespace strategy {

class GridConfigError : public std::invalid_argument {
public:
    explicit GridConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// 슈퍼 그리드 파라미터 (생성 후 불변)
struct GridConfig {
    std::string vt_symbol = "BTCUSDT.BINANCE";

    // 그리드 상/하단
    double lower_price = 40000.0;
    double upper_price = 60000.0;
    double trigger_price = 47000.0;     // 최초 기준가

    // 히스테리시스 (%)
    double rise_percent = 1.0;          // 상승 무장 임계값
    double fall_down = 0.0;             // 고점 대비 회락 → 매도
    double fall_percent = 1.0;          // 하락 무장 임계값
    double rise_up = 0.0;               // 저점 대비 반등 → 매수

    OrderType order_type = OrderType::LIMIT;
    double order_volume = 0.1;          // 고정 수량
    double order_amount = 0.0;          // 금액 기준 수량 (0 = 미사용)
    double max_position = 0.0;          // 0 = 미사용
    double min_position = 0.0;          // 0 = 미사용
    bool multiple_order = true;

    std::string deadline = "GTC";       // reserved, not consulted by the grid logic
    double give_up_bias = 0.0;          // 0 = 미사용
    double buy_offset = 0.0;
    double sell_offset = 0.0;

    // Throws GridConfigError describing the first violated constraint.
    void validate() const;
};

OrderType orderTypeFromString(const std::string& value);

} // namespace strategy
} // namespace supergrid

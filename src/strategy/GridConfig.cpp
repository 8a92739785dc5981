#include "strategy/GridConfig.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

namespace supergrid {
namespace strategy {

namespace {
void requireFinite(const char* name, double value) {
    if (!std::isfinite(value)) {
        throw GridConfigError(std::string(name) + " must be a finite number");
    }
}

void requireNonNegative(const char* name, double value) {
    if (value < 0.0) {
        std::ostringstream oss;
        oss << name << " must not be negative (got " << value << ")";
        throw GridConfigError(oss.str());
    }
}
} // namespace

void GridConfig::validate() const {
    const std::pair<const char*, double> numeric_fields[] = {
        {"lower_price", lower_price},
        {"upper_price", upper_price},
        {"trigger_price", trigger_price},
        {"rise_percent", rise_percent},
        {"fall_down", fall_down},
        {"fall_percent", fall_percent},
        {"rise_up", rise_up},
        {"order_volume", order_volume},
        {"order_amount", order_amount},
        {"max_position", max_position},
        {"min_position", min_position},
        {"give_up_bias", give_up_bias},
        {"buy_offset", buy_offset},
        {"sell_offset", sell_offset},
    };
    for (const auto& field : numeric_fields) {
        requireFinite(field.first, field.second);
    }

    if (lower_price > upper_price) {
        std::ostringstream oss;
        oss << "lower_price " << lower_price << " is above upper_price " << upper_price;
        throw GridConfigError(oss.str());
    }

    if (trigger_price < lower_price || trigger_price > upper_price) {
        std::ostringstream oss;
        oss << "trigger_price " << trigger_price << " outside corridor ["
            << lower_price << ", " << upper_price << "]";
        throw GridConfigError(oss.str());
    }

    requireNonNegative("rise_percent", rise_percent);
    requireNonNegative("fall_down", fall_down);
    requireNonNegative("fall_percent", fall_percent);
    requireNonNegative("rise_up", rise_up);
    requireNonNegative("give_up_bias", give_up_bias);

    requireNonNegative("order_volume", order_volume);
    requireNonNegative("order_amount", order_amount);
    requireNonNegative("max_position", max_position);
    requireNonNegative("min_position", min_position);
}

OrderType orderTypeFromString(const std::string& value) {
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "LIMIT") {
        return OrderType::LIMIT;
    }
    if (upper == "MARKET") {
        return OrderType::MARKET;
    }
    throw GridConfigError("unknown order_type: " + value);
}

} // namespace strategy
} // namespace supergrid

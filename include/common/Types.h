#pragma once

#include <string>

namespace supergrid {

using Price = double;
using Volume = double;

enum class OrderSide { BUY, SELL };
enum class OrderType { LIMIT, MARKET };
enum class Offset { NONE, OPEN, CLOSE };
enum class OrderStatus { PENDING, SUBMITTED, FILLED, PARTIALLY_FILLED, CANCELLED, REJECTED };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// 호가 1단계까지만 사용
struct Tick {
    std::string symbol;
    double last_price;
    double bid_price_1;
    double ask_price_1;
    long long timestamp;

    Tick() : last_price(0), bid_price_1(0), ask_price_1(0), timestamp(0) {}

    Tick(double last, double bid, double ask, long long t)
        : last_price(last), bid_price_1(bid), ask_price_1(ask), timestamp(t) {}
};

inline const char* orderSideToString(OrderSide side) {
    return (side == OrderSide::BUY) ? "BUY" : "SELL";
}

inline const char* orderTypeToString(OrderType type) {
    return (type == OrderType::LIMIT) ? "LIMIT" : "MARKET";
}

inline const char* offsetToString(Offset offset) {
    switch (offset) {
        case Offset::NONE: return "NONE";
        case Offset::OPEN: return "OPEN";
        case Offset::CLOSE: return "CLOSE";
    }
    return "NONE";
}

inline const char* orderStatusToString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

inline bool isTerminalStatus(OrderStatus status) {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELLED ||
           status == OrderStatus::REJECTED;
}

} // namespace supergrid

#pragma once

#include <string>

namespace ladder {

// Epoch milliseconds
using TimestampMs = long long;
using Price = double;
using Volume = double;
using Amount = double;

enum class OrderSide { BUY, SELL };

inline const char* orderSideToString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    TimestampMs timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, TimestampMs t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}

    // Close-only bar (high/low collapse onto the close)
    static Candle fromClose(double c, TimestampMs t) {
        return Candle(c, c, c, c, 0.0, t);
    }
};

} // namespace ladder

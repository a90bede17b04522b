#pragma once

#include <string>
#include <vector>

namespace quantbench {

enum class TradeDirection { LONG, SHORT };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;    // ms since epoch

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

constexpr long long MS_PER_MINUTE = 60LL * 1000LL;
constexpr long long MS_PER_DAY = 24LL * 60LL * MS_PER_MINUTE;

inline const char* toString(TradeDirection direction) {
    return direction == TradeDirection::LONG ? "LONG" : "SHORT";
}

// +1 for LONG, -1 for SHORT
inline double directionSign(TradeDirection direction) {
    return direction == TradeDirection::LONG ? 1.0 : -1.0;
}

} // namespace quantbench

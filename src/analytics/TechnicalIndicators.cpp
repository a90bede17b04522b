#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quantbench {
namespace analytics {

namespace {
double trueRange(const Candle& current, double prev_close) {
    double tr1 = current.high - current.low;
    double tr2 = std::abs(current.high - prev_close);
    double tr3 = std::abs(current.low - prev_close);
    return std::max({tr1, tr2, tr3});
}
}

double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }

    // Initial ATR is the mean of the first `period` true ranges
    double atr = 0.0;
    for (int i = 1; i <= period; ++i) {
        atr += trueRange(candles[i], candles[i - 1].close);
    }
    atr /= period;

    // Wilder smoothing to the end
    for (size_t i = static_cast<size_t>(period) + 1; i < candles.size(); ++i) {
        atr = ((atr * (period - 1)) + trueRange(candles[i], candles[i - 1].close)) / period;
    }

    return atr;
}

std::vector<double> TechnicalIndicators::calculateSMASeries(const std::vector<double>& prices, int period) {
    std::vector<double> out(prices.size(), 0.0);
    if (period <= 0) return out;

    double window = 0.0;
    for (size_t i = 0; i < prices.size(); ++i) {
        window += prices[i];
        if (i >= static_cast<size_t>(period)) {
            window -= prices[i - period];
        }
        if (i + 1 >= static_cast<size_t>(period)) {
            out[i] = window / period;
        }
    }
    return out;
}

AtrTracker::AtrTracker(int period)
    : period_(period)
{
    if (period_ <= 0) {
        throw std::invalid_argument("ATR period must be positive");
    }
}

void AtrTracker::update(const Candle& candle) {
    if (!has_prev_) {
        has_prev_ = true;
        prev_close_ = candle.close;
        return;
    }

    const double tr = trueRange(candle, prev_close_);
    prev_close_ = candle.close;
    ++tr_count_;

    if (tr_count_ < period_) {
        tr_sum_ += tr;
    } else if (tr_count_ == period_) {
        tr_sum_ += tr;
        atr_ = tr_sum_ / period_;
    } else {
        atr_ = ((atr_ * (period_ - 1)) + tr) / period_;
    }
}

} // namespace analytics
} // namespace quantbench

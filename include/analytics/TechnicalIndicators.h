#pragma once

#include <vector>
#include "common/Types.h"

namespace quantbench {
namespace analytics {

class TechnicalIndicators {
public:
    // ATR (Average True Range), Wilder smoothing. 0 when fewer than period + 1 candles.
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    // Rolling SMA aligned with prices; entries before the first full window are 0
    static std::vector<double> calculateSMASeries(const std::vector<double>& prices, int period);
};

// Incremental Wilder ATR, fed one candle at a time.
// value() matches calculateATR over the candles seen so far.
class AtrTracker {
public:
    explicit AtrTracker(int period = 14);

    void update(const Candle& candle);
    bool ready() const { return tr_count_ >= period_; }
    double value() const { return ready() ? atr_ : 0.0; }
    int period() const { return period_; }

private:
    int period_;
    bool has_prev_ = false;
    double prev_close_ = 0.0;
    int tr_count_ = 0;
    double tr_sum_ = 0.0;
    double atr_ = 0.0;
};

} // namespace analytics
} // namespace quantbench

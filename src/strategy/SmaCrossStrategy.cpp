#include "strategy/SmaCrossStrategy.h"
#include "analytics/TechnicalIndicators.h"

#include <stdexcept>

namespace quantbench {
namespace strategy {

namespace {
// +1 fast above slow, -1 below, 0 when undefined or equal
int crossState(const std::vector<double>& fast, const std::vector<double>& slow, size_t idx) {
    if (idx >= fast.size() || idx >= slow.size()) return 0;
    if (fast[idx] <= 0.0 || slow[idx] <= 0.0) return 0;
    if (fast[idx] > slow[idx]) return 1;
    if (fast[idx] < slow[idx]) return -1;
    return 0;
}
}

SmaCrossStrategy::SmaCrossStrategy()
    : fast_period_(10)
    , slow_period_(30)
    , allow_short_signals_(true)
{}

StrategyInfo SmaCrossStrategy::getInfo() const {
    StrategyInfo info;
    info.id = ID;
    info.name = "SMA Crossover";
    info.min_candles_required = slow_period_ + 1;

    ParameterSpec fast;
    fast.name = "fast_period";
    fast.type = ParameterType::INTEGER;
    fast.default_value = 10.0;
    fast.min = 1.0;
    fast.max = 500.0;
    fast.description = "Fast SMA period";

    ParameterSpec slow;
    slow.name = "slow_period";
    slow.type = ParameterType::INTEGER;
    slow.default_value = 30.0;
    slow.min = 2.0;
    slow.max = 1000.0;
    slow.description = "Slow SMA period";

    ParameterSpec shorts;
    shorts.name = "allow_short_signals";
    shorts.type = ParameterType::BOOLEAN;
    shorts.default_value = true;
    shorts.description = "Emit SHORT entries on downward crosses";

    info.parameters = {fast, slow, shorts};
    return info;
}

void SmaCrossStrategy::initialize(const StrategyParameters& params) {
    const auto resolved = params.resolve(getInfo().parameters);
    const int fast = resolved.getInt("fast_period");
    const int slow = resolved.getInt("slow_period");
    if (fast >= slow) {
        throw std::invalid_argument("fast_period must be smaller than slow_period");
    }
    fast_period_ = fast;
    slow_period_ = slow;
    allow_short_signals_ = resolved.getBool("allow_short_signals");
}

IndicatorResult SmaCrossStrategy::populateIndicators(const std::vector<Candle>& candles) {
    // Only the tail matters for a crossover; avoid recomputing the whole history each candle
    const size_t window = static_cast<size_t>(slow_period_) + 1;
    const size_t start = candles.size() > window ? candles.size() - window : 0;

    std::vector<double> closes;
    closes.reserve(candles.size() - start);
    for (size_t i = start; i < candles.size(); ++i) {
        closes.push_back(candles[i].close);
    }

    IndicatorResult result;
    result.series["sma_fast"] = analytics::TechnicalIndicators::calculateSMASeries(closes, fast_period_);
    result.series["sma_slow"] = analytics::TechnicalIndicators::calculateSMASeries(closes, slow_period_);
    return result;
}

Signal SmaCrossStrategy::populateEntrySignal(
    const std::vector<Candle>& candles,
    const IndicatorResult& indicators,
    double current_price
) {
    const auto& fast = indicators.series.at("sma_fast");
    const auto& slow = indicators.series.at("sma_slow");
    if (fast.size() < 2) return Signal();

    const size_t last = fast.size() - 1;
    const int prev = crossState(fast, slow, last - 1);
    const int now = crossState(fast, slow, last);

    Signal signal;
    if (prev < 0 && now > 0) {
        signal = Signal(SignalType::LONG, current_price, "fast SMA crossed above slow SMA");
    } else if (prev > 0 && now < 0 && allow_short_signals_) {
        signal = Signal(SignalType::SHORT, current_price, "fast SMA crossed below slow SMA");
    }
    if (!signal.isNone() && !candles.empty()) {
        signal.timestamp = candles.back().timestamp;
    }
    return signal;
}

Signal SmaCrossStrategy::populateExitSignal(
    const std::vector<Candle>& candles,
    const IndicatorResult& indicators,
    const PositionSnapshot& position
) {
    const auto& fast = indicators.series.at("sma_fast");
    const auto& slow = indicators.series.at("sma_slow");
    if (fast.empty() || candles.empty()) return Signal();

    const int now = crossState(fast, slow, fast.size() - 1);
    const double price = candles.back().close;
    if (position.direction == TradeDirection::LONG && now < 0) {
        return Signal(SignalType::EXIT_LONG, price, "fast SMA below slow SMA");
    }
    if (position.direction == TradeDirection::SHORT && now > 0) {
        return Signal(SignalType::EXIT_SHORT, price, "fast SMA above slow SMA");
    }
    return Signal();
}

} // namespace strategy
} // namespace quantbench

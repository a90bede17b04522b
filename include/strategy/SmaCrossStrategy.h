#pragma once

#include "strategy/IStrategy.h"

namespace quantbench {
namespace strategy {

// Fast/slow SMA crossover. LONG on an upward cross, SHORT on a downward
// cross, exit when the averages cross back against the position.
class SmaCrossStrategy : public IStrategy {
public:
    static constexpr const char* ID = "sma_cross";

    SmaCrossStrategy();

    StrategyInfo getInfo() const override;
    void initialize(const StrategyParameters& params) override;

    IndicatorResult populateIndicators(const std::vector<Candle>& candles) override;

    Signal populateEntrySignal(
        const std::vector<Candle>& candles,
        const IndicatorResult& indicators,
        double current_price
    ) override;

    Signal populateExitSignal(
        const std::vector<Candle>& candles,
        const IndicatorResult& indicators,
        const PositionSnapshot& position
    ) override;

private:
    int fast_period_;
    int slow_period_;
    bool allow_short_signals_;
};

} // namespace strategy
} // namespace quantbench

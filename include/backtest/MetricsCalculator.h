#pragma once

#include "backtest/BacktestTypes.h"
#include <vector>

namespace quantbench {
namespace backtest {

// Performance statistics from a finalized trade list and the equity curve.
// Wins are trades with net PnL > 0, everything else counts as a loss.
class MetricsCalculator {
public:
    static BacktestMetrics calculate(
        const std::vector<Trade>& trades,
        const std::vector<EquityPoint>& equity_curve,
        double initial_balance
    );

    // 0 when both sides are zero, +inf when only losses are zero
    static double profitFactor(double gross_profit, double gross_loss);

    // Candle-to-candle equity returns (fractions)
    static std::vector<double> equityReturns(const std::vector<EquityPoint>& equity_curve);

    // mean / sample stdev of the non-zero returns, scaled by sqrt(252)
    static double sharpeRatio(const std::vector<double>& returns);

    // mean / downside deviation of the non-zero returns, scaled by sqrt(252)
    static double sortinoRatio(const std::vector<double>& returns);

    // Historical 95% VaR and expected shortfall, as positive loss percentages
    static double valueAtRisk95(const std::vector<double>& returns);
    static double expectedShortfall95(const std::vector<double>& returns);

    static double sampleStdDev(const std::vector<double>& values);

private:
    static void fillTradeStats(BacktestMetrics& m, const std::vector<Trade>& trades, double initial_balance);
    static void fillEquityStats(BacktestMetrics& m, const std::vector<EquityPoint>& equity_curve, double initial_balance);
};

} // namespace backtest
} // namespace quantbench

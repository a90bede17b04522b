#pragma once

#include "backtest/BacktestTypes.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace quantbench {
namespace backtest {

struct MonteCarloConfig {
    int iterations = 1000;
    double ruin_threshold = 0.5;        // fraction of initial equity lost
    double initial_equity = 10000.0;
    std::optional<std::uint32_t> seed;
};

struct PercentileBands {
    double p5 = 0.0;
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double p95 = 0.0;
};

struct MonteCarloResult {
    int iterations = 0;
    std::vector<double> final_equities;
    std::vector<double> max_drawdowns;      // % per path
    PercentileBands percentiles;
    double ruin_probability = 0.0;
    double profit_probability = 0.0;
    double avg_final_equity = 0.0;
    double std_final_equity = 0.0;
    double avg_max_drawdown = 0.0;
    double worst_case = 0.0;
    double best_case = 0.0;
};

// Mulberry32. Same seed, same sequence on every platform.
class Mulberry32 {
public:
    explicit Mulberry32(std::uint32_t seed) : state_(seed) {}

    std::uint32_t nextU32();
    double nextDouble();    // [0, 1)

private:
    std::uint32_t state_;
};

// Reshuffles realized trade PnL to estimate the spread of outcomes.
// Degenerate input (no trades, no iterations) yields a neutral result
// with every equity figure equal to the initial equity.
class MonteCarloSimulator {
public:
    explicit MonteCarloSimulator(MonteCarloConfig config = MonteCarloConfig());

    MonteCarloResult simulate(const std::vector<Trade>& trades);
    MonteCarloResult simulate(const std::vector<double>& pnl_values);

    // One result per PnL scaling factor
    std::vector<MonteCarloResult> simulateWithPositionSizing(
        const std::vector<Trade>& trades,
        const std::vector<double>& multipliers
    );

    // Fraction of shuffled paths that reach +target_profit_percent before
    // falling to -max_loss_percent
    double calculateTargetProbability(
        const std::vector<Trade>& trades,
        double target_profit_percent,
        double max_loss_percent
    );

    const MonteCarloConfig& config() const { return config_; }

private:
    void reseed();
    void shuffle(std::vector<double>& values);
    MonteCarloResult emptyResult() const;
    static double percentile(const std::vector<double>& sorted, double p);

    MonteCarloConfig config_;
    Mulberry32 rng_;
    std::vector<double> buffer_;
};

// Convenience wrapper: simulate(trades) with a throwaway simulator
MonteCarloResult analyzeWithMonteCarlo(const std::vector<Trade>& trades, const MonteCarloConfig& config);

} // namespace backtest
} // namespace quantbench

#include "backtest/MonteCarloSimulator.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace quantbench {
namespace backtest {

namespace {
std::vector<double> netPnlOf(const std::vector<Trade>& trades) {
    std::vector<double> values;
    values.reserve(trades.size());
    for (const auto& t : trades) values.push_back(t.net_pnl);
    return values;
}
}

std::uint32_t Mulberry32::nextU32() {
    state_ += 0x6D2B79F5u;
    std::uint32_t t = state_;
    t = (t ^ (t >> 15)) * (t | 1u);
    t ^= t + (t ^ (t >> 7)) * (t | 61u);
    return t ^ (t >> 14);
}

double Mulberry32::nextDouble() {
    return static_cast<double>(nextU32()) / 4294967296.0;
}

MonteCarloSimulator::MonteCarloSimulator(MonteCarloConfig config)
    : config_(std::move(config))
    , rng_(0)
{
    if (config_.iterations < 0) config_.iterations = 0;
    reseed();
}

void MonteCarloSimulator::reseed() {
    if (config_.seed) {
        rng_ = Mulberry32(*config_.seed);
    } else {
        std::random_device rd;
        rng_ = Mulberry32(rd());
    }
}

void MonteCarloSimulator::shuffle(std::vector<double>& values) {
    // Fisher-Yates
    for (size_t i = values.size(); i-- > 1;) {
        const size_t j = static_cast<size_t>(std::floor(rng_.nextDouble() * static_cast<double>(i + 1)));
        std::swap(values[i], values[std::min(j, i)]);
    }
}

double MonteCarloSimulator::percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    const size_t idx = static_cast<size_t>(std::floor(p / 100.0 * static_cast<double>(sorted.size())));
    return sorted[std::min(idx, sorted.size() - 1)];
}

MonteCarloResult MonteCarloSimulator::emptyResult() const {
    MonteCarloResult result;
    const double init = config_.initial_equity;
    result.iterations = 0;
    result.percentiles.p5 = init;
    result.percentiles.p25 = init;
    result.percentiles.p50 = init;
    result.percentiles.p75 = init;
    result.percentiles.p95 = init;
    result.avg_final_equity = init;
    result.worst_case = init;
    result.best_case = init;
    return result;
}

MonteCarloResult MonteCarloSimulator::simulate(const std::vector<Trade>& trades) {
    return simulate(netPnlOf(trades));
}

MonteCarloResult MonteCarloSimulator::simulate(const std::vector<double>& pnl_values) {
    if (pnl_values.empty() || config_.iterations <= 0) {
        return emptyResult();
    }
    if (config_.seed) reseed();

    const int iterations = config_.iterations;
    const double init = config_.initial_equity;
    const double ruin_level = init * (1.0 - config_.ruin_threshold);

    MonteCarloResult result;
    result.iterations = iterations;
    result.final_equities.resize(iterations);
    result.max_drawdowns.resize(iterations);

    buffer_.resize(pnl_values.size());
    int ruined = 0;
    int profitable = 0;

    for (int it = 0; it < iterations; ++it) {
        std::copy(pnl_values.begin(), pnl_values.end(), buffer_.begin());
        shuffle(buffer_);

        double equity = init;
        double peak = init;
        double max_dd = 0.0;
        for (double pnl : buffer_) {
            equity += pnl;
            if (equity > peak) {
                peak = equity;
            }
            const double dd = (peak > 1e-12) ? (peak - equity) / peak * 100.0 : 100.0;
            max_dd = std::max(max_dd, dd);
        }

        result.final_equities[it] = equity;
        result.max_drawdowns[it] = max_dd;
        if (equity < ruin_level) ruined++;
        if (equity > init) profitable++;
    }

    std::vector<double> sorted = result.final_equities;
    std::sort(sorted.begin(), sorted.end());

    result.percentiles.p5 = percentile(sorted, 5);
    result.percentiles.p25 = percentile(sorted, 25);
    result.percentiles.p50 = percentile(sorted, 50);
    result.percentiles.p75 = percentile(sorted, 75);
    result.percentiles.p95 = percentile(sorted, 95);

    const double n = static_cast<double>(iterations);
    result.ruin_probability = ruined / n;
    result.profit_probability = profitable / n;

    double sum = 0.0;
    for (double v : sorted) sum += v;
    result.avg_final_equity = sum / n;

    double sq = 0.0;
    for (double v : sorted) sq += (v - result.avg_final_equity) * (v - result.avg_final_equity);
    result.std_final_equity = std::sqrt(sq / n);

    double dd_sum = 0.0;
    for (double v : result.max_drawdowns) dd_sum += v;
    result.avg_max_drawdown = dd_sum / n;

    result.worst_case = sorted.front();
    result.best_case = sorted.back();

    LOG_DEBUG("Monte Carlo: {} iterations, p50 {:.2f}, ruin {:.3f}", iterations, result.percentiles.p50,
              result.ruin_probability);
    return result;
}

std::vector<MonteCarloResult> MonteCarloSimulator::simulateWithPositionSizing(
    const std::vector<Trade>& trades,
    const std::vector<double>& multipliers
) {
    const auto base = netPnlOf(trades);
    std::vector<MonteCarloResult> results;
    results.reserve(multipliers.size());

    std::vector<double> scaled(base.size());
    for (double mult : multipliers) {
        for (size_t i = 0; i < base.size(); ++i) {
            scaled[i] = base[i] * mult;
        }
        results.push_back(simulate(scaled));
    }
    return results;
}

double MonteCarloSimulator::calculateTargetProbability(
    const std::vector<Trade>& trades,
    double target_profit_percent,
    double max_loss_percent
) {
    if (trades.empty() || config_.iterations <= 0) {
        return 0.0;
    }
    if (config_.seed) reseed();

    const double init = config_.initial_equity;
    const double target = init * (1.0 + target_profit_percent / 100.0);
    const double ruin = init * (1.0 - max_loss_percent / 100.0);

    const auto pnl_values = netPnlOf(trades);
    buffer_.resize(pnl_values.size());
    int reached = 0;
    for (int it = 0; it < config_.iterations; ++it) {
        std::copy(pnl_values.begin(), pnl_values.end(), buffer_.begin());
        shuffle(buffer_);

        double equity = init;
        for (double pnl : buffer_) {
            equity += pnl;
            if (equity >= target) {
                reached++;
                break;
            }
            if (equity <= ruin) {
                break;
            }
        }
    }
    return static_cast<double>(reached) / config_.iterations;
}

MonteCarloResult analyzeWithMonteCarlo(const std::vector<Trade>& trades, const MonteCarloConfig& config) {
    MonteCarloSimulator simulator(config);
    return simulator.simulate(trades);
}

} // namespace backtest
} // namespace quantbench

#include "backtest/MonteCarloSimulator.h"
#include "TestSupport.h"

#include <iostream>
#include <vector>

using quantbench::backtest::MonteCarloConfig;
using quantbench::backtest::MonteCarloResult;
using quantbench::backtest::MonteCarloSimulator;
using quantbench::backtest::Mulberry32;
using quantbench::backtest::Trade;
using quantbench::backtest::analyzeWithMonteCarlo;
using quantbench::test::near;
using quantbench::test::tradeWithPnl;

namespace {

std::vector<Trade> tradesOf(const std::vector<double>& pnls) {
    std::vector<Trade> trades;
    for (double p : pnls) trades.push_back(tradeWithPnl(p));
    return trades;
}

MonteCarloConfig seeded(int iterations = 1000) {
    MonteCarloConfig config;
    config.iterations = iterations;
    config.initial_equity = 10000.0;
    config.seed = 42u;
    return config;
}

int testMulberry32() {
    Mulberry32 a(42);
    Mulberry32 b(42);
    Mulberry32 c(43);
    bool differs = false;
    for (int i = 0; i < 100; ++i) {
        const double va = a.nextDouble();
        const double vb = b.nextDouble();
        if (va != vb || va < 0.0 || va >= 1.0) {
            std::cerr << "[TEST] same seed must give the same sequence in [0, 1)\n";
            return 1;
        }
        if (va != c.nextDouble()) differs = true;
    }
    if (!differs) {
        std::cerr << "[TEST] different seeds should diverge\n";
        return 1;
    }
    return 0;
}

int testSeededRunsAreReproducible() {
    const auto trades = tradesOf({100.0, -50.0, 200.0, -80.0, 30.0});

    MonteCarloSimulator first(seeded());
    MonteCarloSimulator second(seeded());
    const MonteCarloResult r1 = first.simulate(trades);
    const MonteCarloResult r2 = second.simulate(trades);
    const MonteCarloResult r3 = first.simulate(trades);

    if (r1.max_drawdowns != r2.max_drawdowns || r1.max_drawdowns != r3.max_drawdowns) {
        std::cerr << "[TEST] seeded simulations must be reproducible\n";
        return 1;
    }
    if (r1.percentiles.p5 != r2.percentiles.p5 || r1.percentiles.p95 != r2.percentiles.p95 ||
        r1.avg_max_drawdown != r2.avg_max_drawdown) {
        std::cerr << "[TEST] seeded percentiles differ\n";
        return 1;
    }
    if (r1.iterations != 1000 || r1.final_equities.size() != 1000) {
        std::cerr << "[TEST] expected 1000 paths\n";
        return 1;
    }
    // order does not change the sum
    if (!near(r1.percentiles.p5, 10200.0) || !near(r1.percentiles.p95, 10200.0) ||
        !near(r1.std_final_equity, 0.0)) {
        std::cerr << "[TEST] every path ends at initial + total pnl\n";
        return 1;
    }
    for (double dd : r1.max_drawdowns) {
        if (!(dd > 0.0)) {
            std::cerr << "[TEST] each path contains a loss and so a drawdown\n";
            return 1;
        }
    }
    bool varied = false;
    for (double dd : r1.max_drawdowns) {
        if (dd != r1.max_drawdowns.front()) varied = true;
    }
    if (!varied) {
        std::cerr << "[TEST] shuffling should vary the drawdown\n";
        return 1;
    }
    return 0;
}

int testProbabilities() {
    MonteCarloSimulator winners(seeded(200));
    const auto r1 = winners.simulate(tradesOf({10.0, 20.0, 30.0}));
    if (r1.ruin_probability != 0.0 || r1.profit_probability != 1.0 || r1.avg_max_drawdown != 0.0) {
        std::cerr << "[TEST] all-positive trades: no ruin, always profit\n";
        return 1;
    }

    MonteCarloSimulator losers(seeded(200));
    const auto r2 = losers.simulate(tradesOf({-3000.0, -3000.0, 500.0}));
    if (r2.ruin_probability != 1.0 || r2.profit_probability != 0.0) {
        std::cerr << "[TEST] losing 55% with threshold 50% is ruin on every path\n";
        return 1;
    }
    if (!near(r2.worst_case, 4500.0) || !near(r2.best_case, 4500.0)) {
        std::cerr << "[TEST] worst/best case wrong\n";
        return 1;
    }
    return 0;
}

int testEmptyInputIsNeutral() {
    MonteCarloSimulator simulator(seeded());
    const auto r = simulator.simulate(std::vector<Trade>());
    if (r.iterations != 0 || !r.final_equities.empty()) {
        std::cerr << "[TEST] no trades should run no paths\n";
        return 1;
    }
    if (r.percentiles.p5 != 10000.0 || r.percentiles.p95 != 10000.0 || r.avg_final_equity != 10000.0 ||
        r.worst_case != 10000.0 || r.best_case != 10000.0 || r.ruin_probability != 0.0) {
        std::cerr << "[TEST] empty result should sit at the initial equity\n";
        return 1;
    }

    auto config = seeded();
    config.iterations = 0;
    if (analyzeWithMonteCarlo(tradesOf({100.0}), config).iterations != 0) {
        std::cerr << "[TEST] zero iterations should give the neutral result\n";
        return 1;
    }
    return 0;
}

int testPositionSizingScalesPnl() {
    MonteCarloSimulator simulator(seeded(100));
    const auto results = simulator.simulateWithPositionSizing(tradesOf({100.0, -50.0, 150.0}), {0.5, 1.0, 2.0});
    if (results.size() != 3) {
        std::cerr << "[TEST] one result per multiplier\n";
        return 1;
    }
    if (!near(results[0].percentiles.p50, 10100.0) || !near(results[1].percentiles.p50, 10200.0) ||
        !near(results[2].percentiles.p50, 10400.0)) {
        std::cerr << "[TEST] scaled medians wrong\n";
        return 1;
    }
    if (!(results[2].avg_max_drawdown > results[0].avg_max_drawdown)) {
        std::cerr << "[TEST] larger size should deepen drawdowns\n";
        return 1;
    }
    return 0;
}

int testTargetProbability() {
    MonteCarloSimulator simulator(seeded(100));
    if (simulator.calculateTargetProbability(tradesOf({100.0, 100.0, 100.0, 100.0, 100.0}), 4.0, 10.0) != 1.0) {
        std::cerr << "[TEST] steady winners always reach +4%\n";
        return 1;
    }
    if (simulator.calculateTargetProbability(tradesOf({-100.0, -100.0, -100.0}), 1.0, 2.0) != 0.0) {
        std::cerr << "[TEST] steady losers never reach the target\n";
        return 1;
    }
    if (simulator.calculateTargetProbability({}, 1.0, 1.0) != 0.0) {
        std::cerr << "[TEST] no trades gives probability 0\n";
        return 1;
    }
    const double mixed = simulator.calculateTargetProbability(tradesOf({500.0, -500.0}), 4.0, 4.0);
    if (!(mixed > 0.2 && mixed < 0.8)) {
        std::cerr << "[TEST] coin-flip ordering should reach the target about half the time, got " << mixed << "\n";
        return 1;
    }
    return 0;
}

} // namespace

int main() {
    if (testMulberry32() != 0) return 1;
    if (testSeededRunsAreReproducible() != 0) return 1;
    if (testProbabilities() != 0) return 1;
    if (testEmptyInputIsNeutral() != 0) return 1;
    if (testPositionSizingScalesPnl() != 0) return 1;
    if (testTargetProbability() != 0) return 1;

    std::cout << "[TEST] MonteCarlo PASSED\n";
    return 0;
}

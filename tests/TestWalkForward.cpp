#include "backtest/WalkForwardOptimizer.h"
#include "TestSupport.h"

#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using quantbench::Candle;
using quantbench::MS_PER_DAY;
using quantbench::backtest::BacktestConfig;
using quantbench::backtest::BacktestMetrics;
using quantbench::backtest::BacktestResult;
using quantbench::backtest::IParameterOptimizer;
using quantbench::backtest::SegmentResult;
using quantbench::backtest::WalkForwardConfig;
using quantbench::backtest::WalkForwardOptimizer;
using quantbench::backtest::WalkForwardResult;
using quantbench::strategy::IStrategy;
using quantbench::strategy::StrategyFactory;
using quantbench::strategy::StrategyParameters;
using quantbench::test::ScriptedStrategy;
using quantbench::test::T0;
using quantbench::test::frictionlessConfig;
using quantbench::test::near;
using quantbench::test::waveSeries;

namespace {

std::vector<Candle> dailyCandles(size_t count) {
    return waveSeries(count, 100.0, 10.0, 25.0, T0, MS_PER_DAY);
}

// Re-enters every candle and is closed by the one-day holding limit
StrategyFactory busyFactory(int* created = nullptr) {
    return [created]() -> std::shared_ptr<IStrategy> {
        if (created) (*created)++;
        auto strategy = std::make_shared<ScriptedStrategy>(1);
        strategy->entry_every_from = 0;
        return strategy;
    };
}

BacktestConfig busyConfig() {
    auto config = frictionlessConfig();
    config.max_open_positions = 1;
    config.tactics.take_profit.max_holding_minutes = 24.0 * 60.0;
    return config;
}

class MarkingOptimizer : public IParameterOptimizer {
public:
    int calls = 0;

    StrategyParameters optimize(const std::vector<Candle>& train_candles,
                                const BacktestConfig& config,
                                const BacktestResult& train_result,
                                const StrategyFactory&) override {
        calls++;
        StrategyParameters params = config.strategy_params;
        params.set("tuned_on", static_cast<double>(train_candles.size()));
        params.set("train_trades", train_result.metrics.total_trades);
        return params;
    }
};

int testSegmentLayout() {
    WalkForwardConfig config;
    WalkForwardOptimizer optimizer(config, busyConfig(), busyFactory());
    const auto candles = dailyCandles(400);
    const auto windows = optimizer.generateSegments(candles);

    if (windows.size() != 10) {
        std::cerr << "[TEST] 400 daily candles at 90/30/30 should give 10 segments, got " << windows.size() << "\n";
        return 1;
    }
    const auto& first = windows.front();
    if (first.train_start != T0 || first.train_end != T0 + 90 * MS_PER_DAY ||
        first.test_start != T0 + 90 * MS_PER_DAY || first.test_end != T0 + 120 * MS_PER_DAY) {
        std::cerr << "[TEST] first segment bounds wrong\n";
        return 1;
    }
    if (first.train_finish - first.train_begin != 90 || first.test_finish - first.test_begin != 30) {
        std::cerr << "[TEST] first segment should hold 90 train and 30 test candles\n";
        return 1;
    }
    const auto& last = windows.back();
    if (last.index != 10 || last.train_start != T0 + 270 * MS_PER_DAY ||
        last.train_end != T0 + 360 * MS_PER_DAY || last.test_end != T0 + 390 * MS_PER_DAY) {
        std::cerr << "[TEST] last segment bounds wrong\n";
        return 1;
    }
    return 0;
}

int testNotEnoughData() {
    WalkForwardOptimizer optimizer(WalkForwardConfig(), busyConfig(), busyFactory());
    try {
        optimizer.run(dailyCandles(100));
    } catch (const std::runtime_error& e) {
        if (std::string(e.what()) != "Not enough data for walk-forward analysis") {
            std::cerr << "[TEST] unexpected message: " << e.what() << "\n";
            return 1;
        }
        WalkForwardConfig bad;
        bad.train_period_days = 0;
        WalkForwardOptimizer invalid(bad, busyConfig(), busyFactory());
        try {
            invalid.run(dailyCandles(400));
        } catch (const std::invalid_argument&) {
            return 0;
        }
        std::cerr << "[TEST] zero train period must be rejected\n";
        return 1;
    }
    std::cerr << "[TEST] 100 candles cannot fit a 120 day segment\n";
    return 1;
}

int testInsufficientTradesInvalidatesSegment() {
    WalkForwardConfig config;
    config.min_trades = 10;
    StrategyFactory idle = []() -> std::shared_ptr<IStrategy> { return std::make_shared<ScriptedStrategy>(1); };
    WalkForwardOptimizer optimizer(config, frictionlessConfig(), idle);
    const WalkForwardResult result = optimizer.run(dailyCandles(400));

    if (result.segments.size() != 10 || result.valid_segments != 0 || result.invalid_segments != 10) {
        std::cerr << "[TEST] idle strategy should invalidate every segment\n";
        return 1;
    }
    if (result.segments.front().invalid_reason != "Insufficient trades: 0 < 10") {
        std::cerr << "[TEST] invalid reason: " << result.segments.front().invalid_reason << "\n";
        return 1;
    }
    if (result.robustness_score != 0.0 || result.robustness_rating != "Poor" || !result.all_trades.empty()) {
        std::cerr << "[TEST] no valid segments should give a zero score\n";
        return 1;
    }
    return 0;
}

int testFullRun() {
    int created = 0;
    auto marker = std::make_shared<MarkingOptimizer>();
    WalkForwardConfig config;
    config.min_trades = 10;
    WalkForwardOptimizer optimizer(config, busyConfig(), busyFactory(&created), marker);

    int progress_calls = 0;
    int last_total = 0;
    const WalkForwardResult result = optimizer.run(dailyCandles(400), [&](int, int total) {
        progress_calls++;
        last_total = total;
    });

    if (result.valid_segments != 10) {
        std::cerr << "[TEST] busy strategy should validate all segments, got " << result.valid_segments << "\n";
        for (const auto& s : result.segments) std::cerr << "  " << s.invalid_reason << "\n";
        return 1;
    }
    if (created != 20) {
        std::cerr << "[TEST] each train and test run needs a fresh strategy, created " << created << "\n";
        return 1;
    }
    if (progress_calls != 10 || last_total != 10) {
        std::cerr << "[TEST] progress should be reported once per segment\n";
        return 1;
    }
    if (marker->calls != 10 || !result.segments.front().optimized_params.contains("tuned_on")) {
        std::cerr << "[TEST] optimizer should run on every train window\n";
        return 1;
    }
    if (result.segments.front().optimized_params.getNumber("tuned_on") != 90.0) {
        std::cerr << "[TEST] optimizer should see the 90 train candles\n";
        return 1;
    }

    size_t expected_trades = 0;
    size_t expected_points = 0;
    for (const auto& seg : result.segments) {
        expected_trades += seg.test_result.trades.size();
        expected_points += seg.test_result.equity_curve.size();
        for (const auto& t : seg.test_result.trades) {
            if (t.opened_at < seg.window.test_start || t.closed_at >= seg.window.test_end) {
                std::cerr << "[TEST] test trade outside its window\n";
                return 1;
            }
        }
    }
    if (result.all_trades.size() != expected_trades ||
        result.aggregated_metrics.total_trades != static_cast<int>(expected_trades)) {
        std::cerr << "[TEST] all_trades should hold every test trade\n";
        return 1;
    }
    for (size_t i = 1; i < result.all_trades.size(); ++i) {
        if (result.all_trades[i].opened_at < result.all_trades[i - 1].opened_at) {
            std::cerr << "[TEST] all_trades must be ordered by open time\n";
            return 1;
        }
    }
    if (result.combined_equity_curve.size() != expected_points) {
        std::cerr << "[TEST] combined curve size mismatch\n";
        return 1;
    }
    for (size_t i = 0; i < result.combined_equity_curve.size(); ++i) {
        if (result.combined_equity_curve[i].candle_index != static_cast<int>(i)) {
            std::cerr << "[TEST] combined curve indices must be consecutive\n";
            return 1;
        }
    }
    if (result.robustness_score < 0.0 || result.robustness_score > 1.0 || result.robustness_rating.empty()) {
        std::cerr << "[TEST] robustness out of range\n";
        return 1;
    }
    return 0;
}

int testDegradationAndStability() {
    BacktestMetrics train;
    BacktestMetrics test;
    train.total_pnl_percent = 10.0;
    test.total_pnl_percent = 5.0;
    if (!near(WalkForwardOptimizer::calculateDegradation(train, test), 50.0)) {
        std::cerr << "[TEST] halving the return is 50% degradation\n";
        return 1;
    }
    test.total_pnl_percent = 12.0;
    if (WalkForwardOptimizer::calculateDegradation(train, test) != 0.0) {
        std::cerr << "[TEST] improvement is no degradation\n";
        return 1;
    }
    train.total_pnl_percent = -3.0;
    if (WalkForwardOptimizer::calculateDegradation(train, test) != 0.0) {
        std::cerr << "[TEST] losing train window gives 0 degradation\n";
        return 1;
    }
    train.total_pnl_percent = 10.0;
    test.total_pnl_percent = -30.0;
    if (!near(WalkForwardOptimizer::calculateDegradation(train, test), 100.0)) {
        std::cerr << "[TEST] degradation is capped at 100\n";
        return 1;
    }

    train.win_rate = 60.0;
    train.profit_factor = 2.0;
    train.sharpe_ratio = 1.0;
    if (!near(WalkForwardOptimizer::calculateMetricsStability(train, train), 1.0)) {
        std::cerr << "[TEST] identical metrics are fully stable\n";
        return 1;
    }
    test.win_rate = 40.0;
    test.profit_factor = 1.0;
    test.sharpe_ratio = 0.5;
    if (!near(WalkForwardOptimizer::calculateMetricsStability(train, test), 0.62)) {
        std::cerr << "[TEST] stability wrong: " << WalkForwardOptimizer::calculateMetricsStability(train, test) << "\n";
        return 1;
    }
    return 0;
}

int testRobustnessScore() {
    std::vector<SegmentResult> segments(3);
    segments[0].is_valid = true;
    segments[0].test_result.metrics.total_pnl = 1000.0;
    segments[0].test_result.metrics.total_pnl_percent = 10.0;
    segments[0].performance_degradation = 0.0;
    segments[1].is_valid = true;
    segments[1].test_result.metrics.total_pnl = -1000.0;
    segments[1].test_result.metrics.total_pnl_percent = -10.0;
    segments[1].performance_degradation = 50.0;
    segments[2].is_valid = false;   // ignored

    const auto stats = WalkForwardOptimizer::calculateRobustness(segments);
    const double sd = std::sqrt(200.0);
    const double expected = 0.5 * 0.4 + 0.75 * 0.35 + (1.0 - sd / 50.0) * 0.25;
    if (!near(stats.consistency_ratio, 50.0) || !near(stats.avg_degradation, 25.0) ||
        !near(stats.returns_std_dev, sd) || !near(stats.score, expected)) {
        std::cerr << "[TEST] robustness wrong: " << stats.score << "\n";
        return 1;
    }
    if (WalkForwardOptimizer::interpretRobustness(stats.score) != "Good") {
        std::cerr << "[TEST] 0.64 should rate Good\n";
        return 1;
    }

    const auto empty = WalkForwardOptimizer::calculateRobustness({});
    if (empty.score != 0.0 || empty.avg_degradation != 100.0) {
        std::cerr << "[TEST] no valid segments gives score 0 and degradation 100\n";
        return 1;
    }
    if (WalkForwardOptimizer::interpretRobustness(0.85) != "Excellent" ||
        WalkForwardOptimizer::interpretRobustness(0.45) != "Moderate" ||
        WalkForwardOptimizer::interpretRobustness(0.25) != "Weak" ||
        WalkForwardOptimizer::interpretRobustness(0.1) != "Poor") {
        std::cerr << "[TEST] rating thresholds wrong\n";
        return 1;
    }
    return 0;
}

int testAggregationPoolsCounts() {
    BacktestMetrics a;
    a.total_trades = 10;
    a.winning_trades = 8;
    a.losing_trades = 2;
    a.gross_profit = 800.0;
    a.gross_loss = 100.0;
    a.total_pnl = 700.0;
    a.sharpe_ratio = 2.0;
    BacktestMetrics b;
    b.total_trades = 30;
    b.winning_trades = 6;
    b.losing_trades = 24;
    b.gross_profit = 300.0;
    b.gross_loss = 600.0;
    b.total_pnl = -300.0;
    b.sharpe_ratio = -1.0;

    const auto m = WalkForwardOptimizer::aggregateMetrics({a, b});
    if (m.total_trades != 40 || !near(m.win_rate, 35.0) || !near(m.profit_factor, 1100.0 / 700.0)) {
        std::cerr << "[TEST] pooled rates wrong: " << m.win_rate << "\n";
        return 1;
    }
    if (!near(m.sharpe_ratio, 0.5) || !near(m.total_pnl, 400.0)) {
        std::cerr << "[TEST] averaged ratios wrong\n";
        return 1;
    }
    return 0;
}

int testSegmentExceptionIsIsolated() {
    int calls = 0;
    // third call builds segment 1's train strategy, fifth segment 2's test strategy
    StrategyFactory flaky = [&calls]() -> std::shared_ptr<IStrategy> {
        ++calls;
        if (calls == 3) throw std::runtime_error("factory failure");
        if (calls == 5) throw 7;
        auto strategy = std::make_shared<ScriptedStrategy>(1);
        strategy->entry_every_from = 0;
        return strategy;
    };
    WalkForwardConfig config;
    config.min_trades = 5;
    WalkForwardOptimizer optimizer(config, busyConfig(), flaky);

    WalkForwardResult result;
    try {
        result = optimizer.run(dailyCandles(400));
    } catch (...) {
        std::cerr << "[TEST] a failing segment must not abort the run\n";
        return 1;
    }
    if (result.segments.size() != 10 || result.valid_segments != 8 || result.invalid_segments != 2) {
        std::cerr << "[TEST] expected 8 valid of 10 segments, got " << result.valid_segments << "\n";
        return 1;
    }
    if (result.segments[1].is_valid || result.segments[1].invalid_reason != "factory failure" ||
        result.segments[2].is_valid || result.segments[2].invalid_reason != "Unknown segment error") {
        std::cerr << "[TEST] failing segments should carry their reason: '"
                  << result.segments[1].invalid_reason << "', '" << result.segments[2].invalid_reason << "'\n";
        return 1;
    }
    if (!result.segments[0].is_valid || !result.segments[3].is_valid) {
        std::cerr << "[TEST] neighbouring segments should be unaffected\n";
        return 1;
    }
    return 0;
}

} // namespace

int main() {
    if (testSegmentLayout() != 0) return 1;
    if (testNotEnoughData() != 0) return 1;
    if (testInsufficientTradesInvalidatesSegment() != 0) return 1;
    if (testFullRun() != 0) return 1;
    if (testDegradationAndStability() != 0) return 1;
    if (testRobustnessScore() != 0) return 1;
    if (testAggregationPoolsCounts() != 0) return 1;
    if (testSegmentExceptionIsIsolated() != 0) return 1;

    std::cout << "[TEST] WalkForward PASSED\n";
    return 0;
}

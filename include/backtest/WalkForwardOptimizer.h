#pragma once

#include "backtest/BacktestEngine.h"
#include "backtest/BacktestTypes.h"
#include "strategy/StrategyRegistry.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace quantbench {
namespace backtest {

struct WalkForwardConfig {
    int train_period_days = 90;
    int test_period_days = 30;
    int step_period_days = 30;
    int min_trades = 10;            // per test window
    bool optimize_on_train = true;

    std::vector<std::string> validate() const;
};

// Time bounds are half-open [start, end); index bounds likewise
struct SegmentWindow {
    int index = 0;
    long long train_start = 0;
    long long train_end = 0;
    long long test_start = 0;
    long long test_end = 0;
    size_t train_begin = 0;
    size_t train_finish = 0;
    size_t test_begin = 0;
    size_t test_finish = 0;
};

struct SegmentResult {
    SegmentWindow window;
    BacktestResult train_result;
    BacktestResult test_result;
    strategy::StrategyParameters optimized_params;

    bool is_valid = false;
    std::string invalid_reason;
    double performance_degradation = 0.0;   // 0 ~ 100
    double metrics_stability = 0.0;         // 0 ~ 1
};

struct RobustnessStats {
    double score = 0.0;
    double consistency_ratio = 0.0;         // %
    double avg_degradation = 100.0;
    double returns_std_dev = 0.0;
};

struct WalkForwardResult {
    WalkForwardConfig config;
    std::vector<SegmentResult> segments;
    int valid_segments = 0;
    int invalid_segments = 0;

    BacktestMetrics aggregated_metrics;         // test windows
    BacktestMetrics aggregated_train_metrics;

    double robustness_score = 0.0;
    double consistency_ratio = 0.0;
    double avg_degradation = 0.0;
    double returns_std_dev = 0.0;
    std::string robustness_rating;

    std::vector<Trade> all_trades;
    std::vector<EquityPoint> combined_equity_curve;
    double duration_ms = 0.0;
};

// Hook that may retune strategy parameters on a train window before the test
// window runs.
class IParameterOptimizer {
public:
    virtual ~IParameterOptimizer() = default;

    virtual strategy::StrategyParameters optimize(
        const std::vector<Candle>& train_candles,
        const BacktestConfig& config,
        const BacktestResult& train_result,
        const strategy::StrategyFactory& factory
    ) = 0;
};

// Returns the configured parameters unchanged
class PassThroughOptimizer : public IParameterOptimizer {
public:
    strategy::StrategyParameters optimize(
        const std::vector<Candle>& train_candles,
        const BacktestConfig& config,
        const BacktestResult& train_result,
        const strategy::StrategyFactory& factory
    ) override;
};

// (segment number, total segments)
using WalkForwardProgress = std::function<void(int, int)>;

class WalkForwardOptimizer {
public:
    WalkForwardOptimizer(WalkForwardConfig config,
                         BacktestConfig base_config,
                         strategy::StrategyFactory factory,
                         std::shared_ptr<IParameterOptimizer> optimizer = nullptr);

    // Throws std::invalid_argument on bad configuration and std::runtime_error
    // when no segment fits in the series. Errors inside a segment only
    // invalidate that segment.
    WalkForwardResult run(const std::vector<Candle>& candles, const WalkForwardProgress& on_progress = nullptr);

    std::vector<SegmentWindow> generateSegments(const std::vector<Candle>& candles) const;

    static double calculateDegradation(const BacktestMetrics& train, const BacktestMetrics& test);
    static double calculateMetricsStability(const BacktestMetrics& train, const BacktestMetrics& test);
    static BacktestMetrics aggregateMetrics(const std::vector<BacktestMetrics>& metrics);
    static RobustnessStats calculateRobustness(const std::vector<SegmentResult>& segments);
    static std::string interpretRobustness(double score);

private:
    SegmentResult processSegment(const SegmentWindow& window, const std::vector<Candle>& candles);

    WalkForwardConfig config_;
    BacktestConfig base_config_;
    strategy::StrategyFactory factory_;
    std::shared_ptr<IParameterOptimizer> optimizer_;
};

} // namespace backtest
} // namespace quantbench

#include "backtest/WalkForwardOptimizer.h"
#include "backtest/MetricsCalculator.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace quantbench {
namespace backtest {

namespace {
double average(const std::vector<BacktestMetrics>& all, double BacktestMetrics::*field) {
    if (all.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& m : all) sum += m.*field;
    return sum / static_cast<double>(all.size());
}

double maxOf(const std::vector<BacktestMetrics>& all, double BacktestMetrics::*field) {
    double out = 0.0;
    for (const auto& m : all) out = std::max(out, m.*field);
    return out;
}

// Relative difference capped at 1; 1 when the reference is unusable
double relativeDiff(double reference, double other) {
    if (std::isinf(reference) || std::isinf(other)) {
        return (std::isinf(reference) && std::isinf(other)) ? 0.0 : 1.0;
    }
    if (std::abs(reference) <= 1e-12) return 1.0;
    return std::min(1.0, std::abs(reference - other) / std::abs(reference));
}

std::vector<Candle> slice(const std::vector<Candle>& candles, size_t begin, size_t finish) {
    return std::vector<Candle>(candles.begin() + begin, candles.begin() + finish);
}

size_t lowerIndex(const std::vector<Candle>& candles, long long ts) {
    auto it = std::lower_bound(candles.begin(), candles.end(), ts,
                               [](const Candle& c, long long t) { return c.timestamp < t; });
    return static_cast<size_t>(it - candles.begin());
}
}

std::vector<std::string> WalkForwardConfig::validate() const {
    std::vector<std::string> errors;
    if (train_period_days <= 0) errors.push_back("Train period must be positive");
    if (test_period_days <= 0) errors.push_back("Test period must be positive");
    if (step_period_days <= 0) errors.push_back("Step period must be positive");
    if (min_trades < 0) errors.push_back("Min trades cannot be negative");
    return errors;
}

strategy::StrategyParameters PassThroughOptimizer::optimize(
    const std::vector<Candle>& train_candles,
    const BacktestConfig& config,
    const BacktestResult& train_result,
    const strategy::StrategyFactory& factory
) {
    (void)train_candles;
    (void)train_result;
    (void)factory;
    return config.strategy_params;
}

WalkForwardOptimizer::WalkForwardOptimizer(WalkForwardConfig config,
                                           BacktestConfig base_config,
                                           strategy::StrategyFactory factory,
                                           std::shared_ptr<IParameterOptimizer> optimizer)
    : config_(std::move(config))
    , base_config_(std::move(base_config))
    , factory_(std::move(factory))
    , optimizer_(optimizer ? std::move(optimizer) : std::make_shared<PassThroughOptimizer>())
{}

std::vector<SegmentWindow> WalkForwardOptimizer::generateSegments(const std::vector<Candle>& candles) const {
    std::vector<SegmentWindow> windows;
    if (candles.empty()) return windows;

    const long long train_ms = static_cast<long long>(config_.train_period_days) * MS_PER_DAY;
    const long long test_ms = static_cast<long long>(config_.test_period_days) * MS_PER_DAY;
    const long long step_ms = static_cast<long long>(config_.step_period_days) * MS_PER_DAY;
    if (train_ms <= 0 || test_ms <= 0 || step_ms <= 0) return windows;

    const long long last_ts = candles.back().timestamp;
    for (long long start = candles.front().timestamp; start + train_ms + test_ms <= last_ts; start += step_ms) {
        SegmentWindow w;
        w.train_start = start;
        w.train_end = start + train_ms;
        w.test_start = w.train_end;
        w.test_end = w.test_start + test_ms;
        w.train_begin = lowerIndex(candles, w.train_start);
        w.train_finish = lowerIndex(candles, w.train_end);
        w.test_begin = w.train_finish;
        w.test_finish = lowerIndex(candles, w.test_end);

        // Gaps in the data can leave a window empty
        if (w.train_finish <= w.train_begin || w.test_finish <= w.test_begin) continue;

        w.index = static_cast<int>(windows.size()) + 1;
        windows.push_back(w);
    }
    return windows;
}

WalkForwardResult WalkForwardOptimizer::run(const std::vector<Candle>& candles, const WalkForwardProgress& on_progress) {
    const auto started = std::chrono::steady_clock::now();

    const auto errors = config_.validate();
    if (!errors.empty()) {
        std::string message = "Invalid walk-forward config:";
        for (const auto& e : errors) message += " " + e + ";";
        throw std::invalid_argument(message);
    }
    if (!factory_) {
        throw std::runtime_error("Strategy " + base_config_.strategy_id + " not found");
    }

    const auto windows = generateSegments(candles);
    if (windows.empty()) {
        throw std::runtime_error("Not enough data for walk-forward analysis");
    }

    LOG_INFO("Walk-forward started: {} segments (train {}d, test {}d, step {}d)",
             windows.size(), config_.train_period_days, config_.test_period_days, config_.step_period_days);

    WalkForwardResult result;
    result.config = config_;
    result.segments.reserve(windows.size());

    for (const auto& window : windows) {
        if (on_progress) {
            on_progress(window.index, static_cast<int>(windows.size()));
        }
        result.segments.push_back(processSegment(window, candles));
    }

    std::vector<BacktestMetrics> test_metrics;
    std::vector<BacktestMetrics> train_metrics;
    for (const auto& seg : result.segments) {
        if (!seg.is_valid) {
            result.invalid_segments++;
            continue;
        }
        result.valid_segments++;
        test_metrics.push_back(seg.test_result.metrics);
        train_metrics.push_back(seg.train_result.metrics);
        result.all_trades.insert(result.all_trades.end(),
                                 seg.test_result.trades.begin(), seg.test_result.trades.end());
    }

    result.aggregated_metrics = aggregateMetrics(test_metrics);
    result.aggregated_train_metrics = aggregateMetrics(train_metrics);

    const RobustnessStats robustness = calculateRobustness(result.segments);
    result.robustness_score = robustness.score;
    result.consistency_ratio = robustness.consistency_ratio;
    result.avg_degradation = robustness.avg_degradation;
    result.returns_std_dev = robustness.returns_std_dev;
    result.robustness_rating = interpretRobustness(robustness.score);

    std::stable_sort(result.all_trades.begin(), result.all_trades.end(),
                     [](const Trade& a, const Trade& b) { return a.opened_at < b.opened_at; });

    // Test curves chained; cumulative PnL carries over between segments
    double carried_pnl = 0.0;
    int global_index = 0;
    for (const auto& seg : result.segments) {
        if (!seg.is_valid) continue;
        const auto& curve = seg.test_result.equity_curve;
        for (const auto& point : curve) {
            EquityPoint p = point;
            p.candle_index = global_index++;
            p.cumulative_pnl = carried_pnl + point.cumulative_pnl;
            result.combined_equity_curve.push_back(p);
        }
        if (!curve.empty()) {
            carried_pnl += curve.back().cumulative_pnl;
        }
    }

    result.duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();

    LOG_INFO("Walk-forward completed: {}/{} valid segments, robustness {:.2f} ({})",
             result.valid_segments, result.segments.size(), result.robustness_score, result.robustness_rating);
    return result;
}

SegmentResult WalkForwardOptimizer::processSegment(const SegmentWindow& window, const std::vector<Candle>& candles) {
    SegmentResult seg;
    seg.window = window;
    seg.optimized_params = base_config_.strategy_params;

    try {
        const auto train_candles = slice(candles, window.train_begin, window.train_finish);
        const auto test_candles = slice(candles, window.test_begin, window.test_finish);

        BacktestConfig train_config = base_config_;
        train_config.id = base_config_.id + "-seg" + std::to_string(window.index) + "-train";
        train_config.start_date = window.train_start;
        train_config.end_date = window.train_end;
        BacktestEngine train_engine(train_config, factory_());
        seg.train_result = train_engine.run(train_candles);

        if (seg.train_result.status != BacktestStatus::COMPLETED) {
            seg.invalid_reason = "Train backtest failed: " + seg.train_result.error_message;
            LOG_WARN("Segment {} invalid: {}", window.index, seg.invalid_reason);
            return seg;
        }

        if (config_.optimize_on_train && seg.train_result.metrics.total_trades >= config_.min_trades) {
            seg.optimized_params = optimizer_->optimize(train_candles, train_config, seg.train_result, factory_);
        }

        BacktestConfig test_config = base_config_;
        test_config.id = base_config_.id + "-seg" + std::to_string(window.index) + "-test";
        test_config.start_date = window.test_start;
        test_config.end_date = window.test_end;
        test_config.strategy_params = seg.optimized_params;
        BacktestEngine test_engine(test_config, factory_());
        seg.test_result = test_engine.run(test_candles);

        seg.performance_degradation = calculateDegradation(seg.train_result.metrics, seg.test_result.metrics);
        seg.metrics_stability = calculateMetricsStability(seg.train_result.metrics, seg.test_result.metrics);

        const int test_trades = seg.test_result.metrics.total_trades;
        if (seg.test_result.status != BacktestStatus::COMPLETED) {
            seg.invalid_reason = "Test backtest failed: " + seg.test_result.error_message;
        } else if (test_trades < config_.min_trades) {
            seg.invalid_reason = "Insufficient trades: " + std::to_string(test_trades) +
                                 " < " + std::to_string(config_.min_trades);
        } else {
            seg.is_valid = true;
        }
    } catch (const std::exception& e) {
        seg.is_valid = false;
        seg.invalid_reason = e.what();
    } catch (...) {
        seg.is_valid = false;
        seg.invalid_reason = "Unknown segment error";
    }

    if (!seg.is_valid) {
        LOG_WARN("Segment {} invalid: {}", window.index, seg.invalid_reason);
    }
    return seg;
}

double WalkForwardOptimizer::calculateDegradation(const BacktestMetrics& train, const BacktestMetrics& test) {
    const double train_return = train.total_pnl_percent;
    const double test_return = test.total_pnl_percent;
    if (train_return <= 0.0 || test_return >= train_return) {
        return 0.0;
    }
    return std::clamp((train_return - test_return) / train_return * 100.0, 0.0, 100.0);
}

double WalkForwardOptimizer::calculateMetricsStability(const BacktestMetrics& train, const BacktestMetrics& test) {
    const double win_rate_diff = std::abs(train.win_rate - test.win_rate) / 100.0;
    const double pf_diff = (train.profit_factor > 0.0) ? relativeDiff(train.profit_factor, test.profit_factor) : 1.0;
    const double sharpe_diff = relativeDiff(train.sharpe_ratio, test.sharpe_ratio);

    const double stability = 1.0 - (win_rate_diff * 0.4 + pf_diff * 0.35 + sharpe_diff * 0.25);
    return std::clamp(stability, 0.0, 1.0);
}

BacktestMetrics WalkForwardOptimizer::aggregateMetrics(const std::vector<BacktestMetrics>& all) {
    BacktestMetrics out;
    if (all.empty()) return out;

    for (const auto& m : all) {
        out.total_trades += m.total_trades;
        out.winning_trades += m.winning_trades;
        out.losing_trades += m.losing_trades;
        out.long_trades += m.long_trades;
        out.short_trades += m.short_trades;
        out.total_pnl += m.total_pnl;
        out.gross_profit += m.gross_profit;
        out.gross_loss += m.gross_loss;
        out.total_fees += m.total_fees;
        out.max_win = std::max(out.max_win, m.max_win);
        out.max_loss = std::min(out.max_loss, m.max_loss);
        out.max_trade_duration = std::max(out.max_trade_duration, m.max_trade_duration);
        out.max_consecutive_wins = std::max(out.max_consecutive_wins, m.max_consecutive_wins);
        out.max_consecutive_losses = std::max(out.max_consecutive_losses, m.max_consecutive_losses);
        for (const auto& [reason, count] : m.exit_reason_counts) {
            out.exit_reason_counts[reason] += count;
        }
    }

    // Rates from pooled counts, not averaged per segment
    out.win_rate = (out.total_trades > 0)
        ? static_cast<double>(out.winning_trades) / out.total_trades * 100.0 : 0.0;
    out.avg_pnl = (out.total_trades > 0) ? out.total_pnl / out.total_trades : 0.0;
    out.avg_win = (out.winning_trades > 0) ? out.gross_profit / out.winning_trades : 0.0;
    out.avg_loss = (out.losing_trades > 0) ? -out.gross_loss / out.losing_trades : 0.0;
    out.profit_factor = MetricsCalculator::profitFactor(out.gross_profit, out.gross_loss);
    out.risk_reward_ratio = (std::abs(out.avg_loss) > 1e-12) ? std::abs(out.avg_win / out.avg_loss) : 0.0;
    out.expectancy = (out.win_rate / 100.0) * out.avg_win + (1.0 - out.win_rate / 100.0) * out.avg_loss;
    out.total_pnl_percent = average(all, &BacktestMetrics::total_pnl_percent);

    out.max_drawdown = maxOf(all, &BacktestMetrics::max_drawdown);
    out.max_drawdown_percent = maxOf(all, &BacktestMetrics::max_drawdown_percent);
    out.max_drawdown_duration = maxOf(all, &BacktestMetrics::max_drawdown_duration);

    // Ratios: plain mean across segments, not recomputed from a joined series
    out.sharpe_ratio = average(all, &BacktestMetrics::sharpe_ratio);
    out.sortino_ratio = average(all, &BacktestMetrics::sortino_ratio);
    out.calmar_ratio = average(all, &BacktestMetrics::calmar_ratio);
    out.avg_drawdown = average(all, &BacktestMetrics::avg_drawdown);
    out.time_in_drawdown = average(all, &BacktestMetrics::time_in_drawdown);
    out.avg_trade_duration = average(all, &BacktestMetrics::avg_trade_duration);
    out.avg_win_duration = average(all, &BacktestMetrics::avg_win_duration);
    out.avg_loss_duration = average(all, &BacktestMetrics::avg_loss_duration);
    out.annualized_return = average(all, &BacktestMetrics::annualized_return);
    out.volatility = average(all, &BacktestMetrics::volatility);
    out.var95 = average(all, &BacktestMetrics::var95);
    out.expected_shortfall95 = average(all, &BacktestMetrics::expected_shortfall95);
    out.market_exposure = average(all, &BacktestMetrics::market_exposure);
    out.avg_position_size = average(all, &BacktestMetrics::avg_position_size);
    out.avg_leverage = average(all, &BacktestMetrics::avg_leverage);
    out.current_streak = all.back().current_streak;
    return out;
}

RobustnessStats WalkForwardOptimizer::calculateRobustness(const std::vector<SegmentResult>& segments) {
    RobustnessStats stats;

    std::vector<double> returns;
    int profitable = 0;
    double degradation_sum = 0.0;
    for (const auto& seg : segments) {
        if (!seg.is_valid) continue;
        returns.push_back(seg.test_result.metrics.total_pnl_percent);
        if (seg.test_result.metrics.total_pnl > 0.0) profitable++;
        degradation_sum += seg.performance_degradation;
    }
    if (returns.empty()) {
        return stats;
    }

    const double n = static_cast<double>(returns.size());
    stats.consistency_ratio = profitable / n * 100.0;
    stats.avg_degradation = degradation_sum / n;
    stats.returns_std_dev = MetricsCalculator::sampleStdDev(returns);

    const double consistency_score = stats.consistency_ratio / 100.0;
    const double degradation_score = std::max(0.0, 1.0 - stats.avg_degradation / 100.0);
    const double stability_score = std::max(0.0, 1.0 - std::min(stats.returns_std_dev / 50.0, 1.0));

    stats.score = std::clamp(consistency_score * 0.4 + degradation_score * 0.35 + stability_score * 0.25, 0.0, 1.0);
    return stats;
}

std::string WalkForwardOptimizer::interpretRobustness(double score) {
    if (score >= 0.8) return "Excellent";
    if (score >= 0.6) return "Good";
    if (score >= 0.4) return "Moderate";
    if (score >= 0.2) return "Weak";
    return "Poor";
}

} // namespace backtest
} // namespace quantbench

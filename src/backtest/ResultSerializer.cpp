#include "backtest/ResultSerializer.h"
#include "common/Logger.h"

#include <cmath>
#include <fstream>
#include <stdexcept>

namespace quantbench {
namespace backtest {

namespace {

nlohmann::json number(double v) {
    if (!std::isfinite(v)) return nullptr;
    return v;
}

template <typename T>
nlohmann::json optionalNumber(const std::optional<T>& v) {
    if (!v) return nullptr;
    return number(static_cast<double>(*v));
}

template <typename T>
nlohmann::json arrayOf(const std::vector<T>& items) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : items) arr.push_back(toJson(item));
    return arr;
}

nlohmann::json numbers(const std::vector<double>& values) {
    nlohmann::json arr = nlohmann::json::array();
    for (double v : values) arr.push_back(number(v));
    return arr;
}

nlohmann::json toJson(const strategy::TacticsSet& tactics) {
    nlohmann::json j;
    j["id"] = tactics.id;
    j["name"] = tactics.name;
    j["use_stop_loss"] = tactics.use_stop_loss;
    j["use_take_profit"] = tactics.use_take_profit;

    j["entry"] = {
        {"position_sizing", strategy::toString(tactics.entry.position_sizing)},
        {"position_size", number(tactics.entry.position_size)},
        {"leverage", number(tactics.entry.leverage)}
    };

    nlohmann::json tp;
    tp["type"] = strategy::toString(tactics.take_profit.type);
    tp["tp_price"] = optionalNumber(tactics.take_profit.tp_price);
    tp["tp_percent"] = optionalNumber(tactics.take_profit.tp_percent);
    tp["max_holding_minutes"] = optionalNumber(tactics.take_profit.max_holding_minutes);
    nlohmann::json targets = nlohmann::json::array();
    for (const auto& t : tactics.take_profit.targets) {
        targets.push_back({
            {"price", optionalNumber(t.price)},
            {"profit_percent", optionalNumber(t.profit_percent)},
            {"close_percent", number(t.close_percent)}
        });
    }
    tp["targets"] = targets;
    j["take_profit"] = tp;

    nlohmann::json sl;
    sl["type"] = strategy::toString(tactics.stop_loss.type);
    sl["sl_price"] = optionalNumber(tactics.stop_loss.sl_price);
    sl["sl_percent"] = optionalNumber(tactics.stop_loss.sl_percent);
    sl["atr_multiplier"] = optionalNumber(tactics.stop_loss.atr_multiplier);
    sl["atr_period"] = tactics.stop_loss.atr_period;
    sl["move_to_breakeven_after"] = optionalNumber(tactics.stop_loss.move_to_breakeven_after);
    j["stop_loss"] = sl;

    nlohmann::json tr;
    tr["enabled"] = tactics.trailing.enabled;
    tr["type"] = strategy::toString(tactics.trailing.type);
    tr["value"] = number(tactics.trailing.value);
    tr["atr_period"] = tactics.trailing.atr_period;
    tr["atr_multiplier"] = number(tactics.trailing.atr_multiplier);
    tr["activation_profit"] = optionalNumber(tactics.trailing.activation_profit);
    tr["activation_price"] = optionalNumber(tactics.trailing.activation_price);
    tr["activation_after_tp"] = optionalNumber(tactics.trailing.activation_after_tp);
    j["trailing_stop"] = tr;
    return j;
}

} // namespace

nlohmann::json toJson(const strategy::StrategyParameters& params) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& kv : params.values()) {
        if (const double* d = std::get_if<double>(&kv.second)) {
            j[kv.first] = number(*d);
        } else if (const bool* b = std::get_if<bool>(&kv.second)) {
            j[kv.first] = *b;
        } else {
            j[kv.first] = std::get<std::string>(kv.second);
        }
    }
    return j;
}

nlohmann::json toJson(const PositionFill& fill) {
    nlohmann::json j;
    j["price"] = number(fill.price);
    j["size"] = number(fill.size);
    j["fee"] = number(fill.fee);
    j["pnl"] = number(fill.pnl);
    j["timestamp"] = fill.timestamp;
    j["candle_index"] = fill.candle_index;
    j["reason"] = toString(fill.reason);
    return j;
}

nlohmann::json toJson(const Trade& trade) {
    nlohmann::json j;
    j["id"] = trade.id;
    j["position_id"] = trade.position_id;
    j["symbol"] = trade.symbol;
    j["direction"] = toString(trade.direction);
    j["avg_entry_price"] = number(trade.avg_entry_price);
    j["avg_exit_price"] = number(trade.avg_exit_price);
    j["size"] = number(trade.size);
    j["leverage"] = number(trade.leverage);
    j["margin"] = number(trade.margin);
    j["opened_at"] = trade.opened_at;
    j["opened_at_index"] = trade.opened_at_index;
    j["closed_at"] = trade.closed_at;
    j["closed_at_index"] = trade.closed_at_index;
    j["pnl"] = number(trade.pnl);
    j["pnl_percent"] = number(trade.pnl_percent);
    j["fees"] = number(trade.fees);
    j["net_pnl"] = number(trade.net_pnl);
    j["duration_minutes"] = number(trade.duration_minutes);
    j["duration_candles"] = trade.duration_candles;
    j["close_reason"] = toString(trade.close_reason);
    j["liquidated"] = trade.liquidated;
    j["max_favorable_excursion"] = number(trade.max_favorable_excursion);
    j["max_adverse_excursion"] = number(trade.max_adverse_excursion);
    j["exits"] = arrayOf(trade.exits);
    return j;
}

nlohmann::json toJson(const EquityPoint& point) {
    nlohmann::json j;
    j["timestamp"] = point.timestamp;
    j["candle_index"] = point.candle_index;
    j["price"] = number(point.price);
    j["balance"] = number(point.balance);
    j["equity"] = number(point.equity);
    j["available_margin"] = number(point.available_margin);
    j["unrealized_pnl"] = number(point.unrealized_pnl);
    j["realized_pnl"] = number(point.realized_pnl);
    j["daily_pnl"] = number(point.daily_pnl);
    j["cumulative_pnl"] = number(point.cumulative_pnl);
    j["max_equity"] = number(point.max_equity);
    j["drawdown"] = number(point.drawdown);
    j["drawdown_percent"] = number(point.drawdown_percent);
    j["max_drawdown"] = number(point.max_drawdown);
    j["max_drawdown_percent"] = number(point.max_drawdown_percent);
    j["open_positions"] = point.open_positions;
    j["total_trades"] = point.total_trades;
    j["winning_trades"] = point.winning_trades;
    j["losing_trades"] = point.losing_trades;
    return j;
}

nlohmann::json toJson(const BacktestMetrics& m) {
    nlohmann::json j;
    j["total_trades"] = m.total_trades;
    j["winning_trades"] = m.winning_trades;
    j["losing_trades"] = m.losing_trades;
    j["long_trades"] = m.long_trades;
    j["short_trades"] = m.short_trades;
    j["win_rate"] = number(m.win_rate);

    j["total_pnl"] = number(m.total_pnl);
    j["total_pnl_percent"] = number(m.total_pnl_percent);
    j["avg_pnl"] = number(m.avg_pnl);
    j["avg_win"] = number(m.avg_win);
    j["avg_loss"] = number(m.avg_loss);
    j["max_win"] = number(m.max_win);
    j["max_loss"] = number(m.max_loss);
    j["gross_profit"] = number(m.gross_profit);
    j["gross_loss"] = number(m.gross_loss);
    j["total_fees"] = number(m.total_fees);

    j["profit_factor"] = number(m.profit_factor);
    j["risk_reward_ratio"] = number(m.risk_reward_ratio);
    j["expectancy"] = number(m.expectancy);
    j["sharpe_ratio"] = number(m.sharpe_ratio);
    j["sortino_ratio"] = number(m.sortino_ratio);
    j["calmar_ratio"] = number(m.calmar_ratio);

    j["max_drawdown"] = number(m.max_drawdown);
    j["max_drawdown_percent"] = number(m.max_drawdown_percent);
    j["avg_drawdown"] = number(m.avg_drawdown);
    j["max_drawdown_duration"] = number(m.max_drawdown_duration);
    j["time_in_drawdown"] = number(m.time_in_drawdown);

    j["avg_trade_duration"] = number(m.avg_trade_duration);
    j["max_trade_duration"] = number(m.max_trade_duration);
    j["avg_win_duration"] = number(m.avg_win_duration);
    j["avg_loss_duration"] = number(m.avg_loss_duration);

    j["max_consecutive_wins"] = m.max_consecutive_wins;
    j["max_consecutive_losses"] = m.max_consecutive_losses;
    j["current_streak"] = m.current_streak;

    j["annualized_return"] = number(m.annualized_return);
    j["volatility"] = number(m.volatility);
    j["var95"] = number(m.var95);
    j["expected_shortfall95"] = number(m.expected_shortfall95);

    j["market_exposure"] = number(m.market_exposure);
    j["avg_position_size"] = number(m.avg_position_size);
    j["avg_leverage"] = number(m.avg_leverage);

    j["exit_reason_counts"] = m.exit_reason_counts;
    return j;
}

nlohmann::json toJson(const BacktestLogEntry& entry) {
    nlohmann::json j;
    j["timestamp"] = entry.timestamp;
    j["candle_index"] = entry.candle_index;
    j["level"] = toString(entry.level);
    j["message"] = entry.message;
    j["data"] = entry.data;
    return j;
}

nlohmann::json toJson(const BacktestConfig& config) {
    nlohmann::json j;
    j["id"] = config.id;
    j["name"] = config.name;
    j["symbol"] = config.symbol;
    j["timeframe"] = config.timeframe;
    j["start_date"] = config.start_date;
    j["end_date"] = config.end_date;
    j["initial_balance"] = number(config.initial_balance);
    j["currency"] = config.currency;
    j["strategy_id"] = config.strategy_id;
    j["strategy_params"] = toJson(config.strategy_params);
    j["tactics"] = toJson(config.tactics);
    j["fee_percent"] = number(config.fee_percent);
    j["slippage_percent"] = number(config.slippage_percent);
    j["max_leverage"] = number(config.max_leverage);
    j["margin_mode"] = toString(config.margin_mode);
    j["allow_short"] = config.allow_short;
    j["max_drawdown"] = optionalNumber(config.max_drawdown);
    j["max_open_positions"] = config.max_open_positions;
    j["record_debug_logs"] = config.record_debug_logs;
    return j;
}

nlohmann::json toJson(const BacktestResult& result) {
    nlohmann::json j;
    j["id"] = result.id;
    j["config"] = toJson(result.config);
    j["status"] = toString(result.status);
    j["progress"] = number(result.progress);
    j["trades"] = arrayOf(result.trades);
    j["equity_curve"] = arrayOf(result.equity_curve);
    j["metrics"] = toJson(result.metrics);
    j["logs"] = arrayOf(result.logs);
    j["initial_balance"] = number(result.initial_balance);
    j["final_balance"] = number(result.final_balance);
    j["final_equity"] = number(result.final_equity);
    j["candles_processed"] = result.candles_processed;
    j["signals_generated"] = result.signals_generated;
    j["signals_skipped"] = result.signals_skipped;
    j["aborted_on_drawdown"] = result.aborted_on_drawdown;
    j["duration_ms"] = number(result.duration_ms);
    if (!result.error_message.empty()) {
        j["error"] = result.error_message;
    }
    return j;
}

nlohmann::json toJson(const SegmentResult& segment) {
    nlohmann::json j;
    j["segment_index"] = segment.window.index;
    j["train_start"] = segment.window.train_start;
    j["train_end"] = segment.window.train_end;
    j["test_start"] = segment.window.test_start;
    j["test_end"] = segment.window.test_end;
    j["train_metrics"] = toJson(segment.train_result.metrics);
    j["test_metrics"] = toJson(segment.test_result.metrics);
    j["train_status"] = toString(segment.train_result.status);
    j["test_status"] = toString(segment.test_result.status);
    j["test_trades"] = arrayOf(segment.test_result.trades);
    j["optimized_params"] = toJson(segment.optimized_params);
    j["is_valid"] = segment.is_valid;
    j["invalid_reason"] = segment.invalid_reason;
    j["performance_degradation"] = number(segment.performance_degradation);
    j["metrics_stability"] = number(segment.metrics_stability);
    return j;
}

nlohmann::json toJson(const WalkForwardResult& result) {
    nlohmann::json j;
    j["config"] = {
        {"train_period_days", result.config.train_period_days},
        {"test_period_days", result.config.test_period_days},
        {"step_period_days", result.config.step_period_days},
        {"min_trades", result.config.min_trades},
        {"optimize_on_train", result.config.optimize_on_train}
    };
    j["segments"] = arrayOf(result.segments);
    j["total_segments"] = result.segments.size();
    j["valid_segments"] = result.valid_segments;
    j["invalid_segments"] = result.invalid_segments;
    j["aggregated_metrics"] = toJson(result.aggregated_metrics);
    j["aggregated_train_metrics"] = toJson(result.aggregated_train_metrics);
    j["robustness_score"] = number(result.robustness_score);
    j["consistency_ratio"] = number(result.consistency_ratio);
    j["avg_degradation"] = number(result.avg_degradation);
    j["returns_std_dev"] = number(result.returns_std_dev);
    j["robustness_rating"] = result.robustness_rating;
    j["all_trades"] = arrayOf(result.all_trades);
    j["combined_equity_curve"] = arrayOf(result.combined_equity_curve);
    j["duration_ms"] = number(result.duration_ms);
    return j;
}

nlohmann::json toJson(const MonteCarloResult& result) {
    nlohmann::json j;
    j["iterations"] = result.iterations;
    j["final_equities"] = numbers(result.final_equities);
    j["max_drawdowns"] = numbers(result.max_drawdowns);
    j["percentiles"] = {
        {"p5", number(result.percentiles.p5)},
        {"p25", number(result.percentiles.p25)},
        {"p50", number(result.percentiles.p50)},
        {"p75", number(result.percentiles.p75)},
        {"p95", number(result.percentiles.p95)}
    };
    j["ruin_probability"] = number(result.ruin_probability);
    j["profit_probability"] = number(result.profit_probability);
    j["avg_final_equity"] = number(result.avg_final_equity);
    j["std_final_equity"] = number(result.std_final_equity);
    j["avg_max_drawdown"] = number(result.avg_max_drawdown);
    j["worst_case"] = number(result.worst_case);
    j["best_case"] = number(result.best_case);
    return j;
}

nlohmann::json toJson(const SensitivityResult& result) {
    nlohmann::json j;
    j["parameter"] = result.parameter;
    j["base_value"] = number(result.base_value);
    nlohmann::json points = nlohmann::json::array();
    for (const auto& p : result.points) {
        nlohmann::json pj;
        pj["value"] = number(p.value);
        pj["pnl"] = number(p.pnl);
        pj["win_rate"] = number(p.win_rate);
        pj["sharpe_ratio"] = number(p.sharpe_ratio);
        pj["max_drawdown"] = number(p.max_drawdown);
        pj["profit_factor"] = number(p.profit_factor);
        pj["trades"] = p.trades;
        if (p.failed) pj["error"] = p.error;
        points.push_back(pj);
    }
    j["points"] = points;
    j["impact"] = number(result.impact);
    j["optimal_value"] = number(result.optimal_value);
    j["stability"] = toString(result.stability);
    j["recommendation"] = result.recommendation;
    return j;
}

nlohmann::json toJson(const SensitivityAnalysis& analysis) {
    nlohmann::json j;
    j["parameters"] = arrayOf(analysis.parameters);
    j["most_sensitive_parameter"] = analysis.most_sensitive_parameter;
    j["least_sensitive_parameter"] = analysis.least_sensitive_parameter;
    j["stable_parameters"] = analysis.stable_parameters;
    j["sensitive_parameters"] = analysis.sensitive_parameters;
    j["recommendations"] = analysis.recommendations;
    return j;
}

void writeJson(const std::string& path, const nlohmann::json& doc) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    out << doc.dump(2) << "\n";
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
    LOG_INFO("Wrote {}", path);
}

} // namespace backtest
} // namespace quantbench

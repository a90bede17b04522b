#include "backtest/SensitivityAnalyzer.h"
#include "backtest/BacktestEngine.h"
#include "common/Logger.h"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace quantbench {
namespace backtest {

SensitivityAnalyzer::SensitivityAnalyzer(BacktestConfig base_config,
                                         strategy::StrategyFactory factory,
                                         SensitivityObjective objective)
    : base_config_(std::move(base_config))
    , factory_(std::move(factory))
    , objective_(objective)
{}

BacktestConfig SensitivityAnalyzer::applyParameterValue(const BacktestConfig& config, const std::string& name, double value) {
    BacktestConfig modified = config;
    if (name == "tp_percent") {
        modified.tactics.take_profit.tp_percent = value;
    } else if (name == "sl_percent") {
        modified.tactics.stop_loss.sl_percent = value;
    } else if (name == "position_size") {
        modified.tactics.entry.position_size = value;
    } else {
        modified.strategy_params.set(name, value);
    }
    return modified;
}

double SensitivityAnalyzer::objectiveValue(const SensitivityPoint& point, SensitivityObjective objective) {
    switch (objective) {
        case SensitivityObjective::PNL: return point.pnl;
        case SensitivityObjective::SHARPE: return point.sharpe_ratio;
        case SensitivityObjective::WIN_RATE: return point.win_rate;
        case SensitivityObjective::PROFIT_FACTOR: return point.profit_factor;
        case SensitivityObjective::MAX_DRAWDOWN: return point.max_drawdown;
    }
    return point.pnl;
}

double SensitivityAnalyzer::calculateImpact(const std::vector<SensitivityPoint>& points, SensitivityObjective objective) {
    std::vector<double> values;
    for (const auto& p : points) {
        const double v = objectiveValue(p, objective);
        if (!p.failed && std::isfinite(v)) values.push_back(v);
    }
    if (values.size() < 2) return 0.0;

    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    const double range = *hi - *lo;
    const double middle = values[values.size() / 2];
    if (middle == 0.0) {
        return range > 0.0 ? 100.0 : 0.0;
    }
    return std::min(100.0, range / std::abs(middle) * 100.0);
}

ParameterStability SensitivityAnalyzer::classifyImpact(double impact) {
    if (impact < 10.0) return ParameterStability::STABLE;
    if (impact < 25.0) return ParameterStability::MODERATE;
    if (impact < 50.0) return ParameterStability::SENSITIVE;
    return ParameterStability::HIGHLY_SENSITIVE;
}

SensitivityResult SensitivityAnalyzer::analyzeParameter(const std::vector<Candle>& candles,
                                                        const SensitivityParameter& param) const {
    if (param.steps < 1) {
        throw std::invalid_argument("Sensitivity steps must be at least 1: " + param.name);
    }
    if (!factory_) {
        throw std::runtime_error("Strategy " + base_config_.strategy_id + " not found");
    }

    SensitivityResult result;
    result.parameter = param.name;
    result.base_value = param.base_value;

    const double step = (param.max_value - param.min_value) / param.steps;
    for (int i = 0; i <= param.steps; ++i) {
        SensitivityPoint point;
        point.value = param.min_value + i * step;

        BacktestConfig config = applyParameterValue(base_config_, param.name, point.value);
        config.id = base_config_.id + "-" + param.name + "-" + std::to_string(i);
        BacktestEngine engine(config, factory_());
        const BacktestResult run = engine.run(candles);

        if (run.status == BacktestStatus::FAILED) {
            point.failed = true;
            point.error = run.error_message;
            LOG_WARN("Sensitivity run {}={} failed: {}", param.name, point.value, run.error_message);
        }
        point.pnl = run.metrics.total_pnl;
        point.win_rate = run.metrics.win_rate;
        point.sharpe_ratio = run.metrics.sharpe_ratio;
        point.max_drawdown = run.metrics.max_drawdown_percent;
        point.profit_factor = run.metrics.profit_factor;
        point.trades = run.metrics.total_trades;
        result.points.push_back(point);
    }

    result.impact = calculateImpact(result.points, objective_);
    result.stability = classifyImpact(result.impact);

    const SensitivityPoint* best = nullptr;
    for (const auto& p : result.points) {
        if (p.failed) continue;
        if (!best) {
            best = &p;
            continue;
        }
        const double v = objectiveValue(p, objective_);
        const double b = objectiveValue(*best, objective_);
        const bool better = (objective_ == SensitivityObjective::MAX_DRAWDOWN) ? v < b : v > b;
        if (better) best = &p;
    }
    result.optimal_value = best ? best->value : param.base_value;
    result.recommendation = recommend(param, result.optimal_value, result.stability);
    return result;
}

std::string SensitivityAnalyzer::recommend(const SensitivityParameter& param, double optimal_value,
                                           ParameterStability stability) const {
    if (stability == ParameterStability::STABLE) {
        return fmt::format("{} is stable. Current value of {} is acceptable. Consider adjusting other parameters.",
                           param.name, param.base_value);
    }
    if (stability == ParameterStability::HIGHLY_SENSITIVE) {
        if (optimal_value == param.base_value) {
            return fmt::format("{} is highly sensitive. Current value is optimal.", param.name);
        }
        return fmt::format("{} is highly sensitive. Consider {} to {:.2f}.", param.name,
                           optimal_value > param.base_value ? "increase" : "decrease", optimal_value);
    }
    std::string label = toString(stability);
    std::transform(label.begin(), label.end(), label.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return fmt::format("{} has {} sensitivity. Optimal value is {:.2f}.", param.name, label, optimal_value);
}

SensitivityAnalysis SensitivityAnalyzer::analyzeMultiple(const std::vector<Candle>& candles,
                                                         const std::vector<SensitivityParameter>& params) const {
    SensitivityAnalysis analysis;
    for (const auto& param : params) {
        analysis.parameters.push_back(analyzeParameter(candles, param));
    }

    std::stable_sort(analysis.parameters.begin(), analysis.parameters.end(),
                     [](const SensitivityResult& a, const SensitivityResult& b) { return a.impact > b.impact; });

    if (!analysis.parameters.empty()) {
        analysis.most_sensitive_parameter = analysis.parameters.front().parameter;
        analysis.least_sensitive_parameter = analysis.parameters.back().parameter;
    }

    int stable_count = 0;
    for (const auto& r : analysis.parameters) {
        if (r.stability == ParameterStability::STABLE || r.stability == ParameterStability::MODERATE) {
            analysis.stable_parameters.push_back(r.parameter);
        } else {
            analysis.sensitive_parameters.push_back(r.parameter);
            analysis.recommendations.push_back(r.recommendation);
        }
        if (r.stability == ParameterStability::STABLE) stable_count++;
    }

    if (analysis.sensitive_parameters.size() > 3) {
        analysis.recommendations.push_back(
            "Multiple parameters are sensitive. Consider using walk-forward optimization to avoid overfitting.");
    }
    if (stable_count * 2 > static_cast<int>(analysis.parameters.size())) {
        analysis.recommendations.push_back("Most parameters are stable, indicating a robust strategy configuration.");
    }
    return analysis;
}

const char* toString(SensitivityObjective objective) {
    switch (objective) {
        case SensitivityObjective::PNL: return "pnl";
        case SensitivityObjective::SHARPE: return "sharpe";
        case SensitivityObjective::WIN_RATE: return "win_rate";
        case SensitivityObjective::PROFIT_FACTOR: return "profit_factor";
        case SensitivityObjective::MAX_DRAWDOWN: return "max_drawdown";
    }
    return "pnl";
}

const char* toString(ParameterStability stability) {
    switch (stability) {
        case ParameterStability::STABLE: return "STABLE";
        case ParameterStability::MODERATE: return "MODERATE";
        case ParameterStability::SENSITIVE: return "SENSITIVE";
        case ParameterStability::HIGHLY_SENSITIVE: return "HIGHLY_SENSITIVE";
    }
    return "STABLE";
}

SensitivityObjective sensitivityObjectiveFromString(const std::string& name) {
    if (name == "pnl") return SensitivityObjective::PNL;
    if (name == "sharpe") return SensitivityObjective::SHARPE;
    if (name == "win_rate") return SensitivityObjective::WIN_RATE;
    if (name == "profit_factor") return SensitivityObjective::PROFIT_FACTOR;
    if (name == "max_drawdown") return SensitivityObjective::MAX_DRAWDOWN;
    throw std::invalid_argument("Unknown sensitivity objective: " + name);
}

} // namespace backtest
} // namespace quantbench

#pragma once

#include "backtest/BacktestTypes.h"
#include "strategy/StrategyRegistry.h"
#include <string>
#include <vector>

namespace quantbench {
namespace backtest {

enum class SensitivityObjective { PNL, SHARPE, WIN_RATE, PROFIT_FACTOR, MAX_DRAWDOWN };

enum class ParameterStability { STABLE, MODERATE, SENSITIVE, HIGHLY_SENSITIVE };

// Swept parameter. tp_percent, sl_percent and position_size go to the tactics,
// any other name to the strategy parameters.
struct SensitivityParameter {
    std::string name;
    double base_value = 0.0;
    double min_value = 0.0;
    double max_value = 0.0;
    int steps = 10;
};

struct SensitivityPoint {
    double value = 0.0;
    double pnl = 0.0;
    double win_rate = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;      // %
    double profit_factor = 0.0;
    int trades = 0;
    bool failed = false;
    std::string error;
};

struct SensitivityResult {
    std::string parameter;
    double base_value = 0.0;
    std::vector<SensitivityPoint> points;
    double impact = 0.0;            // 0 ~ 100
    double optimal_value = 0.0;
    ParameterStability stability = ParameterStability::STABLE;
    std::string recommendation;
};

struct SensitivityAnalysis {
    std::vector<SensitivityResult> parameters;   // most impactful first
    std::string most_sensitive_parameter;
    std::string least_sensitive_parameter;
    std::vector<std::string> stable_parameters;
    std::vector<std::string> sensitive_parameters;
    std::vector<std::string> recommendations;
};

class SensitivityAnalyzer {
public:
    SensitivityAnalyzer(BacktestConfig base_config,
                        strategy::StrategyFactory factory,
                        SensitivityObjective objective = SensitivityObjective::PNL);

    SensitivityResult analyzeParameter(const std::vector<Candle>& candles, const SensitivityParameter& param) const;
    SensitivityAnalysis analyzeMultiple(const std::vector<Candle>& candles,
                                        const std::vector<SensitivityParameter>& params) const;

    static BacktestConfig applyParameterValue(const BacktestConfig& config, const std::string& name, double value);
    static double calculateImpact(const std::vector<SensitivityPoint>& points, SensitivityObjective objective);
    static ParameterStability classifyImpact(double impact);
    static double objectiveValue(const SensitivityPoint& point, SensitivityObjective objective);

private:
    std::string recommend(const SensitivityParameter& param, double optimal_value, ParameterStability stability) const;

    BacktestConfig base_config_;
    strategy::StrategyFactory factory_;
    SensitivityObjective objective_;
};

const char* toString(SensitivityObjective objective);
const char* toString(ParameterStability stability);
SensitivityObjective sensitivityObjectiveFromString(const std::string& name);

} // namespace backtest
} // namespace quantbench

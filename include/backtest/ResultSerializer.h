#pragma once

#include "backtest/BacktestTypes.h"
#include "backtest/MonteCarloSimulator.h"
#include "backtest/SensitivityAnalyzer.h"
#include "backtest/WalkForwardOptimizer.h"
#include <nlohmann/json.hpp>
#include <string>

namespace quantbench {
namespace backtest {

// Non-finite numbers (infinite profit factor, NaN) are written as null.
nlohmann::json toJson(const strategy::StrategyParameters& params);
nlohmann::json toJson(const PositionFill& fill);
nlohmann::json toJson(const Trade& trade);
nlohmann::json toJson(const EquityPoint& point);
nlohmann::json toJson(const BacktestMetrics& metrics);
nlohmann::json toJson(const BacktestLogEntry& entry);
nlohmann::json toJson(const BacktestConfig& config);
nlohmann::json toJson(const BacktestResult& result);
nlohmann::json toJson(const SegmentResult& segment);
nlohmann::json toJson(const WalkForwardResult& result);
nlohmann::json toJson(const MonteCarloResult& result);
nlohmann::json toJson(const SensitivityResult& result);
nlohmann::json toJson(const SensitivityAnalysis& analysis);

// Pretty-printed; throws std::runtime_error when the file cannot be written
void writeJson(const std::string& path, const nlohmann::json& doc);

} // namespace backtest
} // namespace quantbench

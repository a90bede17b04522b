#include "backtest/SensitivityAnalyzer.h"
#include "common/Logger.h"
#include "TestSupport.h"

#include <iostream>
#include <memory>
#include <stdexcept>

using namespace quantbench::backtest;
using quantbench::strategy::IStrategy;
using quantbench::strategy::SignalType;
using quantbench::strategy::StrategyFactory;
using quantbench::test::ScriptedStrategy;
using quantbench::test::frictionlessConfig;
using quantbench::test::fromCloses;
using quantbench::test::near;

namespace {

// LONG at candle 0, closed by signal at candle 2: +10% on the notional
StrategyFactory roundTripFactory() {
    return []() -> std::shared_ptr<IStrategy> {
        auto strategy = std::make_shared<ScriptedStrategy>(1);
        strategy->entries[0] = SignalType::LONG;
        strategy->exits[2] = SignalType::EXIT_LONG;
        return strategy;
    };
}

SensitivityPoint pointWithPnl(double pnl, bool failed = false) {
    SensitivityPoint p;
    p.pnl = pnl;
    p.failed = failed;
    return p;
}

int testApplyParameterValue() {
    const auto base = frictionlessConfig();
    const auto tp = SensitivityAnalyzer::applyParameterValue(base, "tp_percent", 3.0);
    const auto sl = SensitivityAnalyzer::applyParameterValue(base, "sl_percent", 2.0);
    const auto size = SensitivityAnalyzer::applyParameterValue(base, "position_size", 25.0);
    const auto other = SensitivityAnalyzer::applyParameterValue(base, "fast_period", 7.0);

    if (!tp.tactics.take_profit.tp_percent || *tp.tactics.take_profit.tp_percent != 3.0 ||
        !sl.tactics.stop_loss.sl_percent || *sl.tactics.stop_loss.sl_percent != 2.0 ||
        size.tactics.entry.position_size != 25.0 || other.strategy_params.getInt("fast_period") != 7) {
        std::cerr << "[TEST] parameter values routed to the wrong place\n";
        return 1;
    }
    if (!base.strategy_params.empty() || base.tactics.entry.position_size != 10.0) {
        std::cerr << "[TEST] base config must not change\n";
        return 1;
    }
    return 0;
}

int testImpactAndClassification() {
    if (!near(SensitivityAnalyzer::calculateImpact({pointWithPnl(95), pointWithPnl(100), pointWithPnl(105)},
                                                   SensitivityObjective::PNL), 10.0)) {
        std::cerr << "[TEST] impact should be range over middle value\n";
        return 1;
    }
    if (SensitivityAnalyzer::calculateImpact({pointWithPnl(50), pointWithPnl(100), pointWithPnl(400)},
                                             SensitivityObjective::PNL) != 100.0) {
        std::cerr << "[TEST] impact should cap at 100\n";
        return 1;
    }
    if (SensitivityAnalyzer::calculateImpact({pointWithPnl(-10), pointWithPnl(0), pointWithPnl(10)},
                                             SensitivityObjective::PNL) != 100.0 ||
        SensitivityAnalyzer::calculateImpact({pointWithPnl(0), pointWithPnl(0)},
                                             SensitivityObjective::PNL) != 0.0) {
        std::cerr << "[TEST] zero middle value handling wrong\n";
        return 1;
    }
    // the failed point is left out entirely
    if (!near(SensitivityAnalyzer::calculateImpact(
                  {pointWithPnl(95), pointWithPnl(5000, true), pointWithPnl(100), pointWithPnl(105)},
                  SensitivityObjective::PNL), 10.0) ||
        SensitivityAnalyzer::calculateImpact({pointWithPnl(100)}, SensitivityObjective::PNL) != 0.0) {
        std::cerr << "[TEST] failed or lone points should not add impact\n";
        return 1;
    }

    if (SensitivityAnalyzer::classifyImpact(9.99) != ParameterStability::STABLE ||
        SensitivityAnalyzer::classifyImpact(10.0) != ParameterStability::MODERATE ||
        SensitivityAnalyzer::classifyImpact(25.0) != ParameterStability::SENSITIVE ||
        SensitivityAnalyzer::classifyImpact(50.0) != ParameterStability::HIGHLY_SENSITIVE) {
        std::cerr << "[TEST] stability thresholds wrong\n";
        return 1;
    }

    if (sensitivityObjectiveFromString("max_drawdown") != SensitivityObjective::MAX_DRAWDOWN) {
        std::cerr << "[TEST] objective names should parse\n";
        return 1;
    }
    bool threw = false;
    try {
        sensitivityObjectiveFromString("alpha");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[TEST] unknown objective must throw\n";
        return 1;
    }
    return 0;
}

int testAnalyzeParameter() {
    const auto candles = fromCloses({100, 100, 110, 110});
    SensitivityAnalyzer analyzer(frictionlessConfig(), roundTripFactory());

    SensitivityParameter size;
    size.name = "position_size";
    size.base_value = 10.0;
    size.min_value = 0.0;
    size.max_value = 20.0;
    size.steps = 2;

    const auto result = analyzer.analyzeParameter(candles, size);
    if (result.points.size() != 3 || !near(result.points[1].value, 10.0) || !near(result.points[2].value, 20.0)) {
        std::cerr << "[TEST] expected steps + 1 evenly spaced points\n";
        return 1;
    }
    // zero position size is rejected by the engine
    if (!result.points[0].failed || result.points[0].error.find("Position size") == std::string::npos) {
        std::cerr << "[TEST] zero size point should fail: " << result.points[0].error << "\n";
        return 1;
    }
    if (result.points[1].failed || !near(result.points[1].pnl, 100.0) || !near(result.points[2].pnl, 200.0) ||
        result.points[2].trades != 1) {
        std::cerr << "[TEST] pnl should scale with position size\n";
        return 1;
    }
    if (!near(result.impact, 50.0) || result.stability != ParameterStability::HIGHLY_SENSITIVE ||
        !near(result.optimal_value, 20.0) || result.recommendation.find("increase") == std::string::npos) {
        std::cerr << "[TEST] impact " << result.impact << " optimum " << result.optimal_value << "\n";
        return 1;
    }

    SensitivityParameter bad = size;
    bad.steps = 0;
    bool threw = false;
    try {
        analyzer.analyzeParameter(candles, bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[TEST] zero steps must throw\n";
        return 1;
    }

    threw = false;
    try {
        SensitivityAnalyzer(frictionlessConfig(), StrategyFactory()).analyzeParameter(candles, size);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[TEST] missing factory must throw\n";
        return 1;
    }
    return 0;
}

int testAnalyzeMultiple() {
    const auto candles = fromCloses({100, 100, 110, 110});
    auto config = frictionlessConfig();
    config.tactics.use_stop_loss = true;
    config.tactics.stop_loss.sl_percent = 30.0;
    SensitivityAnalyzer analyzer(config, roundTripFactory(), SensitivityObjective::PNL);

    // far-away stops never trigger, so PnL does not move
    SensitivityParameter sl;
    sl.name = "sl_percent";
    sl.base_value = 30.0;
    sl.min_value = 20.0;
    sl.max_value = 40.0;
    sl.steps = 2;

    SensitivityParameter size;
    size.name = "position_size";
    size.base_value = 10.0;
    size.min_value = 10.0;
    size.max_value = 30.0;
    size.steps = 2;

    const auto analysis = analyzer.analyzeMultiple(candles, {sl, size});
    if (analysis.parameters.size() != 2 || analysis.most_sensitive_parameter != "position_size" ||
        analysis.least_sensitive_parameter != "sl_percent") {
        std::cerr << "[TEST] parameters should be ranked by impact\n";
        return 1;
    }
    if (analysis.parameters[1].impact != 0.0 || analysis.parameters[1].stability != ParameterStability::STABLE) {
        std::cerr << "[TEST] untriggered stop should be stable\n";
        return 1;
    }
    if (analysis.stable_parameters.size() != 1 || analysis.sensitive_parameters.size() != 1 ||
        analysis.recommendations.size() != 1) {
        std::cerr << "[TEST] stable/sensitive split wrong\n";
        return 1;
    }
    return 0;
}

} // namespace

int main() {
    quantbench::Logger::getInstance().initialize("logs", "warn", true);

    if (testApplyParameterValue() != 0) return 1;
    if (testImpactAndClassification() != 0) return 1;
    if (testAnalyzeParameter() != 0) return 1;
    if (testAnalyzeMultiple() != 0) return 1;

    std::cout << "[TEST] Sensitivity PASSED\n";
    return 0;
}

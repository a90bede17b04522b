#pragma once

#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestTypes.h"
#include "backtest/MonteCarloSimulator.h"
#include "backtest/WalkForwardOptimizer.h"

namespace quantbench {

// Process-wide settings file. The backtest core never reads this; callers
// pull the typed records out and pass them in.
class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults. Malformed JSON throws std::runtime_error,
    // invalid values throw std::invalid_argument.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // Back to built-in defaults
    void reset();

    backtest::BacktestConfig getBacktestConfig() const;
    backtest::WalkForwardConfig getWalkForwardConfig() const;
    backtest::MonteCarloConfig getMonteCarloConfig() const;
    std::string getLogLevel() const;
    std::string getLogDir() const;
    bool isConsoleOnly() const;

private:
    Config() = default;

    mutable std::mutex mutex_;
    backtest::BacktestConfig backtest_config_;
    backtest::WalkForwardConfig walk_forward_config_;
    backtest::MonteCarloConfig monte_carlo_config_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    bool console_only_ = false;
};

} // namespace quantbench

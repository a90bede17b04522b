#pragma once

#include "analytics/TechnicalIndicators.h"
#include "backtest/BacktestTypes.h"
#include "backtest/PositionLedger.h"
#include "strategy/IStrategy.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace quantbench {
namespace backtest {

// Receives the progress percentage; it has no access to simulation state
using ProgressCallback = std::function<void(double)>;

// Drives one simulation over a candle series. Per candle:
//   1. mark positions to the close, liquidate breached positions
//   2. stop loss, then take-profit targets in order, then strategy exit
//      signal, time exit, break-even and trailing-stop updates
//   3. entry signal from the strategy
//   4. equity point
//   5. drawdown circuit breaker
// A stop loss and a take-profit target touched by the same candle resolve to
// the stop loss.
class BacktestEngine {
public:
    static constexpr int PROGRESS_INTERVAL = 100;

    BacktestEngine(BacktestConfig config, std::shared_ptr<strategy::IStrategy> strategy);

    // Never throws; failures are reported through status and error_message
    BacktestResult run(const std::vector<Candle>& candles, const ProgressCallback& on_progress = nullptr);

    const BacktestConfig& config() const { return config_; }

private:
    void reset();
    BacktestResult fail(const std::string& message);

    void updatePositions(const Candle& candle, int index);
    void checkExitConditions(const Candle& candle, int index, const strategy::IndicatorResult& indicators);
    void applyBreakeven(Position& position, const Candle& candle, int index);
    void updateTrailingStop(Position& position, const Candle& candle, int index);
    void checkEntrySignal(const Candle& candle, int index, const strategy::IndicatorResult& indicators);
    void openPosition(TradeDirection direction, const Candle& candle, int index);
    void recordEquityPoint(const Candle& candle, int index);

    double calculatePositionSize(double price) const;
    double trailingDistance(const Position& position, double mark) const;
    double atrValue(int period) const;

    void log(LogLevel level, const Candle& candle, int index,
             const std::string& message, nlohmann::json data = nlohmann::json::object());

    BacktestConfig config_;
    std::shared_ptr<strategy::IStrategy> strategy_;
    std::unique_ptr<PositionLedger> ledger_;

    // candles[0..i] at step i
    std::vector<Candle> history_;
    std::map<int, analytics::AtrTracker> atr_trackers_;

    BacktestResult result_;
    double max_equity_ = 0.0;
    double max_drawdown_ = 0.0;
    double max_drawdown_percent_ = 0.0;
    double current_drawdown_percent_ = 0.0;
    long long current_day_ = -1;
    double day_start_equity_ = 0.0;
    double last_equity_ = 0.0;
};

} // namespace backtest
} // namespace quantbench

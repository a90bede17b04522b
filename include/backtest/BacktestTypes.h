#pragma once

#include "common/Types.h"
#include "strategy/StrategyParameters.h"
#include "strategy/TacticsConfig.h"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace quantbench {
namespace backtest {

enum class PositionStatus { OPEN, CLOSED, LIQUIDATED };

enum class CloseReason {
    TP,
    SL,
    SIGNAL,
    MANUAL,
    LIQUIDATION,
    TIME,
    TRAILING_STOP
};

enum class BacktestStatus { PENDING, RUNNING, COMPLETED, FAILED, CANCELLED };

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };

enum class MarginMode { ISOLATED, CROSS };

// Entry or exit execution against one candle
struct PositionFill {
    double price = 0.0;
    double size = 0.0;
    double fee = 0.0;
    double pnl = 0.0;           // gross, exits only
    long long timestamp = 0;
    int candle_index = 0;
    CloseReason reason = CloseReason::MANUAL;  // exits only
};

struct TakeProfitTarget {
    double price = 0.0;
    double close_percent = 100.0;   // % of the size at open
    bool filled = false;
};

struct TrailingState {
    bool enabled = false;
    bool active = false;
    strategy::TrailingType type = strategy::TrailingType::PERCENT;
    double value = 0.0;
    int atr_period = 14;
    double atr_multiplier = 2.0;
    std::optional<double> activation_profit;
    std::optional<double> activation_price;
    std::optional<int> activation_after_tp;
    double high_water = 0.0;    // highest high (LONG) / lowest low (SHORT) since activation
    int updates = 0;
};

struct Position {
    std::string id;
    std::string symbol;
    TradeDirection direction = TradeDirection::LONG;
    PositionStatus status = PositionStatus::OPEN;

    std::vector<PositionFill> entries;
    std::vector<PositionFill> exits;
    double avg_entry_price = 0.0;
    double initial_size = 0.0;
    double total_size = 0.0;        // remaining

    std::optional<double> stop_loss;
    bool stop_from_trailing = false;
    bool breakeven_applied = false;
    std::vector<TakeProfitTarget> take_profits;
    int filled_targets = 0;
    TrailingState trailing;

    double leverage = 1.0;
    double margin = 0.0;            // posted at open
    double remaining_margin = 0.0;
    double liquidation_price = 0.0;

    double current_price = 0.0;
    double unrealized_pnl = 0.0;
    double realized_pnl = 0.0;      // gross PnL of exit fills
    double fees = 0.0;              // entry + exit fees

    double max_favorable_excursion = 0.0;
    double max_adverse_excursion = 0.0;

    long long opened_at = 0;
    int opened_at_index = 0;

    double exitedSize() const {
        double s = 0.0;
        for (const auto& e : exits) s += e.size;
        return s;
    }
};

// Finalized position
struct Trade {
    std::string id;
    std::string position_id;
    std::string symbol;
    TradeDirection direction = TradeDirection::LONG;

    double avg_entry_price = 0.0;
    double avg_exit_price = 0.0;
    double size = 0.0;              // size at open
    double leverage = 1.0;
    double margin = 0.0;

    long long opened_at = 0;
    int opened_at_index = 0;
    long long closed_at = 0;
    int closed_at_index = 0;

    double pnl = 0.0;               // gross
    double pnl_percent = 0.0;       // net PnL / margin * 100
    double fees = 0.0;
    double net_pnl = 0.0;

    double duration_minutes = 0.0;
    int duration_candles = 0;
    CloseReason close_reason = CloseReason::MANUAL;
    bool liquidated = false;

    double max_favorable_excursion = 0.0;
    double max_adverse_excursion = 0.0;

    std::vector<PositionFill> exits;
};

struct EquityPoint {
    long long timestamp = 0;
    int candle_index = 0;
    double price = 0.0;

    double balance = 0.0;
    double equity = 0.0;
    double available_margin = 0.0;

    double unrealized_pnl = 0.0;
    double realized_pnl = 0.0;      // cumulative net of closed trades
    double daily_pnl = 0.0;
    double cumulative_pnl = 0.0;    // equity - initial balance

    double max_equity = 0.0;
    double drawdown = 0.0;
    double drawdown_percent = 0.0;
    double max_drawdown = 0.0;
    double max_drawdown_percent = 0.0;

    int open_positions = 0;
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
};

struct BacktestMetrics {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    int long_trades = 0;
    int short_trades = 0;
    double win_rate = 0.0;          // %

    double total_pnl = 0.0;
    double total_pnl_percent = 0.0;
    double avg_pnl = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double max_win = 0.0;
    double max_loss = 0.0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;        // absolute
    double total_fees = 0.0;

    double profit_factor = 0.0;
    double risk_reward_ratio = 0.0;
    double expectancy = 0.0;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double calmar_ratio = 0.0;

    double max_drawdown = 0.0;
    double max_drawdown_percent = 0.0;
    double avg_drawdown = 0.0;              // % over candles in drawdown
    double max_drawdown_duration = 0.0;     // days
    double time_in_drawdown = 0.0;          // % of candles

    double avg_trade_duration = 0.0;        // minutes
    double max_trade_duration = 0.0;
    double avg_win_duration = 0.0;
    double avg_loss_duration = 0.0;

    int max_consecutive_wins = 0;
    int max_consecutive_losses = 0;
    int current_streak = 0;                 // >0 wins, <0 losses

    double annualized_return = 0.0;
    double volatility = 0.0;                // annualized, %
    double var95 = 0.0;                     // % loss per candle
    double expected_shortfall95 = 0.0;

    double market_exposure = 0.0;           // % of candles with an open position
    double avg_position_size = 0.0;         // notional at open
    double avg_leverage = 0.0;

    std::map<std::string, int> exit_reason_counts;
};

struct BacktestConfig {
    std::string id = "backtest";
    std::string name;
    std::string symbol = "BTCUSDT";
    std::string timeframe = "1h";
    long long start_date = 0;       // ms, 0 = unbounded
    long long end_date = 0;

    double initial_balance = 10000.0;
    std::string currency = "USDT";

    std::string strategy_id;
    strategy::StrategyParameters strategy_params;
    strategy::TacticsSet tactics;

    double fee_percent = 0.1;
    double slippage_percent = 0.0;
    double max_leverage = 10.0;
    MarginMode margin_mode = MarginMode::ISOLATED;
    bool allow_short = true;

    std::optional<double> max_drawdown;     // abort threshold, %
    int max_open_positions = 3;

    bool record_debug_logs = false;

    // Empty when usable
    std::vector<std::string> validate() const;
};

struct BacktestLogEntry {
    long long timestamp = 0;
    int candle_index = 0;
    LogLevel level = LogLevel::INFO;
    std::string message;
    nlohmann::json data;
};

struct BacktestResult {
    std::string id;
    BacktestConfig config;
    BacktestStatus status = BacktestStatus::PENDING;
    double progress = 0.0;          // 0 ~ 100

    std::vector<Trade> trades;
    std::vector<EquityPoint> equity_curve;
    BacktestMetrics metrics;
    std::vector<BacktestLogEntry> logs;

    double initial_balance = 0.0;
    double final_balance = 0.0;
    double final_equity = 0.0;

    int candles_processed = 0;
    int signals_generated = 0;
    int signals_skipped = 0;
    bool aborted_on_drawdown = false;

    double duration_ms = 0.0;
    std::string error_message;
};

const char* toString(PositionStatus status);
const char* toString(CloseReason reason);
const char* toString(BacktestStatus status);
const char* toString(LogLevel level);
const char* toString(MarginMode mode);

MarginMode marginModeFromString(const std::string& name);

} // namespace backtest
} // namespace quantbench

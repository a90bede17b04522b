#pragma once

#include <optional>
#include <string>
#include <vector>

namespace quantbench {
namespace strategy {

enum class SizingMode {
    PERCENT,        // % of balance as notional
    FIXED,          // fixed quote amount
    RISK_BASED      // flat 2% of balance
};

enum class TakeProfitType {
    FIXED_TP,
    MULTI_TP,
    TIME_BASED
};

enum class StopLossType {
    FIXED,          // absolute price
    PERCENT,
    ATR_BASED
};

enum class TrailingType {
    PERCENT,
    FIXED,
    ATR_BASED
};

struct EntryTactic {
    SizingMode position_sizing = SizingMode::PERCENT;
    double position_size = 10.0;
    double leverage = 1.0;
};

// One rung of the take-profit ladder. Either price or profit_percent is set.
struct TakeProfitTargetSpec {
    std::optional<double> price;
    std::optional<double> profit_percent;
    double close_percent = 100.0;   // % of the size at open
};

struct TakeProfitTactic {
    TakeProfitType type = TakeProfitType::FIXED_TP;
    std::optional<double> tp_price;
    std::optional<double> tp_percent;
    std::vector<TakeProfitTargetSpec> targets;
    std::optional<double> max_holding_minutes;  // TIME close
};

struct StopLossTactic {
    StopLossType type = StopLossType::PERCENT;
    std::optional<double> sl_price;
    std::optional<double> sl_percent;
    std::optional<double> atr_multiplier;
    int atr_period = 14;
    std::optional<double> move_to_breakeven_after;  // profit % that pulls the stop to entry
};

struct TrailingStopTactic {
    bool enabled = false;
    TrailingType type = TrailingType::PERCENT;
    double value = 1.0;             // percent or absolute distance
    int atr_period = 14;
    double atr_multiplier = 2.0;
    std::optional<double> activation_profit;    // %
    std::optional<double> activation_price;
    std::optional<int> activation_after_tp;     // number of filled targets
};

struct TacticsSet {
    std::string id = "default";
    std::string name = "Default";
    EntryTactic entry;
    TakeProfitTactic take_profit;
    StopLossTactic stop_loss;
    TrailingStopTactic trailing;
    bool use_stop_loss = false;
    bool use_take_profit = false;
};

// Empty when the tactics set is usable
std::vector<std::string> validateTactics(const TacticsSet& tactics);

const char* toString(SizingMode mode);
const char* toString(TakeProfitType type);
const char* toString(StopLossType type);
const char* toString(TrailingType type);

// Throw std::invalid_argument for unknown names
SizingMode sizingModeFromString(const std::string& name);
TakeProfitType takeProfitTypeFromString(const std::string& name);
StopLossType stopLossTypeFromString(const std::string& name);
TrailingType trailingTypeFromString(const std::string& name);

} // namespace strategy
} // namespace quantbench

#include "strategy/TacticsConfig.h"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace quantbench {
namespace strategy {

std::vector<std::string> validateTactics(const TacticsSet& tactics) {
    std::vector<std::string> errors;

    if (tactics.entry.position_size <= 0.0) {
        errors.push_back("Position size must be positive");
    }
    if (tactics.entry.position_sizing == SizingMode::PERCENT && tactics.entry.position_size > 100.0) {
        errors.push_back("Percent position size cannot exceed 100");
    }
    if (tactics.entry.leverage < 1.0) {
        errors.push_back("Leverage must be at least 1");
    }

    if (tactics.use_take_profit) {
        const auto& tp = tactics.take_profit;
        if (tp.type == TakeProfitType::MULTI_TP) {
            if (tp.targets.empty()) {
                errors.push_back("MULTI_TP requires at least one target");
            }
            double total = 0.0;
            for (size_t i = 0; i < tp.targets.size(); ++i) {
                const auto& target = tp.targets[i];
                if (!target.price && !target.profit_percent) {
                    errors.push_back("Take profit target " + std::to_string(i + 1) + " needs a price or profit percent");
                }
                if (target.close_percent <= 0.0) {
                    errors.push_back("Take profit target " + std::to_string(i + 1) + " close percent must be positive");
                }
                total += target.close_percent;
            }
            if (!tp.targets.empty() && std::abs(total - 100.0) > 0.01) {
                std::ostringstream oss;
                oss << "Take profit close percentages must sum to 100 (got " << total << ")";
                errors.push_back(oss.str());
            }
        } else if (tp.type == TakeProfitType::FIXED_TP) {
            if (!tp.tp_price && !tp.tp_percent && tp.targets.empty()) {
                errors.push_back("Take profit needs a price, percent or targets");
            }
        } else if (tp.type == TakeProfitType::TIME_BASED) {
            if (!tp.max_holding_minutes || *tp.max_holding_minutes <= 0.0) {
                errors.push_back("TIME_BASED take profit needs a positive max holding time");
            }
        }
    }

    if (tactics.use_stop_loss) {
        const auto& sl = tactics.stop_loss;
        switch (sl.type) {
            case StopLossType::FIXED:
                if (!sl.sl_price) errors.push_back("FIXED stop loss needs a price");
                break;
            case StopLossType::PERCENT:
                if (!sl.sl_percent || *sl.sl_percent <= 0.0) errors.push_back("PERCENT stop loss needs a positive percent");
                break;
            case StopLossType::ATR_BASED:
                if (!sl.atr_multiplier || *sl.atr_multiplier <= 0.0) errors.push_back("ATR_BASED stop loss needs a positive multiplier");
                if (sl.atr_period <= 0) errors.push_back("ATR period must be positive");
                break;
        }
    }

    if (tactics.trailing.enabled) {
        const auto& tr = tactics.trailing;
        if (tr.type == TrailingType::ATR_BASED) {
            if (tr.atr_period <= 0 || tr.atr_multiplier <= 0.0) {
                errors.push_back("ATR trailing stop needs positive period and multiplier");
            }
        } else if (tr.value <= 0.0) {
            errors.push_back("Trailing stop distance must be positive");
        }
    }

    return errors;
}

const char* toString(SizingMode mode) {
    switch (mode) {
        case SizingMode::PERCENT: return "PERCENT";
        case SizingMode::FIXED: return "FIXED";
        case SizingMode::RISK_BASED: return "RISK_BASED";
    }
    return "PERCENT";
}

const char* toString(TakeProfitType type) {
    switch (type) {
        case TakeProfitType::FIXED_TP: return "FIXED_TP";
        case TakeProfitType::MULTI_TP: return "MULTI_TP";
        case TakeProfitType::TIME_BASED: return "TIME_BASED";
    }
    return "FIXED_TP";
}

const char* toString(StopLossType type) {
    switch (type) {
        case StopLossType::FIXED: return "FIXED";
        case StopLossType::PERCENT: return "PERCENT";
        case StopLossType::ATR_BASED: return "ATR_BASED";
    }
    return "PERCENT";
}

const char* toString(TrailingType type) {
    switch (type) {
        case TrailingType::PERCENT: return "PERCENT";
        case TrailingType::FIXED: return "FIXED";
        case TrailingType::ATR_BASED: return "ATR_BASED";
    }
    return "PERCENT";
}

SizingMode sizingModeFromString(const std::string& name) {
    if (name == "PERCENT") return SizingMode::PERCENT;
    if (name == "FIXED") return SizingMode::FIXED;
    if (name == "RISK_BASED") return SizingMode::RISK_BASED;
    throw std::invalid_argument("Unknown position sizing mode: " + name);
}

TakeProfitType takeProfitTypeFromString(const std::string& name) {
    if (name == "FIXED_TP") return TakeProfitType::FIXED_TP;
    if (name == "MULTI_TP") return TakeProfitType::MULTI_TP;
    if (name == "TIME_BASED") return TakeProfitType::TIME_BASED;
    throw std::invalid_argument("Unknown take profit type: " + name);
}

StopLossType stopLossTypeFromString(const std::string& name) {
    if (name == "FIXED") return StopLossType::FIXED;
    if (name == "PERCENT") return StopLossType::PERCENT;
    if (name == "ATR_BASED") return StopLossType::ATR_BASED;
    throw std::invalid_argument("Unknown stop loss type: " + name);
}

TrailingType trailingTypeFromString(const std::string& name) {
    if (name == "PERCENT") return TrailingType::PERCENT;
    if (name == "FIXED") return TrailingType::FIXED;
    if (name == "ATR_BASED") return TrailingType::ATR_BASED;
    throw std::invalid_argument("Unknown trailing stop type: " + name);
}

} // namespace strategy
} // namespace quantbench

#include "backtest/BacktestTypes.h"

#include <stdexcept>

namespace quantbench {
namespace backtest {

std::vector<std::string> BacktestConfig::validate() const {
    std::vector<std::string> errors;

    if (initial_balance <= 0.0) {
        errors.push_back("Initial balance must be positive");
    }
    if (fee_percent < 0.0) {
        errors.push_back("Fee percent cannot be negative");
    }
    if (slippage_percent < 0.0) {
        errors.push_back("Slippage percent cannot be negative");
    }
    if (max_leverage < 1.0) {
        errors.push_back("Max leverage must be at least 1");
    }
    if (max_open_positions < 1) {
        errors.push_back("Max open positions must be at least 1");
    }
    if (max_drawdown && (*max_drawdown <= 0.0 || *max_drawdown > 100.0)) {
        errors.push_back("Max drawdown must be in (0, 100]");
    }
    if (start_date > 0 && end_date > 0 && end_date <= start_date) {
        errors.push_back("End date must be after start date");
    }

    for (const auto& e : strategy::validateTactics(tactics)) {
        errors.push_back("Tactics: " + e);
    }
    return errors;
}

const char* toString(PositionStatus status) {
    switch (status) {
        case PositionStatus::OPEN: return "OPEN";
        case PositionStatus::CLOSED: return "CLOSED";
        case PositionStatus::LIQUIDATED: return "LIQUIDATED";
    }
    return "OPEN";
}

const char* toString(CloseReason reason) {
    switch (reason) {
        case CloseReason::TP: return "TP";
        case CloseReason::SL: return "SL";
        case CloseReason::SIGNAL: return "SIGNAL";
        case CloseReason::MANUAL: return "MANUAL";
        case CloseReason::LIQUIDATION: return "LIQUIDATION";
        case CloseReason::TIME: return "TIME";
        case CloseReason::TRAILING_STOP: return "TRAILING_STOP";
    }
    return "MANUAL";
}

const char* toString(BacktestStatus status) {
    switch (status) {
        case BacktestStatus::PENDING: return "PENDING";
        case BacktestStatus::RUNNING: return "RUNNING";
        case BacktestStatus::COMPLETED: return "COMPLETED";
        case BacktestStatus::FAILED: return "FAILED";
        case BacktestStatus::CANCELLED: return "CANCELLED";
    }
    return "PENDING";
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

const char* toString(MarginMode mode) {
    return mode == MarginMode::CROSS ? "CROSS" : "ISOLATED";
}

MarginMode marginModeFromString(const std::string& name) {
    if (name == "ISOLATED") return MarginMode::ISOLATED;
    if (name == "CROSS") return MarginMode::CROSS;
    throw std::invalid_argument("Unknown margin mode: " + name);
}

} // namespace backtest
} // namespace quantbench

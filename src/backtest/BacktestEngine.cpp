#include "backtest/BacktestEngine.h"
#include "backtest/MetricsCalculator.h"
#include "common/Logger.h"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace quantbench {
namespace backtest {

namespace {
constexpr double RISK_BASED_FRACTION = 0.02;
constexpr double ATR_FALLBACK_FRACTION = 0.02;

strategy::PositionSnapshot snapshotOf(const Position& p) {
    strategy::PositionSnapshot s;
    s.id = p.id;
    s.direction = p.direction;
    s.avg_entry_price = p.avg_entry_price;
    s.total_size = p.total_size;
    s.unrealized_pnl = p.unrealized_pnl;
    s.opened_at = p.opened_at;
    s.opened_at_index = p.opened_at_index;
    return s;
}

double profitPercent(const Position& p, double price) {
    if (p.avg_entry_price <= 0.0) return 0.0;
    return directionSign(p.direction) * (price - p.avg_entry_price) / p.avg_entry_price * 100.0;
}

std::string joinErrors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e;
    }
    return out;
}
}

BacktestEngine::BacktestEngine(BacktestConfig config, std::shared_ptr<strategy::IStrategy> strategy)
    : config_(std::move(config))
    , strategy_(std::move(strategy))
{}

void BacktestEngine::reset() {
    result_ = BacktestResult();
    result_.id = config_.id;
    result_.config = config_;
    result_.initial_balance = config_.initial_balance;
    result_.final_balance = config_.initial_balance;
    result_.final_equity = config_.initial_balance;

    ledger_ = std::make_unique<PositionLedger>(
        config_.initial_balance, config_.fee_percent, config_.slippage_percent,
        config_.margin_mode, config_.symbol);
    history_.clear();
    atr_trackers_.clear();

    max_equity_ = config_.initial_balance;
    max_drawdown_ = 0.0;
    max_drawdown_percent_ = 0.0;
    current_drawdown_percent_ = 0.0;
    current_day_ = -1;
    day_start_equity_ = config_.initial_balance;
    last_equity_ = config_.initial_balance;
}

BacktestResult BacktestEngine::fail(const std::string& message) {
    result_.status = BacktestStatus::FAILED;
    result_.error_message = message;

    BacktestLogEntry entry;
    entry.level = LogLevel::ERROR;
    entry.message = message;
    result_.logs.push_back(entry);

    LOG_ERROR("Backtest {} failed: {}", config_.id, message);
    return std::move(result_);
}

BacktestResult BacktestEngine::run(const std::vector<Candle>& candles, const ProgressCallback& on_progress) {
    const auto started = std::chrono::steady_clock::now();
    reset();
    result_.status = BacktestStatus::RUNNING;

    if (!strategy_) {
        return fail("Strategy " + config_.strategy_id + " not found");
    }

    const auto config_errors = config_.validate();
    if (!config_errors.empty()) {
        return fail("Invalid backtest config: " + joinErrors(config_errors));
    }

    strategy::StrategyInfo info;
    // getInfo reflects the initialized parameters
    try {
        strategy_->initialize(config_.strategy_params);
        info = strategy_->getInfo();
    } catch (const std::exception& e) {
        return fail("Strategy " + config_.strategy_id + " initialization failed: " + e.what());
    } catch (...) {
        return fail("Strategy " + config_.strategy_id + " initialization failed: unknown error");
    }

    const size_t min_candles = static_cast<size_t>(std::max(1, info.min_candles_required));
    if (candles.size() < min_candles) {
        return fail(fmt::format("Insufficient candles: {} < {} required by strategy {}",
                                candles.size(), min_candles, info.id));
    }
    for (size_t i = 1; i < candles.size(); ++i) {
        if (candles[i].timestamp <= candles[i - 1].timestamp) {
            return fail(fmt::format("Candle timestamps must be strictly increasing (index {})", i));
        }
    }

    if (config_.tactics.stop_loss.type == strategy::StopLossType::ATR_BASED && config_.tactics.use_stop_loss) {
        atr_trackers_.emplace(config_.tactics.stop_loss.atr_period,
                              analytics::AtrTracker(config_.tactics.stop_loss.atr_period));
    }
    if (config_.tactics.trailing.enabled && config_.tactics.trailing.type == strategy::TrailingType::ATR_BASED) {
        atr_trackers_.emplace(config_.tactics.trailing.atr_period,
                              analytics::AtrTracker(config_.tactics.trailing.atr_period));
    }

    // The first step sees exactly min_candles candles
    const size_t start = min_candles - 1;
    const size_t total_steps = candles.size() - start;
    history_.reserve(candles.size());
    for (size_t i = 0; i < start; ++i) {
        history_.push_back(candles[i]);
        for (auto& [_, tracker] : atr_trackers_) tracker.update(candles[i]);
    }
    result_.equity_curve.reserve(total_steps);

    LOG_INFO("Backtest {} started: {} candles, strategy {}, symbol {}",
             config_.id, candles.size(), info.id, config_.symbol);
    log(LogLevel::INFO, candles[start], static_cast<int>(start),
        fmt::format("Backtest started with {} candles", candles.size()),
        {{"strategy", info.id}, {"initial_balance", config_.initial_balance}});

    size_t last_index = start;
    try {
        for (size_t i = start; i < candles.size(); ++i) {
            const Candle& candle = candles[i];
            const int index = static_cast<int>(i);
            last_index = i;

            history_.push_back(candle);
            for (auto& [_, tracker] : atr_trackers_) tracker.update(candle);

            updatePositions(candle, index);

            const strategy::IndicatorResult indicators = strategy_->populateIndicators(history_);
            checkExitConditions(candle, index, indicators);
            checkEntrySignal(candle, index, indicators);

            recordEquityPoint(candle, index);

            result_.progress = static_cast<double>(i - start) / static_cast<double>(total_steps) * 100.0;
            result_.candles_processed++;
            if (on_progress && result_.candles_processed % PROGRESS_INTERVAL == 0) {
                on_progress(result_.progress);
            }

            if (config_.max_drawdown && current_drawdown_percent_ > *config_.max_drawdown) {
                log(LogLevel::WARNING, candle, index,
                    fmt::format("Max drawdown exceeded: {:.2f}% > {:.2f}%", current_drawdown_percent_, *config_.max_drawdown),
                    {{"drawdown_percent", current_drawdown_percent_}});
                ledger_->closeAll(candle.close, CloseReason::MANUAL, candle.timestamp, index);
                result_.aborted_on_drawdown = true;
                break;
            }
        }

        if (!result_.aborted_on_drawdown) {
            const Candle& last = candles.back();
            ledger_->closeAll(last.close, CloseReason::MANUAL, last.timestamp, static_cast<int>(last_index));
            result_.progress = 100.0;
        }

        result_.status = BacktestStatus::COMPLETED;
    } catch (const std::exception& e) {
        result_.status = BacktestStatus::FAILED;
        result_.error_message = e.what();
        log(LogLevel::ERROR, candles[last_index], static_cast<int>(last_index),
            std::string("Simulation error: ") + e.what());
    } catch (...) {
        // the strategy is opaque and may throw non-standard types
        result_.status = BacktestStatus::FAILED;
        result_.error_message = "Unknown simulation error";
        log(LogLevel::ERROR, candles[last_index], static_cast<int>(last_index), result_.error_message);
    }

    result_.trades = ledger_->takeTrades();
    result_.metrics = MetricsCalculator::calculate(result_.trades, result_.equity_curve, config_.initial_balance);
    result_.final_balance = ledger_->balance();
    result_.final_equity = ledger_->equity();
    result_.duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();

    if (result_.status == BacktestStatus::COMPLETED) {
        log(LogLevel::INFO, candles[last_index], static_cast<int>(last_index),
            fmt::format("Backtest completed: {} trades, PnL {:.2f} ({:.2f}%)",
                        result_.metrics.total_trades, result_.metrics.total_pnl, result_.metrics.total_pnl_percent));
    }

    return std::move(result_);
}

void BacktestEngine::updatePositions(const Candle& candle, int index) {
    ledger_->markToMarket(candle);

    for (auto& position : ledger_->positions()) {
        if (!ledger_->isLiquidationBreached(position, candle)) continue;

        log(LogLevel::WARNING, candle, index,
            fmt::format("Position {} liquidated at {:.4f}", position.id, position.liquidation_price),
            {{"position_id", position.id}, {"liquidation_price", position.liquidation_price},
             {"forfeited_margin", position.remaining_margin}});
        ledger_->liquidate(position, candle.timestamp, index);
    }
    ledger_->purgeClosed();
}

void BacktestEngine::checkExitConditions(const Candle& candle, int index, const strategy::IndicatorResult& indicators) {
    const auto& tactics = config_.tactics;

    for (auto& position : ledger_->positions()) {
        if (position.status != PositionStatus::OPEN) continue;
        const bool is_long = position.direction == TradeDirection::LONG;

        // Stop loss wins over any take-profit target on the same candle
        if (position.stop_loss) {
            const double stop = *position.stop_loss;
            const bool hit = is_long ? candle.low <= stop : candle.high >= stop;
            if (hit) {
                const CloseReason reason = position.stop_from_trailing ? CloseReason::TRAILING_STOP : CloseReason::SL;
                log(LogLevel::INFO, candle, index,
                    fmt::format("{} hit for {} at {:.4f}", toString(reason), position.id, stop),
                    {{"position_id", position.id}, {"price", stop}});
                ledger_->closePosition(position, stop, reason, candle.timestamp, index);
                continue;
            }
        }

        for (auto& target : position.take_profits) {
            if (target.filled) continue;
            const bool hit = is_long ? candle.high >= target.price : candle.low <= target.price;
            if (!hit) continue;

            target.filled = true;
            position.filled_targets++;
            const double size = position.initial_size * target.close_percent / 100.0;
            log(LogLevel::INFO, candle, index,
                fmt::format("TP {} hit for {} at {:.4f} ({:.1f}%)", position.filled_targets, position.id,
                            target.price, target.close_percent),
                {{"position_id", position.id}, {"price", target.price}, {"close_percent", target.close_percent}});
            if (ledger_->closePartial(position, size, target.price, CloseReason::TP, candle.timestamp, index, false)) {
                break;
            }
        }
        if (position.status != PositionStatus::OPEN) continue;

        const strategy::Signal exit_signal = strategy_->populateExitSignal(history_, indicators, snapshotOf(position));
        if ((is_long && exit_signal.type == strategy::SignalType::EXIT_LONG) ||
            (!is_long && exit_signal.type == strategy::SignalType::EXIT_SHORT)) {
            log(LogLevel::INFO, candle, index,
                fmt::format("Exit signal for {}: {}", position.id, exit_signal.reason),
                {{"position_id", position.id}, {"price", candle.close}});
            ledger_->closePosition(position, candle.close, CloseReason::SIGNAL, candle.timestamp, index);
            continue;
        }

        if (tactics.take_profit.max_holding_minutes) {
            const double held = static_cast<double>(candle.timestamp - position.opened_at) / MS_PER_MINUTE;
            if (held >= *tactics.take_profit.max_holding_minutes) {
                log(LogLevel::INFO, candle, index,
                    fmt::format("Max holding time reached for {} ({:.0f} min)", position.id, held),
                    {{"position_id", position.id}});
                ledger_->closePosition(position, candle.close, CloseReason::TIME, candle.timestamp, index);
                continue;
            }
        }

        applyBreakeven(position, candle, index);
        updateTrailingStop(position, candle, index);
    }

    ledger_->purgeClosed();
}

void BacktestEngine::applyBreakeven(Position& position, const Candle& candle, int index) {
    const auto& sl = config_.tactics.stop_loss;
    if (!sl.move_to_breakeven_after || position.breakeven_applied) return;
    if (profitPercent(position, candle.close) < *sl.move_to_breakeven_after) return;

    position.breakeven_applied = true;
    const double entry = position.avg_entry_price;
    const bool tighter = !position.stop_loss ||
        (position.direction == TradeDirection::LONG ? entry > *position.stop_loss : entry < *position.stop_loss);
    if (tighter) {
        position.stop_loss = entry;
        position.stop_from_trailing = false;
        log(LogLevel::DEBUG, candle, index,
            fmt::format("Stop for {} moved to break-even {:.4f}", position.id, entry));
    }
}

void BacktestEngine::updateTrailingStop(Position& position, const Candle& candle, int index) {
    auto& trailing = position.trailing;
    if (!trailing.enabled) return;

    const bool is_long = position.direction == TradeDirection::LONG;

    if (!trailing.active) {
        bool activate = false;
        if (trailing.activation_profit && profitPercent(position, candle.close) >= *trailing.activation_profit) {
            activate = true;
        }
        if (trailing.activation_price &&
            (is_long ? candle.high >= *trailing.activation_price : candle.low <= *trailing.activation_price)) {
            activate = true;
        }
        if (trailing.activation_after_tp && position.filled_targets >= *trailing.activation_after_tp) {
            activate = true;
        }
        if (!activate) return;

        trailing.active = true;
        trailing.high_water = is_long ? candle.high : candle.low;
        log(LogLevel::INFO, candle, index, fmt::format("Trailing stop activated for {}", position.id),
            {{"position_id", position.id}, {"high_water", trailing.high_water}});
    } else {
        trailing.high_water = is_long ? std::max(trailing.high_water, candle.high)
                                      : std::min(trailing.high_water, candle.low);
    }

    const double distance = trailingDistance(position, trailing.high_water);
    const double candidate = is_long ? trailing.high_water - distance : trailing.high_water + distance;
    if (candidate <= 0.0) return;

    // Never loosen
    const bool better = !position.stop_loss ||
        (is_long ? candidate > *position.stop_loss : candidate < *position.stop_loss);
    if (!better) return;

    position.stop_loss = candidate;
    position.stop_from_trailing = true;
    trailing.updates++;
    log(LogLevel::DEBUG, candle, index,
        fmt::format("Trailing stop for {} updated to {:.4f}", position.id, candidate));
}

double BacktestEngine::trailingDistance(const Position& position, double mark) const {
    const auto& trailing = position.trailing;
    switch (trailing.type) {
        case strategy::TrailingType::PERCENT:
            return mark * trailing.value / 100.0;
        case strategy::TrailingType::FIXED:
            return trailing.value;
        case strategy::TrailingType::ATR_BASED: {
            const double atr = atrValue(trailing.atr_period);
            return (atr > 0.0) ? atr * trailing.atr_multiplier : mark * ATR_FALLBACK_FRACTION;
        }
    }
    return mark * ATR_FALLBACK_FRACTION;
}

double BacktestEngine::atrValue(int period) const {
    auto it = atr_trackers_.find(period);
    return (it != atr_trackers_.end()) ? it->second.value() : 0.0;
}

void BacktestEngine::checkEntrySignal(const Candle& candle, int index, const strategy::IndicatorResult& indicators) {
    const strategy::Signal signal = strategy_->populateEntrySignal(history_, indicators, candle.close);
    if (signal.type != strategy::SignalType::LONG && signal.type != strategy::SignalType::SHORT) {
        return;
    }
    result_.signals_generated++;

    const TradeDirection direction =
        (signal.type == strategy::SignalType::LONG) ? TradeDirection::LONG : TradeDirection::SHORT;

    if (direction == TradeDirection::SHORT && !config_.allow_short) {
        result_.signals_skipped++;
        log(LogLevel::DEBUG, candle, index, "SHORT signal ignored: shorting disabled");
        return;
    }
    if (ledger_->openCount() >= config_.max_open_positions) {
        result_.signals_skipped++;
        log(LogLevel::DEBUG, candle, index, "Signal ignored: max open positions reached");
        return;
    }

    openPosition(direction, candle, index);
}

double BacktestEngine::calculatePositionSize(double price) const {
    if (price <= 0.0) return 0.0;
    const auto& entry = config_.tactics.entry;
    const double balance = ledger_->balance();

    switch (entry.position_sizing) {
        case strategy::SizingMode::PERCENT:
            return (balance * entry.position_size / 100.0) / price;
        case strategy::SizingMode::FIXED:
            return entry.position_size / price;
        case strategy::SizingMode::RISK_BASED:
            return (balance * RISK_BASED_FRACTION) / price;
    }
    return 0.0;
}

void BacktestEngine::openPosition(TradeDirection direction, const Candle& candle, int index) {
    const auto& tactics = config_.tactics;
    const double leverage = std::min(config_.max_leverage, std::max(1.0, tactics.entry.leverage));
    const double size = calculatePositionSize(candle.close);

    if (!ledger_->canAfford(size, candle.close, leverage)) {
        result_.signals_skipped++;
        log(LogLevel::WARNING, candle, index,
            fmt::format("Insufficient balance to open {} position ({:.2f} available)",
                        toString(direction), ledger_->balance()));
        return;
    }

    Position& position = ledger_->open(direction, size, candle.close, leverage, candle.timestamp, index);
    const double entry = position.avg_entry_price;
    const double sign = directionSign(direction);

    if (tactics.use_stop_loss) {
        const auto& sl = tactics.stop_loss;
        switch (sl.type) {
            case strategy::StopLossType::FIXED:
                if (sl.sl_price) position.stop_loss = *sl.sl_price;
                break;
            case strategy::StopLossType::PERCENT:
                if (sl.sl_percent) position.stop_loss = entry * (1.0 - sign * *sl.sl_percent / 100.0);
                break;
            case strategy::StopLossType::ATR_BASED: {
                const double atr = atrValue(sl.atr_period);
                const double distance = (atr > 0.0) ? atr * sl.atr_multiplier.value_or(1.0)
                                                    : entry * ATR_FALLBACK_FRACTION;
                position.stop_loss = entry - sign * distance;
                break;
            }
        }
    }

    if (tactics.use_take_profit) {
        const auto& tp = tactics.take_profit;
        if (!tp.targets.empty()) {
            for (const auto& spec : tp.targets) {
                TakeProfitTarget target;
                target.price = spec.price ? *spec.price
                                          : entry * (1.0 + sign * spec.profit_percent.value_or(0.0) / 100.0);
                target.close_percent = spec.close_percent;
                position.take_profits.push_back(target);
            }
        } else if (tp.tp_price) {
            TakeProfitTarget target;
            target.price = *tp.tp_price;
            position.take_profits.push_back(target);
        } else if (tp.tp_percent) {
            TakeProfitTarget target;
            target.price = entry * (1.0 + sign * *tp.tp_percent / 100.0);
            position.take_profits.push_back(target);
        }
    }

    const auto& tr = tactics.trailing;
    if (tr.enabled) {
        position.trailing.enabled = true;
        position.trailing.type = tr.type;
        position.trailing.value = tr.value;
        position.trailing.atr_period = tr.atr_period;
        position.trailing.atr_multiplier = tr.atr_multiplier;
        position.trailing.activation_profit = tr.activation_profit;
        position.trailing.activation_price = tr.activation_price;
        position.trailing.activation_after_tp = tr.activation_after_tp;
        if (!tr.activation_profit && !tr.activation_price && !tr.activation_after_tp) {
            position.trailing.active = true;
            position.trailing.high_water = entry;
        }
    }

    nlohmann::json data = {
        {"position_id", position.id},
        {"direction", toString(direction)},
        {"price", entry},
        {"size", size},
        {"leverage", leverage},
        {"margin", position.margin},
        {"liquidation_price", position.liquidation_price}
    };
    if (position.stop_loss) data["stop_loss"] = *position.stop_loss;
    log(LogLevel::INFO, candle, index,
        fmt::format("Opened {} {} size {:.6f} at {:.4f} (leverage {:.1f}x)",
                    toString(direction), position.id, size, entry, leverage),
        data);
}

void BacktestEngine::recordEquityPoint(const Candle& candle, int index) {
    const double equity = ledger_->equity();
    max_equity_ = std::max(max_equity_, equity);

    const double drawdown = std::max(0.0, max_equity_ - equity);
    current_drawdown_percent_ = (max_equity_ > 1e-12) ? std::clamp(drawdown / max_equity_ * 100.0, 0.0, 100.0) : 0.0;
    max_drawdown_ = std::max(max_drawdown_, drawdown);
    max_drawdown_percent_ = std::max(max_drawdown_percent_, current_drawdown_percent_);

    const long long day = candle.timestamp / MS_PER_DAY;
    if (day != current_day_) {
        current_day_ = day;
        day_start_equity_ = last_equity_;
    }
    last_equity_ = equity;

    EquityPoint point;
    point.timestamp = candle.timestamp;
    point.candle_index = index;
    point.price = candle.close;
    point.balance = ledger_->balance();
    point.equity = equity;
    point.available_margin = ledger_->balance();
    point.unrealized_pnl = ledger_->unrealizedPnl();
    point.realized_pnl = ledger_->realizedNetPnl();
    point.daily_pnl = equity - day_start_equity_;
    point.cumulative_pnl = equity - config_.initial_balance;
    point.max_equity = max_equity_;
    point.drawdown = drawdown;
    point.drawdown_percent = current_drawdown_percent_;
    point.max_drawdown = max_drawdown_;
    point.max_drawdown_percent = max_drawdown_percent_;
    point.open_positions = ledger_->openCount();
    point.total_trades = static_cast<int>(ledger_->trades().size());
    point.winning_trades = ledger_->winningTrades();
    point.losing_trades = ledger_->losingTrades();
    result_.equity_curve.push_back(point);
}

void BacktestEngine::log(LogLevel level, const Candle& candle, int index,
                         const std::string& message, nlohmann::json data) {
    switch (level) {
        case LogLevel::DEBUG: LOG_DEBUG("[{}] {}", index, message); break;
        case LogLevel::INFO: LOG_INFO("[{}] {}", index, message); break;
        case LogLevel::WARNING: LOG_WARN("[{}] {}", index, message); break;
        case LogLevel::ERROR: LOG_ERROR("[{}] {}", index, message); break;
    }

    if (level == LogLevel::DEBUG && !config_.record_debug_logs) return;

    BacktestLogEntry entry;
    entry.timestamp = candle.timestamp;
    entry.candle_index = index;
    entry.level = level;
    entry.message = message;
    entry.data = std::move(data);
    result_.logs.push_back(std::move(entry));
}

} // namespace backtest
} // namespace quantbench

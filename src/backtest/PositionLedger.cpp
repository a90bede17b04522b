#include "backtest/PositionLedger.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quantbench {
namespace backtest {

namespace {
constexpr double SIZE_EPSILON = 1e-9;
}

PositionLedger::PositionLedger(double initial_balance,
                               double fee_percent,
                               double slippage_percent,
                               MarginMode margin_mode,
                               const std::string& symbol)
    : symbol_(symbol)
    , balance_(initial_balance)
    , fee_rate_(fee_percent / 100.0)
    , slippage_rate_(slippage_percent / 100.0)
    , margin_mode_(margin_mode)
{}

double PositionLedger::applySlippage(double price, TradeDirection direction, bool is_entry) const {
    // Buying pays up, selling receives less
    const bool buying = (direction == TradeDirection::LONG) == is_entry;
    return buying ? price * (1.0 + slippage_rate_) : price * (1.0 - slippage_rate_);
}

double PositionLedger::fee(double size, double price) const {
    return size * price * fee_rate_;
}

double PositionLedger::requiredCapital(double size, double price, double leverage) const {
    const double lev = std::max(1.0, leverage);
    const double fill = price * (1.0 + slippage_rate_);
    return size * fill / lev + fee(size, fill);
}

bool PositionLedger::canAfford(double size, double price, double leverage) const {
    return size > 0.0 && requiredCapital(size, price, leverage) <= balance_;
}

Position& PositionLedger::open(TradeDirection direction,
                               double size,
                               double reference_price,
                               double leverage,
                               long long timestamp,
                               int candle_index) {
    if (!(size > 0.0) || !(reference_price > 0.0)) {
        throw std::invalid_argument("Position size and price must be positive");
    }

    const double lev = std::max(1.0, leverage);
    const double fill_price = applySlippage(reference_price, direction, true);
    const double margin = size * fill_price / lev;
    const double entry_fee = fee(size, fill_price);

    if (margin + entry_fee > balance_ + SIZE_EPSILON) {
        throw std::runtime_error("Insufficient balance for margin and entry fee");
    }

    balance_ -= margin + entry_fee;
    total_fees_ += entry_fee;

    Position position;
    position.id = "pos-" + std::to_string(++position_seq_);
    position.symbol = symbol_;
    position.direction = direction;
    position.status = PositionStatus::OPEN;
    position.avg_entry_price = fill_price;
    position.initial_size = size;
    position.total_size = size;
    position.leverage = lev;
    position.margin = margin;
    position.remaining_margin = margin;
    position.current_price = reference_price;
    position.fees = entry_fee;
    position.opened_at = timestamp;
    position.opened_at_index = candle_index;

    if (margin_mode_ == MarginMode::CROSS) {
        // Free balance backs the position as well
        const double buffer = (margin + balance_) / size;
        position.liquidation_price = (direction == TradeDirection::LONG)
            ? std::max(0.0, fill_price - buffer)
            : fill_price + buffer;
    } else {
        position.liquidation_price = (direction == TradeDirection::LONG)
            ? fill_price * (1.0 - 1.0 / lev)
            : fill_price * (1.0 + 1.0 / lev);
    }

    PositionFill entry;
    entry.price = fill_price;
    entry.size = size;
    entry.fee = entry_fee;
    entry.timestamp = timestamp;
    entry.candle_index = candle_index;
    position.entries.push_back(entry);

    positions_.push_back(position);
    return positions_.back();
}

void PositionLedger::markToMarket(const Candle& candle) {
    for (auto& position : positions_) {
        if (position.status != PositionStatus::OPEN) continue;

        const double sign = directionSign(position.direction);
        position.current_price = candle.close;
        position.unrealized_pnl = sign * (candle.close - position.avg_entry_price) * position.total_size;

        const double best = (position.direction == TradeDirection::LONG) ? candle.high : candle.low;
        const double worst = (position.direction == TradeDirection::LONG) ? candle.low : candle.high;
        position.max_favorable_excursion = std::max(
            position.max_favorable_excursion,
            sign * (best - position.avg_entry_price) * position.total_size);
        position.max_adverse_excursion = std::min(
            position.max_adverse_excursion,
            sign * (worst - position.avg_entry_price) * position.total_size);
    }
}

bool PositionLedger::isLiquidationBreached(const Position& position, const Candle& candle) const {
    if (position.status != PositionStatus::OPEN || position.liquidation_price <= 0.0) {
        return false;
    }
    if (position.direction == TradeDirection::LONG) {
        return candle.low <= position.liquidation_price;
    }
    return candle.high >= position.liquidation_price;
}

bool PositionLedger::closePartial(Position& position,
                                  double size,
                                  double price,
                                  CloseReason reason,
                                  long long timestamp,
                                  int candle_index,
                                  bool market_fill) {
    if (position.status != PositionStatus::OPEN || !(size > 0.0)) {
        return false;
    }

    // Dust left behind by rounding goes out with this fill
    if (size >= position.total_size ||
        position.total_size - size <= position.initial_size * SIZE_EPSILON) {
        size = position.total_size;
    }

    const double sign = directionSign(position.direction);
    const double fill_price = market_fill ? applySlippage(price, position.direction, false) : price;
    const double pnl = sign * (fill_price - position.avg_entry_price) * size;
    const double exit_fee = fee(size, fill_price);
    const double released = (size == position.total_size)
        ? position.remaining_margin
        : position.remaining_margin * (size / position.total_size);

    balance_ += released + pnl - exit_fee;
    total_fees_ += exit_fee;

    position.remaining_margin -= released;
    position.total_size -= size;
    position.realized_pnl += pnl;
    position.fees += exit_fee;

    PositionFill fill;
    fill.price = fill_price;
    fill.size = size;
    fill.fee = exit_fee;
    fill.pnl = pnl;
    fill.timestamp = timestamp;
    fill.candle_index = candle_index;
    fill.reason = reason;
    position.exits.push_back(fill);

    if (position.total_size <= 0.0) {
        position.total_size = 0.0;
        position.unrealized_pnl = 0.0;
        finalize(position, PositionStatus::CLOSED);
        return true;
    }

    position.unrealized_pnl = sign * (position.current_price - position.avg_entry_price) * position.total_size;
    return false;
}

void PositionLedger::closePosition(Position& position,
                                   double price,
                                   CloseReason reason,
                                   long long timestamp,
                                   int candle_index,
                                   bool market_fill) {
    closePartial(position, position.total_size, price, reason, timestamp, candle_index, market_fill);
}

void PositionLedger::liquidate(Position& position, long long timestamp, int candle_index) {
    if (position.status != PositionStatus::OPEN) return;

    const double sign = directionSign(position.direction);
    const double price = position.liquidation_price;
    const double size = position.total_size;
    const double pnl = sign * (price - position.avg_entry_price) * size;

    if (margin_mode_ == MarginMode::CROSS) {
        // Loss beyond the posted margin comes out of the shared balance
        balance_ += position.remaining_margin + pnl;
    }

    position.realized_pnl += pnl;
    position.remaining_margin = 0.0;
    position.total_size = 0.0;
    position.unrealized_pnl = 0.0;

    PositionFill fill;
    fill.price = price;
    fill.size = size;
    fill.fee = 0.0;
    fill.pnl = pnl;
    fill.timestamp = timestamp;
    fill.candle_index = candle_index;
    fill.reason = CloseReason::LIQUIDATION;
    position.exits.push_back(fill);

    finalize(position, PositionStatus::LIQUIDATED);
}

void PositionLedger::closeAll(double price, CloseReason reason, long long timestamp, int candle_index) {
    for (auto& position : positions_) {
        if (position.status == PositionStatus::OPEN) {
            closePosition(position, price, reason, timestamp, candle_index);
        }
    }
    purgeClosed();
}

void PositionLedger::finalize(Position& position, PositionStatus status) {
    position.status = status;

    double exit_notional = 0.0;
    double exit_size = 0.0;
    for (const auto& fill : position.exits) {
        exit_notional += fill.price * fill.size;
        exit_size += fill.size;
    }

    const auto& last = position.exits.back();

    Trade trade;
    trade.id = "trade-" + std::to_string(++trade_seq_);
    trade.position_id = position.id;
    trade.symbol = position.symbol;
    trade.direction = position.direction;
    trade.avg_entry_price = position.avg_entry_price;
    trade.avg_exit_price = (exit_size > 0.0) ? exit_notional / exit_size : 0.0;
    trade.size = position.initial_size;
    trade.leverage = position.leverage;
    trade.margin = position.margin;
    trade.opened_at = position.opened_at;
    trade.opened_at_index = position.opened_at_index;
    trade.closed_at = last.timestamp;
    trade.closed_at_index = last.candle_index;
    trade.pnl = position.realized_pnl;
    trade.fees = position.fees;
    trade.net_pnl = position.realized_pnl - position.fees;
    trade.pnl_percent = (position.margin > 1e-12) ? (trade.net_pnl / position.margin) * 100.0 : 0.0;
    trade.duration_minutes = static_cast<double>(trade.closed_at - trade.opened_at) / MS_PER_MINUTE;
    trade.duration_candles = trade.closed_at_index - trade.opened_at_index;
    trade.close_reason = last.reason;
    trade.liquidated = (status == PositionStatus::LIQUIDATED);
    trade.max_favorable_excursion = position.max_favorable_excursion;
    trade.max_adverse_excursion = position.max_adverse_excursion;
    trade.exits = position.exits;

    realized_net_pnl_ += trade.net_pnl;
    if (trade.net_pnl > 0.0) {
        winning_trades_++;
    } else {
        losing_trades_++;
    }

    Logger::getInstance().logTrade(trade.symbol, toString(trade.direction),
                                   trade.avg_entry_price, trade.avg_exit_price,
                                   trade.size, trade.net_pnl, toString(trade.close_reason));
    trades_.push_back(std::move(trade));
}

void PositionLedger::purgeClosed() {
    positions_.erase(
        std::remove_if(positions_.begin(), positions_.end(),
                       [](const Position& p) { return p.status != PositionStatus::OPEN; }),
        positions_.end());
}

int PositionLedger::openCount() const {
    return static_cast<int>(std::count_if(positions_.begin(), positions_.end(),
        [](const Position& p) { return p.status == PositionStatus::OPEN; }));
}

std::vector<Trade> PositionLedger::takeTrades() {
    std::vector<Trade> out;
    out.swap(trades_);
    return out;
}

double PositionLedger::equity() const {
    double eq = balance_;
    for (const auto& p : positions_) {
        if (p.status == PositionStatus::OPEN) {
            eq += p.remaining_margin + p.unrealized_pnl;
        }
    }
    return eq;
}

double PositionLedger::unrealizedPnl() const {
    double total = 0.0;
    for (const auto& p : positions_) {
        if (p.status == PositionStatus::OPEN) total += p.unrealized_pnl;
    }
    return total;
}

double PositionLedger::lockedMargin() const {
    double total = 0.0;
    for (const auto& p : positions_) {
        if (p.status == PositionStatus::OPEN) total += p.remaining_margin;
    }
    return total;
}

} // namespace backtest
} // namespace quantbench

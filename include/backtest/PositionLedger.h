#pragma once

#include "backtest/BacktestTypes.h"
#include <string>
#include <vector>

namespace quantbench {
namespace backtest {

// Open positions and balance of one simulation run.
//
// Opening debits the margin and the entry fee. Each exit fill credits the
// margin it releases plus its PnL minus its fee. Liquidation of an isolated
// position credits nothing: the remaining margin is forfeited.
class PositionLedger {
public:
    PositionLedger(double initial_balance,
                   double fee_percent,
                   double slippage_percent,
                   MarginMode margin_mode = MarginMode::ISOLATED,
                   const std::string& symbol = "");

    // Balance needed to open size units at price (margin + entry fee)
    double requiredCapital(double size, double price, double leverage) const;
    bool canAfford(double size, double price, double leverage) const;

    // Fills at reference_price with adverse slippage.
    // Throws std::invalid_argument for non-positive size/price and
    // std::runtime_error when the balance cannot cover margin and fee.
    Position& open(TradeDirection direction,
                   double size,
                   double reference_price,
                   double leverage,
                   long long timestamp,
                   int candle_index);

    // Revalues every open position at the candle close and tracks excursions
    void markToMarket(const Candle& candle);

    // LONG: low at or below the liquidation price, SHORT: high at or above
    bool isLiquidationBreached(const Position& position, const Candle& candle) const;

    // Reduces the position by size at price. Market fills pay slippage, limit
    // fills (take-profit targets) do not. Returns true once the position is
    // fully closed and converted into a Trade.
    bool closePartial(Position& position,
                      double size,
                      double price,
                      CloseReason reason,
                      long long timestamp,
                      int candle_index,
                      bool market_fill);

    void closePosition(Position& position,
                       double price,
                       CloseReason reason,
                       long long timestamp,
                       int candle_index,
                       bool market_fill = true);

    // Fills exactly at the liquidation price without fee
    void liquidate(Position& position, long long timestamp, int candle_index);

    void closeAll(double price, CloseReason reason, long long timestamp, int candle_index);

    // Drops positions that are no longer OPEN from the working set
    void purgeClosed();

    std::vector<Position>& positions() { return positions_; }
    const std::vector<Position>& positions() const { return positions_; }
    int openCount() const;

    const std::vector<Trade>& trades() const { return trades_; }
    std::vector<Trade> takeTrades();

    double balance() const { return balance_; }
    double equity() const;
    double unrealizedPnl() const;
    double lockedMargin() const;
    double realizedNetPnl() const { return realized_net_pnl_; }
    double totalFees() const { return total_fees_; }
    int winningTrades() const { return winning_trades_; }
    int losingTrades() const { return losing_trades_; }

private:
    double applySlippage(double price, TradeDirection direction, bool is_entry) const;
    double fee(double size, double price) const;
    void finalize(Position& position, PositionStatus status);

    std::vector<Position> positions_;
    std::vector<Trade> trades_;

    std::string symbol_;
    double balance_;
    double fee_rate_;           // fraction
    double slippage_rate_;      // fraction
    MarginMode margin_mode_;

    double realized_net_pnl_ = 0.0;
    double total_fees_ = 0.0;
    int winning_trades_ = 0;
    int losing_trades_ = 0;
    long long position_seq_ = 0;
    long long trade_seq_ = 0;
};

} // namespace backtest
} // namespace quantbench

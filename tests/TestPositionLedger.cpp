#include "backtest/PositionLedger.h"
#include "TestSupport.h"

#include <iostream>
#include <stdexcept>

using quantbench::TradeDirection;
using quantbench::backtest::CloseReason;
using quantbench::backtest::MarginMode;
using quantbench::backtest::PositionLedger;
using quantbench::backtest::PositionStatus;
using quantbench::test::T0;
using quantbench::test::bar;
using quantbench::test::near;

namespace {

int testIsolatedLiquidationForfeitsMargin() {
    PositionLedger ledger(10000.0, 0.0, 0.0, MarginMode::ISOLATED, "BTCUSDT");
    auto& position = ledger.open(TradeDirection::LONG, 10.0, 100.0, 10.0, T0, 0);

    if (!near(position.margin, 100.0) || !near(position.liquidation_price, 90.0)) {
        std::cerr << "[TEST] margin/liquidation price wrong: " << position.margin
                  << " / " << position.liquidation_price << "\n";
        return 1;
    }
    if (!near(ledger.balance(), 9900.0)) {
        std::cerr << "[TEST] balance after open should be 9900, got " << ledger.balance() << "\n";
        return 1;
    }

    const auto candle = bar(T0 + 1000, 100.0, 101.0, 89.0, 95.0);
    ledger.markToMarket(candle);
    if (!ledger.isLiquidationBreached(ledger.positions().front(), candle)) {
        std::cerr << "[TEST] low 89 should breach liquidation price 90\n";
        return 1;
    }
    ledger.liquidate(ledger.positions().front(), candle.timestamp, 1);
    ledger.purgeClosed();

    if (ledger.openCount() != 0 || ledger.trades().size() != 1) {
        std::cerr << "[TEST] liquidated position should become one trade\n";
        return 1;
    }
    const auto& trade = ledger.trades().front();
    if (!trade.liquidated || trade.close_reason != CloseReason::LIQUIDATION) {
        std::cerr << "[TEST] trade should be flagged as liquidated\n";
        return 1;
    }
    if (!near(trade.avg_exit_price, 90.0) || !near(trade.net_pnl, -100.0)) {
        std::cerr << "[TEST] liquidation fill wrong: exit " << trade.avg_exit_price
                  << " net " << trade.net_pnl << "\n";
        return 1;
    }
    if (!near(ledger.balance(), 9900.0) || !near(ledger.equity(), 9900.0)) {
        std::cerr << "[TEST] isolated liquidation must not credit anything back\n";
        return 1;
    }
    if (!near(trade.pnl_percent, -100.0)) {
        std::cerr << "[TEST] pnl_percent should be -100, got " << trade.pnl_percent << "\n";
        return 1;
    }
    return 0;
}

int testShortLiquidationBoundaryIsInclusive() {
    PositionLedger ledger(10000.0, 0.0, 0.0);
    auto& position = ledger.open(TradeDirection::SHORT, 5.0, 100.0, 5.0, T0, 0);
    if (!near(position.liquidation_price, 120.0)) {
        std::cerr << "[TEST] short liquidation price should be 120, got " << position.liquidation_price << "\n";
        return 1;
    }
    if (ledger.isLiquidationBreached(position, bar(T0 + 1, 100.0, 119.99, 99.0, 110.0))) {
        std::cerr << "[TEST] high below liquidation price must not liquidate\n";
        return 1;
    }
    if (!ledger.isLiquidationBreached(position, bar(T0 + 2, 100.0, 120.0, 99.0, 110.0))) {
        std::cerr << "[TEST] high equal to liquidation price must liquidate\n";
        return 1;
    }
    return 0;
}

int testUnleveragedLongNeverLiquidates() {
    PositionLedger ledger(10000.0, 0.0, 0.0);
    auto& position = ledger.open(TradeDirection::LONG, 1.0, 100.0, 1.0, T0, 0);
    if (ledger.isLiquidationBreached(position, bar(T0 + 1, 100.0, 100.0, 0.01, 0.5))) {
        std::cerr << "[TEST] leverage 1 long has no liquidation price\n";
        return 1;
    }
    return 0;
}

int testPartialExitsConserveSizeAndCash() {
    PositionLedger ledger(10000.0, 0.1, 0.0);
    auto& position = ledger.open(TradeDirection::LONG, 10.0, 100.0, 2.0, T0, 0);
    // margin 500, entry fee 1
    if (!near(ledger.balance(), 9499.0)) {
        std::cerr << "[TEST] balance after open should be 9499, got " << ledger.balance() << "\n";
        return 1;
    }

    ledger.markToMarket(bar(T0 + 1000, 100.0, 111.0, 99.0, 108.0));
    const bool closed = ledger.closePartial(position, 4.0, 110.0, CloseReason::TP, T0 + 1000, 1, false);
    if (closed) {
        std::cerr << "[TEST] partial exit must keep the position open\n";
        return 1;
    }
    if (!near(position.total_size, 6.0) || !near(position.remaining_margin, 300.0)) {
        std::cerr << "[TEST] partial exit left size " << position.total_size
                  << " margin " << position.remaining_margin << "\n";
        return 1;
    }
    if (!near(position.total_size + position.exitedSize(), position.initial_size)) {
        std::cerr << "[TEST] remaining + exited size must equal the size at open\n";
        return 1;
    }

    ledger.closePosition(position, 105.0, CloseReason::SIGNAL, T0 + 2000, 2);
    ledger.purgeClosed();

    if (ledger.trades().size() != 1) {
        std::cerr << "[TEST] expected one trade\n";
        return 1;
    }
    const auto& trade = ledger.trades().front();
    if (trade.exits.size() != 2 || !near(trade.size, 10.0)) {
        std::cerr << "[TEST] trade should carry both exit fills\n";
        return 1;
    }
    // pnl 40 + 30, fees 1 + 0.44 + 0.63
    if (!near(trade.pnl, 70.0) || !near(trade.fees, 2.07) || !near(trade.net_pnl, 67.93)) {
        std::cerr << "[TEST] trade pnl/fees wrong: " << trade.pnl << " / " << trade.fees << "\n";
        return 1;
    }
    if (!near(ledger.balance() - 10000.0, trade.net_pnl)) {
        std::cerr << "[TEST] balance change should equal net pnl\n";
        return 1;
    }
    if (trade.close_reason != CloseReason::SIGNAL || !near(trade.avg_exit_price, 107.0)) {
        std::cerr << "[TEST] close reason or average exit wrong: " << trade.avg_exit_price << "\n";
        return 1;
    }
    return 0;
}

int testSlippageOnMarketFillsOnly() {
    PositionLedger ledger(10000.0, 0.0, 1.0);
    auto& first = ledger.open(TradeDirection::LONG, 1.0, 100.0, 1.0, T0, 0);
    if (!near(first.avg_entry_price, 101.0)) {
        std::cerr << "[TEST] long entry should pay slippage, got " << first.avg_entry_price << "\n";
        return 1;
    }
    ledger.closePosition(first, 110.0, CloseReason::SIGNAL, T0 + 1, 1, true);

    auto& second = ledger.open(TradeDirection::SHORT, 1.0, 100.0, 1.0, T0 + 2, 2);
    if (!near(second.avg_entry_price, 99.0)) {
        std::cerr << "[TEST] short entry should receive less, got " << second.avg_entry_price << "\n";
        return 1;
    }
    ledger.closePosition(second, 90.0, CloseReason::TP, T0 + 3, 3, false);
    ledger.purgeClosed();

    const auto& trades = ledger.trades();
    if (!near(trades[0].avg_exit_price, 108.9)) {
        std::cerr << "[TEST] market exit should pay slippage, got " << trades[0].avg_exit_price << "\n";
        return 1;
    }
    if (!near(trades[1].avg_exit_price, 90.0)) {
        std::cerr << "[TEST] limit exit should fill at its price, got " << trades[1].avg_exit_price << "\n";
        return 1;
    }
    return 0;
}

int testCrossMarginUsesFreeBalance() {
    PositionLedger ledger(10000.0, 0.0, 0.0, MarginMode::CROSS);
    auto& position = ledger.open(TradeDirection::LONG, 10.0, 100.0, 10.0, T0, 0);
    if (position.liquidation_price != 0.0) {
        std::cerr << "[TEST] free balance should push the cross liquidation price to 0, got "
                  << position.liquidation_price << "\n";
        return 1;
    }

    PositionLedger tight(150.0, 0.0, 0.0, MarginMode::CROSS);
    auto& levered = tight.open(TradeDirection::SHORT, 10.0, 100.0, 10.0, T0, 0);
    // buffer (100 + 50) / 10
    if (!near(levered.liquidation_price, 115.0)) {
        std::cerr << "[TEST] cross short liquidation price should be 115, got " << levered.liquidation_price << "\n";
        return 1;
    }
    tight.markToMarket(bar(T0 + 1, 100.0, 116.0, 99.0, 114.0));
    tight.liquidate(levered, T0 + 1, 1);
    if (!near(tight.balance(), 0.0)) {
        std::cerr << "[TEST] cross liquidation should consume the free balance, got " << tight.balance() << "\n";
        return 1;
    }
    return 0;
}

int testInsufficientBalanceIsRejected() {
    PositionLedger ledger(1000.0, 0.1, 0.0);
    if (ledger.canAfford(10.0, 100.0, 1.0)) {
        std::cerr << "[TEST] 1000 notional plus fee must not fit into 1000\n";
        return 1;
    }
    bool threw = false;
    try {
        ledger.open(TradeDirection::LONG, 10.0, 100.0, 1.0, T0, 0);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw || ledger.openCount() != 0 || !near(ledger.balance(), 1000.0)) {
        std::cerr << "[TEST] unaffordable open must throw and leave the ledger untouched\n";
        return 1;
    }

    threw = false;
    try {
        ledger.open(TradeDirection::LONG, 0.0, 100.0, 1.0, T0, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[TEST] zero size must be rejected\n";
        return 1;
    }
    return 0;
}

int testExcursionsAreTracked() {
    PositionLedger ledger(10000.0, 0.0, 0.0);
    ledger.open(TradeDirection::LONG, 2.0, 100.0, 1.0, T0, 0);
    ledger.markToMarket(bar(T0 + 1, 100.0, 106.0, 97.0, 103.0));
    ledger.markToMarket(bar(T0 + 2, 103.0, 104.0, 95.0, 96.0));
    const auto& p = ledger.positions().front();
    if (!near(p.max_favorable_excursion, 12.0) || !near(p.max_adverse_excursion, -10.0)) {
        std::cerr << "[TEST] excursions wrong: " << p.max_favorable_excursion
                  << " / " << p.max_adverse_excursion << "\n";
        return 1;
    }
    if (!near(ledger.unrealizedPnl(), -8.0) || !near(ledger.equity(), 9992.0)) {
        std::cerr << "[TEST] mark to market wrong: " << ledger.equity() << "\n";
        return 1;
    }
    return 0;
}

} // namespace

int main() {
    if (testIsolatedLiquidationForfeitsMargin() != 0) return 1;
    if (testShortLiquidationBoundaryIsInclusive() != 0) return 1;
    if (testUnleveragedLongNeverLiquidates() != 0) return 1;
    if (testPartialExitsConserveSizeAndCash() != 0) return 1;
    if (testSlippageOnMarketFillsOnly() != 0) return 1;
    if (testCrossMarginUsesFreeBalance() != 0) return 1;
    if (testInsufficientBalanceIsRejected() != 0) return 1;
    if (testExcursionsAreTracked() != 0) return 1;

    std::cout << "[TEST] PositionLedger PASSED\n";
    return 0;
}

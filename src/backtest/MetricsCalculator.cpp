#include "backtest/MetricsCalculator.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace quantbench {
namespace backtest {

namespace {
constexpr double TRADING_DAYS = 252.0;

std::vector<double> nonZero(const std::vector<double>& values) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        if (v != 0.0) out.push_back(v);
    }
    return out;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}
}

double MetricsCalculator::profitFactor(double gross_profit, double gross_loss) {
    if (gross_loss > 0.0) {
        return gross_profit / gross_loss;
    }
    return (gross_profit > 0.0) ? std::numeric_limits<double>::infinity() : 0.0;
}

double MetricsCalculator::sampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    const double m = mean(values);
    double sq = 0.0;
    for (double v : values) {
        sq += (v - m) * (v - m);
    }
    return std::sqrt(sq / static_cast<double>(values.size() - 1));
}

std::vector<double> MetricsCalculator::equityReturns(const std::vector<EquityPoint>& equity_curve) {
    std::vector<double> returns;
    if (equity_curve.size() < 2) return returns;
    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double prev = equity_curve[i - 1].equity;
        returns.push_back(prev > 1e-12 ? (equity_curve[i].equity - prev) / prev : 0.0);
    }
    return returns;
}

double MetricsCalculator::sharpeRatio(const std::vector<double>& returns) {
    const auto active = nonZero(returns);
    if (active.size() < 2) return 0.0;
    const double sd = sampleStdDev(active);
    return (sd > 1e-12) ? (mean(active) / sd) * std::sqrt(TRADING_DAYS) : 0.0;
}

double MetricsCalculator::sortinoRatio(const std::vector<double>& returns) {
    const auto active = nonZero(returns);
    if (active.size() < 2) return 0.0;

    double downside_sq = 0.0;
    for (double r : active) {
        if (r < 0.0) downside_sq += r * r;
    }
    const double downside = std::sqrt(downside_sq / static_cast<double>(active.size()));
    return (downside > 1e-12) ? (mean(active) / downside) * std::sqrt(TRADING_DAYS) : 0.0;
}

double MetricsCalculator::valueAtRisk95(const std::vector<double>& returns) {
    if (returns.empty()) return 0.0;
    std::vector<double> sorted = returns;
    std::sort(sorted.begin(), sorted.end());
    const size_t idx = std::min(sorted.size() - 1, static_cast<size_t>(0.05 * sorted.size()));
    return std::max(0.0, -sorted[idx]) * 100.0;
}

double MetricsCalculator::expectedShortfall95(const std::vector<double>& returns) {
    if (returns.empty()) return 0.0;
    std::vector<double> sorted = returns;
    std::sort(sorted.begin(), sorted.end());
    const size_t idx = std::min(sorted.size() - 1, static_cast<size_t>(0.05 * sorted.size()));
    const double tail = std::accumulate(sorted.begin(), sorted.begin() + idx + 1, 0.0) / static_cast<double>(idx + 1);
    return std::max(0.0, -tail) * 100.0;
}

BacktestMetrics MetricsCalculator::calculate(
    const std::vector<Trade>& trades,
    const std::vector<EquityPoint>& equity_curve,
    double initial_balance
) {
    BacktestMetrics m;
    fillTradeStats(m, trades, initial_balance);
    fillEquityStats(m, equity_curve, initial_balance);
    m.calmar_ratio = (m.max_drawdown_percent > 1e-12) ? m.total_pnl_percent / m.max_drawdown_percent : 0.0;
    return m;
}

void MetricsCalculator::fillTradeStats(BacktestMetrics& m, const std::vector<Trade>& trades, double initial_balance) {
    m.total_trades = static_cast<int>(trades.size());
    if (trades.empty()) return;

    double win_duration = 0.0;
    double loss_duration = 0.0;
    double total_duration = 0.0;
    double notional = 0.0;
    double leverage = 0.0;
    int streak_wins = 0;
    int streak_losses = 0;

    m.max_win = 0.0;
    m.max_loss = 0.0;

    for (const auto& t : trades) {
        const double pnl = t.net_pnl;
        m.total_pnl += pnl;
        m.total_fees += t.fees;
        total_duration += t.duration_minutes;
        m.max_trade_duration = std::max(m.max_trade_duration, t.duration_minutes);
        notional += t.avg_entry_price * t.size;
        leverage += t.leverage;
        m.exit_reason_counts[toString(t.close_reason)]++;
        if (t.direction == TradeDirection::LONG) {
            m.long_trades++;
        } else {
            m.short_trades++;
        }

        if (pnl > 0.0) {
            m.winning_trades++;
            m.gross_profit += pnl;
            m.max_win = std::max(m.max_win, pnl);
            win_duration += t.duration_minutes;
            streak_wins++;
            streak_losses = 0;
            m.max_consecutive_wins = std::max(m.max_consecutive_wins, streak_wins);
        } else {
            m.losing_trades++;
            m.gross_loss += -pnl;
            m.max_loss = std::min(m.max_loss, pnl);
            loss_duration += t.duration_minutes;
            streak_losses++;
            streak_wins = 0;
            m.max_consecutive_losses = std::max(m.max_consecutive_losses, streak_losses);
        }
    }

    const double n = static_cast<double>(m.total_trades);
    m.win_rate = (m.winning_trades / n) * 100.0;
    m.total_pnl_percent = (initial_balance > 1e-12) ? (m.total_pnl / initial_balance) * 100.0 : 0.0;
    m.avg_pnl = m.total_pnl / n;
    m.avg_win = (m.winning_trades > 0) ? m.gross_profit / m.winning_trades : 0.0;
    m.avg_loss = (m.losing_trades > 0) ? -m.gross_loss / m.losing_trades : 0.0;
    m.profit_factor = profitFactor(m.gross_profit, m.gross_loss);
    m.risk_reward_ratio = (std::abs(m.avg_loss) > 1e-12) ? std::abs(m.avg_win / m.avg_loss) : 0.0;
    m.expectancy = (m.win_rate / 100.0) * m.avg_win + (1.0 - m.win_rate / 100.0) * m.avg_loss;

    m.avg_trade_duration = total_duration / n;
    m.avg_win_duration = (m.winning_trades > 0) ? win_duration / m.winning_trades : 0.0;
    m.avg_loss_duration = (m.losing_trades > 0) ? loss_duration / m.losing_trades : 0.0;
    m.avg_position_size = notional / n;
    m.avg_leverage = leverage / n;
    m.current_streak = (streak_wins > 0) ? streak_wins : -streak_losses;
}

void MetricsCalculator::fillEquityStats(BacktestMetrics& m, const std::vector<EquityPoint>& equity_curve, double initial_balance) {
    if (equity_curve.empty()) return;

    double dd_sum = 0.0;
    int dd_points = 0;
    int exposed_points = 0;
    long long longest_dd_ms = 0;
    long long dd_start_ts = 0;
    bool in_drawdown = false;

    for (size_t i = 0; i < equity_curve.size(); ++i) {
        const auto& p = equity_curve[i];
        m.max_drawdown = std::max(m.max_drawdown, p.drawdown);
        m.max_drawdown_percent = std::max(m.max_drawdown_percent, p.drawdown_percent);
        if (p.open_positions > 0) exposed_points++;

        if (p.drawdown > 0.0) {
            dd_sum += p.drawdown_percent;
            dd_points++;
            if (!in_drawdown) {
                in_drawdown = true;
                // The drawdown started at the previous (peak) candle
                dd_start_ts = (i > 0) ? equity_curve[i - 1].timestamp : p.timestamp;
            }
            longest_dd_ms = std::max(longest_dd_ms, p.timestamp - dd_start_ts);
        } else if (in_drawdown) {
            in_drawdown = false;
            longest_dd_ms = std::max(longest_dd_ms, p.timestamp - dd_start_ts);
        }
    }

    const double n = static_cast<double>(equity_curve.size());
    m.avg_drawdown = (dd_points > 0) ? dd_sum / dd_points : 0.0;
    m.time_in_drawdown = (dd_points / n) * 100.0;
    m.max_drawdown_duration = static_cast<double>(longest_dd_ms) / MS_PER_DAY;
    m.market_exposure = (exposed_points / n) * 100.0;

    const auto returns = equityReturns(equity_curve);
    m.sharpe_ratio = sharpeRatio(returns);
    m.sortino_ratio = sortinoRatio(returns);
    m.var95 = valueAtRisk95(returns);
    m.expected_shortfall95 = expectedShortfall95(returns);

    const long long span_ms = equity_curve.back().timestamp - equity_curve.front().timestamp;
    if (span_ms > 0 && equity_curve.size() > 1) {
        const double span_days = static_cast<double>(span_ms) / MS_PER_DAY;
        const double final_equity = equity_curve.back().equity;
        if (initial_balance > 1e-12 && final_equity > 0.0) {
            m.annualized_return = (std::pow(final_equity / initial_balance, 365.0 / span_days) - 1.0) * 100.0;
        }
        const double periods_per_year = 365.0 * MS_PER_DAY / (static_cast<double>(span_ms) / (n - 1.0));
        m.volatility = sampleStdDev(returns) * std::sqrt(periods_per_year) * 100.0;
    }
}

} // namespace backtest
} // namespace quantbench

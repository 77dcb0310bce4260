#include "analytics/PerformanceAnalyzer.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace gridlab;
using namespace gridlab::analytics;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

EquityCurve makeCurve(const std::vector<double>& totals, const std::vector<double>& invested = {}) {
    EquityCurve curve;
    Date d(2023, 1, 2);
    for (size_t i = 0; i < totals.size(); ++i) {
        EquityPoint p;
        p.date = d;
        p.total_equity = totals[i];
        p.invested_capital = i < invested.size() ? invested[i] : 0.0;
        curve.push_back(p);
        d = d.addDays(1);
    }
    return curve;
}

Trade makeTrade(OrderSide side, double profit, bool close_out = false) {
    Trade t;
    t.side = side;
    t.price = 10.0;
    t.quantity = 100;
    t.amount = 1000.0;
    t.realized_profit = profit;
    t.close_out = close_out;
    return t;
}
}

int main() {
    PerformanceAnalyzer analyzer;

    // Annualized return
    {
        assert(near(analyzer.annualizedReturn(110000.0, 100000.0, 252), 0.1));
        assert(near(analyzer.annualizedReturn(121000.0, 100000.0, 504), 0.1, 1e-12));
        assert(analyzer.annualizedReturn(110000.0, 100000.0, 0) == 0.0);
        assert(analyzer.annualizedReturn(0.0, 100000.0, 100) == 0.0);
        assert(analyzer.annualizedReturn(-5.0, 100000.0, 100) == 0.0);
    }

    // Sharpe ratio with sample deviation and daily risk-free rate
    {
        const std::vector<double> r = {0.01, -0.01, 0.02};
        const double mean = (0.01 - 0.01 + 0.02) / 3.0;
        double sq = 0.0;
        for (double x : r) {
            sq += (x - mean) * (x - mean);
        }
        const double sd = std::sqrt(sq / 2.0);
        const double expected = (mean - 0.03 / 252.0) / sd * std::sqrt(252.0);
        assert(near(analyzer.sharpeRatio(r), expected, 1e-12));
        assert(analyzer.sharpeRatio(r) > 6.7 && analyzer.sharpeRatio(r) < 6.9);

        assert(analyzer.sharpeRatio({}) == 0.0);
        assert(analyzer.sharpeRatio({0.05}) == 0.0);
        assert(analyzer.sharpeRatio({0.0, 0.0, 0.0}) == 0.0);
    }

    // Drawdown from the running peak
    {
        assert(near(PerformanceAnalyzer::maxDrawdown(makeCurve({100, 120, 90, 130, 104})), 0.25));
        assert(PerformanceAnalyzer::maxDrawdown(makeCurve({100, 101, 102})) == 0.0);
        assert(PerformanceAnalyzer::maxDrawdown(EquityCurve()) == 0.0);
    }

    // Daily returns skip non-positive previous equity
    {
        auto returns = PerformanceAnalyzer::dailyReturns(makeCurve({0.0, 100.0, 110.0}));
        assert(returns.size() == 1);
        assert(near(returns[0], 0.1));
    }

    // Full analysis
    {
        auto curve = makeCurve({100000.0, 95000.0, 110000.0}, {50000.0, 40000.0, 30000.0});
        auto m = analyzer.analyze(curve, 100000.0, 3);
        assert(near(m.final_equity, 110000.0));
        assert(near(m.total_profit, 10000.0));
        assert(near(m.total_return_pct, 10.0));
        assert(near(m.avg_invested_capital, 40000.0));
        assert(near(m.grid_profit_pct, 25.0));
        assert(near(m.max_drawdown_pct, 5.0));
        assert(m.trading_days == 3);
        assert(m.annual_return_pct > 10.0);

        auto empty = analyzer.analyze(EquityCurve(), 100000.0, 0);
        assert(near(empty.final_equity, 100000.0));
        assert(empty.sharpe_ratio == 0.0);
    }

    // Trade statistics under both win-rate policies
    {
        std::vector<Trade> trades = {
            makeTrade(OrderSide::BUY, 0.0),
            makeTrade(OrderSide::SELL, 100.0),
            makeTrade(OrderSide::SELL, -50.0),
            makeTrade(OrderSide::SELL, -10.0, true),
            makeTrade(OrderSide::SELL, 30.0, true),
        };

        // Close-outs stay in the counts but not in the rate
        auto signed_stats = analyzer.summarizeTrades(trades, WinRatePolicy::SIGNED_PROFIT);
        assert(signed_stats.total_trades == 5);
        assert(signed_stats.buy_count == 1);
        assert(signed_stats.sell_count == 4);
        assert(signed_stats.win_count == 1);
        assert(near(signed_stats.win_rate_pct, 50.0));
        assert(near(signed_stats.realized_profit, 70.0));

        auto grid_stats = analyzer.summarizeTrades(trades, WinRatePolicy::ASSUME_GRID_WINS);
        assert(grid_stats.win_count == 3);
        assert(near(grid_stats.win_rate_pct, 100.0));

        std::vector<Trade> buys_only = {makeTrade(OrderSide::BUY, 0.0)};
        assert(near(analyzer.summarizeTrades(buys_only, WinRatePolicy::ASSUME_GRID_WINS).win_rate_pct, 100.0));
        assert(analyzer.summarizeTrades(buys_only, WinRatePolicy::SIGNED_PROFIT).win_rate_pct == 0.0);

        std::vector<Trade> only_close_out = {makeTrade(OrderSide::BUY, 0.0),
                                             makeTrade(OrderSide::SELL, 500.0, true)};
        auto liquidated = analyzer.summarizeTrades(only_close_out, WinRatePolicy::SIGNED_PROFIT);
        assert(liquidated.sell_count == 1);
        assert(liquidated.win_count == 0);
        assert(liquidated.win_rate_pct == 0.0);
    }

    // Policy names
    {
        assert(parseWinRatePolicy("signed_profit") == WinRatePolicy::SIGNED_PROFIT);
        assert(parseWinRatePolicy("ASSUME_GRID_WINS") == WinRatePolicy::ASSUME_GRID_WINS);
        bool threw = false;
        try {
            parseWinRatePolicy("coin_flip");
        } catch (const InvalidParameterError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] PerformanceAnalyzer PASSED\n";
    return 0;
}

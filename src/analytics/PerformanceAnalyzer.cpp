#include "analytics/PerformanceAnalyzer.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>

namespace gridlab {
namespace analytics {

WinRatePolicy parseWinRatePolicy(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "assume_grid_wins") {
        return WinRatePolicy::ASSUME_GRID_WINS;
    }
    if (n == "signed_profit") {
        return WinRatePolicy::SIGNED_PROFIT;
    }
    throw InvalidParameterError("Unknown win rate policy: '" + name + "'");
}

std::string toString(WinRatePolicy policy) {
    return policy == WinRatePolicy::ASSUME_GRID_WINS ? "assume_grid_wins" : "signed_profit";
}

PerformanceAnalyzer::PerformanceAnalyzer(const AnalysisConfig& config)
    : config_(config) {}

PerformanceMetrics PerformanceAnalyzer::analyze(const EquityCurve& curve,
                                                double initial_capital,
                                                int trading_days) const {
    PerformanceMetrics m;
    m.trading_days = trading_days;
    if (curve.empty() || initial_capital <= 0.0) {
        m.final_equity = initial_capital;
        return m;
    }

    m.final_equity = curve.back().total_equity;
    m.total_profit = m.final_equity - initial_capital;
    m.total_return_pct = (m.final_equity / initial_capital - 1.0) * 100.0;
    m.annual_return_pct = annualizedReturn(m.final_equity, initial_capital, trading_days) * 100.0;
    m.sharpe_ratio = sharpeRatio(dailyReturns(curve));
    m.max_drawdown_pct = maxDrawdown(curve) * 100.0;

    const double invested_sum = std::accumulate(
        curve.begin(), curve.end(), 0.0,
        [](double acc, const EquityPoint& p) { return acc + p.invested_capital; });
    m.avg_invested_capital = invested_sum / static_cast<double>(curve.size());
    if (m.avg_invested_capital > 0.0) {
        m.grid_profit_pct = m.total_profit / m.avg_invested_capital * 100.0;
    }
    return m;
}

TradeStats PerformanceAnalyzer::summarizeTrades(const std::vector<Trade>& trades,
                                                WinRatePolicy policy) const {
    TradeStats s;
    int graded_sells = 0;
    for (const auto& trade : trades) {
        s.total_trades++;
        if (trade.side == OrderSide::BUY) {
            s.buy_count++;
            continue;
        }

        s.sell_count++;
        s.realized_profit += trade.realized_profit;
        if (policy == WinRatePolicy::ASSUME_GRID_WINS) {
            // Grid sells always sit above a lower buy; the close-out only counts when profitable
            if (!trade.close_out || trade.realized_profit > 0.0) {
                s.win_count++;
            }
        } else if (!trade.close_out) {
            // Close-outs are not graded
            graded_sells++;
            if (trade.realized_profit > 0.0) {
                s.win_count++;
            }
        }
    }

    if (policy == WinRatePolicy::ASSUME_GRID_WINS) {
        s.win_rate_pct = 100.0;
    } else if (graded_sells > 0) {
        s.win_rate_pct = static_cast<double>(s.win_count) / graded_sells * 100.0;
    }
    return s;
}

double PerformanceAnalyzer::annualizedReturn(double final_equity,
                                             double initial_capital,
                                             int trading_days) const {
    if (trading_days <= 0 || initial_capital <= 0.0) {
        return 0.0;
    }
    const double growth = final_equity / initial_capital;
    if (growth <= 0.0) {
        return 0.0;
    }
    return std::pow(growth, static_cast<double>(config_.trading_days_per_year) / trading_days) - 1.0;
}

double PerformanceAnalyzer::sharpeRatio(const std::vector<double>& daily_returns) const {
    if (daily_returns.size() < 2) {
        return 0.0;
    }
    const double n = static_cast<double>(daily_returns.size());
    const double mean = std::accumulate(daily_returns.begin(), daily_returns.end(), 0.0) / n;

    double sq = 0.0;
    for (double r : daily_returns) {
        sq += (r - mean) * (r - mean);
    }
    const double stddev = std::sqrt(sq / (n - 1.0));
    if (stddev <= 0.0 || !std::isfinite(stddev)) {
        return 0.0;
    }

    const double daily_risk_free = config_.risk_free_rate / config_.trading_days_per_year;
    return (mean - daily_risk_free) / stddev * std::sqrt(static_cast<double>(config_.trading_days_per_year));
}

std::vector<double> PerformanceAnalyzer::dailyReturns(const EquityCurve& curve) {
    std::vector<double> returns;
    if (curve.size() < 2) {
        return returns;
    }
    returns.reserve(curve.size() - 1);
    for (size_t i = 1; i < curve.size(); i++) {
        const double prev = curve[i - 1].total_equity;
        if (prev <= 0.0) {
            continue;
        }
        returns.push_back(curve[i].total_equity / prev - 1.0);
    }
    return returns;
}

double PerformanceAnalyzer::maxDrawdown(const EquityCurve& curve) {
    if (curve.empty()) {
        return 0.0;
    }
    double peak = curve.front().total_equity;
    double max_dd = 0.0;
    for (const auto& point : curve) {
        peak = std::max(peak, point.total_equity);
        if (peak > 0.0) {
            max_dd = std::max(max_dd, (peak - point.total_equity) / peak);
        }
    }
    return max_dd;
}

} // namespace analytics
} // namespace gridlab

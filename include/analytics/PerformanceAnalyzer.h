#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace gridlab {
namespace analytics {

// How the win rate is derived from sell trades
enum class WinRatePolicy {
    ASSUME_GRID_WINS,        // every grid sell counts as a win; the rate is always 100%
    SIGNED_PROFIT            // grid sells with positive realized profit; close-outs excluded
};

WinRatePolicy parseWinRatePolicy(const std::string& name);
std::string toString(WinRatePolicy policy);

struct AnalysisConfig {
    double risk_free_rate;           // annual
    int trading_days_per_year;
    WinRatePolicy win_rate_policy;   // single-asset runs; portfolios always use SIGNED_PROFIT

    AnalysisConfig()
        : risk_free_rate(0.03)
        , trading_days_per_year(252)
        , win_rate_policy(WinRatePolicy::ASSUME_GRID_WINS)
    {}
};

// Percentages are on a 0-100 scale
struct PerformanceMetrics {
    double annual_return_pct = 0.0;
    double total_return_pct = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown_pct = 0.0;
    double final_equity = 0.0;
    double total_profit = 0.0;
    double avg_invested_capital = 0.0;
    double grid_profit_pct = 0.0;    // total profit / average invested capital
    int trading_days = 0;
};

struct TradeStats {
    int total_trades = 0;
    int buy_count = 0;
    int sell_count = 0;
    int win_count = 0;
    double win_rate_pct = 0.0;
    double realized_profit = 0.0;
};

class PerformanceAnalyzer {
public:
    explicit PerformanceAnalyzer(const AnalysisConfig& config = AnalysisConfig());

    PerformanceMetrics analyze(const EquityCurve& curve, double initial_capital, int trading_days) const;
    TradeStats summarizeTrades(const std::vector<Trade>& trades, WinRatePolicy policy) const;

    // (final/initial)^(days_per_year/trading_days) - 1, as a fraction; 0 when undefined
    double annualizedReturn(double final_equity, double initial_capital, int trading_days) const;

    // Annualized; 0 with fewer than two returns or zero deviation
    double sharpeRatio(const std::vector<double>& daily_returns) const;

    static std::vector<double> dailyReturns(const EquityCurve& curve);

    // Largest peak-to-trough decline as a fraction of the peak
    static double maxDrawdown(const EquityCurve& curve);

    const AnalysisConfig& config() const { return config_; }

private:
    AnalysisConfig config_;
};

} // namespace analytics
} // namespace gridlab

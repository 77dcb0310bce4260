#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"
#include "grid/GridConfig.h"
#include "grid/GridScheme.h"
#include "grid/GridResetScheduler.h"
#include "analytics/PerformanceAnalyzer.h"

namespace gridlab {
namespace backtest {

struct SimulatorConfig {
    double reserve_ratio;            // share of capital held back from the initial investment
    double min_initial_position;     // clamp of the initial position fraction
    double max_initial_position;
    double profit_cap_ratio;         // average-cost profit is capped at this share of the sale amount
    int min_buy_divisor;             // cash-short buys keep at least planned/divisor shares
    int min_observations;            // fewer usable prices -> InsufficientDataError

    grid::GridBuilderConfig builder;
    grid::GridResetConfig reset;
    analytics::AnalysisConfig analysis;

    SimulatorConfig()
        : reserve_ratio(0.5)
        , min_initial_position(0.3)
        , max_initial_position(0.9)
        , profit_cap_ratio(0.2)
        , min_buy_divisor(3)
        , min_observations(10)
    {}
};

struct BacktestRequest {
    std::string symbol;
    Amount initial_capital = 0.0;
    std::optional<Date> start_date;
    std::optional<Date> end_date;
    int grid_levels = 10;
    grid::GridType grid_type = grid::GridType::ARITHMETIC;
    grid::GridOverrides overrides;
};

struct BacktestResult {
    std::vector<std::string> symbols;
    Amount initial_capital = 0.0;
    EquityCurve equity_curve;
    std::vector<Trade> trades;
    std::shared_ptr<const grid::GridScheme> final_grid;   // scheme active at the end
    analytics::PerformanceMetrics performance;
    analytics::TradeStats trade_stats;
    double initial_position_ratio = 0.0;
    Amount final_position_value = 0.0;    // market value of holdings before close-out
    int trading_days = 0;                 // days with real price data
};

} // namespace backtest
} // namespace gridlab

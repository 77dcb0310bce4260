#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "backtest/BacktestTypes.h"
#include "backtest/IPriceProvider.h"
#include "backtest/TradeSimulator.h"
#include "analytics/VolatilityEstimator.h"

namespace gridlab {
namespace backtest {

// Runs symbols through the TradeSimulator with an even capital split and
// combines the results into one portfolio result.
class PortfolioAggregator {
public:
    PortfolioAggregator(std::shared_ptr<IPriceProvider> provider,
                        const SimulatorConfig& config = SimulatorConfig(),
                        std::shared_ptr<analytics::IVolatilityEstimator> estimator = nullptr);

    // Single symbol: fetch prices for request.symbol and simulate
    BacktestResult runSingle(const BacktestRequest& request) const;

    // request.symbol is ignored; request.initial_capital is the portfolio total.
    // The first per-symbol failure is logged and rethrown.
    BacktestResult aggregate(const std::vector<std::string>& symbols, const BacktestRequest& request) const;

    BacktestResult aggregate(const std::vector<std::string>& symbols,
                             Amount initial_capital,
                             const std::optional<Date>& start_date,
                             const std::optional<Date>& end_date,
                             int grid_levels,
                             grid::GridType grid_type) const;

    // Union of dates; each date sums the assets that have a point there
    static EquityCurve mergeEquityCurves(const std::vector<EquityCurve>& curves);

private:
    std::shared_ptr<IPriceProvider> provider_;
    SimulatorConfig config_;
    TradeSimulator simulator_;
};

} // namespace backtest
} // namespace gridlab

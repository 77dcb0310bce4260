#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "common/Types.h"
#include "backtest/IPriceProvider.h"

namespace gridlab {
namespace analytics {

// Estimates used to size a grid. Fields are NaN while the rolling windows are
// not yet filled; callers substitute their own defaults.
struct VolatilityEstimate {
    Date as_of;
    double volatility;     // annualized stddev of daily returns
    Price upper_bound;
    Price lower_bound;

    VolatilityEstimate();
};

class IVolatilityEstimator {
public:
    virtual ~IVolatilityEstimator() = default;

    // Estimate for as_of, or for the nearest available date when absent
    virtual VolatilityEstimate estimate(const std::string& symbol, const Date& as_of) = 0;
};

struct EstimatorConfig {
    int volatility_window;          // trading days
    int short_range_window;
    int long_range_window;
    double short_range_weight;      // blend of short vs long rolling extremes
    int trading_days_per_year;

    EstimatorConfig()
        : volatility_window(200)
        , short_range_window(200)
        , long_range_window(800)
        , short_range_weight(0.7)
        , trading_days_per_year(252)
    {}
};

// Rolling-window estimator over the full price history of each symbol
class RollingVolatilityEstimator : public IVolatilityEstimator {
public:
    RollingVolatilityEstimator(std::shared_ptr<backtest::IPriceProvider> provider,
                               const EstimatorConfig& config = EstimatorConfig());

    VolatilityEstimate estimate(const std::string& symbol, const Date& as_of) override;

    // Per-date estimates for a whole series (exposed for tests and tooling)
    static std::vector<VolatilityEstimate> computeSeries(const PriceSeries& series,
                                                         const EstimatorConfig& config);

private:
    const std::vector<VolatilityEstimate>& seriesFor(const std::string& symbol);

    std::shared_ptr<backtest::IPriceProvider> provider_;
    EstimatorConfig config_;
    std::mutex mutex_;
    std::map<std::string, std::vector<VolatilityEstimate>> cache_;
};

struct GridParameterSuggestion {
    double volatility;
    double grid_spacing;
    Price upper_bound;
    Price lower_bound;
    int grid_levels;
};

// Averages the estimates of several symbols into one parameter set.
// Level count = round(range_pct / spacing), clamped to [min_levels, max_levels].
// Throws InsufficientDataError when no symbol has a finite estimate.
GridParameterSuggestion suggestGridParameters(IVolatilityEstimator& estimator,
                                              const std::vector<std::string>& symbols,
                                              const Date& as_of,
                                              double spacing_divisor = 8.0,
                                              int min_levels = 3,
                                              int max_levels = 50);

} // namespace analytics
} // namespace gridlab

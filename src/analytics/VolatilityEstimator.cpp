#include "analytics/VolatilityEstimator.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

namespace gridlab {
namespace analytics {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double windowMax(const std::vector<double>& values, size_t end_inclusive, int window) {
    const size_t begin = end_inclusive + 1 - static_cast<size_t>(window);
    return *std::max_element(values.begin() + static_cast<std::ptrdiff_t>(begin),
                             values.begin() + static_cast<std::ptrdiff_t>(end_inclusive) + 1);
}

double windowMin(const std::vector<double>& values, size_t end_inclusive, int window) {
    const size_t begin = end_inclusive + 1 - static_cast<size_t>(window);
    return *std::min_element(values.begin() + static_cast<std::ptrdiff_t>(begin),
                             values.begin() + static_cast<std::ptrdiff_t>(end_inclusive) + 1);
}
}

VolatilityEstimate::VolatilityEstimate()
    : volatility(kNaN), upper_bound(kNaN), lower_bound(kNaN) {}

RollingVolatilityEstimator::RollingVolatilityEstimator(
    std::shared_ptr<backtest::IPriceProvider> provider,
    const EstimatorConfig& config)
    : provider_(std::move(provider)), config_(config) {
    if (!provider_) {
        throw InvalidParameterError("RollingVolatilityEstimator requires a price provider");
    }
    if (config_.volatility_window < 2 || config_.short_range_window < 1 || config_.long_range_window < 1) {
        throw InvalidParameterError("estimator windows must be positive (volatility window >= 2)");
    }
}

VolatilityEstimate RollingVolatilityEstimator::estimate(const std::string& symbol, const Date& as_of) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& series = seriesFor(symbol);
    if (series.empty()) {
        VolatilityEstimate empty;
        empty.as_of = as_of;
        return empty;
    }

    // Exact or nearest date; ties go to the earlier date
    auto it = std::lower_bound(series.begin(), series.end(), as_of,
                               [](const VolatilityEstimate& e, const Date& d) { return e.as_of < d; });
    if (it == series.end()) {
        return series.back();
    }
    if (it->as_of == as_of || it == series.begin()) {
        return *it;
    }
    const auto before = std::prev(it);
    const long long gap_before = as_of.toDays() - before->as_of.toDays();
    const long long gap_after = it->as_of.toDays() - as_of.toDays();
    return (gap_before <= gap_after) ? *before : *it;
}

std::vector<VolatilityEstimate> RollingVolatilityEstimator::computeSeries(
    const PriceSeries& series,
    const EstimatorConfig& config)
{
    std::vector<Date> dates;
    std::vector<double> closes;
    dates.reserve(series.size());
    closes.reserve(series.size());
    for (const auto& point : series) {
        dates.push_back(point.first);
        closes.push_back(point.second);
    }

    const size_t n = closes.size();
    std::vector<double> returns(n, kNaN);
    for (size_t t = 1; t < n; t++) {
        returns[t] = closes[t] / closes[t - 1] - 1.0;
    }

    const double annualize = std::sqrt(static_cast<double>(config.trading_days_per_year));
    const double w_short = config.short_range_weight;
    const double w_long = 1.0 - w_short;
    const size_t vol_window = static_cast<size_t>(config.volatility_window);

    std::vector<VolatilityEstimate> out(n);
    for (size_t t = 0; t < n; t++) {
        VolatilityEstimate& e = out[t];
        e.as_of = dates[t];

        // 1. Volatility: sample stddev of the last `vol_window` returns (returns start at t=1)
        if (t >= vol_window) {
            double sum = 0.0;
            for (size_t k = t + 1 - vol_window; k <= t; k++) sum += returns[k];
            const double mean = sum / vol_window;
            double sq = 0.0;
            for (size_t k = t + 1 - vol_window; k <= t; k++) {
                sq += (returns[k] - mean) * (returns[k] - mean);
            }
            e.volatility = std::sqrt(sq / (vol_window - 1)) * annualize;
        }

        // 2. Range: blend of short and long rolling extremes
        const bool short_ready = t + 1 >= static_cast<size_t>(config.short_range_window);
        const bool long_ready = t + 1 >= static_cast<size_t>(config.long_range_window);
        if (short_ready && long_ready) {
            e.upper_bound = w_short * windowMax(closes, t, config.short_range_window) +
                            w_long * windowMax(closes, t, config.long_range_window);
            e.lower_bound = w_short * windowMin(closes, t, config.short_range_window) +
                            w_long * windowMin(closes, t, config.long_range_window);
        }
    }
    return out;
}

const std::vector<VolatilityEstimate>& RollingVolatilityEstimator::seriesFor(const std::string& symbol) {
    auto cached = cache_.find(symbol);
    if (cached != cache_.end()) {
        return cached->second;
    }
    const PriceSeries history = provider_->getPrices(symbol);
    auto inserted = cache_.emplace(symbol, computeSeries(history, config_));
    LOG_INFO("Computed rolling estimates for {} over {} closes", symbol, history.size());
    return inserted.first->second;
}

GridParameterSuggestion suggestGridParameters(IVolatilityEstimator& estimator,
                                              const std::vector<std::string>& symbols,
                                              const Date& as_of,
                                              double spacing_divisor,
                                              int min_levels,
                                              int max_levels) {
    double volatility_sum = 0.0;
    double upper_sum = 0.0;
    double lower_sum = 0.0;
    double levels_sum = 0.0;
    int count = 0;

    for (const auto& symbol : symbols) {
        const VolatilityEstimate e = estimator.estimate(symbol, as_of);
        if (!std::isfinite(e.volatility) || !std::isfinite(e.upper_bound) ||
            !std::isfinite(e.lower_bound) || e.volatility <= 0.0) {
            LOG_WARN("No usable estimate for {} as of {}, skipping", symbol, as_of.toString());
            continue;
        }
        const double spacing = e.volatility / spacing_divisor;
        const double range_pct = 2.0 * (e.upper_bound - e.lower_bound) / (e.upper_bound + e.lower_bound);

        volatility_sum += e.volatility;
        upper_sum += e.upper_bound;
        lower_sum += e.lower_bound;
        levels_sum += std::round(range_pct / spacing);
        count++;
    }

    if (count == 0) {
        throw InsufficientDataError("Not enough history to estimate grid parameters as of " + as_of.toString());
    }

    GridParameterSuggestion s;
    s.volatility = volatility_sum / count;
    s.grid_spacing = s.volatility / spacing_divisor;
    s.upper_bound = upper_sum / count;
    s.lower_bound = lower_sum / count;
    s.grid_levels = std::clamp(static_cast<int>(std::lround(levels_sum / count)), min_levels, max_levels);
    return s;
}

} // namespace analytics
} // namespace gridlab

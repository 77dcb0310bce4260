#pragma once

#include <memory>
#include <optional>
#include <string>
#include "grid/GridSchemeBuilder.h"
#include "analytics/VolatilityEstimator.h"

namespace gridlab {
namespace grid {

// Caller-supplied values that take precedence over the estimator
struct GridOverrides {
    std::optional<double> volatility;
    std::optional<double> grid_spacing;
    std::optional<Price> upper_bound;
    std::optional<Price> lower_bound;

    bool hasBounds() const { return upper_bound.has_value() && lower_bound.has_value(); }
};

struct GridParameters {
    double volatility;
    Price upper_bound;
    Price lower_bound;
};

// Decides when the active GridScheme is replaced and builds its successor.
// Triggers on the first call, on a calendar-month change since the last
// trigger, or after reset_interval_days trading days.
class GridResetScheduler {
public:
    GridResetScheduler(const GridSchemeBuilder& builder,
                       const GridResetConfig& config,
                       std::string symbol,
                       int level_count,
                       GridType type,
                       GridOverrides overrides = GridOverrides(),
                       std::shared_ptr<analytics::IVolatilityEstimator> estimator = nullptr);

    // New scheme when a reset triggers on `day`, nullptr otherwise.
    // Calls repeated for the same day count as a single trading day.
    std::shared_ptr<const GridScheme> maybeReset(const Date& day, Price price, Amount available_capital);

    // Unconditional rebuild; pure for identical inputs
    GridScheme rebuild(const Date& day, Price price, Amount available_capital) const;

    GridParameters resolveParameters(const Date& day, Price price) const;

    std::shared_ptr<const GridScheme> current() const { return current_; }
    int daysSinceReset() const { return days_since_reset_; }

private:
    bool isDue(const Date& day) const;

    GridSchemeBuilder builder_;
    GridResetConfig config_;
    std::string symbol_;
    int level_count_;
    GridType type_;
    GridOverrides overrides_;
    std::shared_ptr<analytics::IVolatilityEstimator> estimator_;

    std::shared_ptr<const GridScheme> current_;
    std::optional<Date> last_reset_day_;
    std::optional<Date> last_seen_day_;
    int days_since_reset_;
};

} // namespace grid
} // namespace gridlab

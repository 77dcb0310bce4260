#include "grid/GridResetScheduler.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <cmath>

namespace gridlab {
namespace grid {

GridResetScheduler::GridResetScheduler(const GridSchemeBuilder& builder,
                                       const GridResetConfig& config,
                                       std::string symbol,
                                       int level_count,
                                       GridType type,
                                       GridOverrides overrides,
                                       std::shared_ptr<analytics::IVolatilityEstimator> estimator)
    : builder_(builder)
    , config_(config)
    , symbol_(std::move(symbol))
    , level_count_(level_count)
    , type_(type)
    , overrides_(std::move(overrides))
    , estimator_(std::move(estimator))
    , days_since_reset_(0)
{
    if (config_.reset_interval_days <= 0) {
        throw InvalidParameterError("reset_interval_days must be positive");
    }
}

std::shared_ptr<const GridScheme> GridResetScheduler::maybeReset(const Date& day,
                                                                 Price price,
                                                                 Amount available_capital) {
    if (last_seen_day_ && day > *last_seen_day_) {
        days_since_reset_++;
    }
    if (!last_seen_day_ || day > *last_seen_day_) {
        last_seen_day_ = day;
    }

    if (!isDue(day)) {
        return nullptr;
    }

    LOG_INFO("[{}] Grid reset: date={}, price={:.4f}, capital={:.2f}",
             symbol_, day.toString(), price, available_capital);

    current_ = std::make_shared<const GridScheme>(rebuild(day, price, available_capital));
    last_reset_day_ = day;
    days_since_reset_ = 0;
    return current_;
}

bool GridResetScheduler::isDue(const Date& day) const {
    if (!last_reset_day_) {
        return true;
    }
    if (*last_reset_day_ == day) {
        return false;
    }
    if (config_.reset_on_month_change && !day.sameMonth(*last_reset_day_)) {
        return true;
    }
    return days_since_reset_ >= config_.reset_interval_days;
}

GridScheme GridResetScheduler::rebuild(const Date& day, Price price, Amount available_capital) const {
    const GridParameters params = resolveParameters(day, price);

    GridBuildInput input;
    input.current_price = price;
    input.upper_bound = params.upper_bound;
    input.lower_bound = params.lower_bound;
    input.volatility = params.volatility;
    input.grid_spacing = overrides_.grid_spacing;
    input.level_count = level_count_;
    input.type = type_;
    input.capital = available_capital;

    GridScheme scheme = builder_.build(input);
    scheme.built_on = day;
    return scheme;
}

GridParameters GridResetScheduler::resolveParameters(const Date& day, Price price) const {
    const bool need_estimate = !overrides_.volatility || !overrides_.hasBounds();

    analytics::VolatilityEstimate estimate;
    if (need_estimate && estimator_) {
        try {
            estimate = estimator_->estimate(symbol_, day);
        } catch (const GridLabError& e) {
            LOG_WARN("[{}] Estimator unavailable for {}: {}", symbol_, day.toString(), e.what());
        }
    }

    GridParameters params;

    // 1. Volatility
    params.volatility = overrides_.volatility ? *overrides_.volatility : estimate.volatility;
    if (!std::isfinite(params.volatility) || params.volatility <= 0.0) {
        LOG_WARN("[{}] Volatility for {} is not usable, using default {:.2f}",
                 symbol_, day.toString(), config_.default_volatility);
        params.volatility = config_.default_volatility;
    }

    // 2. Range bounds
    params.upper_bound = overrides_.upper_bound ? *overrides_.upper_bound : estimate.upper_bound;
    params.lower_bound = overrides_.lower_bound ? *overrides_.lower_bound : estimate.lower_bound;
    if (!std::isfinite(params.upper_bound) || !std::isfinite(params.lower_bound)) {
        LOG_WARN("[{}] Grid range for {} is not usable, using price multiples {:.2f}/{:.2f}",
                 symbol_, day.toString(), config_.default_upper_ratio, config_.default_lower_ratio);
        params.upper_bound = price * config_.default_upper_ratio;
        params.lower_bound = price * config_.default_lower_ratio;
    }
    return params;
}

} // namespace grid
} // namespace gridlab

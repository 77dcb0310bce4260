#include "grid/GridSchemeBuilder.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace gridlab {
namespace grid {

int GridScheme::levelIndexFor(Price price) const {
    if (levels.empty()) {
        return 0;
    }
    const auto it = std::lower_bound(levels.begin(), levels.end(), price);
    if (it == levels.end()) {
        return levelCount() - 1;
    }
    return static_cast<int>(it - levels.begin());
}

double GridScheme::relativePosition(Price price) const {
    if (levels.size() < 2) {
        return 0.0;
    }
    const double width = levels.back() - levels.front();
    if (width <= 0.0) {
        return 0.0;
    }
    return std::clamp((price - levels.front()) / width, 0.0, 1.0);
}

bool GridScheme::operator==(const GridScheme& other) const {
    return type == other.type &&
           levels == other.levels &&
           order_sizes == other.order_sizes &&
           upper_bound == other.upper_bound &&
           lower_bound == other.lower_bound &&
           volatility == other.volatility &&
           spacing == other.spacing &&
           reference_price == other.reference_price &&
           current_level == other.current_level &&
           fallback_used == other.fallback_used &&
           built_on == other.built_on;
}

GridSchemeBuilder::GridSchemeBuilder(const GridBuilderConfig& config)
    : config_(config) {
    if (config_.lot_size <= 0) {
        throw InvalidParameterError("lot_size must be positive");
    }
}

GridScheme GridSchemeBuilder::build(const GridBuildInput& input) const {
    if (input.level_count < 3) {
        throw InvalidParameterError("grid_levels must be at least 3, got " +
                                    std::to_string(input.level_count));
    }
    if (!std::isfinite(input.current_price) || input.current_price <= 0.0) {
        throw InvalidParameterError("current price must be positive and finite");
    }

    const Price price = input.current_price;
    const int n = input.level_count;

    // 1. Keep the price strictly inside the range
    Price upper = input.upper_bound;
    Price lower = input.lower_bound;
    if (upper <= price) {
        upper = price * (1.0 + config_.bound_widen_pct);
    }
    if (lower >= price) {
        lower = price * (1.0 - config_.bound_widen_pct);
    }

    GridScheme scheme;
    scheme.type = input.type;
    scheme.upper_bound = upper;
    scheme.lower_bound = lower;
    scheme.volatility = input.volatility;
    scheme.reference_price = price;

    // 2. Level generation
    switch (input.type) {
        case GridType::ARITHMETIC:
            scheme.levels = arithmeticLevels(lower, upper, n);
            break;

        case GridType::GEOMETRIC:
            scheme.levels = geometricLevels(lower, upper, n);
            break;

        case GridType::VOLATILITY:
            scheme.spacing = resolveSpacing(input);
            scheme.levels = volatilityLevels((upper + lower) / 2.0, scheme.spacing, n);
            break;
    }

    const bool all_finite = std::all_of(scheme.levels.begin(), scheme.levels.end(),
                                        [](Price p) { return std::isfinite(p); });
    if (all_finite) {
        std::sort(scheme.levels.begin(), scheme.levels.end());
    }

    // 3. Degenerate levels, or a range missing the price -> arithmetic grid around the price
    if (!all_finite || !isUsable(scheme.levels, n, price)) {
        LOG_WARN("Grid levels unusable ({} geometry, bounds {:.4f}-{:.4f}), using arithmetic fallback",
                 toString(input.type), lower, upper);
        scheme.lower_bound = price * config_.fallback_lower_ratio;
        scheme.upper_bound = price * config_.fallback_upper_ratio;
        scheme.levels = arithmeticLevels(scheme.lower_bound, scheme.upper_bound, n);
        scheme.fallback_used = true;
    }

    // 4. Order sizes
    scheme.order_sizes = allocateOrderSizes(scheme.levels, input.capital);
    scheme.current_level = scheme.levelIndexFor(price);

    LOG_DEBUG("Grid built: type={}, levels={}, range={:.4f}-{:.4f}, current_level={}",
              toString(scheme.type), scheme.levelCount(),
              scheme.levels.front(), scheme.levels.back(), scheme.current_level);
    return scheme;
}

std::vector<Price> GridSchemeBuilder::arithmeticLevels(Price lower, Price upper, int count) {
    std::vector<Price> levels;
    if (count < 2) {
        return levels;
    }
    levels.reserve(static_cast<size_t>(count));
    const double step = (upper - lower) / (count - 1);
    for (int i = 0; i < count; i++) {
        levels.push_back(lower + step * i);
    }
    // Exact endpoint regardless of rounding in the step
    levels.back() = upper;
    return levels;
}

std::vector<Price> GridSchemeBuilder::geometricLevels(Price lower, Price upper, int count) {
    std::vector<Price> levels;
    if (count < 2) {
        return levels;
    }
    levels.reserve(static_cast<size_t>(count));
    const double ratio = std::pow(upper / lower, 1.0 / (count - 1));
    for (int i = 0; i < count; i++) {
        levels.push_back(lower * std::pow(ratio, i));
    }
    levels.back() = upper;
    return levels;
}

std::vector<Price> GridSchemeBuilder::volatilityLevels(Price mid, double spacing, int count) {
    std::vector<Price> levels;
    const int half_count = count / 2;

    levels.push_back(mid);
    for (int i = 1; i <= half_count; i++) {
        levels.push_back(mid * (1.0 + i * spacing));
        levels.insert(levels.begin(), mid * (1.0 - i * spacing));
    }

    // Even counts produce one level too many; trim from the top
    while (static_cast<int>(levels.size()) > count) {
        levels.pop_back();
    }
    while (static_cast<int>(levels.size()) < count) {
        levels.push_back(levels.back() * (1.0 + spacing));
    }
    return levels;
}

std::vector<Shares> GridSchemeBuilder::allocateOrderSizes(const std::vector<Price>& levels,
                                                          Amount capital) const {
    const int n = static_cast<int>(levels.size());
    std::vector<Shares> sizes(static_cast<size_t>(n), 0);
    if (n == 0) {
        return sizes;
    }
    if (!std::isfinite(capital) || capital < 0.0) {
        capital = 0.0;
    }

    // Linear weights 1..N, total N(N+1)/2
    const double total_weight = (config_.weighting == AllocationWeighting::UNIFORM)
        ? static_cast<double>(n)
        : n * (n + 1) / 2.0;

    for (int i = 0; i < n; i++) {
        double weight = 1.0;
        if (config_.weighting == AllocationWeighting::LOWER_HEAVY) {
            weight = static_cast<double>(n - i);
        } else if (config_.weighting == AllocationWeighting::UPPER_HEAVY) {
            weight = static_cast<double>(i + 1);
        }

        const Amount level_capital = capital * weight / total_weight;
        const Price level_price = levels[static_cast<size_t>(i)];
        const Shares lots = static_cast<Shares>(std::floor(level_capital / level_price / config_.lot_size));
        // Every level trades at least one lot, even when capital is exhausted
        sizes[static_cast<size_t>(i)] = std::max(config_.lot_size, lots * config_.lot_size);
    }
    return sizes;
}

double GridSchemeBuilder::resolveSpacing(const GridBuildInput& input) const {
    double spacing = input.grid_spacing ? *input.grid_spacing
                                        : input.volatility / config_.spacing_divisor;
    if (!std::isfinite(spacing) || spacing <= 0.0) {
        LOG_WARN("Invalid grid spacing {}, using default {:.4f}", spacing, config_.default_spacing);
        spacing = config_.default_spacing;
    }
    return spacing;
}

bool GridSchemeBuilder::isUsable(const std::vector<Price>& levels, int expected_count, Price price) {
    if (static_cast<int>(levels.size()) != expected_count) {
        return false;
    }
    for (size_t i = 0; i < levels.size(); i++) {
        if (!std::isfinite(levels[i]) || levels[i] <= 0.0) {
            return false;
        }
        if (i > 0 && !(levels[i - 1] < levels[i])) {
            return false;
        }
    }
    return levels.front() < price && price < levels.back();
}

} // namespace grid
} // namespace gridlab

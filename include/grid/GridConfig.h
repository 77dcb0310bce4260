#pragma once

#include <string>
#include "common/Types.h"

namespace gridlab {
namespace grid {

// ===== Grid Types =====

enum class GridType {
    ARITHMETIC,              // equal price steps
    GEOMETRIC,               // equal ratio steps
    VOLATILITY               // steps of volatility/8 around the range midpoint
};

// How per-level capital is weighted when sizing orders
enum class AllocationWeighting {
    LOWER_HEAVY,             // lowest level weight N, top level weight 1
    UPPER_HEAVY,             // lowest level weight 1, top level weight N
    UNIFORM
};

// Throws InvalidGridTypeError for unknown names
GridType parseGridType(const std::string& name);
std::string toString(GridType type);

// Throws InvalidParameterError for unknown names
AllocationWeighting parseAllocationWeighting(const std::string& name);
std::string toString(AllocationWeighting weighting);

struct GridBuilderConfig {
    Shares lot_size;                 // minimum tradable increment
    AllocationWeighting weighting;
    double bound_widen_pct;          // bounds not containing the price are moved to price*(1 +/- this)
    double spacing_divisor;          // volatility grid spacing = volatility / divisor
    double default_spacing;          // used when the derived spacing is unusable
    double fallback_lower_ratio;     // degenerate grid fallback range, relative to price
    double fallback_upper_ratio;

    GridBuilderConfig()
        : lot_size(100)
        , weighting(AllocationWeighting::LOWER_HEAVY)
        , bound_widen_pct(0.10)
        , spacing_divisor(8.0)
        , default_spacing(0.025)
        , fallback_lower_ratio(0.7)
        , fallback_upper_ratio(1.3)
    {}
};

struct GridResetConfig {
    int reset_interval_days;         // trading days between forced rebuilds
    bool reset_on_month_change;
    double default_volatility;       // substituted for a non-finite estimate
    double default_upper_ratio;      // substituted bounds, relative to price
    double default_lower_ratio;

    GridResetConfig()
        : reset_interval_days(30)
        , reset_on_month_change(true)
        , default_volatility(0.2)
        , default_upper_ratio(1.3)
        , default_lower_ratio(0.6)
    {}
};

} // namespace grid
} // namespace gridlab

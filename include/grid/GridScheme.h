#pragma once

#include <vector>
#include "common/Types.h"
#include "grid/GridConfig.h"

namespace gridlab {
namespace grid {

// One partition of the trading range. Built once per reset cycle and never
// modified afterwards; a reset replaces the whole scheme.
struct GridScheme {
    GridType type;
    std::vector<Price> levels;           // ascending, distinct
    std::vector<Shares> order_sizes;     // parallel to levels, whole lots
    Price upper_bound;                   // bounds after widening
    Price lower_bound;
    double volatility;
    double spacing;                      // ratio step of the volatility grid
    Price reference_price;               // price the scheme was built at
    int current_level;                   // level containing reference_price
    bool fallback_used;                  // degenerate geometry replaced by arithmetic fallback
    Date built_on;

    GridScheme()
        : type(GridType::ARITHMETIC)
        , upper_bound(0), lower_bound(0)
        , volatility(0), spacing(0)
        , reference_price(0), current_level(0)
        , fallback_used(false)
    {}

    int levelCount() const { return static_cast<int>(levels.size()); }

    // First level >= price, or the last level when the price is above all of them
    int levelIndexFor(Price price) const;

    // Position of price between the lowest and highest level, clamped to [0, 1]
    double relativePosition(Price price) const;

    bool operator==(const GridScheme& other) const;
};

} // namespace grid
} // namespace gridlab

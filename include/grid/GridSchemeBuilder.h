#pragma once

#include <optional>
#include <vector>
#include "grid/GridScheme.h"

namespace gridlab {
namespace grid {

struct GridBuildInput {
    Price current_price;
    Price upper_bound;
    Price lower_bound;
    double volatility;                   // annualized, e.g. 0.2
    std::optional<double> grid_spacing;  // overrides volatility / divisor
    int level_count;
    GridType type;
    Amount capital;                      // capital distributed over the levels

    GridBuildInput()
        : current_price(0), upper_bound(0), lower_bound(0)
        , volatility(0), level_count(0)
        , type(GridType::ARITHMETIC), capital(0)
    {}
};

class GridSchemeBuilder {
public:
    explicit GridSchemeBuilder(const GridBuilderConfig& config = GridBuilderConfig());

    // Throws InvalidParameterError when level_count < 3 or the price is not positive
    GridScheme build(const GridBuildInput& input) const;

    static std::vector<Price> arithmeticLevels(Price lower, Price upper, int count);
    static std::vector<Price> geometricLevels(Price lower, Price upper, int count);
    static std::vector<Price> volatilityLevels(Price mid, double spacing, int count);

    // Lot-rounded share count per level
    std::vector<Shares> allocateOrderSizes(const std::vector<Price>& levels, Amount capital) const;

private:
    double resolveSpacing(const GridBuildInput& input) const;
    // Strictly ascending, positive, expected size and bracketing the price
    static bool isUsable(const std::vector<Price>& levels, int expected_count, Price price);

    GridBuilderConfig config_;
};

} // namespace grid
} // namespace gridlab

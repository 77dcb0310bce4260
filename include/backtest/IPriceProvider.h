#pragma once

#include <optional>
#include <string>
#include "common/Types.h"

namespace gridlab {
namespace backtest {

// Source of daily closing prices for a symbol
class IPriceProvider {
public:
    virtual ~IPriceProvider() = default;

    // Chronologically ordered, deduplicated closes within [start, end] (open ends when unset).
    // Throws DataLoadError when the symbol cannot be loaded.
    virtual PriceSeries getPrices(
        const std::string& symbol,
        const std::optional<Date>& start = std::nullopt,
        const std::optional<Date>& end = std::nullopt
    ) = 0;
};

} // namespace backtest
} // namespace gridlab

#include "grid/GridSchemeBuilder.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace gridlab;
using namespace gridlab::grid;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

GridBuildInput makeInput(double price, double lower, double upper, int levels, GridType type) {
    GridBuildInput in;
    in.current_price = price;
    in.lower_bound = lower;
    in.upper_bound = upper;
    in.volatility = 0.2;
    in.level_count = levels;
    in.type = type;
    in.capital = 100000.0;
    return in;
}

void checkShape(const GridScheme& s, int levels, double price) {
    assert(s.levelCount() == levels);
    assert(s.order_sizes.size() == s.levels.size());
    for (size_t i = 1; i < s.levels.size(); ++i) {
        assert(s.levels[i - 1] < s.levels[i]);
    }
    assert(s.levels.front() < price && price < s.levels.back());
    for (Shares size : s.order_sizes) {
        assert(size >= 100 && size % 100 == 0);
    }
}
}

int main() {
    GridSchemeBuilder builder;

    // Arithmetic [80,120] x 5
    {
        auto s = builder.build(makeInput(100.0, 80.0, 120.0, 5, GridType::ARITHMETIC));
        const double expected[] = {80.0, 90.0, 100.0, 110.0, 120.0};
        assert(s.levelCount() == 5);
        for (int i = 0; i < 5; ++i) {
            assert(near(s.levels[i], expected[i]));
        }
        assert(!s.fallback_used);
        assert(s.current_level == 2);
    }

    // Geometric [80,120] x 3
    {
        auto s = builder.build(makeInput(100.0, 80.0, 120.0, 3, GridType::GEOMETRIC));
        assert(s.levelCount() == 3);
        assert(near(s.levels[0], 80.0));
        assert(near(s.levels[1], std::sqrt(80.0 * 120.0), 1e-6));
        assert(near(s.levels[1], 97.98, 0.01));
        assert(near(s.levels[2], 120.0));
    }

    // Shape holds for every geometry and a range of counts and prices
    {
        const GridType types[] = {GridType::ARITHMETIC, GridType::GEOMETRIC, GridType::VOLATILITY};
        const double prices[] = {92.0, 100.0, 107.5};
        for (GridType type : types) {
            for (int n = 3; n <= 21; ++n) {
                for (double price : prices) {
                    auto s = builder.build(makeInput(price, 80.0, 120.0, n, type));
                    checkShape(s, n, price);
                }
            }
        }
    }

    // Bounds not containing the price are widened
    {
        auto s = builder.build(makeInput(100.0, 105.0, 95.0, 5, GridType::ARITHMETIC));
        assert(near(s.upper_bound, 110.0));
        assert(near(s.lower_bound, 90.0));
        assert(near(s.levels.front(), 90.0));
        assert(near(s.levels.back(), 110.0));
        checkShape(s, 5, 100.0);
    }

    // Volatility grid: spacing volatility/8 around the midpoint, trimmed from the top
    {
        auto s5 = builder.build(makeInput(100.0, 80.0, 120.0, 5, GridType::VOLATILITY));
        assert(near(s5.spacing, 0.025));
        const double expected[] = {95.0, 97.5, 100.0, 102.5, 105.0};
        for (int i = 0; i < 5; ++i) {
            assert(near(s5.levels[i], expected[i]));
        }

        auto s4 = builder.build(makeInput(99.0, 80.0, 120.0, 4, GridType::VOLATILITY));
        assert(s4.levelCount() == 4);
        assert(near(s4.levels.front(), 95.0));
        assert(near(s4.levels.back(), 102.5));

        auto in = makeInput(100.0, 80.0, 120.0, 5, GridType::VOLATILITY);
        in.grid_spacing = 0.05;
        auto wide = builder.build(in);
        assert(near(wide.levels.front(), 90.0));
        assert(near(wide.levels.back(), 110.0));
    }

    // Unusable volatility falls back to the default spacing
    {
        auto in = makeInput(100.0, 80.0, 120.0, 5, GridType::VOLATILITY);
        in.volatility = std::numeric_limits<double>::quiet_NaN();
        auto s = builder.build(in);
        assert(near(s.spacing, 0.025));
        assert(!s.fallback_used);
    }

    // Volatility grid that misses the price -> arithmetic fallback around the price
    {
        auto s = builder.build(makeInput(115.0, 80.0, 120.0, 5, GridType::VOLATILITY));
        assert(s.fallback_used);
        assert(s.type == GridType::VOLATILITY);
        assert(near(s.levels.front(), 115.0 * 0.7));
        assert(near(s.levels.back(), 115.0 * 1.3));
        checkShape(s, 5, 115.0);
    }

    // Non-finite bound -> arithmetic fallback
    {
        auto in = makeInput(100.0, 80.0, std::numeric_limits<double>::quiet_NaN(), 6, GridType::GEOMETRIC);
        auto s = builder.build(in);
        assert(s.fallback_used);
        checkShape(s, 6, 100.0);
    }

    // Order sizes: lower levels weighted heavier by default, one lot minimum
    {
        auto s = builder.build(makeInput(100.0, 80.0, 120.0, 5, GridType::ARITHMETIC));
        const Shares expected[] = {400, 200, 200, 100, 100};
        for (int i = 0; i < 5; ++i) {
            assert(s.order_sizes[i] == expected[i]);
        }

        GridBuilderConfig cfg;
        cfg.weighting = AllocationWeighting::UPPER_HEAVY;
        GridSchemeBuilder upper_heavy(cfg);
        auto u = upper_heavy.build(makeInput(100.0, 80.0, 120.0, 5, GridType::ARITHMETIC));
        assert(u.order_sizes.front() == 100);
        assert(u.order_sizes.back() == 200);

        auto zero = makeInput(100.0, 80.0, 120.0, 5, GridType::ARITHMETIC);
        zero.capital = 0.0;
        auto z = builder.build(zero);
        for (Shares size : z.order_sizes) {
            assert(size == 100);
        }
    }

    // Level lookup
    {
        auto s = builder.build(makeInput(100.0, 80.0, 120.0, 5, GridType::ARITHMETIC));
        assert(s.levelIndexFor(70.0) == 0);
        assert(s.levelIndexFor(80.0) == 0);
        assert(s.levelIndexFor(95.0) == 2);
        assert(s.levelIndexFor(110.0) == 3);
        assert(s.levelIndexFor(130.0) == 4);
        assert(near(s.relativePosition(100.0), 0.5));
        assert(near(s.relativePosition(60.0), 0.0));
        assert(near(s.relativePosition(200.0), 1.0));
    }

    // Invalid inputs
    {
        bool threw = false;
        try {
            builder.build(makeInput(100.0, 80.0, 120.0, 2, GridType::ARITHMETIC));
        } catch (const InvalidParameterError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            builder.build(makeInput(0.0, 80.0, 120.0, 5, GridType::ARITHMETIC));
        } catch (const InvalidParameterError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            parseGridType("fibonacci");
        } catch (const InvalidGridTypeError&) {
            threw = true;
        }
        assert(threw);
        assert(parseGridType("Geometric") == GridType::GEOMETRIC);
        assert(parseGridType("volatility-centered") == GridType::VOLATILITY);
    }

    std::cout << "[TEST] GridSchemeBuilder PASSED\n";
    return 0;
}

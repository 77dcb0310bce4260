#include "analytics/VolatilityEstimator.h"
#include "common/Errors.h"

#include <array>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>

using namespace gridlab;
using namespace gridlab::analytics;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

class FixedPriceProvider : public backtest::IPriceProvider {
public:
    explicit FixedPriceProvider(PriceSeries series) : series_(std::move(series)) {}

    PriceSeries getPrices(const std::string& symbol,
                          const std::optional<Date>&,
                          const std::optional<Date>&) override {
        calls++;
        if (symbol != "510300") {
            throw DataLoadError("unknown symbol " + symbol);
        }
        return series_;
    }

    int calls = 0;

private:
    PriceSeries series_;
};

class TableEstimator : public IVolatilityEstimator {
public:
    VolatilityEstimate estimate(const std::string& symbol, const Date& as_of) override {
        VolatilityEstimate e;
        e.as_of = as_of;
        auto it = table.find(symbol);
        if (it != table.end()) {
            e.volatility = it->second[0];
            e.upper_bound = it->second[1];
            e.lower_bound = it->second[2];
        }
        return e;
    }

    std::map<std::string, std::array<double, 3>> table;
};

EstimatorConfig smallWindows() {
    EstimatorConfig cfg;
    cfg.volatility_window = 3;
    cfg.short_range_window = 2;
    cfg.long_range_window = 4;
    cfg.short_range_weight = 0.7;
    return cfg;
}
}

int main() {
    PriceSeries series;
    series[Date(2023, 1, 2)] = 100.0;
    series[Date(2023, 1, 3)] = 110.0;
    series[Date(2023, 1, 4)] = 99.0;
    series[Date(2023, 1, 5)] = 108.9;
    series[Date(2023, 1, 6)] = 100.0;

    // Rolling windows
    {
        auto out = RollingVolatilityEstimator::computeSeries(series, smallWindows());
        assert(out.size() == 5);
        assert(std::isnan(out[2].volatility));
        assert(std::isnan(out[2].upper_bound));

        const double r1 = 110.0 / 100.0 - 1.0;
        const double r2 = 99.0 / 110.0 - 1.0;
        const double r3 = 108.9 / 99.0 - 1.0;
        const double mean = (r1 + r2 + r3) / 3.0;
        const double var = ((r1 - mean) * (r1 - mean) + (r2 - mean) * (r2 - mean) +
                            (r3 - mean) * (r3 - mean)) / 2.0;
        assert(near(out[3].volatility, std::sqrt(var) * std::sqrt(252.0), 1e-12));
        assert(out[3].as_of == Date(2023, 1, 5));

        assert(near(out[3].upper_bound, 0.7 * 108.9 + 0.3 * 110.0));
        assert(near(out[3].lower_bound, 99.0));
        assert(near(out[4].upper_bound, 0.7 * 108.9 + 0.3 * 110.0));
        assert(near(out[4].lower_bound, 0.7 * 100.0 + 0.3 * 99.0));
    }

    // Nearest-date lookup and per-symbol caching
    {
        auto provider = std::make_shared<FixedPriceProvider>(series);
        RollingVolatilityEstimator estimator(provider, smallWindows());

        auto exact = estimator.estimate("510300", Date(2023, 1, 5));
        assert(exact.as_of == Date(2023, 1, 5));

        // Past the last close resolves to the last estimate
        auto weekend = estimator.estimate("510300", Date(2023, 1, 7));
        assert(weekend.as_of == Date(2023, 1, 6));

        auto before = estimator.estimate("510300", Date(2022, 12, 1));
        assert(before.as_of == Date(2023, 1, 2));
        assert(std::isnan(before.volatility));
        assert(provider->calls == 1);

        bool threw = false;
        try {
            estimator.estimate("999999", Date(2023, 1, 5));
        } catch (const DataLoadError&) {
            threw = true;
        }
        assert(threw);
    }

    // Parameter suggestion
    {
        TableEstimator estimator;
        estimator.table["510300"] = {0.16, 110.0, 90.0};
        estimator.table["510500"] = {0.24, 130.0, 70.0};
        const double nan = std::numeric_limits<double>::quiet_NaN();
        estimator.table["159915"] = {nan, nan, nan};

        auto one = suggestGridParameters(estimator, {"510300"}, Date(2023, 6, 1));
        assert(near(one.volatility, 0.16));
        assert(near(one.grid_spacing, 0.02));
        assert(one.grid_levels == 10);

        auto avg = suggestGridParameters(estimator, {"510300", "510500", "159915"}, Date(2023, 6, 1));
        assert(near(avg.volatility, 0.20));
        assert(near(avg.grid_spacing, 0.025));
        assert(near(avg.upper_bound, 120.0));
        assert(near(avg.lower_bound, 80.0));
        // 510300: 0.2 / 0.02 = 10; 510500: 0.6 / 0.03 = 20
        assert(avg.grid_levels == 15);

        auto clamped = suggestGridParameters(estimator, {"510300"}, Date(2023, 6, 1), 8.0, 3, 6);
        assert(clamped.grid_levels == 6);

        bool threw = false;
        try {
            suggestGridParameters(estimator, {"159915"}, Date(2023, 6, 1));
        } catch (const InsufficientDataError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] VolatilityEstimator PASSED\n";
    return 0;
}

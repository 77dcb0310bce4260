#include "grid/GridResetScheduler.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>

using namespace gridlab;
using namespace gridlab::grid;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

class StubEstimator : public analytics::IVolatilityEstimator {
public:
    analytics::VolatilityEstimate estimate(const std::string&, const Date& as_of) override {
        calls++;
        if (fail) {
            throw InsufficientDataError("no history");
        }
        analytics::VolatilityEstimate e;
        e.as_of = as_of;
        e.volatility = volatility;
        e.upper_bound = upper;
        e.lower_bound = lower;
        return e;
    }

    int calls = 0;
    bool fail = false;
    double volatility = 0.16;
    double upper = 120.0;
    double lower = 80.0;
};
}

int main() {
    GridSchemeBuilder builder;

    // First call always builds; same-day calls do not rebuild or advance the counter
    {
        auto est = std::make_shared<StubEstimator>();
        GridResetScheduler sched(builder, GridResetConfig(), "510300", 5, GridType::ARITHMETIC,
                                 GridOverrides(), est);
        auto first = sched.maybeReset(Date(2023, 3, 1), 100.0, 50000.0);
        assert(first);
        assert(first->built_on == Date(2023, 3, 1));
        assert(near(first->levels.front(), 80.0));
        assert(near(first->levels.back(), 120.0));
        assert(sched.current() == first);
        assert(est->calls == 1);

        assert(!sched.maybeReset(Date(2023, 3, 1), 101.0, 50000.0));
        assert(!sched.maybeReset(Date(2023, 3, 1), 102.0, 50000.0));
        assert(sched.daysSinceReset() == 0);

        assert(!sched.maybeReset(Date(2023, 3, 2), 101.0, 50000.0));
        assert(!sched.maybeReset(Date(2023, 3, 2), 101.0, 50000.0));
        assert(sched.daysSinceReset() == 1);

        // Calendar month change
        auto april = sched.maybeReset(Date(2023, 4, 3), 105.0, 40000.0);
        assert(april);
        assert(april != first);
        assert(april->built_on == Date(2023, 4, 3));
        assert(sched.daysSinceReset() == 0);
        assert(sched.rebuild(Date(2023, 3, 1), 100.0, 50000.0) == *first);
    }

    // Interval trigger after 30 trading days when month changes are ignored
    {
        GridResetConfig cfg;
        cfg.reset_on_month_change = false;
        GridOverrides ov;
        ov.volatility = 0.2;
        ov.upper_bound = 120.0;
        ov.lower_bound = 80.0;
        GridResetScheduler sched(builder, cfg, "510500", 5, GridType::GEOMETRIC, ov);

        Date day(2023, 1, 2);
        assert(sched.maybeReset(day, 100.0, 50000.0));
        int resets = 0;
        int trading_days = 0;
        while (trading_days < 30) {
            day = day.addDays(1);
            if (!day.isWeekday()) {
                continue;
            }
            trading_days++;
            if (sched.maybeReset(day, 100.0, 50000.0)) {
                resets++;
                assert(trading_days == 30);
            }
        }
        assert(resets == 1);
        assert(sched.daysSinceReset() == 0);
    }

    // rebuild is deterministic and leaves scheduler state alone
    {
        auto est = std::make_shared<StubEstimator>();
        GridResetScheduler sched(builder, GridResetConfig(), "159915", 7, GridType::VOLATILITY,
                                 GridOverrides(), est);
        const GridScheme a = sched.rebuild(Date(2023, 5, 10), 100.0, 30000.0);
        const GridScheme b = sched.rebuild(Date(2023, 5, 10), 100.0, 30000.0);
        assert(a == b);
        assert(!sched.current());
        assert(near(a.spacing, 0.16 / 8.0));
    }

    // Overrides bypass the estimator entirely
    {
        auto est = std::make_shared<StubEstimator>();
        GridOverrides ov;
        ov.volatility = 0.3;
        ov.upper_bound = 130.0;
        ov.lower_bound = 70.0;
        GridResetScheduler sched(builder, GridResetConfig(), "510300", 5, GridType::ARITHMETIC, ov, est);
        auto p = sched.resolveParameters(Date(2023, 6, 1), 100.0);
        assert(est->calls == 0);
        assert(near(p.volatility, 0.3));
        assert(near(p.upper_bound, 130.0));
        assert(near(p.lower_bound, 70.0));
    }

    // Non-finite estimates and estimator failures fall back to defaults
    {
        auto est = std::make_shared<StubEstimator>();
        est->volatility = std::numeric_limits<double>::quiet_NaN();
        est->upper = std::numeric_limits<double>::quiet_NaN();
        GridResetScheduler sched(builder, GridResetConfig(), "510300", 5, GridType::ARITHMETIC,
                                 GridOverrides(), est);
        auto p = sched.resolveParameters(Date(2023, 6, 1), 100.0);
        assert(near(p.volatility, 0.2));
        assert(near(p.upper_bound, 130.0));
        assert(near(p.lower_bound, 60.0));

        est->fail = true;
        auto q = sched.resolveParameters(Date(2023, 6, 2), 50.0);
        assert(near(q.volatility, 0.2));
        assert(near(q.upper_bound, 65.0));
        assert(near(q.lower_bound, 30.0));

        GridResetScheduler no_estimator(builder, GridResetConfig(), "510300", 5, GridType::ARITHMETIC);
        auto r = no_estimator.resolveParameters(Date(2023, 6, 2), 10.0);
        assert(near(r.upper_bound, 13.0));
        assert(near(r.lower_bound, 6.0));
    }

    // Invalid interval
    {
        GridResetConfig cfg;
        cfg.reset_interval_days = 0;
        bool threw = false;
        try {
            GridResetScheduler sched(builder, cfg, "510300", 5, GridType::ARITHMETIC);
        } catch (const InvalidParameterError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] GridResetScheduler PASSED\n";
    return 0;
}

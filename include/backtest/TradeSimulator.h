#pragma once

#include <map>
#include <memory>
#include <vector>
#include "common/Types.h"
#include "backtest/BacktestTypes.h"
#include "backtest/LevelCrossing.h"
#include "analytics/VolatilityEstimator.h"

namespace gridlab {
namespace backtest {

// Cash and holdings of one simulated account
struct Position {
    Amount cash = 0.0;
    Shares shares = 0;
    std::map<int, Price> level_buy_prices;    // last fill per grid level, cleared on grid reset
    Amount total_buy_amount = 0.0;            // every buy since the start, for the average cost
    Shares total_buy_quantity = 0;

    void recordBuy(Shares quantity, Price price);
    double averageCost() const;
};

// Single-asset grid backtest over a daily close series
class TradeSimulator {
public:
    explicit TradeSimulator(const SimulatorConfig& config = SimulatorConfig(),
                            std::shared_ptr<analytics::IVolatilityEstimator> estimator = nullptr);

    // Throws InsufficientDataError, InvalidParameterError
    BacktestResult simulate(const PriceSeries& prices, const BacktestRequest& request) const;

    // Restricts to the request's range and drops unusable closes
    PriceSeries prepareSeries(const PriceSeries& prices, const BacktestRequest& request) const;

    // clamp(1 - relative position of price in the scheme, min, max)
    double initialPositionRatio(const grid::GridScheme& scheme, Price price) const;

    // Quantity actually bought for a planned level order given the cash on hand; 0 to skip
    Shares buyQuantity(Shares planned, Amount cash, Price price) const;

    // Profit of a sale against the average cost, capped at profit_cap_ratio of the sale amount
    Amount cappedProfit(Price price, double average_cost, Shares quantity) const;

private:
    void validate(const BacktestRequest& request) const;

    void executeSells(const grid::GridScheme& scheme, const LevelCrossing& crossing,
                      const Date& day, Price price, const std::string& symbol,
                      Position& position, std::vector<Trade>& trades) const;
    void executeBuys(const grid::GridScheme& scheme, const LevelCrossing& crossing,
                     const Date& day, Price price, const std::string& symbol,
                     Position& position, std::vector<Trade>& trades) const;

    EquityPoint makePoint(const Date& day, Price price, const Position& position,
                          Amount initial_capital) const;
    Shares lotFloor(double quantity) const;

    static void recordTrade(std::vector<Trade>& trades, const Trade& trade);

    SimulatorConfig config_;
    std::shared_ptr<analytics::IVolatilityEstimator> estimator_;
};

} // namespace backtest
} // namespace gridlab

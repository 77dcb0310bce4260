#include "backtest/TradeSimulator.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "grid/GridResetScheduler.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace gridlab {
namespace backtest {

void Position::recordBuy(Shares quantity, Price price) {
    total_buy_amount += quantity * price;
    total_buy_quantity += quantity;
}

double Position::averageCost() const {
    if (total_buy_quantity <= 0) {
        return 0.0;
    }
    return total_buy_amount / static_cast<double>(total_buy_quantity);
}

TradeSimulator::TradeSimulator(const SimulatorConfig& config,
                               std::shared_ptr<analytics::IVolatilityEstimator> estimator)
    : config_(config)
    , estimator_(std::move(estimator))
{
    if (config_.reserve_ratio < 0.0 || config_.reserve_ratio >= 1.0) {
        throw InvalidParameterError("reserve_ratio must be in [0, 1)");
    }
    if (config_.min_initial_position > config_.max_initial_position) {
        throw InvalidParameterError("min_initial_position exceeds max_initial_position");
    }
    if (config_.min_buy_divisor <= 0) {
        throw InvalidParameterError("min_buy_divisor must be positive");
    }
}

BacktestResult TradeSimulator::simulate(const PriceSeries& prices, const BacktestRequest& request) const {
    validate(request);

    const PriceSeries series = prepareSeries(prices, request);
    const std::string& symbol = request.symbol;
    const Amount capital = request.initial_capital;

    LOG_INFO("[{}] Backtest start: capital={:.2f}, {} price points ({} - {}), {} {} levels",
             symbol, capital, series.size(),
             series.begin()->first.toString(), series.rbegin()->first.toString(),
             request.grid_levels, grid::toString(request.grid_type));

    grid::GridSchemeBuilder builder(config_.builder);
    grid::GridResetScheduler scheduler(builder, config_.reset, symbol,
                                       request.grid_levels, request.grid_type,
                                       request.overrides, estimator_);

    BacktestResult result;
    result.symbols.push_back(symbol);
    result.initial_capital = capital;

    Position position;
    position.cash = capital;

    // 1. Entry: first grid funded by the non-reserved capital
    auto it = series.begin();
    const Date first_day = it->first;
    const Price first_price = it->second;
    const Amount initial_investment = capital * (1.0 - config_.reserve_ratio);

    std::shared_ptr<const grid::GridScheme> scheme =
        scheduler.maybeReset(first_day, first_price, initial_investment);
    int prev_level = scheme->current_level;

    result.initial_position_ratio = initialPositionRatio(*scheme, first_price);
    const Shares initial_quantity =
        lotFloor(initial_investment * result.initial_position_ratio / first_price);
    if (initial_quantity > 0) {
        Trade trade;
        trade.date = first_day;
        trade.symbol = symbol;
        trade.side = OrderSide::BUY;
        trade.price = first_price;
        trade.quantity = initial_quantity;
        trade.amount = initial_quantity * first_price;

        position.cash -= trade.amount;
        position.shares += initial_quantity;
        position.recordBuy(initial_quantity, first_price);
        recordTrade(result.trades, trade);

        LOG_INFO("[{}] Initial buy: {} shares @ {:.4f} (position ratio {:.2f})",
                 symbol, initial_quantity, first_price, result.initial_position_ratio);
    }
    result.equity_curve.push_back(makePoint(first_day, first_price, position, capital));

    // 2. Daily loop
    for (++it; it != series.end(); ++it) {
        const Date& day = it->first;
        const Price price = it->second;

        auto rebuilt = scheduler.maybeReset(day, price, position.cash);
        if (rebuilt) {
            scheme = rebuilt;
            prev_level = scheme->current_level;
            position.level_buy_prices.clear();
        }

        const int curr_level = scheme->levelIndexFor(price);
        const LevelCrossing crossing = planCrossing(prev_level, curr_level);
        if (crossing.direction == CrossDirection::UP) {
            executeSells(*scheme, crossing, day, price, symbol, position, result.trades);
        } else if (crossing.direction == CrossDirection::DOWN) {
            executeBuys(*scheme, crossing, day, price, symbol, position, result.trades);
        }
        prev_level = curr_level;

        result.equity_curve.push_back(makePoint(day, price, position, capital));
    }

    const Date last_day = series.rbegin()->first;
    const Price last_price = series.rbegin()->second;

    // 3. Carry the last state forward over weekdays up to the requested end
    if (request.end_date && last_day < *request.end_date) {
        const EquityPoint last_point = result.equity_curve.back();
        for (Date d = last_day.addDays(1); d <= *request.end_date; d = d.addDays(1)) {
            if (!d.isWeekday()) {
                continue;
            }
            EquityPoint point = last_point;
            point.date = d;
            point.carried_forward = true;
            result.equity_curve.push_back(point);
        }
    }

    // 4. Close out remaining holdings at the last price
    result.final_position_value = position.shares * last_price;
    if (position.shares > 0) {
        Trade trade;
        trade.date = (request.end_date && *request.end_date > last_day) ? *request.end_date : last_day;
        trade.symbol = symbol;
        trade.side = OrderSide::SELL;
        trade.price = last_price;
        trade.quantity = position.shares;
        trade.amount = position.shares * last_price;
        trade.realized_profit = cappedProfit(last_price, position.averageCost(), position.shares);
        trade.close_out = true;

        position.cash += trade.amount;
        position.shares = 0;
        recordTrade(result.trades, trade);

        EquityPoint& final_point = result.equity_curve.back();
        final_point.total_equity = position.cash;
        final_point.cash = position.cash;
        final_point.shares = 0;
        final_point.invested_capital = 0.0;
        final_point.profit = position.cash - capital;

        LOG_INFO("[{}] Close-out: {} shares @ {:.4f}, profit={:.2f}",
                 symbol, trade.quantity, last_price, trade.realized_profit);
    }

    // 5. Summary
    result.final_grid = scheme;
    result.trading_days = static_cast<int>(series.size());

    analytics::PerformanceAnalyzer analyzer(config_.analysis);
    result.performance = analyzer.analyze(result.equity_curve, capital, result.trading_days);
    result.trade_stats = analyzer.summarizeTrades(result.trades, config_.analysis.win_rate_policy);

    LOG_INFO("[{}] Backtest done: final={:.2f}, return={:.2f}%, annual={:.2f}%, sharpe={:.2f}, mdd={:.2f}%, trades={}",
             symbol, result.performance.final_equity, result.performance.total_return_pct,
             result.performance.annual_return_pct, result.performance.sharpe_ratio,
             result.performance.max_drawdown_pct, result.trade_stats.total_trades);
    return result;
}

PriceSeries TradeSimulator::prepareSeries(const PriceSeries& prices, const BacktestRequest& request) const {
    PriceSeries filtered;
    for (const auto& entry : prices) {
        if (request.start_date && entry.first < *request.start_date) {
            continue;
        }
        if (request.end_date && entry.first > *request.end_date) {
            continue;
        }
        filtered.insert(entry);
    }

    if (filtered.empty()) {
        throw InsufficientDataError("No price data for " + request.symbol + " in the requested range");
    }
    const Price first = filtered.begin()->second;
    if (!std::isfinite(first) || first <= 0.0) {
        throw InsufficientDataError("First price of " + request.symbol + " on " +
                                    filtered.begin()->first.toString() + " is not usable");
    }

    PriceSeries series;
    for (const auto& entry : filtered) {
        if (!std::isfinite(entry.second) || entry.second <= 0.0) {
            LOG_WARN("[{}] Dropping unusable close {} on {}",
                     request.symbol, entry.second, entry.first.toString());
            continue;
        }
        series.insert(entry);
    }

    if (static_cast<int>(series.size()) < config_.min_observations) {
        throw InsufficientDataError("Only " + std::to_string(series.size()) + " usable prices for " +
                                    request.symbol + ", need at least " +
                                    std::to_string(config_.min_observations));
    }
    return series;
}

double TradeSimulator::initialPositionRatio(const grid::GridScheme& scheme, Price price) const {
    const double price_position = scheme.relativePosition(price);
    return std::clamp(1.0 - price_position, config_.min_initial_position, config_.max_initial_position);
}

Shares TradeSimulator::buyQuantity(Shares planned, Amount cash, Price price) const {
    if (planned <= 0 || price <= 0.0) {
        return 0;
    }
    Shares quantity = planned;
    if (cash < planned * price) {
        const Shares min_buy = std::max(lotFloor(static_cast<double>(planned) / config_.min_buy_divisor),
                                        config_.builder.lot_size);
        const Shares affordable = lotFloor(cash / price);
        quantity = std::max(min_buy, std::min(affordable, planned));
    }
    if (cash < quantity * price) {
        return 0;
    }
    return quantity;
}

Amount TradeSimulator::cappedProfit(Price price, double average_cost, Shares quantity) const {
    const Amount amount = quantity * price;
    const Amount profit = (price - average_cost) * quantity;
    return std::min(profit, amount * config_.profit_cap_ratio);
}

void TradeSimulator::validate(const BacktestRequest& request) const {
    if (!std::isfinite(request.initial_capital) || request.initial_capital <= 0.0) {
        throw InvalidParameterError("initial_capital must be positive");
    }
    if (request.grid_levels < 3) {
        throw InvalidParameterError("grid_levels must be at least 3, got " +
                                    std::to_string(request.grid_levels));
    }
    if (request.start_date && request.end_date && *request.end_date < *request.start_date) {
        throw InvalidParameterError("end_date " + request.end_date->toString() +
                                    " precedes start_date " + request.start_date->toString());
    }
}

void TradeSimulator::executeSells(const grid::GridScheme& scheme, const LevelCrossing& crossing,
                                  const Date& day, Price price, const std::string& symbol,
                                  Position& position, std::vector<Trade>& trades) const {
    for (int level : crossing.levels) {
        if (position.shares <= 0) {
            break;
        }
        const Shares quantity = std::min(position.shares, scheme.order_sizes[static_cast<size_t>(level)]);
        if (quantity <= 0) {
            continue;
        }

        Trade trade;
        trade.date = day;
        trade.symbol = symbol;
        trade.side = OrderSide::SELL;
        trade.price = price;
        trade.quantity = quantity;
        trade.amount = quantity * price;
        trade.level = level;

        const auto bought = position.level_buy_prices.find(level);
        if (bought != position.level_buy_prices.end()) {
            trade.realized_profit = (price - bought->second) * quantity;
        } else {
            trade.realized_profit = cappedProfit(price, position.averageCost(), quantity);
        }

        position.cash += trade.amount;
        position.shares -= quantity;
        recordTrade(trades, trade);
    }
}

void TradeSimulator::executeBuys(const grid::GridScheme& scheme, const LevelCrossing& crossing,
                                 const Date& day, Price price, const std::string& symbol,
                                 Position& position, std::vector<Trade>& trades) const {
    for (int level : crossing.levels) {
        const Shares planned = scheme.order_sizes[static_cast<size_t>(level)];
        const Shares quantity = buyQuantity(planned, position.cash, price);
        if (quantity <= 0) {
            LOG_DEBUG("[{}] {} level {}: cash {:.2f} too short for {} shares @ {:.4f}",
                      symbol, day.toString(), level, position.cash, planned, price);
            continue;
        }
        if (quantity != planned) {
            LOG_INFO("[{}] {} level {}: cash short, buying {} of {} planned shares",
                     symbol, day.toString(), level, quantity, planned);
        }

        Trade trade;
        trade.date = day;
        trade.symbol = symbol;
        trade.side = OrderSide::BUY;
        trade.price = price;
        trade.quantity = quantity;
        trade.amount = quantity * price;
        trade.level = level;

        position.cash -= trade.amount;
        position.shares += quantity;
        position.level_buy_prices[level] = price;
        position.recordBuy(quantity, price);
        recordTrade(trades, trade);
    }
}

EquityPoint TradeSimulator::makePoint(const Date& day, Price price, const Position& position,
                                      Amount initial_capital) const {
    EquityPoint point;
    point.date = day;
    point.cash = position.cash;
    point.shares = position.shares;
    point.price = price;
    point.total_equity = position.cash + position.shares * price;
    point.invested_capital = initial_capital - position.cash;
    point.profit = point.total_equity - initial_capital;
    return point;
}

Shares TradeSimulator::lotFloor(double quantity) const {
    if (!std::isfinite(quantity) || quantity <= 0.0) {
        return 0;
    }
    const Shares lot = config_.builder.lot_size;
    return static_cast<Shares>(std::floor(quantity / lot)) * lot;
}

void TradeSimulator::recordTrade(std::vector<Trade>& trades, const Trade& trade) {
    LOG_INFO("[{}] {} {} level={} qty={} @ {:.4f} amount={:.2f} profit={:.2f}{}",
             trade.symbol, trade.date.toString(), toString(trade.side), trade.level,
             trade.quantity, trade.price, trade.amount, trade.realized_profit,
             trade.close_out ? " (close-out)" : "");
    Logger::getInstance().logTrade(trade.date.toString(), trade.symbol, toString(trade.side),
                                   trade.price, trade.quantity, trade.amount, trade.realized_profit);
    trades.push_back(trade);
}

} // namespace backtest
} // namespace gridlab

#include "backtest/PortfolioAggregator.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <map>

namespace gridlab {
namespace backtest {

PortfolioAggregator::PortfolioAggregator(std::shared_ptr<IPriceProvider> provider,
                                         const SimulatorConfig& config,
                                         std::shared_ptr<analytics::IVolatilityEstimator> estimator)
    : provider_(std::move(provider))
    , config_(config)
    , simulator_(config, std::move(estimator))
{
    if (!provider_) {
        throw InvalidParameterError("PortfolioAggregator requires a price provider");
    }
}

BacktestResult PortfolioAggregator::runSingle(const BacktestRequest& request) const {
    const PriceSeries prices = provider_->getPrices(request.symbol, request.start_date, request.end_date);
    return simulator_.simulate(prices, request);
}

BacktestResult PortfolioAggregator::aggregate(const std::vector<std::string>& symbols,
                                              Amount initial_capital,
                                              const std::optional<Date>& start_date,
                                              const std::optional<Date>& end_date,
                                              int grid_levels,
                                              grid::GridType grid_type) const {
    BacktestRequest request;
    request.initial_capital = initial_capital;
    request.start_date = start_date;
    request.end_date = end_date;
    request.grid_levels = grid_levels;
    request.grid_type = grid_type;
    return aggregate(symbols, request);
}

BacktestResult PortfolioAggregator::aggregate(const std::vector<std::string>& symbols,
                                              const BacktestRequest& request) const {
    if (symbols.empty()) {
        throw InvalidParameterError("Portfolio backtest needs at least one symbol");
    }

    const Amount per_symbol_capital = request.initial_capital / static_cast<double>(symbols.size());
    LOG_INFO("Portfolio backtest: {} symbols, capital={:.2f} ({:.2f} each)",
             symbols.size(), request.initial_capital, per_symbol_capital);

    std::vector<BacktestResult> results;
    results.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        BacktestRequest single = request;
        single.symbol = symbol;
        single.initial_capital = per_symbol_capital;
        try {
            results.push_back(runSingle(single));
        } catch (const GridLabError& e) {
            LOG_ERROR("[{}] Portfolio backtest aborted: {}", symbol, e.what());
            throw;
        }
    }

    BacktestResult portfolio;
    portfolio.symbols = symbols;
    portfolio.initial_capital = request.initial_capital;
    portfolio.final_grid = results.front().final_grid;

    std::vector<EquityCurve> curves;
    curves.reserve(results.size());
    double ratio_sum = 0.0;
    for (const auto& r : results) {
        curves.push_back(r.equity_curve);
        portfolio.trades.insert(portfolio.trades.end(), r.trades.begin(), r.trades.end());
        portfolio.final_position_value += r.final_position_value;
        ratio_sum += r.initial_position_ratio;
    }
    portfolio.initial_position_ratio = ratio_sum / static_cast<double>(results.size());

    std::stable_sort(portfolio.trades.begin(), portfolio.trades.end(),
                     [](const Trade& a, const Trade& b) { return a.date < b.date; });

    portfolio.equity_curve = mergeEquityCurves(curves);
    portfolio.trading_days = static_cast<int>(std::count_if(
        portfolio.equity_curve.begin(), portfolio.equity_curve.end(),
        [](const EquityPoint& p) { return !p.carried_forward; }));

    analytics::PerformanceAnalyzer analyzer(config_.analysis);
    portfolio.performance = analyzer.analyze(portfolio.equity_curve, portfolio.initial_capital,
                                             portfolio.trading_days);
    portfolio.trade_stats = analyzer.summarizeTrades(portfolio.trades,
                                                     analytics::WinRatePolicy::SIGNED_PROFIT);

    LOG_INFO("Portfolio backtest done: final={:.2f}, return={:.2f}%, annual={:.2f}%, sharpe={:.2f}, mdd={:.2f}%",
             portfolio.performance.final_equity, portfolio.performance.total_return_pct,
             portfolio.performance.annual_return_pct, portfolio.performance.sharpe_ratio,
             portfolio.performance.max_drawdown_pct);
    return portfolio;
}

EquityCurve PortfolioAggregator::mergeEquityCurves(const std::vector<EquityCurve>& curves) {
    std::map<Date, EquityPoint> merged;
    for (const auto& curve : curves) {
        for (const auto& point : curve) {
            auto inserted = merged.emplace(point.date, EquityPoint());
            EquityPoint& slot = inserted.first->second;
            if (inserted.second) {
                slot.date = point.date;
                slot.carried_forward = true;
            }
            slot.total_equity += point.total_equity;
            slot.invested_capital += point.invested_capital;
            slot.profit += point.profit;
            slot.cash += point.cash;
            // A date is real trading data when any asset traded on it
            slot.carried_forward = slot.carried_forward && point.carried_forward;
        }
    }

    EquityCurve result;
    result.reserve(merged.size());
    for (auto& entry : merged) {
        result.push_back(entry.second);
    }
    return result;
}

} // namespace backtest
} // namespace gridlab

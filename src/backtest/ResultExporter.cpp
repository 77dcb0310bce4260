#include "backtest/ResultExporter.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

namespace gridlab {
namespace backtest {

nlohmann::json toJson(const grid::GridScheme& scheme) {
    nlohmann::json raw;
    raw["type"] = grid::toString(scheme.type);
    raw["levels"] = scheme.levels;
    raw["order_sizes"] = scheme.order_sizes;
    raw["upper_bound"] = scheme.upper_bound;
    raw["lower_bound"] = scheme.lower_bound;
    raw["volatility"] = scheme.volatility;
    raw["spacing"] = scheme.spacing;
    raw["reference_price"] = scheme.reference_price;
    raw["current_level"] = scheme.current_level;
    raw["fallback_used"] = scheme.fallback_used;
    raw["built_on"] = scheme.built_on.toString();
    return raw;
}

nlohmann::json toJson(const Trade& trade) {
    nlohmann::json raw;
    raw["date"] = trade.date.toString();
    raw["symbol"] = trade.symbol;
    raw["side"] = toString(trade.side);
    raw["price"] = trade.price;
    raw["quantity"] = trade.quantity;
    raw["amount"] = trade.amount;
    raw["realized_profit"] = trade.realized_profit;
    raw["level"] = trade.level;
    raw["close_out"] = trade.close_out;
    return raw;
}

nlohmann::json toJson(const EquityPoint& point) {
    nlohmann::json raw;
    raw["date"] = point.date.toString();
    raw["total_equity"] = point.total_equity;
    raw["invested_capital"] = point.invested_capital;
    raw["profit"] = point.profit;
    raw["cash"] = point.cash;
    raw["shares"] = point.shares;
    raw["price"] = point.price;
    raw["carried_forward"] = point.carried_forward;
    return raw;
}

nlohmann::json toJson(const BacktestResult& result) {
    nlohmann::json raw;
    raw["symbols"] = result.symbols;
    raw["initial_capital"] = result.initial_capital;
    raw["trading_days"] = result.trading_days;
    raw["initial_position_ratio"] = result.initial_position_ratio;
    raw["final_position_value"] = result.final_position_value;

    const auto& m = result.performance;
    raw["performance"] = {
        {"annual_return_pct", m.annual_return_pct},
        {"total_return_pct", m.total_return_pct},
        {"sharpe_ratio", m.sharpe_ratio},
        {"max_drawdown_pct", m.max_drawdown_pct},
        {"final_equity", m.final_equity},
        {"total_profit", m.total_profit},
        {"avg_invested_capital", m.avg_invested_capital},
        {"grid_profit_pct", m.grid_profit_pct},
        {"trading_days", m.trading_days}
    };

    const auto& s = result.trade_stats;
    raw["trade_stats"] = {
        {"total_trades", s.total_trades},
        {"buy_count", s.buy_count},
        {"sell_count", s.sell_count},
        {"win_count", s.win_count},
        {"win_rate_pct", s.win_rate_pct},
        {"realized_profit", s.realized_profit}
    };

    raw["final_grid"] = result.final_grid ? toJson(*result.final_grid) : nlohmann::json();

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& trade : result.trades) {
        trades.push_back(toJson(trade));
    }
    raw["trades"] = std::move(trades);

    nlohmann::json curve = nlohmann::json::array();
    for (const auto& point : result.equity_curve) {
        curve.push_back(toJson(point));
    }
    raw["equity_curve"] = std::move(curve);
    return raw;
}

bool writeResultJson(const std::filesystem::path& file_path, const BacktestResult& result) {
    std::error_code ec;
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create directory {}: {}", file_path.parent_path().string(), ec.message());
            return false;
        }
    }

    auto tmp_path = file_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Cannot open {} for writing", tmp_path.string());
            return false;
        }
        out << toJson(result).dump(2);
        if (!out) {
            LOG_ERROR("Write to {} failed", tmp_path.string());
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path, ec);
    if (ec) {
        LOG_ERROR("Cannot move {} to {}: {}", tmp_path.string(), file_path.string(), ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    LOG_INFO("Result written to {}", file_path.string());
    return true;
}

} // namespace backtest
} // namespace gridlab

#pragma once

#include <map>
#include <string>
#include <vector>
#include "common/Date.h"

namespace gridlab {

using Price = double;
using Amount = double;
using Shares = long long;

// Trading date -> closing price, ascending by date
using PriceSeries = std::map<Date, Price>;

enum class OrderSide { BUY, SELL };

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

struct Trade {
    Date date;
    std::string symbol;
    OrderSide side;
    Price price;
    Shares quantity;
    Amount amount;
    Amount realized_profit;
    int level;                  // grid level index, -1 if not tied to a level
    bool close_out;             // end-of-backtest liquidation

    Trade()
        : side(OrderSide::BUY), price(0), quantity(0), amount(0)
        , realized_profit(0), level(-1), close_out(false)
    {}
};

struct EquityPoint {
    Date date;
    Amount total_equity;        // cash + shares * price
    Amount invested_capital;    // initial_capital - cash
    Amount profit;              // total_equity - initial_capital
    Amount cash;
    Shares shares;
    Price price;
    bool carried_forward;       // no trading data for this date

    EquityPoint()
        : total_equity(0), invested_capital(0), profit(0)
        , cash(0), shares(0), price(0), carried_forward(false)
    {}
};

using EquityCurve = std::vector<EquityPoint>;

} // namespace gridlab

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "common/Types.h"
#include "backtest/IPriceProvider.h"

namespace gridlab {
namespace backtest {

class DataHistory {
public:
    // Daily closes from a CSV file. Accepts a header naming "date" and "close"
    // columns, or headerless rows of date,close or date,open,high,low,close[,volume].
    // Throws DataLoadError when the file cannot be opened.
    static PriceSeries loadCSV(const std::string& file_path);

    // JSON array of {"date": "...", "close": ...} (or "d"/"c") objects
    static PriceSeries loadJSON(const std::string& file_path);

    // Removes non-finite and non-positive closes
    static PriceSeries dropInvalid(const PriceSeries& series);

    static PriceSeries filterByDate(const PriceSeries& series,
                                    const std::optional<Date>& start,
                                    const std::optional<Date>& end);

    // Reindexes to every weekday in the overlap of [start, end] and the series'
    // own date span, carrying the last known close into missing days
    static PriceSeries forwardFillBusinessDays(const PriceSeries& series,
                                               const std::optional<Date>& start,
                                               const std::optional<Date>& end);
};

// Reads <data_dir>/<symbol>.csv (or .json) and caches the parsed history
class CsvPriceProvider : public IPriceProvider {
public:
    explicit CsvPriceProvider(std::string data_dir);

    PriceSeries getPrices(
        const std::string& symbol,
        const std::optional<Date>& start = std::nullopt,
        const std::optional<Date>& end = std::nullopt
    ) override;

private:
    const PriceSeries& history(const std::string& symbol);

    std::string data_dir_;
    std::mutex mutex_;
    std::map<std::string, PriceSeries> cache_;
};

} // namespace backtest
} // namespace gridlab

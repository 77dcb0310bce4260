#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>
#include <nlohmann/json.hpp>

namespace gridlab {
namespace backtest {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<std::string> splitRow(const std::string& line) {
    std::stringstream ss(line);
    std::string cell;
    std::vector<std::string> row;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }
    return row;
}

void insertPoint(PriceSeries& series, const Date& date, double close) {
    auto result = series.emplace(date, close);
    if (!result.second) {
        // Duplicate date: the later row wins
        result.first->second = close;
        LOG_WARN("Duplicate price row for {}, keeping the later value", date.toString());
    }
}
}

PriceSeries DataHistory::loadCSV(const std::string& file_path) {
    PriceSeries series;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        throw DataLoadError("Failed to open CSV file: " + file_path);
    }

    int date_col = 0;
    int close_col = -1;     // resolved from the header or the row width
    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        line_no++;
        const auto row = splitRow(line);
        if (row.empty() || row[0].empty()) continue;

        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // Header row: locate the date and close columns by name
            for (size_t i = 0; i < row.size(); i++) {
                const std::string name = toLowerCopy(row[i]);
                if (name == "date" || name == "trade_date" || name == "timestamp") {
                    date_col = static_cast<int>(i);
                } else if (name == "close" || name == "adj_close" || name == "price") {
                    close_col = static_cast<int>(i);
                }
            }
            continue;
        }

        int col = close_col;
        if (col < 0) {
            col = (row.size() >= 5) ? 4 : 1;
        }
        if (static_cast<int>(row.size()) <= std::max(col, date_col)) {
            LOG_WARN("Skipping short row {} in {}", line_no, file_path);
            continue;
        }

        const auto date = Date::parse(row[static_cast<size_t>(date_col)]);
        if (!date) {
            LOG_WARN("Skipping row {} with unparseable date: {}", line_no, line);
            continue;
        }

        try {
            insertPoint(series, *date, std::stod(row[static_cast<size_t>(col)]));
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    LOG_INFO("Loaded {} closes from {}", series.size(), file_path);
    return series;
}

PriceSeries DataHistory::loadJSON(const std::string& file_path) {
    PriceSeries series;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        throw DataLoadError("Failed to open JSON file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        throw DataLoadError("Malformed JSON price file: " + file_path);
    }

    for (const auto& item : j) {
        std::string date_text;
        if (item.contains("date") && item["date"].is_string()) date_text = item["date"].get<std::string>();
        else if (item.contains("d") && item["d"].is_string()) date_text = item["d"].get<std::string>();

        const auto date = Date::parse(date_text);
        if (!date) {
            LOG_WARN("Skipping JSON entry with unparseable date: {}", item.dump());
            continue;
        }

        double close = std::nan("");
        if (item.contains("close") && item["close"].is_number()) close = item["close"].get<double>();
        else if (item.contains("c") && item["c"].is_number()) close = item["c"].get<double>();

        insertPoint(series, *date, close);
    }

    LOG_INFO("Loaded {} closes from {}", series.size(), file_path);
    return series;
}

PriceSeries DataHistory::dropInvalid(const PriceSeries& series) {
    PriceSeries out;
    size_t dropped = 0;
    for (const auto& point : series) {
        if (std::isfinite(point.second) && point.second > 0.0) {
            out.emplace_hint(out.end(), point.first, point.second);
        } else {
            dropped++;
        }
    }
    if (dropped > 0) {
        LOG_WARN("Dropped {} non-finite or non-positive closes", dropped);
    }
    return out;
}

PriceSeries DataHistory::filterByDate(const PriceSeries& series,
                                      const std::optional<Date>& start,
                                      const std::optional<Date>& end) {
    auto first = start ? series.lower_bound(*start) : series.begin();
    auto last = end ? series.upper_bound(*end) : series.end();
    if (start && end && *end < *start) {
        return {};
    }
    return PriceSeries(first, last);
}

PriceSeries DataHistory::forwardFillBusinessDays(const PriceSeries& series,
                                                 const std::optional<Date>& start,
                                                 const std::optional<Date>& end) {
    PriceSeries out;
    if (series.empty()) {
        return out;
    }

    const Date from = (start && *start > series.begin()->first) ? *start : series.begin()->first;
    const Date to = (end && *end < series.rbegin()->first) ? *end : series.rbegin()->first;
    if (to < from) {
        return out;
    }

    auto it = series.upper_bound(from);
    // Last close at or before `from`
    double last_close = std::prev(it)->second;

    for (Date day = from; day <= to; day = day.addDays(1)) {
        while (it != series.end() && it->first <= day) {
            last_close = it->second;
            ++it;
        }
        if (day.isWeekday()) {
            out.emplace_hint(out.end(), day, last_close);
        }
    }
    return out;
}

CsvPriceProvider::CsvPriceProvider(std::string data_dir)
    : data_dir_(std::move(data_dir)) {}

PriceSeries CsvPriceProvider::getPrices(const std::string& symbol,
                                        const std::optional<Date>& start,
                                        const std::optional<Date>& end) {
    std::lock_guard<std::mutex> lock(mutex_);
    const PriceSeries& full = history(symbol);
    return DataHistory::forwardFillBusinessDays(full, start, end);
}

const PriceSeries& CsvPriceProvider::history(const std::string& symbol) {
    auto cached = cache_.find(symbol);
    if (cached != cache_.end()) {
        return cached->second;
    }

    const std::filesystem::path base = std::filesystem::path(data_dir_) / symbol;
    PriceSeries raw;
    if (std::filesystem::exists(base.string() + ".csv")) {
        raw = DataHistory::loadCSV(base.string() + ".csv");
    } else if (std::filesystem::exists(base.string() + ".json")) {
        raw = DataHistory::loadJSON(base.string() + ".json");
    } else {
        throw DataLoadError("No price data for symbol " + symbol + " under " + data_dir_);
    }

    auto inserted = cache_.emplace(symbol, DataHistory::dropInvalid(raw));
    return inserted.first->second;
}

} // namespace backtest
} // namespace gridlab

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include "backtest/BacktestTypes.h"

namespace gridlab {
namespace backtest {

nlohmann::json toJson(const grid::GridScheme& scheme);
nlohmann::json toJson(const Trade& trade);
nlohmann::json toJson(const EquityPoint& point);
nlohmann::json toJson(const BacktestResult& result);

// Writes through a .tmp file and renames over the target; false on I/O failure
bool writeResultJson(const std::filesystem::path& file_path, const BacktestResult& result);

} // namespace backtest
} // namespace gridlab

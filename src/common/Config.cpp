#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace gridlab {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

std::optional<Date> readDate(const nlohmann::json& section, const char* key) {
    if (!section.contains(key) || section[key].is_null()) {
        return std::nullopt;
    }
    const std::string text = trimCopy(section[key].get<std::string>());
    if (text.empty()) {
        return std::nullopt;
    }
    auto date = Date::parse(text);
    if (!date) {
        throw InvalidParameterError(std::string("Invalid date for ") + key + ": '" + text + "'");
    }
    return date;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    backtest_ = BacktestDefaults();
    simulator_ = backtest::SimulatorConfig();
    estimator_ = analytics::EstimatorConfig();
    data_dir_ = "data";
    timeout_seconds_ = 60;
    log_dir_ = "logs";
    log_level_ = "info";
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config path: " << config_path.string() << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults" << std::endl;
        applyEnvironmentOverrides();
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw InvalidParameterError("Cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw InvalidParameterError("Malformed config file " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    std::cout << "Config loaded: capital=" << backtest_.initial_capital
              << ", levels=" << backtest_.grid_levels
              << ", type=" << grid::toString(backtest_.grid_type)
              << ", data_dir=" << data_dir_ << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    try {
        if (j.contains("backtest")) {
            auto& b = j["backtest"];
            backtest_.initial_capital = b.value("initial_capital", 100000.0);
            backtest_.grid_levels = b.value("grid_levels", 10);
            backtest_.grid_type = grid::parseGridType(b.value("grid_type", std::string("arithmetic")));
            if (b.contains("symbols")) {
                backtest_.symbols = b["symbols"].get<std::vector<std::string>>();
                for (auto& symbol : backtest_.symbols) {
                    symbol = trimCopy(symbol);
                }
            }
            backtest_.start_date = readDate(b, "start_date");
            backtest_.end_date = readDate(b, "end_date");
        }

        if (j.contains("grid")) {
            auto& g = j["grid"];
            simulator_.builder.lot_size = g.value("lot_size", 100LL);
            simulator_.builder.weighting =
                grid::parseAllocationWeighting(g.value("allocation_weighting", std::string("lower_heavy")));
            simulator_.builder.bound_widen_pct = g.value("bound_widen_pct", 0.10);
            simulator_.builder.spacing_divisor = g.value("spacing_divisor", 8.0);
            simulator_.builder.default_spacing = g.value("default_spacing", 0.025);
            simulator_.builder.fallback_lower_ratio = g.value("fallback_lower_ratio", 0.7);
            simulator_.builder.fallback_upper_ratio = g.value("fallback_upper_ratio", 1.3);

            simulator_.reserve_ratio = g.value("reserve_ratio", 0.5);
            simulator_.min_initial_position = g.value("min_initial_position", 0.3);
            simulator_.max_initial_position = g.value("max_initial_position", 0.9);
            simulator_.profit_cap_ratio = g.value("profit_cap_ratio", 0.2);
            simulator_.min_buy_divisor = g.value("min_buy_divisor", 3);
            simulator_.min_observations = g.value("min_observations", 10);

            simulator_.reset.reset_interval_days = g.value("reset_interval_days", 30);
            simulator_.reset.reset_on_month_change = g.value("reset_on_month_change", true);
            simulator_.reset.default_volatility = g.value("default_volatility", 0.2);
            simulator_.reset.default_upper_ratio = g.value("default_upper_ratio", 1.3);
            simulator_.reset.default_lower_ratio = g.value("default_lower_ratio", 0.6);
        }

        if (j.contains("analysis")) {
            auto& a = j["analysis"];
            simulator_.analysis.risk_free_rate = a.value("risk_free_rate", 0.03);
            simulator_.analysis.trading_days_per_year = a.value("trading_days_per_year", 252);
            simulator_.analysis.win_rate_policy =
                analytics::parseWinRatePolicy(a.value("win_rate_policy", std::string("assume_grid_wins")));
        }

        if (j.contains("data")) {
            auto& d = j["data"];
            data_dir_ = d.value("data_dir", std::string("data"));
            estimator_.volatility_window = d.value("volatility_window", 200);
            estimator_.short_range_window = d.value("short_range_window", 200);
            estimator_.long_range_window = d.value("long_range_window", 800);
            estimator_.short_range_weight = d.value("short_range_weight", 0.7);
            estimator_.trading_days_per_year = simulator_.analysis.trading_days_per_year;
        }

        if (j.contains("runtime")) {
            auto& r = j["runtime"];
            timeout_seconds_ = r.value("timeout_seconds", 60);
            log_dir_ = r.value("log_dir", std::string("logs"));
            log_level_ = r.value("log_level", std::string("info"));
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidParameterError(std::string("Invalid config value: ") + e.what());
    }

    if (backtest_.grid_levels < 3) {
        throw InvalidParameterError("backtest.grid_levels must be at least 3");
    }
    if (simulator_.builder.lot_size <= 0) {
        throw InvalidParameterError("grid.lot_size must be positive");
    }
    if (simulator_.reset.reset_interval_days <= 0) {
        throw InvalidParameterError("grid.reset_interval_days must be positive");
    }

    applyEnvironmentOverrides();
}

void Config::applyEnvironmentOverrides() {
    const std::string data_dir = readEnvVar("GRIDLAB_DATA_DIR");
    if (!data_dir.empty()) {
        data_dir_ = data_dir;
    }
}

} // namespace gridlab

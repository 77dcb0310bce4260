#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backtest/BacktestTypes.h"
#include "analytics/VolatilityEstimator.h"

namespace gridlab {

// Run parameters used when the command line leaves them out
struct BacktestDefaults {
    double initial_capital = 100000.0;
    int grid_levels = 10;
    grid::GridType grid_type = grid::GridType::ARITHMETIC;
    std::vector<std::string> symbols;
    std::optional<Date> start_date;
    std::optional<Date> end_date;
};

class Config {
public:
    static Config& getInstance();

    // Missing file keeps the defaults; malformed content throws InvalidParameterError
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void resetToDefaults();

    const BacktestDefaults& getBacktestDefaults() const { return backtest_; }
    const backtest::SimulatorConfig& getSimulatorConfig() const { return simulator_; }
    const analytics::EstimatorConfig& getEstimatorConfig() const { return estimator_; }

    std::string getDataDir() const { return data_dir_; }

    int getTimeoutSeconds() const { return timeout_seconds_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getLogLevel() const { return log_level_; }

private:
    Config() = default;

    // GRIDLAB_DATA_DIR replaces data.data_dir
    void applyEnvironmentOverrides();

    BacktestDefaults backtest_;
    backtest::SimulatorConfig simulator_;
    analytics::EstimatorConfig estimator_;

    std::string data_dir_ = "data";
    int timeout_seconds_ = 60;
    std::string log_dir_ = "logs";
    std::string log_level_ = "info";
};

} // namespace gridlab

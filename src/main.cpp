#include "common/Logger.h"
#include "common/ArgParse.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"
#include "backtest/DataHistory.h"
#include "backtest/PortfolioAggregator.h"
#include "backtest/BacktestRunner.h"
#include "backtest/ResultExporter.h"
#include "analytics/VolatilityEstimator.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace gridlab;

namespace {

struct CliOptions {
    std::string config_path = "config/config.json";
    std::vector<std::string> symbols;
    std::optional<Date> start_date;
    std::optional<Date> end_date;
    std::optional<double> initial_capital;
    std::optional<int> grid_levels;
    std::optional<std::string> grid_type;
    grid::GridOverrides overrides;
    std::optional<std::string> output_path;
    bool suggest = false;
    bool json_mode = false;
};

void printUsage() {
    std::cout << "Usage: gridlab [options]\n"
              << "  --config <path>       configuration file (default config/config.json)\n"
              << "  --symbols <a,b,...>   symbols to backtest; several run as an even-split portfolio\n"
              << "  --start <YYYY-MM-DD>  first date of the backtest\n"
              << "  --end <YYYY-MM-DD>    last date of the backtest\n"
              << "  --capital <amount>    initial capital\n"
              << "  --levels <n>          grid level count (>= 3)\n"
              << "  --type <name>         arithmetic | geometric | volatility\n"
              << "  --volatility <v>      annualized volatility override\n"
              << "  --spacing <s>         volatility grid spacing override\n"
              << "  --upper <price>       grid upper bound override\n"
              << "  --lower <price>       grid lower bound override\n"
              << "  --suggest             print suggested grid parameters and exit\n"
              << "  --json                print the full result as JSON\n"
              << "  --out <path>          write the full result as JSON to a file\n";
}

std::string trimCopy(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitCsv(const std::string& csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        const size_t comma = csv.find(',', start);
        std::string token = (comma == std::string::npos)
            ? csv.substr(start)
            : csv.substr(start, comma - start);
        token = trimCopy(token);
        if (!token.empty()) {
            out.push_back(token);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

Date parseDateArg(const std::string& flag, const std::string& text) {
    auto date = Date::parse(text);
    if (!date) {
        throw InvalidParameterError(flag + " expects YYYY-MM-DD, got '" + text + "'");
    }
    return *date;
}

// Returns false when only usage was requested
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (arg == "--suggest") {
            opts.suggest = true;
            continue;
        }
        if (arg == "--json") {
            opts.json_mode = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw InvalidParameterError("Missing value for " + arg);
        }
        const std::string value = argv[++i];

        if (arg == "--config") {
            opts.config_path = value;
        } else if (arg == "--symbols") {
            opts.symbols = splitCsv(value);
        } else if (arg == "--start") {
            opts.start_date = parseDateArg(arg, value);
        } else if (arg == "--end") {
            opts.end_date = parseDateArg(arg, value);
        } else if (arg == "--capital") {
            opts.initial_capital = utils::parseNumberArg(arg, value);
        } else if (arg == "--levels") {
            opts.grid_levels = utils::parseIntegerArg(arg, value);
        } else if (arg == "--type") {
            opts.grid_type = value;
        } else if (arg == "--volatility") {
            opts.overrides.volatility = utils::parseNumberArg(arg, value);
        } else if (arg == "--spacing") {
            opts.overrides.grid_spacing = utils::parseNumberArg(arg, value);
        } else if (arg == "--upper") {
            opts.overrides.upper_bound = utils::parseNumberArg(arg, value);
        } else if (arg == "--lower") {
            opts.overrides.lower_bound = utils::parseNumberArg(arg, value);
        } else if (arg == "--out") {
            opts.output_path = value;
        } else {
            throw InvalidParameterError("Unknown option: " + arg);
        }
    }
    return true;
}

void printSummary(const backtest::BacktestResult& result) {
    const auto& m = result.performance;
    const auto& s = result.trade_stats;

    std::cout << "\nBacktest result\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "Symbols:          ";
    for (size_t i = 0; i < result.symbols.size(); ++i) {
        std::cout << (i ? ", " : "") << result.symbols[i];
    }
    std::cout << "\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Initial capital:  " << result.initial_capital << "\n";
    std::cout << "Final equity:     " << m.final_equity << "\n";
    std::cout << "Total profit:     " << m.total_profit << "\n";
    std::cout << "Total return:     " << m.total_return_pct << "%\n";
    std::cout << "Annual return:    " << m.annual_return_pct << "%\n";
    std::cout << "Sharpe ratio:     " << std::setprecision(3) << m.sharpe_ratio << "\n";
    std::cout << std::setprecision(2);
    std::cout << "Max drawdown:     " << m.max_drawdown_pct << "%\n";
    std::cout << "Grid profit:      " << m.grid_profit_pct << "% of avg invested "
              << m.avg_invested_capital << "\n";
    std::cout << "Trading days:     " << result.trading_days << "\n";
    std::cout << "Trades:           " << s.total_trades
              << " (buy " << s.buy_count << ", sell " << s.sell_count << ")\n";
    std::cout << "Win rate:         " << s.win_rate_pct << "%\n";
    if (result.final_grid) {
        const auto& g = *result.final_grid;
        std::cout << "Final grid:       " << grid::toString(g.type) << ", " << g.levelCount()
                  << " levels " << std::setprecision(4) << g.levels.front()
                  << " - " << g.levels.back() << "\n";
    }
    std::cout << "---------------------------------------------\n";
}

int runSuggest(const CliOptions& opts,
               const std::vector<std::string>& symbols,
               const std::optional<Date>& as_of,
               analytics::IVolatilityEstimator& estimator,
               const backtest::SimulatorConfig& sim_config) {
    if (!as_of) {
        throw InvalidParameterError("--suggest needs --start or --end to pick the estimate date");
    }
    const auto s = analytics::suggestGridParameters(estimator, symbols, *as_of,
                                                    sim_config.builder.spacing_divisor);
    if (opts.json_mode) {
        nlohmann::json j;
        j["as_of"] = as_of->toString();
        j["volatility"] = s.volatility;
        j["grid_spacing"] = s.grid_spacing;
        j["upper_bound"] = s.upper_bound;
        j["lower_bound"] = s.lower_bound;
        j["grid_levels"] = s.grid_levels;
        std::cout << j.dump(2) << "\n";
        return 0;
    }
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "Suggested grid parameters (" << as_of->toString() << ")\n";
    std::cout << "  volatility:   " << s.volatility << "\n";
    std::cout << "  grid_spacing: " << s.grid_spacing << "\n";
    std::cout << "  upper_bound:  " << s.upper_bound << "\n";
    std::cout << "  lower_bound:  " << s.lower_bound << "\n";
    std::cout << "  grid_levels:  " << s.grid_levels << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        CliOptions opts;
        if (!parseArgs(argc, argv, opts)) {
            printUsage();
            return 0;
        }

        auto& config = Config::getInstance();
        config.load(opts.config_path);

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        const BacktestDefaults& defaults = config.getBacktestDefaults();
        const backtest::SimulatorConfig sim_config = config.getSimulatorConfig();

        const std::vector<std::string> symbols = opts.symbols.empty() ? defaults.symbols : opts.symbols;
        if (symbols.empty()) {
            throw InvalidParameterError("No symbols given (use --symbols or backtest.symbols)");
        }

        backtest::BacktestRequest request;
        request.symbol = symbols.front();
        request.initial_capital = opts.initial_capital.value_or(defaults.initial_capital);
        request.start_date = opts.start_date ? opts.start_date : defaults.start_date;
        request.end_date = opts.end_date ? opts.end_date : defaults.end_date;
        request.grid_levels = opts.grid_levels.value_or(defaults.grid_levels);
        request.grid_type = opts.grid_type ? grid::parseGridType(*opts.grid_type) : defaults.grid_type;
        request.overrides = opts.overrides;

        const std::string data_dir = utils::PathUtils::resolveRelativePath(config.getDataDir()).string();
        LOG_INFO("GridLab: data_dir={}, symbols={}, levels={}, type={}",
                 data_dir, symbols.size(), request.grid_levels, grid::toString(request.grid_type));

        auto provider = std::make_shared<backtest::CsvPriceProvider>(data_dir);
        auto estimator = std::make_shared<analytics::RollingVolatilityEstimator>(
            provider, config.getEstimatorConfig());

        if (opts.suggest) {
            return runSuggest(opts, symbols,
                              request.start_date ? request.start_date : request.end_date,
                              *estimator, sim_config);
        }

        // The job owns copies of everything it uses; the runner may abandon it
        backtest::BacktestJob job = [provider, estimator, sim_config, symbols, request]() {
            backtest::PortfolioAggregator aggregator(provider, sim_config, estimator);
            if (symbols.size() == 1) {
                return aggregator.runSingle(request);
            }
            return aggregator.aggregate(symbols, request);
        };

        backtest::BacktestRunner runner(std::chrono::seconds(config.getTimeoutSeconds()));
        const backtest::BacktestResult result = runner.run(job);

        if (opts.json_mode) {
            std::cout << backtest::toJson(result).dump(2) << "\n";
        } else {
            printSummary(result);
        }

        if (opts.output_path) {
            if (!backtest::writeResultJson(*opts.output_path, result)) {
                std::cerr << "Failed to write result to " << *opts.output_path << "\n";
                return 1;
            }
        }
        return 0;
    } catch (const BacktestTimeoutError& e) {
        LOG_ERROR("GridLab timeout: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        backtest::BacktestRunner::exitProcess(1);
    } catch (const GridLabError& e) {
        LOG_ERROR("GridLab error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 2;
    }
}

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace gridlab {

class Logger {
public:
    static Logger& getInstance();

    // Console + rotating file sink. Before this is called every log call is a no-op.
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // One CSV line per executed trade in trades.log
    void logTrade(const std::string& date, const std::string& symbol, const std::string& side,
                  double price, long long quantity, double amount, double profit);

    void flush();

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) gridlab::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) gridlab::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) gridlab::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) gridlab::Logger::getInstance().error(__VA_ARGS__)

} // namespace gridlab

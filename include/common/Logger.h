#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace supergrid {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    // 초기화 전에는 아무것도 출력하지 않음 (단위 테스트는 초기화하지 않는다)
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

    // trades.log: time,symbol,order_id,side,price,volume,position
    void logTrade(const std::string& symbol, const std::string& order_id, const std::string& side,
                  double price, double volume, double position);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) supergrid::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) supergrid::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) supergrid::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) supergrid::Logger::getInstance().error(__VA_ARGS__)

} // namespace supergrid

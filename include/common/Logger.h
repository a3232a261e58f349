#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

#include "common/Types.h"

namespace coinlens {

class Logger {
public:
    static Logger& getInstance();
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

    // 분석 결과 CSV 한 줄 (analysis 로그)
    void logAnalysis(const std::string& symbol, const IndicatorSnapshot& snapshot);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> analysis_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) coinlens::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) coinlens::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) coinlens::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) coinlens::Logger::getInstance().error(__VA_ARGS__)

} // namespace coinlens

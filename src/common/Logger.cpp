#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace coinlens {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    // 실행 파일 기준 로그 경로
    const std::filesystem::path logs_path = utils::PathUtils::resolve(log_dir);

    try {
        std::filesystem::create_directories(logs_path);

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "coinlens.log").string(), 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        analysis_logger_ = spdlog::daily_logger_mt("analysis", (logs_path / "analysis.log").string());
        analysis_logger_->set_pattern("%Y-%m-%dT%H:%M:%S,%v");

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logAnalysis(const std::string& symbol, const IndicatorSnapshot& snapshot) {
    if (analysis_logger_) {
        std::ostringstream oss;
        oss << symbol << "," << snapshot.as_of << ","
            << std::fixed << std::setprecision(2) << snapshot.price << ","
            << snapshot.rsi << ","
            << snapshot.ema_short << ","
            << snapshot.ema_long << ","
            << std::setprecision(4) << snapshot.macd << ","
            << std::setprecision(2) << snapshot.volume_change_short << ","
            << snapshot.volume_change_long << ","
            << snapshot.sample_count;
        analysis_logger_->info(oss.str());
    }
}

} // namespace coinlens

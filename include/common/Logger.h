#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace stratopt {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs");

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

    // One CSV line per committed run: run_id,strategy,kind,best_sharpe,trials
    void logRun(const std::string& run_id, const std::string& strategy,
                const std::string& search_kind, double best_sharpe, int trials);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> run_logger_;
    bool initialized_ = false;
};

#define LOG_INFO(...) stratopt::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) stratopt::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) stratopt::Logger::getInstance().error(__VA_ARGS__)

} // namespace stratopt

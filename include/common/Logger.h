#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace rebalex {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs");
    // "debug" | "info" | "warn" | "error"
    void setLevel(const std::string& level);

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

    // CSV audit line: run_id,from,to,message
    void logRunTransition(long long run_id, const std::string& from_status,
                          const std::string& to_status, const std::string& message);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> run_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) rebalex::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) rebalex::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) rebalex::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) rebalex::Logger::getInstance().error(__VA_ARGS__)

} // namespace rebalex

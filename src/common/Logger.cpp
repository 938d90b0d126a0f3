#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace rebalex {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir) {
    if (initialized_) return;

    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = std::filesystem::current_path() / log_dir;
    }

    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/rebalex.log", 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::info);
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        run_logger_ = spdlog::daily_logger_mt("runs", logs_path.string() + "/runs.log");
        run_logger_->set_pattern("%Y-%m-%dT%H:%M:%S,%v");
        run_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("log_init_failed: ") + ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    if (main_logger_) {
        main_logger_->set_level(spdlog::level::from_str(level));
    }
}

void Logger::logRunTransition(long long run_id, const std::string& from_status,
                              const std::string& to_status, const std::string& message) {
    if (run_logger_) {
        std::ostringstream oss;
        oss << run_id << "," << from_status << "," << to_status << "," << message;
        run_logger_->info(oss.str());
    }
}

} // namespace rebalex

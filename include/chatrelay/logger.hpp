/**
 * @file logger.hpp
 * @brief spdlog-backed logging for chatrelay
 */

#ifndef CHATRELAY_LOGGER_HPP
#define CHATRELAY_LOGGER_HPP

#include "types.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace chatrelay {

/**
 * Process-wide logger
 *
 * Console output with colors, plus a rotating file when a log directory
 * is configured. Messages logged before initialize() go to a default
 * console logger.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param log_dir Directory for the rotating log file, empty for console only
     */
    void initialize(LogLevel level = LogLevel::Info, const std::string& log_dir = "") {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("%H:%M:%S [%^%l%$] %n: %v");
            sinks.push_back(console_sink);

            if (!log_dir.empty()) {
                auto log_path = std::filesystem::path(log_dir) / "chatrelay.log";
                std::filesystem::create_directories(log_path.parent_path());

                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_path.string(),
                    1024 * 1024 * 10,
                    5
                );
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(file_sink);
            }

            logger_ = std::make_shared<spdlog::logger>("chatrelay", sinks.begin(), sinks.end());
            logger_->set_level(to_spdlog_level(level));
            logger_->flush_on(spdlog::level::warn);
        } catch (const spdlog::spdlog_ex& ex) {
            logger_ = spdlog::stdout_color_mt("chatrelay_fallback");
            logger_->error("Logger initialization failed: {}", ex.what());
        }
    }

    void set_level(LogLevel level) {
        get()->set_level(to_spdlog_level(level));
    }

    void flush() {
        get()->flush();
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->critical(fmt, std::forward<Args>(args)...);
    }

private:
    Logger() : logger_(spdlog::default_logger()) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    spdlog::logger* get() {
        return logger_.get();
    }

    static spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::None:    return spdlog::level::off;
            case LogLevel::Error:   return spdlog::level::err;
            case LogLevel::Warning: return spdlog::level::warn;
            case LogLevel::Info:    return spdlog::level::info;
            case LogLevel::Debug:   return spdlog::level::debug;
            case LogLevel::All:     return spdlog::level::trace;
            default:                return spdlog::level::info;
        }
    }

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace chatrelay

#define CHATRELAY_LOG_TRACE(...)    ::chatrelay::Logger::instance().trace(__VA_ARGS__)
#define CHATRELAY_LOG_DEBUG(...)    ::chatrelay::Logger::instance().debug(__VA_ARGS__)
#define CHATRELAY_LOG_INFO(...)     ::chatrelay::Logger::instance().info(__VA_ARGS__)
#define CHATRELAY_LOG_WARN(...)     ::chatrelay::Logger::instance().warn(__VA_ARGS__)
#define CHATRELAY_LOG_ERROR(...)    ::chatrelay::Logger::instance().error(__VA_ARGS__)
#define CHATRELAY_LOG_CRITICAL(...) ::chatrelay::Logger::instance().critical(__VA_ARGS__)

#endif // CHATRELAY_LOGGER_HPP

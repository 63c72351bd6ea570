/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace arm_teleop {

class Logger {
public:
    /**
     * Initialize the logging system; calling again replaces the sinks
     * Console output goes to stderr; stdout carries the command stream.
     * @param log_file Path to log file
     * @param level Log level (trace, debug, info, warn, error)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     */
    static void init(const std::string& log_file = "logs/teleop.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5);

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static spdlog::level::level_enum parseLevel(const std::string& level);

    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace arm_teleop

// Convenience macros
#define LOG_TRACE(...) ::arm_teleop::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::arm_teleop::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::arm_teleop::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::arm_teleop::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::arm_teleop::Logger::get()->error(__VA_ARGS__)

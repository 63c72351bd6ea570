/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "Logger.hpp"
#include <vector>
#include <filesystem>
#include <iostream>

namespace arm_teleop {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
bool Logger::s_initialized = false;

void Logger::init(const std::string& log_file,
                  const std::string& level,
                  size_t max_size,
                  size_t max_files) {
    // A second call (after configuration is loaded) replaces the sinks
    bool ready = false;

    try {
        // Create logs directory if needed
        std::filesystem::path log_path(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored, stderr)
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        // File sink (rotating)
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, max_size, max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);

        s_logger = std::make_shared<spdlog::logger>("arm_teleop", sinks.begin(), sinks.end());
        s_logger->set_level(parseLevel(level));

        // Flush on warn or above
        s_logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(s_logger);

        ready = true;

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    }

    if (!ready) {
        // Console-only fallback so LOG_* never dereferences a null logger
        s_logger = std::make_shared<spdlog::logger>(
            "arm_teleop", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        s_logger->set_level(parseLevel(level));
    }
    s_initialized = true;
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!s_initialized) {
        init(); // Initialize with defaults
    }
    return s_logger;
}

spdlog::level::level_enum Logger::parseLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info")  return spdlog::level::info;
    if (level == "warn")  return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

} // namespace arm_teleop

/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to configuration
 */

#pragma once

#include "TeleopConfig.hpp"
#include <mutex>
#include <string>

namespace arm_teleop {
namespace config {

/**
 * Configuration Manager (Singleton)
 *
 * Thread-safe for reading after initialization.
 */
class ConfigManager {
public:
    static ConfigManager& instance();

    // Delete copy/move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Load teleop configuration from YAML file. Relative model paths are
     * resolved against the file's directory.
     * @param filepath Path to teleop_config.yaml
     * @return true if loaded and valid; previous config kept otherwise
     */
    bool loadFile(const std::string& filepath);

    /**
     * Load from YAML text (model paths left as written)
     */
    bool loadString(const std::string& yaml_content);

    const TeleopConfig& teleopConfig() const { return m_config; }

    bool isLoaded() const { return m_loaded; }

    /**
     * Restore defaults (tests)
     */
    void reset();

    /**
     * Effective configuration as JSON (startup log)
     */
    std::string teleopConfigToJson() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    bool parse(const std::string& yaml_content, const std::string& base_dir, const std::string& origin);

    TeleopConfig m_config;
    bool m_loaded = false;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace arm_teleop

/**
 * Valstore - Configuration Manager
 *
 * Loads and saves the engine configuration file.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

#include "EngineConfig.hpp"

namespace valstore {

/**
 * Central configuration manager
 *
 * Owns config.json inside the configuration directory. Only the CLI
 * touches it; the engine receives an EngineConfig copy.
 */
class ConfigManager {
public:
    static ConfigManager& instance();

    // Lifecycle
    bool initialize(const std::filesystem::path& configDirectory);
    bool save();

    // State queries
    bool isFirstRun() const { return m_isFirstRun; }
    const std::filesystem::path& configDirectory() const { return m_configDirectory; }

    const EngineConfig& engineConfig() const { return m_engineConfig; }
    void setEngineConfig(const EngineConfig& config);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadEngineConfig();

    std::filesystem::path m_configDirectory;
    bool m_isFirstRun = true;

    EngineConfig m_engineConfig;
};

} // namespace valstore

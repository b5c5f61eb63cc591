/**
 * Valstore - Configuration Manager Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ConfigManager.hpp"

#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>

namespace valstore {

namespace {
    constexpr const char* CONFIG_FILE = "config.json";
}

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::initialize(const std::filesystem::path& configDirectory) {
    m_configDirectory = configDirectory;
    m_engineConfig = EngineConfig();

    try {
        std::filesystem::create_directories(m_configDirectory);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create config directory: {}", e.what());
        return false;
    }

    m_isFirstRun = !std::filesystem::exists(m_configDirectory / CONFIG_FILE);

    if (m_isFirstRun) {
        // Write defaults so the user has a file to edit
        if (!save()) {
            spdlog::warn("Failed to write default config");
        }
    } else if (!loadEngineConfig()) {
        spdlog::warn("Failed to load engine config, using defaults");
    }

    spdlog::info("ConfigManager initialized at: {}", m_configDirectory.string());
    return true;
}

bool ConfigManager::save() {
    auto configPath = m_configDirectory / CONFIG_FILE;

    try {
        std::ofstream file(configPath);
        if (!file.is_open()) {
            spdlog::error("Cannot open {} for writing", configPath.string());
            return false;
        }
        file << m_engineConfig.toJson();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save engine config: {}", e.what());
        return false;
    }
}

void ConfigManager::setEngineConfig(const EngineConfig& config) {
    m_engineConfig = config;
    if (!save()) {
        spdlog::warn("Engine config changed but could not be saved");
    }
}

bool ConfigManager::loadEngineConfig() {
    auto configPath = m_configDirectory / CONFIG_FILE;

    std::ifstream file(configPath);
    if (!file.is_open()) {
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    m_engineConfig = EngineConfig::fromJson(content);
    return true;
}

} // namespace valstore

/**
 * Valstore - Legacy File Store Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "LegacyFileStore.hpp"

#include "core/Masking.hpp"
#include "core/platform/Platform.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>

#include <spdlog/spdlog.h>

namespace valstore {

namespace {
    constexpr const char* COOKIES_DIR = "cookies";
    constexpr const char* OVERRIDE_ENV = "VALORANT_COOKIES_DIR";
}

LegacyFileStore::LegacyFileStore(std::filesystem::path configuredDirectory)
    : m_configuredDirectory(std::move(configuredDirectory))
{
}

std::vector<std::filesystem::path> LegacyFileStore::candidatePaths(const std::string& userId) const {
    const std::string fileName = userId + ".txt";
    std::vector<std::filesystem::path> paths;

    const char* overrideDir = std::getenv(OVERRIDE_ENV);
    if (overrideDir && overrideDir[0] != '\0') {
        paths.push_back(std::filesystem::path(overrideDir) / fileName);
    } else if (!m_configuredDirectory.empty()) {
        paths.push_back(m_configuredDirectory / fileName);
    }

    paths.push_back(Platform::getDataPath() / COOKIES_DIR / fileName);

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        paths.push_back(cwd / COOKIES_DIR / fileName);
    }

    std::vector<std::filesystem::path> unique;
    for (const auto& path : paths) {
        auto normal = path.lexically_normal();
        if (std::find(unique.begin(), unique.end(), normal) == unique.end()) {
            unique.push_back(normal);
        }
    }
    return unique;
}

CredentialBundle LegacyFileStore::parse(const std::string& content) {
    std::map<std::string, std::string> raw;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        std::string trimmed = sanitizeCredentialValue(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = sanitizeCredentialValue(line.substr(0, eq));
        if (key.empty()) {
            continue;
        }
        raw[key] = line.substr(eq + 1);
    }

    return normalizeCredentials(raw);
}

std::optional<CredentialBundle> LegacyFileStore::load(const std::string& userId) const {
    for (const auto& path : candidatePaths(userId)) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            continue;
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Cannot read cookie file: {}", path.string());
            continue;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        auto bundle = parse(buffer.str());
        spdlog::info("Found cookie file: {} (ssid={})",
                     path.string(), maskSecret(bundle.ssid).toStdString());
        return bundle;
    }

    spdlog::debug("No cookie file for user {}", userId);
    return std::nullopt;
}

bool LegacyFileStore::store(const std::string& userId, const CredentialBundle&) {
    spdlog::warn("Legacy cookie files are read-only, not storing credentials for {}", userId);
    return false;
}

} // namespace valstore

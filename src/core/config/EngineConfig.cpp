/**
 * Valstore - Engine Config Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "EngineConfig.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace valstore {

EngineConfig EngineConfig::fromJson(const std::string& json) {
    EngineConfig config;

    try {
        auto j = nlohmann::json::parse(json);

        if (j.contains("language")) {
            config.language = j["language"].get<std::string>();
        }
        if (j.contains("defaultUserAgent")) {
            config.defaultUserAgent = j["defaultUserAgent"].get<std::string>();
        }
        if (j.contains("primaryStore")) {
            config.primaryStore = j["primaryStore"].get<std::string>();
        }
        if (j.contains("legacyFileStoreEnabled")) {
            config.legacyFileStoreEnabled = j["legacyFileStoreEnabled"].get<bool>();
        }
        if (j.contains("cookiesDirectory")) {
            config.cookiesDirectory = j["cookiesDirectory"].get<std::string>();
        }
        if (j.contains("httpTimeoutMs")) {
            config.httpTimeoutMs = j["httpTimeoutMs"].get<int>();
        }
        if (j.contains("maxTransientRetries")) {
            config.maxTransientRetries = j["maxTransientRetries"].get<int>();
        }
        if (j.contains("retryBackoffMs")) {
            config.retryBackoffMs = j["retryBackoffMs"].get<int>();
        }
        if (j.contains("clientVersionTtlSeconds")) {
            config.clientVersionTtlSeconds = j["clientVersionTtlSeconds"].get<int>();
        }
        if (j.contains("skinIndexTtlSeconds")) {
            config.skinIndexTtlSeconds = j["skinIndexTtlSeconds"].get<int>();
        }
        if (j.contains("logVerbosity")) {
            config.logVerbosity = j["logVerbosity"].get<std::string>();
        }

    } catch (const std::exception& e) {
        spdlog::warn("Invalid engine config, using defaults: {}", e.what());
        return EngineConfig();
    }

    return config;
}

std::string EngineConfig::toJson() const {
    nlohmann::json j;

    j["language"] = language;
    j["defaultUserAgent"] = defaultUserAgent;
    j["primaryStore"] = primaryStore;
    j["legacyFileStoreEnabled"] = legacyFileStoreEnabled;
    j["cookiesDirectory"] = cookiesDirectory;
    j["httpTimeoutMs"] = httpTimeoutMs;
    j["maxTransientRetries"] = maxTransientRetries;
    j["retryBackoffMs"] = retryBackoffMs;
    j["clientVersionTtlSeconds"] = clientVersionTtlSeconds;
    j["skinIndexTtlSeconds"] = skinIndexTtlSeconds;
    j["logVerbosity"] = logVerbosity;

    return j.dump(2);
}

} // namespace valstore

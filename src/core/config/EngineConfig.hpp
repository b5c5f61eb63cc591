/**
 * Valstore - Engine Configuration
 *
 * Settings for the reauthentication and storefront engine.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>

namespace valstore {

/**
 * Engine-wide settings, persisted as config.json
 */
struct EngineConfig {
    std::string language = "ja-JP";                // Skin name locale
    std::string defaultUserAgent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) "
        "AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/120.0.0.0 Safari/537.36";

    // Credential sources
    std::string primaryStore = "keyring";          // keyring, none
    bool legacyFileStoreEnabled = true;
    std::string cookiesDirectory;                  // Overridden by VALORANT_COOKIES_DIR

    // HTTP
    int httpTimeoutMs = 15000;
    int maxTransientRetries = 3;
    int retryBackoffMs = 500;

    // Caches
    int clientVersionTtlSeconds = 600;
    int skinIndexTtlSeconds = 3600;

    std::string logVerbosity = "info";             // debug, info, warning, error

    bool usesKeyring() const { return primaryStore == "keyring"; }

    // Serialization
    static EngineConfig fromJson(const std::string& json);
    std::string toJson() const;
};

} // namespace valstore

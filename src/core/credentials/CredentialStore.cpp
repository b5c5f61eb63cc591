/**
 * Valstore - Credential Store Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "CredentialStore.hpp"
#include "LegacyFileStore.hpp"

#include "core/config/EngineConfig.hpp"

#include <spdlog/spdlog.h>

namespace valstore {

std::unique_ptr<CredentialStore> CredentialStore::createPrimary(const EngineConfig& config) {
    if (!config.usesKeyring()) {
        spdlog::info("Primary credential store disabled by configuration");
        return nullptr;
    }

#ifdef PLATFORM_LINUX
    // Implemented in LibSecretStore.cpp
    extern std::unique_ptr<CredentialStore> createLibSecretStore();
    return createLibSecretStore();
#else
    spdlog::warn("No keyring credential store implementation for this platform");
    return nullptr;
#endif
}

std::unique_ptr<CredentialStore> CredentialStore::createLegacy(const EngineConfig& config) {
    if (!config.legacyFileStoreEnabled) {
        return nullptr;
    }
    return std::make_unique<LegacyFileStore>(config.cookiesDirectory);
}

} // namespace valstore

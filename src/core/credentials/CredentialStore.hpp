/**
 * Valstore - Credential Store
 *
 * Read access to captured session cookies.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "CredentialBundle.hpp"

namespace valstore {

struct EngineConfig;

/**
 * Abstract credential storage interface
 *
 * Implementations:
 * - LibSecretStore (Linux): encrypted keyring, the primary source
 * - LegacyFileStore: flat KEY=VALUE cookie files
 */
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    /**
     * Load the bundle recorded for a user
     *
     * @param userId Caller-side user identifier
     * @return The sanitized bundle, nullopt if nothing is recorded
     */
    virtual std::optional<CredentialBundle> load(const std::string& userId) const = 0;

    /**
     * Save a bundle for a user
     *
     * Used by the import command only, the engine never writes.
     *
     * @return true if stored successfully
     */
    virtual bool store(const std::string& userId, const CredentialBundle& bundle) = 0;

    /**
     * Check if the store can be used
     */
    virtual bool isAvailable() const = 0;

    /**
     * Human-readable store name for logs and reports
     */
    virtual std::string displayName() const = 0;

    /**
     * Create the primary store selected by configuration
     *
     * @return nullptr when the configuration disables it or the
     *         platform has no keyring implementation
     */
    static std::unique_ptr<CredentialStore> createPrimary(const EngineConfig& config);

    /**
     * Create the legacy file store, nullptr when disabled
     */
    static std::unique_ptr<CredentialStore> createLegacy(const EngineConfig& config);

protected:
    CredentialStore() = default;
};

// Service identifier for keyring entries
constexpr const char* VALSTORE_CREDENTIAL_SERVICE = "valstore";

} // namespace valstore

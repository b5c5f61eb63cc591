/**
 * Valstore - Store Service
 *
 * Entry point for callers: credentials in, resolved daily offers out.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <QFuture>
#include <QString>

#include "ItemResolver.hpp"
#include "SkinIndex.hpp"
#include "core/StoreError.hpp"
#include "core/config/EngineConfig.hpp"
#include "network/HttpTransport.hpp"
#include "network/Reauthenticator.hpp"

namespace valstore {

class CredentialStore;

/**
 * Result of a storefront request
 */
struct StoreResult {
    StoreError error = StoreError::None;
    QString errorMessage;
    QString hint;                        // Remediation text for the user
    int httpStatus = 0;                  // Upstream status when relevant
    std::vector<ResolvedItem> items;

    bool isSuccess() const { return error == StoreError::None; }
};

/**
 * Storefront retrieval service
 *
 * Each call runs independently with its own sessions; only the skin
 * index and client version caches are shared.
 */
class StoreService {
public:
    /**
     * @param primary Primary credential store, may be null
     * @param legacy Legacy credential store, may be null
     * @param transportFactory Creates one transport per session
     */
    StoreService(const EngineConfig& config,
                 const CredentialStore* primary,
                 const CredentialStore* legacy,
                 TransportFactory transportFactory);

    /**
     * Fetch and resolve today's offers for a user
     *
     * @param cancelled Checked before every attempt, may be null
     */
    StoreResult fetchStoreItems(const std::string& userId,
                                const std::atomic_bool* cancelled = nullptr);

    /**
     * Run the diagnostic matrix and return the masked report
     */
    QString runDiagnostics(const std::string& userId) const;

    /**
     * Asynchronous variants on the global thread pool
     */
    QFuture<StoreResult> fetchStoreItemsAsync(const std::string& userId,
                                              std::shared_ptr<std::atomic_bool> cancelled = nullptr);
    QFuture<QString> runDiagnosticsAsync(const std::string& userId) const;

private:
    std::vector<ResolvedItem> fetchWithSession(AuthenticatedSession& authenticated);

    EngineConfig m_config;
    const CredentialStore* m_primary;
    const CredentialStore* m_legacy;
    TransportFactory m_transportFactory;
    Reauthenticator m_reauthenticator;
    SkinIndexCache m_skinIndexCache;
};

} // namespace valstore

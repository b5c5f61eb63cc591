/**
 * Valstore - Store Service Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "StoreService.hpp"
#include "DiagnosticReporter.hpp"

#include "core/credentials/CredentialStore.hpp"
#include "network/StorefrontClient.hpp"
#include "network/TokenPipeline.hpp"

#include <QtConcurrent>

#include <spdlog/spdlog.h>

namespace valstore {

namespace {

ReauthOptions reauthOptionsFrom(const EngineConfig& config) {
    ReauthOptions options;
    options.defaultUserAgent = QString::fromStdString(config.defaultUserAgent);
    options.http.timeoutMs = config.httpTimeoutMs;
    options.http.maxTransientRetries = config.maxTransientRetries;
    options.http.retryBackoffMs = config.retryBackoffMs;
    return options;
}

StoreResult failure(StoreError error, const QString& message, int httpStatus = 0) {
    StoreResult result;
    result.error = error;
    result.errorMessage = message;
    result.httpStatus = httpStatus;
    result.hint = hintFor(error, httpStatus);
    return result;
}

/**
 * Failure of a feed that does not depend on the player session
 *
 * Another attempt would hit the same feed, so the walk stops.
 */
class PublicFeedError : public StoreException {
public:
    using StoreException::StoreException;
};

template<typename Fn>
auto fromPublicFeed(const char* feed, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const StoreException& e) {
        throw PublicFeedError(StoreError::UpstreamError,
                              std::string(feed) + ": " + e.what(), e.httpStatus());
    } catch (const HttpError& e) {
        throw PublicFeedError(StoreError::UpstreamError, std::string(feed) + ": " + e.what());
    }
}

} // anonymous namespace

StoreService::StoreService(const EngineConfig& config,
                           const CredentialStore* primary,
                           const CredentialStore* legacy,
                           TransportFactory transportFactory)
    : m_config(config)
    , m_primary(primary)
    , m_legacy(legacy)
    , m_transportFactory(transportFactory)
    , m_reauthenticator(primary, legacy, transportFactory, reauthOptionsFrom(config))
    , m_skinIndexCache(config.skinIndexTtlSeconds)
{
}

std::vector<ResolvedItem> StoreService::fetchWithSession(AuthenticatedSession& authenticated) {
    SessionContext& session = *authenticated.session;

    TokenSet tokens = completeTokenSet(session, authenticated.accessToken, authenticated.idToken,
                                       QString::fromStdString(authenticated.attempt.bundle.puuid));
    if (!tokens.isComplete()) {
        throw StoreException(StoreError::UpstreamError, "token set is incomplete");
    }

    ClientHeaders client;
    client.clientVersion = fromPublicFeed("client version", [&]() {
        return clientVersion(session, m_config.clientVersionTtlSeconds);
    });
    client.clientPlatform = clientPlatformToken();

    nlohmann::json catalog = fetchCatalog(session, tokens, client);

    const QString language = QString::fromStdString(m_config.language);
    auto index = fromPublicFeed("skin feed", [&]() {
        return m_skinIndexCache.get(language, [&session, &language]() {
            return buildSkinIndex(session, language);
        });
    });

    return resolveItems(catalog, *index);
}

StoreResult StoreService::fetchStoreItems(const std::string& userId,
                                          const std::atomic_bool* cancelled) {
    spdlog::info("Fetching storefront for {}", userId);

    StoreResult result;
    bool sawForbidden = false;
    bool sawUpstreamError = false;
    QString lastUpstreamMessage;
    int lastUpstreamStatus = 0;

    auto recordUpstream = [&](const char* what, const std::string& message, int status) {
        spdlog::warn("Reauthenticated but {} failed: {}", what, message);
        sawUpstreamError = true;
        sawForbidden = sawForbidden || status == 403;
        lastUpstreamMessage = QString::fromStdString(message);
        lastUpstreamStatus = status;
    };

    auto reauth = m_reauthenticator.reauthenticate(userId, cancelled,
        [&](AuthenticatedSession& authenticated) {
            try {
                result.items = fetchWithSession(authenticated);
                spdlog::info("Storefront resolved with {} items via {}", result.items.size(),
                             authenticated.attempt.label().toStdString());
                return SessionVerdict::Accept;
            } catch (const PublicFeedError& e) {
                recordUpstream("a public feed", e.what(), e.httpStatus());
                return SessionVerdict::Abort;
            } catch (const StoreException& e) {
                recordUpstream("the session", e.what(), e.httpStatus());
            } catch (const HttpError& e) {
                recordUpstream("a request", e.what(), 0);
            }
            return SessionVerdict::TryNext;
        });

    if (reauth.isSuccess()) {
        return result;
    }
    if (reauth.error == StoreError::Cancelled || reauth.error == StoreError::NotFound ||
        reauth.error == StoreError::InvalidCredentials) {
        return failure(reauth.error, reauth.errorMessage);
    }

    if (sawForbidden) {
        return failure(StoreError::UpstreamError, "Storefront access was refused (HTTP 403)", 403);
    }
    if (sawUpstreamError) {
        return failure(StoreError::UpstreamError, lastUpstreamMessage, lastUpstreamStatus);
    }
    return failure(reauth.error, reauth.errorMessage);
}

QString StoreService::runDiagnostics(const std::string& userId) const {
    DiagnosticReporter reporter(m_reauthenticator, m_primary, m_legacy, m_config.usesKeyring(),
                                m_transportFactory, m_config.clientVersionTtlSeconds);
    return reporter.run(userId);
}

QFuture<StoreResult> StoreService::fetchStoreItemsAsync(const std::string& userId,
                                                        std::shared_ptr<std::atomic_bool> cancelled) {
    return QtConcurrent::run([this, userId, cancelled]() {
        return fetchStoreItems(userId, cancelled.get());
    });
}

QFuture<QString> StoreService::runDiagnosticsAsync(const std::string& userId) const {
    return QtConcurrent::run([this, userId]() {
        return runDiagnostics(userId);
    });
}

} // namespace valstore

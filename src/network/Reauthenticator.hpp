/**
 * Valstore - Reauthenticator
 *
 * Turns captured session cookies into fresh access and id tokens by
 * walking an ordered matrix of attempts.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QString>

#include "HttpTransport.hpp"
#include "SessionContext.hpp"
#include "core/StoreError.hpp"
#include "core/credentials/CredentialBundle.hpp"

namespace valstore {

class CredentialStore;

/**
 * Auth parameter sets accepted by the provider, differing only in scope
 */
enum class AuthVariant {
    ScopeA,    // scope=account openid
    ScopeB     // scope=openid link
};

/**
 * One combination tried during reauthentication
 */
struct AttemptSpec {
    CredentialSource source = CredentialSource::Primary;
    CredentialBundle bundle;
    std::optional<QString> userAgentOverride;   // nullopt = default agent
    CookieScope cookieScope = CookieScope::Full;
    std::vector<AuthVariant> authVariants = {AuthVariant::ScopeA, AuthVariant::ScopeB};

    /**
     * Display label, e.g. "primary + stored UA + FULL"
     */
    QString label() const;
};

/**
 * Status codes seen while trying one auth variant
 *
 * 0 means no HTTP response, -1 means the request was not needed.
 */
struct AuthProbe {
    AuthVariant variant = AuthVariant::ScopeA;
    int postStatus = 0;
    int getStatus = -1;
    bool challenged = false;
};

/**
 * Result of executing one attempt
 */
struct AttemptOutcome {
    AttemptSpec attempt;
    bool succeeded = false;
    std::optional<AuthVariant> variant;    // Winning variant
    std::vector<AuthProbe> probes;
    bool challenged = false;
    QString failureReason;

    /**
     * Status codes per request kind, e.g. "POST=200/200 GET=303/302"
     */
    QString statusSummary() const;
};

/**
 * Session and tokens of the winning attempt
 */
struct AuthenticatedSession {
    std::unique_ptr<SessionContext> session;
    AttemptSpec attempt;
    QString accessToken;
    QString idToken;
};

/**
 * Bundles loaded for one invocation
 */
struct CredentialSet {
    std::optional<CredentialBundle> primary;
    std::optional<CredentialBundle> legacy;
};

/**
 * Reauthentication result
 */
struct ReauthResult {
    StoreError error = StoreError::None;
    QString errorMessage;
    std::optional<AuthenticatedSession> authenticated;
    std::vector<AttemptOutcome> outcomes;

    bool isSuccess() const { return error == StoreError::None && authenticated.has_value(); }
};

/**
 * What the caller decided after an attempt reauthenticated
 */
enum class SessionVerdict {
    Accept,     // Stop walking, keep this session
    TryNext,    // Drop this session, continue with the next attempt
    Abort       // Stop walking, no later attempt can help
};

/**
 * Called with each reauthenticated session while walking the matrix
 */
using SessionHandler = std::function<SessionVerdict(AuthenticatedSession&)>;

struct ReauthOptions {
    QString defaultUserAgent;
    HttpOptions http;
};

/**
 * Attempt matrix executor
 *
 * Stateless between calls; concurrent use for different users is safe
 * as long as the stores are.
 */
class Reauthenticator {
public:
    /**
     * @param primary Primary store, may be null
     * @param legacy Legacy store, may be null
     * @param transportFactory Creates one transport per attempt
     */
    Reauthenticator(const CredentialStore* primary,
                    const CredentialStore* legacy,
                    TransportFactory transportFactory,
                    ReauthOptions options);

    /**
     * Load the bundles of a user from both stores
     *
     * @throws StoreException NotFound when neither store has a record,
     *         InvalidCredentials when no loaded bundle has an ssid
     */
    CredentialSet loadCredentials(const std::string& userId) const;

    /**
     * Build the ordered attempt list
     *
     * Order: source (primary, legacy) x agent (stored, default) x
     * scope (Full, SsidOnly). Bundles without ssid are left out.
     */
    std::vector<AttemptSpec> buildAttemptMatrix(const CredentialSet& credentials) const;

    /**
     * Run one attempt in a fresh session
     *
     * @param authenticated Receives the session and tokens on success,
     *        may be null when the caller only wants the outcome
     */
    AttemptOutcome execute(const AttemptSpec& attempt,
                           std::optional<AuthenticatedSession>* authenticated) const;

    /**
     * Walk the matrix until an attempt succeeds and is accepted
     *
     * @param cancelled Checked before every attempt, may be null
     * @param onSession Decides on each reauthenticated session; without
     *        one the first success is accepted
     *
     * An aborted walk returns UpstreamError. When every attempt ends in
     * TryNext the result is classified like plain failures.
     */
    ReauthResult reauthenticate(const std::string& userId,
                                const std::atomic_bool* cancelled = nullptr,
                                const SessionHandler& onSession = {}) const;

    /**
     * Classify a fully failed matrix
     *
     * ChallengeBlocked if any attempt saw a challenge, else CredentialsExpired.
     */
    static StoreError classifyFailure(const std::vector<AttemptOutcome>& outcomes);

    /**
     * Create a session configured for an attempt, cookies applied
     */
    std::unique_ptr<SessionContext> createSession(const AttemptSpec& attempt) const;

    const ReauthOptions& options() const { return m_options; }

private:
    const CredentialStore* m_primary;
    const CredentialStore* m_legacy;
    TransportFactory m_transportFactory;
    ReauthOptions m_options;
};

/**
 * Extract access_token and id_token from the fragment of a redirect URI
 *
 * @return (access token, id token), nullopt unless both are present
 */
std::optional<std::pair<QString, QString>> parseTokenFragment(const QString& uri);

/**
 * Detect an anti-automation interstitial in a response
 */
bool isChallengeResponse(const HttpResponse& response);

QString authVariantName(AuthVariant variant);

} // namespace valstore

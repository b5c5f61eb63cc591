/**
 * Valstore - Reauthenticator Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Reauthenticator.hpp"
#include "RiotEndpoints.hpp"

#include "core/Masking.hpp"
#include "core/credentials/CredentialStore.hpp"

#include <functional>

#include <QStringList>
#include <QUrlQuery>

#include <spdlog/spdlog.h>

namespace valstore {

namespace {

// Lower-case markers of anti-automation interstitials
constexpr const char* CHALLENGE_SIGNATURES[] = {
    "cf-chl",
    "cf_chl",
    "challenge-platform",
    "cf-browser-verification",
    "just a moment...",
    "attention required! | cloudflare"
};

std::vector<std::pair<const char*, const char*>> authParams(AuthVariant variant) {
    return {
        {"client_id", RiotAuthParams::CLIENT_ID},
        {"nonce", RiotAuthParams::NONCE},
        {"redirect_uri", RiotAuthParams::REDIRECT_URI},
        {"response_type", RiotAuthParams::RESPONSE_TYPE},
        {"scope", variant == AuthVariant::ScopeA ? RiotAuthParams::SCOPE_A
                                                 : RiotAuthParams::SCOPE_B},
        {"prompt", RiotAuthParams::PROMPT}
    };
}

std::optional<HttpResponse> sendQuietly(const std::function<HttpResponse()>& call,
                                        const char* what) {
    try {
        return call();
    } catch (const HttpError& e) {
        spdlog::warn("{} request failed: {}", what, e.what());
        return std::nullopt;
    }
}

/**
 * Legacy endpoint: the redirect URI comes back inside the JSON body
 * as response.parameters.uri
 */
QString redirectUriFromBody(const HttpResponse& response) {
    auto json = nlohmann::json::parse(response.body.constData(),
                                      response.body.constData() + response.body.size(),
                                      nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return QString();
    }

    auto responseIt = json.find("response");
    if (responseIt == json.end() || !responseIt->is_object()) {
        return QString();
    }
    auto paramsIt = responseIt->find("parameters");
    if (paramsIt == responseIt->end() || !paramsIt->is_object()) {
        return QString();
    }
    auto uriIt = paramsIt->find("uri");
    if (uriIt == paramsIt->end() || !uriIt->is_string()) {
        return QString();
    }
    return QString::fromStdString(uriIt->get<std::string>());
}

std::optional<std::pair<QString, QString>> tryVariant(SessionContext& session,
                                                      AuthVariant variant,
                                                      AuthProbe& probe) {
    const auto params = authParams(variant);

    // a. POST to the legacy authorization endpoint
    nlohmann::json body = nlohmann::json::object();
    for (const auto& [key, value] : params) {
        body[key] = value;
    }

    auto post = sendQuietly([&]() {
        return session.postJson(QUrl(RiotUrls::AUTHORIZATION_LEGACY), body);
    }, "Legacy authorization");

    if (post) {
        probe.postStatus = post->status;
        probe.challenged = isChallengeResponse(*post);
        if (post->isSuccess()) {
            if (auto tokens = parseTokenFragment(redirectUriFromBody(*post))) {
                return tokens;
            }
        }
    }

    // b. GET /authorize without following the redirect
    QUrlQuery query;
    for (const auto& [key, value] : params) {
        query.addQueryItem(key, value);
    }
    QUrl authorizeUrl(RiotUrls::AUTHORIZE);
    authorizeUrl.setQuery(query);

    auto get = sendQuietly([&]() {
        return session.get(authorizeUrl, {}, false);
    }, "Authorize");

    if (!get) {
        probe.getStatus = 0;
        return std::nullopt;
    }

    probe.getStatus = get->status;
    probe.challenged = probe.challenged || isChallengeResponse(*get);
    if (get->isRedirect()) {
        return parseTokenFragment(QString::fromUtf8(get->header("Location")));
    }
    return std::nullopt;
}

} // anonymous namespace

QString authVariantName(AuthVariant variant) {
    return variant == AuthVariant::ScopeA ? "ScopeA" : "ScopeB";
}

QString AttemptSpec::label() const {
    return QString("%1 + %2 + %3")
        .arg(source == CredentialSource::Primary ? "primary" : "legacy",
             userAgentOverride ? "stored UA" : "default UA",
             cookieScope == CookieScope::Full ? "FULL" : "SSID");
}

QString AttemptOutcome::statusSummary() const {
    QStringList posts;
    QStringList gets;
    for (const auto& probe : probes) {
        posts << QString::number(probe.postStatus);
        gets << QString::number(probe.getStatus);
    }
    return QString("POST=%1 GET=%2").arg(posts.join('/'), gets.join('/'));
}

std::optional<std::pair<QString, QString>> parseTokenFragment(const QString& uri) {
    int hash = uri.indexOf('#');
    if (hash < 0) {
        return std::nullopt;
    }

    QString accessToken;
    QString idToken;
    const QStringList pairs = uri.mid(hash + 1).split('&', Qt::SkipEmptyParts);
    for (const QString& pair : pairs) {
        int eq = pair.indexOf('=');
        if (eq <= 0) {
            continue;
        }
        QString key = pair.left(eq);
        if (key == "access_token") {
            accessToken = pair.mid(eq + 1);
        } else if (key == "id_token") {
            idToken = pair.mid(eq + 1);
        }
    }

    if (accessToken.isEmpty() || idToken.isEmpty()) {
        return std::nullopt;
    }
    return std::make_pair(accessToken, idToken);
}

bool isChallengeResponse(const HttpResponse& response) {
    if (response.header("cf-mitigated").trimmed().toLower() == "challenge") {
        return true;
    }

    QByteArray body = response.body.toLower();
    for (const char* signature : CHALLENGE_SIGNATURES) {
        if (body.contains(signature)) {
            return true;
        }
    }
    return false;
}

Reauthenticator::Reauthenticator(const CredentialStore* primary,
                                 const CredentialStore* legacy,
                                 TransportFactory transportFactory,
                                 ReauthOptions options)
    : m_primary(primary)
    , m_legacy(legacy)
    , m_transportFactory(std::move(transportFactory))
    , m_options(std::move(options))
{
}

CredentialSet Reauthenticator::loadCredentials(const std::string& userId) const {
    CredentialSet credentials;
    if (m_primary) {
        credentials.primary = m_primary->load(userId);
    }
    if (m_legacy) {
        credentials.legacy = m_legacy->load(userId);
    }

    if (!credentials.primary && !credentials.legacy) {
        throw StoreException(StoreError::NotFound, "No credentials recorded for user " + userId);
    }

    bool primaryValid = credentials.primary && credentials.primary->isValid();
    bool legacyValid = credentials.legacy && credentials.legacy->isValid();
    if (!primaryValid && !legacyValid) {
        throw StoreException(StoreError::InvalidCredentials,
                             "Recorded credentials have no ssid for user " + userId);
    }

    return credentials;
}

std::vector<AttemptSpec> Reauthenticator::buildAttemptMatrix(const CredentialSet& credentials) const {
    // The legacy file never records an agent, it borrows the primary one
    QString storedAgent;
    if (credentials.primary) {
        storedAgent = QString::fromStdString(credentials.primary->userAgent);
    }

    std::vector<std::pair<CredentialSource, const CredentialBundle*>> sources;
    if (credentials.primary && credentials.primary->isValid()) {
        sources.emplace_back(CredentialSource::Primary, &*credentials.primary);
    }
    if (credentials.legacy && credentials.legacy->isValid()) {
        sources.emplace_back(CredentialSource::Legacy, &*credentials.legacy);
    }

    std::vector<AttemptSpec> attempts;
    for (const auto& [source, bundle] : sources) {
        QString ownAgent = bundle->userAgent.empty()
            ? storedAgent
            : QString::fromStdString(bundle->userAgent);

        std::vector<std::optional<QString>> agents;
        if (!ownAgent.isEmpty() && ownAgent != m_options.defaultUserAgent) {
            agents.emplace_back(ownAgent);
        }
        agents.emplace_back(std::nullopt);

        for (const auto& agent : agents) {
            for (CookieScope scope : {CookieScope::Full, CookieScope::SsidOnly}) {
                AttemptSpec attempt;
                attempt.source = source;
                attempt.bundle = *bundle;
                attempt.userAgentOverride = agent;
                attempt.cookieScope = scope;
                attempts.push_back(std::move(attempt));
            }
        }
    }
    return attempts;
}

std::unique_ptr<SessionContext> Reauthenticator::createSession(const AttemptSpec& attempt) const {
    auto session = std::make_unique<SessionContext>(
        m_transportFactory(),
        attempt.userAgentOverride.value_or(m_options.defaultUserAgent),
        m_options.http);
    session->applyCredentials(attempt.bundle, attempt.cookieScope);
    return session;
}

AttemptOutcome Reauthenticator::execute(const AttemptSpec& attempt,
                                        std::optional<AuthenticatedSession>* authenticated) const {
    AttemptOutcome outcome;
    outcome.attempt = attempt;

    auto session = createSession(attempt);

    for (AuthVariant variant : attempt.authVariants) {
        AuthProbe probe;
        probe.variant = variant;
        auto tokens = tryVariant(*session, variant, probe);
        outcome.probes.push_back(probe);
        outcome.challenged = outcome.challenged || probe.challenged;

        if (tokens) {
            outcome.succeeded = true;
            outcome.variant = variant;
            if (authenticated) {
                *authenticated = AuthenticatedSession{
                    std::move(session), attempt, tokens->first, tokens->second};
            }
            return outcome;
        }
    }

    outcome.failureReason = QString("no tokens (%1)%2")
        .arg(outcome.statusSummary(),
             outcome.challenged ? ", bot challenge detected" : "");
    return outcome;
}

ReauthResult Reauthenticator::reauthenticate(const std::string& userId,
                                             const std::atomic_bool* cancelled,
                                             const SessionHandler& onSession) const {
    ReauthResult result;

    CredentialSet credentials;
    try {
        credentials = loadCredentials(userId);
    } catch (const StoreException& e) {
        result.error = e.kind();
        result.errorMessage = QString::fromStdString(e.what());
        spdlog::warn("Reauthentication not possible: {}", e.what());
        return result;
    }

    auto attempts = buildAttemptMatrix(credentials);
    for (size_t i = 0; i < attempts.size(); ++i) {
        if (cancelled && cancelled->load()) {
            spdlog::info("Reauthentication cancelled before attempt {}", i + 1);
            result.error = StoreError::Cancelled;
            result.errorMessage = "Request cancelled";
            return result;
        }

        const auto& attempt = attempts[i];
        spdlog::info("Reauth attempt {}/{}: {} (ssid={})", i + 1, attempts.size(),
                     attempt.label().toStdString(), maskSecret(attempt.bundle.ssid).toStdString());

        std::optional<AuthenticatedSession> authenticated;
        auto outcome = execute(attempt, &authenticated);
        result.outcomes.push_back(outcome);

        if (!outcome.succeeded) {
            spdlog::warn("Reauth attempt {} failed: {}", i + 1, outcome.failureReason.toStdString());
            continue;
        }

        spdlog::info("Reauth succeeded with {} / {}", attempt.label().toStdString(),
                     authVariantName(*outcome.variant).toStdString());

        SessionVerdict verdict = onSession ? onSession(*authenticated) : SessionVerdict::Accept;
        if (verdict == SessionVerdict::Accept) {
            result.authenticated = std::move(authenticated);
            return result;
        }
        if (verdict == SessionVerdict::Abort) {
            result.error = StoreError::UpstreamError;
            result.errorMessage = QString("Stopped after attempt %1").arg(i + 1);
            return result;
        }
        spdlog::warn("Attempt {} reauthenticated but was not usable", i + 1);
    }

    result.error = classifyFailure(result.outcomes);
    result.errorMessage = QString("All %1 reauthentication attempts failed").arg(attempts.size());
    return result;
}

StoreError Reauthenticator::classifyFailure(const std::vector<AttemptOutcome>& outcomes) {
    for (const auto& outcome : outcomes) {
        if (outcome.challenged) {
            return StoreError::ChallengeBlocked;
        }
    }
    return StoreError::CredentialsExpired;
}

} // namespace valstore

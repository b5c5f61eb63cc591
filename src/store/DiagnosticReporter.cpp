/**
 * Valstore - Diagnostic Reporter Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "DiagnosticReporter.hpp"

#include "core/Masking.hpp"
#include "core/StoreError.hpp"
#include "core/credentials/CredentialStore.hpp"
#include "network/RiotEndpoints.hpp"
#include "network/StorefrontClient.hpp"
#include "network/TokenPipeline.hpp"

#include <spdlog/spdlog.h>

namespace valstore {

namespace {

QString outcomeResult(const AttemptOutcome& outcome) {
    if (outcome.succeeded) {
        return "OK";
    }
    return outcome.challenged ? "CHALLENGE" : "FAIL";
}

QString bundleLine(const char* name, const CredentialStore* store,
                   const std::optional<CredentialBundle>& bundle) {
    QString storeName = store ? QString::fromStdString(store->displayName()) : "disabled";
    if (!bundle) {
        return QString("%1 (%2): <no record>").arg(name, storeName);
    }
    return QString("%1 (%2): ssid=%3 ua=%4")
        .arg(name, storeName, maskSecret(bundle->ssid), maskSecret(bundle->userAgent));
}

} // anonymous namespace

QStringList diagnosticHints(const std::vector<AttemptOutcome>& outcomes) {
    QStringList hints;
    if (outcomes.empty()) {
        return hints;
    }

    bool anySuccess = false;
    bool allChallenged = true;
    bool anyChallenged = false;
    bool fullSucceeded = false;
    bool ssidOnlySucceeded = false;
    bool defaultAgentSucceeded = false;

    for (const auto& outcome : outcomes) {
        allChallenged = allChallenged && outcome.challenged;
        anyChallenged = anyChallenged || outcome.challenged;
        if (!outcome.succeeded) {
            continue;
        }
        anySuccess = true;
        if (outcome.attempt.cookieScope == CookieScope::Full) {
            fullSucceeded = true;
        } else {
            ssidOnlySucceeded = true;
        }
        if (!outcome.attempt.userAgentOverride) {
            defaultAgentSucceeded = true;
        }
    }

    if (!anySuccess && allChallenged) {
        hints << "Every attempt hit a bot challenge. Retry from a different network path "
                 "(another connection, no VPN or datacenter address).";
    }
    if (ssidOnlySucceeded && !fullSucceeded) {
        hints << "Only ssid-only attempts succeeded. The secondary cookies (clid, sub, csid, tdid) "
                 "are stale; capture them again.";
    }
    if (!anySuccess && !anyChallenged) {
        hints << "Every attempt failed without a challenge. The session has expired; log in "
                 "again in the browser and capture a new ssid.";
    }
    if (anySuccess && !defaultAgentSucceeded) {
        hints << "Only the stored user agent succeeded. Always reauthenticate with the stored agent.";
    }
    return hints;
}

DiagnosticReporter::DiagnosticReporter(const Reauthenticator& reauthenticator,
                                       const CredentialStore* primary,
                                       const CredentialStore* legacy,
                                       bool primaryConfigured,
                                       TransportFactory transportFactory,
                                       int clientVersionTtlSeconds)
    : m_reauthenticator(reauthenticator)
    , m_primary(primary)
    , m_legacy(legacy)
    , m_primaryConfigured(primaryConfigured)
    , m_transportFactory(std::move(transportFactory))
    , m_clientVersionTtlSeconds(clientVersionTtlSeconds)
{
}

QString DiagnosticReporter::run(const std::string& userId) const {
    spdlog::info("Running diagnostics for {}", userId);

    CredentialSet credentials;
    if (m_primary) {
        credentials.primary = m_primary->load(userId);
    }
    if (m_legacy) {
        credentials.legacy = m_legacy->load(userId);
    }

    QStringList lines;
    appendHeader(lines, userId, credentials);

    StoreError loadError = StoreError::None;
    if (!credentials.primary && !credentials.legacy) {
        loadError = StoreError::NotFound;
    } else if (!(credentials.primary && credentials.primary->isValid()) &&
               !(credentials.legacy && credentials.legacy->isValid())) {
        loadError = StoreError::InvalidCredentials;
    }
    if (loadError != StoreError::None) {
        lines << QString("error: %1").arg(storeErrorName(loadError));
        lines << QString("hint: %1").arg(hintFor(loadError));
        return lines.join('\n');
    }

    const auto attempts = m_reauthenticator.buildAttemptMatrix(credentials);
    std::vector<AttemptOutcome> outcomes;
    std::optional<AuthenticatedSession> firstSuccess;
    size_t firstSuccessIndex = 0;

    lines << "-- attempts --";
    for (size_t i = 0; i < attempts.size(); ++i) {
        const auto& attempt = attempts[i];
        std::optional<AuthenticatedSession> authenticated;
        auto outcome = m_reauthenticator.execute(attempt, firstSuccess ? nullptr : &authenticated);

        lines << QString("[%1] %2  UA=%3 ssid=%4  %5  %6")
            .arg(QString::number(i + 1), attempt.label(),
                 attempt.userAgentOverride ? "DB" : "DEF",
                 maskSecret(attempt.bundle.ssid), outcome.statusSummary(),
                 outcomeResult(outcome));

        if (outcome.succeeded && !firstSuccess) {
            firstSuccess = std::move(authenticated);
            firstSuccessIndex = i + 1;
        }
        outcomes.push_back(std::move(outcome));
    }

    if (firstSuccess) {
        lines << QString("-- pipeline (attempt %1) --").arg(firstSuccessIndex);
        appendPipelineProbe(lines, *firstSuccess);
    }

    QStringList hints = diagnosticHints(outcomes);
    if (!hints.isEmpty()) {
        lines << "-- hints --";
        for (const QString& hint : hints) {
            lines << "- " + hint;
        }
    }

    return lines.join('\n');
}

void DiagnosticReporter::appendHeader(QStringList& lines, const std::string& userId,
                                      const CredentialSet& credentials) const {
    lines << "== valstore diagnostics ==";
    lines << QString("user: %1").arg(QString::fromStdString(userId));
    lines << bundleLine("primary", m_primary, credentials.primary);
    lines << bundleLine("legacy", m_legacy, credentials.legacy);

    if (m_primaryConfigured && (!m_primary || !m_primary->isAvailable())) {
        lines << "WARNING: primary credential store is configured but unavailable";
    }

    lines << QString("egress ip: %1").arg(egressAddress());
}

void DiagnosticReporter::appendPipelineProbe(QStringList& lines,
                                             AuthenticatedSession& authenticated) const {
    SessionContext& session = *authenticated.session;
    TokenSet tokens;

    try {
        tokens = completeTokenSet(session, authenticated.accessToken, authenticated.idToken,
                                  QString::fromStdString(authenticated.attempt.bundle.puuid));
    } catch (const StoreException& e) {
        lines << QString("token pipeline: FAIL (%1)").arg(QString::fromStdString(e.what()));
        return;
    } catch (const HttpError& e) {
        lines << QString("token pipeline: FAIL (%1)").arg(QString::fromStdString(e.what()));
        return;
    }

    lines << QString("token pipeline: OK shard=%1 puuid=%2")
        .arg(tokens.shard, maskSecret(tokens.puuid));

    ClientHeaders client;
    try {
        client.clientVersion = clientVersion(session, m_clientVersionTtlSeconds);
    } catch (const StoreException& e) {
        lines << QString("client version: FAIL (%1)").arg(QString::fromStdString(e.what()));
    } catch (const HttpError& e) {
        lines << QString("client version: FAIL (%1)").arg(QString::fromStdString(e.what()));
    }
    client.clientPlatform = clientPlatformToken();

    lines << QString("wallet: %1").arg(walletStatus(session, tokens, client));
    for (const auto& probe : probeShards(session, tokens, client, tokens.shard)) {
        lines << QString("storefront %1: %2").arg(probe.shard).arg(probe.status);
    }
}

QString DiagnosticReporter::egressAddress() const {
    try {
        SessionContext session(m_transportFactory(), m_reauthenticator.options().defaultUserAgent,
                               m_reauthenticator.options().http);
        auto response = session.get(QUrl(RiotUrls::PUBLIC_IP));
        if (response.isSuccess()) {
            return maskIpAddress(QString::fromUtf8(response.body));
        }
        spdlog::debug("Egress address lookup returned {}", response.status);
    } catch (const HttpError& e) {
        spdlog::debug("Egress address lookup failed: {}", e.what());
    }
    return "<unknown>";
}

} // namespace valstore

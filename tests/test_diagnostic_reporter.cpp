/**
 * Valstore - Diagnostic Report Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "FakeRiot.hpp"
#include "core/Masking.hpp"
#include "store/DiagnosticReporter.hpp"
#include "store/StoreService.hpp"
#include "network/TokenPipeline.hpp"

using namespace valstore;
using namespace valstore::test;

namespace {
    const std::string USER = "user-1";
    const std::string SECRET_SSID = "abcdSECRETSECRETSECRET5678";

    int countResult(const QString& report, const QString& result) {
        int count = 0;
        for (const QString& line : report.split('\n')) {
            if (line.startsWith('[') && line.endsWith("  " + result)) {
                ++count;
            }
        }
        return count;
    }
}

class DiagnosticReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        clearClientVersionCache();
        config.defaultUserAgent = DEFAULT_UA;
        config.maxTransientRetries = 0;
        config.retryBackoffMs = 0;
        primary.records[USER] = makeBundle(SECRET_SSID, STORED_UA);
    }

    QString runReport() {
        provider.setHandler(riot);
        StoreService service(config, &primary, &legacy, provider.factory());
        return service.runDiagnostics(USER);
    }

    EngineConfig config;
    InMemoryCredentialStore primary{"keyring"};
    InMemoryCredentialStore legacy{"file"};
    ScriptedRiot riot;
    FakeProvider provider;
};

TEST_F(DiagnosticReporterTest, NeverPrintsRawSecrets) {
    riot.acceptAuth = [](const HttpRequest&, int) { return true; };

    QString report = runReport();

    EXPECT_TRUE(report.contains(QString("abcd") + QChar(0x2026) + "5678"));
    EXPECT_FALSE(report.contains(QString::fromStdString(SECRET_SSID)));
    EXPECT_FALSE(report.contains("clid-value-0001"));
    EXPECT_FALSE(report.contains("access-token-1"));
    EXPECT_FALSE(report.contains("entitlements-token-1"));
    EXPECT_FALSE(report.contains(PUUID));
    EXPECT_FALSE(report.contains(STORED_UA));
    EXPECT_TRUE(report.contains("primary (keyring): ssid=abcd"));
}

TEST_F(DiagnosticReporterTest, RunsEveryAttemptAfterSuccess) {
    riot.acceptAuth = [](const HttpRequest&, int) { return true; };

    QString report = runReport();

    EXPECT_EQ(countResult(report, "OK"), 4);
    EXPECT_TRUE(report.contains("[1] primary + stored UA + FULL  UA=DB"));
    EXPECT_TRUE(report.contains("[4] primary + default UA + SSID  UA=DEF"));
    EXPECT_TRUE(report.contains("POST=200 GET=303"));
    EXPECT_TRUE(report.contains("-- pipeline (attempt 1) --"));
    EXPECT_TRUE(report.contains("token pipeline: OK shard=ap"));
    EXPECT_TRUE(report.contains("wallet: 200"));
    EXPECT_TRUE(report.contains("storefront ap: 200"));
    EXPECT_TRUE(report.contains("storefront pbe: 200"));
}

TEST_F(DiagnosticReporterTest, HeaderShowsMaskedEgressAddress) {
    QString report = runReport();

    EXPECT_TRUE(report.contains("user: user-1"));
    EXPECT_TRUE(report.contains("legacy (file): <no record>"));
    EXPECT_TRUE(report.contains("egress ip: 203.0.*.77"));
    EXPECT_FALSE(report.contains("203.0.113.77"));
    EXPECT_FALSE(report.contains("WARNING"));
}

TEST_F(DiagnosticReporterTest, EgressLookupFailureIsUnknown) {
    provider.setHandler([this](const HttpRequest& request, int session) {
        if (request.url.host() == "api.ipify.org") {
            return textResponse(500, "");
        }
        return riot(request, session);
    });

    StoreService service(config, &primary, &legacy, provider.factory());
    EXPECT_TRUE(service.runDiagnostics(USER).contains("egress ip: <unknown>"));
}

TEST_F(DiagnosticReporterTest, WarnsAboutUnavailableKeyring) {
    InMemoryCredentialStore locked("keyring", false);
    locked.records[USER] = makeBundle(SECRET_SSID);

    provider.setHandler(riot);
    StoreService service(config, &locked, &legacy, provider.factory());

    EXPECT_TRUE(service.runDiagnostics(USER).contains(
        "WARNING: primary credential store is configured but unavailable"));
}

TEST_F(DiagnosticReporterTest, ChallengesAreReportedSeparately) {
    riot.challengeAuth = [](const HttpRequest&, int) { return true; };

    QString report = runReport();

    EXPECT_EQ(countResult(report, "CHALLENGE"), 4);
    EXPECT_EQ(countResult(report, "FAIL"), 0);
    EXPECT_TRUE(report.contains("different network path"));
}

TEST_F(DiagnosticReporterTest, PlainFailuresSuggestRecapture) {
    QString report = runReport();

    EXPECT_EQ(countResult(report, "FAIL"), 4);
    EXPECT_TRUE(report.contains("session has expired"));
    EXPECT_FALSE(report.contains("-- pipeline"));
}

TEST_F(DiagnosticReporterTest, IsReadOnly) {
    riot.acceptAuth = [](const HttpRequest&, int) { return true; };

    runReport();

    EXPECT_EQ(primary.writes, 0);
    EXPECT_EQ(legacy.writes, 0);
}

TEST_F(DiagnosticReporterTest, AsyncReportMatchesSynchronousRun) {
    provider.setHandler(riot);
    StoreService service(config, &primary, &legacy, provider.factory());

    QString report = service.runDiagnosticsAsync(USER).result();

    EXPECT_TRUE(report.startsWith("== valstore diagnostics =="));
    EXPECT_EQ(countResult(report, "FAIL"), 4);
}

TEST_F(DiagnosticReporterTest, MissingRecordIsReported) {
    provider.setHandler(riot);
    StoreService service(config, &primary, &legacy, provider.factory());
    QString report = service.runDiagnostics("nobody");

    EXPECT_TRUE(report.contains("error: NotFound"));
    EXPECT_FALSE(report.contains("-- attempts --"));
}

class DiagnosticHintsTest : public ::testing::Test {
protected:
    AttemptOutcome outcome(CookieScope scope, bool storedAgent, bool succeeded, bool challenged = false) {
        AttemptOutcome result;
        result.attempt.cookieScope = scope;
        if (storedAgent) {
            result.attempt.userAgentOverride = QString(STORED_UA);
        }
        result.succeeded = succeeded;
        result.challenged = challenged;
        return result;
    }
};

TEST_F(DiagnosticHintsTest, SsidOnlySuccessMeansStaleSecondaryCookies) {
    auto hints = diagnosticHints({
        outcome(CookieScope::Full, false, false),
        outcome(CookieScope::SsidOnly, false, true),
    });

    ASSERT_EQ(hints.size(), 1);
    EXPECT_TRUE(hints[0].contains("secondary cookies"));
}

TEST_F(DiagnosticHintsTest, StoredAgentOnlySuccess) {
    auto hints = diagnosticHints({
        outcome(CookieScope::Full, true, true),
        outcome(CookieScope::Full, false, false),
    });

    ASSERT_EQ(hints.size(), 1);
    EXPECT_TRUE(hints[0].contains("stored user agent"));
}

TEST_F(DiagnosticHintsTest, MixedChallengeGivesNoChallengeHint) {
    auto hints = diagnosticHints({
        outcome(CookieScope::Full, false, false, true),
        outcome(CookieScope::SsidOnly, false, false, false),
    });

    EXPECT_TRUE(hints.isEmpty());
}

TEST_F(DiagnosticHintsTest, CleanSuccessNeedsNoHint) {
    EXPECT_TRUE(diagnosticHints({outcome(CookieScope::Full, false, true)}).isEmpty());
    EXPECT_TRUE(diagnosticHints({}).isEmpty());
}

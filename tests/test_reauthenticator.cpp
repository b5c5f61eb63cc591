/**
 * Valstore - Reauthenticator Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "FakeRiot.hpp"
#include "network/Reauthenticator.hpp"

using namespace valstore;
using namespace valstore::test;

namespace {
    const std::string USER = "user-1";
    const std::string PRIMARY_SSID = "primary-ssid-AAAA1111";
    const std::string LEGACY_SSID = "legacy-ssid-BBBB2222";
}

class ReauthenticatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        primary.records[USER] = makeBundle(PRIMARY_SSID, STORED_UA);
        legacy.records[USER] = makeBundle(LEGACY_SSID);
        legacy.records[USER].userAgent.clear();
    }

    Reauthenticator makeReauthenticator() {
        provider.setHandler(riot);
        ReauthOptions options;
        options.defaultUserAgent = DEFAULT_UA;
        options.http.maxTransientRetries = 0;
        options.http.retryBackoffMs = 0;
        return Reauthenticator(&primary, &legacy, provider.factory(), options);
    }

    InMemoryCredentialStore primary{"keyring"};
    InMemoryCredentialStore legacy{"file"};
    ScriptedRiot riot;
    FakeProvider provider;
};

TEST_F(ReauthenticatorTest, MissingSsidFailsWithoutNetworkTraffic) {
    primary.records[USER].ssid.clear();
    legacy.records.clear();

    auto result = makeReauthenticator().reauthenticate(USER);

    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.error, StoreError::InvalidCredentials);
    EXPECT_TRUE(provider.requests().empty());
    EXPECT_EQ(provider.sessionCount(), 0);
}

TEST_F(ReauthenticatorTest, UnknownUserIsNotFound) {
    auto result = makeReauthenticator().reauthenticate("nobody");

    EXPECT_EQ(result.error, StoreError::NotFound);
    EXPECT_TRUE(provider.requests().empty());
}

TEST_F(ReauthenticatorTest, AttemptMatrixIsOrdered) {
    auto reauth = makeReauthenticator();
    auto attempts = reauth.buildAttemptMatrix(reauth.loadCredentials(USER));

    std::vector<QString> labels;
    for (const auto& attempt : attempts) {
        labels.push_back(attempt.label());
    }

    std::vector<QString> expected = {
        "primary + stored UA + FULL",
        "primary + stored UA + SSID",
        "primary + default UA + FULL",
        "primary + default UA + SSID",
        "legacy + stored UA + FULL",
        "legacy + stored UA + SSID",
        "legacy + default UA + FULL",
        "legacy + default UA + SSID",
    };
    EXPECT_EQ(labels, expected);

    // The legacy file borrows the agent recorded with the primary bundle
    ASSERT_TRUE(attempts[4].userAgentOverride.has_value());
    EXPECT_EQ(*attempts[4].userAgentOverride, QString(STORED_UA));
    EXPECT_EQ(attempts[4].bundle.ssid, LEGACY_SSID);
}

TEST_F(ReauthenticatorTest, StoredAgentEqualToDefaultIsNotRepeated) {
    primary.records[USER].userAgent = DEFAULT_UA;
    legacy.records.clear();

    auto reauth = makeReauthenticator();
    auto attempts = reauth.buildAttemptMatrix(reauth.loadCredentials(USER));

    ASSERT_EQ(attempts.size(), 2u);
    EXPECT_FALSE(attempts[0].userAgentOverride.has_value());
    EXPECT_EQ(attempts[0].cookieScope, CookieScope::Full);
    EXPECT_EQ(attempts[1].cookieScope, CookieScope::SsidOnly);
}

TEST_F(ReauthenticatorTest, SourceWithoutSsidIsLeftOut) {
    primary.records[USER].ssid.clear();

    auto reauth = makeReauthenticator();
    auto attempts = reauth.buildAttemptMatrix(reauth.loadCredentials(USER));

    ASSERT_EQ(attempts.size(), 4u);
    for (const auto& attempt : attempts) {
        EXPECT_EQ(attempt.source, CredentialSource::Legacy);
    }
}

TEST_F(ReauthenticatorTest, WalksMatrixUntilTheOnlyAcceptedCombination) {
    riot.acceptAuth = [](const HttpRequest& request, int) {
        QByteArray cookies = request.header("Cookie");
        return scopeOf(request) == "openid link" &&
               request.header("User-Agent") == DEFAULT_UA &&
               cookies.contains(QByteArray::fromStdString("ssid=" + LEGACY_SSID)) &&
               cookies.contains("clid=");
    };

    auto result = makeReauthenticator().reauthenticate(USER);

    ASSERT_TRUE(result.isSuccess());
    ASSERT_EQ(result.outcomes.size(), 7u);
    for (size_t i = 0; i < 6; ++i) {
        EXPECT_FALSE(result.outcomes[i].succeeded) << "attempt " << i;
    }

    const auto& winner = result.outcomes[6];
    EXPECT_TRUE(winner.succeeded);
    ASSERT_TRUE(winner.variant.has_value());
    EXPECT_EQ(*winner.variant, AuthVariant::ScopeB);
    ASSERT_EQ(winner.probes.size(), 2u);
    EXPECT_EQ(winner.probes[0].getStatus, 302);
    EXPECT_EQ(winner.probes[1].getStatus, 303);
    EXPECT_EQ(winner.statusSummary(), "POST=200/200 GET=302/303");

    EXPECT_EQ(result.authenticated->attempt.source, CredentialSource::Legacy);
    EXPECT_EQ(result.authenticated->attempt.cookieScope, CookieScope::Full);
    EXPECT_FALSE(result.authenticated->attempt.userAgentOverride.has_value());
    EXPECT_EQ(result.authenticated->accessToken, "access-token-1");
    EXPECT_EQ(result.authenticated->idToken, "id-token-1");

    // Nothing after the winning attempt is tried
    for (const auto& recorded : provider.requests()) {
        EXPECT_LE(recorded.session, 6);
    }
}

TEST_F(ReauthenticatorTest, CookieScopeControlsCookieHeader) {
    auto result = makeReauthenticator().reauthenticate(USER);
    ASSERT_FALSE(result.isSuccess());

    bool sawFull = false;
    bool sawSsidOnly = false;
    for (const auto& recorded : provider.requestsTo("auth.riotgames.com/authorize")) {
        QByteArray cookies = recorded.request.header("Cookie");
        if (recorded.session == 0) {
            sawFull = true;
            EXPECT_TRUE(cookies.contains("ssid=primary-ssid-AAAA1111"));
            EXPECT_TRUE(cookies.contains("clid=clid-value-0001"));
            EXPECT_TRUE(cookies.contains("tdid=tdid-value-0001"));
        } else if (recorded.session == 1) {
            sawSsidOnly = true;
            EXPECT_EQ(cookies, QByteArray("ssid=primary-ssid-AAAA1111"));
        }
    }
    EXPECT_TRUE(sawFull);
    EXPECT_TRUE(sawSsidOnly);
}

TEST_F(ReauthenticatorTest, AuthorizeRequestDoesNotFollowRedirects) {
    auto result = makeReauthenticator().reauthenticate(USER);
    ASSERT_FALSE(result.isSuccess());

    auto authorize = provider.requestsTo("auth.riotgames.com/authorize");
    ASSERT_FALSE(authorize.empty());
    for (const auto& recorded : authorize) {
        EXPECT_FALSE(recorded.request.followRedirects);
        EXPECT_EQ(recorded.request.header("Origin"), "https://playvalorant.com");
        EXPECT_EQ(recorded.request.header("Referer"), "https://playvalorant.com/opt_in");
    }
}

TEST_F(ReauthenticatorTest, EverySessionStartsWithItsOwnCookies) {
    // The provider sets a cookie in session 0; later sessions must not send it
    provider.setHandler([this](const HttpRequest& request, int session) {
        HttpResponse response = riot(request, session);
        if (session == 0) {
            response.cookies.append(QNetworkCookie("asid", "leaked-value"));
        }
        return response;
    });

    ReauthOptions options;
    options.defaultUserAgent = DEFAULT_UA;
    options.http.maxTransientRetries = 0;
    Reauthenticator reauth(&primary, &legacy, provider.factory(), options);
    auto result = reauth.reauthenticate(USER);
    ASSERT_FALSE(result.isSuccess());

    for (const auto& recorded : provider.requests()) {
        if (recorded.session > 0) {
            EXPECT_FALSE(recorded.request.header("Cookie").contains("asid=")) << recorded.session;
        }
    }
}

TEST_F(ReauthenticatorTest, TokensFromLegacyEndpointSkipAuthorize) {
    riot.tokensViaPost = true;
    riot.acceptAuth = [](const HttpRequest&, int) { return true; };

    auto result = makeReauthenticator().reauthenticate(USER);

    ASSERT_TRUE(result.isSuccess());
    ASSERT_EQ(result.outcomes.size(), 1u);
    EXPECT_EQ(*result.outcomes[0].variant, AuthVariant::ScopeA);
    EXPECT_TRUE(provider.requestsTo("auth.riotgames.com/authorize").empty());
}

TEST_F(ReauthenticatorTest, RejectedSessionMovesToNextAttempt) {
    riot.acceptAuth = [](const HttpRequest&, int) { return true; };
    int calls = 0;

    auto result = makeReauthenticator().reauthenticate(USER, nullptr,
        [&calls](AuthenticatedSession&) {
            return ++calls == 1 ? SessionVerdict::TryNext : SessionVerdict::Accept;
        });

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(calls, 2);
    ASSERT_EQ(result.outcomes.size(), 2u);
    EXPECT_TRUE(result.outcomes[0].succeeded);
    EXPECT_EQ(result.authenticated->attempt.cookieScope, CookieScope::SsidOnly);
    EXPECT_EQ(provider.sessionCount(), 2);
}

TEST_F(ReauthenticatorTest, AbortedSessionStopsTheWalk) {
    riot.acceptAuth = [](const HttpRequest&, int) { return true; };

    auto result = makeReauthenticator().reauthenticate(USER, nullptr,
        [](AuthenticatedSession&) { return SessionVerdict::Abort; });

    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.error, StoreError::UpstreamError);
    EXPECT_EQ(result.outcomes.size(), 1u);
    EXPECT_EQ(provider.sessionCount(), 1);
}

TEST_F(ReauthenticatorTest, EveryRejectedSessionIsClassifiedLikeFailures) {
    riot.acceptAuth = [](const HttpRequest&, int) { return true; };

    auto result = makeReauthenticator().reauthenticate(USER, nullptr,
        [](AuthenticatedSession&) { return SessionVerdict::TryNext; });

    EXPECT_EQ(result.error, StoreError::CredentialsExpired);
    EXPECT_EQ(result.outcomes.size(), 8u);
}

TEST_F(ReauthenticatorTest, ChallengeOnEveryAttemptIsChallengeBlocked) {
    riot.challengeAuth = [](const HttpRequest&, int) { return true; };

    auto result = makeReauthenticator().reauthenticate(USER);

    EXPECT_EQ(result.error, StoreError::ChallengeBlocked);
    EXPECT_EQ(result.outcomes.size(), 8u);
    for (const auto& outcome : result.outcomes) {
        EXPECT_TRUE(outcome.challenged);
    }
}

TEST_F(ReauthenticatorTest, PlainRejectionIsCredentialsExpired) {
    auto result = makeReauthenticator().reauthenticate(USER);

    EXPECT_EQ(result.error, StoreError::CredentialsExpired);
    EXPECT_EQ(result.outcomes.size(), 8u);
}

TEST_F(ReauthenticatorTest, CancelledBeforeFirstAttempt) {
    std::atomic_bool cancelled{true};

    auto result = makeReauthenticator().reauthenticate(USER, &cancelled);

    EXPECT_EQ(result.error, StoreError::Cancelled);
    EXPECT_TRUE(provider.requests().empty());
}

TEST(TokenFragmentTest, ExtractsBothTokens) {
    auto tokens = parseTokenFragment(
        "https://playvalorant.com/opt_in#access_token=AT.x.y&scope=openid&id_token=IT.a.b&expires_in=3600");

    ASSERT_TRUE(tokens.has_value());
    EXPECT_EQ(tokens->first, "AT.x.y");
    EXPECT_EQ(tokens->second, "IT.a.b");
}

TEST(TokenFragmentTest, RequiresBothTokens) {
    EXPECT_FALSE(parseTokenFragment("https://playvalorant.com/opt_in#access_token=AT").has_value());
    EXPECT_FALSE(parseTokenFragment("https://playvalorant.com/opt_in#id_token=IT").has_value());
}

TEST(TokenFragmentTest, IgnoresQueryWithoutFragment) {
    EXPECT_FALSE(parseTokenFragment(
        "https://playvalorant.com/opt_in?access_token=AT&id_token=IT").has_value());
    EXPECT_FALSE(parseTokenFragment(QString()).has_value());
}

TEST(ChallengeDetectionTest, MitigationHeader) {
    EXPECT_TRUE(isChallengeResponse(challengeResponse()));

    HttpResponse headerOnly;
    headerOnly.status = 403;
    headerOnly.headers.append(qMakePair(QByteArray("CF-Mitigated"), QByteArray("Challenge")));
    EXPECT_TRUE(isChallengeResponse(headerOnly));
}

TEST(ChallengeDetectionTest, BodySignature) {
    EXPECT_TRUE(isChallengeResponse(textResponse(503, "<script src=\"/cdn-cgi/challenge-platform/h/b\"></script>")));
    EXPECT_TRUE(isChallengeResponse(textResponse(200, "window._cf_chl_opt = {}")));
}

TEST(ChallengeDetectionTest, PlainFailureIsNotChallenge) {
    EXPECT_FALSE(isChallengeResponse(textResponse(403, "{\"error\":\"access_denied\"}")));
    EXPECT_FALSE(isChallengeResponse(redirectTo("https://authenticate.riotgames.com/", 302)));
}

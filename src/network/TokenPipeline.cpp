/**
 * Valstore - Token Pipeline Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "TokenPipeline.hpp"
#include "RiotEndpoints.hpp"

#include "core/Masking.hpp"
#include "core/StoreError.hpp"

#include <chrono>
#include <mutex>

#include <spdlog/spdlog.h>

namespace valstore {

namespace {

// Exact payload expected by the player-data API
constexpr const char* CLIENT_PLATFORM_JSON =
    R"({"platformType": "PC", "platformOS": "Windows", )"
    R"("platformOSVersion": "10.0.19042.1.256.64bit", "platformChipset": "Unknown"})";

struct ClientVersionCache {
    std::mutex mutex;
    QString version;
    std::chrono::steady_clock::time_point fetchedAt;
};

ClientVersionCache& versionCache() {
    static ClientVersionCache cache;
    return cache;
}

QString stringField(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return QString();
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return QString();
    }
    return QString::fromStdString(it->get<std::string>());
}

void failUpstream(const char* step, const HttpResponse& response) {
    throw StoreException(StoreError::UpstreamError,
                         std::string(step) + " failed with HTTP " + std::to_string(response.status),
                         response.status);
}

} // anonymous namespace

QString exchangeEntitlement(SessionContext& session, const QString& accessToken) {
    auto response = session.postJson(QUrl(RiotUrls::ENTITLEMENTS),
                                     nlohmann::json::object(),
                                     SessionContext::bearer(accessToken));
    if (!response.isSuccess()) {
        failUpstream("entitlements", response);
    }

    QString token = stringField(parseJsonBody(response, "entitlements"), "entitlements_token");
    if (token.isEmpty()) {
        throw StoreException(StoreError::UpstreamError,
                             "entitlements: response has no entitlements_token",
                             response.status);
    }

    spdlog::debug("Entitlements token acquired ({})", maskSecret(token).toStdString());
    return token;
}

QString discoverShard(SessionContext& session, const QString& accessToken,
                      const QString& idToken) {
    nlohmann::json body = {{"id_token", idToken.toStdString()}};
    auto response = session.putJson(QUrl(RiotUrls::GEO_AFFINITY), body,
                                    SessionContext::bearer(accessToken));
    if (response.status == 400) {
        throw StoreException(StoreError::UpstreamError,
                             "riot-geo rejected the id token (HTTP 400)", 400);
    }
    if (!response.isSuccess()) {
        failUpstream("riot-geo", response);
    }

    auto json = parseJsonBody(response, "riot-geo");
    QString shard;
    if (json.is_object() && json.contains("affinities")) {
        shard = stringField(json["affinities"], "live");
    }
    if (shard.isEmpty()) {
        throw StoreException(StoreError::UpstreamError,
                             "riot-geo: no live affinity in response", response.status);
    }

    spdlog::info("Live shard: {}", shard.toStdString());
    return shard;
}

QString resolveIdentity(SessionContext& session, const QString& accessToken) {
    auto response = session.get(QUrl(RiotUrls::USERINFO), SessionContext::bearer(accessToken));
    if (!response.isSuccess()) {
        failUpstream("userinfo", response);
    }

    QString puuid = stringField(parseJsonBody(response, "userinfo"), "sub");
    if (puuid.isEmpty()) {
        throw StoreException(StoreError::UpstreamError,
                             "userinfo: response has no subject", response.status);
    }

    spdlog::debug("Resolved identity {}", maskSecret(puuid).toStdString());
    return puuid;
}

QString clientVersion(SessionContext& session, int ttlSeconds) {
    auto& cache = versionCache();
    std::lock_guard<std::mutex> lock(cache.mutex);

    auto now = std::chrono::steady_clock::now();
    if (ttlSeconds > 0 && !cache.version.isEmpty() &&
        now - cache.fetchedAt < std::chrono::seconds(ttlSeconds)) {
        return cache.version;
    }

    auto response = session.get(QUrl(RiotUrls::CLIENT_VERSION));
    if (!response.isSuccess()) {
        failUpstream("client version", response);
    }

    auto json = parseJsonBody(response, "client version");
    QString version;
    if (json.is_object() && json.contains("data")) {
        version = stringField(json["data"], "riotClientVersion");
    }
    if (version.isEmpty()) {
        throw StoreException(StoreError::UpstreamError,
                             "client version: riotClientVersion missing", response.status);
    }

    cache.version = version;
    cache.fetchedAt = now;
    spdlog::debug("Client version: {}", version.toStdString());
    return version;
}

void clearClientVersionCache() {
    auto& cache = versionCache();
    std::lock_guard<std::mutex> lock(cache.mutex);
    cache.version.clear();
}

QString clientPlatformToken() {
    return QString::fromLatin1(QByteArray(CLIENT_PLATFORM_JSON).toBase64());
}

TokenSet completeTokenSet(SessionContext& session,
                          const QString& accessToken,
                          const QString& idToken,
                          const QString& knownPuuid) {
    TokenSet tokens;
    tokens.accessToken = accessToken;
    tokens.idToken = idToken;
    tokens.entitlementsToken = exchangeEntitlement(session, accessToken);
    tokens.shard = discoverShard(session, accessToken, idToken);
    tokens.puuid = knownPuuid.isEmpty() ? resolveIdentity(session, accessToken) : knownPuuid;
    return tokens;
}

} // namespace valstore

/**
 * Valstore - Storefront Client Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "StorefrontClient.hpp"
#include "RiotEndpoints.hpp"

#include "core/StoreError.hpp"

#include <QStringList>

#include <spdlog/spdlog.h>

namespace valstore {

namespace {

QUrl playerDataUrl(const char* pattern, const QString& shard, const QString& puuid) {
    return QUrl(QString(pattern).arg(shard, puuid));
}

void throwStorefrontError(const char* generation, int status) {
    throw StoreException(StoreError::UpstreamError,
                         std::string("storefront ") + generation + " failed with HTTP " +
                             std::to_string(status),
                         status);
}

} // anonymous namespace

HeaderList playerDataHeaders(const TokenSet& tokens, const ClientHeaders& client) {
    HeaderList headers = SessionContext::bearer(tokens.accessToken);
    headers.append(qMakePair(QByteArray("X-Riot-Entitlements-JWT"), tokens.entitlementsToken.toUtf8()));
    headers.append(qMakePair(QByteArray("X-Riot-ClientVersion"), client.clientVersion.toUtf8()));
    headers.append(qMakePair(QByteArray("X-Riot-ClientPlatform"), client.clientPlatform.toUtf8()));
    return headers;
}

nlohmann::json fetchCatalog(SessionContext& session, const TokenSet& tokens,
                            const ClientHeaders& client) {
    const HeaderList headers = playerDataHeaders(tokens, client);

    auto v3 = session.postJson(playerDataUrl(RiotUrls::STOREFRONT_V3, tokens.shard, tokens.puuid),
                               nlohmann::json::object(), headers);
    if (v3.isSuccess()) {
        spdlog::info("Storefront fetched (v3)");
        return parseJsonBody(v3, "storefront v3");
    }
    if (v3.status != 404 && v3.status != 405) {
        throwStorefrontError("v3", v3.status);
    }

    spdlog::info("Storefront v3 returned {}, falling back to v2", v3.status);

    auto v2 = session.get(playerDataUrl(RiotUrls::STOREFRONT_V2, tokens.shard, tokens.puuid),
                          headers);
    if (!v2.isSuccess()) {
        throwStorefrontError("v2", v2.status);
    }

    spdlog::info("Storefront fetched (v2)");
    return parseJsonBody(v2, "storefront v2");
}

std::vector<ShardProbeResult> probeShards(SessionContext& session, const TokenSet& tokens,
                                          const ClientHeaders& client,
                                          const QString& preferredShard) {
    QStringList candidates;
    for (const char* shard : KNOWN_SHARDS) {
        candidates << shard;
    }
    if (candidates.removeOne(preferredShard)) {
        candidates.prepend(preferredShard);
    }

    const HeaderList headers = playerDataHeaders(tokens, client);
    std::vector<ShardProbeResult> results;

    for (const QString& shard : candidates) {
        ShardProbeResult probe;
        probe.shard = shard;
        try {
            probe.status = session.get(
                playerDataUrl(RiotUrls::STOREFRONT_V2, shard, tokens.puuid), headers).status;
        } catch (const HttpError& e) {
            spdlog::warn("Shard probe {} failed: {}", shard.toStdString(), e.what());
        }
        spdlog::debug("Storefront probe ({}) -> {}", shard.toStdString(), probe.status);
        results.push_back(probe);
    }

    return results;
}

int walletStatus(SessionContext& session, const TokenSet& tokens, const ClientHeaders& client) {
    try {
        return session.get(playerDataUrl(RiotUrls::WALLET, tokens.shard, tokens.puuid),
                           playerDataHeaders(tokens, client)).status;
    } catch (const HttpError& e) {
        spdlog::warn("Wallet check failed: {}", e.what());
        return 0;
    }
}

} // namespace valstore

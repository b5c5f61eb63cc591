/**
 * Valstore - Token Pipeline
 *
 * Entitlement exchange, shard discovery, identity resolution and the
 * client metadata headers required by the player-data API.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <QString>

#include "SessionContext.hpp"

namespace valstore {

/**
 * Tokens of one successful attempt, never persisted
 */
struct TokenSet {
    QString accessToken;         // From reauthentication
    QString idToken;             // From reauthentication
    QString entitlementsToken;   // From entitlement exchange
    QString shard;               // Regional shard, e.g. "ap"
    QString puuid;               // Player identity

    bool isComplete() const {
        return !accessToken.isEmpty() && !idToken.isEmpty() &&
               !entitlementsToken.isEmpty() && !shard.isEmpty() && !puuid.isEmpty();
    }
};

/**
 * Exchange the access token for an entitlements token
 *
 * @throws StoreException (UpstreamError) if the token field is missing
 */
QString exchangeEntitlement(SessionContext& session, const QString& accessToken);

/**
 * Discover the live shard from the geo affinity endpoint
 *
 * @throws StoreException (UpstreamError) on HTTP 400 or a missing affinity
 */
QString discoverShard(SessionContext& session, const QString& accessToken,
                      const QString& idToken);

/**
 * Resolve the player identity (PUUID) from /userinfo
 *
 * @throws StoreException (UpstreamError) if "sub" is missing
 */
QString resolveIdentity(SessionContext& session, const QString& accessToken);

/**
 * Current Riot client version from the public version feed
 *
 * Cached process-wide for ttlSeconds (0 disables the cache).
 *
 * @throws StoreException (UpstreamError) if the feed cannot be parsed
 */
QString clientVersion(SessionContext& session, int ttlSeconds = 600);

/**
 * Drop the cached client version
 */
void clearClientVersionCache();

/**
 * Base64 platform descriptor of a Windows desktop client
 */
QString clientPlatformToken();

/**
 * Run the pipeline after reauthentication
 *
 * Identity resolution is skipped when knownPuuid is set.
 *
 * @return A complete TokenSet
 * @throws StoreException on the first failing step
 */
TokenSet completeTokenSet(SessionContext& session,
                          const QString& accessToken,
                          const QString& idToken,
                          const QString& knownPuuid);

} // namespace valstore

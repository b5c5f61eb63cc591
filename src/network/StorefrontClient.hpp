/**
 * Valstore - Storefront Client
 *
 * Fetches the per-player storefront, negotiating between the v3 and v2
 * endpoint generations.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "SessionContext.hpp"
#include "TokenPipeline.hpp"

namespace valstore {

/**
 * Client metadata headers required by the player-data API
 */
struct ClientHeaders {
    QString clientVersion;
    QString clientPlatform;
};

/**
 * Status code seen for one shard during a probe
 */
struct ShardProbeResult {
    QString shard;
    int status = 0;    // 0 = no response
};

/**
 * Headers for authenticated player-data requests
 */
HeaderList playerDataHeaders(const TokenSet& tokens, const ClientHeaders& client);

/**
 * Fetch the raw storefront
 *
 * Tries POST v3 first and falls back to GET v2 on 404/405.
 *
 * @return Parsed storefront body, unmodified
 * @throws StoreException (UpstreamError) on any other failure; HTTP 403
 *         is reported with httpStatus 403
 */
nlohmann::json fetchCatalog(SessionContext& session, const TokenSet& tokens,
                            const ClientHeaders& client);

/**
 * Probe the v2 storefront on every known shard
 *
 * Diagnostic only. The preferred shard is probed first.
 */
std::vector<ShardProbeResult> probeShards(SessionContext& session, const TokenSet& tokens,
                                          const ClientHeaders& client,
                                          const QString& preferredShard);

/**
 * Status code of the wallet endpoint, 0 when unreachable
 *
 * Diagnostic sanity check for the headers and shard.
 */
int walletStatus(SessionContext& session, const TokenSet& tokens, const ClientHeaders& client);

} // namespace valstore

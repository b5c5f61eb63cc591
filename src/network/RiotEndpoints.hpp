/**
 * Valstore - Provider Endpoints
 *
 * Fixed URLs and identifiers of the Riot web auth flow and the
 * Valorant player-data API.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

namespace valstore {

namespace RiotUrls {
    // Authentication
    constexpr const char* AUTHORIZATION_LEGACY =
        "https://auth.riotgames.com/api/v1/authorization";
    constexpr const char* AUTHORIZE =
        "https://auth.riotgames.com/authorize";
    constexpr const char* USERINFO =
        "https://auth.riotgames.com/userinfo";
    constexpr const char* ENTITLEMENTS =
        "https://entitlements.auth.riotgames.com/api/token/v1";
    constexpr const char* GEO_AFFINITY =
        "https://riot-geo.pas.si.riotgames.com/pas/v1/product/valorant";

    // Player data, %1 = shard, %2 = puuid
    constexpr const char* STOREFRONT_V3 =
        "https://pd.%1.a.pvp.net/store/v3/storefront/%2";
    constexpr const char* STOREFRONT_V2 =
        "https://pd.%1.a.pvp.net/store/v2/storefront/%2";
    constexpr const char* WALLET =
        "https://pd.%1.a.pvp.net/store/v1/wallet/%2";

    // Public, unauthenticated
    constexpr const char* CLIENT_VERSION =
        "https://valorant-api.com/v1/version";
    constexpr const char* WEAPON_SKINS =
        "https://valorant-api.com/v1/weapons/skins";
    constexpr const char* PUBLIC_IP =
        "https://api.ipify.org";

    // Web client the session pretends to be
    constexpr const char* WEB_ORIGIN = "https://playvalorant.com";
    constexpr const char* WEB_REFERER = "https://playvalorant.com/opt_in";
}

namespace RiotCookieDomains {
    constexpr const char* WILDCARD = ".riotgames.com";
    constexpr const char* AUTH_HOST = "auth.riotgames.com";
}

namespace RiotAuthParams {
    constexpr const char* CLIENT_ID = "play-valorant-web-prod";
    constexpr const char* NONCE = "1";
    constexpr const char* REDIRECT_URI = "https://playvalorant.com/opt_in";
    constexpr const char* RESPONSE_TYPE = "token id_token";
    constexpr const char* PROMPT = "none";
    constexpr const char* SCOPE_A = "account openid";
    constexpr const char* SCOPE_B = "openid link";
}

namespace RiotIds {
    // Valorant Points
    constexpr const char* VP_CURRENCY = "85ad13f7-3d1b-5128-9eb2-7cd8ee0b5741";
    // Reward type of weapon skin levels
    constexpr const char* WEAPON_SKIN_TYPE = "e7c63390-eda7-46e0-bb7a-a6abdacd2433";
}

// Regional shards probed by diagnostics, in default order
constexpr const char* KNOWN_SHARDS[] = {"ap", "na", "eu", "kr", "pbe"};

} // namespace valstore

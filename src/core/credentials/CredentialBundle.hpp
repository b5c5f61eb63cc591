/**
 * Valstore - Credential Bundle
 *
 * Normalized session cookies captured from the browser.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace valstore {

/**
 * Which store a bundle came from
 */
enum class CredentialSource {
    Primary,   // Encrypted keyring store
    Legacy     // Flat cookie file
};

/**
 * Captured session cookies for one user
 *
 * Only ssid is mandatory. Absent values are empty strings.
 */
struct CredentialBundle {
    std::string ssid;
    std::string clid;
    std::string sub;
    std::string csid;
    std::string tdid;
    std::string puuid;       // Known identity, skips /userinfo
    std::string userAgent;   // Browser agent at capture time

    bool isValid() const { return !ssid.empty(); }

    /**
     * Cookie name/value pairs for the auth host, ssid first
     *
     * @param ssidOnly Only return the ssid cookie
     */
    std::vector<std::pair<std::string, std::string>> cookies(bool ssidOnly) const;

    // Serialization (keyring secret payload)
    static CredentialBundle fromJson(const std::string& json);
    std::string toJson() const;
};

/**
 * Strip surrounding whitespace and quote characters from a raw value
 */
std::string sanitizeCredentialValue(const std::string& value);

/**
 * Build a bundle from raw key/value pairs
 *
 * Each field has an explicit precedence list of accepted keys, e.g.
 * ssid <- "ssid", "RIOT_SSID", "SSID". The first non-empty value after
 * sanitizing wins. Unknown keys are ignored.
 */
CredentialBundle normalizeCredentials(const std::map<std::string, std::string>& raw);

} // namespace valstore

/**
 * Valstore - Credential Bundle Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "CredentialBundle.hpp"

#include <initializer_list>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace valstore {

namespace {

constexpr const char* TRIM_CHARACTERS = " \t\r\n\"'";

std::string pick(const std::map<std::string, std::string>& raw,
                 std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = raw.find(key);
        if (it == raw.end()) {
            continue;
        }
        std::string value = sanitizeCredentialValue(it->second);
        if (!value.empty()) {
            return value;
        }
    }
    return {};
}

} // anonymous namespace

std::string sanitizeCredentialValue(const std::string& value) {
    auto begin = value.find_first_not_of(TRIM_CHARACTERS);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(TRIM_CHARACTERS);
    return value.substr(begin, end - begin + 1);
}

CredentialBundle normalizeCredentials(const std::map<std::string, std::string>& raw) {
    CredentialBundle bundle;
    bundle.ssid = pick(raw, {"ssid", "RIOT_SSID", "SSID"});
    bundle.clid = pick(raw, {"clid", "RIOT_CLID", "CLID"});
    bundle.sub = pick(raw, {"sub", "RIOT_SUB", "SUB"});
    bundle.csid = pick(raw, {"csid", "RIOT_CSID", "CSID"});
    bundle.tdid = pick(raw, {"tdid", "RIOT_TDID", "TDID"});
    bundle.puuid = pick(raw, {"puuid", "RIOT_PUUID", "PUUID"});
    bundle.userAgent = pick(raw, {"user_agent", "ua", "USER_AGENT"});
    return bundle;
}

std::vector<std::pair<std::string, std::string>> CredentialBundle::cookies(bool ssidOnly) const {
    std::vector<std::pair<std::string, std::string>> result;
    if (!ssid.empty()) {
        result.emplace_back("ssid", ssid);
    }
    if (ssidOnly) {
        return result;
    }

    const std::pair<const char*, const std::string*> secondary[] = {
        {"clid", &clid}, {"sub", &sub}, {"csid", &csid}, {"tdid", &tdid}
    };
    for (const auto& [name, value] : secondary) {
        if (!value->empty()) {
            result.emplace_back(name, *value);
        }
    }
    return result;
}

CredentialBundle CredentialBundle::fromJson(const std::string& json) {
    std::map<std::string, std::string> raw;

    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            spdlog::warn("Credential payload is not a JSON object");
            return {};
        }
        for (auto& [key, value] : j.items()) {
            if (value.is_string()) {
                raw[key] = value.get<std::string>();
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse credential payload: {}", e.what());
        return {};
    }

    return normalizeCredentials(raw);
}

std::string CredentialBundle::toJson() const {
    nlohmann::json j = nlohmann::json::object();

    const std::pair<const char*, const std::string*> fields[] = {
        {"ssid", &ssid}, {"clid", &clid}, {"sub", &sub}, {"csid", &csid},
        {"tdid", &tdid}, {"puuid", &puuid}, {"user_agent", &userAgent}
    };
    for (const auto& [key, value] : fields) {
        if (!value->empty()) {
            j[key] = *value;
        }
    }

    return j.dump();
}

} // namespace valstore

/**
 * Valstore - Skin Index
 *
 * UUID -> display name and icon lookup built from the public weapon
 * skin feed.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <QString>

#include <nlohmann/json.hpp>

namespace valstore {

class SessionContext;

/**
 * Display data shared by a skin and all of its levels and chromas
 */
struct SkinInfo {
    QString displayName;
    QString iconUrl;     // Empty when the feed has none
};

/**
 * Flattened skin lookup
 *
 * Keys are lower-case UUIDs of skins, skin levels and chromas.
 */
class SkinIndex {
public:
    /**
     * Build from a weapon skin feed ({"data": [...]})
     */
    static SkinIndex fromFeed(const nlohmann::json& feed);

    /**
     * Case-insensitive lookup
     */
    std::optional<SkinInfo> lookup(const QString& uuid) const;

    size_t size() const { return m_entries.size(); }

private:
    void add(const nlohmann::json& uuid, const SkinInfo& info);

    std::unordered_map<std::string, SkinInfo> m_entries;
};

/**
 * Fetch the weapon skin feed and build the index
 *
 * @param language Locale tag, e.g. "ja-JP"
 * @throws StoreException (UpstreamError) if the feed cannot be fetched
 */
SkinIndex buildSkinIndex(SessionContext& session, const QString& language);

/**
 * Read-through cache of skin indexes per language
 *
 * Concurrent callers asking for the same language while it is being
 * built wait for that single build.
 */
class SkinIndexCache {
public:
    explicit SkinIndexCache(int ttlSeconds);

    using Builder = std::function<SkinIndex()>;

    /**
     * Cached index for a language, built with builder when missing or stale
     *
     * @throws whatever builder throws; failed builds are not cached
     */
    std::shared_ptr<const SkinIndex> get(const QString& language, const Builder& builder);

private:
    struct Entry {
        std::shared_future<std::shared_ptr<const SkinIndex>> index;
        std::chrono::steady_clock::time_point builtAt;
    };

    std::chrono::seconds m_ttl;
    std::mutex m_mutex;
    std::map<QString, Entry> m_entries;
};

} // namespace valstore

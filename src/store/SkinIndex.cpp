/**
 * Valstore - Skin Index Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "SkinIndex.hpp"

#include "core/StoreError.hpp"
#include "network/RiotEndpoints.hpp"
#include "network/SessionContext.hpp"

#include <QUrlQuery>

#include <spdlog/spdlog.h>

namespace valstore {

namespace {

QString stringValue(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return QString();
    }
    return QString::fromStdString(it->get<std::string>());
}

} // anonymous namespace

void SkinIndex::add(const nlohmann::json& uuid, const SkinInfo& info) {
    if (!uuid.is_string()) {
        return;
    }
    m_entries[QString::fromStdString(uuid.get<std::string>()).toLower().toStdString()] = info;
}

SkinIndex SkinIndex::fromFeed(const nlohmann::json& feed) {
    SkinIndex index;

    auto dataIt = feed.find("data");
    if (dataIt == feed.end() || !dataIt->is_array()) {
        spdlog::warn("Skin feed has no data array");
        return index;
    }

    for (const auto& skin : *dataIt) {
        if (!skin.is_object()) {
            continue;
        }

        SkinInfo info;
        info.displayName = stringValue(skin, "displayName");
        info.iconUrl = stringValue(skin, "displayIcon");

        auto levels = skin.find("levels");
        bool hasLevels = levels != skin.end() && levels->is_array();
        if (info.iconUrl.isEmpty() && hasLevels && !levels->empty() && levels->front().is_object()) {
            info.iconUrl = stringValue(levels->front(), "displayIcon");
        }

        if (info.displayName.isEmpty()) {
            continue;
        }

        index.add(skin.value("uuid", nlohmann::json()), info);

        if (hasLevels) {
            for (const auto& level : *levels) {
                if (level.is_object()) {
                    index.add(level.value("uuid", nlohmann::json()), info);
                }
            }
        }

        auto chromas = skin.find("chromas");
        if (chromas != skin.end() && chromas->is_array()) {
            for (const auto& chroma : *chromas) {
                if (chroma.is_object()) {
                    index.add(chroma.value("uuid", nlohmann::json()), info);
                }
            }
        }
    }

    spdlog::debug("Skin index built with {} keys", index.size());
    return index;
}

std::optional<SkinInfo> SkinIndex::lookup(const QString& uuid) const {
    auto it = m_entries.find(uuid.toLower().toStdString());
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

SkinIndex buildSkinIndex(SessionContext& session, const QString& language) {
    QUrl url(RiotUrls::WEAPON_SKINS);
    QUrlQuery query;
    query.addQueryItem("language", language);
    url.setQuery(query);

    spdlog::info("Fetching skin catalog ({})", language.toStdString());

    auto response = session.get(url);
    if (!response.isSuccess()) {
        throw StoreException(StoreError::UpstreamError,
                             "skin catalog failed with HTTP " + std::to_string(response.status),
                             response.status);
    }

    return SkinIndex::fromFeed(parseJsonBody(response, "skin catalog"));
}

SkinIndexCache::SkinIndexCache(int ttlSeconds)
    : m_ttl(ttlSeconds)
{
}

std::shared_ptr<const SkinIndex> SkinIndexCache::get(const QString& language,
                                                     const Builder& builder) {
    std::shared_future<std::shared_ptr<const SkinIndex>> future;
    std::promise<std::shared_ptr<const SkinIndex>> promise;
    bool isBuilder = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto now = std::chrono::steady_clock::now();
        auto it = m_entries.find(language);
        if (it != m_entries.end() && now - it->second.builtAt < m_ttl) {
            future = it->second.index;
        } else {
            future = promise.get_future().share();
            m_entries[language] = Entry{future, now};
            isBuilder = true;
        }
    }

    if (isBuilder) {
        try {
            promise.set_value(std::make_shared<const SkinIndex>(builder()));
        } catch (...) {
            promise.set_exception(std::current_exception());
            std::lock_guard<std::mutex> lock(m_mutex);
            m_entries.erase(language);
        }
    }

    return future.get();
}

} // namespace valstore

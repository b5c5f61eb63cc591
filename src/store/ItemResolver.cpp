/**
 * Valstore - Item Resolver Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ItemResolver.hpp"

#include "network/RiotEndpoints.hpp"

#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

namespace valstore {

namespace {

const nlohmann::json* singleItemOffers(const nlohmann::json& catalog) {
    if (!catalog.is_object()) {
        return nullptr;
    }
    auto layout = catalog.find("SkinsPanelLayout");
    if (layout == catalog.end() || !layout->is_object()) {
        return nullptr;
    }
    auto offers = layout->find("SingleItemStoreOffers");
    if (offers == layout->end() || !offers->is_array()) {
        return nullptr;
    }
    return &*offers;
}

QString skinRewardId(const nlohmann::json& offer) {
    auto rewards = offer.find("Rewards");
    if (rewards == offer.end() || !rewards->is_array()) {
        return QString();
    }

    const QString skinType = QString(RiotIds::WEAPON_SKIN_TYPE);
    for (const auto& reward : *rewards) {
        if (!reward.is_object()) {
            continue;
        }
        auto type = reward.find("ItemTypeID");
        auto id = reward.find("ItemID");
        if (type == reward.end() || !type->is_string() || id == reward.end() || !id->is_string()) {
            continue;
        }
        if (QString::fromStdString(type->get<std::string>()).compare(skinType, Qt::CaseInsensitive) == 0) {
            return QString::fromStdString(id->get<std::string>());
        }
    }
    return QString();
}

} // anonymous namespace

std::optional<int> resolvePrice(const nlohmann::json& offer) {
    if (!offer.is_object()) {
        return std::nullopt;
    }

    const nlohmann::json* costs = nullptr;
    for (const char* field : {"DiscountedCost", "Cost"}) {
        auto it = offer.find(field);
        if (it != offer.end() && it->is_object()) {
            costs = &*it;
            break;
        }
    }
    if (!costs) {
        return std::nullopt;
    }

    auto vp = costs->find(RiotIds::VP_CURRENCY);
    if (vp == costs->end() || !vp->is_number()) {
        return std::nullopt;
    }
    double amount = vp->get<double>();
    if (!std::isfinite(amount) || amount < 0 ||
        amount > static_cast<double>(std::numeric_limits<int>::max())) {
        spdlog::warn("Ignoring out-of-range VP price {}", amount);
        return std::nullopt;
    }
    return static_cast<int>(amount);
}

std::vector<ResolvedItem> resolveItems(const nlohmann::json& catalog, const SkinIndex& index) {
    std::vector<ResolvedItem> items;

    const nlohmann::json* offers = singleItemOffers(catalog);
    if (!offers) {
        spdlog::warn("Storefront has no single item offers");
        return items;
    }

    for (const auto& offer : *offers) {
        if (!offer.is_object()) {
            continue;
        }

        QString itemId = skinRewardId(offer);
        if (itemId.isEmpty()) {
            spdlog::debug("Skipping offer without a weapon skin reward");
            continue;
        }

        ResolvedItem item;
        item.itemId = itemId;
        item.price = resolvePrice(offer);

        if (auto info = index.lookup(itemId)) {
            item.name = info->displayName;
            item.iconUrl = info->iconUrl;
        } else {
            spdlog::debug("No skin entry for {}", itemId.toStdString());
            item.name = itemId;
        }

        items.push_back(std::move(item));
    }

    return items;
}

} // namespace valstore

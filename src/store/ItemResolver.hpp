/**
 * Valstore - Item Resolver
 *
 * Turns a raw storefront into display-ready offers.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "SkinIndex.hpp"

namespace valstore {

/**
 * One daily offer
 */
struct ResolvedItem {
    QString itemId;
    QString name;              // Falls back to itemId when unknown
    std::optional<int> price;  // VP, nullopt when not listed
    QString iconUrl;
};

/**
 * VP price of a single offer
 *
 * DiscountedCost wins over Cost when present.
 */
std::optional<int> resolvePrice(const nlohmann::json& offer);

/**
 * Resolve the single-item offers of a storefront, in catalog order
 *
 * Offers without a weapon skin reward are skipped.
 */
std::vector<ResolvedItem> resolveItems(const nlohmann::json& catalog, const SkinIndex& index);

} // namespace valstore

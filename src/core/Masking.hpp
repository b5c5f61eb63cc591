/**
 * Valstore - Secret Masking
 *
 * Helpers for printing credential values without revealing them.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>

#include <QString>

namespace valstore {

/**
 * Mask a secret for display
 *
 * Values longer than 8 characters keep their first and last 4 characters
 * ("abcd…5678"). Shorter values are replaced entirely, empty values
 * render as "<none>".
 */
QString maskSecret(const QString& value);
QString maskSecret(const std::string& value);

/**
 * Mask an IP address for display
 *
 * IPv4 hides the third octet ("203.0.*.4"), IPv6 keeps the first and
 * last six characters. Empty input renders as "<unknown>".
 */
QString maskIpAddress(const QString& address);

} // namespace valstore

/**
 * Valstore - Error Taxonomy
 *
 * Error kinds surfaced to callers of the storefront engine.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <stdexcept>
#include <string>

#include <QString>

namespace valstore {

/**
 * Store error types
 */
enum class StoreError {
    None,
    InvalidCredentials,    // Bundle has no ssid, nothing was sent
    CredentialsExpired,    // Every attempt failed without a challenge
    ChallengeBlocked,      // Anti-automation challenge seen on at least one attempt
    UpstreamError,         // Provider answered with something unusable
    NotFound,              // No credentials on record for the user
    Cancelled              // Caller cancelled between attempts
};

/**
 * Error raised inside a single attempt or pipeline step
 *
 * Caught at the attempt boundary; only the aggregated classification
 * reaches the caller.
 */
class StoreException : public std::runtime_error {
public:
    StoreException(StoreError kind, const std::string& message, int httpStatus = 0)
        : std::runtime_error(message)
        , m_kind(kind)
        , m_httpStatus(httpStatus) {}

    StoreError kind() const { return m_kind; }
    int httpStatus() const { return m_httpStatus; }

private:
    StoreError m_kind;
    int m_httpStatus;
};

/**
 * Short identifier for an error kind (e.g. "ChallengeBlocked")
 */
QString storeErrorName(StoreError error);

/**
 * Remediation hint shown to the user for an error kind
 *
 * @param error Error kind
 * @param httpStatus HTTP status attached to the error, 403 selects the
 *        privilege/block hint for UpstreamError
 */
QString hintFor(StoreError error, int httpStatus = 0);

} // namespace valstore

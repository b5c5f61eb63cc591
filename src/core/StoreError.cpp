/**
 * Valstore - Error Taxonomy Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "StoreError.hpp"

namespace valstore {

QString storeErrorName(StoreError error) {
    switch (error) {
        case StoreError::None:
            return "None";
        case StoreError::InvalidCredentials:
            return "InvalidCredentials";
        case StoreError::CredentialsExpired:
            return "CredentialsExpired";
        case StoreError::ChallengeBlocked:
            return "ChallengeBlocked";
        case StoreError::UpstreamError:
            return "UpstreamError";
        case StoreError::NotFound:
            return "NotFound";
        case StoreError::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

QString hintFor(StoreError error, int httpStatus) {
    switch (error) {
        case StoreError::None:
            return QString();
        case StoreError::InvalidCredentials:
            return "The saved session has no ssid cookie. Capture the session again from the browser.";
        case StoreError::CredentialsExpired:
            return "The saved session has expired. Log in again in the browser and capture a new ssid.";
        case StoreError::ChallengeBlocked:
            return "The provider answered with an anti-bot challenge. Try again from a different network path.";
        case StoreError::UpstreamError:
            if (httpStatus == 403) {
                return "The provider refused the storefront request (HTTP 403). "
                       "The account is signed in but not allowed or currently blocked.";
            }
            return "The provider returned an unexpected response. Please try again later.";
        case StoreError::NotFound:
            return "No saved session for this user. Capture one with the browser extension first.";
        case StoreError::Cancelled:
            return "The request was cancelled.";
    }
    return QString();
}

} // namespace valstore

/**
 * Valstore - Legacy File Store
 *
 * Read-only access to per-user cookie files written by older versions
 * of the capture endpoint.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <vector>

#include "CredentialStore.hpp"

namespace valstore {

/**
 * Flat KEY=VALUE cookie files named "<userId>.txt"
 *
 * Search order: override directory (VALORANT_COOKIES_DIR, else the
 * configured directory), <data dir>/cookies, <cwd>/cookies.
 */
class LegacyFileStore : public CredentialStore {
public:
    explicit LegacyFileStore(std::filesystem::path configuredDirectory = {});

    std::optional<CredentialBundle> load(const std::string& userId) const override;

    // Legacy files are never written
    bool store(const std::string& userId, const CredentialBundle& bundle) override;

    bool isAvailable() const override { return true; }
    std::string displayName() const override { return "file"; }

    /**
     * Candidate file locations for a user, in search order, without duplicates
     */
    std::vector<std::filesystem::path> candidatePaths(const std::string& userId) const;

    /**
     * Parse the content of a cookie file
     *
     * Blank lines, "#" comments and lines without "=" are skipped.
     */
    static CredentialBundle parse(const std::string& content);

private:
    std::filesystem::path m_configuredDirectory;
};

} // namespace valstore

/**
 * Valstore - Platform Abstraction
 *
 * Per-user directories for configuration, data and logs.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

namespace valstore {

/**
 * Platform abstraction layer
 */
class Platform {
public:
    /**
     * Get the configuration directory path
     *
     * Linux: $XDG_CONFIG_HOME/valstore or ~/.config/valstore/
     */
    static std::filesystem::path getConfigPath();

    /**
     * Get the data directory path
     *
     * Linux: $XDG_DATA_HOME/valstore or ~/.local/share/valstore/
     * Legacy cookie files live in its "cookies" subdirectory.
     */
    static std::filesystem::path getDataPath();
};

} // namespace valstore

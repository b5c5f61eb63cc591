/**
 * Valstore - Platform Implementation (Linux)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef PLATFORM_LINUX

#include "Platform.hpp"

#include <cstdlib>

namespace valstore {

namespace {

std::filesystem::path xdgPath(const char* variable, const char* fallback) {
    const char* xdg = std::getenv(variable);
    if (xdg && xdg[0] != '\0') {
        return std::filesystem::path(xdg) / "valstore";
    }

    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / fallback / "valstore";
    }

    return std::filesystem::path(fallback) / "valstore";
}

} // anonymous namespace

std::filesystem::path Platform::getConfigPath() {
    return xdgPath("XDG_CONFIG_HOME", ".config");
}

std::filesystem::path Platform::getDataPath() {
    return xdgPath("XDG_DATA_HOME", ".local/share");
}

} // namespace valstore

#endif // PLATFORM_LINUX

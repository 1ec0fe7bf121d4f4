#include "acedaw/common/Paths.hpp"

#include <cstdlib>

namespace acedaw::common {
namespace {

/// Returns the value of an environment variable as a path, or an empty path
/// when it is unset or empty.
std::filesystem::path envPath(const char* name) {
    if (const char* value = std::getenv(name); value != nullptr && value[0] != '\0') {
        return std::filesystem::path(value);
    }
    return {};
}

#ifdef _WIN32
std::filesystem::path userConfigDir() {
    const auto appData = envPath("APPDATA");
    return appData.empty() ? appData : appData / "acedaw";
}

std::filesystem::path userDataDir() {
    const auto localAppData = envPath("LOCALAPPDATA");
    return localAppData.empty() ? localAppData : localAppData / "acedaw";
}
#else
/// Uses $XDG_CONFIG_HOME/acedaw/ or falls back to ~/.config/acedaw/.
std::filesystem::path userConfigDir() {
    if (const auto xdg = envPath("XDG_CONFIG_HOME"); !xdg.empty()) {
        return xdg / "acedaw";
    }
    if (const auto home = envPath("HOME"); !home.empty()) {
        return home / ".config" / "acedaw";
    }
    return {};
}

/// Uses $XDG_DATA_HOME/acedaw/ or falls back to ~/.local/share/acedaw/.
std::filesystem::path userDataDir() {
    if (const auto xdg = envPath("XDG_DATA_HOME"); !xdg.empty()) {
        return xdg / "acedaw";
    }
    if (const auto home = envPath("HOME"); !home.empty()) {
        return home / ".local" / "share" / "acedaw";
    }
    return {};
}
#endif

}  // namespace

std::filesystem::path userConfigPath() {
    const auto dir = userConfigDir();
    if (dir.empty()) {
        return {};
    }
    return dir / "config.json";
}

std::filesystem::path defaultStoreDirectory() {
    const auto dir = userDataDir();
    if (dir.empty()) {
        return {};
    }
    return dir / "store";
}

}  // namespace acedaw::common

#pragma once

#include <filesystem>

namespace acedaw::common {

/// Resolves the per-user config file.
/// On Linux: $XDG_CONFIG_HOME/acedaw/config.json or ~/.config/acedaw/config.json.
/// On Windows: %APPDATA%\acedaw\config.json.
/// Returns an empty path when no user config location is available.
std::filesystem::path userConfigPath();

/// Resolves the default directory backing the project/audio store.
/// On Linux: $XDG_DATA_HOME/acedaw/store or ~/.local/share/acedaw/store.
/// On Windows: %LOCALAPPDATA%\acedaw\store.
/// Returns an empty path when no user data location is available.
std::filesystem::path defaultStoreDirectory();

}  // namespace acedaw::common

#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace acedaw::library {

struct LibraryConfig {
    std::filesystem::path storeDirectory;
    std::optional<std::filesystem::path> logFile;
};

/// Store under the user data directory, no log file.
LibraryConfig defaultLibraryConfig();

/// Reads a JSON config file with optional "storeDirectory" and "logFile" string
/// keys. A missing file yields the defaults; relative paths resolve against the
/// file's directory. Malformed JSON or wrong-typed keys are errors.
std::expected<LibraryConfig, std::string> loadLibraryConfig(const std::filesystem::path& path);

}  // namespace acedaw::library

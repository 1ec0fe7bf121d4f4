#pragma once

#include <filesystem>
#include <string>

namespace acedaw::common {

/// Timestamped diagnostic log shared by the library and the CLI.
/// Nothing is written until init() has opened a log file.
class Logger {
public:
    static bool init(const std::filesystem::path& logPath);
    static void log(const std::string& message);
    static void logWarning(const std::string& message);
    static void logError(const std::string& message);
    static void shutdown();

private:
    Logger() = default;
};

}  // namespace acedaw::common

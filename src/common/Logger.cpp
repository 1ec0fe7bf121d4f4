#include "acedaw/common/Logger.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string_view>

namespace acedaw::common {
namespace {

std::ofstream logFile;
std::mutex logMutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

void writeLine(std::string_view level, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile << level << ' ' << timestamp() << " - " << message << '\n';
        logFile.flush();
    }
}

}  // namespace

bool Logger::init(const std::filesystem::path& logPath) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.close();
    }

    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    logFile.open(logPath, std::ios::out | std::ios::app);
    if (!logFile.is_open()) {
        return false;
    }
    logFile << "\n=== acedaw startup " << timestamp() << " ===\n";
    logFile.flush();
    return true;
}

void Logger::log(const std::string& message) {
    writeLine("[INFO ]", message);
}

void Logger::logWarning(const std::string& message) {
    writeLine("[WARN ]", message);
}

void Logger::logError(const std::string& message) {
    writeLine("[ERROR]", message);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile << "=== acedaw shutdown " << timestamp() << " ===\n\n";
        logFile.close();
    }
}

}  // namespace acedaw::common

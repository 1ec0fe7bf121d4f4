#include "acedaw/library/LibraryConfig.hpp"

#include "acedaw/common/Paths.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>

using json = nlohmann::json;

namespace acedaw::library {
namespace {

std::expected<json, std::string> readJsonFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(std::format("Failed to open '{}'", path.string()));
    }

    try {
        json root;
        file >> root;
        return root;
    } catch (const std::exception& ex) {
        return std::unexpected(std::format("Failed to parse '{}': {}", path.string(), ex.what()));
    }
}

std::expected<std::optional<std::filesystem::path>, std::string> readPathField(const json& root, const char* field,
                                                                              const std::filesystem::path& baseDir) {
    const auto it = root.find(field);
    if (it == root.end() || it->is_null()) {
        return std::optional<std::filesystem::path>{};
    }
    if (!it->is_string() || it->get_ref<const std::string&>().empty()) {
        return std::unexpected(std::format("Config field '{}' must be a non-empty string", field));
    }

    std::filesystem::path value(it->get<std::string>());
    if (value.is_relative()) {
        value = baseDir / value;
    }
    return std::optional<std::filesystem::path>{value.lexically_normal()};
}

}  // namespace

LibraryConfig defaultLibraryConfig() {
    LibraryConfig config;
    config.storeDirectory = common::defaultStoreDirectory();
    return config;
}

std::expected<LibraryConfig, std::string> loadLibraryConfig(const std::filesystem::path& path) {
    LibraryConfig config = defaultLibraryConfig();
    if (path.empty()) {
        return config;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return config;
    }

    auto root = readJsonFile(path);
    if (!root.has_value()) {
        return std::unexpected(root.error());
    }
    if (!root->is_object()) {
        return std::unexpected(std::format("Config file '{}' must contain a JSON object", path.string()));
    }

    const auto baseDir = path.parent_path();
    auto storeDirectory = readPathField(*root, "storeDirectory", baseDir);
    if (!storeDirectory.has_value()) {
        return std::unexpected(storeDirectory.error());
    }
    auto logFile = readPathField(*root, "logFile", baseDir);
    if (!logFile.has_value()) {
        return std::unexpected(logFile.error());
    }

    if (storeDirectory->has_value()) {
        config.storeDirectory = **storeDirectory;
    }
    config.logFile = *logFile;
    return config;
}

}  // namespace acedaw::library

#include "acedaw/store/DirectoryKeyValueStore.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <utility>

namespace acedaw::store {
namespace {

// '%' followed by non-hex, so no encoded key can collide with a temp file.
constexpr std::string_view kTempSuffix = "%tmp";

bool isPlainKeyChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

std::optional<uint8_t> hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return static_cast<uint8_t>(c - '0');
    }
    if (c >= 'A' && c <= 'F') {
        return static_cast<uint8_t>(10 + (c - 'A'));
    }
    return std::nullopt;
}

}  // namespace

std::string encodeKeyFileName(std::string_view key) {
    static constexpr char kHexDigits[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(key.size());
    for (const char c : key) {
        if (isPlainKeyChar(c)) {
            out.push_back(c);
            continue;
        }
        const auto byte = static_cast<uint8_t>(c);
        out.push_back('%');
        out.push_back(kHexDigits[(byte >> 4u) & 0x0Fu]);
        out.push_back(kHexDigits[byte & 0x0Fu]);
    }
    return out;
}

std::optional<std::string> decodeKeyFileName(std::string_view fileName) {
    if (fileName.empty()) {
        return std::nullopt;
    }

    std::string out;
    out.reserve(fileName.size());
    for (size_t i = 0; i < fileName.size(); ++i) {
        const char c = fileName[i];
        if (isPlainKeyChar(c)) {
            out.push_back(c);
            continue;
        }
        if (c != '%' || i + 2u >= fileName.size()) {
            return std::nullopt;
        }
        const auto hi = hexValue(fileName[i + 1u]);
        const auto lo = hexValue(fileName[i + 2u]);
        if (!hi.has_value() || !lo.has_value()) {
            return std::nullopt;
        }
        const auto byte = static_cast<uint8_t>((*hi << 4u) | *lo);
        if (isPlainKeyChar(static_cast<char>(byte))) {
            // Plain characters are never escaped; reject to keep the mapping one-to-one.
            return std::nullopt;
        }
        out.push_back(static_cast<char>(byte));
        i += 2u;
    }
    return out;
}

DirectoryKeyValueStore::DirectoryKeyValueStore(std::filesystem::path root) : root_(std::move(root)) {}

std::expected<DirectoryKeyValueStore, std::string> DirectoryKeyValueStore::open(const std::filesystem::path& root) {
    if (root.empty()) {
        return std::unexpected("Store directory path is empty");
    }

    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create store directory '{}': {}", root.string(), ec.message()));
    }
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return std::unexpected(std::format("Store path '{}' is not a directory", root.string()));
    }
    return DirectoryKeyValueStore(root);
}

std::filesystem::path DirectoryKeyValueStore::pathForKey(std::string_view key) const {
    return root_ / encodeKeyFileName(key);
}

std::expected<std::optional<std::vector<uint8_t>>, std::string> DirectoryKeyValueStore::get(std::string_view key) const {
    if (key.empty()) {
        return std::optional<std::vector<uint8_t>>{};
    }

    const auto path = pathForKey(key);
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return std::optional<std::vector<uint8_t>>{};
    }
    if (ec) {
        return std::unexpected(std::format("Failed to inspect '{}': {}", path.string(), ec.message()));
    }
    if (!std::filesystem::is_regular_file(status)) {
        return std::optional<std::vector<uint8_t>>{};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(std::format("Failed to open '{}'", path.string()));
    }
    std::vector<uint8_t> bytes(std::istreambuf_iterator<char>(file), {});
    if (file.bad()) {
        return std::unexpected(std::format("Failed while reading '{}'", path.string()));
    }
    return std::optional<std::vector<uint8_t>>{std::move(bytes)};
}

std::expected<void, std::string> DirectoryKeyValueStore::set(std::string_view key, std::span<const uint8_t> value) {
    if (key.empty()) {
        return std::unexpected("Store key must not be empty");
    }

    const auto path = pathForKey(key);
    auto tempPath = path;
    tempPath += std::string(kTempSuffix);

    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return std::unexpected(std::format("Failed to open '{}' for writing", tempPath.string()));
        }
        if (!value.empty()) {
            out.write(reinterpret_cast<const char*>(value.data()), static_cast<std::streamsize>(value.size()));
        }
        if (!out.good()) {
            std::error_code ec;
            std::filesystem::remove(tempPath, ec);
            return std::unexpected(std::format("Failed while writing '{}'", tempPath.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code cleanupEc;
        std::filesystem::remove(tempPath, cleanupEc);
        return std::unexpected(std::format("Failed to move '{}' into place: {}", path.string(), ec.message()));
    }
    return {};
}

std::expected<void, std::string> DirectoryKeyValueStore::remove(std::string_view key) {
    if (key.empty()) {
        return {};
    }

    const auto path = pathForKey(key);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to remove '{}': {}", path.string(), ec.message()));
    }
    return {};
}

std::expected<std::vector<std::string>, std::string> DirectoryKeyValueStore::listKeys() const {
    std::vector<std::string> keys;
    std::error_code ec;
    std::filesystem::directory_iterator it(root_, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to list '{}': {}", root_.string(), ec.message()));
    }

    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc) || entryEc) {
            continue;
        }
        if (auto key = decodeKeyFileName(it->path().filename().string()); key.has_value()) {
            keys.push_back(std::move(*key));
        }
    }
    if (ec) {
        return std::unexpected(std::format("Failed to list '{}': {}", root_.string(), ec.message()));
    }
    return keys;
}

}  // namespace acedaw::store

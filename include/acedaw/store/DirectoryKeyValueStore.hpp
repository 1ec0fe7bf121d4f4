#pragma once

#include "acedaw/store/KeyValueStore.hpp"

#include <filesystem>

namespace acedaw::store {

/// Stores each key as one file inside a directory. File names are the
/// percent-encoded key, so any key string maps to a portable file name.
class DirectoryKeyValueStore : public KeyValueStore {
public:
    /// Creates root if needed.
    static std::expected<DirectoryKeyValueStore, std::string> open(const std::filesystem::path& root);

    std::expected<std::optional<std::vector<uint8_t>>, std::string> get(std::string_view key) const override;
    std::expected<void, std::string> set(std::string_view key, std::span<const uint8_t> value) override;
    std::expected<void, std::string> remove(std::string_view key) override;
    std::expected<std::vector<std::string>, std::string> listKeys() const override;

    const std::filesystem::path& root() const { return root_; }

private:
    explicit DirectoryKeyValueStore(std::filesystem::path root);

    std::filesystem::path pathForKey(std::string_view key) const;

    std::filesystem::path root_;
};

std::string encodeKeyFileName(std::string_view key);

/// Returns std::nullopt for names that encodeKeyFileName() cannot have produced.
std::optional<std::string> decodeKeyFileName(std::string_view fileName);

}  // namespace acedaw::store

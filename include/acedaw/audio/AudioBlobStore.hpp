#pragma once

#include "acedaw/audio/AudioBlobKey.hpp"
#include "acedaw/store/KeyValueStore.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace acedaw::audio {

/// Raw audio payloads (WAV bytes) stored under AudioBlobKey addresses.
class AudioBlobStore {
public:
    explicit AudioBlobStore(store::KeyValueStore& store);

    /// Returns the store key the payload was written under.
    std::expected<std::string, std::string> save(const AudioBlobKey& key, std::span<const uint8_t> payload);

    std::expected<std::optional<std::vector<uint8_t>>, std::string> load(const AudioBlobKey& key) const;

    /// For raw keys taken from an archive manifest.
    std::expected<std::optional<std::vector<uint8_t>>, std::string> loadByKey(std::string_view key) const;

    std::expected<void, std::string> remove(const AudioBlobKey& key);

    std::expected<void, std::string> removeByKey(std::string_view key);

    /// Removes every blob of the project; returns how many keys were removed.
    std::expected<size_t, std::string> removeAllForProject(std::string_view projectId);

    /// Keys of the project's blobs, sorted ascending.
    std::expected<std::vector<std::string>, std::string> keysForProject(std::string_view projectId) const;

private:
    store::KeyValueStore& store_;
};

}  // namespace acedaw::audio

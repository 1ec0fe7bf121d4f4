#include "acedaw/audio/AudioBlobStore.hpp"

#include "acedaw/common/Logger.hpp"

#include <algorithm>
#include <format>

namespace acedaw::audio {

AudioBlobStore::AudioBlobStore(store::KeyValueStore& store) : store_(store) {}

std::expected<std::string, std::string> AudioBlobStore::save(const AudioBlobKey& key,
                                                             std::span<const uint8_t> payload) {
    auto storeKey = formatAudioBlobKey(key);
    if (!storeKey.has_value()) {
        return std::unexpected(storeKey.error());
    }
    if (auto written = store_.set(*storeKey, payload); !written.has_value()) {
        return std::unexpected(written.error());
    }
    return *storeKey;
}

std::expected<std::optional<std::vector<uint8_t>>, std::string> AudioBlobStore::load(const AudioBlobKey& key) const {
    auto storeKey = formatAudioBlobKey(key);
    if (!storeKey.has_value()) {
        return std::unexpected(storeKey.error());
    }
    return store_.get(*storeKey);
}

std::expected<std::optional<std::vector<uint8_t>>, std::string> AudioBlobStore::loadByKey(std::string_view key) const {
    return store_.get(key);
}

std::expected<void, std::string> AudioBlobStore::remove(const AudioBlobKey& key) {
    auto storeKey = formatAudioBlobKey(key);
    if (!storeKey.has_value()) {
        return std::unexpected(storeKey.error());
    }
    return store_.remove(*storeKey);
}

std::expected<void, std::string> AudioBlobStore::removeByKey(std::string_view key) {
    return store_.remove(key);
}

std::expected<size_t, std::string> AudioBlobStore::removeAllForProject(std::string_view projectId) {
    auto keys = keysForProject(projectId);
    if (!keys.has_value()) {
        return std::unexpected(keys.error());
    }

    // Keys are disjoint, so a failed removal does not stop the others.
    size_t removed = 0;
    std::optional<std::string> firstError;
    for (const auto& key : *keys) {
        if (auto result = store_.remove(key); !result.has_value()) {
            common::Logger::logError(std::format("Failed to remove audio blob '{}': {}", key, result.error()));
            if (!firstError.has_value()) {
                firstError = result.error();
            }
            continue;
        }
        ++removed;
    }

    if (firstError.has_value()) {
        return std::unexpected(*firstError);
    }
    return removed;
}

std::expected<std::vector<std::string>, std::string> AudioBlobStore::keysForProject(std::string_view projectId) const {
    // A delimiter in the id would make the prefix reach into another project's clips.
    if (projectId.empty() || projectId.find(kAudioKeyDelimiter) != std::string_view::npos) {
        return std::unexpected(std::format("Invalid project id '{}' for an audio key", projectId));
    }

    auto keys = store_.listKeys();
    if (!keys.has_value()) {
        return std::unexpected(keys.error());
    }

    const auto prefix = audioKeyPrefix(projectId);
    std::vector<std::string> matching;
    for (auto& key : *keys) {
        if (key.starts_with(prefix)) {
            matching.push_back(std::move(key));
        }
    }
    std::sort(matching.begin(), matching.end());
    return matching;
}

}  // namespace acedaw::audio

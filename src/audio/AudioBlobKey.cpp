#include "acedaw/audio/AudioBlobKey.hpp"

#include <format>

namespace acedaw::audio {
namespace {

constexpr std::string_view kCumulativeName = "cumulative";
constexpr std::string_view kIsolatedName = "isolated";

bool isValidComponent(std::string_view component) {
    return !component.empty() && component.find(kAudioKeyDelimiter) == std::string_view::npos;
}

}  // namespace

std::string_view audioVariantName(AudioVariant variant) {
    switch (variant) {
    case AudioVariant::Cumulative:
        return kCumulativeName;
    case AudioVariant::Isolated:
        return kIsolatedName;
    }
    return kCumulativeName;
}

std::optional<AudioVariant> parseAudioVariant(std::string_view name) {
    if (name == kCumulativeName) {
        return AudioVariant::Cumulative;
    }
    if (name == kIsolatedName) {
        return AudioVariant::Isolated;
    }
    return std::nullopt;
}

std::expected<std::string, std::string> formatAudioBlobKey(const AudioBlobKey& key) {
    if (!isValidComponent(key.projectId)) {
        return std::unexpected(std::format("Invalid project id '{}' for an audio key", key.projectId));
    }
    if (!isValidComponent(key.clipId)) {
        return std::unexpected(std::format("Invalid clip id '{}' for an audio key", key.clipId));
    }
    return std::format("{}{}{}{}{}{}", kAudioKeyPrefix, key.projectId, kAudioKeyDelimiter, key.clipId,
                       kAudioKeyDelimiter, audioVariantName(key.variant));
}

std::optional<AudioBlobKey> parseAudioBlobKey(std::string_view key) {
    if (!key.starts_with(kAudioKeyPrefix)) {
        return std::nullopt;
    }
    key.remove_prefix(kAudioKeyPrefix.size());

    const size_t projectEnd = key.find(kAudioKeyDelimiter);
    if (projectEnd == std::string_view::npos) {
        return std::nullopt;
    }
    const size_t clipEnd = key.find(kAudioKeyDelimiter, projectEnd + 1u);
    if (clipEnd == std::string_view::npos) {
        return std::nullopt;
    }

    const std::string_view projectId = key.substr(0, projectEnd);
    const std::string_view clipId = key.substr(projectEnd + 1u, clipEnd - projectEnd - 1u);
    const auto variant = parseAudioVariant(key.substr(clipEnd + 1u));
    if (!isValidComponent(projectId) || !isValidComponent(clipId) || !variant.has_value()) {
        return std::nullopt;
    }

    return AudioBlobKey{std::string(projectId), std::string(clipId), *variant};
}

std::string audioKeyPrefix(std::string_view projectId) {
    return std::format("{}{}{}", kAudioKeyPrefix, projectId, kAudioKeyDelimiter);
}

}  // namespace acedaw::audio

#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace acedaw::audio {

enum class AudioVariant : uint8_t {
    Cumulative,  // all layers up to and including the clip's layer
    Isolated,    // the clip's layer alone
};

std::string_view audioVariantName(AudioVariant variant);

std::optional<AudioVariant> parseAudioVariant(std::string_view name);

/// Address of one audio payload: "audio:<projectId>:<clipId>:<variant>".
struct AudioBlobKey {
    std::string projectId;
    std::string clipId;
    AudioVariant variant = AudioVariant::Cumulative;

    bool operator==(const AudioBlobKey&) const = default;
};

inline constexpr std::string_view kAudioKeyPrefix = "audio:";
inline constexpr char kAudioKeyDelimiter = ':';

/// Fails when a component is empty or contains the delimiter, since such keys
/// could collide or not split back into the same components.
std::expected<std::string, std::string> formatAudioBlobKey(const AudioBlobKey& key);

std::optional<AudioBlobKey> parseAudioBlobKey(std::string_view key);

/// "audio:<projectId>:" - every key of the project's blobs starts with this.
std::string audioKeyPrefix(std::string_view projectId);

}  // namespace acedaw::audio

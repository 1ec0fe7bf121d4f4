#pragma once

#include "acedaw/audio/AudioBuffer.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace acedaw::audio {

/// Decodes a WAV payload at its native rate and channel count.
std::expected<AudioBuffer, std::string> decodeWav(std::span<const uint8_t> wavBytes);

/// Writes 32-bit float WAV so out-of-range samples survive unclipped.
std::expected<std::vector<uint8_t>, std::string> encodeWav(const AudioBuffer& buffer);

}  // namespace acedaw::audio

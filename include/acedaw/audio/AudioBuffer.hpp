#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace acedaw::audio {

/// Planar float audio. Every channel of a buffer has the same number of frames.
struct AudioBuffer {
    uint32_t sampleRate = 0;
    std::vector<std::vector<float>> channels;

    size_t channelCount() const { return channels.size(); }

    size_t frameCount() const { return channels.empty() ? 0 : channels.front().size(); }

    bool operator==(const AudioBuffer&) const = default;
};

}  // namespace acedaw::audio

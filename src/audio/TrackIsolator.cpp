#include "acedaw/audio/TrackIsolator.hpp"

#include <algorithm>
#include <utility>

namespace acedaw::audio {

AudioBuffer isolateTrack(const AudioBuffer& currentMix, const AudioBuffer* previousMix) {
    if (previousMix == nullptr) {
        return currentMix;
    }

    AudioBuffer isolated;
    isolated.sampleRate = currentMix.sampleRate;
    isolated.channels.reserve(currentMix.channels.size());

    for (size_t ch = 0; ch < currentMix.channels.size(); ++ch) {
        std::vector<float> out = currentMix.channels[ch];
        if (ch < previousMix->channels.size()) {
            const auto& prev = previousMix->channels[ch];
            const size_t overlap = std::min(out.size(), prev.size());
            for (size_t i = 0; i < overlap; ++i) {
                out[i] -= prev[i];
            }
        }
        isolated.channels.push_back(std::move(out));
    }
    return isolated;
}

}  // namespace acedaw::audio

#pragma once

#include "acedaw/audio/AudioBuffer.hpp"

namespace acedaw::audio {

/// Derives one layer's signal from two cumulative mixes: currentMix minus
/// previousMix, sample by sample. Channels or frames missing from previousMix
/// count as silence. A null previousMix (first layer) returns currentMix as is.
/// The result keeps currentMix's sample rate, channel count and length and is
/// neither clipped nor normalized.
AudioBuffer isolateTrack(const AudioBuffer& currentMix, const AudioBuffer* previousMix);

}  // namespace acedaw::audio

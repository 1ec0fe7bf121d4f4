#include "acedaw/audio/WavCodec.hpp"

#include <cstring>
#include <format>
#include <utility>
#include <vector>

#define MA_NO_DEVICE_IO
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

namespace acedaw::audio {
namespace {

constexpr ma_uint64 kDecodeChunkFrames = 4096;

/// Growable in-memory target for ma_encoder. The WAV writer seeks back to
/// patch chunk sizes when it is finalized.
struct MemorySink {
    std::vector<uint8_t> bytes;
    size_t cursor = 0;
};

ma_result onSinkWrite(ma_encoder* encoder, const void* bufferIn, size_t bytesToWrite, size_t* bytesWritten) {
    auto* sink = static_cast<MemorySink*>(encoder->pUserData);
    if (sink->cursor + bytesToWrite > sink->bytes.size()) {
        sink->bytes.resize(sink->cursor + bytesToWrite);
    }
    if (bytesToWrite > 0) {
        std::memcpy(sink->bytes.data() + sink->cursor, bufferIn, bytesToWrite);
    }
    sink->cursor += bytesToWrite;
    if (bytesWritten != nullptr) {
        *bytesWritten = bytesToWrite;
    }
    return MA_SUCCESS;
}

ma_result onSinkSeek(ma_encoder* encoder, ma_int64 offset, ma_seek_origin origin) {
    auto* sink = static_cast<MemorySink*>(encoder->pUserData);
    ma_int64 base = 0;
    if (origin == ma_seek_origin_current) {
        base = static_cast<ma_int64>(sink->cursor);
    } else if (origin == ma_seek_origin_end) {
        base = static_cast<ma_int64>(sink->bytes.size());
    }

    const ma_int64 target = base + offset;
    if (target < 0) {
        return MA_INVALID_ARGS;
    }
    sink->cursor = static_cast<size_t>(target);
    if (sink->cursor > sink->bytes.size()) {
        sink->bytes.resize(sink->cursor);
    }
    return MA_SUCCESS;
}

}  // namespace

std::expected<AudioBuffer, std::string> decodeWav(std::span<const uint8_t> wavBytes) {
    if (wavBytes.empty()) {
        return std::unexpected("WAV payload is empty");
    }

    // Zero channels/rate keeps the file's native layout.
    ma_decoder_config decoderConfig = ma_decoder_config_init(ma_format_f32, 0, 0);
    decoderConfig.encodingFormat = ma_encoding_format_wav;
    ma_decoder decoder{};

    const ma_result initResult = ma_decoder_init_memory(wavBytes.data(), wavBytes.size(), &decoderConfig, &decoder);
    if (initResult != MA_SUCCESS) {
        return std::unexpected(std::format("Failed to decode WAV payload (miniaudio error {})",
                                           static_cast<int>(initResult)));
    }

    const ma_uint32 channelCount = decoder.outputChannels;
    if (channelCount == 0) {
        ma_decoder_uninit(&decoder);
        return std::unexpected("Decoded WAV has no channels");
    }

    AudioBuffer buffer;
    buffer.sampleRate = decoder.outputSampleRate;
    buffer.channels.resize(channelCount);

    std::vector<float> chunk(static_cast<size_t>(kDecodeChunkFrames) * channelCount);
    while (true) {
        ma_uint64 framesRead = 0;
        const ma_result readResult = ma_decoder_read_pcm_frames(&decoder, chunk.data(), kDecodeChunkFrames, &framesRead);
        if (readResult != MA_SUCCESS && readResult != MA_AT_END) {
            ma_decoder_uninit(&decoder);
            return std::unexpected(std::format("Error while decoding WAV data (miniaudio error {})",
                                               static_cast<int>(readResult)));
        }

        for (ma_uint64 frame = 0; frame < framesRead; ++frame) {
            for (ma_uint32 ch = 0; ch < channelCount; ++ch) {
                buffer.channels[ch].push_back(chunk[static_cast<size_t>(frame) * channelCount + ch]);
            }
        }

        if (framesRead == 0 || readResult == MA_AT_END) {
            break;
        }
    }

    ma_decoder_uninit(&decoder);
    return buffer;
}

std::expected<std::vector<uint8_t>, std::string> encodeWav(const AudioBuffer& buffer) {
    if (buffer.channels.empty()) {
        return std::unexpected("Cannot encode WAV without channels");
    }
    if (buffer.sampleRate == 0) {
        return std::unexpected("Cannot encode WAV with a zero sample rate");
    }

    const size_t frameCount = buffer.frameCount();
    for (const auto& channel : buffer.channels) {
        if (channel.size() != frameCount) {
            return std::unexpected("Cannot encode WAV: channels have different lengths");
        }
    }

    const auto channelCount = static_cast<ma_uint32>(buffer.channels.size());
    std::vector<float> interleaved(frameCount * channelCount);
    for (size_t frame = 0; frame < frameCount; ++frame) {
        for (ma_uint32 ch = 0; ch < channelCount; ++ch) {
            interleaved[frame * channelCount + ch] = buffer.channels[ch][frame];
        }
    }

    MemorySink sink;
    ma_encoder_config encoderConfig =
        ma_encoder_config_init(ma_encoding_format_wav, ma_format_f32, channelCount, buffer.sampleRate);
    ma_encoder encoder{};
    const ma_result initResult = ma_encoder_init(onSinkWrite, onSinkSeek, &sink, &encoderConfig, &encoder);
    if (initResult != MA_SUCCESS) {
        return std::unexpected(std::format("Failed to start WAV encoder (miniaudio error {})",
                                           static_cast<int>(initResult)));
    }

    ma_uint64 framesWritten = 0;
    const ma_result writeResult = ma_encoder_write_pcm_frames(&encoder, interleaved.data(),
                                                              static_cast<ma_uint64>(frameCount), &framesWritten);
    ma_encoder_uninit(&encoder);
    if (writeResult != MA_SUCCESS || framesWritten != frameCount) {
        return std::unexpected(std::format("Failed while encoding WAV data (miniaudio error {})",
                                           static_cast<int>(writeResult)));
    }

    return std::move(sink.bytes);
}

}  // namespace acedaw::audio

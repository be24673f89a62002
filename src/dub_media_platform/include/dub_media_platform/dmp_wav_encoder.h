#pragma once

#include "dmp_audio.h"
#include "dmp_encoded_asset.h"
#include "dmp_errors.h"
#include <cstdint>

namespace dmp {

// RIFF/WAVE layout constants (canonical 44-byte header, no extra chunks)
namespace wav_format {
    constexpr uint32_t HEADER_BYTES = 44;
    constexpr uint32_t FMT_CHUNK_BYTES = 16;
    constexpr uint16_t FORMAT_PCM = 1;
    constexpr uint16_t BITS_PER_SAMPLE = 16;
    constexpr const char* MIME_TYPE = "audio/wav";
    constexpr const char* EXTENSION = "wav";
}

// Container encoder: float track -> 16-bit linear PCM WAV bytes.
//
// Per sample: clamp to [-1, 1], scale negatives by 32768 and non-negatives by
// 32767, truncate toward zero. Samples are interleaved by channel,
// little-endian, in frame order. Payload = frames * channels * 2 bytes and
// every length field is derived from it exactly.
// Pure and deterministic: the same buffer always produces identical bytes.
class WavEncoder {
public:
    static Result<EncodedAudioAsset> Encode(const AudioBuffer& track);

    // Float -> int16 conversion used for every sample (NaN encodes as 0)
    static int16_t QuantizeSample(float sample);
};

} // namespace dmp

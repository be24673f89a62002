#pragma once

#include "dmp_audio.h"
#include "dmp_errors.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dmp {

// Raw PCM frame decoder.
// Input is 16-bit signed little-endian samples, interleaved by channel.
// Output sample = s / 32768.0 (range [-1.0, 0.99997]).
// A trailing partial frame (or odd trailing byte) is dropped silently.
// No resampling and no format sniffing: the caller states the format.
class PcmDecoder {
public:
    static Result<AudioBuffer> DecodeS16LE(const uint8_t* data, size_t size,
                                           const AudioFormat& format);

    // Decode one synthesized clip and anchor it at `start_time` seconds
    static Result<DecodedSegment> Decode(const std::vector<uint8_t>& raw,
                                         double start_time,
                                         const AudioFormat& format = synthesis_format::FORMAT);
};

} // namespace dmp

#include <dub_media_platform/dmp_pcm_decoder.h>
#include <cmath>

namespace dmp {

Result<AudioBuffer> PcmDecoder::DecodeS16LE(const uint8_t* data, size_t size,
                                             const AudioFormat& format) {
    if (format.channels <= 0 || format.sample_rate <= 0) {
        return Error::invalid_arg("PcmDecoder: channel count and sample rate must be positive");
    }
    if (size > 0 && !data) {
        return Error::invalid_arg("PcmDecoder: null data with non-zero size");
    }

    const size_t total_samples = size / synthesis_format::BYTES_PER_SAMPLE;
    const size_t channels = static_cast<size_t>(format.channels);
    const int64_t frames = static_cast<int64_t>(total_samples / channels);

    auto alloc = AudioBuffer::Allocate(format, frames);
    if (alloc.is_error()) {
        return alloc.error();
    }
    AudioBuffer buffer = std::move(alloc.value());

    for (size_t ch = 0; ch < channels; ++ch) {
        float* out = buffer.channel_data(static_cast<int32_t>(ch));
        for (int64_t i = 0; i < frames; ++i) {
            const size_t byte = (static_cast<size_t>(i) * channels + ch) * 2;
            const uint16_t raw = static_cast<uint16_t>(data[byte]) |
                                 static_cast<uint16_t>(data[byte + 1] << 8);
            out[i] = static_cast<float>(static_cast<int16_t>(raw) / 32768.0);
        }
    }

    return buffer;
}

Result<DecodedSegment> PcmDecoder::Decode(const std::vector<uint8_t>& raw,
                                          double start_time,
                                          const AudioFormat& format) {
    if (!std::isfinite(start_time) || start_time < 0.0) {
        return Error::invalid_arg("Segment start time must be a finite, non-negative number of seconds");
    }

    auto decoded = DecodeS16LE(raw.data(), raw.size(), format);
    if (decoded.is_error()) {
        return decoded.error();
    }
    return DecodedSegment{std::move(decoded.value()), start_time};
}

} // namespace dmp

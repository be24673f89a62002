#include <dub_media_platform/dmp_wav_encoder.h>
#include "impl/dmp_log.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <new>
#include <string>
#include <vector>

namespace dmp {

namespace {

// Little-endian writer over a pre-sized byte vector
class ByteWriter {
public:
    explicit ByteWriter(std::vector<uint8_t>& out) : m_out(out), m_pos(0) {}

    void tag(const char (&fourcc)[5]) {
        for (int i = 0; i < 4; ++i) {
            m_out[m_pos++] = static_cast<uint8_t>(fourcc[i]);
        }
    }
    void u16(uint16_t v) {
        m_out[m_pos++] = static_cast<uint8_t>(v & 0xFF);
        m_out[m_pos++] = static_cast<uint8_t>((v >> 8) & 0xFF);
    }
    void u32(uint32_t v) {
        u16(static_cast<uint16_t>(v & 0xFFFF));
        u16(static_cast<uint16_t>((v >> 16) & 0xFFFF));
    }
    void i16(int16_t v) { u16(static_cast<uint16_t>(v)); }

    size_t pos() const { return m_pos; }

private:
    std::vector<uint8_t>& m_out;
    size_t m_pos;
};

} // namespace

int16_t WavEncoder::QuantizeSample(float sample) {
    if (std::isnan(sample)) {
        return 0;
    }
    const double clamped = std::max(-1.0, std::min(1.0, static_cast<double>(sample)));
    const double scaled = clamped < 0.0 ? clamped * 32768.0 : clamped * 32767.0;
    return static_cast<int16_t>(scaled);  // truncates toward zero
}

Result<EncodedAudioAsset> WavEncoder::Encode(const AudioBuffer& track) {
    const int32_t channels = track.channels();
    const int32_t sample_rate = track.sample_rate();
    if (channels <= 0 || channels > std::numeric_limits<uint16_t>::max() / 2) {
        return Error::invalid_arg("WavEncoder: unsupported channel count " + std::to_string(channels));
    }
    if (sample_rate <= 0) {
        return Error::invalid_arg("WavEncoder: sample rate must be positive");
    }

    const uint64_t block_align = static_cast<uint64_t>(channels) * (wav_format::BITS_PER_SAMPLE / 8);
    const uint64_t data_bytes = static_cast<uint64_t>(track.frames()) * block_align;
    const uint64_t riff_bytes = data_bytes + (wav_format::HEADER_BYTES - 8);
    if (riff_bytes > std::numeric_limits<uint32_t>::max()) {
        return Error::resource_exhausted(
            "WAV payload of " + std::to_string(data_bytes) + " bytes exceeds the 32-bit RIFF limit");
    }
    const uint64_t byte_rate = static_cast<uint64_t>(sample_rate) * block_align;
    if (byte_rate > std::numeric_limits<uint32_t>::max()) {
        return Error::invalid_arg("WavEncoder: byte rate does not fit the fmt chunk");
    }

    std::vector<uint8_t> bytes;
    try {
        bytes.resize(static_cast<size_t>(wav_format::HEADER_BYTES + data_bytes));
    } catch (const std::bad_alloc&) {
        return Error::resource_exhausted("Cannot allocate " + std::to_string(data_bytes) +
                                         " bytes for WAV payload");
    }

    ByteWriter w(bytes);

    // RIFF header
    w.tag("RIFF");
    w.u32(static_cast<uint32_t>(riff_bytes));
    w.tag("WAVE");

    // fmt chunk
    w.tag("fmt ");
    w.u32(wav_format::FMT_CHUNK_BYTES);
    w.u16(wav_format::FORMAT_PCM);
    w.u16(static_cast<uint16_t>(channels));
    w.u32(static_cast<uint32_t>(sample_rate));
    w.u32(static_cast<uint32_t>(byte_rate));
    w.u16(static_cast<uint16_t>(block_align));
    w.u16(wav_format::BITS_PER_SAMPLE);

    // data chunk
    w.tag("data");
    w.u32(static_cast<uint32_t>(data_bytes));

    for (int64_t i = 0; i < track.frames(); ++i) {
        for (int32_t ch = 0; ch < channels; ++ch) {
            w.i16(QuantizeSample(track.channel_data(ch)[i]));
        }
    }

    if (w.pos() != bytes.size()) {
        return Error::internal("WavEncoder: wrote " + std::to_string(w.pos()) +
                               " bytes, expected " + std::to_string(bytes.size()));
    }

    DMP_LOG_DEBUG("Encoded %lld frames x %d ch @ %d Hz -> %zu bytes",
                  static_cast<long long>(track.frames()), channels, sample_rate, bytes.size());

    return EncodedAudioAsset(std::move(bytes), wav_format::MIME_TYPE, wav_format::EXTENSION);
}

} // namespace dmp

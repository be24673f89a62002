#pragma once

#include "dmp_errors.h"
#include "dmp_time.h"
#include <cstdint>
#include <vector>

namespace dmp {

// Audio format descriptor (samples are always float32, planar, in memory)
struct AudioFormat {
    int32_t sample_rate;
    int32_t channels;

    bool operator==(const AudioFormat& other) const {
        return sample_rate == other.sample_rate && channels == other.channels;
    }
    bool operator!=(const AudioFormat& other) const { return !(*this == other); }
};

// Fixed format of the speech-synthesis collaborator's output and of the dub track
namespace synthesis_format {
    constexpr int32_t SAMPLE_RATE = 24000;
    constexpr int32_t CHANNELS = 1;
    constexpr int32_t BYTES_PER_SAMPLE = 2;  // 16-bit signed little-endian
    constexpr AudioFormat FORMAT = {SAMPLE_RATE, CHANNELS};
}

// Planar multi-channel float buffer.
// Every channel holds exactly frames() samples.
class AudioBuffer {
public:
    AudioBuffer();

    // Takes ownership of per-channel sample vectors (all must be the same length)
    AudioBuffer(AudioFormat format, std::vector<std::vector<float>> channels);

    // Zero-initialized buffer of `frames` frames per channel.
    // ResourceExhausted if the allocation cannot be satisfied.
    static Result<AudioBuffer> Allocate(const AudioFormat& format, int64_t frames);

    const AudioFormat& format() const { return m_format; }
    int32_t sample_rate() const { return m_format.sample_rate; }
    int32_t channels() const { return m_format.channels; }
    int64_t frames() const { return m_frames; }
    bool empty() const { return m_frames == 0; }

    // Duration in seconds (frames / sample_rate)
    double duration_seconds() const;

    float* channel_data(int32_t channel);
    const float* channel_data(int32_t channel) const;
    const std::vector<float>& channel(int32_t channel) const;

    // Sum `src` into this buffer starting at frame `offset`, per channel.
    // Overlapping material adds; nothing is clamped here.
    // Precondition: same format, offset >= 0, offset + src.frames() <= frames().
    void mix_in(const AudioBuffer& src, int64_t offset);

    // Frame-ordered interleaved copy (frame 0 ch 0, frame 0 ch 1, ...)
    std::vector<float> interleaved() const;

private:
    AudioFormat m_format;
    int64_t m_frames;
    std::vector<std::vector<float>> m_channels;
};

// The composite output of the timeline compositor
using CompositeTrack = AudioBuffer;

// One synthesized clip plus its anchor on the output timeline.
// Immutable once constructed.
class TimedSegmentRequest {
public:
    TimedSegmentRequest(std::vector<uint8_t> audio_bytes, double start_time)
        : m_audio_bytes(std::move(audio_bytes)), m_start_time(start_time) {}

    const std::vector<uint8_t>& audio_bytes() const { return m_audio_bytes; }
    double start_time() const { return m_start_time; }

private:
    std::vector<uint8_t> m_audio_bytes;
    double m_start_time;
};

// Decoded clip, owned by the compositor call that produced it
struct DecodedSegment {
    AudioBuffer samples;
    double start_time;

    double end_time() const { return start_time + samples.duration_seconds(); }
};

} // namespace dmp

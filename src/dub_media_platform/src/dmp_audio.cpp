#include <dub_media_platform/dmp_audio.h>
#include <algorithm>
#include <cassert>
#include <new>
#include <string>

namespace dmp {

AudioBuffer::AudioBuffer()
    : m_format{synthesis_format::SAMPLE_RATE, synthesis_format::CHANNELS}
    , m_frames(0)
    , m_channels(static_cast<size_t>(synthesis_format::CHANNELS)) {
}

AudioBuffer::AudioBuffer(AudioFormat format, std::vector<std::vector<float>> channels)
    : m_format(format)
    , m_frames(channels.empty() ? 0 : static_cast<int64_t>(channels.front().size()))
    , m_channels(std::move(channels)) {
    assert(m_format.channels > 0 && "AudioBuffer: channel count must be positive");
    assert(m_format.sample_rate > 0 && "AudioBuffer: sample rate must be positive");
    assert(static_cast<int32_t>(m_channels.size()) == m_format.channels &&
           "AudioBuffer: channel vector count does not match format");
    for (const auto& ch : m_channels) {
        assert(static_cast<int64_t>(ch.size()) == m_frames &&
               "AudioBuffer: channels have different lengths");
        (void)ch;
    }
}

Result<AudioBuffer> AudioBuffer::Allocate(const AudioFormat& format, int64_t frames) {
    if (format.channels <= 0 || format.sample_rate <= 0) {
        return Error::invalid_arg("AudioBuffer::Allocate: invalid format");
    }
    if (frames < 0) {
        return Error::invalid_arg("AudioBuffer::Allocate: negative frame count");
    }

    std::vector<std::vector<float>> channels;
    try {
        channels.resize(static_cast<size_t>(format.channels));
        for (auto& ch : channels) {
            ch.assign(static_cast<size_t>(frames), 0.0f);
        }
    } catch (const std::bad_alloc&) {
        return Error::resource_exhausted(
            "Cannot allocate " + std::to_string(frames) + " frames x " +
            std::to_string(format.channels) + " channels");
    } catch (const std::length_error&) {
        return Error::resource_exhausted(
            "Frame count " + std::to_string(frames) + " exceeds addressable memory");
    }

    return AudioBuffer(format, std::move(channels));
}

double AudioBuffer::duration_seconds() const {
    return frames_to_seconds(m_frames, m_format.sample_rate);
}

float* AudioBuffer::channel_data(int32_t channel) {
    assert(channel >= 0 && channel < m_format.channels);
    return m_channels[static_cast<size_t>(channel)].data();
}

const float* AudioBuffer::channel_data(int32_t channel) const {
    assert(channel >= 0 && channel < m_format.channels);
    return m_channels[static_cast<size_t>(channel)].data();
}

const std::vector<float>& AudioBuffer::channel(int32_t channel) const {
    assert(channel >= 0 && channel < m_format.channels);
    return m_channels[static_cast<size_t>(channel)];
}

void AudioBuffer::mix_in(const AudioBuffer& src, int64_t offset) {
    assert(src.format() == m_format && "mix_in: format mismatch");
    assert(offset >= 0 && offset + src.frames() <= m_frames && "mix_in: source exceeds destination");

    for (int32_t ch = 0; ch < m_format.channels; ++ch) {
        const float* in = src.channel_data(ch);
        float* out = channel_data(ch) + offset;
        for (int64_t i = 0; i < src.frames(); ++i) {
            out[i] += in[i];
        }
    }
}

std::vector<float> AudioBuffer::interleaved() const {
    const size_t channels = static_cast<size_t>(m_format.channels);
    std::vector<float> out(static_cast<size_t>(m_frames) * channels);
    for (size_t ch = 0; ch < channels; ++ch) {
        const auto& src = m_channels[ch];
        for (size_t i = 0; i < src.size(); ++i) {
            out[i * channels + ch] = src[i];
        }
    }
    return out;
}

} // namespace dmp

#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libavutil/opt.h>
}

#include <dub_media_platform/dmp_errors.h>
#include <dub_media_platform/dmp_audio.h>

namespace dmp {
namespace impl {

// SwrContext wrapper for audio resampling
// Converts any input format to float32 interleaved at the target format
class FFmpegResampleContext {
public:
    FFmpegResampleContext() = default;
    ~FFmpegResampleContext();

    // Non-copyable
    FFmpegResampleContext(const FFmpegResampleContext&) = delete;
    FFmpegResampleContext& operator=(const FFmpegResampleContext&) = delete;

    // Move semantics
    FFmpegResampleContext(FFmpegResampleContext&& other) noexcept;
    FFmpegResampleContext& operator=(FFmpegResampleContext&& other) noexcept;

    // Initialize for conversion from source format to `dst`
    Result<void> init(int src_sample_rate, const AVChannelLayout* src_ch_layout,
                      AVSampleFormat src_sample_fmt, const AudioFormat& dst);

    // Resample audio data into interleaved float.
    // Returns frames written per channel, or a negative AVERROR.
    int64_t convert(const uint8_t* const* src_data, int src_samples,
                    float* dst_data, int64_t dst_max_samples);

    // Drain samples buffered inside the resampler (same return convention)
    int64_t flush(float* dst_data, int64_t dst_max_samples);

    // Upper bound on output frames for `in_samples` more input frames
    int64_t get_out_samples(int in_samples) const;

    int dst_channels() const { return m_dst_channels; }

private:
    SwrContext* m_swr_ctx = nullptr;
    int m_dst_sample_rate = 0;
    int m_dst_channels = 0;
};

} // namespace impl
} // namespace dmp

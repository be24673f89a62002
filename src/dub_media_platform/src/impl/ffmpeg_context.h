#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
}

#include <dub_media_platform/dmp_errors.h>
#include <dub_media_platform/dmp_time.h>
#include <string>

namespace dmp {
namespace impl {

// Convert FFmpeg error code to DMP Error
Error ffmpeg_error(int errnum, const std::string& context);

// FFmpeg format context wrapper (for MediaFile)
class FFmpegFormatContext {
public:
    FFmpegFormatContext() = default;
    ~FFmpegFormatContext();

    // Non-copyable
    FFmpegFormatContext(const FFmpegFormatContext&) = delete;
    FFmpegFormatContext& operator=(const FFmpegFormatContext&) = delete;

    // Move semantics
    FFmpegFormatContext(FFmpegFormatContext&& other) noexcept;
    FFmpegFormatContext& operator=(FFmpegFormatContext&& other) noexcept;

    // Open a file and read stream info
    Result<void> open(const std::string& path);

    // Find best video / audio stream (returns -1 if none, does not error)
    int find_video_stream();
    int find_audio_stream();

    AVFormatContext* get() const { return m_fmt_ctx; }
    int video_stream_index() const { return m_video_stream_idx; }
    int audio_stream_index() const { return m_audio_stream_idx; }
    AVStream* video_stream() const;
    AVStream* audio_stream() const;
    AVCodecParameters* video_codec_params() const;
    AVCodecParameters* audio_codec_params() const;

private:
    AVFormatContext* m_fmt_ctx = nullptr;
    int m_video_stream_idx = -1;
    int m_audio_stream_idx = -1;
};

// FFmpeg codec context wrapper (software decode only)
class FFmpegCodecContext {
public:
    FFmpegCodecContext() = default;
    ~FFmpegCodecContext();

    // Non-copyable
    FFmpegCodecContext(const FFmpegCodecContext&) = delete;
    FFmpegCodecContext& operator=(const FFmpegCodecContext&) = delete;

    // Move semantics
    FFmpegCodecContext(FFmpegCodecContext&& other) noexcept;
    FFmpegCodecContext& operator=(FFmpegCodecContext&& other) noexcept;

    // Initialize from codec parameters
    Result<void> init(AVCodecParameters* params);

    AVCodecContext* get() const { return m_codec_ctx; }

private:
    AVCodecContext* m_codec_ctx = nullptr;
};

// Convert stream PTS to microseconds
TimeUS stream_pts_to_us(int64_t pts, AVStream* stream);

} // namespace impl
} // namespace dmp

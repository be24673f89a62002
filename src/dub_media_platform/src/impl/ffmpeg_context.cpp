#include "ffmpeg_context.h"
#include <cassert>

namespace dmp {
namespace impl {

Error ffmpeg_error(int errnum, const std::string& context) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, errbuf, sizeof(errbuf));
    std::string msg = context + ": " + errbuf;

    // Map FFmpeg errors to DMP errors
    if (errnum == AVERROR(ENOENT)) {
        return Error::file_not_found(msg);
    } else if (errnum == AVERROR(ENOMEM)) {
        return Error::resource_exhausted(msg);
    } else if (errnum == AVERROR_INVALIDDATA || errnum == AVERROR(EINVAL)) {
        return Error::unsupported(msg);
    } else if (errnum == AVERROR_DECODER_NOT_FOUND) {
        return Error::unsupported("No decoder found: " + context);
    }
    return Error::internal(msg);
}

// FFmpegFormatContext implementation

FFmpegFormatContext::~FFmpegFormatContext() {
    if (m_fmt_ctx) {
        avformat_close_input(&m_fmt_ctx);
    }
}

FFmpegFormatContext::FFmpegFormatContext(FFmpegFormatContext&& other) noexcept
    : m_fmt_ctx(other.m_fmt_ctx),
      m_video_stream_idx(other.m_video_stream_idx),
      m_audio_stream_idx(other.m_audio_stream_idx) {
    other.m_fmt_ctx = nullptr;
    other.m_video_stream_idx = -1;
    other.m_audio_stream_idx = -1;
}

FFmpegFormatContext& FFmpegFormatContext::operator=(FFmpegFormatContext&& other) noexcept {
    if (this != &other) {
        if (m_fmt_ctx) {
            avformat_close_input(&m_fmt_ctx);
        }
        m_fmt_ctx = other.m_fmt_ctx;
        m_video_stream_idx = other.m_video_stream_idx;
        m_audio_stream_idx = other.m_audio_stream_idx;
        other.m_fmt_ctx = nullptr;
        other.m_video_stream_idx = -1;
        other.m_audio_stream_idx = -1;
    }
    return *this;
}

Result<void> FFmpegFormatContext::open(const std::string& path) {
    int ret = avformat_open_input(&m_fmt_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        if (ret == AVERROR(ENOENT)) {
            return Error::file_not_found(path);
        }
        return ffmpeg_error(ret, "avformat_open_input(" + path + ")");
    }

    ret = avformat_find_stream_info(m_fmt_ctx, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, "avformat_find_stream_info");
    }

    return Result<void>();
}

int FFmpegFormatContext::find_video_stream() {
    assert(m_fmt_ctx && "Format context not opened");

    int idx = av_find_best_stream(m_fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    m_video_stream_idx = idx >= 0 ? idx : -1;

    // Cover art is stored as a single-picture video stream; it is not video
    if (m_video_stream_idx >= 0 &&
        (m_fmt_ctx->streams[m_video_stream_idx]->disposition & AV_DISPOSITION_ATTACHED_PIC)) {
        m_video_stream_idx = -1;
    }
    return m_video_stream_idx;
}

AVStream* FFmpegFormatContext::video_stream() const {
    if (m_video_stream_idx < 0) return nullptr;
    return m_fmt_ctx->streams[m_video_stream_idx];
}

AVCodecParameters* FFmpegFormatContext::video_codec_params() const {
    AVStream* stream = video_stream();
    return stream ? stream->codecpar : nullptr;
}

int FFmpegFormatContext::find_audio_stream() {
    assert(m_fmt_ctx && "Format context not opened");

    int idx = av_find_best_stream(m_fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    m_audio_stream_idx = idx >= 0 ? idx : -1;
    return m_audio_stream_idx;
}

AVStream* FFmpegFormatContext::audio_stream() const {
    if (m_audio_stream_idx < 0) return nullptr;
    return m_fmt_ctx->streams[m_audio_stream_idx];
}

AVCodecParameters* FFmpegFormatContext::audio_codec_params() const {
    AVStream* stream = audio_stream();
    return stream ? stream->codecpar : nullptr;
}

// FFmpegCodecContext implementation

FFmpegCodecContext::~FFmpegCodecContext() {
    if (m_codec_ctx) {
        avcodec_free_context(&m_codec_ctx);
    }
}

FFmpegCodecContext::FFmpegCodecContext(FFmpegCodecContext&& other) noexcept
    : m_codec_ctx(other.m_codec_ctx) {
    other.m_codec_ctx = nullptr;
}

FFmpegCodecContext& FFmpegCodecContext::operator=(FFmpegCodecContext&& other) noexcept {
    if (this != &other) {
        if (m_codec_ctx) {
            avcodec_free_context(&m_codec_ctx);
        }
        m_codec_ctx = other.m_codec_ctx;
        other.m_codec_ctx = nullptr;
    }
    return *this;
}

Result<void> FFmpegCodecContext::init(AVCodecParameters* params) {
    const AVCodec* codec = avcodec_find_decoder(params->codec_id);
    if (!codec) {
        return Error::unsupported("No decoder for codec ID " + std::to_string(params->codec_id));
    }

    m_codec_ctx = avcodec_alloc_context3(codec);
    if (!m_codec_ctx) {
        return Error::resource_exhausted("Failed to allocate codec context");
    }

    int ret = avcodec_parameters_to_context(m_codec_ctx, params);
    if (ret < 0) {
        return ffmpeg_error(ret, "avcodec_parameters_to_context");
    }

    ret = avcodec_open2(m_codec_ctx, codec, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, "avcodec_open2");
    }

    return Result<void>();
}

// Utility functions

TimeUS stream_pts_to_us(int64_t pts, AVStream* stream) {
    if (pts == AV_NOPTS_VALUE) {
        return 0;
    }
    AVRational time_base = stream->time_base;
    // us = pts * time_base.num * 1000000 / time_base.den
    return av_rescale_q(pts, time_base, {1, 1000000});
}

} // namespace impl
} // namespace dmp

#include <dub_media_platform/dmp_media_file.h>
#include "impl/media_file_impl.h"
#include "impl/ffmpeg_context.h"  // av_log_set_level
#include <cassert>
#include <mutex>

namespace dmp {

MediaFile::MediaFile(std::unique_ptr<MediaFileImpl> impl, MediaFileInfo info)
    : m_impl(std::move(impl)), m_info(std::move(info)) {
    assert(m_impl && "MediaFile impl cannot be null");
}

MediaFile::~MediaFile() = default;

const MediaFileInfo& MediaFile::info() const {
    return m_info;
}

Result<std::shared_ptr<MediaFile>> MediaFile::Open(const std::string& path) {
    // Decoder chatter on damaged inputs is not actionable for callers
    static std::once_flag s_ffmpeg_log_init;
    std::call_once(s_ffmpeg_log_init, [] {
        av_log_set_level(AV_LOG_FATAL);
    });

    auto impl = std::make_unique<MediaFileImpl>();

    auto open_result = impl->fmt_ctx.open(path);
    if (open_result.is_error()) {
        return open_result.error();
    }

    MediaFileInfo info;
    info.path = path;

    // Video is optional - audio-only sources play without a picture
    AVStream* video_stream = nullptr;
    if (impl->fmt_ctx.find_video_stream() >= 0) {
        video_stream = impl->fmt_ctx.video_stream();
        AVCodecParameters* params = impl->fmt_ctx.video_codec_params();
        info.has_video = true;
        info.video_width = params->width;
        info.video_height = params->height;
    }

    AVStream* audio_stream = nullptr;
    if (impl->fmt_ctx.find_audio_stream() >= 0) {
        audio_stream = impl->fmt_ctx.audio_stream();
        AVCodecParameters* audio_params = impl->fmt_ctx.audio_codec_params();
        info.has_audio = true;
        info.audio_sample_rate = audio_params->sample_rate;
        info.audio_channels = audio_params->ch_layout.nb_channels;
    }

    if (!info.has_video && !info.has_audio) {
        return Error::unsupported("No video or audio stream found in " + path);
    }

    // Duration in microseconds - try format, then video stream, then audio stream
    AVFormatContext* fmt = impl->fmt_ctx.get();
    if (fmt->duration != AV_NOPTS_VALUE) {
        info.duration_us = av_rescale_q(fmt->duration, AV_TIME_BASE_Q, {1, 1000000});
    } else if (video_stream && video_stream->duration != AV_NOPTS_VALUE) {
        info.duration_us = impl::stream_pts_to_us(video_stream->duration, video_stream);
    } else if (audio_stream && audio_stream->duration != AV_NOPTS_VALUE) {
        info.duration_us = impl::stream_pts_to_us(audio_stream->duration, audio_stream);
    }

    return std::make_shared<MediaFile>(std::move(impl), std::move(info));
}

Result<MediaFileInfo> MediaFile::Probe(const std::string& path) {
    auto result = Open(path);
    if (result.is_error()) {
        return result.error();
    }
    return result.value()->info();
}

} // namespace dmp

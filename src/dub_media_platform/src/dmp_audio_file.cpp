#include <dub_media_platform/dmp_audio_file.h>
#include "impl/media_file_impl.h"
#include "impl/ffmpeg_context.h"
#include "impl/ffmpeg_resample.h"
#include "impl/dmp_log.h"

#include <new>
#include <vector>

namespace dmp {

namespace {

// Frames of headroom for draining the resampler at EOF
constexpr int64_t FLUSH_FRAMES = 4096;

struct PacketFrame {
    AVPacket* pkt = av_packet_alloc();
    AVFrame* frame = av_frame_alloc();
    ~PacketFrame() {
        av_packet_free(&pkt);
        av_frame_free(&frame);
    }
    PacketFrame() = default;
    PacketFrame(const PacketFrame&) = delete;
    PacketFrame& operator=(const PacketFrame&) = delete;
};

// Pull every ready frame out of the decoder and append it, resampled
Result<void> drain_decoder(AVCodecContext* codec, AVFrame* frame,
                           impl::FFmpegResampleContext& resampler,
                           std::vector<float>& interleaved) {
    const int channels = resampler.dst_channels();
    while (true) {
        int ret = avcodec_receive_frame(codec, frame);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return Result<void>();
        }
        if (ret < 0) {
            return impl::ffmpeg_error(ret, "avcodec_receive_frame (audio)");
        }

        int64_t out_needed = resampler.get_out_samples(frame->nb_samples);
        size_t current_size = interleaved.size();
        interleaved.resize(current_size + static_cast<size_t>(out_needed * channels));

        int64_t out_samples = resampler.convert(
            frame->data, frame->nb_samples,
            interleaved.data() + current_size, out_needed);
        av_frame_unref(frame);
        if (out_samples < 0) {
            return impl::ffmpeg_error(static_cast<int>(out_samples), "swr_convert");
        }

        interleaved.resize(current_size + static_cast<size_t>(out_samples * channels));
    }
}

} // namespace

Result<AudioBuffer> LoadAudioFile(const std::string& path, const AudioFormat& out) {
    auto media_result = MediaFile::Open(path);
    if (media_result.is_error()) {
        return media_result.error();
    }
    return LoadAudioFile(media_result.value(), out);
}

Result<AudioBuffer> LoadAudioFile(const std::shared_ptr<MediaFile>& media_file,
                                  const AudioFormat& out) {
    if (!media_file) {
        return Error::invalid_arg("LoadAudioFile: null media file");
    }
    if (!media_file->info().has_audio) {
        return Error::unsupported("MediaFile has no audio stream: " + media_file->info().path);
    }
    if (out.sample_rate <= 0 || out.channels <= 0) {
        return Error::invalid_arg("LoadAudioFile: output format must have positive rate and channels");
    }

    MediaFileImpl* file_impl = media_file->impl_ptr();
    AVFormatContext* fmt_ctx = file_impl->fmt_ctx.get();
    const int audio_stream_idx = file_impl->fmt_ctx.audio_stream_index();

    impl::FFmpegCodecContext codec_ctx;
    auto codec_result = codec_ctx.init(file_impl->fmt_ctx.audio_codec_params());
    if (codec_result.is_error()) {
        return codec_result.error();
    }
    AVCodecContext* codec = codec_ctx.get();

    impl::FFmpegResampleContext resampler;
    auto resample_result = resampler.init(codec->sample_rate, &codec->ch_layout,
                                          codec->sample_fmt, out);
    if (resample_result.is_error()) {
        return resample_result.error();
    }

    // Rewind in case the file was read before
    int ret = av_seek_frame(fmt_ctx, audio_stream_idx, 0, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        DMP_LOG_DEBUG("Rewind failed on %s, decoding from current position",
                      media_file->info().path.c_str());
    }

    PacketFrame pf;
    if (!pf.pkt || !pf.frame) {
        return Error::resource_exhausted("Failed to allocate packet/frame");
    }

    std::vector<float> interleaved;
    try {
        const int64_t estimate =
            (media_file->info().duration_us * out.sample_rate) / 1000000 + FLUSH_FRAMES;
        if (estimate > 0) {
            interleaved.reserve(static_cast<size_t>(estimate * out.channels));
        }

        while (true) {
            ret = av_read_frame(fmt_ctx, pf.pkt);
            if (ret == AVERROR_EOF) {
                break;
            }
            if (ret < 0) {
                av_packet_unref(pf.pkt);
                return impl::ffmpeg_error(ret, "av_read_frame (audio)");
            }

            if (pf.pkt->stream_index != audio_stream_idx) {
                av_packet_unref(pf.pkt);
                continue;
            }

            ret = avcodec_send_packet(codec, pf.pkt);
            av_packet_unref(pf.pkt);
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                return impl::ffmpeg_error(ret, "avcodec_send_packet (audio)");
            }

            auto drain_result = drain_decoder(codec, pf.frame, resampler, interleaved);
            if (drain_result.is_error()) {
                return drain_result.error();
            }
        }

        // Flush decoder then resampler
        ret = avcodec_send_packet(codec, nullptr);
        if (ret < 0 && ret != AVERROR_EOF) {
            return impl::ffmpeg_error(ret, "avcodec_send_packet (flush)");
        }
        auto drain_result = drain_decoder(codec, pf.frame, resampler, interleaved);
        if (drain_result.is_error()) {
            return drain_result.error();
        }

        size_t current_size = interleaved.size();
        interleaved.resize(current_size + static_cast<size_t>(FLUSH_FRAMES * out.channels));
        int64_t flushed = resampler.flush(interleaved.data() + current_size, FLUSH_FRAMES);
        if (flushed < 0) {
            return impl::ffmpeg_error(static_cast<int>(flushed), "swr_convert (flush)");
        }
        interleaved.resize(current_size + static_cast<size_t>(flushed * out.channels));
    } catch (const std::bad_alloc&) {
        return Error::resource_exhausted("Out of memory decoding " + media_file->info().path);
    }

    const int64_t frames = static_cast<int64_t>(interleaved.size()) / out.channels;
    auto buffer_result = AudioBuffer::Allocate(out, frames);
    if (buffer_result.is_error()) {
        return buffer_result.error();
    }
    AudioBuffer buffer = std::move(buffer_result.value());
    for (int32_t ch = 0; ch < out.channels; ++ch) {
        float* dst = buffer.channel_data(ch);
        for (int64_t i = 0; i < frames; ++i) {
            dst[i] = interleaved[static_cast<size_t>(i * out.channels + ch)];
        }
    }

    DMP_LOG_DEBUG("Loaded %lld frames x %d ch @ %d Hz from %s",
                  static_cast<long long>(frames), out.channels, out.sample_rate,
                  media_file->info().path.c_str());
    return buffer;
}

} // namespace dmp

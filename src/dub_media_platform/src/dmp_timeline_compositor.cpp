#include <dub_media_platform/dmp_timeline_compositor.h>
#include <dub_media_platform/dmp_audio_context.h>
#include "impl/dmp_log.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace dmp {

CompositorConfig default_compositor_config() {
    constexpr int64_t RIFF_HEADER_REMAINDER = 36;  // RIFF size field counts everything after itself
    constexpr int64_t MAX_DATA_BYTES =
        static_cast<int64_t>(std::numeric_limits<uint32_t>::max()) - RIFF_HEADER_REMAINDER;

    CompositorConfig cfg;
    cfg.max_total_frames = MAX_DATA_BYTES /
        (synthesis_format::CHANNELS * synthesis_format::BYTES_PER_SAMPLE);
    return cfg;
}

TimelineCompositor::TimelineCompositor(CompositorConfig config)
    : m_config(config) {
}

Result<CompositeTrack> TimelineCompositor::Composite(const std::vector<TimedSegmentRequest>& segments) {
    return Composite(AudioContext::Instance(), segments);
}

Result<CompositeTrack> TimelineCompositor::Composite(AudioContext& context,
                                                     const std::vector<TimedSegmentRequest>& segments) {
    m_placements.clear();
    const AudioFormat& fmt = context.format();

    // Degenerate but valid: nothing to place yields a zero-length track
    if (segments.empty()) {
        DMP_LOG_DEBUG("Composite: no segments, producing empty track");
        return AudioBuffer::Allocate(fmt, 0);
    }

    // Decode stage: independent per segment, completion order irrelevant
    auto decoded_results = context.DecodeAll(segments);

    std::vector<DecodedSegment> decoded;
    decoded.reserve(decoded_results.size());
    for (size_t i = 0; i < decoded_results.size(); ++i) {
        if (decoded_results[i].is_error()) {
            const Error& err = decoded_results[i].error();
            DMP_LOG_WARN("Composite: segment %zu failed to decode: %s", i, err.message.c_str());
            return Error{err.code, "Segment " + std::to_string(i) + ": " + err.message};
        }
        decoded.push_back(std::move(decoded_results[i].value()));
    }

    // Output length: ceil(rate * max end time)
    double max_end = 0.0;
    for (const auto& seg : decoded) {
        max_end = std::max(max_end, seg.end_time());
    }
    const double total_frames_d = frames_for_duration(max_end, fmt.sample_rate);
    if (!std::isfinite(total_frames_d) ||
        total_frames_d > static_cast<double>(m_config.max_total_frames)) {
        return Error::resource_exhausted(
            "Timeline of " + std::to_string(max_end) + "s exceeds the maximum of " +
            std::to_string(m_config.max_total_frames) + " frames");
    }
    int64_t total_frames = static_cast<int64_t>(total_frames_d);

    // Placement: round(start * rate). Rounding can land a clip a fraction of a
    // frame later than the ceil() bound allows; grow the target rather than truncate.
    m_placements.reserve(decoded.size());
    for (size_t i = 0; i < decoded.size(); ++i) {
        int64_t start_frame = frame_at_time(decoded[i].start_time, fmt.sample_rate);
        int64_t frames = decoded[i].samples.frames();
        total_frames = std::max(total_frames, start_frame + frames);
        m_placements.push_back({i, start_frame, frames});
    }
    if (total_frames > m_config.max_total_frames) {
        m_placements.clear();
        return Error::resource_exhausted(
            "Timeline length " + std::to_string(total_frames) + " frames exceeds the maximum of " +
            std::to_string(m_config.max_total_frames));
    }

    auto ctx_result = OfflineRenderContext::Create(fmt, total_frames);
    if (ctx_result.is_error()) {
        m_placements.clear();
        return ctx_result.error();
    }
    auto& render_ctx = ctx_result.value();

    for (const auto& placement : m_placements) {
        auto scheduled = render_ctx->Schedule(decoded[placement.request_index].samples,
                                              placement.start_frame);
        if (scheduled.is_error()) {
            m_placements.clear();
            return scheduled.error();
        }
    }

    DMP_LOG_DEBUG("Composite: %zu segments into %lld frames (%.3fs)",
                  decoded.size(), static_cast<long long>(total_frames), max_end);

    return render_ctx->Render();
}

} // namespace dmp

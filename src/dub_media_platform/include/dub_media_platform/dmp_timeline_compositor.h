#pragma once

#include "dmp_audio.h"
#include "dmp_errors.h"
#include <cstdint>
#include <vector>

namespace dmp {

class AudioContext;

// Compositor limits
struct CompositorConfig {
    // Upper bound on output length. Defaults to the largest mono 16-bit track
    // whose RIFF length fields still fit in 32 bits.
    int64_t max_total_frames;
};

CompositorConfig default_compositor_config();

// Where a segment landed on the output timeline (diagnostics, tests)
struct SegmentPlacement {
    size_t request_index;
    int64_t start_frame;
    int64_t frames;
};

// Timeline compositor: decodes independently synthesized clips and sums them
// into one track, each anchored at round(start_time * sample_rate).
//
// Output length is ceil(sample_rate * max(start_i + duration_i)); overlapping
// clips add (clamping is the encoder's job). Clips are never resampled,
// stretched or crossfaded, and never truncated.
class TimelineCompositor {
public:
    explicit TimelineCompositor(CompositorConfig config = default_compositor_config());

    // Composite using the process-wide AudioContext
    Result<CompositeTrack> Composite(const std::vector<TimedSegmentRequest>& segments);

    // Composite using an explicit context
    Result<CompositeTrack> Composite(AudioContext& context,
                                     const std::vector<TimedSegmentRequest>& segments);

    // Placements from the last successful Composite() call
    const std::vector<SegmentPlacement>& last_placements() const { return m_placements; }

    const CompositorConfig& config() const { return m_config; }

private:
    CompositorConfig m_config;
    std::vector<SegmentPlacement> m_placements;
};

} // namespace dmp

#pragma once

#include <cmath>
#include <cstdint>

namespace dmp {

// Canonical time unit for transports: microseconds since track start
using TimeUS = int64_t;

// Timeline positions handed in by collaborators and editors are seconds (double).
// Frame math is kept here so compositor, encoder and playback agree on rounding.

inline double us_to_seconds(TimeUS us) {
    return static_cast<double>(us) / 1000000.0;
}

// Duration of `frames` sample-frames at `sample_rate`, in seconds
inline double frames_to_seconds(int64_t frames, int32_t sample_rate) {
    return static_cast<double>(frames) / sample_rate;
}

// Number of frames needed to hold `seconds` of audio: ceil(rate * seconds)
inline double frames_for_duration(double seconds, int32_t sample_rate) {
    return std::ceil(seconds * sample_rate);
}

// Frame index at which a clip anchored at `seconds` begins: round(seconds * rate)
inline int64_t frame_at_time(double seconds, int32_t sample_rate) {
    return static_cast<int64_t>(std::llround(seconds * sample_rate));
}

} // namespace dmp

#pragma once

#include <memory>
#include <cstdint>
#include <string>
#include <vector>

#include <QMutex>

namespace aop {

// Configuration for audio output
struct AopConfig {
    int32_t sample_rate;       // Requested sample rate (default 24000, the dub rate)
    int32_t channels;          // Channel count (default 1, mono)
    int32_t target_buffer_ms;  // Device buffer size in ms (default 100)
};

// Report from device open
struct AopOpenReport {
    int32_t actual_sample_rate = 0;
    int32_t actual_channels = 0;
    int32_t actual_buffer_ms = 0;
    std::string device_name;
};

// Whole in-memory track with a seekable read position.
// Thread-safe: the device thread reads while the UI thread seeks.
class PlaybackCursor {
public:
    PlaybackCursor() = default;

    // Replace the source (interleaved float) and rewind to frame 0
    void SetSource(std::vector<float> interleaved, int32_t channels);

    // Copy up to `frames` frames into `out` and advance.
    // Past the end the remainder is filled with silence.
    // Returns frames taken from the source.
    int64_t Read(float* out, int64_t frames);

    // Clamped to [0, TotalFrames()]
    void Seek(int64_t frame);

    int64_t Position() const;
    int64_t TotalFrames() const;
    int32_t Channels() const;
    bool AtEnd() const;

    // Source frames plus the silence handed out after the end
    int64_t DeliveredFrames() const;

    // At the end and every source frame has left a device queue of
    // `queued_frames` (the queue holds only padding)
    bool Drained(int64_t queued_frames) const;

private:
    mutable QMutex m_mutex;
    std::vector<float> m_samples;
    int32_t m_channels = 1;
    int64_t m_total_frames = 0;
    int64_t m_position = 0;
    int64_t m_padded_frames = 0;
};

// Forward declaration for implementation
class AudioOutputImpl;

// Audio output device playing one PlaybackCursor (pull mode)
class AudioOutput {
public:
    ~AudioOutput();

    // Open the default audio output device
    // Returns nullptr on failure (check out_report for details)
    static std::unique_ptr<AudioOutput> Open(const AopConfig& config, AopOpenReport* out_report);

    // Close the audio output (called automatically by destructor)
    void Close();

    // Load a track in the device format (SampleRate() x Channels()) and rewind
    void SetSource(std::vector<float> interleaved);

    // Start/stop playback. Stop keeps the audible position.
    void Start();
    void Stop();
    bool IsPlaying() const;

    // Jump to frame; drops audio already queued in the device
    void SeekFrames(int64_t frame);

    // Audible position (read cursor minus frames still queued in the device)
    int64_t PositionFrames() const;
    double PositionSeconds() const;

    int64_t TotalFrames() const;
    bool AtEnd() const;

    // Whole track has been heard (the device is only playing padding)
    bool Finished() const;

    int32_t SampleRate() const;
    int32_t Channels() const;

    // Internal constructor (public but impl is opaque)
    explicit AudioOutput(std::unique_ptr<AudioOutputImpl> impl);

private:
    std::unique_ptr<AudioOutputImpl> m_impl;
};

// Create default config
inline AopConfig default_config() {
    AopConfig cfg;
    cfg.sample_rate = 24000;
    cfg.channels = 1;
    cfg.target_buffer_ms = 100;
    return cfg;
}

} // namespace aop

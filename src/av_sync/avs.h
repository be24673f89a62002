#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace avs {

// Audio/video sync controller.
//
// Keeps an independently playing audio transport within a bounded offset of
// a video transport. Host playback signals are fed in as SyncEvents; drift
// checks run once per display frame through a FrameScheduler. All calls must
// come from the thread that runs the scheduler's callbacks.

// Host transport signals the controller reacts to
enum class SyncEvent {
    Play,
    Pause,
    Ended,
    Seeked
};

enum class SyncState {
    Idle,       // no correction loop
    Tracking    // one correction loop scheduled
};

// Maximum tolerated |video - audio| before a hard correction
constexpr double DEFAULT_DRIFT_THRESHOLD_S = 0.25;

// Minimal playback transport surface (position in seconds)
class Transport {
public:
    virtual ~Transport() = default;

    virtual double PositionSeconds() const = 0;
    virtual void SetPositionSeconds(double seconds) = 0;
    virtual void Play() = 0;
    virtual void Pause() = 0;
    virtual bool IsPaused() const = 0;

    // False once the underlying media element is gone
    virtual bool IsAvailable() const { return true; }
};

using FrameToken = uint64_t;
constexpr FrameToken INVALID_FRAME_TOKEN = 0;

// Host display cadence: runs a callback once, on the next rendered frame
class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;

    virtual FrameToken RequestFrame(std::function<void()> callback) = 0;
    // Cancelling an unknown or already-fired token is a no-op
    virtual void CancelFrame(FrameToken token) = 0;
};

struct SyncConfig {
    double drift_threshold_s;   // Correct when drift is strictly greater (default 0.25)
};

struct SyncStats {
    uint64_t checks = 0;        // frame checks executed
    uint64_t corrections = 0;   // threshold corrections
    uint64_t resyncs = 0;       // play/seek re-anchors
    double last_drift_s = 0.0;
    double max_drift_s = 0.0;
};

// Forward declaration
class SyncControllerImpl;

class SyncController {
public:
    ~SyncController();

    // Transports and scheduler are not owned and must outlive the controller
    // (or Teardown() must be called first)
    static std::unique_ptr<SyncController> Create(Transport* video, Transport* audio,
                                                  FrameScheduler* scheduler,
                                                  const SyncConfig& config);

    void HandleEvent(SyncEvent event);

    // Cancel any scheduled check and stop reacting to events
    void Teardown();

    SyncState state() const;
    bool HasPendingCheck() const;
    SyncStats stats() const;
    const SyncConfig& config() const;

    // |video - audio|
    static double MeasureDrift(double video_s, double audio_s);

    // Internal constructor
    explicit SyncController(std::unique_ptr<SyncControllerImpl> impl);

private:
    std::unique_ptr<SyncControllerImpl> m_impl;
};

// Create default config
inline SyncConfig default_config() {
    SyncConfig cfg;
    cfg.drift_threshold_s = DEFAULT_DRIFT_THRESHOLD_S;
    return cfg;
}

} // namespace avs

#pragma once

#include "dmp_audio.h"
#include "dmp_errors.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace dmp {

// Process-wide audio processing context.
// Fixed at the synthesis format (24 kHz mono) and created on first use;
// it is reused for every decode and is only torn down at process exit.
// Creating one per call would restart the decode workers each time.
class AudioContext {
public:
    // The single instance (constructed on first call, thread-safe)
    static AudioContext& Instance();

    // Worker count for the instance. Only honoured before the first Instance() call.
    static void SetWorkerCount(int workers);

    ~AudioContext();

    AudioContext(const AudioContext&) = delete;
    AudioContext& operator=(const AudioContext&) = delete;

    const AudioFormat& format() const { return m_format; }
    int worker_count() const { return static_cast<int>(m_workers.size()); }

    // Decode every request independently (concurrently when workers exist).
    // Results are returned in request order regardless of completion order.
    std::vector<Result<DecodedSegment>> DecodeAll(const std::vector<TimedSegmentRequest>& requests);

private:
    AudioContext(AudioFormat format, int workers);

    void start_workers(int count);
    void stop_workers();
    void worker_loop();
    void submit(std::function<void()> job);

    AudioFormat m_format;

    std::vector<std::thread> m_workers;
    std::mutex m_jobs_mutex;
    std::condition_variable m_jobs_cv;
    std::vector<std::function<void()>> m_jobs;
    std::atomic<bool> m_shutdown{false};
};

// Offline (non-realtime) render target, created per composite call and sized
// exactly to the computed total length. Sources are summed into it at their
// start frames; Render() hands over the finished buffer.
class OfflineRenderContext {
public:
    static Result<std::unique_ptr<OfflineRenderContext>> Create(const AudioFormat& format,
                                                                int64_t length_frames);

    int64_t length_frames() const { return m_target.frames(); }
    const AudioFormat& format() const { return m_target.format(); }

    // Add `source` at `start_frame`. The source must fit entirely inside the
    // target: nothing is ever truncated.
    Result<void> Schedule(const AudioBuffer& source, int64_t start_frame);

    // Move the rendered buffer out. The context is spent afterwards.
    AudioBuffer Render();

private:
    explicit OfflineRenderContext(AudioBuffer target);

    AudioBuffer m_target;
    bool m_rendered = false;
};

} // namespace dmp

#include <dub_media_platform/dmp_audio_context.h>
#include <dub_media_platform/dmp_pcm_decoder.h>
#include "impl/dmp_log.h"

#include <cassert>
#include <string>

namespace dmp {

namespace {
std::atomic<int> s_requested_workers{2};
std::atomic<bool> s_instance_created{false};
} // namespace

// ============================================================================
// AudioContext
// ============================================================================

AudioContext& AudioContext::Instance() {
    static AudioContext instance(synthesis_format::FORMAT, s_requested_workers.load());
    return instance;
}

void AudioContext::SetWorkerCount(int workers) {
    if (s_instance_created.load()) {
        DMP_LOG_WARN("AudioContext::SetWorkerCount(%d) ignored: context already created", workers);
        return;
    }
    s_requested_workers.store(workers < 0 ? 0 : workers);
}

AudioContext::AudioContext(AudioFormat format, int workers)
    : m_format(format) {
    s_instance_created.store(true);
    if (workers > 0) {
        start_workers(workers);
    }
    DMP_LOG_DEBUG("AudioContext created: %d Hz, %d ch, %d decode workers",
                  m_format.sample_rate, m_format.channels, workers);
}

AudioContext::~AudioContext() {
    stop_workers();
}

void AudioContext::start_workers(int count) {
    m_shutdown.store(false);
    for (int i = 0; i < count; ++i) {
        m_workers.emplace_back(&AudioContext::worker_loop, this);
    }
}

void AudioContext::stop_workers() {
    {
        std::lock_guard<std::mutex> lock(m_jobs_mutex);
        m_shutdown.store(true);
    }
    m_jobs_cv.notify_all();
    for (auto& t : m_workers) {
        if (t.joinable()) {
            t.join();
        }
    }
    m_workers.clear();
    m_jobs.clear();
}

void AudioContext::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(m_jobs_mutex);
        m_jobs.push_back(std::move(job));
    }
    m_jobs_cv.notify_one();
}

void AudioContext::worker_loop() {
    while (!m_shutdown.load()) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(m_jobs_mutex);
            m_jobs_cv.wait(lock, [this] {
                return m_shutdown.load() || !m_jobs.empty();
            });
            if (m_shutdown.load()) break;
            if (m_jobs.empty()) continue;

            job = std::move(m_jobs.back());
            m_jobs.pop_back();
        }
        job();
    }
}

std::vector<Result<DecodedSegment>> AudioContext::DecodeAll(
    const std::vector<TimedSegmentRequest>& requests) {

    std::vector<Result<DecodedSegment>> results(
        requests.size(), Result<DecodedSegment>(Error::internal("segment not decoded")));

    if (m_workers.empty() || requests.size() < 2) {
        for (size_t i = 0; i < requests.size(); ++i) {
            results[i] = PcmDecoder::Decode(requests[i].audio_bytes(),
                                            requests[i].start_time(), m_format);
        }
        return results;
    }

    // Each job writes only its own slot; the batch counter is the only shared state
    std::mutex done_mutex;
    std::condition_variable done_cv;
    size_t remaining = requests.size();

    for (size_t i = 0; i < requests.size(); ++i) {
        submit([&, i] {
            auto decoded = PcmDecoder::Decode(requests[i].audio_bytes(),
                                              requests[i].start_time(), m_format);
            std::lock_guard<std::mutex> lock(done_mutex);
            results[i] = std::move(decoded);
            if (--remaining == 0) {
                done_cv.notify_one();
            }
        });
    }

    std::unique_lock<std::mutex> lock(done_mutex);
    done_cv.wait(lock, [&remaining] { return remaining == 0; });
    return results;
}

// ============================================================================
// OfflineRenderContext
// ============================================================================

OfflineRenderContext::OfflineRenderContext(AudioBuffer target)
    : m_target(std::move(target)) {
}

Result<std::unique_ptr<OfflineRenderContext>> OfflineRenderContext::Create(
    const AudioFormat& format, int64_t length_frames) {
    auto target = AudioBuffer::Allocate(format, length_frames);
    if (target.is_error()) {
        return target.error();
    }
    return std::unique_ptr<OfflineRenderContext>(
        new OfflineRenderContext(std::move(target.value())));
}

Result<void> OfflineRenderContext::Schedule(const AudioBuffer& source, int64_t start_frame) {
    assert(!m_rendered && "OfflineRenderContext::Schedule after Render");

    if (source.format() != m_target.format()) {
        return Error::invalid_arg("Source format does not match render context format");
    }
    if (start_frame < 0 || start_frame + source.frames() > m_target.frames()) {
        return Error::internal(
            "Source [" + std::to_string(start_frame) + ", " +
            std::to_string(start_frame + source.frames()) + ") exceeds render length " +
            std::to_string(m_target.frames()));
    }

    m_target.mix_in(source, start_frame);
    return Result<void>();
}

AudioBuffer OfflineRenderContext::Render() {
    assert(!m_rendered && "OfflineRenderContext::Render called twice");
    m_rendered = true;
    return std::move(m_target);
}

} // namespace dmp

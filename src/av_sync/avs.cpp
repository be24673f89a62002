#include "avs.h"

#include <cassert>
#include <cmath>

namespace avs {

class SyncControllerImpl {
public:
    SyncControllerImpl(Transport* video, Transport* audio, FrameScheduler* scheduler,
                       const SyncConfig& config)
        : m_video(video), m_audio(audio), m_scheduler(scheduler), m_config(config) {}

    void handle_event(SyncEvent event);
    void teardown();

    Transport* m_video;
    Transport* m_audio;
    FrameScheduler* m_scheduler;
    SyncConfig m_config;

    SyncState m_state = SyncState::Idle;
    FrameToken m_pending = INVALID_FRAME_TOKEN;
    // Bumped whenever the pending check is replaced or cancelled so that a
    // callback the host already dequeued cannot act on a stale loop
    uint64_t m_generation = 0;
    bool m_torn_down = false;
    SyncStats m_stats;

private:
    bool transports_available() const {
        return m_video->IsAvailable() && m_audio->IsAvailable();
    }
    void resync();
    void schedule_check();
    void cancel_check();
    void on_frame(uint64_t generation);
};

void SyncControllerImpl::resync() {
    m_audio->SetPositionSeconds(m_video->PositionSeconds());
    m_stats.resyncs++;
}

void SyncControllerImpl::schedule_check() {
    assert(m_pending == INVALID_FRAME_TOKEN && "previous check must be cancelled first");
    uint64_t generation = ++m_generation;
    m_pending = m_scheduler->RequestFrame([this, generation]() { on_frame(generation); });
}

void SyncControllerImpl::cancel_check() {
    ++m_generation;
    if (m_pending != INVALID_FRAME_TOKEN) {
        m_scheduler->CancelFrame(m_pending);
        m_pending = INVALID_FRAME_TOKEN;
    }
}

void SyncControllerImpl::on_frame(uint64_t generation) {
    if (generation != m_generation || m_torn_down) {
        return;
    }
    m_pending = INVALID_FRAME_TOKEN;

    // Loop ends by itself once the video stops or a transport goes away
    if (!transports_available() || m_video->IsPaused()) {
        m_state = SyncState::Idle;
        return;
    }

    m_stats.checks++;
    const double video_s = m_video->PositionSeconds();
    const double drift = SyncController::MeasureDrift(video_s, m_audio->PositionSeconds());
    m_stats.last_drift_s = drift;
    if (drift > m_stats.max_drift_s) {
        m_stats.max_drift_s = drift;
    }
    if (drift > m_config.drift_threshold_s) {
        m_audio->SetPositionSeconds(video_s);
        m_stats.corrections++;
    }

    schedule_check();
}

void SyncControllerImpl::handle_event(SyncEvent event) {
    if (m_torn_down) {
        return;
    }

    switch (event) {
        case SyncEvent::Play:
            // Replace any running loop; never two loops on one audio transport
            cancel_check();
            if (!transports_available()) {
                m_state = SyncState::Idle;
                return;
            }
            resync();
            m_audio->Play();
            m_state = SyncState::Tracking;
            schedule_check();
            break;

        case SyncEvent::Pause:
        case SyncEvent::Ended:
            cancel_check();
            if (m_audio->IsAvailable()) {
                m_audio->Pause();
            }
            m_state = SyncState::Idle;
            break;

        case SyncEvent::Seeked:
            // Exact re-anchor regardless of threshold
            if (transports_available()) {
                resync();
            }
            break;
    }
}

void SyncControllerImpl::teardown() {
    if (m_torn_down) {
        return;
    }
    cancel_check();
    m_state = SyncState::Idle;
    m_torn_down = true;
}

// ============================================================================
// SyncController
// ============================================================================

SyncController::SyncController(std::unique_ptr<SyncControllerImpl> impl)
    : m_impl(std::move(impl)) {
}

SyncController::~SyncController() {
    if (m_impl) {
        m_impl->teardown();
    }
}

std::unique_ptr<SyncController> SyncController::Create(Transport* video, Transport* audio,
                                                       FrameScheduler* scheduler,
                                                       const SyncConfig& config) {
    assert(video && audio && scheduler && "SyncController needs both transports and a scheduler");
    return std::make_unique<SyncController>(
        std::make_unique<SyncControllerImpl>(video, audio, scheduler, config));
}

void SyncController::HandleEvent(SyncEvent event) {
    m_impl->handle_event(event);
}

void SyncController::Teardown() {
    m_impl->teardown();
}

SyncState SyncController::state() const {
    return m_impl->m_state;
}

bool SyncController::HasPendingCheck() const {
    return m_impl->m_pending != INVALID_FRAME_TOKEN;
}

SyncStats SyncController::stats() const {
    return m_impl->m_stats;
}

const SyncConfig& SyncController::config() const {
    return m_impl->m_config;
}

double SyncController::MeasureDrift(double video_s, double audio_s) {
    return std::fabs(video_s - audio_s);
}

} // namespace avs

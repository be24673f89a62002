// AV sync controller: drift threshold, seek resync, loop lifetime

#include <QtTest>
#include <map>

#include "av_sync/avs.h"

namespace {

class FakeTransport : public avs::Transport {
public:
    double position = 0.0;
    bool paused = true;
    bool available = true;
    int set_calls = 0;
    int play_calls = 0;
    int pause_calls = 0;

    double PositionSeconds() const override { return position; }
    void SetPositionSeconds(double seconds) override { position = seconds; set_calls++; }
    void Play() override { paused = false; play_calls++; }
    void Pause() override { paused = true; pause_calls++; }
    bool IsPaused() const override { return paused; }
    bool IsAvailable() const override { return available; }
};

// Frames advance only when the test says so
class ManualScheduler : public avs::FrameScheduler {
public:
    avs::FrameToken RequestFrame(std::function<void()> callback) override {
        avs::FrameToken token = m_next++;
        m_pending[token] = std::move(callback);
        requests++;
        return token;
    }

    void CancelFrame(avs::FrameToken token) override {
        if (m_pending.erase(token) > 0) {
            cancels++;
        }
    }

    // Run every callback queued before this frame
    void Tick() {
        std::map<avs::FrameToken, std::function<void()>> due;
        due.swap(m_pending);
        for (auto& entry : due) {
            entry.second();
        }
    }

    // Keep a callback past cancellation, as a host that already dequeued it would
    std::function<void()> Steal() {
        if (m_pending.empty()) return {};
        auto it = m_pending.begin();
        auto cb = std::move(it->second);
        m_pending.erase(it);
        return cb;
    }

    size_t pending() const { return m_pending.size(); }

    int requests = 0;
    int cancels = 0;

private:
    std::map<avs::FrameToken, std::function<void()>> m_pending;
    avs::FrameToken m_next = 1;
};

} // namespace

class TestAVSSyncController : public QObject
{
    Q_OBJECT

private:
    FakeTransport m_video;
    FakeTransport m_audio;
    ManualScheduler* m_scheduler = nullptr;

    std::unique_ptr<avs::SyncController> make_controller() {
        return avs::SyncController::Create(&m_video, &m_audio, m_scheduler, avs::default_config());
    }

    // Start playback at `video_s` and let one frame pass with audio at `audio_s`
    void play_then_drift(avs::SyncController& ctl, double video_s, double audio_s) {
        m_video.position = video_s;
        m_video.paused = false;
        ctl.HandleEvent(avs::SyncEvent::Play);
        m_audio.position = audio_s;
        m_scheduler->Tick();
    }

private slots:
    void init() {
        m_video = FakeTransport();
        m_audio = FakeTransport();
        m_scheduler = new ManualScheduler();
    }

    void cleanup() {
        delete m_scheduler;
        m_scheduler = nullptr;
    }

    // ========================================================================
    // CONFIG
    // ========================================================================

    void test_default_threshold() {
        QCOMPARE(avs::default_config().drift_threshold_s, 0.25);
        auto ctl = make_controller();
        QCOMPARE(ctl->config().drift_threshold_s, 0.25);
        QCOMPARE(ctl->state(), avs::SyncState::Idle);
        QVERIFY(!ctl->HasPendingCheck());
    }

    void test_measure_drift_is_absolute() {
        QCOMPARE(avs::SyncController::MeasureDrift(10.0, 9.5), 0.5);
        QCOMPARE(avs::SyncController::MeasureDrift(9.5, 10.0), 0.5);
        QCOMPARE(avs::SyncController::MeasureDrift(3.0, 3.0), 0.0);
    }

    // ========================================================================
    // PLAY
    // ========================================================================

    void test_play_resyncs_and_starts_audio() {
        auto ctl = make_controller();
        m_video.position = 12.5;
        m_video.paused = false;
        m_audio.position = 3.0;

        ctl->HandleEvent(avs::SyncEvent::Play);

        QCOMPARE(m_audio.position, 12.5);
        QCOMPARE(m_audio.play_calls, 1);
        QVERIFY(!m_audio.paused);
        QCOMPARE(ctl->state(), avs::SyncState::Tracking);
        QVERIFY(ctl->HasPendingCheck());
        QCOMPARE(ctl->stats().resyncs, uint64_t(1));
    }

    void test_repeated_play_keeps_single_loop() {
        auto ctl = make_controller();
        m_video.paused = false;

        ctl->HandleEvent(avs::SyncEvent::Play);
        ctl->HandleEvent(avs::SyncEvent::Play);
        ctl->HandleEvent(avs::SyncEvent::Play);

        QCOMPARE(m_scheduler->pending(), size_t(1));
        QCOMPARE(m_scheduler->cancels, 2);

        m_scheduler->Tick();
        QCOMPARE(ctl->stats().checks, uint64_t(1));
        QCOMPARE(m_scheduler->pending(), size_t(1));
    }

    void test_play_with_unavailable_transport_stays_idle() {
        auto ctl = make_controller();
        m_audio.available = false;
        m_video.paused = false;

        ctl->HandleEvent(avs::SyncEvent::Play);

        QCOMPARE(ctl->state(), avs::SyncState::Idle);
        QVERIFY(!ctl->HasPendingCheck());
        QCOMPARE(m_audio.play_calls, 0);
        QCOMPARE(m_audio.set_calls, 0);
    }

    // ========================================================================
    // DRIFT THRESHOLD
    // ========================================================================

    void test_drift_below_threshold_left_alone() {
        auto ctl = make_controller();
        play_then_drift(*ctl, 10.0, 9.8);

        QCOMPARE(m_audio.position, 9.8);
        QCOMPARE(ctl->stats().corrections, uint64_t(0));
        QCOMPARE(ctl->stats().checks, uint64_t(1));
        QVERIFY(ctl->HasPendingCheck());
    }

    void test_drift_at_threshold_left_alone() {
        auto ctl = make_controller();
        play_then_drift(*ctl, 1.25, 1.0);

        QCOMPARE(m_audio.position, 1.0);
        QCOMPARE(ctl->stats().corrections, uint64_t(0));
        QCOMPARE(ctl->stats().last_drift_s, 0.25);
    }

    void test_drift_above_threshold_snaps_to_video() {
        auto ctl = make_controller();
        play_then_drift(*ctl, 10.0, 9.7);

        QCOMPARE(m_audio.position, 10.0);
        QCOMPARE(ctl->stats().corrections, uint64_t(1));
    }

    void test_audio_ahead_is_corrected_too() {
        auto ctl = make_controller();
        play_then_drift(*ctl, 5.0, 6.0);

        QCOMPARE(m_audio.position, 5.0);
        QCOMPARE(ctl->stats().max_drift_s, 1.0);
    }

    void test_custom_threshold() {
        avs::SyncConfig cfg;
        cfg.drift_threshold_s = 0.1;
        auto ctl = avs::SyncController::Create(&m_video, &m_audio, m_scheduler, cfg);
        play_then_drift(*ctl, 2.0, 1.8);

        QCOMPARE(m_audio.position, 2.0);
        QCOMPARE(ctl->stats().corrections, uint64_t(1));
    }

    void test_loop_continues_each_frame() {
        auto ctl = make_controller();
        m_video.paused = false;
        ctl->HandleEvent(avs::SyncEvent::Play);

        for (int i = 0; i < 5; ++i) {
            m_scheduler->Tick();
        }
        QCOMPARE(ctl->stats().checks, uint64_t(5));
        QCOMPARE(m_scheduler->pending(), size_t(1));
    }

    // ========================================================================
    // SEEK
    // ========================================================================

    void test_seek_resyncs_below_threshold() {
        auto ctl = make_controller();
        m_video.paused = false;
        ctl->HandleEvent(avs::SyncEvent::Play);

        m_video.position = 4.00;
        m_audio.position = 4.01;
        ctl->HandleEvent(avs::SyncEvent::Seeked);

        QCOMPARE(m_audio.position, 4.0);
        QCOMPARE(ctl->stats().resyncs, uint64_t(2));
        QCOMPARE(ctl->state(), avs::SyncState::Tracking);
    }

    void test_seek_while_idle_resyncs_without_loop() {
        auto ctl = make_controller();
        m_video.position = 30.0;
        m_audio.position = 0.0;

        ctl->HandleEvent(avs::SyncEvent::Seeked);

        QCOMPARE(m_audio.position, 30.0);
        QCOMPARE(ctl->state(), avs::SyncState::Idle);
        QVERIFY(!ctl->HasPendingCheck());
        QCOMPARE(m_audio.play_calls, 0);
    }

    // ========================================================================
    // STOPPING THE LOOP
    // ========================================================================

    void test_pause_cancels_and_pauses_audio() {
        auto ctl = make_controller();
        m_video.paused = false;
        ctl->HandleEvent(avs::SyncEvent::Play);

        m_video.paused = true;
        ctl->HandleEvent(avs::SyncEvent::Pause);

        QCOMPARE(ctl->state(), avs::SyncState::Idle);
        QVERIFY(!ctl->HasPendingCheck());
        QCOMPARE(m_scheduler->pending(), size_t(0));
        QCOMPARE(m_audio.pause_calls, 1);
        QVERIFY(m_audio.paused);
    }

    void test_ended_cancels_and_pauses_audio() {
        auto ctl = make_controller();
        m_video.paused = false;
        ctl->HandleEvent(avs::SyncEvent::Play);

        ctl->HandleEvent(avs::SyncEvent::Ended);

        QCOMPARE(ctl->state(), avs::SyncState::Idle);
        QCOMPARE(m_scheduler->pending(), size_t(0));
        QVERIFY(m_audio.paused);
    }

    void test_paused_video_ends_loop_on_next_frame() {
        auto ctl = make_controller();
        m_video.paused = false;
        ctl->HandleEvent(avs::SyncEvent::Play);

        m_video.paused = true;
        m_scheduler->Tick();

        QCOMPARE(ctl->state(), avs::SyncState::Idle);
        QVERIFY(!ctl->HasPendingCheck());
        QCOMPARE(ctl->stats().checks, uint64_t(0));
    }

    void test_vanished_transport_ends_loop() {
        auto ctl = make_controller();
        m_video.paused = false;
        ctl->HandleEvent(avs::SyncEvent::Play);

        m_video.available = false;
        m_scheduler->Tick();

        QCOMPARE(ctl->state(), avs::SyncState::Idle);
        QCOMPARE(m_scheduler->pending(), size_t(0));
    }

    void test_stale_callback_is_ignored() {
        auto ctl = make_controller();
        m_video.paused = false;
        ctl->HandleEvent(avs::SyncEvent::Play);

        // Host already dequeued the callback when pause arrives
        auto stale = m_scheduler->Steal();
        QVERIFY(stale);
        ctl->HandleEvent(avs::SyncEvent::Pause);

        m_video.position = 50.0;
        stale();

        QCOMPARE(ctl->stats().checks, uint64_t(0));
        QCOMPARE(m_scheduler->pending(), size_t(0));
        QCOMPARE(ctl->state(), avs::SyncState::Idle);
    }

    // ========================================================================
    // TEARDOWN
    // ========================================================================

    void test_teardown_cancels_and_ignores_events() {
        auto ctl = make_controller();
        m_video.paused = false;
        ctl->HandleEvent(avs::SyncEvent::Play);

        ctl->Teardown();
        QCOMPARE(m_scheduler->pending(), size_t(0));
        QCOMPARE(ctl->state(), avs::SyncState::Idle);

        ctl->HandleEvent(avs::SyncEvent::Play);
        ctl->HandleEvent(avs::SyncEvent::Seeked);
        QCOMPARE(m_scheduler->pending(), size_t(0));
        QCOMPARE(m_audio.play_calls, 1);
        QCOMPARE(ctl->stats().resyncs, uint64_t(1));

        ctl->Teardown();  // idempotent
    }

    void test_destruction_cancels_pending_check() {
        {
            auto ctl = make_controller();
            m_video.paused = false;
            ctl->HandleEvent(avs::SyncEvent::Play);
            QCOMPARE(m_scheduler->pending(), size_t(1));
        }
        QCOMPARE(m_scheduler->pending(), size_t(0));
        m_scheduler->Tick();
    }
};

QTEST_MAIN(TestAVSSyncController)
#include "test_avs_sync_controller.moc"

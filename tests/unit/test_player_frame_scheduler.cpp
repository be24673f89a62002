// Qt frame scheduler driving the sync loop, and the transports over it

#include <QtTest>
#include <QMediaPlayer>
#include <algorithm>

#include "player/qt_transports.h"

using namespace DUB;

class TestPlayerFrameScheduler : public QObject
{
    Q_OBJECT

private slots:
    // ========================================================================
    // SCHEDULER
    // ========================================================================

    void test_callback_runs_once_on_next_tick() {
        QtFrameScheduler scheduler(5);
        int runs = 0;
        avs::FrameToken token = scheduler.RequestFrame([&runs]() { runs++; });
        QVERIFY(token != avs::INVALID_FRAME_TOKEN);
        QCOMPARE(scheduler.pendingCount(), 1);

        QTRY_COMPARE(runs, 1);
        QCOMPARE(scheduler.pendingCount(), 0);
        QTest::qWait(30);
        QCOMPARE(runs, 1);
    }

    void test_parent_owns_scheduler_and_pending_frames() {
        auto* owner = new QObject();
        QPointer<QtFrameScheduler> scheduler = new QtFrameScheduler(5, owner);
        int runs = 0;
        scheduler->RequestFrame([&runs]() { runs++; });

        delete owner;
        QVERIFY(scheduler.isNull());
        QTest::qWait(30);
        QCOMPARE(runs, 0);
    }

    void test_cancelled_callback_never_runs() {
        QtFrameScheduler scheduler(5);
        int kept = 0;
        int cancelled = 0;
        avs::FrameToken drop = scheduler.RequestFrame([&cancelled]() { cancelled++; });
        scheduler.RequestFrame([&kept]() { kept++; });
        scheduler.CancelFrame(drop);
        scheduler.CancelFrame(drop);  // already gone

        QTRY_COMPARE(kept, 1);
        QCOMPARE(cancelled, 0);
    }

    void test_request_from_callback_waits_for_next_tick() {
        QtFrameScheduler scheduler(5);
        int runs = 0;
        int pendingInside = 0;
        std::function<void()> loop;
        loop = [&]() {
            runs++;
            if (runs < 3) {
                scheduler.RequestFrame(loop);
                // Queued for the following tick, not this one
                pendingInside = std::max(pendingInside, scheduler.pendingCount());
            }
        };
        scheduler.RequestFrame(loop);

        QTRY_COMPARE(runs, 3);
        QCOMPARE(pendingInside, 1);
        QCOMPARE(scheduler.pendingCount(), 0);
    }

    void test_drives_sync_controller() {
        // No dub output behind the audio transport: Play leaves the controller idle
        QMediaPlayer player;
        VideoTransport video(&player);
        AudioTransport audio(nullptr);
        QtFrameScheduler scheduler(5);

        QVERIFY(video.IsAvailable());
        QVERIFY(video.IsPaused());
        QVERIFY(!audio.IsAvailable());
        QCOMPARE(audio.PositionSeconds(), 0.0);

        auto sync = avs::SyncController::Create(&video, &audio, &scheduler, avs::default_config());
        sync->HandleEvent(avs::SyncEvent::Play);
        QCOMPARE(sync->state(), avs::SyncState::Idle);
        QCOMPARE(scheduler.pendingCount(), 0);
    }

    // ========================================================================
    // TRANSPORTS
    // ========================================================================

    void test_video_transport_survives_player_deletion() {
        auto* player = new QMediaPlayer();
        VideoTransport video(player);
        QVERIFY(video.IsAvailable());

        delete player;
        QVERIFY(!video.IsAvailable());
        QVERIFY(video.IsPaused());
        QCOMPARE(video.PositionSeconds(), 0.0);
        video.SetPositionSeconds(3.0);
        video.Play();
    }
};

QTEST_MAIN(TestPlayerFrameScheduler)
#include "test_player_frame_scheduler.moc"

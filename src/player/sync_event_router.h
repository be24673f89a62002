#pragma once

#include <av_sync/avs.h>

#include <QObject>
#include <QMediaPlayer>

namespace DUB {

// Sync event for a QMediaPlayer playback state (StoppedState is an end)
avs::SyncEvent syncEventForState(QMediaPlayer::PlaybackState state);

/**
 * Feeds QMediaPlayer signals into a sync controller.
 *
 * A requested seek is re-anchored on the first position report that follows
 * it, since some backends apply setPosition() asynchronously. A seek to the
 * current position produces no report and resyncs at once.
 */
class SyncEventRouter : public QObject
{
    Q_OBJECT

public:
    explicit SyncEventRouter(avs::SyncController* sync, QObject* parent = nullptr);

    // Call before QMediaPlayer::setPosition(targetMs)
    void beginSeek(qint64 currentMs, qint64 targetMs);
    bool seekPending() const { return m_seekPending; }

public slots:
    void onPlaybackStateChanged(QMediaPlayer::PlaybackState state);
    void onPositionChanged(qint64 ms);

signals:
    void playingChanged(bool playing);

private:
    avs::SyncController* m_sync;
    bool m_seekPending = false;
};

} // namespace DUB

#include "sync_event_router.h"

namespace DUB {

avs::SyncEvent syncEventForState(QMediaPlayer::PlaybackState state)
{
    switch (state) {
        case QMediaPlayer::PlayingState:
            return avs::SyncEvent::Play;
        case QMediaPlayer::PausedState:
            return avs::SyncEvent::Pause;
        case QMediaPlayer::StoppedState:
            break;
    }
    return avs::SyncEvent::Ended;
}

SyncEventRouter::SyncEventRouter(avs::SyncController* sync, QObject* parent)
    : QObject(parent)
    , m_sync(sync)
{
}

void SyncEventRouter::beginSeek(qint64 currentMs, qint64 targetMs)
{
    if (currentMs == targetMs) {
        m_seekPending = false;
        m_sync->HandleEvent(avs::SyncEvent::Seeked);
        return;
    }
    m_seekPending = true;
}

void SyncEventRouter::onPlaybackStateChanged(QMediaPlayer::PlaybackState state)
{
    m_sync->HandleEvent(syncEventForState(state));
    emit playingChanged(state == QMediaPlayer::PlayingState);
}

void SyncEventRouter::onPositionChanged(qint64 ms)
{
    Q_UNUSED(ms);
    if (!m_seekPending) return;
    m_seekPending = false;
    m_sync->HandleEvent(avs::SyncEvent::Seeked);
}

} // namespace DUB

#pragma once

#include "qt_transports.h"
#include "sync_event_router.h"

#include <audio_output_platform/aop.h>
#include <av_sync/avs.h>
#include <dub_media_platform/dmp_errors.h>
#include <dub_media_platform/dmp_media_file.h>

#include <QObject>
#include <QMediaPlayer>
#include <QString>
#include <QTimer>
#include <memory>

class QVideoWidget;

namespace DUB {

/**
 * Plays a source file together with its dub.
 *
 * Video source: the original video plays muted and the dub track follows it
 * through the AV sync controller. Host transport signals (play, pause, end,
 * seek) are translated into sync events.
 * Audio-only source: the dub plays directly on the audio device.
 */
class DubbedPlayer : public QObject
{
    Q_OBJECT

public:
    DubbedPlayer(const avs::SyncConfig& syncConfig, int frameIntervalMs, QObject* parent = nullptr);
    ~DubbedPlayer() override;

    dmp::Result<void> open(const QString& sourcePath, const QString& dubPath);

    bool isOpen() const { return m_audio != nullptr; }
    bool hasVideo() const { return m_sourceInfo.has_video; }
    const dmp::MediaFileInfo& sourceInfo() const { return m_sourceInfo; }

    void setVideoOutput(QVideoWidget* widget);

    void play();
    void pause();
    void seek(double seconds);
    bool isPlaying() const;

    double positionSeconds() const;
    double durationSeconds() const;

    // Null in audio-only mode
    const avs::SyncController* syncController() const { return m_sync.get(); }

signals:
    void positionChanged(double seconds);
    void durationChanged(double seconds);
    void playingChanged(bool playing);
    void finished();

private slots:
    void onMediaStatusChanged(QMediaPlayer::MediaStatus status);
    void onAudioTick();

private:
    void close();

    avs::SyncConfig m_syncConfig;
    int m_frameIntervalMs;

    dmp::MediaFileInfo m_sourceInfo;
    std::unique_ptr<aop::AudioOutput> m_audio;
    QMediaPlayer* m_mediaPlayer = nullptr;
    QtFrameScheduler* m_scheduler = nullptr;
    std::unique_ptr<VideoTransport> m_videoTransport;
    std::unique_ptr<AudioTransport> m_audioTransport;
    std::unique_ptr<avs::SyncController> m_sync;
    std::unique_ptr<SyncEventRouter> m_router;

    // Position polling and end detection for audio-only playback
    QTimer m_audioTick;
};

} // namespace DUB

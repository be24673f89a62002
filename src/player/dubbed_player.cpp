#include "dubbed_player.h"

#include <dub_media_platform/dmp_audio_file.h>

#include <QLoggingCategory>
#include <QUrl>
#include <QVideoWidget>

#include <cmath>

Q_LOGGING_CATEGORY(dubPlayer, "dub.player")

namespace DUB {

namespace {
constexpr int AUDIO_TICK_MS = 50;
}

DubbedPlayer::DubbedPlayer(const avs::SyncConfig& syncConfig, int frameIntervalMs, QObject* parent)
    : QObject(parent)
    , m_syncConfig(syncConfig)
    , m_frameIntervalMs(frameIntervalMs)
{
    m_audioTick.setInterval(AUDIO_TICK_MS);
    connect(&m_audioTick, &QTimer::timeout, this, &DubbedPlayer::onAudioTick);
}

DubbedPlayer::~DubbedPlayer()
{
    close();
}

void DubbedPlayer::close()
{
    // Sync loop first: it must not outlive either transport
    m_router.reset();
    if (m_sync) {
        m_sync->Teardown();
        qCDebug(dubPlayer, "Sync stats: %llu checks, %llu corrections, max drift %.3fs",
                static_cast<unsigned long long>(m_sync->stats().checks),
                static_cast<unsigned long long>(m_sync->stats().corrections),
                m_sync->stats().max_drift_s);
        m_sync.reset();
    }
    m_audioTick.stop();
    m_videoTransport.reset();
    m_audioTransport.reset();
    if (m_mediaPlayer) {
        m_mediaPlayer->disconnect(this);
        m_mediaPlayer->stop();
        delete m_mediaPlayer;
        m_mediaPlayer = nullptr;
    }
    delete m_scheduler;
    m_scheduler = nullptr;
    m_audio.reset();
    m_sourceInfo = dmp::MediaFileInfo();
}

dmp::Result<void> DubbedPlayer::open(const QString& sourcePath, const QString& dubPath)
{
    close();

    auto probe = dmp::MediaFile::Probe(sourcePath.toStdString());
    if (probe.is_error()) {
        return probe.error();
    }

    aop::AopOpenReport report;
    auto audio = aop::AudioOutput::Open(aop::default_config(), &report);
    if (!audio) {
        return dmp::Error::unsupported("Cannot open audio output: " + report.device_name);
    }
    qCInfo(dubPlayer, "Audio device %s: %d Hz, %d ch",
           report.device_name.c_str(), report.actual_sample_rate, report.actual_channels);

    // Decode the dub straight to the device format
    auto dub = dmp::LoadAudioFile(dubPath.toStdString(),
                                  dmp::AudioFormat{audio->SampleRate(), audio->Channels()});
    if (dub.is_error()) {
        return dub.error();
    }
    audio->SetSource(dub.value().interleaved());

    m_sourceInfo = probe.value();
    m_audio = std::move(audio);

    if (!m_sourceInfo.has_video) {
        qCInfo(dubPlayer, "Audio-only source, playing dub directly (%.2fs)",
               static_cast<double>(m_audio->TotalFrames()) / m_audio->SampleRate());
        emit durationChanged(durationSeconds());
        return dmp::Result<void>();
    }

    // Original video with its own audio left unrouted (muted)
    m_mediaPlayer = new QMediaPlayer(this);
    m_mediaPlayer->setSource(QUrl::fromLocalFile(sourcePath));
    connect(m_mediaPlayer, &QMediaPlayer::mediaStatusChanged,
            this, &DubbedPlayer::onMediaStatusChanged);
    connect(m_mediaPlayer, &QMediaPlayer::positionChanged, this, [this](qint64 ms) {
        emit positionChanged(static_cast<double>(ms) / 1000.0);
    });
    connect(m_mediaPlayer, &QMediaPlayer::durationChanged, this, [this](qint64 ms) {
        emit durationChanged(static_cast<double>(ms) / 1000.0);
    });

    m_scheduler = new QtFrameScheduler(m_frameIntervalMs, this);
    m_videoTransport = std::make_unique<VideoTransport>(m_mediaPlayer);
    m_audioTransport = std::make_unique<AudioTransport>(m_audio.get());
    m_sync = avs::SyncController::Create(m_videoTransport.get(), m_audioTransport.get(),
                                         m_scheduler, m_syncConfig);

    m_router = std::make_unique<SyncEventRouter>(m_sync.get());
    connect(m_mediaPlayer, &QMediaPlayer::playbackStateChanged,
            m_router.get(), &SyncEventRouter::onPlaybackStateChanged);
    connect(m_mediaPlayer, &QMediaPlayer::positionChanged,
            m_router.get(), &SyncEventRouter::onPositionChanged);
    connect(m_router.get(), &SyncEventRouter::playingChanged,
            this, &DubbedPlayer::playingChanged);

    qCInfo(dubPlayer, "Video source %dx%d, sync threshold %.3fs",
           m_sourceInfo.video_width, m_sourceInfo.video_height, m_syncConfig.drift_threshold_s);
    return dmp::Result<void>();
}

void DubbedPlayer::setVideoOutput(QVideoWidget* widget)
{
    if (m_mediaPlayer) {
        m_mediaPlayer->setVideoOutput(widget);
    }
}

void DubbedPlayer::play()
{
    if (!m_audio) return;
    if (m_mediaPlayer) {
        // Sync starts from playbackStateChanged
        m_mediaPlayer->play();
        return;
    }
    if (m_audio->AtEnd()) {
        m_audio->SeekFrames(0);
    }
    m_audio->Start();
    m_audioTick.start();
    emit playingChanged(true);
}

void DubbedPlayer::pause()
{
    if (!m_audio) return;
    if (m_mediaPlayer) {
        m_mediaPlayer->pause();
        return;
    }
    m_audio->Stop();
    m_audioTick.stop();
    emit playingChanged(false);
}

void DubbedPlayer::seek(double seconds)
{
    if (!m_audio) return;
    if (m_mediaPlayer) {
        const qint64 targetMs = static_cast<qint64>(std::llround(seconds * 1000.0));
        // Re-anchored from the position report that follows
        m_router->beginSeek(m_mediaPlayer->position(), targetMs);
        m_mediaPlayer->setPosition(targetMs);
        return;
    }
    m_audio->SeekFrames(std::llround(seconds * m_audio->SampleRate()));
    emit positionChanged(positionSeconds());
}

bool DubbedPlayer::isPlaying() const
{
    if (m_mediaPlayer) {
        return m_mediaPlayer->playbackState() == QMediaPlayer::PlayingState;
    }
    return m_audio && m_audio->IsPlaying();
}

double DubbedPlayer::positionSeconds() const
{
    if (m_mediaPlayer) {
        return static_cast<double>(m_mediaPlayer->position()) / 1000.0;
    }
    return m_audio ? m_audio->PositionSeconds() : 0.0;
}

double DubbedPlayer::durationSeconds() const
{
    if (m_mediaPlayer) {
        return static_cast<double>(m_mediaPlayer->duration()) / 1000.0;
    }
    return m_audio ? static_cast<double>(m_audio->TotalFrames()) / m_audio->SampleRate() : 0.0;
}

void DubbedPlayer::onMediaStatusChanged(QMediaPlayer::MediaStatus status)
{
    if (status == QMediaPlayer::EndOfMedia) {
        qCDebug(dubPlayer, "End of media, %llu sync corrections",
                static_cast<unsigned long long>(m_sync->stats().corrections));
        emit finished();
    } else if (status == QMediaPlayer::InvalidMedia) {
        qCWarning(dubPlayer) << "Video playback failed:" << m_mediaPlayer->errorString();
    }
}

void DubbedPlayer::onAudioTick()
{
    emit positionChanged(positionSeconds());
    if (m_audio->Finished()) {
        m_audio->Stop();
        m_audioTick.stop();
        emit playingChanged(false);
        emit finished();
    }
}

} // namespace DUB

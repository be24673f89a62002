#include "qt_transports.h"

#include <cmath>

namespace DUB {

// VideoTransport

double VideoTransport::PositionSeconds() const
{
    return m_player ? static_cast<double>(m_player->position()) / 1000.0 : 0.0;
}

void VideoTransport::SetPositionSeconds(double seconds)
{
    if (m_player) {
        m_player->setPosition(static_cast<qint64>(std::llround(seconds * 1000.0)));
    }
}

void VideoTransport::Play()
{
    if (m_player) m_player->play();
}

void VideoTransport::Pause()
{
    if (m_player) m_player->pause();
}

bool VideoTransport::IsPaused() const
{
    return !m_player || m_player->playbackState() != QMediaPlayer::PlayingState;
}

bool VideoTransport::IsAvailable() const
{
    return !m_player.isNull();
}

// AudioTransport

double AudioTransport::PositionSeconds() const
{
    return m_output ? m_output->PositionSeconds() : 0.0;
}

void AudioTransport::SetPositionSeconds(double seconds)
{
    if (m_output) {
        m_output->SeekFrames(std::llround(seconds * m_output->SampleRate()));
    }
}

void AudioTransport::Play()
{
    if (m_output) m_output->Start();
}

void AudioTransport::Pause()
{
    if (m_output) m_output->Stop();
}

bool AudioTransport::IsPaused() const
{
    return !m_output || !m_output->IsPlaying();
}

bool AudioTransport::IsAvailable() const
{
    return m_output != nullptr;
}

// QtFrameScheduler

QtFrameScheduler::QtFrameScheduler(int intervalMs, QObject* parent)
    : QObject(parent)
{
    m_timer.setInterval(intervalMs > 0 ? intervalMs : 16);
    m_timer.setTimerType(Qt::PreciseTimer);
    connect(&m_timer, &QTimer::timeout, this, &QtFrameScheduler::onTick);
}

avs::FrameToken QtFrameScheduler::RequestFrame(std::function<void()> callback)
{
    avs::FrameToken token = m_nextToken++;
    m_pending.emplace(token, std::move(callback));
    if (!m_timer.isActive()) {
        m_timer.start();
    }
    return token;
}

void QtFrameScheduler::CancelFrame(avs::FrameToken token)
{
    m_pending.erase(token);
    if (m_pending.empty()) {
        m_timer.stop();
    }
}

void QtFrameScheduler::onTick()
{
    std::map<avs::FrameToken, std::function<void()>> due;
    due.swap(m_pending);
    for (auto& entry : due) {
        entry.second();
    }
    if (m_pending.empty()) {
        m_timer.stop();
    }
}

} // namespace DUB

#pragma once

#include <av_sync/avs.h>
#include <audio_output_platform/aop.h>

#include <QObject>
#include <QPointer>
#include <QMediaPlayer>
#include <QTimer>
#include <functional>
#include <map>

namespace DUB {

/**
 * Video element as a sync transport (position in seconds over QMediaPlayer ms)
 */
class VideoTransport : public avs::Transport
{
public:
    explicit VideoTransport(QMediaPlayer* player) : m_player(player) {}

    double PositionSeconds() const override;
    void SetPositionSeconds(double seconds) override;
    void Play() override;
    void Pause() override;
    bool IsPaused() const override;
    bool IsAvailable() const override;

private:
    QPointer<QMediaPlayer> m_player;
};

/**
 * Dub track on the audio output device as a sync transport
 */
class AudioTransport : public avs::Transport
{
public:
    explicit AudioTransport(aop::AudioOutput* output) : m_output(output) {}

    double PositionSeconds() const override;
    void SetPositionSeconds(double seconds) override;
    void Play() override;
    void Pause() override;
    bool IsPaused() const override;
    bool IsAvailable() const override;

private:
    aop::AudioOutput* m_output;
};

/**
 * Display-cadence scheduler on the Qt event loop.
 * Every pending callback runs on the next tick; callbacks requested while
 * ticking wait for the following one. The timer only runs while something
 * is pending.
 */
class QtFrameScheduler : public QObject, public avs::FrameScheduler
{
    Q_OBJECT

public:
    explicit QtFrameScheduler(int intervalMs, QObject* parent = nullptr);

    avs::FrameToken RequestFrame(std::function<void()> callback) override;
    void CancelFrame(avs::FrameToken token) override;

    int pendingCount() const { return static_cast<int>(m_pending.size()); }

private slots:
    void onTick();

private:
    QTimer m_timer;
    avs::FrameToken m_nextToken = 1;
    std::map<avs::FrameToken, std::function<void()>> m_pending;
};

} // namespace DUB

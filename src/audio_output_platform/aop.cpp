#include "aop.h"

#include <QAudioFormat>
#include <QAudioSink>
#include <QMediaDevices>
#include <QIODevice>
#include <QMutexLocker>

#include <algorithm>
#include <cassert>
#include <cstring>

namespace aop {

// ============================================================================
// PlaybackCursor
// ============================================================================

void PlaybackCursor::SetSource(std::vector<float> interleaved, int32_t channels) {
    assert(channels > 0 && "PlaybackCursor needs at least one channel");
    QMutexLocker lock(&m_mutex);
    m_channels = channels;
    m_total_frames = static_cast<int64_t>(interleaved.size()) / channels;
    m_samples = std::move(interleaved);
    m_position = 0;
    m_padded_frames = 0;
}

int64_t PlaybackCursor::Read(float* out, int64_t frames) {
    QMutexLocker lock(&m_mutex);

    int64_t to_read = std::max<int64_t>(0, std::min(frames, m_total_frames - m_position));
    size_t read_samples = static_cast<size_t>(to_read) * static_cast<size_t>(m_channels);
    size_t total_samples = static_cast<size_t>(frames) * static_cast<size_t>(m_channels);

    if (read_samples > 0) {
        std::memcpy(out, m_samples.data() + static_cast<size_t>(m_position) * m_channels,
                    read_samples * sizeof(float));
    }
    // Past the end: silence
    if (read_samples < total_samples) {
        std::memset(out + read_samples, 0, (total_samples - read_samples) * sizeof(float));
    }

    m_position += to_read;
    m_padded_frames += std::max<int64_t>(0, frames - to_read);
    return to_read;
}

void PlaybackCursor::Seek(int64_t frame) {
    QMutexLocker lock(&m_mutex);
    m_position = std::max<int64_t>(0, std::min(frame, m_total_frames));
    m_padded_frames = 0;
}

int64_t PlaybackCursor::Position() const {
    QMutexLocker lock(&m_mutex);
    return m_position;
}

int64_t PlaybackCursor::TotalFrames() const {
    QMutexLocker lock(&m_mutex);
    return m_total_frames;
}

int32_t PlaybackCursor::Channels() const {
    QMutexLocker lock(&m_mutex);
    return m_channels;
}

bool PlaybackCursor::AtEnd() const {
    QMutexLocker lock(&m_mutex);
    return m_position >= m_total_frames;
}

int64_t PlaybackCursor::DeliveredFrames() const {
    QMutexLocker lock(&m_mutex);
    return m_position + m_padded_frames;
}

bool PlaybackCursor::Drained(int64_t queued_frames) const {
    QMutexLocker lock(&m_mutex);
    return m_position >= m_total_frames && m_padded_frames >= queued_frames;
}

// ============================================================================
// Device
// ============================================================================

// QIODevice adapter for QAudioSink to read from the cursor
class AudioIODevice : public QIODevice {
public:
    AudioIODevice(PlaybackCursor* cursor, int channels, QObject* parent = nullptr)
        : QIODevice(parent)
        , m_cursor(cursor)
        , m_channels(channels) {
    }

    bool open(OpenMode mode) override {
        if (mode != ReadOnly) return false;
        return QIODevice::open(mode);
    }

    qint64 readData(char* data, qint64 maxlen) override {
        int64_t bytes_per_frame = static_cast<int64_t>(m_channels) * sizeof(float);
        int64_t frames = maxlen / bytes_per_frame;

        m_cursor->Read(reinterpret_cast<float*>(data), frames);

        return frames * bytes_per_frame;  // Always return requested amount (silence-padded)
    }

    qint64 writeData(const char*, qint64) override {
        return -1;  // Not writable
    }

    bool isSequential() const override { return true; }

private:
    PlaybackCursor* m_cursor;
    int m_channels;
};

// Implementation class
class AudioOutputImpl {
public:
    AudioOutputImpl(int sample_rate, int channels, int buffer_ms)
        : m_sample_rate(sample_rate)
        , m_channels(channels)
        , m_buffer_ms(buffer_ms)
        , m_playing(false) {
    }

    ~AudioOutputImpl() {
        if (m_sink) {
            m_sink->stop();
        }
    }

    bool init(AopOpenReport* out_report) {
        QAudioFormat format;
        format.setSampleRate(m_sample_rate);
        format.setChannelCount(m_channels);
        format.setSampleFormat(QAudioFormat::Float);

        QAudioDevice device = QMediaDevices::defaultAudioOutput();
        if (device.isNull()) {
            if (out_report) out_report->device_name = "No audio device";
            return false;
        }

        // Fall back to the device's own rate/layout; callers decode to it
        if (!device.isFormatSupported(format)) {
            QAudioFormat nearestFormat = device.preferredFormat();
            nearestFormat.setSampleFormat(QAudioFormat::Float);
            if (!device.isFormatSupported(nearestFormat)) {
                if (out_report) out_report->device_name = "Format not supported";
                return false;
            }
            format = nearestFormat;
            m_sample_rate = format.sampleRate();
            m_channels = format.channelCount();
        }

        m_sink = std::make_unique<QAudioSink>(device, format);
        m_sink->setBufferSize(static_cast<qsizetype>(bytes_per_frame()) *
                              (static_cast<qsizetype>(m_sample_rate) * m_buffer_ms / 1000));
        m_io_device = std::make_unique<AudioIODevice>(&m_cursor, m_channels);

        if (out_report) {
            out_report->actual_sample_rate = m_sample_rate;
            out_report->actual_channels = m_channels;
            out_report->actual_buffer_ms = m_buffer_ms;
            out_report->device_name = device.description().toStdString();
        }

        return true;
    }

    void set_source(std::vector<float> interleaved) {
        bool was_playing = m_playing;
        stop();
        m_cursor.SetSource(std::move(interleaved), m_channels);
        if (was_playing) start();
    }

    void start() {
        if (!m_sink || m_playing) return;
        m_io_device->open(QIODevice::ReadOnly);
        m_sink->start(m_io_device.get());
        m_playing = true;
    }

    void stop() {
        if (!m_sink || !m_playing) return;
        // Rewind over what was queued but never heard
        int64_t audible = position_frames();
        m_sink->stop();
        m_io_device->close();
        m_cursor.Seek(audible);
        m_playing = false;
    }

    bool is_playing() const {
        return m_playing;
    }

    void seek_frames(int64_t frame) {
        bool was_playing = m_playing;
        stop();
        m_cursor.Seek(frame);
        if (was_playing) start();
    }

    int64_t queued_frames() const {
        if (!m_sink || !m_playing) return 0;
        qsizetype queued = m_sink->bufferSize() - m_sink->bytesFree();
        return std::max<int64_t>(0, queued / bytes_per_frame());
    }

    int64_t position_frames() const {
        int64_t heard = m_cursor.DeliveredFrames() - queued_frames();
        return std::max<int64_t>(0, std::min(heard, m_cursor.TotalFrames()));
    }

    bool finished() const {
        return m_cursor.Drained(queued_frames());
    }

    int64_t bytes_per_frame() const {
        return static_cast<int64_t>(m_channels) * sizeof(float);
    }

    PlaybackCursor& cursor() { return m_cursor; }
    const PlaybackCursor& cursor() const { return m_cursor; }
    int sample_rate() const { return m_sample_rate; }
    int channels() const { return m_channels; }

private:
    int m_sample_rate;
    int m_channels;
    int m_buffer_ms;
    PlaybackCursor m_cursor;
    std::unique_ptr<AudioIODevice> m_io_device;
    std::unique_ptr<QAudioSink> m_sink;
    bool m_playing;
};

// AudioOutput implementation

AudioOutput::AudioOutput(std::unique_ptr<AudioOutputImpl> impl)
    : m_impl(std::move(impl)) {
    assert(m_impl && "AudioOutput impl cannot be null");
}

AudioOutput::~AudioOutput() {
    Close();
}

std::unique_ptr<AudioOutput> AudioOutput::Open(const AopConfig& config, AopOpenReport* out_report) {
    int sample_rate = config.sample_rate > 0 ? config.sample_rate : 24000;
    int channels = config.channels > 0 ? config.channels : 1;
    int buffer_ms = config.target_buffer_ms > 0 ? config.target_buffer_ms : 100;

    auto impl = std::make_unique<AudioOutputImpl>(sample_rate, channels, buffer_ms);

    if (!impl->init(out_report)) {
        return nullptr;
    }

    return std::unique_ptr<AudioOutput>(new AudioOutput(std::move(impl)));
}

void AudioOutput::Close() {
    if (m_impl) {
        m_impl->stop();
    }
}

void AudioOutput::SetSource(std::vector<float> interleaved) {
    m_impl->set_source(std::move(interleaved));
}

void AudioOutput::Start() {
    m_impl->start();
}

void AudioOutput::Stop() {
    m_impl->stop();
}

bool AudioOutput::IsPlaying() const {
    return m_impl->is_playing();
}

void AudioOutput::SeekFrames(int64_t frame) {
    m_impl->seek_frames(frame);
}

int64_t AudioOutput::PositionFrames() const {
    return m_impl->position_frames();
}

double AudioOutput::PositionSeconds() const {
    return static_cast<double>(m_impl->position_frames()) / m_impl->sample_rate();
}

int64_t AudioOutput::TotalFrames() const {
    return m_impl->cursor().TotalFrames();
}

bool AudioOutput::AtEnd() const {
    return m_impl->cursor().AtEnd();
}

bool AudioOutput::Finished() const {
    return m_impl->finished();
}

int32_t AudioOutput::SampleRate() const {
    return m_impl->sample_rate();
}

int32_t AudioOutput::Channels() const {
    return m_impl->channels();
}

} // namespace aop

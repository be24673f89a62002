#include "dub_session.h"
#include "../models/voice_catalog.h"

#include <dub_media_platform/dmp_base64.h>
#include <dub_media_platform/dmp_pcm_decoder.h>
#include <dub_media_platform/dmp_wav_encoder.h>

#include <QLoggingCategory>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <cmath>
#include <thread>
#include <vector>

Q_LOGGING_CATEGORY(dubSession, "dub.session")

namespace DUB {

namespace {

struct SynthesisJob
{
    int segment;
    QString text;
    QString voiceId;
    double startTime;
};

} // namespace

DubSession::DubSession(TranscriptionService* transcriber,
                       SpeechSynthesisService* synthesizer,
                       dmp::AssetStore* store,
                       dmp::CompositorConfig compositorConfig)
    : m_transcriber(transcriber)
    , m_synthesizer(synthesizer)
    , m_store(store)
    , m_compositor(compositorConfig)
{
    assert(m_store && "DubSession needs an asset store");
}

DubSession::~DubSession()
{
    releaseDub();
}

void DubSession::setSynthesisConcurrency(int workers)
{
    m_synthesisConcurrency = std::max(1, workers);
}

// ============================================================================
// Source and script
// ============================================================================

dmp::Result<dmp::MediaFileInfo> DubSession::loadSource(const QString& path)
{
    auto probe = dmp::MediaFile::Probe(path.toStdString());
    if (probe.is_error()) {
        qCWarning(dubSession, "Cannot load %s: %s", qPrintable(path),
                  probe.error().message.c_str());
        return probe.error();
    }

    releaseDub();
    m_script.clear();
    clearEdits();
    m_sourcePath = path;
    m_sourceInfo = probe.value();

    qCInfo(dubSession, "Loaded %s (%s, %.2fs)", qPrintable(path),
           m_sourceInfo->has_video ? "video" : "audio", m_sourceInfo->duration_seconds());
    return probe.value();
}

dmp::Result<void> DubSession::transcribe(const QString& languageCode)
{
    if (!hasSource()) {
        return dmp::Error::invalid_arg("No source file loaded");
    }
    if (!m_transcriber) {
        return dmp::Error::invalid_arg("No transcription service configured");
    }

    m_script.clear();
    clearEdits();

    const QString languageName = VoiceCatalog::transcriptionLanguageName(languageCode);
    auto result = m_transcriber->transcribe(m_sourcePath, languageName);
    if (result.is_error()) {
        qCWarning(dubSession, "Transcription failed: %s", result.error().message.c_str());
        return result.error();
    }

    setScript(result.value());
    qCInfo(dubSession, "Transcribed %d segments, %d speakers", segmentCount(),
           static_cast<int>(speakers().size()));
    return dmp::Result<void>();
}

void DubSession::setScript(const TimedScript& script)
{
    m_script = script;
    clearEdits();

    for (int i = 0; i < m_script.size(); ++i) {
        m_customDialog.insert(i, m_script[i].text);
    }

    const QStringList sorted = speakers();
    for (int i = 0; i < sorted.size(); ++i) {
        m_voiceMap.insert(sorted[i], VoiceCatalog::voiceForSpeakerIndex(i).id);
    }
}

dmp::Result<void> DubSession::checkIndex(int index) const
{
    if (index < 0 || index >= m_script.size()) {
        return dmp::Error::invalid_arg("Segment index " + std::to_string(index) +
                                       " out of range (" + std::to_string(m_script.size()) +
                                       " segments)");
    }
    return dmp::Result<void>();
}

dmp::Result<void> DubSession::setDialog(int index, const QString& text)
{
    auto check = checkIndex(index);
    if (check.is_error()) return check;
    m_customDialog.insert(index, text);
    return dmp::Result<void>();
}

QString DubSession::dialog(int index) const
{
    if (index < 0 || index >= m_script.size()) {
        return QString();
    }
    const QString custom = m_customDialog.value(index);
    return custom.isEmpty() ? m_script[index].text : custom;
}

dmp::Result<void> DubSession::setSpeaker(int index, const QString& speaker)
{
    auto check = checkIndex(index);
    if (check.is_error()) return check;
    m_script[index].speaker = speaker;
    return dmp::Result<void>();
}

dmp::Result<void> DubSession::setStartTime(int index, double seconds)
{
    auto check = checkIndex(index);
    if (check.is_error()) return check;
    if (!std::isfinite(seconds)) {
        return dmp::Error::invalid_arg("Start time must be a number");
    }
    m_script[index].start = seconds;
    return dmp::Result<void>();
}

dmp::Result<void> DubSession::setEndTime(int index, double seconds)
{
    auto check = checkIndex(index);
    if (check.is_error()) return check;
    if (!std::isfinite(seconds)) {
        return dmp::Error::invalid_arg("End time must be a number");
    }
    m_script[index].end = seconds;
    return dmp::Result<void>();
}

dmp::Result<void> DubSession::setMuted(int index, bool muted)
{
    auto check = checkIndex(index);
    if (check.is_error()) return check;
    if (muted) {
        m_muted.insert(index);
    } else {
        m_muted.remove(index);
    }
    return dmp::Result<void>();
}

dmp::Result<void> DubSession::toggleMuted(int index)
{
    return setMuted(index, !isMuted(index));
}

void DubSession::assignVoice(const QString& speaker, const QString& voiceId)
{
    if (!VoiceCatalog::findVoice(voiceId)) {
        qCWarning(dubSession, "Voice %s is not in the catalog", qPrintable(voiceId));
    }
    m_voiceMap.insert(speaker, voiceId);
}

QStringList DubSession::speakers() const
{
    QSet<QString> unique;
    for (const TimedChunk& chunk : m_script) {
        unique.insert(chunk.speaker);
    }
    QStringList sorted(unique.begin(), unique.end());
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

QString DubSession::synthesisText(int index) const
{
    const QString text = dialog(index);
    return text.trimmed().isEmpty() ? QString(BLANK_DIALOG_PLACEHOLDER) : text;
}

// ============================================================================
// Dub generation
// ============================================================================

dmp::Result<dmp::AssetHandle> DubSession::generateDub()
{
    if (m_script.isEmpty()) {
        return dmp::Error::invalid_arg("Please provide a script to generate the dubbing.");
    }
    if (!m_synthesizer) {
        return dmp::Error::invalid_arg("No speech synthesis service configured");
    }

    releaseDub();

    // Every voice is resolved before the first request goes out
    std::vector<SynthesisJob> jobs;
    for (int i = 0; i < m_script.size(); ++i) {
        if (isMuted(i)) {
            continue;
        }
        const TimedChunk& chunk = m_script[i];
        const QString voiceId = m_voiceMap.value(chunk.speaker);
        if (voiceId.isEmpty()) {
            return dmp::Error::missing_voice(chunk.speaker.toStdString());
        }
        jobs.push_back({i, synthesisText(i), voiceId, chunk.start});
    }

    qCInfo(dubSession, "Generating dub from %zu of %d segments", jobs.size(), segmentCount());

    // Responses land in job order whatever order they finish in
    std::vector<std::optional<dmp::Result<std::vector<uint8_t>>>> audio(jobs.size());
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t j = next.fetch_add(1); j < jobs.size(); j = next.fetch_add(1)) {
            const SynthesisJob& job = jobs[j];
            auto speech = m_synthesizer->synthesize(job.text, job.voiceId);
            if (speech.is_error()) {
                audio[j] = speech.error();
                continue;
            }
            if (speech.value().isEmpty()) {
                audio[j] = dmp::Error::collaborator_failure(
                    "Failed to generate audio for segment: \"" + job.text.toStdString() + "\"");
                continue;
            }
            audio[j] = dmp::DecodeBase64(speech.value().toStdString());
        }
    };

    const size_t threadCount = std::min(jobs.size(), static_cast<size_t>(m_synthesisConcurrency));
    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (size_t t = 0; t < threadCount; ++t) {
        threads.emplace_back(worker);
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    std::vector<dmp::TimedSegmentRequest> requests;
    requests.reserve(jobs.size());
    for (size_t j = 0; j < jobs.size(); ++j) {
        assert(audio[j].has_value() && "every synthesis job must produce a result");
        auto& bytes = *audio[j];
        if (bytes.is_error()) {
            qCWarning(dubSession, "Segment %d failed: %s", jobs[j].segment,
                      bytes.error().message.c_str());
            return bytes.error();
        }
        requests.emplace_back(std::move(bytes.value()), jobs[j].startTime);
    }

    auto track = m_compositor.Composite(requests);
    if (track.is_error()) {
        return track.error();
    }

    auto encoded = dmp::WavEncoder::Encode(track.value());
    if (encoded.is_error()) {
        return encoded.error();
    }

    m_currentDub = m_store->Register(encoded.value());
    qCInfo(dubSession, "Dub ready: %.2fs, %zu bytes as %s", track.value().duration_seconds(),
           encoded.value().size(), m_currentDub.url().c_str());
    return m_currentDub;
}

dmp::Result<dmp::EncodedAudioAsset> DubSession::previewSegment(int index)
{
    auto check = checkIndex(index);
    if (check.is_error()) return check.error();
    if (!m_synthesizer) {
        return dmp::Error::invalid_arg("No speech synthesis service configured");
    }

    const TimedChunk& chunk = m_script[index];
    const QString voiceId = m_voiceMap.value(chunk.speaker);
    if (voiceId.isEmpty()) {
        return dmp::Error::missing_voice(chunk.speaker.toStdString());
    }

    auto speech = m_synthesizer->synthesize(synthesisText(index), voiceId);
    if (speech.is_error()) {
        return speech.error();
    }
    if (speech.value().isEmpty()) {
        return dmp::Error::collaborator_failure("Failed to generate preview audio.");
    }

    auto bytes = dmp::DecodeBase64(speech.value().toStdString());
    if (bytes.is_error()) {
        return bytes.error();
    }
    auto samples = dmp::PcmDecoder::DecodeS16LE(bytes.value().data(), bytes.value().size(),
                                                dmp::synthesis_format::FORMAT);
    if (samples.is_error()) {
        return samples.error();
    }

    qCDebug(dubSession, "Preview of segment %d: %.2fs", index, samples.value().duration_seconds());
    return dmp::WavEncoder::Encode(samples.value());
}

dmp::Result<void> DubSession::saveDub(const QString& path) const
{
    if (!m_currentDub.valid()) {
        return dmp::Error::invalid_arg("No dubbed audio to save");
    }
    auto asset = m_store->Resolve(m_currentDub);
    if (asset.is_error()) {
        return asset.error();
    }
    const std::string target =
        path.isEmpty() ? asset.value().suggested_filename() : path.toStdString();
    auto written = asset.value().WriteToFile(target);
    if (written.is_ok()) {
        qCInfo(dubSession, "Saved dub to %s", target.c_str());
    }
    return written;
}

void DubSession::reset()
{
    const size_t released = m_store->ReleaseAll();
    m_currentDub = dmp::AssetHandle();
    qCDebug(dubSession, "Reset: released %zu asset handle(s)", released);
    m_sourcePath.clear();
    m_sourceInfo.reset();
    m_script.clear();
    clearEdits();
}

void DubSession::clearEdits()
{
    m_customDialog.clear();
    m_voiceMap.clear();
    m_muted.clear();
}

void DubSession::releaseDub()
{
    if (m_currentDub.valid()) {
        m_store->Release(m_currentDub);
        m_currentDub = dmp::AssetHandle();
    }
}

} // namespace DUB

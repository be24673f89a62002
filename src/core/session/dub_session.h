#pragma once

#include "../models/timed_chunk.h"
#include "../services/collaborators.h"

#include <dub_media_platform/dmp_encoded_asset.h>
#include <dub_media_platform/dmp_errors.h>
#include <dub_media_platform/dmp_media_file.h>
#include <dub_media_platform/dmp_timeline_compositor.h>

#include <QMap>
#include <QSet>
#include <QString>
#include <QStringList>
#include <optional>

namespace DUB {

// Text synthesized for a blank line so the segment keeps its slot
constexpr const char* BLANK_DIALOG_PLACEHOLDER = ".";

// Parallel speech requests during dub generation
constexpr int DEFAULT_SYNTHESIS_CONCURRENCY = 4;

/**
 * Editing state for one source file and the dub built from it.
 *
 * Holds the timed script, per-segment dialog edits and mute flags, and the
 * speaker-to-voice map. generateDub() turns the unmuted segments into one
 * WAV asset registered in the asset store; the previous dub's handle is
 * released first. Not thread-safe: drive from one thread.
 */
class DubSession
{
public:
    DubSession(TranscriptionService* transcriber,
               SpeechSynthesisService* synthesizer,
               dmp::AssetStore* store,
               dmp::CompositorConfig compositorConfig = dmp::default_compositor_config());
    ~DubSession();

    DubSession(const DubSession&) = delete;
    DubSession& operator=(const DubSession&) = delete;

    void setSynthesisConcurrency(int workers);

    // Source media

    /**
     * Probe and adopt a new source file.
     * On success all editing state is cleared and the previous dub released;
     * on failure the session is unchanged.
     */
    dmp::Result<dmp::MediaFileInfo> loadSource(const QString& path);
    bool hasSource() const { return m_sourceInfo.has_value(); }
    QString sourcePath() const { return m_sourcePath; }
    const std::optional<dmp::MediaFileInfo>& sourceInfo() const { return m_sourceInfo; }

    // Script

    /**
     * Transcribe the source into `languageCode`.
     * Edits, voices and mute flags are cleared before the request. On success
     * the dialog starts as the transcribed text and sorted speakers get the
     * catalog voices in turn.
     */
    dmp::Result<void> transcribe(const QString& languageCode);

    // Replace the script directly (same resets as a transcription)
    void setScript(const TimedScript& script);

    const TimedScript& script() const { return m_script; }
    int segmentCount() const { return static_cast<int>(m_script.size()); }

    dmp::Result<void> setDialog(int index, const QString& text);
    // Edited dialog when non-empty, else the transcribed text
    QString dialog(int index) const;

    dmp::Result<void> setSpeaker(int index, const QString& speaker);
    dmp::Result<void> setStartTime(int index, double seconds);
    dmp::Result<void> setEndTime(int index, double seconds);

    dmp::Result<void> setMuted(int index, bool muted);
    dmp::Result<void> toggleMuted(int index);
    bool isMuted(int index) const { return m_muted.contains(index); }

    void assignVoice(const QString& speaker, const QString& voiceId);
    QString voiceFor(const QString& speaker) const { return m_voiceMap.value(speaker); }

    // Unique speakers, sorted
    QStringList speakers() const;

    // Dub

    /**
     * Synthesize every unmuted segment, composite them at their start times
     * and encode the result. Fails without synthesizing anything when the
     * script is empty or a segment's speaker has no voice.
     */
    dmp::Result<dmp::AssetHandle> generateDub();

    // Synthesize and encode one segment on its own (muted or not)
    dmp::Result<dmp::EncodedAudioAsset> previewSegment(int index);

    dmp::AssetHandle currentDub() const { return m_currentDub; }
    bool hasDub() const { return m_currentDub.valid(); }

    // Write the current dub; empty path means its suggested filename
    dmp::Result<void> saveDub(const QString& path = QString()) const;

    // Drop source, script, edits and dub; releases every handle in the store
    void reset();

private:
    dmp::Result<void> checkIndex(int index) const;
    QString synthesisText(int index) const;
    void clearEdits();
    void releaseDub();

    TranscriptionService* m_transcriber;
    SpeechSynthesisService* m_synthesizer;
    dmp::AssetStore* m_store;
    dmp::TimelineCompositor m_compositor;
    int m_synthesisConcurrency = DEFAULT_SYNTHESIS_CONCURRENCY;

    QString m_sourcePath;
    std::optional<dmp::MediaFileInfo> m_sourceInfo;

    TimedScript m_script;
    QMap<int, QString> m_customDialog;
    QMap<QString, QString> m_voiceMap;
    QSet<int> m_muted;

    dmp::AssetHandle m_currentDub;
};

} // namespace DUB

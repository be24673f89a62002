#pragma once

#include "../models/timed_chunk.h"

#include <dub_media_platform/dmp_errors.h>

#include <QByteArray>
#include <QString>

namespace DUB {

/**
 * Transcribes a media file and translates it into the target language.
 * Failures are CollaboratorFailure with a human-readable message.
 */
class TranscriptionService
{
public:
    virtual ~TranscriptionService() = default;

    virtual dmp::Result<TimedScript> transcribe(const QString& mediaPath,
                                                const QString& languageName) = 0;
};

/**
 * Speaks one line with the given voice.
 * Returns base64 text of raw 16-bit mono 24 kHz little-endian PCM.
 * Must be callable from several threads at once.
 */
class SpeechSynthesisService
{
public:
    virtual ~SpeechSynthesisService() = default;

    virtual dmp::Result<QByteArray> synthesize(const QString& text, const QString& voiceId) = 0;
};

} // namespace DUB

#pragma once

#include "../models/timed_chunk.h"

#include <dub_media_platform/dmp_errors.h>

#include <QByteArray>
#include <QString>

namespace DUB {

/**
 * Strict parser for the transcription service's JSON output.
 *
 * Input is trimmed and an optional ```json fence is removed. The rest must be
 * a JSON array of objects with numeric "start"/"end" and string
 * "text"/"speaker"; "gender" is optional. Anything else fails as a whole
 * with CollaboratorFailure.
 */
class TranscriptParser
{
public:
    static dmp::Result<TimedScript> parse(const QString& output);

    static QString stripCodeFence(const QString& output);

    // Inverse of parse(): the same array shape, gender spelled out
    static QByteArray serialize(const TimedScript& script);
};

} // namespace DUB

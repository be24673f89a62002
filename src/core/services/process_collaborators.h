#pragma once

#include "collaborators.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace DUB {

// Default wait for one external command before it is killed
constexpr int DEFAULT_COLLABORATOR_TIMEOUT_MS = 300000;

/**
 * Runs `<command> <args...>`, feeds stdin, returns trimmed stdout (possibly
 * empty). Fails with CollaboratorFailure on start failure, crash, timeout or
 * non-zero exit; the message carries the command's stderr.
 */
dmp::Result<QByteArray> runCollaboratorCommand(const QString& command,
                                               const QStringList& arguments,
                                               const QByteArray& input,
                                               int timeoutMs);

/**
 * Transcription via external command:
 *   <command> <media-path> <language-name>   (JSON on stdout)
 */
class ProcessTranscriptionService : public TranscriptionService
{
public:
    explicit ProcessTranscriptionService(const QString& command,
                                         int timeoutMs = DEFAULT_COLLABORATOR_TIMEOUT_MS);

    dmp::Result<TimedScript> transcribe(const QString& mediaPath,
                                        const QString& languageName) override;

private:
    QString m_command;
    int m_timeoutMs;
};

/**
 * Speech synthesis via external command:
 *   <command> <voice-id>   (text on stdin, base64 PCM on stdout)
 */
class ProcessSpeechSynthesisService : public SpeechSynthesisService
{
public:
    explicit ProcessSpeechSynthesisService(const QString& command,
                                           int timeoutMs = DEFAULT_COLLABORATOR_TIMEOUT_MS);

    dmp::Result<QByteArray> synthesize(const QString& text, const QString& voiceId) override;

private:
    QString m_command;
    int m_timeoutMs;
};

} // namespace DUB

#include "process_collaborators.h"
#include "transcript_parser.h"

#include <QLoggingCategory>
#include <QProcess>

Q_DECLARE_LOGGING_CATEGORY(dubServices)

namespace DUB {

namespace {

dmp::Error commandFailure(const QString& program, const QString& what, const QByteArray& stderrText)
{
    QString message = QString("%1 %2").arg(program, what);
    const QString detail = QString::fromUtf8(stderrText).trimmed();
    if (!detail.isEmpty()) {
        message += ": " + detail;
    }
    return dmp::Error::collaborator_failure(message.toStdString());
}

} // namespace

dmp::Result<QByteArray> runCollaboratorCommand(const QString& command,
                                               const QStringList& arguments,
                                               const QByteArray& input,
                                               int timeoutMs)
{
    QStringList parts = QProcess::splitCommand(command);
    if (parts.isEmpty()) {
        return dmp::Error::invalid_arg("No collaborator command configured");
    }
    const QString program = parts.takeFirst();
    parts.append(arguments);

    QProcess process;
    process.start(program, parts);
    if (!process.waitForStarted()) {
        return dmp::Error::collaborator_failure(
            QString("%1 failed to start: %2").arg(program, process.errorString()).toStdString());
    }

    if (!input.isEmpty()) {
        process.write(input);
    }
    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished();
        return commandFailure(program, QString("timed out after %1 ms").arg(timeoutMs),
                              process.readAllStandardError());
    }

    const QByteArray stderrText = process.readAllStandardError();
    if (process.exitStatus() != QProcess::NormalExit) {
        return commandFailure(program, "crashed", stderrText);
    }
    if (process.exitCode() != 0) {
        return commandFailure(program, QString("exited with code %1").arg(process.exitCode()),
                              stderrText);
    }

    QByteArray output = process.readAllStandardOutput().trimmed();
    qCDebug(dubServices, "%s produced %lld bytes", qPrintable(program),
            static_cast<long long>(output.size()));
    return output;
}

// ProcessTranscriptionService

ProcessTranscriptionService::ProcessTranscriptionService(const QString& command, int timeoutMs)
    : m_command(command)
    , m_timeoutMs(timeoutMs)
{
}

dmp::Result<TimedScript> ProcessTranscriptionService::transcribe(const QString& mediaPath,
                                                                 const QString& languageName)
{
    qCInfo(dubServices, "Transcribing %s into %s", qPrintable(mediaPath), qPrintable(languageName));
    auto output = runCollaboratorCommand(m_command, {mediaPath, languageName}, QByteArray(),
                                         m_timeoutMs);
    if (output.is_error()) {
        return output.error();
    }
    return TranscriptParser::parse(QString::fromUtf8(output.value()));
}

// ProcessSpeechSynthesisService

ProcessSpeechSynthesisService::ProcessSpeechSynthesisService(const QString& command, int timeoutMs)
    : m_command(command)
    , m_timeoutMs(timeoutMs)
{
}

dmp::Result<QByteArray> ProcessSpeechSynthesisService::synthesize(const QString& text,
                                                                  const QString& voiceId)
{
    return runCollaboratorCommand(m_command, {voiceId}, text.toUtf8(), m_timeoutMs);
}

} // namespace DUB

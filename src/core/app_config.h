#pragma once

#include <av_sync/avs.h>
#include <dub_media_platform/dmp_errors.h>

#include <QProcessEnvironment>
#include <QString>

class QCommandLineParser;

namespace DUB {

/**
 * Application settings.
 * Resolved as: built-in defaults, then environment, then command line.
 */
struct AppConfig
{
    QString targetLanguage = "en";
    QString outputPath = "dubbed-audio.wav";
    QString transcribeCommand;
    QString ttsCommand;
    double syncThresholdSeconds = avs::DEFAULT_DRIFT_THRESHOLD_S;
    int frameIntervalMs = 16;           // one display frame at 60 Hz
    int decodeThreads = 2;
    int synthesisConcurrency = 4;
    int collaboratorTimeoutMs = 300000;

    // DUB_TARGET_LANGUAGE, DUB_TRANSCRIBE_COMMAND, DUB_TTS_COMMAND,
    // DUB_SYNC_THRESHOLD_MS, DUB_DECODE_THREADS
    dmp::Result<void> applyEnvironment(const QProcessEnvironment& env);

    // Register the options understood by applyCommandLine()
    static void addOptions(QCommandLineParser& parser);
    dmp::Result<void> applyCommandLine(const QCommandLineParser& parser);

    avs::SyncConfig syncConfig() const;

    // defaults + system environment + parsed command line
    static dmp::Result<AppConfig> resolve(const QCommandLineParser& parser);
};

} // namespace DUB

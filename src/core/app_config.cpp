#include "app_config.h"
#include "models/voice_catalog.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QLoggingCategory>

#include <cmath>

Q_LOGGING_CATEGORY(dubConfig, "dub.config")

namespace DUB {

namespace {

dmp::Result<double> parseThresholdMs(const QString& text, const QString& source)
{
    bool ok = false;
    const double ms = text.trimmed().toDouble(&ok);
    if (!ok || !std::isfinite(ms) || ms <= 0.0) {
        return dmp::Error::invalid_arg(
            QString("%1: sync threshold must be a positive number of milliseconds, got '%2'")
                .arg(source, text).toStdString());
    }
    return ms / 1000.0;
}

dmp::Result<int> parseCount(const QString& text, const QString& source, int minimum)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok || value < minimum) {
        return dmp::Error::invalid_arg(
            QString("%1: expected an integer >= %2, got '%3'")
                .arg(source).arg(minimum).arg(text).toStdString());
    }
    return value;
}

void checkLanguage(const QString& code)
{
    if (!VoiceCatalog::findLanguage(code)) {
        qCWarning(dubConfig, "Unknown target language '%s'", qPrintable(code));
    }
}

} // namespace

dmp::Result<void> AppConfig::applyEnvironment(const QProcessEnvironment& env)
{
    if (env.contains("DUB_TARGET_LANGUAGE")) {
        targetLanguage = env.value("DUB_TARGET_LANGUAGE");
        checkLanguage(targetLanguage);
    }
    if (env.contains("DUB_TRANSCRIBE_COMMAND")) {
        transcribeCommand = env.value("DUB_TRANSCRIBE_COMMAND");
    }
    if (env.contains("DUB_TTS_COMMAND")) {
        ttsCommand = env.value("DUB_TTS_COMMAND");
    }
    if (env.contains("DUB_SYNC_THRESHOLD_MS")) {
        auto threshold = parseThresholdMs(env.value("DUB_SYNC_THRESHOLD_MS"), "DUB_SYNC_THRESHOLD_MS");
        if (threshold.is_error()) return threshold.error();
        syncThresholdSeconds = threshold.value();
    }
    if (env.contains("DUB_DECODE_THREADS")) {
        auto threads = parseCount(env.value("DUB_DECODE_THREADS"), "DUB_DECODE_THREADS", 0);
        if (threads.is_error()) return threads.error();
        decodeThreads = threads.value();
    }
    return dmp::Result<void>();
}

void AppConfig::addOptions(QCommandLineParser& parser)
{
    parser.addOption(QCommandLineOption({"l", "language"},
        "Target language code (see 'languages').", "code"));
    parser.addOption(QCommandLineOption({"o", "output"},
        "Where to write the dub.", "path"));
    parser.addOption(QCommandLineOption("transcribe-command",
        "Command run as: <command> <media> <language>.", "command"));
    parser.addOption(QCommandLineOption("tts-command",
        "Command run as: <command> <voice>, text on stdin.", "command"));
    parser.addOption(QCommandLineOption("sync-threshold-ms",
        "Audio/video drift tolerated before correction.", "ms"));
    parser.addOption(QCommandLineOption("frame-interval-ms",
        "Interval between drift checks.", "ms"));
    parser.addOption(QCommandLineOption("decode-threads",
        "Segment decode workers (0 decodes inline).", "n"));
    parser.addOption(QCommandLineOption("synthesis-jobs",
        "Speech requests in flight at once.", "n"));
    parser.addOption(QCommandLineOption("timeout-ms",
        "Per-command collaborator timeout.", "ms"));
}

dmp::Result<void> AppConfig::applyCommandLine(const QCommandLineParser& parser)
{
    if (parser.isSet("language")) {
        targetLanguage = parser.value("language");
        checkLanguage(targetLanguage);
    }
    if (parser.isSet("output")) {
        outputPath = parser.value("output");
    }
    if (parser.isSet("transcribe-command")) {
        transcribeCommand = parser.value("transcribe-command");
    }
    if (parser.isSet("tts-command")) {
        ttsCommand = parser.value("tts-command");
    }
    if (parser.isSet("sync-threshold-ms")) {
        auto threshold = parseThresholdMs(parser.value("sync-threshold-ms"), "--sync-threshold-ms");
        if (threshold.is_error()) return threshold.error();
        syncThresholdSeconds = threshold.value();
    }
    if (parser.isSet("frame-interval-ms")) {
        auto interval = parseCount(parser.value("frame-interval-ms"), "--frame-interval-ms", 1);
        if (interval.is_error()) return interval.error();
        frameIntervalMs = interval.value();
    }
    if (parser.isSet("decode-threads")) {
        auto threads = parseCount(parser.value("decode-threads"), "--decode-threads", 0);
        if (threads.is_error()) return threads.error();
        decodeThreads = threads.value();
    }
    if (parser.isSet("synthesis-jobs")) {
        auto jobs = parseCount(parser.value("synthesis-jobs"), "--synthesis-jobs", 1);
        if (jobs.is_error()) return jobs.error();
        synthesisConcurrency = jobs.value();
    }
    if (parser.isSet("timeout-ms")) {
        auto timeout = parseCount(parser.value("timeout-ms"), "--timeout-ms", 1);
        if (timeout.is_error()) return timeout.error();
        collaboratorTimeoutMs = timeout.value();
    }
    return dmp::Result<void>();
}

avs::SyncConfig AppConfig::syncConfig() const
{
    avs::SyncConfig cfg = avs::default_config();
    cfg.drift_threshold_s = syncThresholdSeconds;
    return cfg;
}

dmp::Result<AppConfig> AppConfig::resolve(const QCommandLineParser& parser)
{
    AppConfig config;
    auto env = config.applyEnvironment(QProcessEnvironment::systemEnvironment());
    if (env.is_error()) return env.error();
    auto cli = config.applyCommandLine(parser);
    if (cli.is_error()) return cli.error();
    return config;
}

} // namespace DUB

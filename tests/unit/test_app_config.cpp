// Application settings: defaults, environment and command-line layering

#include <QtTest>
#include <QCommandLineParser>
#include <QProcessEnvironment>

#include "core/app_config.h"

using namespace DUB;

class TestAppConfig : public QObject
{
    Q_OBJECT

private:
    static bool parse(QCommandLineParser& parser, const QStringList& args) {
        AppConfig::addOptions(parser);
        return parser.parse(QStringList({"dubstudio"}) + args);
    }

private slots:
    // ========================================================================
    // DEFAULTS
    // ========================================================================

    void test_defaults() {
        AppConfig config;
        QCOMPARE(config.targetLanguage, QString("en"));
        QCOMPARE(config.outputPath, QString("dubbed-audio.wav"));
        QVERIFY(config.transcribeCommand.isEmpty());
        QVERIFY(config.ttsCommand.isEmpty());
        QCOMPARE(config.syncThresholdSeconds, 0.25);
        QCOMPARE(config.frameIntervalMs, 16);
        QCOMPARE(config.decodeThreads, 2);
        QCOMPARE(config.synthesisConcurrency, 4);
        QCOMPARE(config.collaboratorTimeoutMs, 300000);
        QCOMPARE(config.syncConfig().drift_threshold_s, 0.25);
    }

    // ========================================================================
    // ENVIRONMENT
    // ========================================================================

    void test_environment_overrides() {
        QProcessEnvironment env;
        env.insert("DUB_TARGET_LANGUAGE", "ms");
        env.insert("DUB_TRANSCRIBE_COMMAND", "transcribe.sh");
        env.insert("DUB_TTS_COMMAND", "speak --fast");
        env.insert("DUB_SYNC_THRESHOLD_MS", "100");
        env.insert("DUB_DECODE_THREADS", "0");

        AppConfig config;
        QVERIFY(config.applyEnvironment(env).is_ok());
        QCOMPARE(config.targetLanguage, QString("ms"));
        QCOMPARE(config.transcribeCommand, QString("transcribe.sh"));
        QCOMPARE(config.ttsCommand, QString("speak --fast"));
        QCOMPARE(config.syncThresholdSeconds, 0.1);
        QCOMPARE(config.decodeThreads, 0);
    }

    void test_empty_environment_changes_nothing() {
        AppConfig config;
        QVERIFY(config.applyEnvironment(QProcessEnvironment()).is_ok());
        QCOMPARE(config.targetLanguage, QString("en"));
        QCOMPARE(config.syncThresholdSeconds, 0.25);
    }

    void test_environment_rejects_bad_numbers() {
        const QStringList badThresholds = {"0", "-5", "abc", "nan", ""};
        for (const QString& value : badThresholds) {
            QProcessEnvironment env;
            env.insert("DUB_SYNC_THRESHOLD_MS", value);
            AppConfig config;
            auto result = config.applyEnvironment(env);
            QVERIFY2(result.is_error(), qPrintable(value));
            QCOMPARE(result.error().code, dmp::ErrorCode::InvalidArg);
            QCOMPARE(config.syncThresholdSeconds, 0.25);
        }

        QProcessEnvironment env;
        env.insert("DUB_DECODE_THREADS", "-1");
        AppConfig config;
        QVERIFY(config.applyEnvironment(env).is_error());
    }

    // ========================================================================
    // COMMAND LINE
    // ========================================================================

    void test_command_line_options() {
        QCommandLineParser parser;
        QVERIFY(parse(parser, {"-l", "fr", "-o", "out.wav", "--tts-command", "speak",
                               "--transcribe-command", "listen", "--sync-threshold-ms", "500",
                               "--frame-interval-ms", "33", "--decode-threads", "3",
                               "--synthesis-jobs", "8", "--timeout-ms", "1000"}));

        AppConfig config;
        QVERIFY(config.applyCommandLine(parser).is_ok());
        QCOMPARE(config.targetLanguage, QString("fr"));
        QCOMPARE(config.outputPath, QString("out.wav"));
        QCOMPARE(config.ttsCommand, QString("speak"));
        QCOMPARE(config.transcribeCommand, QString("listen"));
        QCOMPARE(config.syncThresholdSeconds, 0.5);
        QCOMPARE(config.frameIntervalMs, 33);
        QCOMPARE(config.decodeThreads, 3);
        QCOMPARE(config.synthesisConcurrency, 8);
        QCOMPARE(config.collaboratorTimeoutMs, 1000);
        QCOMPARE(config.syncConfig().drift_threshold_s, 0.5);
    }

    void test_command_line_wins_over_environment() {
        QProcessEnvironment env;
        env.insert("DUB_TARGET_LANGUAGE", "de");
        env.insert("DUB_SYNC_THRESHOLD_MS", "100");

        QCommandLineParser parser;
        QVERIFY(parse(parser, {"--language", "ja"}));

        AppConfig config;
        QVERIFY(config.applyEnvironment(env).is_ok());
        QVERIFY(config.applyCommandLine(parser).is_ok());
        QCOMPARE(config.targetLanguage, QString("ja"));
        QCOMPARE(config.syncThresholdSeconds, 0.1);
    }

    void test_command_line_rejects_bad_counts() {
        const QList<QStringList> bad = {
            {"--frame-interval-ms", "0"},
            {"--synthesis-jobs", "0"},
            {"--decode-threads", "two"},
            {"--timeout-ms", "-1"},
            {"--sync-threshold-ms", "0"},
        };
        for (const QStringList& args : bad) {
            QCommandLineParser parser;
            QVERIFY(parse(parser, args));
            AppConfig config;
            auto result = config.applyCommandLine(parser);
            QVERIFY2(result.is_error(), qPrintable(args.join(' ')));
            QCOMPARE(result.error().code, dmp::ErrorCode::InvalidArg);
        }
    }

    void test_unknown_language_is_kept() {
        QCommandLineParser parser;
        QVERIFY(parse(parser, {"-l", "xx"}));

        AppConfig config;
        QVERIFY(config.applyCommandLine(parser).is_ok());
        QCOMPARE(config.targetLanguage, QString("xx"));
    }
};

QTEST_MAIN(TestAppConfig)
#include "test_app_config.moc"

#include <QApplication>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QHBoxLayout>
#include <QLabel>
#include <QLoggingCategory>
#include <QPushButton>
#include <QSlider>
#include <QVBoxLayout>
#include <QVideoWidget>
#include <QWidget>

#include <cstdio>
#include <memory>

#include <dub_media_platform/dmp_audio_context.h>
#include <dub_media_platform/dmp_encoded_asset.h>
#include <dub_media_platform/dmp_errors.h>

#include "core/app_config.h"
#include "core/models/voice_catalog.h"
#include "core/services/process_collaborators.h"
#include "core/services/transcript_parser.h"
#include "core/session/dub_session.h"
#include "player/dubbed_player.h"

Q_LOGGING_CATEGORY(dubMain, "dub.main")

namespace {

const char* USAGE_COMMANDS =
    "Commands:\n"
    "  transcribe <source>          Print the timed script as JSON\n"
    "  dub <source>                 Generate the dubbed track\n"
    "  preview <source>             Synthesize one segment (--segment)\n"
    "  play <source> <dub.wav>      Play the source with its dub\n"
    "  voices                       List voices\n"
    "  languages                    List target languages\n";

int fail(const dmp::Error& error)
{
    std::fprintf(stderr, "%s: %s\n", dmp::error_code_to_string(error.code), error.message.c_str());
    return 1;
}

int usage(const QCommandLineParser& parser, const QString& problem)
{
    std::fprintf(stderr, "%s\n\n%s\n%s", qPrintable(problem), USAGE_COMMANDS,
                 qPrintable(parser.helpText()));
    return 2;
}

dmp::Result<DUB::TimedScript> loadScriptFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return dmp::Error::file_not_found(path.toStdString());
    }
    return DUB::TranscriptParser::parse(QString::fromUtf8(file.readAll()));
}

// Script from --script, else from the transcription command
dmp::Result<void> prepareScript(DUB::DubSession& session, const DUB::AppConfig& config,
                                const QCommandLineParser& parser)
{
    if (parser.isSet("script")) {
        auto script = loadScriptFile(parser.value("script"));
        if (script.is_error()) return script.error();
        session.setScript(script.value());
        return dmp::Result<void>();
    }
    if (config.transcribeCommand.isEmpty()) {
        return dmp::Error::invalid_arg("Set --transcribe-command (or DUB_TRANSCRIBE_COMMAND) "
                                       "or pass --script");
    }
    return session.transcribe(config.targetLanguage);
}

// --voice SPEAKER=VOICE, --dialog N=TEXT, --mute N
dmp::Result<void> applyEdits(DUB::DubSession& session, const QCommandLineParser& parser)
{
    for (const QString& assignment : parser.values("voice")) {
        const int eq = assignment.indexOf('=');
        if (eq <= 0) {
            return dmp::Error::invalid_arg("--voice expects SPEAKER=VOICE, got " +
                                           assignment.toStdString());
        }
        session.assignVoice(assignment.left(eq), assignment.mid(eq + 1));
    }
    for (const QString& edit : parser.values("dialog")) {
        const int eq = edit.indexOf('=');
        bool ok = false;
        const int index = eq > 0 ? edit.left(eq).toInt(&ok) : -1;
        if (!ok) {
            return dmp::Error::invalid_arg("--dialog expects N=TEXT, got " + edit.toStdString());
        }
        auto result = session.setDialog(index, edit.mid(eq + 1));
        if (result.is_error()) return result;
    }
    for (const QString& value : parser.values("mute")) {
        bool ok = false;
        const int index = value.toInt(&ok);
        if (!ok) {
            return dmp::Error::invalid_arg("--mute expects a segment index, got " +
                                           value.toStdString());
        }
        auto result = session.setMuted(index, true);
        if (result.is_error()) return result;
    }
    return dmp::Result<void>();
}

int runPlayer(const QString& sourcePath, const QString& dubPath, const DUB::AppConfig& config)
{
    DUB::DubbedPlayer player(config.syncConfig(), config.frameIntervalMs);
    auto opened = player.open(sourcePath, dubPath);
    if (opened.is_error()) {
        return fail(opened.error());
    }

    QWidget window;
    window.setWindowTitle(QString("%1 - dubbed").arg(sourcePath));
    auto* layout = new QVBoxLayout(&window);

    if (player.hasVideo()) {
        auto* video = new QVideoWidget(&window);
        video->setMinimumSize(640, 360);
        layout->addWidget(video, 1);
        player.setVideoOutput(video);
    }

    auto* controls = new QHBoxLayout();
    auto* playButton = new QPushButton("Play", &window);
    auto* slider = new QSlider(Qt::Horizontal, &window);
    auto* timeLabel = new QLabel("0.00 / 0.00", &window);
    slider->setRange(0, 0);
    controls->addWidget(playButton);
    controls->addWidget(slider, 1);
    controls->addWidget(timeLabel);
    layout->addLayout(controls);

    auto updateTime = [&player, timeLabel](double position) {
        timeLabel->setText(QString("%1 / %2").arg(position, 0, 'f', 2)
                                             .arg(player.durationSeconds(), 0, 'f', 2));
    };

    QObject::connect(playButton, &QPushButton::clicked, &player, [&player]() {
        if (player.isPlaying()) {
            player.pause();
        } else {
            player.play();
        }
    });
    QObject::connect(&player, &DUB::DubbedPlayer::playingChanged, playButton, [playButton](bool playing) {
        playButton->setText(playing ? "Pause" : "Play");
    });
    QObject::connect(&player, &DUB::DubbedPlayer::durationChanged, slider, [slider](double seconds) {
        slider->setRange(0, static_cast<int>(seconds * 1000.0));
    });
    QObject::connect(&player, &DUB::DubbedPlayer::positionChanged, slider,
                     [slider, updateTime](double seconds) {
        if (!slider->isSliderDown()) {
            slider->setValue(static_cast<int>(seconds * 1000.0));
        }
        updateTime(seconds);
    });
    QObject::connect(slider, &QSlider::sliderReleased, &player, [&player, slider]() {
        player.seek(slider->value() / 1000.0);
    });

    slider->setRange(0, static_cast<int>(player.durationSeconds() * 1000.0));
    window.resize(800, player.hasVideo() ? 520 : 80);
    window.show();

    int result = QCoreApplication::exec();
    qCInfo(dubMain, "Player closed");
    return result;
}

} // namespace

int main(int argc, char *argv[])
{
    // Only playback needs a window system
    const bool wantsGui = argc > 1 && qstrcmp(argv[1], "play") == 0;
    std::unique_ptr<QCoreApplication> app;
    if (wantsGui) {
        app = std::make_unique<QApplication>(argc, argv);
    } else {
        app = std::make_unique<QCoreApplication>(argc, argv);
    }
    QCoreApplication::setApplicationName("dubstudio");
    QCoreApplication::setApplicationVersion("1.0.0");

    // Info and above by default; QT_LOGGING_RULES still overrides
    QLoggingCategory::setFilterRules("dub.*.debug=false\ndub.*.info=true");

    QCommandLineParser parser;
    parser.setApplicationDescription("Timed speech dubbing: transcribe, re-voice and play media.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "transcribe | dub | preview | play | voices | languages");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    DUB::AppConfig::addOptions(parser);
    parser.addOption(QCommandLineOption("script", "Timed script JSON instead of transcribing.", "path"));
    parser.addOption(QCommandLineOption("voice", "Voice for a speaker (repeatable).", "SPEAKER=VOICE"));
    parser.addOption(QCommandLineOption("dialog", "Replace a segment's dialog (repeatable).", "N=TEXT"));
    parser.addOption(QCommandLineOption("mute", "Leave a segment out of the dub (repeatable).", "N"));
    parser.addOption(QCommandLineOption("segment", "Segment to preview.", "N"));
    parser.process(*app);

    auto resolved = DUB::AppConfig::resolve(parser);
    if (resolved.is_error()) {
        return fail(resolved.error());
    }
    const DUB::AppConfig config = resolved.value();

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        return usage(parser, "No command given.");
    }
    const QString command = args.first();

    if (command == "voices") {
        for (const DUB::VoiceInfo& voice : DUB::VoiceCatalog::voices()) {
            std::printf("%-8s %s %s\n", qPrintable(voice.id), qPrintable(voice.description),
                        qPrintable(voice.language));
        }
        return 0;
    }
    if (command == "languages") {
        for (const DUB::LanguageInfo& language : DUB::VoiceCatalog::languages()) {
            std::printf("%-3s %s\n", qPrintable(language.code), qPrintable(language.displayName));
        }
        return 0;
    }
    if (command == "play") {
        if (args.size() != 3) {
            return usage(parser, "play needs <source> <dub.wav>.");
        }
        return runPlayer(args[1], args[2], config);
    }
    if (command != "transcribe" && command != "dub" && command != "preview") {
        return usage(parser, QString("Unknown command '%1'.").arg(command));
    }
    if (args.size() != 2) {
        return usage(parser, QString("%1 needs <source>.").arg(command));
    }

    dmp::AudioContext::SetWorkerCount(config.decodeThreads);

    std::unique_ptr<DUB::ProcessTranscriptionService> transcriber;
    if (!config.transcribeCommand.isEmpty()) {
        transcriber = std::make_unique<DUB::ProcessTranscriptionService>(
            config.transcribeCommand, config.collaboratorTimeoutMs);
    }
    std::unique_ptr<DUB::ProcessSpeechSynthesisService> synthesizer;
    if (!config.ttsCommand.isEmpty()) {
        synthesizer = std::make_unique<DUB::ProcessSpeechSynthesisService>(
            config.ttsCommand, config.collaboratorTimeoutMs);
    }

    dmp::AssetStore store;
    DUB::DubSession session(transcriber.get(), synthesizer.get(), &store);
    session.setSynthesisConcurrency(config.synthesisConcurrency);

    auto loaded = session.loadSource(args[1]);
    if (loaded.is_error()) {
        return fail(loaded.error());
    }

    if (command == "transcribe") {
        if (config.transcribeCommand.isEmpty()) {
            return fail(dmp::Error::invalid_arg(
                "Set --transcribe-command (or DUB_TRANSCRIBE_COMMAND)"));
        }
        auto transcribed = session.transcribe(config.targetLanguage);
        if (transcribed.is_error()) {
            return fail(transcribed.error());
        }
        std::fputs(DUB::TranscriptParser::serialize(session.script()).constData(), stdout);
        return 0;
    }

    auto prepared = prepareScript(session, config, parser);
    if (prepared.is_error()) {
        return fail(prepared.error());
    }
    auto edited = applyEdits(session, parser);
    if (edited.is_error()) {
        return fail(edited.error());
    }

    if (command == "preview") {
        bool ok = false;
        const int index = parser.value("segment").toInt(&ok);
        if (!ok) {
            return usage(parser, "preview needs --segment N.");
        }
        auto preview = session.previewSegment(index);
        if (preview.is_error()) {
            return fail(preview.error());
        }
        const QString target = parser.isSet("output") ? config.outputPath
                                                      : QString("segment-%1.wav").arg(index);
        auto written = preview.value().WriteToFile(target.toStdString());
        if (written.is_error()) {
            return fail(written.error());
        }
        std::printf("%s\n", qPrintable(target));
        return 0;
    }

    // dub
    for (const QString& speaker : session.speakers()) {
        qCInfo(dubMain, "%s -> %s", qPrintable(speaker), qPrintable(session.voiceFor(speaker)));
    }
    auto dub = session.generateDub();
    if (dub.is_error()) {
        return fail(dub.error());
    }
    auto saved = session.saveDub(config.outputPath);
    if (saved.is_error()) {
        return fail(saved.error());
    }
    std::printf("%s\n", qPrintable(config.outputPath));
    session.reset();
    return 0;
}

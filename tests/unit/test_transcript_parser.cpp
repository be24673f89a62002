// Transcription output parsing, chunk model and voice catalog

#include <QtTest>

#include "core/models/timed_chunk.h"
#include "core/models/voice_catalog.h"
#include "core/services/transcript_parser.h"

using namespace DUB;

class TestTranscriptParser : public QObject
{
    Q_OBJECT

private slots:
    // ========================================================================
    // PARSING
    // ========================================================================

    void test_parse_plain_array() {
        auto result = TranscriptParser::parse(
            R"([{"start": 0.5, "end": 2.0, "text": "Hello", "speaker": "SPEAKER_01", "gender": "Female"},
                {"start": 2.5, "end": 4, "text": "Hi", "speaker": "SPEAKER_02", "gender": "male"}])");
        QVERIFY(result.is_ok());

        const TimedScript& script = result.value();
        QCOMPARE(script.size(), qsizetype(2));
        QCOMPARE(script[0].start, 0.5);
        QCOMPARE(script[0].end, 2.0);
        QCOMPARE(script[0].text, QString("Hello"));
        QCOMPARE(script[0].speaker, QString("SPEAKER_01"));
        QCOMPARE(script[0].gender, Gender::Female);
        QCOMPARE(script[1].end, 4.0);
        QCOMPARE(script[1].gender, Gender::Male);
        QCOMPARE(script[0].duration(), 1.5);
    }

    void test_parse_strips_json_fence() {
        auto result = TranscriptParser::parse(
            "```json\n[{\"start\": 0, \"end\": 1, \"text\": \"a\", \"speaker\": \"S\"}]\n```\n");
        QVERIFY(result.is_ok());
        QCOMPARE(result.value().size(), qsizetype(1));
        QCOMPARE(result.value()[0].gender, Gender::Unknown);
    }

    void test_parse_strips_bare_fence() {
        QCOMPARE(TranscriptParser::stripCodeFence("```\n[]\n```"), QString("[]"));
        QCOMPARE(TranscriptParser::stripCodeFence("  []  "), QString("[]"));
    }

    void test_parse_empty_array() {
        auto result = TranscriptParser::parse("[]");
        QVERIFY(result.is_ok());
        QVERIFY(result.value().isEmpty());
    }

    void test_null_or_unknown_gender_is_unknown() {
        auto result = TranscriptParser::parse(
            R"([{"start": 0, "end": 1, "text": "a", "speaker": "S", "gender": null},
                {"start": 1, "end": 2, "text": "b", "speaker": "S", "gender": "Robot"}])");
        QVERIFY(result.is_ok());
        QCOMPARE(result.value()[0].gender, Gender::Unknown);
        QCOMPARE(result.value()[1].gender, Gender::Unknown);
    }

    // ========================================================================
    // MALFORMED OUTPUT
    // ========================================================================

    void test_malformed_output_fails_whole() {
        const QStringList bad = {
            "not json",
            R"({"start": 0})",
            R"([1, 2])",
            R"([{"start": "0", "end": 1, "text": "a", "speaker": "S"}])",
            R"([{"start": 0, "text": "a", "speaker": "S"}])",
            R"([{"start": 0, "end": 1, "text": 7, "speaker": "S"}])",
            R"([{"start": 0, "end": 1, "text": "a"}])",
            R"([{"start": 0, "end": 1, "text": "a", "speaker": "S", "gender": 3}])",
            R"([{"start": 0, "end": 1, "text": "a", "speaker": "S"}, {"start": 1}])",
        };
        for (const QString& text : bad) {
            auto result = TranscriptParser::parse(text);
            QVERIFY2(result.is_error(), qPrintable(text));
            QCOMPARE(result.error().code, dmp::ErrorCode::CollaboratorFailure);
            QVERIFY(QString::fromStdString(result.error().message)
                        .startsWith("Transcription returned malformed data: "));
        }
    }

    // ========================================================================
    // SERIALIZE
    // ========================================================================

    void test_serialize_parses_back() {
        TimedScript script;
        TimedChunk a;
        a.start = 1.25;
        a.end = 3.0;
        a.text = QString::fromUtf8("Selamat pagi \"semua\"");
        a.speaker = "SPEAKER_00";
        a.gender = Gender::Female;
        script.append(a);

        auto result = TranscriptParser::parse(QString::fromUtf8(TranscriptParser::serialize(script)));
        QVERIFY(result.is_ok());
        QCOMPARE(result.value().size(), qsizetype(1));
        QCOMPARE(result.value()[0].text, a.text);
        QCOMPARE(result.value()[0].start, 1.25);
        QCOMPARE(result.value()[0].gender, Gender::Female);
    }

    // ========================================================================
    // GENDER
    // ========================================================================

    void test_gender_strings() {
        QCOMPARE(genderFromString(" FEMALE "), Gender::Female);
        QCOMPARE(genderFromString("Male"), Gender::Male);
        QCOMPARE(genderFromString(""), Gender::Unknown);
        QCOMPARE(genderToString(Gender::Male), QString("Male"));
        QCOMPARE(genderToString(Gender::Unknown), QString("Unknown"));
    }

    // ========================================================================
    // VOICE CATALOG
    // ========================================================================

    void test_voice_order_and_lookup() {
        const auto& voices = VoiceCatalog::voices();
        QCOMPARE(voices.size(), qsizetype(5));
        QCOMPARE(voices[0].id, QString("Kore"));
        QCOMPARE(voices[4].id, QString("Zephyr"));

        QVERIFY(VoiceCatalog::findVoice("Fenrir") != nullptr);
        QVERIFY(VoiceCatalog::findVoice("Nobody") == nullptr);
    }

    void test_voices_cycle_by_speaker_index() {
        QCOMPARE(VoiceCatalog::voiceForSpeakerIndex(0).id, QString("Kore"));
        QCOMPARE(VoiceCatalog::voiceForSpeakerIndex(1).id, QString("Puck"));
        QCOMPARE(VoiceCatalog::voiceForSpeakerIndex(5).id, QString("Kore"));
        QCOMPARE(VoiceCatalog::voiceForSpeakerIndex(7).id, QString("Charon"));
    }

    void test_languages() {
        QCOMPARE(VoiceCatalog::languages().size(), qsizetype(11));
        const LanguageInfo* ms = VoiceCatalog::findLanguage("ms");
        QVERIFY(ms != nullptr);
        QCOMPARE(ms->displayName, QString("Bahasa Malaysia"));
        QVERIFY(VoiceCatalog::findLanguage("xx") == nullptr);
    }

    void test_transcription_language_name() {
        QCOMPARE(VoiceCatalog::transcriptionLanguageName("ms"), QString("Malay"));
        QCOMPARE(VoiceCatalog::transcriptionLanguageName("fr"), QString("French"));
        QCOMPARE(VoiceCatalog::transcriptionLanguageName("xx"), QString("the selected language"));
    }
};

QTEST_MAIN(TestTranscriptParser)
#include "test_transcript_parser.moc"

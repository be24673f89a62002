// FFmpeg-backed media probing, audio loading and base64 payload decoding

#include <QtTest>
#include <QTemporaryDir>
#include <cmath>
#include <cstdlib>

#include <dub_media_platform/dmp_audio_file.h>
#include <dub_media_platform/dmp_base64.h>
#include <dub_media_platform/dmp_media_file.h>
#include <dub_media_platform/dmp_wav_encoder.h>

class TestDMPMediaIO : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir m_dir;
    std::string m_wav_path;

    static constexpr int FRAMES = 2400;  // 0.1s at 24 kHz

private slots:
    void initTestCase() {
        QVERIFY(m_dir.isValid());

        // Constant negative level: quantizes and decodes back exactly
        dmp::AudioBuffer tone(dmp::synthesis_format::FORMAT,
                              {std::vector<float>(FRAMES, -0.5f)});
        auto encoded = dmp::WavEncoder::Encode(tone);
        QVERIFY(encoded.is_ok());

        m_wav_path = m_dir.filePath("tone.wav").toStdString();
        QVERIFY(encoded.value().WriteToFile(m_wav_path).is_ok());
    }

    // ========================================================================
    // PROBE
    // ========================================================================

    void test_probe_reports_audio_stream() {
        auto info = dmp::MediaFile::Probe(m_wav_path);
        QVERIFY2(info.is_ok(), info.is_ok() ? "" : info.error().message.c_str());

        QVERIFY(info.value().has_audio);
        QVERIFY(!info.value().has_video);
        QCOMPARE(info.value().audio_sample_rate, 24000);
        QCOMPARE(info.value().audio_channels, 1);
        QVERIFY(std::fabs(info.value().duration_seconds() - 0.1) < 0.01);
        QCOMPARE(info.value().path, m_wav_path);
    }

    void test_probe_missing_file() {
        auto info = dmp::MediaFile::Probe(m_dir.filePath("nope.mp4").toStdString());
        QVERIFY(info.is_error());
        QCOMPARE(info.error().code, dmp::ErrorCode::FileNotFound);
    }

    void test_probe_garbage_file() {
        const std::string path = m_dir.filePath("garbage.bin").toStdString();
        dmp::EncodedAudioAsset junk(std::vector<uint8_t>(64, 0x5A), "application/octet-stream", "bin");
        QVERIFY(junk.WriteToFile(path).is_ok());

        auto info = dmp::MediaFile::Probe(path);
        QVERIFY(info.is_error());
        QVERIFY(info.error().code != dmp::ErrorCode::Ok);
    }

    // ========================================================================
    // LOAD
    // ========================================================================

    void test_load_in_native_format() {
        auto loaded = dmp::LoadAudioFile(m_wav_path, dmp::synthesis_format::FORMAT);
        QVERIFY2(loaded.is_ok(), loaded.is_ok() ? "" : loaded.error().message.c_str());

        const auto& buf = loaded.value();
        QCOMPARE(buf.channels(), 1);
        QCOMPARE(buf.sample_rate(), 24000);
        QVERIFY(std::llabs(buf.frames() - FRAMES) <= 32);
        QVERIFY(std::fabs(buf.channel_data(0)[FRAMES / 2] + 0.5f) < 1e-4f);
    }

    void test_load_resamples_and_upmixes() {
        const dmp::AudioFormat device{48000, 2};
        auto loaded = dmp::LoadAudioFile(m_wav_path, device);
        QVERIFY2(loaded.is_ok(), loaded.is_ok() ? "" : loaded.error().message.c_str());

        const auto& buf = loaded.value();
        QCOMPARE(buf.channels(), 2);
        QCOMPARE(buf.sample_rate(), 48000);
        QVERIFY(std::llabs(buf.frames() - 2 * FRAMES) <= 64);

        // Away from the resampler's edges the level is unchanged on both channels
        const int64_t mid = buf.frames() / 2;
        QVERIFY(std::fabs(buf.channel_data(0)[mid] + 0.5f) < 0.01f);
        QVERIFY(std::fabs(buf.channel_data(1)[mid] + 0.5f) < 0.01f);
    }

    void test_load_from_opened_file() {
        auto file = dmp::MediaFile::Open(m_wav_path);
        QVERIFY(file.is_ok());

        // Same file decoded twice: loader rewinds the demuxer
        auto first = dmp::LoadAudioFile(file.value(), dmp::synthesis_format::FORMAT);
        auto second = dmp::LoadAudioFile(file.value(), dmp::synthesis_format::FORMAT);
        QVERIFY(first.is_ok());
        QVERIFY(second.is_ok());
        QCOMPARE(first.value().frames(), second.value().frames());
    }

    void test_load_rejects_bad_arguments() {
        auto null_file = dmp::LoadAudioFile(std::shared_ptr<dmp::MediaFile>(),
                                            dmp::synthesis_format::FORMAT);
        QVERIFY(null_file.is_error());
        QCOMPARE(null_file.error().code, dmp::ErrorCode::InvalidArg);

        auto bad_format = dmp::LoadAudioFile(m_wav_path, dmp::AudioFormat{0, 1});
        QVERIFY(bad_format.is_error());
        QCOMPARE(bad_format.error().code, dmp::ErrorCode::InvalidArg);

        auto missing = dmp::LoadAudioFile(m_dir.filePath("nope.wav").toStdString(),
                                          dmp::synthesis_format::FORMAT);
        QVERIFY(missing.is_error());
        QCOMPARE(missing.error().code, dmp::ErrorCode::FileNotFound);
    }

    // ========================================================================
    // BASE64
    // ========================================================================

    void test_base64_decodes_bytes() {
        auto decoded = dmp::DecodeBase64("AAEC");
        QVERIFY(decoded.is_ok());
        QVERIFY(decoded.value() == std::vector<uint8_t>({0x00, 0x01, 0x02}));
    }

    void test_base64_ignores_whitespace() {
        auto decoded = dmp::DecodeBase64(" AA\nEC\r\n");
        QVERIFY(decoded.is_ok());
        QVERIFY(decoded.value() == std::vector<uint8_t>({0x00, 0x01, 0x02}));
    }

    void test_base64_empty_is_empty() {
        auto decoded = dmp::DecodeBase64("");
        QVERIFY(decoded.is_ok());
        QVERIFY(decoded.value().empty());
    }

    void test_base64_rejects_invalid_text() {
        auto decoded = dmp::DecodeBase64("not*base64!");
        QVERIFY(decoded.is_error());
        QCOMPARE(decoded.error().code, dmp::ErrorCode::DecodeFailed);
    }

    void test_base64_payload_is_pcm() {
        // 0x8000 little-endian = -32768 = -1.0
        auto decoded = dmp::DecodeBase64("AIA=");
        QVERIFY(decoded.is_ok());
        QVERIFY(decoded.value() == std::vector<uint8_t>({0x00, 0x80}));
    }
};

QTEST_MAIN(TestDMPMediaIO)
#include "test_dmp_media_io.moc"

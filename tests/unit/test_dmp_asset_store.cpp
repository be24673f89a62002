// Encoded asset lifetime: handles, resolution, release and save-to-file

#include <QtTest>
#include <QTemporaryDir>
#include <QFile>

#include <dub_media_platform/dmp_encoded_asset.h>

class TestDMPAssetStore : public QObject
{
    Q_OBJECT

private:
    static dmp::EncodedAudioAsset make_asset(std::vector<uint8_t> bytes) {
        return dmp::EncodedAudioAsset(std::move(bytes), "audio/wav", "wav");
    }

private slots:
    // ========================================================================
    // HANDLES
    // ========================================================================

    void test_register_issues_unique_handles() {
        dmp::AssetStore store;
        auto a = store.Register(make_asset({1, 2, 3}));
        auto b = store.Register(make_asset({4}));

        QVERIFY(a.valid());
        QVERIFY(b.valid());
        QVERIFY(a != b);
        QCOMPARE(a.url(), "dmp-asset:" + std::to_string(a.id));
        QVERIFY(a.url() != b.url());
        QCOMPARE(store.live_count(), size_t(2));
        store.ReleaseAll();
    }

    void test_default_handle_is_invalid() {
        dmp::AssetHandle none;
        QVERIFY(!none.valid());

        dmp::AssetStore store;
        auto resolved = store.Resolve(none);
        QVERIFY(resolved.is_error());
        QCOMPARE(resolved.error().code, dmp::ErrorCode::InvalidArg);
    }

    void test_resolve_returns_registered_bytes() {
        dmp::AssetStore store;
        auto handle = store.Register(make_asset({9, 8, 7}));

        auto resolved = store.Resolve(handle);
        QVERIFY(resolved.is_ok());
        QVERIFY(resolved.value().bytes() == std::vector<uint8_t>({9, 8, 7}));
        QCOMPARE(resolved.value().mime_type(), std::string("audio/wav"));
        store.Release(handle);
    }

    // ========================================================================
    // RELEASE
    // ========================================================================

    void test_release_once_then_noop() {
        dmp::AssetStore store;
        auto handle = store.Register(make_asset({1}));

        QVERIFY(store.Release(handle));
        QVERIFY(!store.Release(handle));
        QCOMPARE(store.live_count(), size_t(0));

        auto resolved = store.Resolve(handle);
        QVERIFY(resolved.is_error());
        QCOMPARE(resolved.error().code, dmp::ErrorCode::InvalidArg);
    }

    void test_released_bytes_outlive_handle_for_holders() {
        dmp::AssetStore store;
        auto handle = store.Register(make_asset({5, 6}));
        auto held = store.Resolve(handle);
        QVERIFY(held.is_ok());

        QVERIFY(store.Release(handle));
        QCOMPARE(held.value().size(), size_t(2));
    }

    void test_release_all_counts_live_assets() {
        dmp::AssetStore store;
        store.Register(make_asset({1}));
        auto second = store.Register(make_asset({2}));
        store.Register(make_asset({3}));
        QVERIFY(store.Release(second));

        QCOMPARE(store.ReleaseAll(), size_t(2));
        QCOMPARE(store.live_count(), size_t(0));
        QCOMPARE(store.ReleaseAll(), size_t(0));
    }

    void test_handles_not_reused_after_release() {
        dmp::AssetStore store;
        auto first = store.Register(make_asset({1}));
        store.Release(first);
        auto second = store.Register(make_asset({1}));
        QVERIFY(first != second);
        store.Release(second);
    }

    // ========================================================================
    // SAVE
    // ========================================================================

    void test_write_to_file() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("out.wav");

        auto asset = make_asset({'R', 'I', 'F', 'F'});
        auto written = asset.WriteToFile(path.toStdString());
        QVERIFY(written.is_ok());

        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QCOMPARE(file.readAll(), QByteArray("RIFF"));
    }

    void test_write_overwrites_existing_file() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const std::string path = dir.filePath("out.wav").toStdString();

        QVERIFY(make_asset({1, 2, 3, 4, 5, 6}).WriteToFile(path).is_ok());
        QVERIFY(make_asset({7}).WriteToFile(path).is_ok());

        QFile file(QString::fromStdString(path));
        QVERIFY(file.open(QIODevice::ReadOnly));
        QCOMPARE(file.size(), qint64(1));
    }

    void test_write_rejects_empty_path() {
        auto result = make_asset({1}).WriteToFile("");
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, dmp::ErrorCode::InvalidArg);
    }

    void test_write_into_missing_directory() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const std::string path = dir.filePath("missing/out.wav").toStdString();

        auto result = make_asset({1}).WriteToFile(path);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, dmp::ErrorCode::FileNotFound);
    }

    void test_suggested_filename_without_extension() {
        dmp::EncodedAudioAsset bare({1}, "application/octet-stream", "");
        QCOMPARE(bare.suggested_filename(), std::string("dubbed-audio"));
    }
};

QTEST_MAIN(TestDMPAssetStore)
#include "test_dmp_asset_store.moc"

#include <QtTest/QtTest>
#include "core/shared/settings_manager.h"

#include <QTemporaryDir>

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void cleanup();

    void testMissingKeysKeepDefaults();
    void testSaveLoadRoundTrip();
    void testLoadMissingOrCorruptFile();
    void testResolvePathsUnderDataDir();
    void testEnvironmentOverrides();
};

void TestSettingsManager::cleanup()
{
    qunsetenv("GHURFATI_CONFIG");
    qunsetenv("GHURFATI_DATA_DIR");
    qunsetenv("GHURFATI_MODELS_DIR");
}

void TestSettingsManager::testMissingKeysKeepDefaults()
{
    QJsonObject json;
    json[QStringLiteral("matchK")] = 3;
    json[QStringLiteral("categoryMismatchPenalty")] = 0.5;

    const gf::Settings settings = gf::SettingsManager::fromJson(json);
    QCOMPARE(settings.matchK, 3);
    QCOMPARE(settings.categoryMismatchPenalty, 0.5);
    QCOMPARE(settings.overfetchFactor, 4);
    QCOMPARE(settings.admissionCapacity, 64);
    QCOMPARE(settings.generationSlots, 1);
    QCOMPARE(settings.retryMaxAttempts, 3);
    QVERIFY(settings.embeddingEnabled);
}

void TestSettingsManager::testSaveLoadRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/settings.json"));

    gf::Settings settings;
    settings.generatorCommand = QStringLiteral("/opt/gen/render");
    settings.generatorArgs = {QStringLiteral("--fp16"), QStringLiteral("--steps=30")};
    settings.embeddingDimensions = 768;
    settings.retryMultiplier = 1.5;
    settings.embeddingEnabled = false;
    QVERIFY(gf::SettingsManager::saveTo(settings, path));

    const auto loaded = gf::SettingsManager::loadFrom(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->generatorCommand, settings.generatorCommand);
    QCOMPARE(loaded->generatorArgs, settings.generatorArgs);
    QCOMPARE(loaded->embeddingDimensions, 768);
    QCOMPARE(loaded->retryMultiplier, 1.5);
    QVERIFY(!loaded->embeddingEnabled);
}

void TestSettingsManager::testLoadMissingOrCorruptFile()
{
    QTemporaryDir dir;
    QVERIFY(!gf::SettingsManager::loadFrom(dir.filePath(QStringLiteral("absent.json"))).has_value());

    const QString corrupt = dir.filePath(QStringLiteral("corrupt.json"));
    QFile file(corrupt);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();
    QVERIFY(!gf::SettingsManager::loadFrom(corrupt).has_value());
}

void TestSettingsManager::testResolvePathsUnderDataDir()
{
    gf::Settings settings;
    settings.dataDir = QStringLiteral("/srv/ghurfati");
    settings.indexPath = QStringLiteral("/mnt/index/catalog.hnsw");
    gf::SettingsManager::resolvePaths(settings);

    QCOMPARE(settings.dbPath, QStringLiteral("/srv/ghurfati/jobs.db"));
    QCOMPARE(settings.imageRoot, QStringLiteral("/srv/ghurfati/images"));
    QCOMPARE(settings.indexPath, QStringLiteral("/mnt/index/catalog.hnsw"));
    QCOMPARE(settings.indexMetaPath, QStringLiteral("/srv/ghurfati/catalog.meta"));
    QCOMPARE(settings.catalogDbPath, QStringLiteral("/srv/ghurfati/catalog.db"));
    QCOMPARE(settings.modelsDir, QStringLiteral("/srv/ghurfati/models"));
}

void TestSettingsManager::testEnvironmentOverrides()
{
    qputenv("GHURFATI_CONFIG", "/etc/ghurfati/matcher.json");
    qputenv("GHURFATI_DATA_DIR", "/var/lib/ghurfati/");
    qputenv("GHURFATI_MODELS_DIR", "/opt/models");

    QCOMPARE(gf::SettingsManager::settingsFilePath(), QStringLiteral("/etc/ghurfati/matcher.json"));
    QCOMPARE(gf::SettingsManager::dataDirectory(), QStringLiteral("/var/lib/ghurfati"));

    gf::Settings settings;
    settings.modelsDir = QStringLiteral("/ignored");
    gf::SettingsManager::resolvePaths(settings);
    QCOMPARE(settings.dataDir, QStringLiteral("/var/lib/ghurfati"));
    QCOMPARE(settings.dbPath, QStringLiteral("/var/lib/ghurfati/jobs.db"));
    QCOMPARE(settings.modelsDir, QStringLiteral("/opt/models"));
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"

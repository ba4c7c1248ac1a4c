#include <QtTest/QtTest>

#include "core/models/model_manifest.h"
#include "core/models/model_registry.h"
#include "core/models/model_session.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

class TestModelRegistry : public QObject {
    Q_OBJECT

private slots:
    void testManifestParsesEntries();
    void testManifestSkipsIncompleteEntries();
    void testManifestRejectsBadRoot();
    void testManifestMalformedNormalizationKeepsDefaults();
    void testRegistryWithoutManifest();
    void testRegistryUnknownRole();
    void testRegistryFallbackChainTerminates();
    void testSessionFailsOnInvalidModel();
};

namespace {

QJsonObject encoderEntry(const QString& file, const QString& fallback = {})
{
    QJsonObject entry;
    entry.insert("name", "clip-vit-b32");
    entry.insert("file", file);
    entry.insert("modelId", "clip-vit-b32-v1");
    entry.insert("dimensions", 512);
    entry.insert("imageSize", 224);
    entry.insert("inputs", QJsonArray{"pixel_values"});
    entry.insert("outputs", QJsonArray{"image_embeds"});
    if (!fallback.isEmpty()) {
        entry.insert("fallbackRole", fallback);
    }
    return entry;
}

bool writeManifest(const QString& dir, const QJsonObject& models)
{
    QFile file(dir + "/manifest.json");
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    QJsonObject root;
    root.insert("models", models);
    return file.write(QJsonDocument(root).toJson()) > 0;
}

} // namespace

void TestModelRegistry::testManifestParsesEntries()
{
    QJsonObject models;
    QJsonObject entry = encoderEntry("clip.onnx");
    entry.insert("mean", QJsonArray{0.5, 0.5, 0.5});
    entry.insert("std", QJsonArray{0.25, 0.25, 0.25});
    entry.insert("intraOpThreads", 4);
    models.insert("region-encoder", entry);

    QJsonObject root;
    root.insert("models", models);
    const auto manifest = gf::ModelManifest::loadFromJson(root);
    QVERIFY(manifest.has_value());
    QCOMPARE(manifest->models.size(), size_t(1));

    const gf::ModelManifestEntry& parsed = manifest->models.at("region-encoder");
    QCOMPARE(parsed.name, QStringLiteral("clip-vit-b32"));
    QCOMPARE(parsed.file, QStringLiteral("clip.onnx"));
    QCOMPARE(parsed.modelId, QStringLiteral("clip-vit-b32-v1"));
    QCOMPARE(parsed.dimensions, 512);
    QCOMPARE(parsed.imageSize, 224);
    QCOMPARE(parsed.intraOpThreads, 4);
    QCOMPARE(parsed.mean[1], 0.5f);
    QCOMPARE(parsed.std[2], 0.25f);
    QCOMPARE(parsed.inputs.size(), size_t(1));
    QCOMPARE(parsed.inputs.front(), QStringLiteral("pixel_values"));
    QCOMPARE(parsed.outputs.front(), QStringLiteral("image_embeds"));
}

void TestModelRegistry::testManifestSkipsIncompleteEntries()
{
    QJsonObject noFile;
    noFile.insert("name", "broken");

    QJsonObject zeroSize = encoderEntry("x.onnx");
    zeroSize.insert("imageSize", 0);

    QJsonObject zeroDims = encoderEntry("y.onnx");
    zeroDims.insert("dimensions", 0);

    QJsonObject models;
    models.insert("region-encoder", encoderEntry("clip.onnx"));
    models.insert("zero-dims", zeroDims);
    models.insert("missing-file", noFile);
    models.insert("zero-size", zeroSize);
    models.insert("not-object", 42);

    QJsonObject root;
    root.insert("models", models);
    const auto manifest = gf::ModelManifest::loadFromJson(root);
    QVERIFY(manifest.has_value());
    QCOMPARE(manifest->models.size(), size_t(1));
    QVERIFY(manifest->models.count("region-encoder") == 1);
}

void TestModelRegistry::testManifestRejectsBadRoot()
{
    QVERIFY(!gf::ModelManifest::loadFromJson(QJsonObject()).has_value());

    QJsonObject root;
    root.insert("models", QJsonArray{});
    QVERIFY(!gf::ModelManifest::loadFromJson(root).has_value());

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QFile file(dir.filePath("manifest.json"));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ nope");
    file.close();
    QVERIFY(!gf::ModelManifest::loadFromFile(file.fileName()).has_value());
    QVERIFY(!gf::ModelManifest::loadFromFile(dir.filePath("absent.json")).has_value());
}

void TestModelRegistry::testManifestMalformedNormalizationKeepsDefaults()
{
    QJsonObject entry = encoderEntry("clip.onnx");
    entry.insert("mean", QJsonArray{0.1, 0.2});
    entry.insert("std", QJsonArray{0.2, 0.0, 0.2});

    QJsonObject models;
    models.insert("region-encoder", entry);
    QJsonObject root;
    root.insert("models", models);

    const auto manifest = gf::ModelManifest::loadFromJson(root);
    QVERIFY(manifest.has_value());
    const gf::ModelManifestEntry defaults;
    QVERIFY(manifest->models.at("region-encoder").mean == defaults.mean);
    QVERIFY(manifest->models.at("region-encoder").std == defaults.std);
}

void TestModelRegistry::testRegistryWithoutManifest()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    gf::ModelRegistry registry(dir.path());
    QVERIFY(registry.manifest().models.empty());
    QVERIFY(!registry.hasModel("region-encoder"));
    QVERIFY(registry.getSession("region-encoder") == nullptr);
}

void TestModelRegistry::testRegistryUnknownRole()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QJsonObject models;
    models.insert("region-encoder", encoderEntry("clip.onnx"));
    QVERIFY(writeManifest(dir.path(), models));

    gf::ModelRegistry registry(dir.path());
    QVERIFY(registry.hasModel("region-encoder"));
    QVERIFY(!registry.hasModel("text-encoder"));
    QVERIFY(registry.getSession("text-encoder") == nullptr);
    QCOMPARE(registry.modelsDir(), QDir::cleanPath(dir.path()));
}

void TestModelRegistry::testRegistryFallbackChainTerminates()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    // Two roles falling back to each other, neither with a model file.
    QJsonObject models;
    models.insert("region-encoder", encoderEntry("a.onnx", "region-encoder-small"));
    models.insert("region-encoder-small", encoderEntry("b.onnx", "region-encoder"));
    QVERIFY(writeManifest(dir.path(), models));

    gf::ModelRegistry registry(dir.path());
    QVERIFY(registry.getSession("region-encoder") == nullptr);

    // Failed roles are remembered, so asking again stays cheap and still fails.
    QVERIFY(registry.getSession("region-encoder-small") == nullptr);
    QVERIFY(registry.hasModel("region-encoder-small"));
}

void TestModelRegistry::testSessionFailsOnInvalidModel()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString modelPath = dir.filePath("garbage.onnx");
    QFile model(modelPath);
    QVERIFY(model.open(QIODevice::WriteOnly));
    model.write("not-a-real-onnx-model");
    model.close();

    gf::ModelManifestEntry entry;
    entry.name = QStringLiteral("garbage");
    entry.file = QStringLiteral("garbage.onnx");

    gf::ModelSession session(entry);
    QVERIFY(!session.initialize(modelPath));
    QVERIFY(!session.isAvailable());
    QVERIFY(session.session() == nullptr);
    QCOMPARE(session.manifest().name, QStringLiteral("garbage"));

    gf::ModelSession missing(entry);
    QVERIFY(!missing.initialize(dir.filePath("absent.onnx")));
    QVERIFY(missing.outputNames().empty());
}

QTEST_MAIN(TestModelRegistry)
#include "test_model_registry.moc"

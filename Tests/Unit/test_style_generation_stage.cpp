#include <QtTest/QtTest>
#include "core/generation/image_storage.h"
#include "core/generation/style_generation_stage.h"
#include "fake_backends.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <memory>

class TestStyleGenerationStage : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testResolveStaysUnderRoot();
    void testExistsRequiresNonEmptyFile();
    void testAllocateStyledIsStablePerJob();
    void testAllocateRejectsUnsafeJobIds();
    void testRemoveJobArtifacts();

    void testValidateRequest();
    void testGenerateStoresRendering();
    void testFailureRemovesPartialOutput();
    void testValidationFailureSkipsBackend();

private:
    gf::StyleParams modernParams() const;
    void writeFile(const QString& relative, const QByteArray& content);

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<gf::ImageStorage> m_storage;
    std::unique_ptr<gf::test::FakeGenerationBackend> m_backend;
};

void TestStyleGenerationStage::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_storage = std::make_unique<gf::ImageStorage>(m_dir->filePath("images"));
    QVERIFY(m_storage->ensureRoot());
    m_backend = std::make_unique<gf::test::FakeGenerationBackend>();
    writeFile(QStringLiteral("uploads/room.jpg"), "jpeg");
}

void TestStyleGenerationStage::cleanup()
{
    m_backend.reset();
    m_storage.reset();
    m_dir.reset();
}

gf::StyleParams TestStyleGenerationStage::modernParams() const
{
    gf::StyleParams params;
    params.style = QStringLiteral("modern");
    params.strength = 0.6;
    return params;
}

void TestStyleGenerationStage::writeFile(const QString& relative, const QByteArray& content)
{
    const QString path = m_storage->rootDir() + QLatin1Char('/') + relative;
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
}

// ── ImageStorage ────────────────────────────────────────────

void TestStyleGenerationStage::testResolveStaysUnderRoot()
{
    const QString root = m_storage->rootDir();
    QCOMPARE(m_storage->resolve("uploads/room.jpg").value(), root + "/uploads/room.jpg");
    QCOMPARE(m_storage->resolve("uploads/../uploads/room.jpg").value(), root + "/uploads/room.jpg");

    QVERIFY(!m_storage->resolve(QString()).has_value());
    QVERIFY(!m_storage->resolve("   ").has_value());
    QVERIFY(!m_storage->resolve("/etc/passwd").has_value());
    QVERIFY(!m_storage->resolve("../outside.jpg").has_value());
    QVERIFY(!m_storage->resolve("uploads/../../outside.jpg").has_value());
    QVERIFY(!m_storage->resolve(".").has_value());
}

void TestStyleGenerationStage::testExistsRequiresNonEmptyFile()
{
    QVERIFY(m_storage->exists("uploads/room.jpg"));
    QVERIFY(!m_storage->exists("uploads/absent.jpg"));
    QVERIFY(!m_storage->exists("uploads"));

    writeFile(QStringLiteral("uploads/empty.jpg"), QByteArray());
    QVERIFY(!m_storage->exists("uploads/empty.jpg"));
}

void TestStyleGenerationStage::testAllocateStyledIsStablePerJob()
{
    const auto first = m_storage->allocateStyled("job-42");
    QVERIFY(first.has_value());
    QCOMPARE(first->ref, QStringLiteral("styled/job-42/styled.png"));
    QVERIFY(QFileInfo(QFileInfo(first->path).absolutePath()).isDir());

    writeFile(first->ref, "old rendering");
    const auto second = m_storage->allocateStyled("job-42");
    QVERIFY(second.has_value());
    QCOMPARE(second->path, first->path);
    QVERIFY(!QFile::exists(second->path));
}

void TestStyleGenerationStage::testAllocateRejectsUnsafeJobIds()
{
    QVERIFY(!m_storage->allocateStyled(QString()).has_value());
    QVERIFY(!m_storage->allocateStyled("../escape").has_value());
    QVERIFY(!m_storage->allocateStyled("a/b").has_value());
    QVERIFY(!m_storage->removeJobArtifacts("../uploads"));
}

void TestStyleGenerationStage::testRemoveJobArtifacts()
{
    const auto allocation = m_storage->allocateStyled("job-7");
    QVERIFY(allocation.has_value());
    writeFile(allocation->ref, "rendering");
    QVERIFY(m_storage->exists(allocation->ref));

    QVERIFY(m_storage->removeJobArtifacts("job-7"));
    QVERIFY(!m_storage->exists(allocation->ref));
    QVERIFY(m_storage->removeJobArtifacts("job-7"));
    QVERIFY(m_storage->exists("uploads/room.jpg"));
}

// ── StyleGenerationStage ────────────────────────────────────

void TestStyleGenerationStage::testValidateRequest()
{
    gf::StyleGenerationStage stage(m_backend.get(), m_storage.get(), 1000);

    QVERIFY(!stage.validateRequest("uploads/room.jpg", modernParams()).has_value());

    gf::StyleParams unknown = modernParams();
    unknown.style = QStringLiteral("baroque-space-age");
    const auto badStyle = stage.validateRequest("uploads/room.jpg", unknown);
    QVERIFY(badStyle.has_value());
    QCOMPARE(badStyle->code, QStringLiteral("invalid_style"));

    const auto badRef = stage.validateRequest("/abs/room.jpg", modernParams());
    QVERIFY(badRef.has_value());
    QCOMPARE(badRef->kind, gf::ErrorKind::Validation);
    QCOMPARE(badRef->code, QStringLiteral("invalid_photo_ref"));

    const auto missing = stage.validateRequest("uploads/nope.jpg", modernParams());
    QVERIFY(missing.has_value());
    QCOMPARE(missing->code, QStringLiteral("photo_not_found"));
}

void TestStyleGenerationStage::testGenerateStoresRendering()
{
    gf::StyleGenerationStage stage(m_backend.get(), m_storage.get(), 4321);

    const auto result = stage.generate("job-1", "uploads/room.jpg", modernParams());
    QVERIFY(result.ok());
    QCOMPARE(result.value->jobId, QStringLiteral("job-1"));
    QCOMPARE(result.value->imageRef, QStringLiteral("styled/job-1/styled.png"));
    QCOMPARE(result.value->params.style, QStringLiteral("modern"));
    QVERIFY(result.value->generationMs >= 0);
    QVERIFY(m_storage->exists(result.value->imageRef));

    const gf::GenerationRequest request = m_backend->lastRequest();
    QCOMPARE(request.jobId, QStringLiteral("job-1"));
    QCOMPARE(request.photoPath, m_storage->resolve("uploads/room.jpg").value());
    QCOMPARE(request.outputPath, m_storage->resolve(result.value->imageRef).value());
    QCOMPARE(request.timeoutMs, 4321);
    QCOMPARE(request.params.strength.value(), 0.6);
}

void TestStyleGenerationStage::testFailureRemovesPartialOutput()
{
    gf::StyleGenerationStage stage(m_backend.get(), m_storage.get(), 1000);

    // The backend leaves a partial file behind before failing.
    m_backend->setHook([](const gf::GenerationRequest& request) {
        QFile partial(request.outputPath);
        if (partial.open(QIODevice::WriteOnly)) {
            partial.write("partial");
        }
    });
    m_backend->scriptFailure(gf::StageError::transient(QStringLiteral("generation_timeout"),
                                                       QStringLiteral("slow")));

    const auto result = stage.generate("job-2", "uploads/room.jpg", modernParams());
    QVERIFY(!result.ok());
    QCOMPARE(result.error.kind, gf::ErrorKind::Transient);
    QCOMPARE(result.error.code, QStringLiteral("generation_timeout"));
    QVERIFY(!m_storage->exists("styled/job-2/styled.png"));
}

void TestStyleGenerationStage::testValidationFailureSkipsBackend()
{
    gf::StyleGenerationStage stage(m_backend.get(), m_storage.get(), 1000);

    gf::StyleParams params = modernParams();
    params.strength = 1.5;
    const auto result = stage.generate("job-3", "uploads/room.jpg", params);
    QVERIFY(!result.ok());
    QCOMPARE(result.error.kind, gf::ErrorKind::Validation);
    QCOMPARE(result.error.code, QStringLiteral("invalid_strength"));
    QCOMPARE(m_backend->calls(), 0);
}

QTEST_MAIN(TestStyleGenerationStage)
#include "test_style_generation_stage.moc"

#include <QtTest/QtTest>
#include "core/extraction/process_region_detector.h"
#include "core/generation/process_generation_backend.h"
#include "core/shared/process_runner.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <memory>

class TestProcessSidecars : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testExpandArguments();
    void testRunProcessCapturesOutput();
    void testRunProcessTimesOut();
    void testRunProcessFailsToStart();

    void testParseDetectorOutput();
    void testParseRejectsMalformedDocument();
    void testDetectRunsScript();
    void testDetectExitCodes();
    void testDetectTimeout();
    void testDetectWithoutCommand();

    void testGeneratorWritesOutput();
    void testGeneratorReceivesRequestOnStdin();
    void testGeneratorExitCodes();
    void testGeneratorSuccessWithoutOutput();

private:
    QString writeScript(const QString& name, const QByteArray& body);

    std::unique_ptr<QTemporaryDir> m_dir;
};

void TestProcessSidecars::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void TestProcessSidecars::cleanup()
{
    m_dir.reset();
}

QString TestProcessSidecars::writeScript(const QString& name, const QByteArray& body)
{
    const QString path = m_dir->filePath(name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write("#!/bin/sh\n");
        file.write(body);
        file.write("\n");
    }
    return path;
}

// ── process runner ──────────────────────────────────────────

void TestProcessSidecars::testExpandArguments()
{
    const QStringList expanded = gf::expandArguments(
        {QStringLiteral("--in={input}"), QStringLiteral("{style}"), QStringLiteral("plain")},
        {{QStringLiteral("input"), QStringLiteral("/tmp/a.jpg")},
         {QStringLiteral("style"), QStringLiteral("modern")}});
    QCOMPARE(expanded, QStringList({QStringLiteral("--in=/tmp/a.jpg"),
                                    QStringLiteral("modern"),
                                    QStringLiteral("plain")}));
}

void TestProcessSidecars::testRunProcessCapturesOutput()
{
    const QString script = writeScript("echo.sh", "cat\necho err >&2\nexit 4");
    const gf::ProcessOutcome outcome =
        gf::runProcess(QStringLiteral("/bin/sh"), {script}, 5000, QByteArray("hello"));
    QCOMPARE(outcome.status, gf::ProcessOutcome::Status::Finished);
    QCOMPARE(outcome.exitCode, 4);
    QCOMPARE(outcome.standardOutput, QByteArray("hello"));
    QCOMPARE(outcome.standardError, QStringLiteral("err"));
}

void TestProcessSidecars::testRunProcessTimesOut()
{
    const QString script = writeScript("sleep.sh", "sleep 5");
    const gf::ProcessOutcome outcome = gf::runProcess(QStringLiteral("/bin/sh"), {script}, 200);
    QCOMPARE(outcome.status, gf::ProcessOutcome::Status::TimedOut);
    QVERIFY(outcome.durationMs < 5000);
}

void TestProcessSidecars::testRunProcessFailsToStart()
{
    const gf::ProcessOutcome outcome =
        gf::runProcess(m_dir->filePath("does-not-exist"), {}, 2000);
    QCOMPARE(outcome.status, gf::ProcessOutcome::Status::FailedToStart);
}

// ── region detector ─────────────────────────────────────────

void TestProcessSidecars::testParseDetectorOutput()
{
    const QByteArray output = R"({"regions":[
        {"box":[0.1,0.2,0.3,0.4],"category":" Sofa ","score":0.93,"embedding":[1,0,0]},
        {"box":[0.5,0.5,0.2,0.2],"category":"lamp","score":0.4},
        {"box":[0.9,0.9,0.5,0.5],"category":"rug","score":0.8},
        {"box":[0.1,0.1],"category":"bed","score":0.9},
        {"category":"chair","score":0.7}
    ]})";

    const auto result = gf::ProcessRegionDetector::parseOutput(output);
    QVERIFY(result.ok());
    QCOMPARE(result.value->size(), size_t(2));

    const gf::DetectedRegion& sofa = result.value->at(0);
    QCOMPARE(sofa.category, QStringLiteral("sofa"));
    QCOMPARE(sofa.box.x, 0.1);
    QCOMPARE(sofa.box.height, 0.4);
    QVERIFY(qFuzzyCompare(sofa.score, 0.93f));
    QCOMPARE(sofa.embedding, std::vector<float>({1.0f, 0.0f, 0.0f}));

    const gf::DetectedRegion& lamp = result.value->at(1);
    QCOMPARE(lamp.category, QStringLiteral("lamp"));
    QVERIFY(lamp.embedding.empty());
}

void TestProcessSidecars::testParseRejectsMalformedDocument()
{
    for (const QByteArray& output : {QByteArray("not json"), QByteArray("[]"),
                                     QByteArray(R"({"regions":{}})"), QByteArray()}) {
        const auto result = gf::ProcessRegionDetector::parseOutput(output);
        QVERIFY(!result.ok());
        QCOMPARE(result.error.kind, gf::ErrorKind::Transient);
        QCOMPARE(result.error.code, QStringLiteral("detector_malformed_output"));
    }

    const auto empty = gf::ProcessRegionDetector::parseOutput(R"({"regions":[]})");
    QVERIFY(empty.ok());
    QVERIFY(empty.value->empty());
}

void TestProcessSidecars::testDetectRunsScript()
{
    const QString script = writeScript("detect.sh",
        "test -f \"$1\" || exit 3\n"
        "echo '{\"regions\":[{\"box\":[0,0,0.5,0.5],\"category\":\"sofa\",\"score\":0.9}]}'");
    const QString image = m_dir->filePath("image.png");
    {
        QFile file(image);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("png");
    }

    gf::ProcessRegionDetector detector(QStringLiteral("/bin/sh"),
                                       {script, QStringLiteral("{input}")}, 5000);
    const auto result = detector.detect(image);
    QVERIFY(result.ok());
    QCOMPARE(result.value->size(), size_t(1));
    QCOMPARE(result.value->front().category, QStringLiteral("sofa"));

    const auto missing = detector.detect(m_dir->filePath("absent.png"));
    QVERIFY(!missing.ok());
    QCOMPARE(missing.error.kind, gf::ErrorKind::Validation);
    QCOMPARE(missing.error.code, QStringLiteral("corrupt_image"));
}

void TestProcessSidecars::testDetectExitCodes()
{
    const QString unavailable = writeScript("busy.sh", "exit 75");
    gf::ProcessRegionDetector busy(QStringLiteral("/bin/sh"), {unavailable}, 5000);
    const auto busyResult = busy.detect(QStringLiteral("x"));
    QVERIFY(!busyResult.ok());
    QCOMPARE(busyResult.error.kind, gf::ErrorKind::Transient);
    QCOMPARE(busyResult.error.code, QStringLiteral("detector_unavailable"));

    const QString broken = writeScript("broken.sh", "exit 1");
    gf::ProcessRegionDetector failing(QStringLiteral("/bin/sh"), {broken}, 5000);
    const auto failed = failing.detect(QStringLiteral("x"));
    QVERIFY(!failed.ok());
    QCOMPARE(failed.error.kind, gf::ErrorKind::Transient);
    QCOMPARE(failed.error.code, QStringLiteral("detector_failed"));
}

void TestProcessSidecars::testDetectTimeout()
{
    const QString script = writeScript("slow.sh", "sleep 5");
    gf::ProcessRegionDetector detector(QStringLiteral("/bin/sh"), {script}, 200);
    const auto result = detector.detect(QStringLiteral("x"));
    QVERIFY(!result.ok());
    QCOMPARE(result.error.kind, gf::ErrorKind::Transient);
    QCOMPARE(result.error.code, QStringLiteral("extraction_timeout"));
}

void TestProcessSidecars::testDetectWithoutCommand()
{
    gf::ProcessRegionDetector detector(QString(), {}, 1000);
    const auto result = detector.detect(QStringLiteral("x"));
    QVERIFY(!result.ok());
    QCOMPARE(result.error.code, QStringLiteral("detector_unavailable"));
}

// ── generation backend ──────────────────────────────────────

void TestProcessSidecars::testGeneratorWritesOutput()
{
    const QString script = writeScript("gen.sh", "cat >/dev/null\ncp \"$1\" \"$2\"");
    const QString photo = m_dir->filePath("room.jpg");
    {
        QFile file(photo);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("jpeg-bytes");
    }

    gf::ProcessGenerationBackend backend(
        QStringLiteral("/bin/sh"),
        {script, QStringLiteral("{input}"), QStringLiteral("{output}"), QStringLiteral("{style}")});

    gf::GenerationRequest request;
    request.jobId = QStringLiteral("job-1");
    request.photoPath = photo;
    request.outputPath = m_dir->filePath("styled.png");
    request.params.style = QStringLiteral("modern");
    request.timeoutMs = 5000;

    QVERIFY(!backend.generate(request).has_value());
    QFile output(request.outputPath);
    QVERIFY(output.open(QIODevice::ReadOnly));
    QCOMPARE(output.readAll(), QByteArray("jpeg-bytes"));
}

void TestProcessSidecars::testGeneratorReceivesRequestOnStdin()
{
    const QString script = writeScript("stdin.sh", "cat > \"$1\"");
    gf::ProcessGenerationBackend backend(QStringLiteral("/bin/sh"),
                                         {script, QStringLiteral("{output}")});

    gf::GenerationRequest request;
    request.jobId = QStringLiteral("job-7");
    request.photoPath = QStringLiteral("/photos/room.jpg");
    request.outputPath = m_dir->filePath("request.json");
    request.params.style = QStringLiteral("industrial");
    request.params.strength = 0.25;
    request.params.roomCategory = QStringLiteral("office");
    request.timeoutMs = 5000;

    QVERIFY(!backend.generate(request).has_value());

    QFile written(request.outputPath);
    QVERIFY(written.open(QIODevice::ReadOnly));
    const QJsonObject payload = QJsonDocument::fromJson(written.readAll()).object();
    QCOMPARE(payload.value("jobId").toString(), QStringLiteral("job-7"));
    QCOMPARE(payload.value("input").toString(), QStringLiteral("/photos/room.jpg"));
    QCOMPARE(payload.value("style").toString(), QStringLiteral("industrial"));
    QCOMPARE(payload.value("strength").toDouble(), 0.25);
}

void TestProcessSidecars::testGeneratorExitCodes()
{
    gf::GenerationRequest request;
    request.jobId = QStringLiteral("job-2");
    request.outputPath = m_dir->filePath("never.png");
    request.params.style = QStringLiteral("modern");
    request.timeoutMs = 5000;

    const QString rejected = writeScript("reject.sh", "cat >/dev/null\nexit 2");
    const auto invalid = gf::ProcessGenerationBackend(QStringLiteral("/bin/sh"), {rejected})
                             .generate(request);
    QVERIFY(invalid.has_value());
    QCOMPARE(invalid->kind, gf::ErrorKind::Validation);
    QCOMPARE(invalid->code, QStringLiteral("invalid_style"));

    const QString busy = writeScript("busy.sh", "cat >/dev/null\nexit 75");
    const auto unavailable = gf::ProcessGenerationBackend(QStringLiteral("/bin/sh"), {busy})
                                 .generate(request);
    QVERIFY(unavailable.has_value());
    QCOMPARE(unavailable->kind, gf::ErrorKind::Transient);
    QCOMPARE(unavailable->code, QStringLiteral("generator_unavailable"));

    const QString slow = writeScript("slow.sh", "sleep 5");
    request.timeoutMs = 200;
    const auto timedOut = gf::ProcessGenerationBackend(QStringLiteral("/bin/sh"), {slow})
                              .generate(request);
    QVERIFY(timedOut.has_value());
    QCOMPARE(timedOut->kind, gf::ErrorKind::Transient);
    QCOMPARE(timedOut->code, QStringLiteral("generation_timeout"));

    const auto unconfigured = gf::ProcessGenerationBackend(QString(), {}).generate(request);
    QVERIFY(unconfigured.has_value());
    QCOMPARE(unconfigured->code, QStringLiteral("generator_unavailable"));
}

void TestProcessSidecars::testGeneratorSuccessWithoutOutput()
{
    const QString script = writeScript("noop.sh", "cat >/dev/null\nexit 0");
    gf::ProcessGenerationBackend backend(QStringLiteral("/bin/sh"), {script});

    gf::GenerationRequest request;
    request.jobId = QStringLiteral("job-3");
    request.outputPath = m_dir->filePath("missing.png");
    request.params.style = QStringLiteral("modern");
    request.timeoutMs = 5000;

    const auto error = backend.generate(request);
    QVERIFY(error.has_value());
    QCOMPARE(error->kind, gf::ErrorKind::Transient);
    QCOMPARE(error->code, QStringLiteral("empty_output"));
}

QTEST_MAIN(TestProcessSidecars)
#include "test_process_sidecars.moc"

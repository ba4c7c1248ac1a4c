#include <QtTest/QtTest>

#include "core/ipc/message.h"
#include "core/ipc/service_base.h"

#include <QDir>

namespace {

class ScopedEnvVar {
public:
    ScopedEnvVar(const char* key, const QByteArray& value)
        : m_key(key)
        , m_hadOriginal(qEnvironmentVariableIsSet(key))
        , m_original(qgetenv(key))
    {
        qputenv(m_key, value);
    }

    ~ScopedEnvVar()
    {
        if (m_hadOriginal) {
            qputenv(m_key, m_original);
        } else {
            qunsetenv(m_key);
        }
    }

private:
    const char* m_key;
    bool m_hadOriginal = false;
    QByteArray m_original;
};

// Adds an "echo" method on top of the built-in ones.
class EchoService final : public gf::ServiceBase {
public:
    EchoService()
        : gf::ServiceBase(QStringLiteral("echo-unit"))
    {
        registerMethod(QStringLiteral("echo"), [](uint64_t id, const QJsonObject& params) {
            return gf::IpcMessage::makeResponse(id, params);
        });
    }

    QJsonObject dispatch(const QJsonObject& request) const
    {
        return handleRequest(request);
    }
};

} // namespace

class TestServiceBase : public QObject {
    Q_OBJECT

private slots:
    void testSocketDirectoryOverride();
    void testSocketDirectoryFallsBackToRuntime();
    void testPingReportsService();
    void testSubclassRoutesOwnMethods();
    void testUnknownMethodIsNotFound();
    void testShutdownAcknowledges();
};

void TestServiceBase::testSocketDirectoryOverride()
{
    const QByteArray runtimeRaw = "/tmp/gf-runtime/../gf-runtime";
    const QByteArray socketRaw = "/tmp/gf-sockets/./nested/..";

    ScopedEnvVar runtimeEnv("GHURFATI_RUNTIME_DIR", runtimeRaw);
    ScopedEnvVar socketEnv("GHURFATI_SOCKET_DIR", socketRaw);

    QCOMPARE(gf::ServiceBase::runtimeDirectory(), QStringLiteral("/tmp/gf-runtime"));
    QCOMPARE(gf::ServiceBase::socketDirectory(), QStringLiteral("/tmp/gf-sockets"));
    QCOMPARE(gf::ServiceBase::socketPath(QStringLiteral("matcher")),
             QStringLiteral("/tmp/gf-sockets/matcher.sock"));
}

void TestServiceBase::testSocketDirectoryFallsBackToRuntime()
{
    ScopedEnvVar runtimeEnv("GHURFATI_RUNTIME_DIR", "/tmp/gf-fallback/./x/..");
    ScopedEnvVar socketEnv("GHURFATI_SOCKET_DIR", QByteArray());

    QCOMPARE(gf::ServiceBase::socketDirectory(), QStringLiteral("/tmp/gf-fallback"));
    QCOMPARE(gf::ServiceBase::socketPath(QStringLiteral("matcher")),
             QStringLiteral("/tmp/gf-fallback/matcher.sock"));
}

void TestServiceBase::testPingReportsService()
{
    EchoService service;
    const QJsonObject response =
        service.dispatch(gf::IpcMessage::makeRequest(11, QStringLiteral("ping")));

    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    QCOMPARE(response.value(QStringLiteral("id")).toInteger(), qint64(11));
    const QJsonObject result = response.value(QStringLiteral("result")).toObject();
    QVERIFY(result.value(QStringLiteral("pong")).toBool());
    QCOMPARE(result.value(QStringLiteral("service")).toString(), QStringLiteral("echo-unit"));
    QVERIFY(result.value(QStringLiteral("timestamp")).toInteger() > 0);
}

void TestServiceBase::testSubclassRoutesOwnMethods()
{
    EchoService service;
    const QJsonObject params{{QStringLiteral("jobId"), QStringLiteral("job-5")}};
    const QJsonObject response =
        service.dispatch(gf::IpcMessage::makeRequest(4, QStringLiteral("echo"), params));

    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    QCOMPARE(response.value(QStringLiteral("result")).toObject(), params);
}

void TestServiceBase::testUnknownMethodIsNotFound()
{
    EchoService service;
    const QJsonObject response =
        service.dispatch(gf::IpcMessage::makeRequest(27, QStringLiteral("restyle")));

    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("error"));
    QCOMPARE(response.value(QStringLiteral("id")).toInteger(), qint64(27));
    const QJsonObject error = response.value(QStringLiteral("error")).toObject();
    QCOMPARE(error.value(QStringLiteral("code")).toInt(),
             static_cast<int>(gf::IpcErrorCode::NotFound));
    QVERIFY(error.value(QStringLiteral("message")).toString().contains(QStringLiteral("restyle")));
}

void TestServiceBase::testShutdownAcknowledges()
{
    EchoService service;
    const QJsonObject response =
        service.dispatch(gf::IpcMessage::makeRequest(3, QStringLiteral("shutdown")));

    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    QVERIFY(response.value(QStringLiteral("result")).toObject()
                .value(QStringLiteral("shutting_down")).toBool());

    // The queued quit must not outlive this test.
    QCoreApplication::removePostedEvents(QCoreApplication::instance());
}

QTEST_MAIN(TestServiceBase)
#include "test_service_base.moc"

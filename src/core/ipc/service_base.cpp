#include "core/ipc/service_base.h"
#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QJsonObject>
#include <QPointer>

#include <sys/types.h>
#include <unistd.h>

#include <cstdio>

namespace gf {

namespace {

// Empty when unset or blank.
QString envDirectory(const char* name)
{
    const QString raw = qEnvironmentVariable(name).trimmed();
    return raw.isEmpty() ? QString() : QDir::cleanPath(raw);
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>(this))
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });

    registerMethod(QStringLiteral("ping"), [this](uint64_t id, const QJsonObject&) {
        return IpcMessage::makeResponse(id, QJsonObject{
            {QStringLiteral("pong"), true},
            {QStringLiteral("service"), m_serviceName},
            {QStringLiteral("timestamp"), QDateTime::currentMSecsSinceEpoch()},
        });
    });

    registerMethod(QStringLiteral("shutdown"), [this](uint64_t id, const QJsonObject&) {
        LOG_INFO(gfIpc, "%s: shutdown requested", qPrintable(m_serviceName));
        // Queued so the acknowledgement is written before the loop exits.
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
        return IpcMessage::makeResponse(id, QJsonObject{{QStringLiteral("shutting_down"), true}});
    });
}

ServiceBase::~ServiceBase() = default;

int ServiceBase::run()
{
    if (!prepare()) {
        return fail("initialization failed");
    }

    const QString path = socketPath(m_serviceName);
    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        LOG_ERROR(gfIpc, "%s: cannot create socket directory %s",
                  qPrintable(m_serviceName), qPrintable(dir));
        return fail("no socket directory");
    }
    if (!m_server->listen(path)) {
        return fail("cannot listen");
    }

    LOG_INFO(gfIpc, "%s: listening on %s", qPrintable(m_serviceName), qPrintable(path));
    std::fputs("ready\n", stdout);
    std::fflush(stdout);

    const int exitCode = QCoreApplication::exec();
    m_server->close();
    teardown();
    LOG_INFO(gfIpc, "%s: stopped (exit code %d)", qPrintable(m_serviceName), exitCode);
    return exitCode;
}

int ServiceBase::fail(const char* what)
{
    LOG_ERROR(gfIpc, "%s: %s", qPrintable(m_serviceName), what);
    teardown();
    return 1;
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir(socketDirectory()).filePath(serviceName + QStringLiteral(".sock"));
}

QString ServiceBase::runtimeDirectory()
{
    const QString configured = envDirectory("GHURFATI_RUNTIME_DIR");
    return configured.isEmpty()
        ? QStringLiteral("/tmp/ghurfati-%1").arg(getuid())
        : configured;
}

QString ServiceBase::socketDirectory()
{
    const QString configured = envDirectory("GHURFATI_SOCKET_DIR");
    return configured.isEmpty() ? runtimeDirectory() : configured;
}

bool ServiceBase::prepare()
{
    return true;
}

void ServiceBase::teardown()
{
}

void ServiceBase::registerMethod(const QString& method, MethodHandler handler)
{
    m_methods.insert(method, std::move(handler));
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request) const
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const uint64_t id = IpcMessage::requestId(request);

    const auto it = m_methods.constFind(method);
    if (it == m_methods.constEnd()) {
        LOG_WARN(gfIpc, "%s: unknown method '%s'", qPrintable(m_serviceName), qPrintable(method));
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("Unknown method: %1").arg(method));
    }
    return it.value()(id, IpcMessage::params(request));
}

void ServiceBase::sendNotification(const QString& method, const QJsonObject& params)
{
    const QJsonObject envelope = IpcMessage::makeNotification(method, params);
    QPointer<SocketServer> server(m_server.get());
    QMetaObject::invokeMethod(m_server.get(), [server, envelope]() {
        if (server) {
            server->broadcast(envelope);
        }
    }, Qt::QueuedConnection);
}

} // namespace gf

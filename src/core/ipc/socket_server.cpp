#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"

namespace gf {

namespace {

constexpr int kLivenessProbeMs = 150;

bool someoneAnswersOn(const QString& socketPath)
{
    QLocalSocket probe;
    probe.connectToServer(socketPath);
    if (!probe.waitForConnected(kLivenessProbeMs)) {
        return false;
    }
    probe.disconnectFromServer();
    return true;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>(this))
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    connect(m_server.get(), &QLocalServer::newConnection, this, &SocketServer::accept);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    if (!m_server->listen(socketPath)) {
        if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
            LOG_ERROR(gfIpc, "listen(%s): %s", qPrintable(socketPath),
                      qPrintable(m_server->errorString()));
            return false;
        }
        if (someoneAnswersOn(socketPath)) {
            LOG_ERROR(gfIpc, "%s is held by another running process", qPrintable(socketPath));
            return false;
        }

        LOG_WARN(gfIpc, "Replacing stale socket %s", qPrintable(socketPath));
        QLocalServer::removeServer(socketPath);
        if (!m_server->listen(socketPath)) {
            LOG_ERROR(gfIpc, "listen(%s) after removing stale socket: %s",
                      qPrintable(socketPath), qPrintable(m_server->errorString()));
            return false;
        }
    }
    return true;
}

void SocketServer::close()
{
    const QList<QLocalSocket*> clients = m_pending.keys();
    m_pending.clear();
    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        client->abort();
        client->deleteLater();
    }

    if (m_server->isListening()) {
        LOG_DEBUG(gfIpc, "Closing %s", qPrintable(m_server->fullServerName()));
        m_server->close();
    }
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

void SocketServer::broadcast(const QJsonObject& notification)
{
    const QByteArray frame = IpcMessage::encode(notification);
    if (frame.isEmpty()) {
        LOG_WARN(gfIpc, "Dropping notification that does not fit in a frame");
        return;
    }
    for (auto it = m_pending.keyBegin(); it != m_pending.keyEnd(); ++it) {
        (*it)->write(frame);
        (*it)->flush();
    }
}

void SocketServer::accept()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        m_pending.insert(client, QByteArray());
        connect(client, &QLocalSocket::readyRead, this, [this, client]() { consume(client); });
        connect(client, &QLocalSocket::disconnected, this, [this, client]() { forget(client); });
        LOG_DEBUG(gfIpc, "Client connected, %d open", static_cast<int>(m_pending.size()));
    }
}

void SocketServer::forget(QLocalSocket* client)
{
    if (m_pending.remove(client) == 0) {
        return;
    }
    client->disconnect(this);
    client->deleteLater();
    LOG_DEBUG(gfIpc, "Client gone, %d open", static_cast<int>(m_pending.size()));
}

QJsonObject SocketServer::answer(const QJsonObject& request) const
{
    if (!m_handler) {
        return IpcMessage::makeError(IpcMessage::requestId(request), IpcErrorCode::InternalError,
                                     QStringLiteral("Service has no request handler"));
    }
    return m_handler(request);
}

void SocketServer::consume(QLocalSocket* client)
{
    auto slot = m_pending.find(client);
    if (slot == m_pending.end()) {
        return;
    }
    slot->append(client->readAll());
    if (slot->size() > kMaxPendingBytes || IpcMessage::isOversized(*slot)) {
        LOG_ERROR(gfIpc, "Oversized frame from client, closing the connection");
        forget(client);
        client->abort();
        return;
    }

    // The handler may re-enter the event loop, so look the buffer up again
    // on every pass.
    for (;;) {
        slot = m_pending.find(client);
        if (slot == m_pending.end()) {
            return;
        }
        const std::optional<IpcMessage::DecodeResult> frame = IpcMessage::decode(*slot);
        if (!frame) {
            return;
        }
        slot->remove(0, frame->bytesConsumed);

        const QString type = frame->json.value(QStringLiteral("type")).toString();
        if (type == QLatin1String("request")) {
            const QByteArray reply = IpcMessage::encode(answer(frame->json));
            if (!reply.isEmpty()) {
                client->write(reply);
                client->flush();
            }
        } else if (type == QLatin1String("notification")) {
            answer(frame->json);
        } else {
            LOG_WARN(gfIpc, "Ignoring frame of type '%s'", qPrintable(type));
        }
    }
}

} // namespace gf

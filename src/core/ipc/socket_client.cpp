#include "core/ipc/socket_client.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <utility>

namespace gf {

namespace {

constexpr int kWaitSliceMs = 50;

} // namespace

SocketClient::SocketClient(QObject* parent)
    : QObject(parent)
    , m_socket(std::make_unique<QLocalSocket>(this))
{
}

SocketClient::~SocketClient()
{
    disconnect();
}

bool SocketClient::connectToServer(const QString& socketPath, int timeoutMs)
{
    const QString path = socketPath.trimmed();
    if (path.isEmpty() || timeoutMs <= 0) {
        return false;
    }
    if (isConnected() && m_socket->serverName() == path) {
        return true;
    }

    m_socket->abort();
    m_pending.clear();
    m_notifications.clear();
    m_socket->connectToServer(path);
    if (!m_socket->waitForConnected(timeoutMs)) {
        LOG_DEBUG(gfIpc, "connect(%s): %s", qPrintable(path), qPrintable(m_socket->errorString()));
        return false;
    }
    return true;
}

void SocketClient::disconnect()
{
    if (m_socket->state() != QLocalSocket::UnconnectedState) {
        m_socket->disconnectFromServer();
    }
    m_pending.clear();
}

bool SocketClient::isConnected() const
{
    return m_socket->state() == QLocalSocket::ConnectedState;
}

std::optional<QJsonObject> SocketClient::sendRequest(const QString& method,
                                                     const QJsonObject& params,
                                                     int timeoutMs)
{
    if (!isConnected()) {
        LOG_WARN(gfIpc, "%s not sent: client is not connected", qPrintable(method));
        return std::nullopt;
    }

    const uint64_t id = m_nextRequestId++;
    const QByteArray frame = IpcMessage::encode(IpcMessage::makeRequest(id, method, params));
    if (frame.isEmpty()) {
        return std::nullopt;
    }

    m_awaitedId = id;
    m_reply.reset();
    m_socket->write(frame);
    m_socket->flush();
    pumpUntil([this]() { return m_reply.has_value(); }, timeoutMs);
    m_awaitedId = 0;

    if (!m_reply) {
        LOG_WARN(gfIpc, "%s (id %llu): no reply within %d ms",
                 qPrintable(method), static_cast<unsigned long long>(id), timeoutMs);
    }
    return std::exchange(m_reply, std::nullopt);
}

std::optional<QJsonObject> SocketClient::waitForNotification(const QString& method, int timeoutMs)
{
    std::optional<QJsonObject> found = takeNotification(method);
    if (!found) {
        pumpUntil([&]() { return (found = takeNotification(method)).has_value(); }, timeoutMs);
    }
    return found;
}

void SocketClient::pumpUntil(const std::function<bool()>& done, int timeoutMs)
{
    QElapsedTimer clock;
    clock.start();
    while (!done() && isConnected()) {
        const qint64 left = timeoutMs - clock.elapsed();
        if (left <= 0) {
            return;
        }
        if (m_socket->bytesAvailable() == 0) {
            m_socket->waitForReadyRead(static_cast<int>(std::min<qint64>(left, kWaitSliceMs)));
        }
        drainSocket();
    }
}

std::optional<QJsonObject> SocketClient::takeNotification(const QString& method)
{
    const auto it = std::find_if(m_notifications.begin(), m_notifications.end(),
                                 [&](const Notification& n) { return n.method == method; });
    if (it == m_notifications.end()) {
        return std::nullopt;
    }
    const QJsonObject params = it->params;
    m_notifications.erase(it);
    return params;
}

void SocketClient::drainSocket()
{
    m_pending.append(m_socket->readAll());
    if (m_pending.size() > kMaxPendingBytes || IpcMessage::isOversized(m_pending)) {
        LOG_ERROR(gfIpc, "Oversized frame from server, dropping the connection");
        m_pending.clear();
        m_socket->abort();
        return;
    }

    while (const std::optional<IpcMessage::DecodeResult> frame = IpcMessage::decode(m_pending)) {
        m_pending.remove(0, frame->bytesConsumed);
        const QJsonObject& msg = frame->json;
        const QString type = msg.value(QStringLiteral("type")).toString();

        if (type == QLatin1String("notification")) {
            m_notifications.append(Notification{msg.value(QStringLiteral("method")).toString(),
                                                IpcMessage::params(msg)});
        } else if (type == QLatin1String("response") || type == QLatin1String("error")) {
            const uint64_t id = IpcMessage::requestId(msg);
            if (m_awaitedId != 0 && id == m_awaitedId) {
                m_reply = msg;
            } else {
                LOG_DEBUG(gfIpc, "Dropping late reply for request %llu",
                          static_cast<unsigned long long>(id));
            }
        }
    }
}

} // namespace gf

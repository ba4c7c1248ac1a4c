#pragma once

#include "core/ipc/message.h"

#include <QList>
#include <QLocalSocket>
#include <QObject>

#include <functional>
#include <memory>
#include <optional>

namespace gf {

// Synchronous client for a ServiceBase socket.
//
// Calls block on the socket itself rather than spinning an event loop, so it
// is safe to use from test bodies and tools that have none running.
// Notifications arriving while a call waits are queued for
// waitForNotification().
class SocketClient : public QObject {
    Q_OBJECT
public:
    static constexpr int kMaxPendingBytes = 2 * IpcMessage::kMaxMessageSize;

    explicit SocketClient(QObject* parent = nullptr);
    ~SocketClient() override;

    bool connectToServer(const QString& socketPath, int timeoutMs = 5000);
    void disconnect();
    bool isConnected() const;

    // The response or error envelope; nullopt when the connection drops or
    // nothing arrives in time.
    std::optional<QJsonObject> sendRequest(const QString& method,
                                           const QJsonObject& params = {},
                                           int timeoutMs = 30000);

    // Params of the oldest queued or next arriving notification named |method|.
    std::optional<QJsonObject> waitForNotification(const QString& method, int timeoutMs);

private:
    struct Notification {
        QString method;
        QJsonObject params;
    };

    // Reads frames until |done| holds, the deadline passes or the peer leaves.
    void pumpUntil(const std::function<bool()>& done, int timeoutMs);
    void drainSocket();
    std::optional<QJsonObject> takeNotification(const QString& method);

    std::unique_ptr<QLocalSocket> m_socket;
    QByteArray m_pending;
    uint64_t m_nextRequestId = 1;
    uint64_t m_awaitedId = 0;
    std::optional<QJsonObject> m_reply;
    QList<Notification> m_notifications;
};

} // namespace gf

#pragma once

#include "core/ipc/message.h"

#include <QHash>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>

#include <functional>
#include <memory>

namespace gf {

// QLocalServer speaking length-prefixed JSON frames.
//
// Every "request" frame is handed to the request handler and the returned
// envelope is written back on the same connection. "notification" frames run
// the handler and drop its reply. All of this happens on the thread owning
// the server, so the handler never runs concurrently with itself.
class SocketServer : public QObject {
    Q_OBJECT
public:
    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    // Per-connection cap on unparsed bytes.
    static constexpr int kMaxPendingBytes = 2 * IpcMessage::kMaxMessageSize;

    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    // A socket file nobody answers on is treated as left over from a crash
    // and replaced; a live one makes listen() fail.
    bool listen(const QString& socketPath);
    void close();

    void setRequestHandler(RequestHandler handler);

    // Writes |notification| to every open connection.
    void broadcast(const QJsonObject& notification);

private:
    void accept();
    void consume(QLocalSocket* client);
    void forget(QLocalSocket* client);
    QJsonObject answer(const QJsonObject& request) const;

    std::unique_ptr<QLocalServer> m_server;
    QHash<QLocalSocket*, QByteArray> m_pending;
    RequestHandler m_handler;
};

} // namespace gf

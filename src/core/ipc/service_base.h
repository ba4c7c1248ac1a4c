#pragma once

#include "core/ipc/socket_server.h"

#include <QCoreApplication>
#include <QHash>
#include <QString>

#include <functional>
#include <memory>

namespace gf {

// A sidecar process answering framed JSON requests on a local socket.
//
// Subclasses register their methods by name; "ping" and "shutdown" are built
// in. run() owns the process lifecycle: prepare(), listen, print the "ready"
// banner the parent waits for, spin the event loop, teardown().
class ServiceBase : public QObject {
    Q_OBJECT
public:
    // Receives the request id and its "params" object.
    using MethodHandler = std::function<QJsonObject(uint64_t id, const QJsonObject& params)>;

    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Returns the process exit code.
    int run();

    const QString& serviceName() const { return m_serviceName; }

    // <socketDirectory()>/<serviceName>.sock
    static QString socketPath(const QString& serviceName);

    // GHURFATI_RUNTIME_DIR, else /tmp/ghurfati-<uid>.
    static QString runtimeDirectory();
    // GHURFATI_SOCKET_DIR, else the runtime directory.
    static QString socketDirectory();

protected:
    // Runs before the socket is opened; false aborts run() with exit code 1.
    virtual bool prepare();
    // Runs once the event loop has returned, and after a failed start.
    virtual void teardown();

    // A later registration for the same name replaces the earlier one.
    void registerMethod(const QString& method, MethodHandler handler);

    // Routes one request envelope to its handler. Unknown methods answer NOT_FOUND.
    QJsonObject handleRequest(const QJsonObject& request) const;

    // Broadcasts to every connected client. Safe from any thread.
    void sendNotification(const QString& method, const QJsonObject& params = {});

private:
    int fail(const char* what);

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
    QHash<QString, MethodHandler> m_methods;
};

} // namespace gf

#pragma once

#include "core/ipc/socket_client.h"

#include <QJsonObject>
#include <QProcess>
#include <QString>
#include <QTemporaryDir>

#include <optional>

namespace gf::test {

// Runs ghurfati-matcher against a private data directory and socket
// directory, and keeps one connected SocketClient to it.
class MatcherProcess {
public:
    MatcherProcess();
    ~MatcherProcess();

    MatcherProcess(const MatcherProcess&) = delete;
    MatcherProcess& operator=(const MatcherProcess&) = delete;

    // Waits for the "ready" banner and a successful ping.
    bool start(const QString& dataDir, const QString& configPath, int readyTimeoutMs = 30000);
    // Asks for shutdown and reaps the process.
    void stop();

    bool isRunning() const;
    SocketClient& client() { return m_client; }

    // Never empty: a missing reply comes back as a TIMEOUT error envelope.
    QJsonObject request(const QString& method, const QJsonObject& params = {},
                        int timeoutMs = 10000);

    // Submits a job and returns its id, or an empty string when refused.
    QString submit(const QJsonObject& params);

    // Waits for the jobFinished notification of |jobId| and returns the
    // getStatus payload. nullopt when no notification arrives in time.
    std::optional<QJsonObject> waitForJob(const QString& jobId, int timeoutMs = 30000);

    static QString binaryPath();

private:
    bool waitForBanner(int timeoutMs);
    bool connectAndPing(int timeoutMs);

    QTemporaryDir m_socketDir;
    QString m_socketPath;
    QProcess m_process;
    SocketClient m_client;
};

} // namespace gf::test

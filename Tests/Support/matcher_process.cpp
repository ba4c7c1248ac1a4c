#include "matcher_process.h"

#include "ipc_test_utils.h"

#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTest>

#include <algorithm>

namespace gf::test {

namespace {

int remainingMs(const QElapsedTimer& timer, int budgetMs)
{
    return std::max(0, budgetMs - static_cast<int>(timer.elapsed()));
}

} // namespace

// Socket paths are limited to ~100 bytes, so stay directly under /tmp.
MatcherProcess::MatcherProcess()
    : m_socketDir(QStringLiteral("/tmp/gf-matcher-XXXXXX"))
{
}

MatcherProcess::~MatcherProcess()
{
    stop();
}

QString MatcherProcess::binaryPath()
{
    const QString name = QStringLiteral("ghurfati-matcher");
    const QFileInfo sibling(QDir(QCoreApplication::applicationDirPath()).filePath(name));
    if (sibling.isFile() && sibling.isExecutable()) {
        return sibling.canonicalFilePath();
    }
    return QStandardPaths::findExecutable(name);
}

bool MatcherProcess::start(const QString& dataDir, const QString& configPath, int readyTimeoutMs)
{
    const QString binary = binaryPath();
    if (binary.isEmpty() || !m_socketDir.isValid()) {
        qWarning() << "ghurfati-matcher binary or socket directory unavailable";
        return false;
    }
    m_socketPath = QDir(m_socketDir.path()).filePath(QStringLiteral("matcher.sock"));

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("GHURFATI_SOCKET_DIR"), m_socketDir.path());
    env.insert(QStringLiteral("GHURFATI_DATA_DIR"), dataDir);
    env.insert(QStringLiteral("GHURFATI_CONFIG"), configPath);

    m_process.setProcessEnvironment(env);
    m_process.setProcessChannelMode(QProcess::ForwardedErrorChannel);
    m_process.start(binary, QStringList());
    if (!m_process.waitForStarted(5000)) {
        qWarning() << "ghurfati-matcher failed to start:" << m_process.errorString();
        return false;
    }

    QElapsedTimer timer;
    timer.start();
    if (!waitForBanner(readyTimeoutMs)
        || !connectAndPing(std::max(1000, remainingMs(timer, readyTimeoutMs)))) {
        qWarning() << "ghurfati-matcher did not become ready";
        stop();
        return false;
    }
    return true;
}

bool MatcherProcess::waitForBanner(int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();
    QByteArray output;
    while (timer.elapsed() < timeoutMs) {
        if (m_process.state() == QProcess::NotRunning) {
            return false;
        }
        m_process.waitForReadyRead(50);
        output += m_process.readAllStandardOutput();
        if (output.startsWith("ready\n") || output.contains("\nready\n")) {
            return true;
        }
    }
    return false;
}

bool MatcherProcess::connectAndPing(int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < timeoutMs) {
        if (m_client.isConnected() || m_client.connectToServer(m_socketPath, 200)) {
            const QJsonObject pong = request(QStringLiteral("ping"), {},
                                             std::max(200, remainingMs(timer, timeoutMs)));
            if (isResponse(pong)) {
                return true;
            }
            m_client.disconnect();
        }
        QTest::qWait(25);
    }
    return false;
}

void MatcherProcess::stop()
{
    if (m_client.isConnected()) {
        // The reply may race the service's exit; either way it is going down.
        (void)m_client.sendRequest(QStringLiteral("shutdown"), {}, 1000);
    }
    m_client.disconnect();

    if (m_process.state() != QProcess::NotRunning && !m_process.waitForFinished(5000)) {
        m_process.terminate();
        if (!m_process.waitForFinished(3000)) {
            m_process.kill();
            m_process.waitForFinished(2000);
        }
    }
}

bool MatcherProcess::isRunning() const
{
    return m_process.state() != QProcess::NotRunning;
}

QJsonObject MatcherProcess::request(const QString& method, const QJsonObject& params,
                                    int timeoutMs)
{
    if (std::optional<QJsonObject> reply = m_client.sendRequest(method, params, timeoutMs)) {
        return *reply;
    }
    return noReplyError(method, timeoutMs, m_socketPath);
}

QString MatcherProcess::submit(const QJsonObject& params)
{
    const QJsonObject reply = request(QStringLiteral("submit"), params);
    if (!isResponse(reply)) {
        qWarning() << "submit refused:" << errorCodeString(reply) << errorReason(reply);
        return QString();
    }
    return resultPayload(reply).value(QStringLiteral("jobId")).toString();
}

std::optional<QJsonObject> MatcherProcess::waitForJob(const QString& jobId, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();
    while (true) {
        const int remaining = remainingMs(timer, timeoutMs);
        if (remaining <= 0) {
            return std::nullopt;
        }
        const std::optional<QJsonObject> finished =
            m_client.waitForNotification(QStringLiteral("jobFinished"), remaining);
        if (!finished) {
            return std::nullopt;
        }
        if (finished->value(QStringLiteral("jobId")).toString() == jobId) {
            break;
        }
    }

    const QJsonObject reply =
        request(QStringLiteral("getStatus"), {{QStringLiteral("jobId"), jobId}});
    if (!isResponse(reply)) {
        return std::nullopt;
    }
    return resultPayload(reply);
}

} // namespace gf::test

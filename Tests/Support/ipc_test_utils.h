#pragma once

#include <QJsonObject>
#include <QString>

namespace gf::test {

bool isResponse(const QJsonObject& message);
bool isError(const QJsonObject& message);
QJsonObject resultPayload(const QJsonObject& message);
QJsonObject errorPayload(const QJsonObject& message);

// "error.codeString" and the matcher's "error.reason" of an error envelope.
QString errorCodeString(const QJsonObject& message);
QString errorReason(const QJsonObject& message);

// Error envelope standing in for a request that got no reply.
QJsonObject noReplyError(const QString& method, int timeoutMs, const QString& socketPath);

} // namespace gf::test

#include "core/ipc/message.h"
#include "core/shared/logging.h"
#include <QJsonDocument>
#include <QtEndian>

namespace gf {

namespace {

quint32 readLengthPrefix(const QByteArray& buffer)
{
    return qFromBigEndian<quint32>(buffer.constData());
}

} // namespace

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray body = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (body.size() > kMaxMessageSize) {
        LOG_WARN(gfIpc, "Message of %lld bytes exceeds the %d byte frame limit",
                 static_cast<long long>(body.size()), kMaxMessageSize);
        return {};
    }

    QByteArray frame(kHeaderSize, Qt::Uninitialized);
    qToBigEndian(static_cast<quint32>(body.size()), frame.data());
    frame.append(body);
    return frame;
}

bool IpcMessage::isOversized(const QByteArray& buffer)
{
    if (buffer.size() < kHeaderSize) {
        return false;
    }
    return readLengthPrefix(buffer) > static_cast<quint32>(kMaxMessageSize);
}

std::optional<IpcMessage::DecodeResult> IpcMessage::decode(const QByteArray& buffer)
{
    if (buffer.size() < kHeaderSize || isOversized(buffer)) {
        return std::nullopt;
    }
    const int bodySize = static_cast<int>(readLengthPrefix(buffer));
    if (buffer.size() - kHeaderSize < bodySize) {
        return std::nullopt;
    }

    DecodeResult frame;
    frame.bytesConsumed = kHeaderSize + bodySize;

    QJsonParseError parseError;
    const QJsonDocument doc =
        QJsonDocument::fromJson(buffer.mid(kHeaderSize, bodySize), &parseError);
    if (doc.isObject()) {
        frame.json = doc.object();
    } else {
        LOG_WARN(gfIpc, "Skipping frame that is not a JSON object (%s)",
                 parseError.error == QJsonParseError::NoError
                     ? "wrong top-level type" : qPrintable(parseError.errorString()));
    }
    return frame;
}

namespace {

QJsonObject envelope(const char* type, uint64_t id)
{
    return QJsonObject{
        {QStringLiteral("type"), QLatin1String(type)},
        {QStringLiteral("id"), static_cast<qint64>(id)},
    };
}

// Empty params are left out of the envelope.
void attachParams(QJsonObject& message, const QJsonObject& params)
{
    if (!params.isEmpty()) {
        message.insert(QStringLiteral("params"), params);
    }
}

} // namespace

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject message = envelope("request", id);
    message.insert(QStringLiteral("method"), method);
    attachParams(message, params);
    return message;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject message = envelope("response", id);
    message.insert(QStringLiteral("result"), result);
    return message;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& text)
{
    QJsonObject message = envelope("error", id);
    message.insert(QStringLiteral("error"), QJsonObject{
        {QStringLiteral("code"), static_cast<int>(code)},
        {QStringLiteral("codeString"), ipcErrorCodeToString(code)},
        {QStringLiteral("message"), text},
    });
    return message;
}

QJsonObject IpcMessage::makeNotification(const QString& method, const QJsonObject& params)
{
    QJsonObject message{
        {QStringLiteral("type"), QStringLiteral("notification")},
        {QStringLiteral("method"), method},
    };
    attachParams(message, params);
    return message;
}

uint64_t IpcMessage::requestId(const QJsonObject& message)
{
    return static_cast<uint64_t>(message.value(QStringLiteral("id")).toInteger());
}

QJsonObject IpcMessage::params(const QJsonObject& message)
{
    return message.value(QStringLiteral("params")).toObject();
}

} // namespace gf

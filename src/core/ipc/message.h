#pragma once

#include "core/shared/ipc_messages.h"
#include <QByteArray>
#include <QJsonObject>
#include <cstdint>
#include <optional>

namespace gf {

// Wire framing for the matcher socket: 4-byte big-endian payload length
// followed by a compact UTF-8 JSON object.
class IpcMessage {
public:
    static QByteArray encode(const QJsonObject& json);

    struct DecodeResult {
        QJsonObject json;
        int bytesConsumed = 0;
    };

    // Returns nullopt while the buffer holds less than one complete frame.
    // A frame that is complete but not a JSON object is consumed and
    // reported with an empty json so the reader can skip past it.
    static std::optional<DecodeResult> decode(const QByteArray& buffer);

    // True when the length prefix already announces a frame above kMaxMessageSize.
    static bool isOversized(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& text);
    static QJsonObject makeNotification(const QString& method, const QJsonObject& params = {});

    static uint64_t requestId(const QJsonObject& message);
    static QJsonObject params(const QJsonObject& message);

    static constexpr int kHeaderSize = 4;
    static constexpr int kMaxMessageSize = 16 * 1024 * 1024;
};

} // namespace gf

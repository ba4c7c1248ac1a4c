#pragma once

#include "core/shared/types.h"

#include <QString>

namespace gf {

// Error codes carried in "error.code" on the matcher socket. The numeric
// values are part of the wire format.
enum class IpcErrorCode : int {
    InvalidParams    = 1,   // malformed request or rejected job parameters
    Timeout          = 2,   // raised client-side when no reply arrives
    NotFound         = 4,   // unknown method or job id
    InternalError    = 6,
    CapacityExceeded = 10,  // admission queue full
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:    return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::Timeout:          return QStringLiteral("TIMEOUT");
    case IpcErrorCode::NotFound:         return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::InternalError:    return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::CapacityExceeded: return QStringLiteral("CAPACITY_EXCEEDED");
    }
    return QStringLiteral("UNKNOWN");
}

// Wire code for a request the pipeline refused synchronously.
inline IpcErrorCode ipcErrorCodeForKind(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Validation: return IpcErrorCode::InvalidParams;
    case ErrorKind::Capacity:   return IpcErrorCode::CapacityExceeded;
    default:                    return IpcErrorCode::InternalError;
    }
}

} // namespace gf

#include "sockd/ServiceError.hpp"

namespace sockd {

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::AlreadyRunning:           return "AlreadyRunning";
        case ErrorKind::StartTimeout:             return "StartTimeout";
        case ErrorKind::StopFailed:               return "StopFailed";
        case ErrorKind::NotRunning:               return "NotRunning";
        case ErrorKind::ConnectionError:          return "ConnectionError";
        case ErrorKind::SocketInUse:              return "SocketInUse";
        case ErrorKind::TransportPermissionError: return "TransportPermissionError";
        case ErrorKind::PathPermissionError:      return "PathPermissionError";
        case ErrorKind::PrivilegeError:           return "PrivilegeError";
        case ErrorKind::BadCommand:               return "BadCommand";
    }
    return "Unknown";
}

} // namespace sockd

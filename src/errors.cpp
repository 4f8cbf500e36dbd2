/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/errors.hpp>

namespace peerlink {

    const char *errorKindName(ErrorKind k) {
        switch (k) {
            case ErrorKind::TransportError:    return "TransportError";
            case ErrorKind::EncodeError:       return "EncodeError";
            case ErrorKind::PermissionDenied:  return "PermissionDenied";
            case ErrorKind::ProtocolError:     return "ProtocolError";
            case ErrorKind::ConfigError:       return "ConfigError";
            case ErrorKind::InvalidTransition: return "InvalidTransition";
            case ErrorKind::Timeout:           return "Timeout";
            case ErrorKind::NotFound:          return "NotFound";
        }
        return "Unknown";
    }

} // namespace peerlink

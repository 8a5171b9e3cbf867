#include <webswarm/core/error.hpp>

namespace webswarm {

const char* error_kind_str(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::TRANSPORT: return "transport";
        case ErrorKind::PROTOCOL: return "protocol";
        case ErrorKind::STATE_CONFLICT: return "state_conflict";
        case ErrorKind::ORACLE: return "oracle";
    }
    return "unknown";
}

} // namespace webswarm

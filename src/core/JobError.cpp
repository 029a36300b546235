#include "thermo/core/JobError.hpp"

namespace thermo {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Document:              return "document";
        case ErrorKind::Transport:             return "transport";
        case ErrorKind::Render:                return "render";
        case ErrorKind::Encode:                return "encode";
        case ErrorKind::CapabilityUnsupported: return "capability unsupported";
        case ErrorKind::Rejected:              return "rejected";
    }
    return "unknown";
}

std::string JobError::describe() const {
    std::string out = toString(kind);
    out += ": ";
    out += message;
    return out;
}

JobError JobError::fromErrorCode(ErrorKind kind, std::string message, const std::error_code& ec) {
    if (ec) {
        message += " (";
        message += ec.message();
        message += ')';
    }
    return {kind, std::move(message)};
}

} // namespace thermo

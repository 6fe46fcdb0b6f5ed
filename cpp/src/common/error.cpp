#include "vecpart/common/error.hpp"

namespace vecpart {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UNSUPPORTED_TYPE: return "UNSUPPORTED_TYPE";
        case ErrorKind::STREAM_CORRUPTION: return "STREAM_CORRUPTION";
        case ErrorKind::TYPE_MISMATCH: return "TYPE_MISMATCH";
        case ErrorKind::ALLOCATION_FAILURE: return "ALLOCATION_FAILURE";
    }
    return "UNKNOWN";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message)
    , kind_(kind)
    , message_(message) {}

} // namespace vecpart

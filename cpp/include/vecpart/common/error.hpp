#pragma once

#include <stdexcept>
#include <string>

namespace vecpart {

enum class ErrorKind {
    UNSUPPORTED_TYPE,    // Minor type tag with no registry entry
    STREAM_CORRUPTION,   // Short read, bad count or bad length prefix
    TYPE_MISMATCH,       // Typed access that does not match the vector
    ALLOCATION_FAILURE   // Allocator could not satisfy a request
};

const char* error_kind_name(ErrorKind kind);

/**
 * Failure raised by the partition core.
 * what() is prefixed with the kind name, e.g. "STREAM_CORRUPTION: ..."
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

    // Message without the kind prefix
    const std::string& message() const { return message_; }

private:
    ErrorKind kind_;
    std::string message_;
};

} // namespace vecpart

#include "dedup/core/error.hpp"

namespace dedup {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::PathKindMismatch: return "PathKindMismatch";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::GenericIOFailure: return "GenericIOFailure";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

std::string Error::describe() const {
    std::string text = to_string(kind);
    text += ": ";
    text += message;
    return text;
}

Error make_error(ErrorKind kind, std::string message, std::string path) {
    Error error;
    error.kind = kind;
    error.message = std::move(message);
    error.path = std::move(path);
    return error;
}

ErrorKind classify(const std::error_code& ec) noexcept {
    if (ec == std::errc::no_such_file_or_directory) {
        return ErrorKind::NotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ErrorKind::PermissionDenied;
    }
    if (ec == std::errc::not_a_directory || ec == std::errc::is_a_directory) {
        return ErrorKind::PathKindMismatch;
    }
    return ErrorKind::GenericIOFailure;
}

Error error_from_code(const std::error_code& ec, const std::string& path, const std::string& context) {
    return make_error(classify(ec), context + ": " + path + " (" + ec.message() + ")", path);
}

} // namespace dedup

#pragma once

#include <string>
#include <system_error>

namespace dedup {

/**
 * @brief Failure categories shared by the scanner, hash engine and deleter
 */
enum class ErrorKind {
    NotFound,          ///< Path does not exist (or vanished since it was listed)
    PathKindMismatch,  ///< Expected a regular file / directory, found something else
    PermissionDenied,
    GenericIOFailure,
    InvalidArgument    ///< Bad root path, empty duplicate group, bad configuration
};

const char* to_string(ErrorKind kind) noexcept;

struct Error {
    ErrorKind kind = ErrorKind::GenericIOFailure;
    std::string message;
    std::string path;  ///< Offending path, empty when not path related

    /// "<kind>: <message>" used in logs and reports
    std::string describe() const;
};

Error make_error(ErrorKind kind, std::string message, std::string path = {});

/**
 * @brief Map an OS error onto an ErrorKind
 *
 * no_such_file_or_directory -> NotFound
 * permission_denied / operation_not_permitted -> PermissionDenied
 * not_a_directory / is_a_directory -> PathKindMismatch
 * anything else -> GenericIOFailure
 */
ErrorKind classify(const std::error_code& ec) noexcept;

Error error_from_code(const std::error_code& ec, const std::string& path, const std::string& context);

} // namespace dedup

#include "fsgate/result.hpp"

namespace fsgate {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_PATH: return "invalid_path";
        case ErrorCode::BOUNDARY_VIOLATION: return "boundary_violation";
        case ErrorCode::TRAVERSAL_IN_SUFFIX: return "traversal_in_suffix";
        case ErrorCode::FILE_NOT_FOUND: return "file_not_found";
        case ErrorCode::PERMISSION_DENIED: return "permission_denied";
        case ErrorCode::IO_ERROR: return "io_error";
    }
    return "io_error";
}

Error error_from_errc(const std::error_code& ec, const std::string& context) {
    ErrorCode code = ErrorCode::IO_ERROR;
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        code = ErrorCode::FILE_NOT_FOUND;
    } else if (ec == std::errc::permission_denied ||
               ec == std::errc::operation_not_permitted) {
        code = ErrorCode::PERMISSION_DENIED;
    }
    return Error(code, context + ": " + ec.message());
}

} // namespace fsgate

#include "utils/error.hpp"

namespace http_wire {
namespace utils {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::NULL_POINTER: return "NULL_POINTER";
        case ErrorCode::OUT_OF_MEMORY: return "OUT_OF_MEMORY";
        case ErrorCode::OPERATION_FAILED: return "OPERATION_FAILED";

        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_WRITE_ERROR: return "FILE_WRITE_ERROR";

        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "CONFIG_INVALID_LOG_LEVEL";

        case ErrorCode::STREAM_READ_ERROR: return "STREAM_READ_ERROR";
        case ErrorCode::STREAM_WRITE_ERROR: return "STREAM_WRITE_ERROR";
        case ErrorCode::STREAM_CLOSED: return "STREAM_CLOSED";

        case ErrorCode::HTTP_MALFORMED_START_LINE: return "HTTP_MALFORMED_START_LINE";
        case ErrorCode::HTTP_MALFORMED_HEADER: return "HTTP_MALFORMED_HEADER";
        case ErrorCode::HTTP_INVALID_CONTENT_LENGTH: return "HTTP_INVALID_CONTENT_LENGTH";
        case ErrorCode::HTTP_UNEXPECTED_EOF: return "HTTP_UNEXPECTED_EOF";
        case ErrorCode::HTTP_WRITE_FAILED: return "HTTP_WRITE_FAILED";
        case ErrorCode::HTTP_LINE_TOO_LONG: return "HTTP_LINE_TOO_LONG";
        case ErrorCode::HTTP_TOO_MANY_HEADERS: return "HTTP_TOO_MANY_HEADERS";
        case ErrorCode::HTTP_BODY_TOO_LARGE: return "HTTP_BODY_TOO_LARGE";

        case ErrorCode::BUFFER_CAPACITY_EXCEEDED: return "BUFFER_CAPACITY_EXCEEDED";

        default: return "UNKNOWN_ERROR_CODE";
    }
}

const char* error_code_to_description(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Operation completed successfully";
        case ErrorCode::UNKNOWN_ERROR: return "An unknown error occurred";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::NULL_POINTER: return "Null pointer";
        case ErrorCode::OUT_OF_MEMORY: return "Out of memory";
        case ErrorCode::OPERATION_FAILED: return "Operation failed";

        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::FILE_WRITE_ERROR: return "File write error";

        case ErrorCode::CONFIG_PARSE_ERROR: return "Config parse error";
        case ErrorCode::CONFIG_INVALID_VALUE: return "Invalid config value";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "Invalid log level";

        case ErrorCode::STREAM_READ_ERROR: return "Stream read error";
        case ErrorCode::STREAM_WRITE_ERROR: return "Stream write error";
        case ErrorCode::STREAM_CLOSED: return "Stream closed";

        case ErrorCode::HTTP_MALFORMED_START_LINE: return "Malformed start line";
        case ErrorCode::HTTP_MALFORMED_HEADER: return "Malformed header line";
        case ErrorCode::HTTP_INVALID_CONTENT_LENGTH: return "Invalid content-length value";
        case ErrorCode::HTTP_UNEXPECTED_EOF: return "Stream closed before message was complete";
        case ErrorCode::HTTP_WRITE_FAILED: return "Failed to write message";
        case ErrorCode::HTTP_LINE_TOO_LONG: return "Line too long";
        case ErrorCode::HTTP_TOO_MANY_HEADERS: return "Too many headers";
        case ErrorCode::HTTP_BODY_TOO_LARGE: return "Body too large";

        case ErrorCode::BUFFER_CAPACITY_EXCEEDED: return "Buffer capacity exceeded";

        default: return "Unknown error";
    }
}

} // namespace utils
} // namespace http_wire

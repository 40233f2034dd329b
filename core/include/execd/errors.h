#pragma once

#include <string>

namespace execd {

// Failure classes surfaced to callers of the engine and the status API.
//   INVALID_REQUEST - malformed request, unknown session for seek
//   NOT_FOUND       - session id absent from the store
//   RUNTIME_ERROR   - spawn or execution infrastructure failure
enum class ErrorCode {
    INVALID_REQUEST,
    NOT_FOUND,
    RUNTIME_ERROR,
};

struct ExecError {
    ErrorCode code{ErrorCode::RUNTIME_ERROR};
    std::string message;
};

inline const char* error_code_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorCode::NOT_FOUND:       return "NOT_FOUND";
        case ErrorCode::RUNTIME_ERROR:   return "RUNTIME_ERROR";
    }
    return "RUNTIME_ERROR";
}

// Fills *err when non-null. Always returns false so call sites can
// `return fail(err, ...)`.
inline bool fail(ExecError* err, ErrorCode code, std::string message) {
    if (err) {
        err->code = code;
        err->message = std::move(message);
    }
    return false;
}

} // namespace execd

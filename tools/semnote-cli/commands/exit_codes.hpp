#pragma once

#include <semnote/result.hpp>

namespace semnote::cli {

// Standard exit codes for CLI commands
// Named with SEMNOTE_ prefix to avoid conflict with system macros
constexpr int SEMNOTE_EXIT_SUCCESS = 0;
constexpr int SEMNOTE_EXIT_USER_ERROR = 1;     // Invalid arguments, unconfirmed reset
constexpr int SEMNOTE_EXIT_NOT_FOUND = 2;      // Note/resource not found
constexpr int SEMNOTE_EXIT_IO_ERROR = 3;       // File/network/store/provider errors
constexpr int SEMNOTE_EXIT_INTERNAL = 4;       // Internal/unexpected errors

inline int exit_code_for(const Error& error) {
    if (error.code() == ErrorCode::NOT_FOUND) {
        return SEMNOTE_EXIT_NOT_FOUND;
    }
    switch (error.category()) {
        case ErrorCategory::VALIDATION:
            return SEMNOTE_EXIT_USER_ERROR;
        case ErrorCategory::EMBEDDING:
        case ErrorCategory::STORE:
            return SEMNOTE_EXIT_IO_ERROR;
        default:
            return error.code() == ErrorCode::IO_ERROR ? SEMNOTE_EXIT_IO_ERROR
                                                      : SEMNOTE_EXIT_INTERNAL;
    }
}

}  // namespace semnote::cli

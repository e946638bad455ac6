#pragma once

#include <zk/result.hpp>

namespace zk::cli {

// Standard exit codes for CLI commands
// Named with ZK_ prefix to avoid conflict with system macros
constexpr int ZK_EXIT_SUCCESS = 0;
constexpr int ZK_EXIT_USER_ERROR = 1;     // Invalid arguments, usage errors
constexpr int ZK_EXIT_NOT_FOUND = 2;      // Note or wiki directory not found
constexpr int ZK_EXIT_IO_ERROR = 3;       // File and watcher errors
constexpr int ZK_EXIT_INTERNAL = 4;       // Internal/unexpected errors

inline int exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return ZK_EXIT_SUCCESS;
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::PARSE_ERROR: return ZK_EXIT_USER_ERROR;
        case ErrorCode::NOT_FOUND: return ZK_EXIT_NOT_FOUND;
        case ErrorCode::IO_ERROR:
        case ErrorCode::WATCH_ERROR: return ZK_EXIT_IO_ERROR;
        default: return ZK_EXIT_INTERNAL;
    }
}

}  // namespace zk::cli

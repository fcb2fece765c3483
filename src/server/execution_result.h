#pragma once

#include <string>
#include <vector>

namespace execgate {

enum class ErrorKind {
    kNone,
    kEmptySubmission,
    kRejectedUnsafe,
    kTimeout,
    kRuntimeFailure,
    kInfrastructure,
    kUnavailable
};

inline const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return "none";
        case ErrorKind::kEmptySubmission: return "empty_submission";
        case ErrorKind::kRejectedUnsafe: return "rejected_unsafe";
        case ErrorKind::kTimeout: return "timeout";
        case ErrorKind::kRuntimeFailure: return "runtime_failure";
        case ErrorKind::kInfrastructure: return "infrastructure";
        case ErrorKind::kUnavailable: return "unavailable";
    }
    return "unknown";
}

// Outcome of one submission, produced by the sandbox or read back from the cache.
struct ExecutionResult {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
    double elapsed_seconds = 0.0;
    bool from_cache = false;
    std::string fingerprint;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::vector<std::string> issues;
    ErrorKind error_kind = ErrorKind::kNone;
};

} // namespace execgate

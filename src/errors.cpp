#include "exec_kernel/errors.h"

#include <cerrno>
#include <cstring>
#include <utility>

namespace exec_kernel {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidResourceRequest: return "invalid_resource_request";
        case ErrorKind::EnvironmentSetupFailed: return "environment_setup_failed";
        case ErrorKind::IsolationUnavailable:   return "isolation_unavailable";
        case ErrorKind::ProcessLaunchFailed:    return "process_launch_failed";
        case ErrorKind::ExecutionTimedOut:      return "execution_timed_out";
    }
    return "unknown";
}

ExecutionError::ExecutionError(ErrorKind kind, const std::string& message, std::string field)
    : std::runtime_error(message), kind_(kind), field_(std::move(field)) {}

std::string errno_message(const std::string& what) {
    return what + ": " + strerror(errno);
}

} // namespace exec_kernel

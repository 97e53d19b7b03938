#pragma once

#include <stdexcept>
#include <string>

namespace exec_kernel {

enum class ErrorKind {
    InvalidResourceRequest,
    EnvironmentSetupFailed,
    IsolationUnavailable,
    ProcessLaunchFailed,
    ExecutionTimedOut,
};

const char* to_string(ErrorKind kind) noexcept;

/// Typed failure raised inside the engine. Converted to an ExecutionResponse
/// at the ExecutionEngine boundary, never seen by callers of execute().
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(ErrorKind kind, const std::string& message, std::string field = {});

    ErrorKind kind() const noexcept { return kind_; }

    /// Offending request field for InvalidResourceRequest. For a launch
    /// failure, the LaunchSpec member that could not be applied ("argv" or
    /// "working_dir").
    const std::string& field() const noexcept { return field_; }

private:
    ErrorKind kind_;
    std::string field_;
};

/// "<what>: <strerror(errno)>"
std::string errno_message(const std::string& what);

} // namespace exec_kernel

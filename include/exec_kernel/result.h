#pragma once

#include <optional>
#include <string>

#include "errors.h"
#include "supervisor.h"

namespace exec_kernel {

enum class ResultKind {
    Completed,
    TimedOut,
    ProcessLaunchFailed,
    EnvironmentSetupFailed,
    IsolationUnavailable,
    InvalidResourceRequest,
};

const char* to_string(ResultKind kind) noexcept;

/// HTTP status the service layer reports for each kind.
int http_status(ResultKind kind) noexcept;

/// Caller-facing result of one execute() call. `outcome` is set exactly when
/// kind == Completed; `message` (and for invalid requests `field`) otherwise.
struct ExecutionResponse {
    ResultKind kind = ResultKind::Completed;
    std::optional<ExecutionOutcome> outcome;
    std::string message;
    std::string field;
    bool sandboxed = false;

    bool ok() const noexcept { return kind == ResultKind::Completed; }
};

/// Pure mapping from supervisor results to ExecutionResponse.
class ResultTranslator {
public:
    static ExecutionResponse completed(const ExecutionOutcome& outcome, bool sandboxed);
    static ExecutionResponse failed(const ExecutionError& error, bool sandboxed);
    static ResultKind kind_of(ErrorKind kind) noexcept;
};

} // namespace exec_kernel

#include "exec_kernel/result.h"

namespace exec_kernel {

const char* to_string(ResultKind kind) noexcept {
    switch (kind) {
        case ResultKind::Completed:              return "completed";
        case ResultKind::TimedOut:               return "timed_out";
        case ResultKind::ProcessLaunchFailed:    return "process_launch_failed";
        case ResultKind::EnvironmentSetupFailed: return "environment_setup_failed";
        case ResultKind::IsolationUnavailable:   return "isolation_unavailable";
        case ResultKind::InvalidResourceRequest: return "invalid_resource_request";
    }
    return "unknown";
}

int http_status(ResultKind kind) noexcept {
    switch (kind) {
        case ResultKind::Completed:              return 200;
        case ResultKind::InvalidResourceRequest: return 400;
        case ResultKind::TimedOut:               return 504;
        case ResultKind::ProcessLaunchFailed:
        case ResultKind::EnvironmentSetupFailed:
        case ResultKind::IsolationUnavailable:   return 500;
    }
    return 500;
}

ResultKind ResultTranslator::kind_of(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidResourceRequest: return ResultKind::InvalidResourceRequest;
        case ErrorKind::EnvironmentSetupFailed: return ResultKind::EnvironmentSetupFailed;
        case ErrorKind::IsolationUnavailable:   return ResultKind::IsolationUnavailable;
        case ErrorKind::ProcessLaunchFailed:    return ResultKind::ProcessLaunchFailed;
        case ErrorKind::ExecutionTimedOut:      return ResultKind::TimedOut;
    }
    return ResultKind::ProcessLaunchFailed;
}

ExecutionResponse ResultTranslator::completed(const ExecutionOutcome& outcome, bool sandboxed) {
    ExecutionResponse r;
    r.kind = ResultKind::Completed;
    r.outcome = outcome;
    r.outcome->timed_out = false;
    r.sandboxed = sandboxed;
    return r;
}

ExecutionResponse ResultTranslator::failed(const ExecutionError& error, bool sandboxed) {
    ExecutionResponse r;
    r.kind = kind_of(error.kind());
    r.message = error.what();
    if (error.kind() == ErrorKind::InvalidResourceRequest) r.field = error.field();
    r.sandboxed = sandboxed;
    return r;
}

} // namespace exec_kernel

#pragma once

#include <cstddef>
#include <string>

#include "process.h"

namespace exec_kernel {

struct ExecutionOutcome {
    std::string stdout_output;
    std::string stderr_output;
    int exit_code = 0;              // -N if killed by signal N
    bool timed_out = false;         // never true in a returned outcome
    double elapsed_seconds = 0.0;
    bool output_truncated = false;
};

/// Lifecycle of one run:
///   Created -> Staged -> Running -> {Completed | TimedOut | LaunchFailed} -> TornDown
/// TornDown is reachable from every state but Created and is terminal.
enum class RunState {
    Created,
    Staged,
    Running,
    Completed,
    TimedOut,
    LaunchFailed,
    TornDown,
};

const char* to_string(RunState state) noexcept;

/// Records the state of one run. Reaches TornDown from its destructor, so
/// declare it before the resources it outlives.
class RunTracker {
public:
    explicit RunTracker(std::string run_id);
    ~RunTracker();

    RunTracker(const RunTracker&) = delete;
    RunTracker& operator=(const RunTracker&) = delete;

    /// Moves to `next`; illegal transitions are logged and ignored.
    void advance(RunState next) noexcept;

    RunState state() const noexcept { return state_; }
    const std::string& run_id() const noexcept { return run_id_; }

private:
    std::string run_id_;
    RunState state_ = RunState::Created;
};

struct SupervisorOptions {
    size_t max_output_bytes = 1 << 20;   // per stream; the rest is drained and dropped
};

/// Runs one process to completion under a wall-clock deadline.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(SupervisorOptions options = {}) : options_(options) {}

    /// Launch `spec` through `launcher` and capture stdout/stderr until exit.
    ///
    /// Throws ExecutionError(ExecutionTimedOut) after killing the program
    /// tree when spec.budget.wall_clock_seconds elapse; captured output is
    /// discarded. Throws ExecutionError(ProcessLaunchFailed) when the process
    /// cannot start. No process from the run is alive when this returns or
    /// throws.
    ExecutionOutcome run(ProcessLauncher& launcher, const LaunchSpec& spec,
                         RunTracker* tracker = nullptr) const;

    const SupervisorOptions& options() const noexcept { return options_; }

private:
    SupervisorOptions options_;
};

} // namespace exec_kernel

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

#include "limits.h"

namespace exec_kernel {

struct ExecutionOutcome;

/// setrlimit() values applied in the child before exec. -1 = leave as is.
struct ResourceLimits {
    int64_t max_cpu_seconds = -1;   // RLIMIT_CPU
    int64_t max_memory_bytes = -1;  // RLIMIT_AS
    int64_t max_file_size = -1;     // RLIMIT_FSIZE
    int64_t max_open_files = -1;    // RLIMIT_NOFILE
    int64_t max_processes = -1;     // RLIMIT_NPROC
    int64_t max_core_size = -1;     // RLIMIT_CORE
};

/// What to run: `argv` in `working_dir`, bounded by `budget`.
struct LaunchSpec {
    std::vector<std::string> argv;
    std::string working_dir;
    ResourceBudget budget{};
    ResourceLimits rlimits;
    std::vector<std::string> env;   // KEY=VALUE pairs added to the inherited environment
};

/// Owning handle to one launched program. `pid()` is a per-run reaper that
/// forks the program as a child subreaper and, once the program exits,
/// kills everything it left behind (including descendants that called
/// setsid()) before exiting with the program's status. If destroyed while
/// still alive, the whole tree is killed and reaped.
class ChildProcess {
public:
    ChildProcess(pid_t pid, int stdout_fd, int stderr_fd);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const noexcept { return pid_; }
    int stdout_fd() const noexcept { return stdout_fd_; }
    int stderr_fd() const noexcept { return stderr_fd_; }
    void close_stdout() noexcept;
    void close_stderr() noexcept;

    /// True once the reaper has exited, i.e. the program and all of its
    /// descendants are gone. Does not reap it.
    bool exited();

    /// Wait for the reaper to exit and collect the program's status. Blocks
    /// until the program finishes; call after exited() or on EOF.
    void reap();

    /// Forcibly terminate: the reaper kills the program tree and itself
    /// (SIGKILL on the group if it does not finish in time), then kill hooks
    /// run.
    void kill() noexcept;

    bool reaped() const noexcept { return reaped_; }

    /// Exit status after reap(): the exit code, or -signal if killed.
    int exit_code() const noexcept { return exit_code_; }

    /// Runs after kill(), e.g. to remove a container the killed client left.
    void on_kill(std::function<void()> hook) { kill_hooks_.push_back(std::move(hook)); }

private:
    bool exits_within(std::chrono::milliseconds limit) noexcept;
    void wait_blocking() noexcept;

    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    bool reaped_ = false;
    int exit_code_ = -1;
    std::vector<std::function<void()>> kill_hooks_;
};

struct IsolationStatus {
    bool available;
    std::string detail;
};

/// Capability that turns a LaunchSpec into a running process. Swapping the
/// implementation swaps the isolation runtime; timeout and teardown live in
/// ProcessSupervisor.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /// Throws ExecutionError(ProcessLaunchFailed) if the program cannot start.
    virtual std::unique_ptr<ChildProcess> launch(const LaunchSpec& spec) = 0;

    /// Examine a finished run. Throws ProcessLaunchFailed when the outcome
    /// shows the runtime never started the program.
    virtual void inspect(const ExecutionOutcome& /*outcome*/) const {}

    /// Whether the launcher can run anything right now.
    virtual IsolationStatus probe() const = 0;

    virtual bool sandboxed() const noexcept = 0;
};

/// fork/exec under a per-run reaper, program in a fresh process group,
/// stdin from /dev/null. Inherited descriptors other than stdio are closed.
class PosixLauncher : public ProcessLauncher {
public:
    std::unique_ptr<ChildProcess> launch(const LaunchSpec& spec) override;
    IsolationStatus probe() const override { return {true, "host process"}; }
    bool sandboxed() const noexcept override { return false; }
};

} // namespace exec_kernel

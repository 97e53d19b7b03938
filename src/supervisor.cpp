#include "exec_kernel/supervisor.h"
#include "exec_kernel/errors.h"

#include <spdlog/spdlog.h>

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <utility>

namespace exec_kernel {

namespace {

constexpr std::chrono::milliseconds kPollSlice{50};

// Once the program tree is gone, pipes still open after this are abandoned.
constexpr std::chrono::milliseconds kDrainGrace{250};

bool legal_transition(RunState from, RunState to) {
    switch (to) {
        case RunState::Staged:       return from == RunState::Created;
        case RunState::Running:      return from == RunState::Created || from == RunState::Staged;
        case RunState::Completed:
        case RunState::TimedOut:
        case RunState::LaunchFailed: return from == RunState::Running;
        case RunState::TornDown:     return from != RunState::Created && from != RunState::TornDown;
        case RunState::Created:      return false;
    }
    return false;
}

// One captured stream.
struct Capture {
    int fd;
    std::string data;
    bool truncated = false;

    // Returns false on EOF.
    bool read_some(size_t cap) {
        char buf[4096];
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) return true;
            spdlog::warn("read from child pipe failed: {}", strerror(errno));
            return false;
        }
        if (n == 0) return false;
        size_t room = data.size() < cap ? cap - data.size() : 0;
        size_t take = std::min(room, static_cast<size_t>(n));
        data.append(buf, take);
        if (take < static_cast<size_t>(n)) truncated = true;
        return true;
    }
};

} // anonymous namespace

const char* to_string(RunState state) noexcept {
    switch (state) {
        case RunState::Created:      return "created";
        case RunState::Staged:       return "staged";
        case RunState::Running:      return "running";
        case RunState::Completed:    return "completed";
        case RunState::TimedOut:     return "timed_out";
        case RunState::LaunchFailed: return "launch_failed";
        case RunState::TornDown:     return "torn_down";
    }
    return "unknown";
}

RunTracker::RunTracker(std::string run_id) : run_id_(std::move(run_id)) {}

RunTracker::~RunTracker() {
    if (state_ != RunState::Created) advance(RunState::TornDown);
}

void RunTracker::advance(RunState next) noexcept {
    if (!legal_transition(state_, next)) {
        spdlog::warn("run {}: ignoring transition {} -> {}", run_id_, to_string(state_), to_string(next));
        return;
    }
    spdlog::debug("run {}: {} -> {}", run_id_, to_string(state_), to_string(next));
    state_ = next;
}

ExecutionOutcome ProcessSupervisor::run(ProcessLauncher& launcher, const LaunchSpec& spec,
                                        RunTracker* tracker) const {
    using clock = std::chrono::steady_clock;

    auto start = clock::now();
    auto deadline = start + std::chrono::seconds(spec.budget.wall_clock_seconds);

    if (tracker) tracker->advance(RunState::Running);

    std::unique_ptr<ChildProcess> child;
    try {
        child = launcher.launch(spec);
    } catch (const ExecutionError&) {
        if (tracker) tracker->advance(RunState::LaunchFailed);
        throw;
    }

    Capture out{child->stdout_fd(), {}};
    Capture err{child->stderr_fd(), {}};
    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    clock::time_point drain_deadline;

    while (true) {
        if (!exited && child->exited()) {
            exited = true;
            child->reap();
            drain_deadline = clock::now() + kDrainGrace;
        }
        if (exited && !out_open && !err_open) break;

        auto now = clock::now();
        if (exited && now >= drain_deadline) {
            spdlog::warn("pid {}: output pipes still open {}ms after exit, abandoning them",
                         child->pid(), kDrainGrace.count());
            break;
        }
        if (!exited && now >= deadline) {
            child->kill();
            if (tracker) tracker->advance(RunState::TimedOut);
            spdlog::warn("pid {} exceeded {}s wall clock limit, killed", child->pid(),
                         spec.budget.wall_clock_seconds);
            throw ExecutionError(ErrorKind::ExecutionTimedOut,
                                 "Execution timed out after " +
                                     std::to_string(spec.budget.wall_clock_seconds) + "s");
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            (exited ? drain_deadline : deadline) - now);
        int wait_ms = static_cast<int>(std::min(remaining, kPollSlice).count()) + 1;

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) fds[nfds++] = {out.fd, POLLIN, 0};
        if (err_open) fds[nfds++] = {err.fd, POLLIN, 0};

        int ret = ::poll(nfds ? fds : nullptr, nfds, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(errno_message("poll"));
        }
        for (nfds_t i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == out.fd && !out.read_some(options_.max_output_bytes)) {
                out_open = false;
                child->close_stdout();
            } else if (fds[i].fd == err.fd && !err.read_some(options_.max_output_bytes)) {
                err_open = false;
                child->close_stderr();
            }
        }
    }

    ExecutionOutcome outcome;
    outcome.stdout_output = std::move(out.data);
    outcome.stderr_output = std::move(err.data);
    outcome.exit_code = child->exit_code();
    outcome.output_truncated = out.truncated || err.truncated;
    outcome.elapsed_seconds = std::chrono::duration<double>(clock::now() - start).count();

    try {
        launcher.inspect(outcome);
    } catch (const ExecutionError&) {
        if (tracker) tracker->advance(RunState::LaunchFailed);
        throw;
    }
    if (tracker) tracker->advance(RunState::Completed);

    spdlog::debug("pid {} exited with {} after {:.3f}s", child->pid(), outcome.exit_code,
                  outcome.elapsed_seconds);
    return outcome;
}

} // namespace exec_kernel

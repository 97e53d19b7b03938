#include "exec_kernel/process.h"
#include "exec_kernel/errors.h"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <thread>

extern char** environ;

namespace exec_kernel {

namespace {

void apply_rlimit(int resource, int64_t value) {
    if (value < 0) return;
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>(value);
    rl.rlim_max = static_cast<rlim_t>(value);
    setrlimit(resource, &rl);
}

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::string join(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

bool same_key(const char* entry, const std::string& kv) {
    auto eq = kv.find('=');
    if (eq == std::string::npos) return false;
    return std::strncmp(entry, kv.c_str(), eq + 1) == 0;
}

// Inherited environment with the launch KEY=VALUE pairs replacing any
// existing entries of the same key.
std::vector<std::string> build_env(const std::vector<std::string>& extra) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        bool overridden = false;
        for (const auto& kv : extra) {
            if (same_key(*e, kv)) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env.emplace_back(*e);
    }
    env.insert(env.end(), extra.begin(), extra.end());
    return env;
}

std::vector<char*> to_cstrings(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(&s[0]);
    out.push_back(nullptr);
    return out;
}

// Reported by the child through the close-on-exec error pipe.
struct ChildFailure {
    int stage;   // 0 = chdir, 1 = exec, 2 = fork
    int error;
};

// Descriptor the error pipe is moved to in the reaper.
constexpr int kFailFd = 3;

// How long kill() waits for the reaper to sweep before killing it outright.
constexpr std::chrono::milliseconds kReaperGrace{1000};

// Everything the forked side needs, prepared before fork().
struct ChildSetup {
    char* const* argv;
    char* const* envp;
    const char* workdir;
    const ResourceLimits* limits;
    int devnull;
    int stdout_fd;
    int stderr_fd;
    int fail_fd;
};

// Only async-signal-safe calls from here to the end of the namespace: the
// caller may be multithreaded.

void report_failure(int stage, int error) {
    ChildFailure failure{stage, error};
    ssize_t ignored = write(kFailFd, &failure, sizeof(failure));
    (void)ignored;
}

void close_fds_from(int first) {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, first, ~0U, 0) == 0) return;
#endif
    struct rlimit rl;
    long limit = 1024;
    if (getrlimit(RLIMIT_NOFILE, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY) {
        limit = static_cast<long>(rl.rlim_cur);
    }
    for (long fd = first; fd < limit; ++fd) close(static_cast<int>(fd));
}

char* append_number(char* out, long value) {
    char digits[24];
    int n = 0;
    do {
        digits[n++] = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value > 0);
    while (n > 0) *out++ = digits[--n];
    return out;
}

// SIGKILLs every direct child listed in `list_path`. A pid cut off by the
// buffer end is skipped; the next pass picks it up.
void kill_listed_children(const char* list_path) {
    int fd = open(list_path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) return;
    char buf[4096];
    ssize_t n = read(fd, buf, sizeof(buf));
    close(fd);
    pid_t pid = 0;
    for (ssize_t i = 0; i < n; ++i) {
        if (buf[i] >= '0' && buf[i] <= '9') {
            pid = pid * 10 + (buf[i] - '0');
        } else {
            if (pid > 0) ::kill(pid, SIGKILL);
            pid = 0;
        }
    }
}

// Kills and reaps every remaining descendant. As a subreaper, orphans of
// the program (setsid() included) are re-parented here, so repeating
// kill-children/reap-one until ECHILD empties the whole tree.
void kill_descendants(const char* list_path) {
    while (true) {
        kill_listed_children(list_path);
        if (waitpid(-1, nullptr, 0) < 0) {
            if (errno == EINTR) continue;
            return;
        }
    }
}

// Reaps exited orphans and returns true once `program` has exited. The
// program itself is left unreaped so its process group id stays reserved.
bool program_exited(pid_t program) {
    while (true) {
        siginfo_t si;
        std::memset(&si, 0, sizeof(si));
        if (waitid(P_ALL, 0, &si, WEXITED | WNOHANG | WNOWAIT) != 0 || si.si_pid == 0) {
            return false;
        }
        if (si.si_pid == program) return true;
        waitpid(si.si_pid, nullptr, 0);
    }
}

[[noreturn]] void exit_like(int status) {
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        struct rlimit no_core{0, 0};
        setrlimit(RLIMIT_CORE, &no_core);
        signal(sig, SIG_DFL);
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, sig);
        sigprocmask(SIG_UNBLOCK, &set, nullptr);
        ::kill(getpid(), sig);
    }
    _exit(WIFEXITED(status) ? WEXITSTATUS(status) : 1);
}

[[noreturn]] void exec_program(const ChildSetup& s) {
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    const ResourceLimits& lim = *s.limits;
    apply_rlimit(RLIMIT_CPU, lim.max_cpu_seconds);
    apply_rlimit(RLIMIT_AS, lim.max_memory_bytes);
    apply_rlimit(RLIMIT_FSIZE, lim.max_file_size);
    apply_rlimit(RLIMIT_NOFILE, lim.max_open_files);
    apply_rlimit(RLIMIT_NPROC, lim.max_processes);
    apply_rlimit(RLIMIT_CORE, lim.max_core_size);

    execvpe(s.argv[0], s.argv, s.envp);
    report_failure(1, errno);
    _exit(127);
}

// Body of the forked process. It becomes a child subreaper, forks the
// program, waits for it, then kills everything the program left behind and
// exits with the program's status. SIGTERM means: stop now, sweep, die by
// SIGKILL.
[[noreturn]] void run_reaper(const ChildSetup& s) {
    sigset_t watched;
    sigemptyset(&watched);
    sigaddset(&watched, SIGCHLD);
    sigaddset(&watched, SIGTERM);
    sigprocmask(SIG_BLOCK, &watched, nullptr);
    signal(SIGCHLD, SIG_DFL);

    setpgid(0, 0);
    prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0);

    dup2(s.devnull, STDIN_FILENO);
    dup2(s.stdout_fd, STDOUT_FILENO);
    dup2(s.stderr_fd, STDERR_FILENO);
    if (s.fail_fd != kFailFd) dup2(s.fail_fd, kFailFd);
    fcntl(kFailFd, F_SETFD, FD_CLOEXEC);
    // Drops descriptors of the parent, including pipes of concurrent runs.
    close_fds_from(kFailFd + 1);

    if (s.workdir && chdir(s.workdir) != 0) {
        report_failure(0, errno);
        _exit(126);
    }

    pid_t program = fork();
    if (program < 0) {
        report_failure(2, errno);
        _exit(126);
    }
    if (program == 0) exec_program(s);

    setpgid(program, program);
    // From here on only the program tree holds the pipes.
    close(kFailFd);
    int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (devnull >= 0) {
        dup2(devnull, STDOUT_FILENO);
        dup2(devnull, STDERR_FILENO);
        close(devnull);
    }

    char list_path[64] = "/proc/self/task/";
    char* end = append_number(list_path + std::strlen(list_path), static_cast<long>(getpid()));
    std::memcpy(end, "/children", sizeof("/children"));

    bool terminated = false;
    while (!program_exited(program)) {
        if (sigwaitinfo(&watched, nullptr) == SIGTERM) {
            terminated = true;
            break;
        }
    }

    ::kill(-program, SIGKILL);
    int status = 0;
    while (waitpid(program, &status, 0) < 0 && errno == EINTR) {}
    kill_descendants(list_path);
    if (terminated) ::kill(getpid(), SIGKILL);
    exit_like(status);
}

} // anonymous namespace

// ── ChildProcess ────────────────────────────────────────────────────────

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::~ChildProcess() {
    if (!reaped_) kill();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void ChildProcess::close_stdout() noexcept { close_fd(stdout_fd_); }
void ChildProcess::close_stderr() noexcept { close_fd(stderr_fd_); }

bool ChildProcess::exited() {
    if (reaped_) return true;
    siginfo_t si;
    std::memset(&si, 0, sizeof(si));
    while (waitid(P_PID, static_cast<id_t>(pid_), &si, WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno == EINTR) continue;
        throw std::runtime_error(errno_message("waitid"));
    }
    return si.si_pid != 0;
}

void ChildProcess::reap() {
    if (reaped_) return;
    wait_blocking();
}

void ChildProcess::kill() noexcept {
    if (reaped_) return;
    ::kill(pid_, SIGTERM);
    if (!exits_within(kReaperGrace)) {
        spdlog::warn("reaper {} did not finish its sweep, killing it", pid_);
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
    }
    wait_blocking();
    spdlog::debug("killed process tree of {}", pid_);
    for (auto& hook : kill_hooks_) {
        try {
            hook();
        } catch (const std::exception& e) {
            spdlog::warn("teardown hook for pid {} failed: {}", pid_, e.what());
        }
    }
    kill_hooks_.clear();
}

bool ChildProcess::exits_within(std::chrono::milliseconds limit) noexcept {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (true) {
        siginfo_t si;
        std::memset(&si, 0, sizeof(si));
        if (waitid(P_PID, static_cast<id_t>(pid_), &si, WEXITED | WNOHANG | WNOWAIT) != 0) {
            if (errno == EINTR) continue;
            return true;
        }
        if (si.si_pid != 0) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void ChildProcess::wait_blocking() noexcept {
    int status = 0;
    pid_t w;
    do {
        w = waitpid(pid_, &status, 0);
    } while (w < 0 && errno == EINTR);

    if (w == pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = -WTERMSIG(status);
        }
    } else {
        spdlog::warn("waitpid({}) failed: {}", pid_, strerror(errno));
    }
    reaped_ = true;
}

// ── PosixLauncher ───────────────────────────────────────────────────────

std::unique_ptr<ChildProcess> PosixLauncher::launch(const LaunchSpec& spec) {
    if (spec.argv.empty()) {
        throw ExecutionError(ErrorKind::ProcessLaunchFailed, "empty command");
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> args = spec.argv;
    std::vector<char*> c_args = to_cstrings(args);
    std::vector<std::string> env = build_env(spec.env);
    std::vector<char*> c_env = to_cstrings(env);
    const char* workdir = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int fail_pipe[2] = {-1, -1};
    int devnull = -1;
    auto close_all = [&] {
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(fail_pipe[0]); close_fd(fail_pipe[1]);
        close_fd(devnull);
    };

    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(fail_pipe, O_CLOEXEC) != 0) {
        std::string msg = errno_message("pipe failed");
        close_all();
        throw ExecutionError(ErrorKind::ProcessLaunchFailed, msg);
    }
    devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        std::string msg = errno_message("open /dev/null");
        close_all();
        throw ExecutionError(ErrorKind::ProcessLaunchFailed, msg);
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::string msg = errno_message("fork failed");
        close_all();
        throw ExecutionError(ErrorKind::ProcessLaunchFailed, msg);
    }

    if (pid == 0) {
        run_reaper(ChildSetup{c_args.data(), c_env.data(), workdir, &spec.rlimits, devnull,
                              out_pipe[1], err_pipe[1], fail_pipe[1]});
    }

    // Parent. Set the group here too so an early kill(-pid) cannot miss.
    setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(fail_pipe[1]);
    close_fd(devnull);

    auto child = std::make_unique<ChildProcess>(pid, out_pipe[0], err_pipe[0]);

    // EOF once the reaper has forked and the program has exec'd.
    ChildFailure failure{0, 0};
    ssize_t n;
    do {
        n = read(fail_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close_fd(fail_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        child->reap();
        if (failure.stage == 0) {
            throw ExecutionError(ErrorKind::ProcessLaunchFailed,
                                 "chdir " + spec.working_dir + ": " + strerror(failure.error),
                                 "working_dir");
        }
        if (failure.stage == 1) {
            throw ExecutionError(ErrorKind::ProcessLaunchFailed,
                                 "exec " + spec.argv[0] + ": " + strerror(failure.error), "argv");
        }
        throw ExecutionError(ErrorKind::ProcessLaunchFailed,
                             std::string("fork failed: ") + strerror(failure.error));
    }

    spdlog::debug("spawned pid {}: {}", pid, join(spec.argv));
    return child;
}

} // namespace exec_kernel

#include "exec_kernel/container.h"
#include "exec_kernel/errors.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <utility>

namespace exec_kernel {

namespace {

// Exit status the docker/podman client uses when it could not run the container.
constexpr int kRuntimeStartFailure = 125;

bool is_root_user(const std::string& user) {
    std::string uid = user.substr(0, user.find(':'));
    return uid.empty() || uid == "0" || uid == "root";
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool daemon_unreachable(const std::string& stderr_output) {
    return stderr_output.find("Cannot connect to the Docker daemon") != std::string::npos ||
           stderr_output.find("Is the docker daemon running") != std::string::npos ||
           stderr_output.find("unable to connect to Podman") != std::string::npos;
}

} // anonymous namespace

// ── IsolationProfile ────────────────────────────────────────────────────

IsolationProfile::IsolationProfile(ContainerSettings settings) : settings_(std::move(settings)) {
    if (settings_.runtime.empty()) throw std::invalid_argument("container runtime must be set");
    if (settings_.image.empty()) throw std::invalid_argument("container image must be set");
    if (settings_.interpreter.empty()) throw std::invalid_argument("container interpreter must be set");
    if (is_root_user(settings_.user)) {
        throw std::invalid_argument("container user must be an unprivileged uid, got '" +
                                    settings_.user + "'");
    }
    if (settings_.mount_point.empty() || settings_.mount_point[0] != '/') {
        throw std::invalid_argument("mount point must be absolute");
    }
    if (settings_.probe_timeout_seconds <= 0 || settings_.teardown_timeout_seconds <= 0) {
        throw std::invalid_argument("runtime probe and teardown timeouts must be positive");
    }
}

std::vector<std::string> IsolationProfile::command_line(
    const std::string& container_name,
    const std::string& host_dir,
    const ResourceBudget& budget,
    const std::vector<std::string>& command
) const {
    const auto& s = settings_;
    std::string memory = std::to_string(budget.memory_mb) + "m";

    std::vector<std::string> argv = {
        s.runtime, "run",
        "--rm",
        "--name", container_name,
        "--network", "none",
        "--memory=" + memory,
        "--memory-swap=" + memory,
        "--pids-limit", std::to_string(budget.process_count),
        "--security-opt", "no-new-privileges",
        "--cap-drop", "ALL",
        "--read-only",
        "--tmpfs", "/tmp:rw,exec,nosuid,size=" + s.tmpfs_size,
        "--user", s.user,
        "-v", host_dir + ":" + s.mount_point + ":ro",
        "-w", s.mount_point,
        s.image,
    };
    argv.insert(argv.end(), command.begin(), command.end());
    return argv;
}

// ── ContainerLauncher ───────────────────────────────────────────────────

ContainerLauncher::ContainerLauncher(ContainerSettings settings) : profile_(std::move(settings)) {}

std::string ContainerLauncher::container_name(const std::string& staging_dir) {
    return std::filesystem::path(staging_dir).filename().string();
}

IsolationStatus ContainerLauncher::probe() const {
    const auto& s = profile_.settings();
    LaunchSpec spec;
    spec.argv = {s.runtime, "info", "--format", "{{.ServerVersion}}"};
    spec.budget = {s.probe_timeout_seconds, 0, 0};

    ProcessSupervisor supervisor;
    try {
        ExecutionOutcome out = supervisor.run(host_, spec);
        if (out.exit_code != 0) {
            std::string why = trim(out.stderr_output);
            return {false, s.runtime + " info exited with " + std::to_string(out.exit_code) +
                               (why.empty() ? "" : ": " + why)};
        }
        return {true, s.runtime + " " + trim(out.stdout_output)};
    } catch (const ExecutionError& e) {
        return {false, e.what()};
    }
}

std::unique_ptr<ChildProcess> ContainerLauncher::launch(const LaunchSpec& spec) {
    std::string name = container_name(spec.working_dir);

    LaunchSpec client;
    client.argv = profile_.command_line(name, spec.working_dir, spec.budget, spec.argv);
    client.working_dir = spec.working_dir;
    client.budget = spec.budget;

    spdlog::debug("starting container {} from image {}", name, profile_.settings().image);
    std::unique_ptr<ChildProcess> child;
    try {
        child = host_.launch(client);
    } catch (const ExecutionError& e) {
        // The runtime client itself could not be executed.
        if (e.field() != "argv") throw;
        throw ExecutionError(ErrorKind::IsolationUnavailable,
                             std::string("isolation runtime unavailable: ") + e.what());
    }

    // Killing the client does not stop the container; remove it explicitly.
    child->on_kill([this, name] { remove_container(name); });
    return child;
}

void ContainerLauncher::inspect(const ExecutionOutcome& outcome) const {
    if (outcome.exit_code != kRuntimeStartFailure) return;
    std::string why = trim(outcome.stderr_output);
    if (daemon_unreachable(why)) {
        throw ExecutionError(ErrorKind::IsolationUnavailable, why);
    }
    throw ExecutionError(ErrorKind::ProcessLaunchFailed,
                         "container runtime failed to start: " +
                             (why.empty() ? std::string("no diagnostics") : why));
}

void ContainerLauncher::remove_container(const std::string& name) const {
    const auto& s = profile_.settings();
    LaunchSpec spec;
    spec.argv = {s.runtime, "rm", "-f", name};
    spec.budget = {s.teardown_timeout_seconds, 0, 0};

    ProcessSupervisor supervisor;
    try {
        ExecutionOutcome out = supervisor.run(host_, spec);
        if (out.exit_code != 0) {
            spdlog::warn("{} rm -f {} exited with {}: {}", s.runtime, name, out.exit_code,
                         trim(out.stderr_output));
        } else {
            spdlog::debug("removed container {}", name);
        }
    } catch (const ExecutionError& e) {
        spdlog::warn("could not remove container {}: {}", name, e.what());
    }
}

} // namespace exec_kernel

#pragma once

#include <string>
#include <vector>

#include "process.h"
#include "supervisor.h"

namespace exec_kernel {

/// Deployment settings for the container runtime. The hardening flags are
/// not part of this struct and cannot be turned off.
struct ContainerSettings {
    std::string runtime = "docker";             // client binary, PATH lookup
    std::string image = "python:3.11-slim";
    std::vector<std::string> interpreter = {"python"};
    std::string user = "1000:1000";             // must not be root
    std::string tmpfs_size = "64m";
    std::string mount_point = "/workdir";
    int probe_timeout_seconds = 10;
    int teardown_timeout_seconds = 10;
};

/// Builds the hardened `<runtime> run ...` command line.
class IsolationProfile {
public:
    /// Throws std::invalid_argument for unusable settings (empty runtime or
    /// image, root user, relative mount point).
    explicit IsolationProfile(ContainerSettings settings);

    std::vector<std::string> command_line(const std::string& container_name,
                                          const std::string& host_dir,
                                          const ResourceBudget& budget,
                                          const std::vector<std::string>& command) const;

    const ContainerSettings& settings() const noexcept { return settings_; }

private:
    ContainerSettings settings_;
};

/// Runs the program inside a disposable container. spec.working_dir is the
/// staging directory, bind-mounted read-only; spec.argv runs inside the
/// container from the mount point.
class ContainerLauncher : public ProcessLauncher {
public:
    explicit ContainerLauncher(ContainerSettings settings);

    /// `<runtime> info`, bounded by probe_timeout_seconds.
    IsolationStatus probe() const override;

    std::unique_ptr<ChildProcess> launch(const LaunchSpec& spec) override;

    /// Exit code 125 is the runtime's own failure to start the container.
    void inspect(const ExecutionOutcome& outcome) const override;

    bool sandboxed() const noexcept override { return true; }

    const IsolationProfile& profile() const noexcept { return profile_; }

    /// Container name used for a given staging directory.
    static std::string container_name(const std::string& staging_dir);

private:
    void remove_container(const std::string& name) const;

    IsolationProfile profile_;
    mutable PosixLauncher host_;
};

} // namespace exec_kernel

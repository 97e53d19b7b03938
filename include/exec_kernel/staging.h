#pragma once

#include <string>

namespace exec_kernel {

/// Per-request scratch directory holding exactly one source file.
/// Removed recursively when the handle is destroyed.
class StagingArea {
public:
    static constexpr const char* kScriptName = "script.py";

    /// Create a uniquely named directory under `root` and write `source` into
    /// it. Throws ExecutionError(EnvironmentSetupFailed); nothing is left on
    /// disk when it throws.
    static StagingArea create(const std::string& root, const std::string& source);

    StagingArea(StagingArea&& other) noexcept;
    StagingArea& operator=(StagingArea&& other) noexcept;
    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;
    ~StagingArea();

    /// Absolute directory path, suitable as a bind-mount source.
    const std::string& path() const noexcept { return path_; }
    std::string script_path() const { return path_ + "/" + kScriptName; }

    /// Final path component, unique among live staging areas on this host.
    std::string name() const;

    /// Remove the directory now. Safe to call more than once.
    void remove() noexcept;

private:
    explicit StagingArea(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

} // namespace exec_kernel

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "config.h"
#include "limits.h"
#include "process.h"
#include "result.h"
#include "supervisor.h"

namespace exec_kernel {

struct ExecutionRequest {
    std::string source;
    std::optional<int> timeout_seconds;    // default from LimitPolicy
    std::optional<int> memory_limit_mb;    // default from LimitPolicy
    bool isolation_requested = false;
    std::string language = "python";
};

/// Everything a strategy needs that is fixed for the engine's lifetime.
struct StrategyContext {
    const ProcessSupervisor& supervisor;
    const std::string& staging_root;
};

/// Stage the source and run it through an isolating launcher. Fails with
/// IsolationUnavailable before staging if the runtime does not answer.
struct IsolatedStrategy {
    ProcessLauncher* launcher;
    std::vector<std::string> interpreter;
    bool probe_first;

    bool sandboxed() const noexcept { return true; }
    ExecutionOutcome run(const StrategyContext& ctx, const std::string& source,
                         const ResourceBudget& budget, RunTracker& tracker) const;
};

/// Degraded-trust path: the interpreter runs directly on the host with full
/// filesystem and network access.
struct FallbackStrategy {
    ProcessLauncher* launcher;
    std::string python_executable;

    bool sandboxed() const noexcept { return false; }
    ExecutionOutcome run(const StrategyContext& ctx, const std::string& source,
                         const ResourceBudget& budget, RunTracker& tracker) const;
};

using ExecutionStrategy = std::variant<IsolatedStrategy, FallbackStrategy>;

/// Entry point of the execution core. Holds only immutable state after
/// construction; execute() may be called from many threads at once.
class ExecutionEngine {
public:
    /// Throws std::invalid_argument for an unusable configuration.
    explicit ExecutionEngine(EngineConfig config = {});

    /// Use `isolated_launcher` instead of the container runtime.
    ExecutionEngine(EngineConfig config, std::unique_ptr<ProcessLauncher> isolated_launcher);

    /// Run one request. Never throws for request-level failures: the
    /// response carries exactly one ResultKind.
    ExecutionResponse execute(const ExecutionRequest& request) const;

    /// Chosen once per request from isolation_requested.
    ExecutionStrategy select_strategy(const ExecutionRequest& request) const;

    /// Probe the isolation runtime (health reporting).
    IsolationStatus isolation_status() const;

    const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
    ResourceLimitPolicy policy_;
    ProcessSupervisor supervisor_;
    std::unique_ptr<ProcessLauncher> isolated_;
    std::unique_ptr<ProcessLauncher> fallback_;
};

} // namespace exec_kernel

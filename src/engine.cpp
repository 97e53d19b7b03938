#include "exec_kernel/engine.h"
#include "exec_kernel/container.h"
#include "exec_kernel/errors.h"
#include "exec_kernel/staging.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <exception>
#include <random>
#include <utility>

namespace exec_kernel {

namespace {

std::string new_run_id() {
    std::random_device rd;
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%08x%08x", rd(), rd());
    return buf;
}

SupervisorOptions supervisor_options(const EngineConfig& config) {
    SupervisorOptions opts;
    opts.max_output_bytes = config.max_output_bytes;
    return opts;
}

} // anonymous namespace

// ── Strategies ──────────────────────────────────────────────────────────

ExecutionOutcome IsolatedStrategy::run(const StrategyContext& ctx, const std::string& source,
                                       const ResourceBudget& budget, RunTracker& tracker) const {
    if (probe_first) {
        IsolationStatus status = launcher->probe();
        if (!status.available) {
            throw ExecutionError(ErrorKind::IsolationUnavailable,
                                 "isolation runtime unavailable: " + status.detail);
        }
    }

    StagingArea area = StagingArea::create(ctx.staging_root, source);
    tracker.advance(RunState::Staged);

    LaunchSpec spec;
    spec.argv = interpreter;
    spec.argv.emplace_back(StagingArea::kScriptName);
    spec.working_dir = area.path();
    spec.budget = budget;
    return ctx.supervisor.run(*launcher, spec, &tracker);
}

ExecutionOutcome FallbackStrategy::run(const StrategyContext& ctx, const std::string& source,
                                       const ResourceBudget& budget, RunTracker& tracker) const {
    spdlog::warn("run {}: executing WITHOUT isolation, code has host filesystem and network access",
                 tracker.run_id());

    StagingArea area = StagingArea::create(ctx.staging_root, source);
    tracker.advance(RunState::Staged);

    LaunchSpec spec;
    spec.argv = {python_executable, area.script_path()};
    spec.working_dir = area.path();
    spec.budget = budget;
    // CPU backstop only; the wall clock deadline is enforced by the supervisor.
    spec.rlimits.max_cpu_seconds = budget.wall_clock_seconds + 1;
    spec.rlimits.max_core_size = 0;
    return ctx.supervisor.run(*launcher, spec, &tracker);
}

// ── ExecutionEngine ─────────────────────────────────────────────────────

ExecutionEngine::ExecutionEngine(EngineConfig config)
    : ExecutionEngine(config, std::make_unique<ContainerLauncher>(config.container)) {}

ExecutionEngine::ExecutionEngine(EngineConfig config,
                                 std::unique_ptr<ProcessLauncher> isolated_launcher)
    : config_(std::move(config)),
      policy_(config_.limits),
      supervisor_(supervisor_options(config_)),
      isolated_(std::move(isolated_launcher)),
      fallback_(std::make_unique<PosixLauncher>()) {
    if (!isolated_) throw std::invalid_argument("isolated launcher must not be null");
    if (config_.python_executable.empty()) {
        throw std::invalid_argument("python executable must be set");
    }
    if (config_.max_output_bytes == 0) {
        throw std::invalid_argument("max_output_bytes must be positive");
    }
}

ExecutionStrategy ExecutionEngine::select_strategy(const ExecutionRequest& request) const {
    if (request.isolation_requested) {
        return IsolatedStrategy{isolated_.get(), config_.container.interpreter,
                                config_.probe_before_run};
    }
    return FallbackStrategy{fallback_.get(), config_.python_executable};
}

ExecutionResponse ExecutionEngine::execute(const ExecutionRequest& request) const {
    // Declared first so it is torn down last, after the staging area.
    RunTracker tracker(new_run_id());
    ExecutionStrategy strategy = select_strategy(request);
    bool sandboxed = std::visit([](const auto& s) { return s.sandboxed(); }, strategy);
    StrategyContext ctx{supervisor_, config_.staging_root};

    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    spdlog::info("run {}: {} execution, {} bytes of source", tracker.run_id(),
                 sandboxed ? "isolated" : "unsandboxed", request.source.size());
    try {
        policy_.check_language(request.language);
        ResourceBudget budget = policy_.normalize(request.timeout_seconds, request.memory_limit_mb);

        ExecutionOutcome outcome = std::visit(
            [&](const auto& s) { return s.run(ctx, request.source, budget, tracker); }, strategy);

        spdlog::info("run {}: completed with exit code {} in {:.3f}s", tracker.run_id(),
                     outcome.exit_code, elapsed());
        return ResultTranslator::completed(outcome, sandboxed);
    } catch (const ExecutionError& e) {
        spdlog::info("run {}: {} after {:.3f}s: {}", tracker.run_id(), to_string(e.kind()),
                     elapsed(), e.what());
        return ResultTranslator::failed(e, sandboxed);
    } catch (const std::exception& e) {
        // Staging and process handles are already released by unwinding.
        spdlog::error("run {}: internal failure: {}", tracker.run_id(), e.what());
        return ResultTranslator::failed(ExecutionError(ErrorKind::ProcessLaunchFailed, e.what()),
                                        sandboxed);
    }
}

IsolationStatus ExecutionEngine::isolation_status() const {
    return isolated_->probe();
}

} // namespace exec_kernel

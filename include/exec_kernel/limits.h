#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace exec_kernel {

/// Defaults and ceilings applied to every request.
struct LimitPolicy {
    int default_timeout_seconds = 5;
    int max_timeout_seconds = 60;
    int default_memory_mb = 128;
    int max_memory_mb = 1024;
    int process_count_limit = 64;
};

/// Normalized limits for one execution. Read-only once derived.
struct ResourceBudget {
    int wall_clock_seconds;
    int memory_mb;
    int process_count;

    int64_t memory_bytes() const noexcept {
        return static_cast<int64_t>(memory_mb) * 1024 * 1024;
    }
};

class ResourceLimitPolicy {
public:
    /// Throws std::invalid_argument if the policy itself is inconsistent.
    explicit ResourceLimitPolicy(const LimitPolicy& policy = {});

    /// Apply defaults to omitted fields and reject out-of-range values with
    /// ExecutionError(InvalidResourceRequest) naming the field.
    ResourceBudget normalize(std::optional<int> timeout_seconds,
                             std::optional<int> memory_limit_mb) const;

    /// Only "python" is executable.
    void check_language(const std::string& language) const;

    const LimitPolicy& policy() const noexcept { return policy_; }

private:
    LimitPolicy policy_;
};

} // namespace exec_kernel

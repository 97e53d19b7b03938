#include "exec_kernel/limits.h"
#include "exec_kernel/errors.h"

#include <stdexcept>

namespace exec_kernel {

namespace {

int checked(std::optional<int> value, int fallback, int ceiling, const char* field) {
    int v = value.value_or(fallback);
    if (v <= 0) {
        throw ExecutionError(ErrorKind::InvalidResourceRequest,
                             std::string(field) + " must be positive, got " + std::to_string(v),
                             field);
    }
    if (v > ceiling) {
        throw ExecutionError(ErrorKind::InvalidResourceRequest,
                             std::string(field) + " exceeds maximum of " + std::to_string(ceiling) +
                                 ", got " + std::to_string(v),
                             field);
    }
    return v;
}

} // anonymous namespace

ResourceLimitPolicy::ResourceLimitPolicy(const LimitPolicy& policy) : policy_(policy) {
    if (policy_.max_timeout_seconds <= 0 || policy_.max_memory_mb <= 0 ||
        policy_.process_count_limit <= 0) {
        throw std::invalid_argument("limit policy ceilings must be positive");
    }
    if (policy_.default_timeout_seconds <= 0 ||
        policy_.default_timeout_seconds > policy_.max_timeout_seconds) {
        throw std::invalid_argument("default timeout must lie in (0, max_timeout_seconds]");
    }
    if (policy_.default_memory_mb <= 0 || policy_.default_memory_mb > policy_.max_memory_mb) {
        throw std::invalid_argument("default memory must lie in (0, max_memory_mb]");
    }
}

ResourceBudget ResourceLimitPolicy::normalize(std::optional<int> timeout_seconds,
                                              std::optional<int> memory_limit_mb) const {
    ResourceBudget budget{};
    budget.wall_clock_seconds = checked(timeout_seconds, policy_.default_timeout_seconds,
                                        policy_.max_timeout_seconds, "timeout_seconds");
    budget.memory_mb = checked(memory_limit_mb, policy_.default_memory_mb,
                               policy_.max_memory_mb, "memory_limit_mb");
    budget.process_count = policy_.process_count_limit;
    return budget;
}

void ResourceLimitPolicy::check_language(const std::string& language) const {
    if (language != "python") {
        throw ExecutionError(ErrorKind::InvalidResourceRequest,
                             "Only 'python' language supported, got '" + language + "'",
                             "language");
    }
}

} // namespace exec_kernel

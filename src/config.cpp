#include "exec_kernel/config.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace exec_kernel {

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

void read_string(const char* name, std::string& out) {
    if (const char* v = env(name)) out = v;
}

template <typename T>
void read_number(const char* name, T& out, long long min_value = 0) {
    const char* v = env(name);
    if (!v) return;
    long long parsed = 0;
    try {
        size_t pos = 0;
        parsed = std::stoll(v, &pos);
        if (pos != std::string(v).size()) throw std::invalid_argument(v);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + ": expected an integer, got '" + v + "'");
    }
    using bounds = std::numeric_limits<T>;
    if (parsed < min_value || static_cast<unsigned long long>(parsed) >
                                   static_cast<unsigned long long>(bounds::max())) {
        throw std::invalid_argument(std::string(name) + ": " + v + " is outside [" +
                                    std::to_string(min_value) + ", " +
                                    std::to_string(bounds::max()) + "]");
    }
    out = static_cast<T>(parsed);
}

void read_bool(const char* name, bool& out) {
    const char* v = env(name);
    if (!v) return;
    std::string s(v);
    if (s == "1" || s == "true" || s == "yes") {
        out = true;
    } else if (s == "0" || s == "false" || s == "no") {
        out = false;
    } else {
        throw std::invalid_argument(std::string(name) + ": expected a boolean, got '" + s + "'");
    }
}

} // anonymous namespace

EngineConfig EngineConfig::from_env() {
    EngineConfig cfg;

    read_number("EXEC_KERNEL_DEFAULT_TIMEOUT", cfg.limits.default_timeout_seconds);
    read_number("EXEC_KERNEL_MAX_TIMEOUT", cfg.limits.max_timeout_seconds);
    read_number("EXEC_KERNEL_DEFAULT_MEMORY_MB", cfg.limits.default_memory_mb);
    read_number("EXEC_KERNEL_MAX_MEMORY_MB", cfg.limits.max_memory_mb);
    read_number("EXEC_KERNEL_PIDS_LIMIT", cfg.limits.process_count_limit);

    read_string("EXEC_KERNEL_STAGING_ROOT", cfg.staging_root);
    read_string("EXEC_KERNEL_PYTHON", cfg.python_executable);
    read_number("EXEC_KERNEL_MAX_OUTPUT_BYTES", cfg.max_output_bytes);
    read_bool("EXEC_KERNEL_PROBE_BEFORE_RUN", cfg.probe_before_run);
    read_string("EXEC_KERNEL_LOG_LEVEL", cfg.log_level);

    read_string("EXEC_KERNEL_CONTAINER_RUNTIME", cfg.container.runtime);
    read_string("EXEC_KERNEL_CONTAINER_IMAGE", cfg.container.image);
    read_string("EXEC_KERNEL_CONTAINER_USER", cfg.container.user);
    read_string("EXEC_KERNEL_TMPFS_SIZE", cfg.container.tmpfs_size);
    read_number("EXEC_KERNEL_PROBE_TIMEOUT", cfg.container.probe_timeout_seconds, 1);

    return cfg;
}

void configure_logging(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        throw std::invalid_argument("unknown log level '" + level + "'");
    }
    spdlog::set_level(lvl);
}

} // namespace exec_kernel

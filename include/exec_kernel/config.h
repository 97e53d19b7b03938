#pragma once

#include <cstddef>
#include <string>

#include "container.h"
#include "limits.h"

namespace exec_kernel {

struct EngineConfig {
    LimitPolicy limits;
    std::string staging_root;                  // empty = system temp directory
    std::string python_executable = "python3"; // unsandboxed interpreter, PATH lookup
    ContainerSettings container;
    size_t max_output_bytes = 1 << 20;
    bool probe_before_run = true;              // check the runtime before staging
    std::string log_level = "info";

    /// Defaults overlaid with EXEC_KERNEL_* environment variables.
    /// Throws std::invalid_argument naming the variable on a malformed value.
    static EngineConfig from_env();
};

/// Set the spdlog level ("trace", "debug", "info", "warn", "error", "off").
void configure_logging(const std::string& level);

} // namespace exec_kernel

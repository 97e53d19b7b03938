#include "test_util.h"

#include <exec_kernel/config.h>

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <limits>
#include <stdexcept>
#include <string>

using exec_kernel::EngineConfig;
using test_util::EnvGuard;

// NOLINTNEXTLINE
TEST(engine_config, defaults_match_the_service_contract) {
    EngineConfig cfg;
    EXPECT_EQ(cfg.limits.default_timeout_seconds, 5);
    EXPECT_EQ(cfg.limits.default_memory_mb, 128);
    EXPECT_EQ(cfg.limits.process_count_limit, 64);
    EXPECT_EQ(cfg.container.runtime, "docker");
    EXPECT_EQ(cfg.container.image, "python:3.11-slim");
    EXPECT_EQ(cfg.container.user, "1000:1000");
    EXPECT_EQ(cfg.python_executable, "python3");
    EXPECT_TRUE(cfg.probe_before_run);
}

// NOLINTNEXTLINE
TEST(engine_config, environment_overrides_defaults) {
    EnvGuard timeout("EXEC_KERNEL_MAX_TIMEOUT", "90");
    EnvGuard memory("EXEC_KERNEL_DEFAULT_MEMORY_MB", "256");
    EnvGuard runtime("EXEC_KERNEL_CONTAINER_RUNTIME", "podman");
    EnvGuard image("EXEC_KERNEL_CONTAINER_IMAGE", "python:3.12-slim");
    EnvGuard probe("EXEC_KERNEL_PROBE_BEFORE_RUN", "false");
    EnvGuard root("EXEC_KERNEL_STAGING_ROOT", "/var/tmp");

    auto cfg = EngineConfig::from_env();
    EXPECT_EQ(cfg.limits.max_timeout_seconds, 90);
    EXPECT_EQ(cfg.limits.default_memory_mb, 256);
    EXPECT_EQ(cfg.container.runtime, "podman");
    EXPECT_EQ(cfg.container.image, "python:3.12-slim");
    EXPECT_FALSE(cfg.probe_before_run);
    EXPECT_EQ(cfg.staging_root, "/var/tmp");
    EXPECT_EQ(cfg.limits.default_timeout_seconds, 5);
}

// NOLINTNEXTLINE
TEST(engine_config, empty_variables_are_ignored) {
    EnvGuard timeout("EXEC_KERNEL_MAX_TIMEOUT", "");
    EXPECT_EQ(EngineConfig::from_env().limits.max_timeout_seconds, 60);
}

// NOLINTNEXTLINE
TEST(engine_config, malformed_numbers_name_the_variable) {
    for (const char* bad : {"abc", "12s", "-4", "99999999999999999999", "4294967306"}) {
        EnvGuard timeout("EXEC_KERNEL_MAX_TIMEOUT", bad);
        try {
            EngineConfig::from_env();
            FAIL() << "accepted " << bad;
        } catch (const std::invalid_argument& e) {
            EXPECT_NE(std::string(e.what()).find("EXEC_KERNEL_MAX_TIMEOUT"), std::string::npos)
                << e.what();
        }
    }
}

// NOLINTNEXTLINE
TEST(engine_config, integer_range_is_enforced) {
    {
        EnvGuard timeout("EXEC_KERNEL_MAX_TIMEOUT", std::to_string(std::numeric_limits<int>::max()));
        EXPECT_EQ(EngineConfig::from_env().limits.max_timeout_seconds,
                  std::numeric_limits<int>::max());
    }
    {
        EnvGuard probe("EXEC_KERNEL_PROBE_TIMEOUT", "0");
        EXPECT_THROW(EngineConfig::from_env(), std::invalid_argument);
    }
    {
        EnvGuard probe("EXEC_KERNEL_PROBE_TIMEOUT", "3");
        EXPECT_EQ(EngineConfig::from_env().container.probe_timeout_seconds, 3);
    }
}

// NOLINTNEXTLINE
TEST(engine_config, malformed_booleans_are_refused) {
    EnvGuard probe("EXEC_KERNEL_PROBE_BEFORE_RUN", "maybe");
    EXPECT_THROW(EngineConfig::from_env(), std::invalid_argument);
}

// NOLINTNEXTLINE
TEST(configure_logging, sets_the_global_level) {
    auto before = spdlog::get_level();
    exec_kernel::configure_logging("debug");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    exec_kernel::configure_logging("off");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::off);
    EXPECT_THROW(exec_kernel::configure_logging("chatty"), std::invalid_argument);
    spdlog::set_level(before);
}

#include "test_util.h"

#include <exec_kernel/errors.h>
#include <exec_kernel/staging.h>

#include <gtest/gtest.h>

#include <sys/stat.h>

#include <filesystem>
#include <utility>

using exec_kernel::ErrorKind;
using exec_kernel::ExecutionError;
using exec_kernel::StagingArea;
using test_util::TempDir;

namespace fs = std::filesystem;

// NOLINTNEXTLINE
TEST(staging_area, writes_exactly_one_script) {
    TempDir root;
    auto area = StagingArea::create(root.path(), "print(2+2)\n");

    EXPECT_EQ(fs::path(area.path()).parent_path(), fs::path(root.path()));
    EXPECT_EQ(area.name().rfind("fusional-", 0), 0u) << area.name();
    EXPECT_EQ(test_util::read_file(area.script_path()), "print(2+2)\n");
    EXPECT_EQ(test_util::count_entries(area.path()), 1u);
}

// NOLINTNEXTLINE
TEST(staging_area, readable_by_other_users) {
    TempDir root;
    auto area = StagingArea::create(root.path(), "pass\n");

    struct stat st;
    ASSERT_EQ(stat(area.path().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0755u);
    ASSERT_EQ(stat(area.script_path().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0644u);
}

// NOLINTNEXTLINE
TEST(staging_area, removed_when_handle_is_destroyed) {
    TempDir root;
    std::string path;
    {
        auto area = StagingArea::create(root.path(), "x = 1\n");
        path = area.path();
        ASSERT_TRUE(fs::exists(path));
    }
    EXPECT_FALSE(fs::exists(path));
    EXPECT_EQ(test_util::count_entries(root.path()), 0u);
}

// NOLINTNEXTLINE
TEST(staging_area, removed_on_exception_unwinding) {
    TempDir root;
    try {
        auto area = StagingArea::create(root.path(), "x = 1\n");
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(test_util::count_entries(root.path()), 0u);
}

// NOLINTNEXTLINE
TEST(staging_area, concurrent_areas_are_distinct) {
    TempDir root;
    auto a = StagingArea::create(root.path(), "a");
    auto b = StagingArea::create(root.path(), "b");
    EXPECT_NE(a.path(), b.path());
    EXPECT_EQ(test_util::read_file(a.script_path()), "a");
    EXPECT_EQ(test_util::read_file(b.script_path()), "b");
}

// NOLINTNEXTLINE
TEST(staging_area, move_transfers_ownership) {
    TempDir root;
    auto a = StagingArea::create(root.path(), "a");
    std::string path = a.path();

    StagingArea b = std::move(a);
    EXPECT_EQ(b.path(), path);
    EXPECT_TRUE(a.path().empty());
    EXPECT_TRUE(fs::exists(path));

    b.remove();
    EXPECT_FALSE(fs::exists(path));
    b.remove();
}

// NOLINTNEXTLINE
TEST(staging_area, empty_source_is_allowed) {
    TempDir root;
    auto area = StagingArea::create(root.path(), "");
    EXPECT_EQ(fs::file_size(area.script_path()), 0u);
}

// NOLINTNEXTLINE
TEST(staging_area, missing_root_fails_setup) {
    TempDir root;
    try {
        StagingArea::create(root / "does/not/exist", "print(1)");
        FAIL() << "expected EnvironmentSetupFailed";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EnvironmentSetupFailed);
        EXPECT_NE(std::string(e.what()).find("mkdtemp"), std::string::npos) << e.what();
    }
    EXPECT_EQ(test_util::count_entries(root.path()), 0u);
}

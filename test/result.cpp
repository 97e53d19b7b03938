#include <exec_kernel/result.h>

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace exec_kernel;

// NOLINTNEXTLINE
TEST(result_translator, completed_carries_the_outcome) {
    ExecutionOutcome outcome;
    outcome.stdout_output = "4\n";
    outcome.exit_code = 0;

    auto r = ResultTranslator::completed(outcome, false);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.kind, ResultKind::Completed);
    ASSERT_TRUE(r.outcome.has_value());
    EXPECT_EQ(r.outcome->stdout_output, "4\n");
    EXPECT_FALSE(r.sandboxed);
    EXPECT_TRUE(r.message.empty());
    EXPECT_EQ(http_status(r.kind), 200);
}

// NOLINTNEXTLINE
TEST(result_translator, non_zero_exit_is_still_completed) {
    ExecutionOutcome outcome;
    outcome.exit_code = 1;
    outcome.stderr_output = "ZeroDivisionError";
    auto r = ResultTranslator::completed(outcome, true);
    EXPECT_EQ(r.kind, ResultKind::Completed);
    EXPECT_TRUE(r.sandboxed);
}

// NOLINTNEXTLINE
TEST(result_translator, timeout_is_distinct_and_has_no_outcome) {
    ExecutionError err(ErrorKind::ExecutionTimedOut, "Execution timed out after 1s");
    auto r = ResultTranslator::failed(err, false);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.kind, ResultKind::TimedOut);
    EXPECT_FALSE(r.outcome.has_value());
    EXPECT_EQ(r.message, "Execution timed out after 1s");
    EXPECT_EQ(http_status(r.kind), 504);
}

// NOLINTNEXTLINE
TEST(result_translator, invalid_request_keeps_the_field) {
    ExecutionError err(ErrorKind::InvalidResourceRequest, "bad", "memory_limit_mb");
    auto r = ResultTranslator::failed(err, false);
    EXPECT_EQ(r.kind, ResultKind::InvalidResourceRequest);
    EXPECT_EQ(r.field, "memory_limit_mb");
    EXPECT_EQ(http_status(r.kind), 400);
}

// NOLINTNEXTLINE
TEST(result_translator, every_error_kind_maps_to_its_own_result_kind) {
    const ErrorKind kinds[] = {
        ErrorKind::InvalidResourceRequest, ErrorKind::EnvironmentSetupFailed,
        ErrorKind::IsolationUnavailable,   ErrorKind::ProcessLaunchFailed,
        ErrorKind::ExecutionTimedOut,
    };
    std::set<ResultKind> seen;
    std::set<std::string> names;
    for (auto k : kinds) {
        auto rk = ResultTranslator::kind_of(k);
        EXPECT_NE(rk, ResultKind::Completed);
        seen.insert(rk);
        names.insert(to_string(rk));
    }
    EXPECT_EQ(seen.size(), 5u);
    EXPECT_EQ(names.size(), 5u);
}

// NOLINTNEXTLINE
TEST(result_translator, setup_failures_are_internal_errors) {
    EXPECT_EQ(http_status(ResultKind::ProcessLaunchFailed), 500);
    EXPECT_EQ(http_status(ResultKind::EnvironmentSetupFailed), 500);
    EXPECT_EQ(http_status(ResultKind::IsolationUnavailable), 500);
}

// NOLINTNEXTLINE
TEST(result_translator, field_is_only_reported_for_invalid_requests) {
    ExecutionError err(ErrorKind::ProcessLaunchFailed, "exec python3: No such file", "ignored");
    auto r = ResultTranslator::failed(err, true);
    EXPECT_TRUE(r.field.empty());
    EXPECT_TRUE(r.sandboxed);
}

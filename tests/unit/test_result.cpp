/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the Error taxonomy.
 * @author Dimitris Kafetzis
 */

#include "core/result.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace task_orchestrator;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().code, ErrorCode::Internal);
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapPropagatesError) {
    Result<int> r = Error{ErrorCode::NotFound, "missing"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_TRUE(doubled.error().is(ErrorCode::NotFound));
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 20;
    auto chained = r.and_then([](int v) -> Result<std::string> {
        if (v > 10) return std::to_string(v + 1);
        return Error{ErrorCode::InvalidArgument, "too small"};
    });
    ASSERT_TRUE(chained.has_value());
    EXPECT_EQ(*chained, "21");
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{"fail"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> failed = Error{ErrorCode::StorageFailure, "disk"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_TRUE(failed.error().is(ErrorCode::StorageFailure));
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>(ErrorCode::ProjectNotFound, "no project");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ProjectNotFound);
    EXPECT_EQ(r.error().what(), "no project");
}

// ─── Error taxonomy ──────────────────────────

TEST(ErrorTest, GateViolationCarriesKind) {
    auto err = Error::gate_violation(GateKind::TestsFailed, "Task cannot be completed with failed tests.");
    EXPECT_EQ(err.code, ErrorCode::GateViolation);
    EXPECT_TRUE(err.is_gate(GateKind::TestsFailed));
    EXPECT_FALSE(err.is_gate(GateKind::SpecMissing));
}

TEST(ErrorTest, PlainErrorIsNoGate) {
    Error err{ErrorCode::NotFound, "Task not found: 7"};
    EXPECT_FALSE(err.gate.has_value());
    EXPECT_FALSE(err.is_gate(GateKind::ApprovalRequired));
}

TEST(ErrorTest, CodeNames) {
    EXPECT_EQ(to_string(ErrorCode::NotFound), "task_not_found");
    EXPECT_EQ(to_string(ErrorCode::DependencyEndpointNotFound), "dependency_endpoint_not_found");
    EXPECT_EQ(to_string(ErrorCode::CycleRejected), "cycle_rejected");
    EXPECT_EQ(to_string(GateKind::SpecMissing), "spec_missing");
    EXPECT_EQ(to_string(GateKind::ApprovalRequired), "approval_required");
}

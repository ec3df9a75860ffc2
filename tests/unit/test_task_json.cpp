/**
 * @file test_task_json.cpp
 * @brief Unit tests for task / dependency / project JSON records.
 * @author Dimitris Kafetzis
 */

#include "workload/task.hpp"

#include <gtest/gtest.h>
#include <chrono>

using namespace task_orchestrator;

TEST(TaskJsonTest, DurationFallsBackToDefault) {
    Task task{.id = 1, .project_id = 1, .name = "t"};
    EXPECT_DOUBLE_EQ(task.duration_hours(1.0), 1.0);

    task.estimate_hours = 0.0;
    EXPECT_DOUBLE_EQ(task.duration_hours(1.5), 1.5);

    task.estimate_hours = 4.0;
    EXPECT_DOUBLE_EQ(task.duration_hours(1.0), 4.0);
}

TEST(TaskJsonTest, ParseMinimalTask) {
    auto j = Document::parse(R"({"id": 7, "project_id": 2, "name": "Write docs"})");
    auto task = task_from_json(j);
    ASSERT_TRUE(task.has_value()) << task.error().message;
    EXPECT_EQ(task->id, 7);
    EXPECT_EQ(task->project_id, 2);
    EXPECT_EQ(task->status, TaskStatus::Pending);
    EXPECT_FALSE(task->estimate_hours.has_value());
    EXPECT_FALSE(task->spec.has_value());
    EXPECT_TRUE(task->inputs.is_object());
    EXPECT_TRUE(task->tests.is_array());
}

TEST(TaskJsonTest, ParseFullTask) {
    auto j = Document::parse(R"({
        "id": 3, "project_id": 1, "name": "Build", "description": "compile",
        "status": "approved", "estimate_hours": 2.5, "requires_approval": true,
        "approved_by": "alice", "approved_at": "2024-05-01T10:20:30.250Z",
        "order": 4, "spec": {"objective": "ship"}, "test_results": null
    })");
    auto task = task_from_json(j);
    ASSERT_TRUE(task.has_value()) << task.error().message;
    EXPECT_EQ(task->status, TaskStatus::Approved);
    EXPECT_DOUBLE_EQ(*task->estimate_hours, 2.5);
    EXPECT_TRUE(task->requires_approval);
    EXPECT_EQ(task->approved_by, "alice");
    ASSERT_TRUE(task->approved_at.has_value());
    EXPECT_EQ(format_timestamp(*task->approved_at), "2024-05-01T10:20:30.250Z");
    EXPECT_EQ(task->order, 4);
    ASSERT_TRUE(task->spec.has_value());
    EXPECT_EQ((*task->spec)["objective"], "ship");
    EXPECT_FALSE(task->test_results.has_value());
}

TEST(TaskJsonTest, ApprovedAtFractionScaledToMilliseconds) {
    auto parse_ms = [](const std::string& stamp) -> int64_t {
        Document j = {{"id", 1}, {"project_id", 1}, {"name", "t"}, {"approved_at", stamp}};
        auto task = task_from_json(j);
        EXPECT_TRUE(task.has_value());
        if (!task || !task->approved_at) return -1;
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            task->approved_at->time_since_epoch()).count();
    };

    EXPECT_EQ(parse_ms("2023-11-14T22:13:20Z"), 1700000000000);
    EXPECT_EQ(parse_ms("2023-11-14T22:13:20.5Z"), 1700000000500);
    EXPECT_EQ(parse_ms("2023-11-14T22:13:20.05Z"), 1700000000050);
    EXPECT_EQ(parse_ms("2023-11-14T22:13:20.123Z"), 1700000000123);
    EXPECT_EQ(parse_ms("2023-11-14T22:13:20.123456Z"), 1700000000123);
}

TEST(TaskJsonTest, UnknownStatusRejected) {
    auto j = Document::parse(R"({"id": 1, "project_id": 1, "name": "x", "status": "done"})");
    auto task = task_from_json(j);
    ASSERT_FALSE(task.has_value());
    EXPECT_EQ(task.error().code, ErrorCode::InvalidArgument);
}

TEST(TaskJsonTest, MissingIdRejected) {
    auto task = task_from_json(Document::parse(R"({"project_id": 1, "name": "x"})"));
    ASSERT_FALSE(task.has_value());
    EXPECT_EQ(task.error().code, ErrorCode::InvalidArgument);
}

TEST(TaskJsonTest, TaskSurvivesJsonRendering) {
    Task task{
        .id = 9, .project_id = 2, .name = "Deploy",
        .estimate_hours = 3.0, .status = TaskStatus::Review,
        .requires_approval = true, .order = 1,
        .spec = Document{{"objective", "deploy"}}
    };
    Document j = task;
    EXPECT_EQ(j["status"], "review");
    EXPECT_TRUE(j["test_results"].is_null());

    auto parsed = task_from_json(j);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->name, "Deploy");
    EXPECT_EQ(parsed->status, TaskStatus::Review);
    EXPECT_EQ(parsed->spec, task.spec);
}

TEST(TaskJsonTest, TaskRefRendersEstimate) {
    TaskRef ref{.task_id = 4, .name = "B", .duration_hours = 3.0, .status = TaskStatus::Pending};
    Document j = ref;
    EXPECT_EQ(j["task_id"], 4);
    EXPECT_DOUBLE_EQ(j["estimate_hours"].get<double>(), 3.0);
    EXPECT_EQ(j["status"], "pending");
}

TEST(TaskJsonTest, ParseDependencyAndProject) {
    auto dep = dependency_from_json(Document::parse(R"({"task_id": 2, "depends_on_task_id": 1})"));
    ASSERT_TRUE(dep.has_value());
    EXPECT_EQ(*dep, (TaskDependency{.task_id = 2, .depends_on_task_id = 1}));

    auto project = project_from_json(Document::parse(
        R"({"id": 5, "name": "P", "status": "planning", "risk_level": "high",
            "acceptance_criteria": ["fast", "safe"]})"));
    ASSERT_TRUE(project.has_value());
    EXPECT_EQ(project->status, ProjectStatus::Planning);
    EXPECT_EQ(project->risk_level, RiskLevel::High);
    EXPECT_EQ(project->acceptance_criteria.size(), 2u);
}

TEST(TaskJsonTest, ProjectWithBadRiskRejected) {
    auto project = project_from_json(Document::parse(R"({"id": 5, "name": "P", "risk_level": "severe"})"));
    EXPECT_FALSE(project.has_value());
}

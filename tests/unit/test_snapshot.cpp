/**
 * @file test_snapshot.cpp
 * @brief Unit tests for snapshot import/export.
 * @author Dimitris Kafetzis
 */

#include "storage/snapshot.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace task_orchestrator;

class SnapshotTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "to_test_snapshot";
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
};

static Document sample_snapshot() {
    return Document::parse(R"({
        "projects": [{"id": 3, "name": "Site", "status": "planning", "risk_level": "medium"}],
        "tasks": [
            {"id": 1, "project_id": 3, "name": "Design", "estimate_hours": 2.5,
             "status": "approved", "requires_approval": true, "order": 0,
             "spec": {"objective": "layout"}},
            {"id": 2, "project_id": 3, "name": "Build", "estimate_hours": 4.0, "order": 1}
        ],
        "dependencies": [{"task_id": 2, "depends_on_task_id": 1}]
    })");
}

TEST_F(SnapshotTest, ImportPopulatesStore) {
    InMemoryTaskStore store;
    ASSERT_TRUE(import_snapshot(sample_snapshot(), store).has_value());

    auto project = store.get_project(3);
    ASSERT_TRUE(project.has_value());
    EXPECT_EQ(project->status, ProjectStatus::Planning);

    auto design = store.get_task(1);
    ASSERT_TRUE(design.has_value());
    EXPECT_EQ(design->status, TaskStatus::Approved);
    EXPECT_TRUE(design->requires_approval);
    EXPECT_TRUE(is_non_empty(design->spec));

    auto deps = store.list_dependencies(3);
    ASSERT_TRUE(deps.has_value());
    ASSERT_EQ(deps->size(), 1u);
    EXPECT_EQ((*deps)[0], (TaskDependency{.task_id = 2, .depends_on_task_id = 1}));
}

TEST_F(SnapshotTest, MissingSectionsAreEmpty) {
    InMemoryTaskStore store;
    ASSERT_TRUE(import_snapshot(Document::object(), store).has_value());
    EXPECT_TRUE(store.all_tasks().empty());
}

TEST_F(SnapshotTest, NonObjectRejected) {
    InMemoryTaskStore store;
    auto result = import_snapshot(Document::array(), store);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::InvalidArgument));
}

TEST_F(SnapshotTest, DanglingEdgeRejected) {
    auto doc = sample_snapshot();
    doc["dependencies"].push_back(Document{{"task_id", 2}, {"depends_on_task_id", 99}});
    InMemoryTaskStore store;
    auto result = import_snapshot(doc, store);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::DependencyEndpointNotFound));
}

TEST_F(SnapshotTest, SaveThenLoad) {
    InMemoryTaskStore original;
    ASSERT_TRUE(import_snapshot(sample_snapshot(), original).has_value());

    auto path = dir_ / "state.json";
    ASSERT_TRUE(save_snapshot(path, original).has_value());

    InMemoryTaskStore restored;
    ASSERT_TRUE(load_snapshot(path, restored).has_value());
    EXPECT_EQ(export_snapshot(restored), export_snapshot(original));

    // Counters continue after the highest imported id.
    auto next = restored.create_task(Task{.project_id = 3, .name = "Ship"});
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, 3);
}

TEST_F(SnapshotTest, MissingFile) {
    InMemoryTaskStore store;
    auto result = load_snapshot(dir_ / "absent.json", store);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::StorageFailure));
}

TEST_F(SnapshotTest, InvalidJson) {
    auto path = dir_ / "broken.json";
    std::ofstream(path) << "{\"projects\": [";

    InMemoryTaskStore store;
    auto result = load_snapshot(path, store);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::InvalidArgument));
}

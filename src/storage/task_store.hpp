/**
 * @file task_store.hpp
 * @brief Storage collaborator interface.
 * @author Dimitris Kafetzis
 *
 * The engine never owns persistent state: every analysis reads a snapshot
 * through this interface and every lifecycle transition is written back
 * through update_task(), which implementations must execute as one
 * serialized check-then-write per task. Analyses read through snapshot()
 * so tasks and edges always come from the same moment. Failures carry
 * ErrorCode::StorageFailure and are propagated to callers unchanged.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/task.hpp"

#include <functional>
#include <vector>

namespace task_orchestrator {

/// Mutation applied to a task under the store's per-task serialization.
/// Returning an error aborts the write and leaves the stored task untouched.
using TaskMutation = std::function<Result<void>(Task&)>;

/// A project with its tasks and edges, read as one consistent unit.
/// Every edge names tasks present in `tasks`.
struct ProjectSnapshot {
    Project project;
    std::vector<Task> tasks;                 ///< Ordered by (order, id)
    std::vector<TaskDependency> dependencies;
};

struct OrderUpdate {
    TaskId task_id = 0;
    int32_t order = 0;
};

class ITaskStore {
public:
    virtual ~ITaskStore() = default;

    // ── Projects ─────────────────────────────
    virtual Result<Project> get_project(ProjectId id) = 0;
    /// Assigns an id when `project.id` is 0.
    virtual Result<ProjectId> create_project(Project project) = 0;
    virtual Result<void> save_project(const Project& project) = 0;

    // ── Tasks ────────────────────────────────
    /// One consistent snapshot, ordered by (order, id).
    virtual Result<std::vector<Task>> list_tasks(ProjectId project) = 0;
    virtual Result<Task> get_task(TaskId id) = 0;
    /// Assigns an id when `task.id` is 0.
    virtual Result<TaskId> create_task(Task task) = 0;
    virtual Result<void> save_task(const Task& task) = 0;
    virtual Result<Task> update_task(TaskId id, const TaskMutation& mutation) = 0;
    /// All-or-nothing: an unknown id or a failed write leaves every order unchanged.
    virtual Result<void> update_orders(const std::vector<OrderUpdate>& updates) = 0;
    /// Removes the task and every edge touching it.
    virtual Result<void> delete_task(TaskId id) = 0;

    // ── Dependencies ─────────────────────────
    /// Edges whose dependent task belongs to `project`.
    virtual Result<std::vector<TaskDependency>> list_dependencies(ProjectId project) = 0;
    virtual Result<void> save_dependency(const TaskDependency& dependency) = 0;

    // ── Snapshots ────────────────────────────
    /// Project, tasks and edges under a single read.
    virtual Result<ProjectSnapshot> snapshot(ProjectId project) = 0;
};

}  // namespace task_orchestrator

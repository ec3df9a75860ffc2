/**
 * @file in_memory_store.hpp
 * @brief ITaskStore backed by process memory.
 * @author Dimitris Kafetzis
 *
 * Used by the CLI (loaded from a snapshot file), the tests and the
 * benchmark. Reads take a shared lock, writes an exclusive one, so
 * update_task() runs its gate check and write as one critical section.
 * Test helpers allow injecting storage failures.
 */

#pragma once

#include "storage/task_store.hpp"

#include <atomic>
#include <map>
#include <shared_mutex>
#include <vector>

namespace task_orchestrator {

class InMemoryTaskStore : public ITaskStore {
public:
    InMemoryTaskStore() = default;

    // Non-copyable
    InMemoryTaskStore(const InMemoryTaskStore&) = delete;
    InMemoryTaskStore& operator=(const InMemoryTaskStore&) = delete;

    Result<Project> get_project(ProjectId id) override;
    Result<ProjectId> create_project(Project project) override;
    Result<void> save_project(const Project& project) override;

    Result<std::vector<Task>> list_tasks(ProjectId project) override;
    Result<Task> get_task(TaskId id) override;
    Result<TaskId> create_task(Task task) override;
    Result<void> save_task(const Task& task) override;
    Result<Task> update_task(TaskId id, const TaskMutation& mutation) override;
    Result<void> update_orders(const std::vector<OrderUpdate>& updates) override;
    Result<void> delete_task(TaskId id) override;

    Result<std::vector<TaskDependency>> list_dependencies(ProjectId project) override;
    Result<void> save_dependency(const TaskDependency& dependency) override;

    Result<ProjectSnapshot> snapshot(ProjectId project) override;

    // ── Whole-store access (snapshots) ───────
    [[nodiscard]] std::vector<Project> all_projects() const;
    [[nodiscard]] std::vector<Task> all_tasks() const;
    [[nodiscard]] std::vector<TaskDependency> all_dependencies() const;

    // ── Test helpers ─────────────────────────
    /// Make the next `count` write operations fail with StorageFailure.
    void fail_next_writes(uint32_t count) noexcept { failing_writes_.store(count); }
    /// Make every read fail with StorageFailure until cleared.
    void fail_reads(bool fail) noexcept { failing_reads_.store(fail); }

private:
    Result<void> check_write();
    Result<void> check_read() const;

    // Callers hold mutex_.
    std::vector<Task> tasks_of(ProjectId project) const;
    std::vector<TaskDependency> dependencies_of(ProjectId project) const;

    mutable std::shared_mutex mutex_;
    std::map<ProjectId, Project> projects_;
    std::map<TaskId, Task> tasks_;
    std::vector<TaskDependency> dependencies_;
    ProjectId next_project_id_ = 1;
    TaskId next_task_id_ = 1;

    std::atomic<uint32_t> failing_writes_{0};
    std::atomic<bool> failing_reads_{false};
};

}  // namespace task_orchestrator

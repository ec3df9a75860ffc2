/**
 * @file in_memory_store.cpp
 * @brief InMemoryTaskStore implementation.
 * @author Dimitris Kafetzis
 */

#include "storage/in_memory_store.hpp"

#include <algorithm>
#include <mutex>

namespace task_orchestrator {

Result<void> InMemoryTaskStore::check_write() {
    auto remaining = failing_writes_.load();
    while (remaining > 0) {
        if (failing_writes_.compare_exchange_weak(remaining, remaining - 1)) {
            return Error{ErrorCode::StorageFailure, "Injected write failure"};
        }
    }
    return Result<void>{};
}

Result<void> InMemoryTaskStore::check_read() const {
    if (failing_reads_.load()) {
        return Error{ErrorCode::StorageFailure, "Injected read failure"};
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Projects
// ─────────────────────────────────────────────

Result<Project> InMemoryTaskStore::get_project(ProjectId id) {
    if (auto ok = check_read(); !ok) return ok.error();

    std::shared_lock lock(mutex_);
    auto it = projects_.find(id);
    if (it == projects_.end()) {
        return Error{ErrorCode::ProjectNotFound, "Project not found: " + std::to_string(id)};
    }
    return it->second;
}

Result<ProjectId> InMemoryTaskStore::create_project(Project project) {
    if (auto ok = check_write(); !ok) return ok.error();

    std::unique_lock lock(mutex_);
    if (project.id == 0) {
        project.id = next_project_id_;
    } else if (projects_.contains(project.id)) {
        return Error{ErrorCode::InvalidArgument,
                     "Project already exists: " + std::to_string(project.id)};
    }
    next_project_id_ = std::max(next_project_id_, project.id + 1);

    auto id = project.id;
    projects_.emplace(id, std::move(project));
    return id;
}

Result<void> InMemoryTaskStore::save_project(const Project& project) {
    if (auto ok = check_write(); !ok) return ok;

    std::unique_lock lock(mutex_);
    auto it = projects_.find(project.id);
    if (it == projects_.end()) {
        return Error{ErrorCode::ProjectNotFound, "Project not found: " + std::to_string(project.id)};
    }
    it->second = project;
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Tasks
// ─────────────────────────────────────────────

Result<std::vector<Task>> InMemoryTaskStore::list_tasks(ProjectId project) {
    if (auto ok = check_read(); !ok) return ok.error();

    std::shared_lock lock(mutex_);
    return tasks_of(project);
}

Result<Task> InMemoryTaskStore::get_task(TaskId id) {
    if (auto ok = check_read(); !ok) return ok.error();

    std::shared_lock lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return Error{ErrorCode::NotFound, "Task not found: " + std::to_string(id)};
    }
    return it->second;
}

Result<TaskId> InMemoryTaskStore::create_task(Task task) {
    if (auto ok = check_write(); !ok) return ok.error();

    std::unique_lock lock(mutex_);
    if (!projects_.contains(task.project_id)) {
        return Error{ErrorCode::ProjectNotFound,
                     "Project not found: " + std::to_string(task.project_id)};
    }
    if (task.id == 0) {
        task.id = next_task_id_;
    } else if (tasks_.contains(task.id)) {
        return Error{ErrorCode::InvalidArgument, "Task already exists: " + std::to_string(task.id)};
    }
    next_task_id_ = std::max(next_task_id_, task.id + 1);

    auto id = task.id;
    tasks_.emplace(id, std::move(task));
    return id;
}

Result<void> InMemoryTaskStore::save_task(const Task& task) {
    if (auto ok = check_write(); !ok) return ok;

    std::unique_lock lock(mutex_);
    auto it = tasks_.find(task.id);
    if (it == tasks_.end()) {
        return Error{ErrorCode::NotFound, "Task not found: " + std::to_string(task.id)};
    }
    it->second = task;
    return Result<void>{};
}

Result<Task> InMemoryTaskStore::update_task(TaskId id, const TaskMutation& mutation) {
    std::unique_lock lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return Error{ErrorCode::NotFound, "Task not found: " + std::to_string(id)};
    }

    Task updated = it->second;
    if (auto applied = mutation(updated); !applied) {
        return applied.error();
    }
    if (auto ok = check_write(); !ok) return ok.error();

    it->second = updated;
    return updated;
}

Result<void> InMemoryTaskStore::update_orders(const std::vector<OrderUpdate>& updates) {
    std::unique_lock lock(mutex_);
    for (const auto& update : updates) {
        if (!tasks_.contains(update.task_id)) {
            return Error{ErrorCode::NotFound, "Task not found: " + std::to_string(update.task_id)};
        }
    }
    if (auto ok = check_write(); !ok) return ok;

    for (const auto& update : updates) {
        tasks_.at(update.task_id).order = update.order;
    }
    return Result<void>{};
}

Result<void> InMemoryTaskStore::delete_task(TaskId id) {
    if (auto ok = check_write(); !ok) return ok;

    std::unique_lock lock(mutex_);
    if (tasks_.erase(id) == 0) {
        return Error{ErrorCode::NotFound, "Task not found: " + std::to_string(id)};
    }
    std::erase_if(dependencies_, [id](const TaskDependency& dep) {
        return dep.task_id == id || dep.depends_on_task_id == id;
    });
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Dependencies
// ─────────────────────────────────────────────

Result<std::vector<TaskDependency>> InMemoryTaskStore::list_dependencies(ProjectId project) {
    if (auto ok = check_read(); !ok) return ok.error();

    std::shared_lock lock(mutex_);
    return dependencies_of(project);
}

Result<void> InMemoryTaskStore::save_dependency(const TaskDependency& dependency) {
    if (auto ok = check_write(); !ok) return ok;

    std::unique_lock lock(mutex_);
    if (!tasks_.contains(dependency.task_id) || !tasks_.contains(dependency.depends_on_task_id)) {
        return Error{ErrorCode::DependencyEndpointNotFound,
                     "One or both tasks not found: " + std::to_string(dependency.task_id)
                     + " -> " + std::to_string(dependency.depends_on_task_id)};
    }
    if (std::find(dependencies_.begin(), dependencies_.end(), dependency) == dependencies_.end()) {
        dependencies_.push_back(dependency);
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Snapshots
// ─────────────────────────────────────────────

Result<ProjectSnapshot> InMemoryTaskStore::snapshot(ProjectId project) {
    if (auto ok = check_read(); !ok) return ok.error();

    std::shared_lock lock(mutex_);
    auto it = projects_.find(project);
    if (it == projects_.end()) {
        return Error{ErrorCode::ProjectNotFound, "Project not found: " + std::to_string(project)};
    }
    return ProjectSnapshot{
        .project = it->second,
        .tasks = tasks_of(project),
        .dependencies = dependencies_of(project)
    };
}

std::vector<Task> InMemoryTaskStore::tasks_of(ProjectId project) const {
    std::vector<Task> out;
    for (const auto& [id, task] : tasks_) {
        if (task.project_id == project) out.push_back(task);
    }
    std::stable_sort(out.begin(), out.end(), [](const Task& a, const Task& b) {
        return a.order < b.order;
    });
    return out;
}

std::vector<TaskDependency> InMemoryTaskStore::dependencies_of(ProjectId project) const {
    std::vector<TaskDependency> out;
    for (const auto& dep : dependencies_) {
        auto it = tasks_.find(dep.task_id);
        if (it != tasks_.end() && it->second.project_id == project) {
            out.push_back(dep);
        }
    }
    return out;
}

// ─────────────────────────────────────────────
// Whole-store access
// ─────────────────────────────────────────────

std::vector<Project> InMemoryTaskStore::all_projects() const {
    std::shared_lock lock(mutex_);
    std::vector<Project> out;
    for (const auto& [id, project] : projects_) out.push_back(project);
    return out;
}

std::vector<Task> InMemoryTaskStore::all_tasks() const {
    std::shared_lock lock(mutex_);
    std::vector<Task> out;
    for (const auto& [id, task] : tasks_) out.push_back(task);
    return out;
}

std::vector<TaskDependency> InMemoryTaskStore::all_dependencies() const {
    std::shared_lock lock(mutex_);
    return dependencies_;
}

}  // namespace task_orchestrator

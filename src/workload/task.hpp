/**
 * @file task.hpp
 * @brief Task, dependency and project records.
 * @author Dimitris Kafetzis
 *
 * Flat, id-keyed records as handed over by the storage collaborator. The
 * dependency graph is derived from these per request and never stored.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace task_orchestrator {

/**
 * @brief A unit of work inside a project.
 */
struct Task {
    TaskId id = 0;
    ProjectId project_id = 0;
    std::string name;
    std::string description;
    Document inputs = Document::object();
    Document outputs = Document::object();
    Document tests = Document::array();
    Document security_checks = Document::array();
    std::optional<double> estimate_hours;
    TaskStatus status = TaskStatus::Pending;
    std::optional<double> confidence_score;
    bool requires_approval = false;
    std::optional<std::string> approved_by;
    std::optional<Timestamp> approved_at;
    std::optional<std::string> rejection_reason;
    int32_t order = 0;
    std::optional<Document> spec;
    std::optional<Document> test_results;

    /// Scheduling duration: the estimate when positive, otherwise the default.
    [[nodiscard]] double duration_hours(double default_hours) const noexcept {
        if (estimate_hours && *estimate_hours > 0.0) return *estimate_hours;
        return default_hours;
    }
};

/**
 * @brief Directed edge: `task_id` waits for `depends_on_task_id`.
 */
struct TaskDependency {
    TaskId task_id = 0;
    TaskId depends_on_task_id = 0;

    bool operator==(const TaskDependency&) const = default;
};

struct Project {
    ProjectId id = 0;
    std::string name;
    std::string description;
    std::string goal;
    std::vector<std::string> acceptance_criteria;
    std::string environment;
    ProjectStatus status = ProjectStatus::Draft;
    RiskLevel risk_level = RiskLevel::Low;
};

/**
 * @brief Lightweight task reference used by every analysis result.
 */
struct TaskRef {
    TaskId task_id = 0;
    std::string name;
    double duration_hours = 0.0;
    TaskStatus status = TaskStatus::Pending;

    bool operator==(const TaskRef&) const = default;
};

// ── JSON conversion (snapshot files, CLI output) ─────────

void to_json(Document& j, const Task& task);
void to_json(Document& j, const TaskDependency& dep);
void to_json(Document& j, const Project& project);
void to_json(Document& j, const TaskRef& ref);

Result<Task> task_from_json(const Document& j);
Result<TaskDependency> dependency_from_json(const Document& j);
Result<Project> project_from_json(const Document& j);

}  // namespace task_orchestrator

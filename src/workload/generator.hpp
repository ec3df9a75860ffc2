/**
 * @file generator.hpp
 * @brief Synthetic project generators for testing and benchmarking.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "storage/task_store.hpp"
#include "workload/task.hpp"

#include <optional>
#include <random>
#include <vector>

namespace task_orchestrator {

/// Per-task defaults stamped onto every generated task.
struct TaskTemplate {
    std::optional<double> estimate_hours = 2.0;
    TaskStatus status = TaskStatus::Pending;
    bool requires_approval = false;
};

/**
 * @brief A project with its tasks and edges, ids already assigned.
 *
 * Task ids run from `first_task_id` upwards in creation order; `order`
 * follows creation order too.
 */
struct ProjectFixture {
    Project project;
    std::vector<Task> tasks;
    std::vector<TaskDependency> dependencies;

    [[nodiscard]] TaskId task_id(size_t index) const { return tasks.at(index).id; }
};

/**
 * @brief Factory for synthetic projects with various dependency topologies.
 */
class ProjectGenerator {
public:
    /// Linear chain: T0 → T1 → ... → Tn-1
    static ProjectFixture linear_chain(ProjectId project, size_t num_tasks,
                                       TaskTemplate base = {}, TaskId first_task_id = 1);

    /// Fan-out / fan-in: source → {branches} → sink
    static ProjectFixture fan_out_fan_in(ProjectId project, size_t width,
                                         TaskTemplate base = {}, TaskId first_task_id = 1);

    /// Diamond: repeated fan-out/fan-in, each level hanging off the previous merge
    static ProjectFixture diamond(ProjectId project, size_t depth, size_t width,
                                  TaskTemplate base = {}, TaskId first_task_id = 1);

    /// Random DAG; estimates drawn uniformly from [min_hours, max_hours]
    static ProjectFixture random_dag(ProjectId project, size_t num_tasks,
                                     float edge_probability,
                                     double min_hours, double max_hours,
                                     std::mt19937& rng, TaskId first_task_id = 1);

    /// Create the fixture's project, tasks and edges in `store`.
    static Result<void> populate(const ProjectFixture& fixture, ITaskStore& store);
};

}  // namespace task_orchestrator

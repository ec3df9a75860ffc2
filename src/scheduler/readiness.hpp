/**
 * @file readiness.hpp
 * @brief Partitions open tasks into actionable, needs-approval and blocked.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "graph/dependency_graph.hpp"
#include "scheduler/scheduler.hpp"

namespace task_orchestrator {

/**
 * @brief Classifies every task that is not COMPLETED, FAILED or IN_PROGRESS.
 *
 * A task is ready when every prerequisite is COMPLETED. Ready tasks in
 * REVIEW that require approval go to needs-approval, other ready tasks are
 * actionable, and unready tasks are blocked with their unmet prerequisites.
 * Lists are complete and follow ascending task id.
 */
class ReadinessClassifier {
public:
    [[nodiscard]] ReadinessReport classify(const DependencyGraph& graph) const;

    /// Whether a task in `status` is considered at all.
    [[nodiscard]] static constexpr bool is_candidate(TaskStatus status) noexcept {
        switch (status) {
            case TaskStatus::Completed:
            case TaskStatus::Failed:
            case TaskStatus::InProgress:
                return false;
            case TaskStatus::Pending:
            case TaskStatus::Blocked:
            case TaskStatus::Review:
            case TaskStatus::Approved:
                return true;
        }
        return false;
    }
};

}  // namespace task_orchestrator

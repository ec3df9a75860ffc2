/**
 * @file prioritizer.hpp
 * @brief Status-based reordering of a project's tasks.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "scheduler/scheduler.hpp"
#include "workload/task.hpp"

#include <vector>

namespace task_orchestrator {

/**
 * @brief Orders tasks so work already in flight comes first.
 *
 * Rank: IN_PROGRESS < REVIEW < APPROVED < PENDING < BLOCKED < COMPLETED
 * < FAILED. Equal ranks keep their current `order` (then task id). The
 * new order value of a task is its position; only moved tasks are
 * reported, so planning twice after applying yields no changes.
 */
class Prioritizer {
public:
    [[nodiscard]] ReorderPlan plan(const std::vector<Task>& tasks) const;

    /// Write the planned order values into `tasks`.
    static void apply(const ReorderPlan& plan, std::vector<Task>& tasks);

    [[nodiscard]] static constexpr int rank(TaskStatus status) noexcept {
        switch (status) {
            case TaskStatus::InProgress: return 0;
            case TaskStatus::Review:     return 1;
            case TaskStatus::Approved:   return 2;
            case TaskStatus::Pending:    return 3;
            case TaskStatus::Blocked:    return 4;
            case TaskStatus::Completed:  return 5;
            case TaskStatus::Failed:     return 6;
        }
        return 7;
    }
};

}  // namespace task_orchestrator

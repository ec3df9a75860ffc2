/**
 * @file prioritizer.cpp
 * @brief Prioritizer implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/prioritizer.hpp"

#include <algorithm>
#include <tuple>
#include <unordered_map>

namespace task_orchestrator {

ReorderPlan Prioritizer::plan(const std::vector<Task>& tasks) const {
    std::vector<const Task*> sorted;
    sorted.reserve(tasks.size());
    for (const auto& task : tasks) sorted.push_back(&task);

    std::sort(sorted.begin(), sorted.end(), [](const Task* a, const Task* b) {
        return std::make_tuple(rank(a->status), a->order, a->id)
             < std::make_tuple(rank(b->status), b->order, b->id);
    });

    ReorderPlan result;
    result.total_tasks = tasks.size();
    for (size_t position = 0; position < sorted.size(); ++position) {
        const auto& task = *sorted[position];
        auto new_order = static_cast<int32_t>(position);
        if (task.order != new_order) {
            result.changes.push_back(OrderChange{
                .task_id = task.id,
                .name = task.name,
                .old_order = task.order,
                .new_order = new_order
            });
        }
    }
    return result;
}

void Prioritizer::apply(const ReorderPlan& plan, std::vector<Task>& tasks) {
    std::unordered_map<TaskId, int32_t> new_orders;
    for (const auto& change : plan.changes) {
        new_orders.emplace(change.task_id, change.new_order);
    }
    for (auto& task : tasks) {
        if (auto it = new_orders.find(task.id); it != new_orders.end()) {
            task.order = it->second;
        }
    }
}

}  // namespace task_orchestrator

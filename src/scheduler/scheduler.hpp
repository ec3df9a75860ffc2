/**
 * @file scheduler.hpp
 * @brief Result types shared by the graph analyzers and the prioritizer.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "workload/task.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace task_orchestrator {

// ─────────────────────────────────────────────
// Critical Path
// ─────────────────────────────────────────────

/// Non-fatal conditions reported alongside an analysis result.
enum class CriticalPathCondition : uint8_t {
    CircularDependency
};

[[nodiscard]] constexpr std::string_view to_string(CriticalPathCondition condition) noexcept {
    switch (condition) {
        case CriticalPathCondition::CircularDependency: return "circular_dependency";
    }
    return "unknown";
}

struct CriticalPath {
    std::vector<TaskRef> path;            ///< Ordered prerequisite first
    double total_hours = 0.0;
    std::optional<CriticalPathCondition> condition;

    [[nodiscard]] bool circular() const noexcept {
        return condition == CriticalPathCondition::CircularDependency;
    }
};

// ─────────────────────────────────────────────
// Readiness
// ─────────────────────────────────────────────

struct BlockedTask {
    TaskId task_id = 0;
    std::string name;
    TaskStatus status = TaskStatus::Pending;
    std::vector<TaskId> blocked_by_ids;       ///< Unmet prerequisites
    std::vector<std::string> blocked_by;      ///< Their names, same order
};

struct ReadinessReport {
    std::vector<TaskRef> actionable;
    std::vector<TaskRef> needs_approval;
    std::vector<BlockedTask> blocked;
};

// ─────────────────────────────────────────────
// Reprioritization
// ─────────────────────────────────────────────

struct OrderChange {
    TaskId task_id = 0;
    std::string name;
    int32_t old_order = 0;
    int32_t new_order = 0;

    bool operator==(const OrderChange&) const = default;
};

struct ReorderPlan {
    std::vector<OrderChange> changes;     ///< Only tasks whose order moves
    size_t total_tasks = 0;
};

}  // namespace task_orchestrator

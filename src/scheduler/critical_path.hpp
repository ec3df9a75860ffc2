/**
 * @file critical_path.hpp
 * @brief Longest-duration path through a project's dependency graph.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "graph/dependency_graph.hpp"
#include "scheduler/scheduler.hpp"

namespace task_orchestrator {

/**
 * @brief Finds the path of maximum summed duration between a start node
 *        (no prerequisites) and an end node (no dependents).
 *
 * A cycle yields an empty path, zero hours and the CircularDependency
 * condition. Start and end nodes are enumerated by ascending task id and
 * only a strictly longer path replaces the current best, so among equally
 * long paths the first one found wins.
 */
class CriticalPathAnalyzer {
public:
    [[nodiscard]] CriticalPath analyze(const DependencyGraph& graph) const;
};

}  // namespace task_orchestrator

/**
 * @file readiness.cpp
 * @brief ReadinessClassifier implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/readiness.hpp"

namespace task_orchestrator {

ReadinessReport ReadinessClassifier::classify(const DependencyGraph& graph) const {
    ReadinessReport report;

    for (DependencyGraph::Index idx = 0; idx < graph.node_count(); ++idx) {
        const auto& node = graph.node(idx);
        if (!is_candidate(node.status)) continue;

        BlockedTask blocked{.task_id = node.id, .name = node.name, .status = node.status};
        for (auto prereq_idx : graph.predecessors(idx)) {
            const auto& prereq = graph.node(prereq_idx);
            if (prereq.status != TaskStatus::Completed) {
                blocked.blocked_by_ids.push_back(prereq.id);
                blocked.blocked_by.push_back(prereq.name);
            }
        }

        if (!blocked.blocked_by_ids.empty()) {
            report.blocked.push_back(std::move(blocked));
        } else if (node.status == TaskStatus::Review && node.requires_approval) {
            report.needs_approval.push_back(node.ref());
        } else {
            report.actionable.push_back(node.ref());
        }
    }

    return report;
}

}  // namespace task_orchestrator

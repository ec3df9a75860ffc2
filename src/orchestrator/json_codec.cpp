/**
 * @file json_codec.cpp
 * @brief JsonCodec implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/json_codec.hpp"

#include <algorithm>
#include <cstdint>

namespace task_orchestrator {

namespace {

template <typename T, typename Fn>
Document encode_list(const std::vector<T>& items, size_t limit, Fn&& encode_item) {
    Document out = Document::array();
    const size_t count = std::min(limit, items.size());
    for (size_t i = 0; i < count; ++i) {
        out.push_back(encode_item(items[i]));
    }
    return out;
}

Document encode_refs(const std::vector<TaskRef>& refs, size_t limit = SIZE_MAX) {
    return encode_list(refs, limit, [](const TaskRef& ref) { return Document(ref); });
}

Document optional_number(const std::optional<double>& value) {
    return value ? Document(*value) : Document(nullptr);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Analyses
// ─────────────────────────────────────────────

Document JsonCodec::encode(ProjectId project, const CriticalPath& path) {
    Document out = {
        {"project_id", project},
        {"critical_path", encode_refs(path.path)},
        {"total_hours", path.total_hours}
    };
    if (path.condition) {
        out["condition"] = std::string{to_string(*path.condition)};
        out["error"] = "Circular dependency detected";
    }
    return out;
}

Document JsonCodec::encode(const GraphView& graph) {
    Document nodes = Document::array();
    for (const auto& node : graph.nodes) {
        nodes.push_back({
            {"id", node.id},
            {"name", node.name},
            {"status", std::string{to_string(node.status)}},
            {"estimate_hours", optional_number(node.estimate_hours)},
            {"requires_approval", node.requires_approval},
            {"order", node.order}
        });
    }

    Document edges = Document::array();
    for (const auto& edge : graph.edges) {
        edges.push_back({{"from", edge.from}, {"to", edge.to}});
    }

    return {
        {"project_id", graph.project_id},
        {"nodes", std::move(nodes)},
        {"edges", std::move(edges)}
    };
}

Document JsonCodec::encode(ProjectId project, const ReorderPlan& plan) {
    Document changes = Document::array();
    for (const auto& change : plan.changes) {
        changes.push_back({
            {"task_id", change.task_id},
            {"name", change.name},
            {"old_order", change.old_order},
            {"new_order", change.new_order}
        });
    }
    return {
        {"project_id", project},
        {"changes", std::move(changes)},
        {"total_tasks", plan.total_tasks}
    };
}

Document JsonCodec::encode(ProjectId project, const ReadinessReport& report,
                           const PresentationConfig& limits) {
    auto needs_approval = encode_list(report.needs_approval, SIZE_MAX, [](const TaskRef& ref) {
        return Document{
            {"task_id", ref.task_id},
            {"name", ref.name},
            {"status", std::string{to_string(ref.status)}}
        };
    });

    auto blocked = encode_list(report.blocked, limits.blocked_limit, [](const BlockedTask& task) {
        return Document{
            {"task_id", task.task_id},
            {"name", task.name},
            {"blocked_by", task.blocked_by}
        };
    });

    return {
        {"project_id", project},
        {"actionable", encode_refs(report.actionable, limits.actionable_limit)},
        {"actionable_total", report.actionable.size()},
        {"needs_approval", std::move(needs_approval)},
        {"blocked", std::move(blocked)},
        {"blocked_total", report.blocked.size()}
    };
}

Document JsonCodec::encode(const StatusSummary& summary) {
    Document counts = Document::object();
    for (const auto& [status, count] : summary.task_counts) {
        counts[std::string{to_string(status)}] = count;
    }

    return {
        {"project_id", summary.project_id},
        {"project_name", summary.project_name},
        {"status", std::string{to_string(summary.project_status)}},
        {"risk_level", std::string{to_string(summary.risk_level)}},
        {"task_counts", std::move(counts)},
        {"total_tasks", summary.total_tasks},
        {"total_estimate_hours", summary.total_estimate_hours},
        {"completed_estimate_hours", summary.completed_estimate_hours},
        {"progress_percent", summary.progress_percent},
        {"critical_path_hours", summary.critical_path_hours},
        {"circular_dependency", summary.circular_dependency},
        {"next_actions", encode_refs(summary.next_actions)},
        {"needs_approval", encode_refs(summary.needs_approval)}
    };
}

Document JsonCodec::encode(const BootstrapResult& result) {
    return {
        {"message", "Plan generated successfully"},
        {"project_id", result.project_id},
        {"task_ids", result.task_ids},
        {"tasks_created", result.task_ids.size()},
        {"dependencies_created", result.dependency_count},
        {"dependencies_skipped", result.skipped_dependencies},
        {"estimated_total_hours", result.estimated_total_hours},
        {"risk_level", std::string{to_string(result.risk_level)}}
    };
}

// ─────────────────────────────────────────────
// Lifecycle / errors
// ─────────────────────────────────────────────

Document JsonCodec::encode(LifecycleAction action, const Task& task) {
    std::string message;
    switch (action) {
        case LifecycleAction::Approve:  message = "Task approved successfully"; break;
        case LifecycleAction::Reject:   message = "Task rejected"; break;
        case LifecycleAction::Complete: message = "Task completed successfully"; break;
    }
    return {
        {"message", message},
        {"task_id", task.id},
        {"status", std::string{to_string(task.status)}}
    };
}

Document JsonCodec::encode(const Error& error) {
    Document out = {
        {"error", std::string{to_string(error.code)}},
        {"message", error.message}
    };
    if (error.gate) {
        out["gate"] = std::string{to_string(*error.gate)};
    }
    return out;
}

}  // namespace task_orchestrator

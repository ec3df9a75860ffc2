/**
 * @file dependency_graph.hpp
 * @brief Per-request dependency graph over one project's tasks.
 * @author Dimitris Kafetzis
 *
 * Nodes live in an arena ordered by ascending task id; adjacency lists hold
 * arena indices. Edges point from a prerequisite to its dependent. The
 * graph is rebuilt from flat records for every analysis call and holds no
 * references back into the store.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/task.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace task_orchestrator {

/**
 * @brief Node payload copied out of a Task record.
 */
struct GraphNode {
    TaskId id = 0;
    std::string name;
    double duration_hours = 1.0;             ///< Estimate or configured default
    std::optional<double> estimate_hours;    ///< Raw estimate, for display
    TaskStatus status = TaskStatus::Pending;
    bool requires_approval = false;
    int32_t order = 0;

    [[nodiscard]] TaskRef ref() const {
        return TaskRef{.task_id = id, .name = name, .duration_hours = duration_hours, .status = status};
    }
};

struct GraphEdge {
    TaskId from = 0;   ///< Prerequisite
    TaskId to = 0;     ///< Dependent

    bool operator==(const GraphEdge&) const = default;
};

/**
 * @brief Directed graph of one project's tasks.
 */
class DependencyGraph {
public:
    using Index = size_t;

    DependencyGraph() = default;
    explicit DependencyGraph(ProjectId project_id) : project_id_(project_id) {}

    // ── Construction ──────────────────────────
    Index add_node(GraphNode node);
    /// Adds prerequisite → dependent. Duplicate edges are ignored.
    void add_edge(Index prerequisite, Index dependent);

    // ── Queries ───────────────────────────────
    [[nodiscard]] ProjectId project_id() const noexcept { return project_id_; }
    [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    [[nodiscard]] std::optional<Index> index_of(TaskId id) const;
    [[nodiscard]] const GraphNode& node(Index idx) const { return nodes_.at(idx); }
    [[nodiscard]] const std::vector<GraphNode>& nodes() const noexcept { return nodes_; }
    [[nodiscard]] const std::vector<Index>& successors(Index idx) const { return successors_.at(idx); }
    [[nodiscard]] const std::vector<Index>& predecessors(Index idx) const { return predecessors_.at(idx); }
    [[nodiscard]] std::vector<GraphEdge> edges() const;

    [[nodiscard]] std::vector<Index> start_nodes() const;
    [[nodiscard]] std::vector<Index> end_nodes() const;

    /**
     * @brief Kahn's algorithm, lowest arena index first among ready nodes.
     *
     * Returns fewer than node_count() entries when the graph has a cycle.
     */
    [[nodiscard]] std::vector<Index> topological_order() const;
    [[nodiscard]] bool has_cycle() const;
    [[nodiscard]] bool reachable(Index from, Index to) const;

private:
    ProjectId project_id_ = 0;
    std::vector<GraphNode> nodes_;
    std::unordered_map<TaskId, Index> index_;
    std::vector<std::vector<Index>> successors_;
    std::vector<std::vector<Index>> predecessors_;
    std::vector<std::pair<Index, Index>> edges_;
};

/**
 * @brief Assembles a DependencyGraph from one project's records.
 */
class GraphBuilder {
public:
    explicit GraphBuilder(double default_duration_hours = 1.0)
        : default_duration_hours_(default_duration_hours) {}

    /**
     * @brief Build the graph for `project_id`.
     *
     * Fails with ProjectMismatch when a task belongs to another project,
     * DependencyEndpointNotFound when an edge names a task outside the
     * supplied set, and InvalidArgument on duplicate task ids.
     */
    [[nodiscard]] Result<DependencyGraph> build(ProjectId project_id,
                                                const std::vector<Task>& tasks,
                                                const std::vector<TaskDependency>& dependencies) const;

    [[nodiscard]] double default_duration_hours() const noexcept { return default_duration_hours_; }

private:
    double default_duration_hours_;
};

}  // namespace task_orchestrator

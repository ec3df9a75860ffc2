/**
 * @file dependency_graph.cpp
 * @brief DependencyGraph and GraphBuilder implementation.
 * @author Dimitris Kafetzis
 *
 * Kahn's algorithm for topological ordering (min-heap on arena index so the
 * order is reproducible), iterative DFS cycle detection, and BFS
 * reachability. All algorithms are O(V+E) apart from the heap factor.
 */

#include "graph/dependency_graph.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <stack>

namespace task_orchestrator {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

DependencyGraph::Index DependencyGraph::add_node(GraphNode node) {
    Index idx = nodes_.size();
    index_.emplace(node.id, idx);
    nodes_.push_back(std::move(node));
    successors_.emplace_back();
    predecessors_.emplace_back();
    return idx;
}

void DependencyGraph::add_edge(Index prerequisite, Index dependent) {
    auto& succ = successors_.at(prerequisite);
    if (std::find(succ.begin(), succ.end(), dependent) != succ.end()) return;

    succ.push_back(dependent);
    predecessors_.at(dependent).push_back(prerequisite);
    edges_.emplace_back(prerequisite, dependent);
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<DependencyGraph::Index> DependencyGraph::index_of(TaskId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::vector<GraphEdge> DependencyGraph::edges() const {
    std::vector<GraphEdge> out;
    out.reserve(edges_.size());
    for (const auto& [from, to] : edges_) {
        out.push_back({nodes_[from].id, nodes_[to].id});
    }
    return out;
}

std::vector<DependencyGraph::Index> DependencyGraph::start_nodes() const {
    std::vector<Index> out;
    for (Index i = 0; i < nodes_.size(); ++i) {
        if (predecessors_[i].empty()) out.push_back(i);
    }
    return out;
}

std::vector<DependencyGraph::Index> DependencyGraph::end_nodes() const {
    std::vector<Index> out;
    for (Index i = 0; i < nodes_.size(); ++i) {
        if (successors_[i].empty()) out.push_back(i);
    }
    return out;
}

std::vector<DependencyGraph::Index> DependencyGraph::topological_order() const {
    std::vector<size_t> in_degree(nodes_.size(), 0);
    for (const auto& [from, to] : edges_) {
        ++in_degree[to];
    }

    std::priority_queue<Index, std::vector<Index>, std::greater<>> zero_in;
    for (Index i = 0; i < nodes_.size(); ++i) {
        if (in_degree[i] == 0) zero_in.push(i);
    }

    std::vector<Index> order;
    order.reserve(nodes_.size());

    while (!zero_in.empty()) {
        auto current = zero_in.top();
        zero_in.pop();
        order.push_back(current);

        for (auto next : successors_[current]) {
            if (--in_degree[next] == 0) {
                zero_in.push(next);
            }
        }
    }

    return order;
}

bool DependencyGraph::has_cycle() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::vector<Color> color(nodes_.size(), Color::White);

    struct Frame {
        Index node;
        size_t neighbor_idx;
    };

    for (Index start = 0; start < nodes_.size(); ++start) {
        if (color[start] != Color::White) continue;

        std::stack<Frame> dfs_stack;
        dfs_stack.push({start, 0});
        color[start] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& [node, idx] = dfs_stack.top();
            const auto& succ = successors_[node];

            if (idx >= succ.size()) {
                color[node] = Color::Black;
                dfs_stack.pop();
                continue;
            }

            auto neighbor = succ[idx];
            ++idx;

            if (color[neighbor] == Color::Gray) {
                return true;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                dfs_stack.push({neighbor, 0});
            }
        }
    }

    return false;
}

bool DependencyGraph::reachable(Index from, Index to) const {
    if (from == to) return true;

    std::vector<bool> seen(nodes_.size(), false);
    std::queue<Index> frontier;
    frontier.push(from);
    seen[from] = true;

    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();
        for (auto next : successors_[current]) {
            if (next == to) return true;
            if (!seen[next]) {
                seen[next] = true;
                frontier.push(next);
            }
        }
    }
    return false;
}

// ─────────────────────────────────────────────
// GraphBuilder
// ─────────────────────────────────────────────

Result<DependencyGraph> GraphBuilder::build(ProjectId project_id,
                                            const std::vector<Task>& tasks,
                                            const std::vector<TaskDependency>& dependencies) const {
    std::vector<const Task*> sorted;
    sorted.reserve(tasks.size());
    for (const auto& task : tasks) {
        if (task.project_id != project_id) {
            return Error{ErrorCode::ProjectMismatch,
                         "Task " + std::to_string(task.id) + " belongs to project "
                         + std::to_string(task.project_id) + ", not "
                         + std::to_string(project_id)};
        }
        sorted.push_back(&task);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const Task* a, const Task* b) { return a->id < b->id; });

    DependencyGraph graph(project_id);
    for (size_t i = 0; i < sorted.size(); ++i) {
        const auto& task = *sorted[i];
        if (i > 0 && sorted[i - 1]->id == task.id) {
            return Error{ErrorCode::InvalidArgument,
                         "Duplicate task id " + std::to_string(task.id)};
        }
        graph.add_node(GraphNode{
            .id = task.id,
            .name = task.name,
            .duration_hours = task.duration_hours(default_duration_hours_),
            .estimate_hours = task.estimate_hours,
            .status = task.status,
            .requires_approval = task.requires_approval,
            .order = task.order
        });
    }

    for (const auto& dep : dependencies) {
        auto prerequisite = graph.index_of(dep.depends_on_task_id);
        auto dependent = graph.index_of(dep.task_id);
        if (!prerequisite || !dependent) {
            return Error{ErrorCode::DependencyEndpointNotFound,
                         "Dependency " + std::to_string(dep.task_id) + " -> "
                         + std::to_string(dep.depends_on_task_id)
                         + " references a task outside project "
                         + std::to_string(project_id)};
        }
        graph.add_edge(*prerequisite, *dependent);
    }

    return graph;
}

}  // namespace task_orchestrator

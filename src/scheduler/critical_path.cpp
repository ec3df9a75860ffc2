/**
 * @file critical_path.cpp
 * @brief CriticalPathAnalyzer: longest path via DP on topological order.
 * @author Dimitris Kafetzis
 *
 * Algorithm:
 *   For each start node s (ascending id):
 *     dist[s] = duration(s); dist[v] = dist[u] + duration(v) relaxed along
 *     the topological order, keeping a predecessor link per node.
 *     For each end node e (ascending id) reachable from s:
 *       keep the path to e if dist[e] beats the best so far.
 *
 * Complexity: O(S × (V + E)) where S = start nodes.
 */

#include "scheduler/critical_path.hpp"

#include <algorithm>
#include <limits>

namespace task_orchestrator {

namespace {

constexpr double kUnreached = -std::numeric_limits<double>::infinity();
constexpr size_t kNoPredecessor = std::numeric_limits<size_t>::max();

}  // anonymous namespace

CriticalPath CriticalPathAnalyzer::analyze(const DependencyGraph& graph) const {
    CriticalPath result;
    if (graph.empty()) return result;

    if (graph.has_cycle()) {
        result.condition = CriticalPathCondition::CircularDependency;
        return result;
    }

    const auto topo = graph.topological_order();
    const auto starts = graph.start_nodes();
    const auto ends = graph.end_nodes();
    const size_t n = graph.node_count();

    std::vector<double> dist(n);
    std::vector<size_t> pred(n);
    double best = 0.0;
    std::vector<size_t> best_path;

    for (auto start : starts) {
        std::fill(dist.begin(), dist.end(), kUnreached);
        std::fill(pred.begin(), pred.end(), kNoPredecessor);
        dist[start] = graph.node(start).duration_hours;

        for (auto u : topo) {
            if (dist[u] == kUnreached) continue;
            for (auto v : graph.successors(u)) {
                double candidate = dist[u] + graph.node(v).duration_hours;
                if (candidate > dist[v]) {
                    dist[v] = candidate;
                    pred[v] = u;
                }
            }
        }

        for (auto end : ends) {
            if (dist[end] == kUnreached || !(dist[end] > best)) continue;

            best = dist[end];
            best_path.clear();
            for (auto v = end; v != kNoPredecessor; v = pred[v]) {
                best_path.push_back(v);
            }
            std::reverse(best_path.begin(), best_path.end());
        }
    }

    result.total_hours = best;
    result.path.reserve(best_path.size());
    for (auto idx : best_path) {
        result.path.push_back(graph.node(idx).ref());
    }
    return result;
}

}  // namespace task_orchestrator

/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade that ties all modules together.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Graph analyses over one project (critical path, graph view,
 *      readiness, status summary)
 *   2. Gated lifecycle transitions (approve, reject, complete)
 *   3. Reprioritization, dependency creation and advisor-driven planning
 *
 * Every analysis rebuilds the dependency graph from a fresh store snapshot.
 * Lifecycle transitions run inside ITaskStore::update_task so each gate
 * check and its write are one serialized step.
 */

#pragma once

#include "advisor/advisor.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/dependency_graph.hpp"
#include "lifecycle/task_lifecycle.hpp"
#include "scheduler/critical_path.hpp"
#include "scheduler/prioritizer.hpp"
#include "scheduler/readiness.hpp"
#include "scheduler/scheduler.hpp"
#include "storage/task_store.hpp"
#include "telemetry/audit_recorder.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace task_orchestrator {

// ─────────────────────────────────────────────
// Facade results
// ─────────────────────────────────────────────

/// Nodes and edges of a project, for visualization.
struct GraphView {
    ProjectId project_id = 0;
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
};

struct StatusSummary {
    ProjectId project_id = 0;
    std::string project_name;
    ProjectStatus project_status = ProjectStatus::Draft;
    RiskLevel risk_level = RiskLevel::Low;
    std::map<TaskStatus, size_t> task_counts;   ///< Every status, zero-filled
    size_t total_tasks = 0;
    double total_estimate_hours = 0.0;          ///< Estimated tasks only
    double completed_estimate_hours = 0.0;
    double progress_percent = 0.0;              ///< Rounded to 2 decimals
    double critical_path_hours = 0.0;
    bool circular_dependency = false;
    std::vector<TaskRef> next_actions;          ///< Top-N actionable
    std::vector<TaskRef> needs_approval;
};

struct BootstrapResult {
    ProjectId project_id = 0;
    std::vector<TaskId> task_ids;               ///< In proposal order
    size_t dependency_count = 0;
    size_t skipped_dependencies = 0;
    RiskLevel risk_level = RiskLevel::Medium;
    double estimated_total_hours = 0.0;
};

// ─────────────────────────────────────────────
// Orchestrator
// ─────────────────────────────────────────────

/**
 * @brief The presentation-facing engine.
 *
 * The store is shared with the caller; everything else is owned. When no
 * advisor is injected one is built from `config.advisor`: "model" needs a
 * completion client, otherwise the deterministic fallback is used.
 */
class Orchestrator {
public:
    struct Options {
        Config config;
        std::shared_ptr<ITaskStore> store;
        std::unique_ptr<IAdvisor> advisor;
        std::unique_ptr<ICompletionClient> completion_client;
        std::unique_ptr<ILogSink> log_sink;
        std::unique_ptr<ILogSink> audit_sink;
        LogLevel log_level = LogLevel::Info;
    };

    explicit Orchestrator(Options opts);

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Analyses ─────────────────────────────
    Result<CriticalPath> critical_path(ProjectId project);
    Result<GraphView> dependency_graph(ProjectId project);
    Result<ReadinessReport> next_actions(ProjectId project);
    Result<StatusSummary> status_summary(ProjectId project);

    /// Persist the status-ranked order. Audited only when something moved.
    Result<ReorderPlan> reprioritize(ProjectId project);

    // ── Lifecycle ────────────────────────────
    Result<Task> approve(TaskId task, const std::string& approver);
    Result<Task> reject(TaskId task, const std::string& rejector, const std::string& reason);
    Result<Task> complete(TaskId task);

    // ── Records ──────────────────────────────
    Result<TaskId> create_task(Task task);
    Result<void> delete_task(TaskId task);

    /**
     * @brief Record that `task` waits for `depends_on`.
     *
     * Duplicates succeed without a second write. With
     * `dependencies.reject_cycles` an edge closing a cycle fails with
     * CycleRejected; otherwise cycles surface lazily in the analyses.
     */
    Result<void> add_dependency(TaskId task, TaskId depends_on);

    /// Store a test report produced outside the engine.
    Result<Task> record_test_results(TaskId task, Document results);

    // ── Advisor-driven ───────────────────────
    Result<Task> generate_spec(TaskId task);
    Result<BootstrapResult> bootstrap_plan(ProjectId project);

    // ── Accessors (for testing) ─────────────
    Logger& logger() { return logger_; }
    AuditRecorder& audit() { return audit_; }
    IAdvisor& advisor() { return *advisor_; }
    const Config& config() const { return config_; }

private:
    Result<DependencyGraph> load_graph(ProjectId project);
    std::unique_ptr<IAdvisor> create_advisor(std::unique_ptr<ICompletionClient> client);

    Config config_;
    Logger logger_;
    AuditRecorder audit_;
    std::shared_ptr<ITaskStore> store_;
    std::unique_ptr<IAdvisor> advisor_;

    GraphBuilder builder_;
    CriticalPathAnalyzer analyzer_;
    ReadinessClassifier classifier_;
    Prioritizer prioritizer_;

    std::mutex dependency_mutex_;   ///< Serializes check-then-insert of edges
};

}  // namespace task_orchestrator

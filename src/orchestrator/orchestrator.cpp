/**
 * @file orchestrator.cpp
 * @brief Orchestrator facade implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/orchestrator.hpp"

#include "advisor/fallback_advisor.hpp"
#include "advisor/model_advisor.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace task_orchestrator {

namespace {

constexpr double kDefaultConfidence = 0.5;

std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

Document order_changes_document(const ReorderPlan& plan) {
    Document changes = Document::array();
    for (const auto& change : plan.changes) {
        changes.push_back({
            {"task_id", change.task_id},
            {"name", change.name},
            {"old_order", change.old_order},
            {"new_order", change.new_order}
        });
    }
    return changes;
}

}  // anonymous namespace

Orchestrator::Orchestrator(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_null_sink(std::move(opts.log_sink)), opts.log_level, "orchestrator")
    , audit_(or_null_sink(std::move(opts.audit_sink)))
    , store_(std::move(opts.store))
    , advisor_(std::move(opts.advisor))
    , builder_(config_.engine.default_duration_hours) {
    if (!advisor_) {
        advisor_ = create_advisor(std::move(opts.completion_client));
    }
    logger_.debug("Orchestrator ready", {
        {"advisor", std::string{advisor_->name()}},
        {"reject_cycles", config_.dependencies.reject_cycles},
        {"default_duration_hours", config_.engine.default_duration_hours}
    });
}

std::unique_ptr<IAdvisor> Orchestrator::create_advisor(std::unique_ptr<ICompletionClient> client) {
    if (config_.advisor.mode == "model") {
        if (client) {
            return std::make_unique<ModelBackedAdvisor>(std::move(client), config_.advisor, logger_);
        }
        logger_.warn("Model advisor requested without a completion client, using fallback");
    }
    return std::make_unique<FallbackAdvisor>();
}

Result<DependencyGraph> Orchestrator::load_graph(ProjectId project) {
    auto snapshot = store_->snapshot(project);
    if (!snapshot) return snapshot.error();

    return builder_.build(project, snapshot->tasks, snapshot->dependencies);
}

// ─────────────────────────────────────────────
// Analyses
// ─────────────────────────────────────────────

Result<CriticalPath> Orchestrator::critical_path(ProjectId project) {
    auto graph = load_graph(project);
    if (!graph) return graph.error();

    auto result = analyzer_.analyze(*graph);
    if (result.circular()) {
        logger_.warn("Circular dependency detected", {{"project", project}});
    }
    return result;
}

Result<GraphView> Orchestrator::dependency_graph(ProjectId project) {
    auto graph = load_graph(project);
    if (!graph) return graph.error();

    return GraphView{
        .project_id = project,
        .nodes = graph->nodes(),
        .edges = graph->edges()
    };
}

Result<ReadinessReport> Orchestrator::next_actions(ProjectId project) {
    auto graph = load_graph(project);
    if (!graph) return graph.error();

    return classifier_.classify(*graph);
}

Result<StatusSummary> Orchestrator::status_summary(ProjectId project) {
    auto snapshot = store_->snapshot(project);
    if (!snapshot) return snapshot.error();

    const auto& owner = snapshot->project;
    const auto& tasks = snapshot->tasks;
    auto graph = builder_.build(project, tasks, snapshot->dependencies);
    if (!graph) return graph.error();

    StatusSummary summary{
        .project_id = project,
        .project_name = owner.name,
        .project_status = owner.status,
        .risk_level = owner.risk_level,
        .total_tasks = tasks.size()
    };
    for (auto status : kAllTaskStatuses) {
        summary.task_counts[status] = 0;
    }

    for (const auto& task : tasks) {
        summary.task_counts[task.status]++;
        if (task.estimate_hours && *task.estimate_hours > 0.0) {
            summary.total_estimate_hours += *task.estimate_hours;
            if (task.status == TaskStatus::Completed) {
                summary.completed_estimate_hours += *task.estimate_hours;
            }
        }
    }

    if (summary.total_estimate_hours > 0.0) {
        double progress = summary.completed_estimate_hours / summary.total_estimate_hours * 100.0;
        summary.progress_percent = std::round(progress * 100.0) / 100.0;
    }

    auto path = analyzer_.analyze(*graph);
    summary.critical_path_hours = path.total_hours;
    summary.circular_dependency = path.circular();

    auto readiness = classifier_.classify(*graph);
    const size_t limit = std::min<size_t>(config_.presentation.summary_actions_limit,
                                          readiness.actionable.size());
    summary.next_actions.assign(readiness.actionable.begin(),
                                readiness.actionable.begin() + static_cast<std::ptrdiff_t>(limit));
    summary.needs_approval = std::move(readiness.needs_approval);

    return summary;
}

Result<ReorderPlan> Orchestrator::reprioritize(ProjectId project) {
    auto snapshot = store_->snapshot(project);
    if (!snapshot) return snapshot.error();

    auto plan = prioritizer_.plan(snapshot->tasks);

    if (!plan.changes.empty()) {
        std::vector<OrderUpdate> updates;
        updates.reserve(plan.changes.size());
        for (const auto& change : plan.changes) {
            updates.push_back({.task_id = change.task_id, .order = change.new_order});
        }
        // A failed batch leaves every order unchanged.
        if (auto written = store_->update_orders(updates); !written) {
            logger_.error("Reprioritization write failed", written.error());
            return written.error();
        }

        audit_.record(AuditEvent::TasksReprioritized, project, std::nullopt, "orchestrator_service", {
            {"change_count", plan.changes.size()},
            {"changes", order_changes_document(plan)}
        });
        logger_.info("Tasks reprioritized", {
            {"project", project},
            {"changes", plan.changes.size()},
            {"total_tasks", plan.total_tasks}
        });
    }
    return plan;
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<Task> Orchestrator::approve(TaskId task, const std::string& approver) {
    const auto now = std::chrono::system_clock::now();
    auto updated = store_->update_task(task, [&](Task& t) {
        return TaskLifecycle::approve(t, approver, now);
    });
    if (!updated) {
        logger_.warn("Approve refused", {{"task", task}, {"reason", updated.error().message}});
        return updated.error();
    }

    audit_.record(AuditEvent::TaskApproved, updated->project_id, task, approver);
    logger_.info("Task approved", {{"task", task}, {"by", approver}});
    return updated;
}

Result<Task> Orchestrator::reject(TaskId task, const std::string& rejector, const std::string& reason) {
    auto updated = store_->update_task(task, [&](Task& t) {
        return TaskLifecycle::reject(t, reason);
    });
    if (!updated) {
        logger_.warn("Reject refused", {{"task", task}, {"reason", updated.error().message}});
        return updated.error();
    }

    audit_.record(AuditEvent::TaskRejected, updated->project_id, task, rejector, {{"reason", reason}});
    logger_.info("Task rejected", {{"task", task}, {"by", rejector}});
    return updated;
}

Result<Task> Orchestrator::complete(TaskId task) {
    auto updated = store_->update_task(task, [](Task& t) {
        return TaskLifecycle::complete(t);
    });
    if (!updated) {
        logger_.warn("Complete refused", {{"task", task}, {"reason", updated.error().message}});
        return updated.error();
    }

    audit_.record(AuditEvent::TaskCompleted, updated->project_id, task, "system");
    logger_.info("Task completed", {{"task", task}});
    return updated;
}

// ─────────────────────────────────────────────
// Records
// ─────────────────────────────────────────────

Result<TaskId> Orchestrator::create_task(Task task) {
    const auto project = task.project_id;
    const auto name = task.name;

    auto id = store_->create_task(std::move(task));
    if (!id) return id.error();

    audit_.record(AuditEvent::TaskCreated, project, *id, "system", {{"name", name}});
    return id;
}

Result<void> Orchestrator::delete_task(TaskId task) {
    auto existing = store_->get_task(task);
    if (!existing) return existing.error();

    auto removed = store_->delete_task(task);
    if (!removed) return removed;

    audit_.record(AuditEvent::TaskDeleted, existing->project_id, task, "system",
                  {{"name", existing->name}});
    return Result<void>{};
}

Result<void> Orchestrator::add_dependency(TaskId task, TaskId depends_on) {
    if (task == depends_on) {
        return Error{ErrorCode::SelfDependency, "Task cannot depend on itself"};
    }

    std::lock_guard lock(dependency_mutex_);

    auto dependent = store_->get_task(task);
    auto prerequisite = store_->get_task(depends_on);
    if (!dependent && !dependent.error().is(ErrorCode::NotFound)) return dependent.error();
    if (!prerequisite && !prerequisite.error().is(ErrorCode::NotFound)) return prerequisite.error();
    if (!dependent || !prerequisite) {
        return Error{ErrorCode::DependencyEndpointNotFound, "One or both tasks not found"};
    }
    if (dependent->project_id != prerequisite->project_id) {
        return Error{ErrorCode::ProjectMismatch, "Tasks belong to different projects"};
    }

    const auto project = dependent->project_id;
    auto existing = store_->list_dependencies(project);
    if (!existing) return existing.error();

    const TaskDependency edge{.task_id = task, .depends_on_task_id = depends_on};
    if (std::find(existing->begin(), existing->end(), edge) != existing->end()) {
        return Result<void>{};
    }

    if (config_.dependencies.reject_cycles) {
        auto graph = load_graph(project);
        if (!graph) return graph.error();

        // The new edge runs depends_on → task; it closes a cycle iff
        // task already reaches depends_on.
        auto from = graph->index_of(task);
        auto to = graph->index_of(depends_on);
        if (from && to && graph->reachable(*from, *to)) {
            logger_.warn("Dependency rejected: would create a cycle",
                         {{"task", task}, {"depends_on", depends_on}});
            return Error{ErrorCode::CycleRejected, "Dependency would create a circular dependency"};
        }
    }

    auto saved = store_->save_dependency(edge);
    if (!saved) return saved;

    audit_.record(AuditEvent::DependencyCreated, project, task, "system",
                  {{"depends_on_task_id", depends_on}});
    return Result<void>{};
}

Result<Task> Orchestrator::record_test_results(TaskId task, Document results) {
    if (!results.is_object()) {
        return Error{ErrorCode::InvalidArgument, "Test results must be a JSON object"};
    }

    Document details = Document::object();
    if (auto it = results.find("status"); it != results.end()) details["status"] = *it;

    auto updated = store_->update_task(task, [&results](Task& t) -> Result<void> {
        t.test_results = std::move(results);
        return Result<void>{};
    });
    if (!updated) return updated.error();

    audit_.record(AuditEvent::TestResultsRecorded, updated->project_id, task, "sandbox_runner",
                  std::move(details));
    return updated;
}

// ─────────────────────────────────────────────
// Advisor-driven
// ─────────────────────────────────────────────

Result<Task> Orchestrator::generate_spec(TaskId task) {
    auto current = store_->get_task(task);
    if (!current) return current.error();

    auto spec = advisor_->generate_spec(SpecRequest{
        .task_name = current->name,
        .task_description = current->description,
        .project_context = "Project ID: " + std::to_string(current->project_id),
        .inputs = current->inputs,
        .outputs = current->outputs,
        .tests = current->tests
    });
    if (!spec) {
        logger_.error("Spec generation failed", spec.error());
        return spec.error();
    }

    double confidence = kDefaultConfidence;
    if (auto it = spec->find("confidence_score"); it != spec->end() && it->is_number()) {
        confidence = it->get<double>();
    }

    auto updated = store_->update_task(task, [&](Task& t) -> Result<void> {
        t.spec = *spec;
        t.confidence_score = confidence;
        return Result<void>{};
    });
    if (!updated) return updated.error();

    audit_.record(AuditEvent::SpecGenerated, updated->project_id, task, advisor_->name(),
                  {{"confidence_score", confidence}});
    return updated;
}

Result<BootstrapResult> Orchestrator::bootstrap_plan(ProjectId project) {
    auto owner = store_->get_project(project);
    if (!owner) return owner.error();

    auto plan = advisor_->generate_plan(PlanRequest{
        .project_name = owner->name,
        .goal = owner->goal,
        .description = owner->description,
        .acceptance_criteria = owner->acceptance_criteria,
        .environment = owner->environment
    });
    if (!plan) {
        logger_.error("Plan generation failed", plan.error());
        return plan.error();
    }

    BootstrapResult result{
        .project_id = project,
        .risk_level = plan->risk_level,
        .estimated_total_hours = plan->estimated_total_hours.value_or(0.0)
    };

    for (size_t idx = 0; idx < plan->tasks.size(); ++idx) {
        const auto& proposal = plan->tasks[idx];
        auto id = store_->create_task(Task{
            .project_id = project,
            .name = proposal.name,
            .description = proposal.description,
            .inputs = proposal.inputs,
            .outputs = proposal.outputs,
            .tests = proposal.tests,
            .security_checks = proposal.security_checks,
            .estimate_hours = proposal.estimate_hours,
            .confidence_score = proposal.confidence_score,
            .requires_approval = proposal.requires_approval,
            .order = proposal.order.value_or(static_cast<int32_t>(idx))
        });
        if (!id) return id.error();
        result.task_ids.push_back(*id);
    }

    for (size_t idx = 0; idx < plan->tasks.size(); ++idx) {
        for (size_t dep : plan->tasks[idx].dependencies) {
            if (dep >= result.task_ids.size() || dep == idx) {
                logger_.warn("Skipping invalid plan dependency", {{"task_index", idx}, {"dependency_index", dep}});
                result.skipped_dependencies++;
                continue;
            }
            auto saved = store_->save_dependency(TaskDependency{
                .task_id = result.task_ids[idx],
                .depends_on_task_id = result.task_ids[dep]
            });
            if (!saved) return saved.error();
            result.dependency_count++;
        }
    }

    owner->risk_level = plan->risk_level;
    owner->status = ProjectStatus::Planning;
    if (auto saved = store_->save_project(*owner); !saved) return saved.error();

    audit_.record(AuditEvent::PlanGenerated, project, std::nullopt, advisor_->name(), {
        {"task_count", result.task_ids.size()},
        {"dependency_count", result.dependency_count},
        {"risk_level", std::string{to_string(result.risk_level)}},
        {"estimated_total_hours", result.estimated_total_hours}
    });
    logger_.info("Plan generated", {{"project", project}, {"tasks", result.task_ids.size()}});
    return result;
}

}  // namespace task_orchestrator

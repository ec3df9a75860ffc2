/**
 * @file task_lifecycle.cpp
 * @brief TaskLifecycle gate checks and transitions.
 * @author Dimitris Kafetzis
 */

#include "lifecycle/task_lifecycle.hpp"

namespace task_orchestrator {

Result<void> TaskLifecycle::check_approve(const Task& task) {
    if (!is_non_empty(task.spec)) {
        return Error::gate_violation(
            GateKind::SpecMissing,
            "Task cannot be approved without a machine-readable specification. "
            "Generate spec first.");
    }
    return Result<void>{};
}

Result<void> TaskLifecycle::check_complete(const Task& task) {
    if (!is_non_empty(task.test_results)) {
        return Error::gate_violation(
            GateKind::TestResultsMissing,
            "Task cannot be completed without test results. Run tests first.");
    }
    if (tests_failed(*task.test_results)) {
        return Error::gate_violation(
            GateKind::TestsFailed,
            "Task cannot be completed with failed tests.");
    }
    if (task.requires_approval && task.status != TaskStatus::Approved) {
        return Error::gate_violation(
            GateKind::ApprovalRequired,
            "Task requires human approval before completion.");
    }
    return Result<void>{};
}

Result<void> TaskLifecycle::approve(Task& task, const std::string& approver, Timestamp now) {
    if (approver.empty()) {
        return Error{ErrorCode::InvalidArgument, "Approver identity must not be empty"};
    }
    if (auto gate = check_approve(task); !gate) {
        return gate;
    }

    task.status = target_status(LifecycleAction::Approve);
    task.approved_by = approver;
    task.approved_at = now;
    task.rejection_reason.reset();
    return Result<void>{};
}

Result<void> TaskLifecycle::reject(Task& task, const std::string& reason) {
    if (reason.empty()) {
        return Error{ErrorCode::InvalidArgument, "Rejection reason must not be empty"};
    }

    task.status = target_status(LifecycleAction::Reject);
    task.rejection_reason = reason;
    task.approved_by.reset();
    task.approved_at.reset();
    return Result<void>{};
}

Result<void> TaskLifecycle::complete(Task& task) {
    if (auto gate = check_complete(task); !gate) {
        return gate;
    }

    task.status = target_status(LifecycleAction::Complete);
    return Result<void>{};
}

bool TaskLifecycle::tests_failed(const Document& test_results) {
    if (!test_results.is_object()) return false;
    auto it = test_results.find("status");
    return it != test_results.end() && it->is_string()
        && it->get_ref<const std::string&>() == "failed";
}

}  // namespace task_orchestrator

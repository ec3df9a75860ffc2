/**
 * @file task_lifecycle.hpp
 * @brief Gated state machine for approve / reject / complete.
 * @author Dimitris Kafetzis
 *
 * Gates:
 *   Approve:  the task carries a non-empty spec           (SpecMissing)
 *   Complete: test results are present                    (TestResultsMissing)
 *             test_results.status is not "failed"         (TestsFailed)
 *             requires_approval implies status APPROVED   (ApprovalRequired)
 *
 * The transition functions mutate a Task in place and are meant to run
 * inside ITaskStore::update_task so the gate check and the write form one
 * critical section. A failed gate leaves the task untouched.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/task.hpp"

#include <string>
#include <string_view>

namespace task_orchestrator {

enum class LifecycleAction : uint8_t {
    Approve,
    Reject,
    Complete
};

[[nodiscard]] constexpr std::string_view to_string(LifecycleAction action) noexcept {
    switch (action) {
        case LifecycleAction::Approve:  return "approve";
        case LifecycleAction::Reject:   return "reject";
        case LifecycleAction::Complete: return "complete";
    }
    return "unknown";
}

/// Status a successful action leaves the task in.
[[nodiscard]] constexpr TaskStatus target_status(LifecycleAction action) noexcept {
    switch (action) {
        case LifecycleAction::Approve:  return TaskStatus::Approved;
        case LifecycleAction::Reject:   return TaskStatus::Pending;
        case LifecycleAction::Complete: return TaskStatus::Completed;
    }
    return TaskStatus::Pending;
}

class TaskLifecycle {
public:
    // ── Gate checks (no mutation) ────────────
    [[nodiscard]] static Result<void> check_approve(const Task& task);
    [[nodiscard]] static Result<void> check_complete(const Task& task);

    // ── Transitions ──────────────────────────

    /// → APPROVED; records approver and time, clears any rejection reason.
    [[nodiscard]] static Result<void> approve(Task& task, const std::string& approver, Timestamp now);

    /// → PENDING; records the reason, clears approver and approval time.
    [[nodiscard]] static Result<void> reject(Task& task, const std::string& reason);

    /// → COMPLETED.
    [[nodiscard]] static Result<void> complete(Task& task);

    /// True when the report's `status` field reads "failed".
    [[nodiscard]] static bool tests_failed(const Document& test_results);
};

}  // namespace task_orchestrator

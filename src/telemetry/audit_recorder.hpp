/**
 * @file audit_recorder.hpp
 * @brief Append-only audit trail of state-changing operations.
 * @author Dimitris Kafetzis
 *
 * One NDJSON object per event:
 * `{"event", "ts", "project", "task"?, "actor", "details"}`.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace task_orchestrator {

// ─────────────────────────────────────────────
// Audit events
// ─────────────────────────────────────────────

enum class AuditEvent : uint8_t {
    TaskCreated,
    TaskDeleted,
    DependencyCreated,
    SpecGenerated,
    TestResultsRecorded,
    TaskApproved,
    TaskRejected,
    TaskCompleted,
    TasksReprioritized,
    PlanGenerated
};

[[nodiscard]] constexpr std::string_view to_string(AuditEvent event) noexcept {
    switch (event) {
        case AuditEvent::TaskCreated:         return "task_created";
        case AuditEvent::TaskDeleted:         return "task_deleted";
        case AuditEvent::DependencyCreated:   return "dependency_created";
        case AuditEvent::SpecGenerated:       return "spec_generated";
        case AuditEvent::TestResultsRecorded: return "test_results_recorded";
        case AuditEvent::TaskApproved:        return "task_approved";
        case AuditEvent::TaskRejected:        return "task_rejected";
        case AuditEvent::TaskCompleted:       return "task_completed";
        case AuditEvent::TasksReprioritized:  return "tasks_reprioritized";
        case AuditEvent::PlanGenerated:       return "plan_generated";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// AuditRecorder
// ─────────────────────────────────────────────

class AuditRecorder {
public:
    explicit AuditRecorder(std::unique_ptr<ILogSink> sink);

    void record(AuditEvent event,
                ProjectId project,
                std::optional<TaskId> task,
                std::string_view actor,
                Document details = Document::object());

    void flush();

    /// Number of events recorded since construction.
    [[nodiscard]] uint64_t event_count() const;

private:
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    uint64_t event_count_{0};
};

}  // namespace task_orchestrator

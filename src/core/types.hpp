/**
 * @file types.hpp
 * @brief Fundamental types used throughout TaskOrchestrator.
 * @author Dimitris Kafetzis
 *
 * Defines TaskId, ProjectId, the task/project status enumerations and the
 * Document alias for structured task payloads (specs, test reports).
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace task_orchestrator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = int64_t;
using ProjectId = int64_t;
using Timestamp = std::chrono::system_clock::time_point;

/// Structured document (spec, test results, inputs/outputs).
using Document = nlohmann::json;

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,       ///< Default for a newly created task
    InProgress,    ///< Already moving, never re-offered as actionable
    Blocked,       ///< Set by collaborators outside the lifecycle
    Review,        ///< Awaiting review or sign-off
    Approved,      ///< Passed the spec-binding gate
    Completed,     ///< Terminal
    Failed         ///< Terminal
};

/**
 * @brief Convert TaskStatus to its wire representation.
 */
[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:    return "pending";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Blocked:    return "blocked";
        case TaskStatus::Review:     return "review";
        case TaskStatus::Approved:   return "approved";
        case TaskStatus::Completed:  return "completed";
        case TaskStatus::Failed:     return "failed";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept;

/// COMPLETED and FAILED take no further part in scheduling.
[[nodiscard]] constexpr bool is_terminal(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Completed:
        case TaskStatus::Failed:
            return true;
        case TaskStatus::Pending:
        case TaskStatus::InProgress:
        case TaskStatus::Blocked:
        case TaskStatus::Review:
        case TaskStatus::Approved:
            return false;
    }
    return false;
}

inline constexpr TaskStatus kAllTaskStatuses[] = {
    TaskStatus::Pending, TaskStatus::InProgress, TaskStatus::Blocked,
    TaskStatus::Review,  TaskStatus::Approved,   TaskStatus::Completed,
    TaskStatus::Failed
};

// ─────────────────────────────────────────────
// Project Status & Risk
// ─────────────────────────────────────────────

enum class ProjectStatus : uint8_t {
    Draft,
    Planning,
    InProgress,
    Review,
    Completed,
    Archived
};

[[nodiscard]] constexpr std::string_view to_string(ProjectStatus status) noexcept {
    switch (status) {
        case ProjectStatus::Draft:      return "draft";
        case ProjectStatus::Planning:   return "planning";
        case ProjectStatus::InProgress: return "in_progress";
        case ProjectStatus::Review:     return "review";
        case ProjectStatus::Completed:  return "completed";
        case ProjectStatus::Archived:   return "archived";
    }
    return "unknown";
}

[[nodiscard]] std::optional<ProjectStatus> parse_project_status(std::string_view text) noexcept;

enum class RiskLevel : uint8_t {
    Low,
    Medium,
    High,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(RiskLevel level) noexcept {
    switch (level) {
        case RiskLevel::Low:      return "low";
        case RiskLevel::Medium:   return "medium";
        case RiskLevel::High:     return "high";
        case RiskLevel::Critical: return "critical";
    }
    return "unknown";
}

[[nodiscard]] std::optional<RiskLevel> parse_risk_level(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Documents
// ─────────────────────────────────────────────

/**
 * @brief True when a document carries content.
 *
 * Absent, null, false, zero, "" and empty objects/arrays all count as empty.
 */
[[nodiscard]] bool is_non_empty(const std::optional<Document>& doc) noexcept;

/// ISO 8601 UTC rendering with millisecond precision.
[[nodiscard]] std::string format_timestamp(Timestamp ts);

}  // namespace task_orchestrator

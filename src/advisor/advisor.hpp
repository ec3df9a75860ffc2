/**
 * @file advisor.hpp
 * @brief Plan / spec / verification producer interface.
 * @author Dimitris Kafetzis
 *
 * The orchestrator consumes whatever structured result an IAdvisor returns
 * and never asks which variant produced it. Two variants exist:
 * FallbackAdvisor (deterministic) and ModelBackedAdvisor (language model
 * behind ICompletionClient, degrading to the fallback on any failure).
 * Model output is validated against a fixed required-field set before use.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace task_orchestrator {

// ─────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────

struct PlanRequest {
    std::string project_name;
    std::string goal;
    std::string description;
    std::vector<std::string> acceptance_criteria;
    std::string environment;
};

struct SpecRequest {
    std::string task_name;
    std::string task_description;
    std::string project_context;
    Document inputs = Document::object();
    Document outputs = Document::object();
    Document tests = Document::array();
};

struct VerificationRequest {
    std::string filename;
    std::string mime_type;
    uint64_t size_bytes = 0;
    std::string content;
    std::string task_name;
    std::string task_description;
    Document expected_outputs = Document::object();
};

// ─────────────────────────────────────────────
// Plan proposal
// ─────────────────────────────────────────────

/**
 * @brief One proposed task. `dependencies` are indices into the plan.
 */
struct TaskProposal {
    std::string name;
    std::string description;
    Document inputs = Document::object();
    Document outputs = Document::object();
    Document tests = Document::array();
    Document security_checks = Document::array();
    std::optional<double> estimate_hours;
    std::optional<int32_t> order;
    bool requires_approval = false;
    std::optional<double> confidence_score;
    std::vector<size_t> dependencies;
};

struct PlanProposal {
    std::vector<TaskProposal> tasks;
    RiskLevel risk_level = RiskLevel::Medium;
    std::optional<double> estimated_total_hours;
};

// ─────────────────────────────────────────────
// Required fields
// ─────────────────────────────────────────────

inline constexpr std::string_view kPlanRequiredFields[] = {"tasks", "risk_level"};
inline constexpr std::string_view kSpecRequiredFields[] = {
    "task_name", "objective", "inputs", "outputs", "test_cases"};
inline constexpr std::string_view kVerificationRequiredFields[] = {
    "status", "overall_score", "checks"};

/// Fails with AdvisorFailure naming the first missing field.
Result<void> validate_required(const Document& doc, std::span<const std::string_view> fields);

/// Convert a validated plan document into a proposal.
Result<PlanProposal> parse_plan(const Document& doc);

// ─────────────────────────────────────────────
// IAdvisor
// ─────────────────────────────────────────────

class IAdvisor {
public:
    virtual ~IAdvisor() = default;

    virtual Result<PlanProposal> generate_plan(const PlanRequest& request) = 0;
    virtual Result<Document> generate_spec(const SpecRequest& request) = 0;
    virtual Result<Document> verify_artifact(const VerificationRequest& request) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ─────────────────────────────────────────────
// ICompletionClient
// ─────────────────────────────────────────────

struct CompletionRequest {
    std::string system_prompt;
    std::string user_prompt;
    std::string model;
    double temperature = 0.7;
    uint32_t max_tokens = 4096;
};

/**
 * @brief Text-completion endpoint used by ModelBackedAdvisor.
 */
class ICompletionClient {
public:
    virtual ~ICompletionClient() = default;
    virtual Result<std::string> complete(const CompletionRequest& request) = 0;
};

}  // namespace task_orchestrator

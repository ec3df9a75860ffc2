/**
 * @file fallback_advisor.hpp
 * @brief Deterministic advisor used when no model is available.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "advisor/advisor.hpp"

namespace task_orchestrator {

/**
 * @brief Produces fixed-shape plans, specs and verification reports.
 *
 * Plan: research → implementation → testing, 2h / 4h / 2h, with approval
 * required on the first and last step. Spec: mirrors the task's inputs,
 * outputs and tests at confidence 0.5. Verification: substring scan for
 * risky patterns plus a size check.
 */
class FallbackAdvisor : public IAdvisor {
public:
    Result<PlanProposal> generate_plan(const PlanRequest& request) override;
    Result<Document> generate_spec(const SpecRequest& request) override;
    Result<Document> verify_artifact(const VerificationRequest& request) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "fallback"; }

    /// Plan as a raw document, before parse_plan().
    [[nodiscard]] static Document plan_document(const PlanRequest& request);
};

}  // namespace task_orchestrator

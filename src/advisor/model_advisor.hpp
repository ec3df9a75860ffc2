/**
 * @file model_advisor.hpp
 * @brief Advisor backed by a language model completion endpoint.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "advisor/advisor.hpp"
#include "advisor/fallback_advisor.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <memory>
#include <string>

namespace task_orchestrator {

/**
 * @brief Asks the model for JSON, validates it, and falls back on failure.
 *
 * Any client error, unparsable reply or missing required field is logged
 * as a warning and answered by the embedded FallbackAdvisor, so callers
 * always receive a structurally valid result.
 */
class ModelBackedAdvisor : public IAdvisor {
public:
    ModelBackedAdvisor(std::unique_ptr<ICompletionClient> client,
                       AdvisorConfig config,
                       Logger& logger);

    Result<PlanProposal> generate_plan(const PlanRequest& request) override;
    Result<Document> generate_spec(const SpecRequest& request) override;
    Result<Document> verify_artifact(const VerificationRequest& request) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "model"; }

    /**
     * @brief Extract a JSON document from a model reply.
     *
     * Strips a ```json (or bare ```) fenced block when present.
     */
    [[nodiscard]] static Result<Document> parse_reply(const std::string& reply);

    static constexpr size_t kMaxVerificationChars = 8000;

private:
    Result<Document> ask(const std::string& system_prompt,
                         const std::string& user_prompt,
                         double temperature);

    std::unique_ptr<ICompletionClient> client_;
    AdvisorConfig config_;
    Logger& logger_;
    FallbackAdvisor fallback_;
};

}  // namespace task_orchestrator

/**
 * @file model_advisor.cpp
 * @brief ModelBackedAdvisor implementation and prompt templates.
 * @author Dimitris Kafetzis
 */

#include "advisor/model_advisor.hpp"

#include <sstream>

namespace task_orchestrator {

namespace {

constexpr const char* kPlannerSystemPrompt =
    "You are a project planner. Break the goal into concrete tasks. Reply with "
    "a single JSON object: {\"tasks\": [{\"name\", \"description\", \"inputs\", "
    "\"outputs\", \"tests\", \"security_checks\", \"estimate_hours\", \"order\", "
    "\"requires_approval\", \"confidence_score\", \"dependencies\": [task index]}], "
    "\"risk_level\": \"low|medium|high|critical\", \"estimated_total_hours\"}.";

constexpr const char* kSpecSystemPrompt =
    "You write machine-readable task specifications. Reply with a single JSON "
    "object containing task_name, objective, inputs, outputs, test_cases, "
    "edge_cases, security_requirements, implementation_notes and confidence_score.";

constexpr const char* kVerifierSystemPrompt =
    "You review delivered artifacts for quality and security. Reply with a single "
    "JSON object containing status (pass|warning|fail), overall_score (0-1), "
    "checks, summary, security_issues and recommendations.";

constexpr double kVerifierTemperature = 0.3;

std::string bullet_list(const std::vector<std::string>& items) {
    if (items.empty()) return "N/A";
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << '\n';
        oss << "- " << items[i];
    }
    return oss.str();
}

}  // anonymous namespace

ModelBackedAdvisor::ModelBackedAdvisor(std::unique_ptr<ICompletionClient> client,
                                       AdvisorConfig config,
                                       Logger& logger)
    : client_(std::move(client)), config_(std::move(config)), logger_(logger) {}

Result<Document> ModelBackedAdvisor::parse_reply(const std::string& reply) {
    std::string body = reply;
    if (auto open = body.find("```json"); open != std::string::npos) {
        body = body.substr(open + 7);
        if (auto close = body.find("```"); close != std::string::npos) body.resize(close);
    } else if (auto fence = body.find("```"); fence != std::string::npos) {
        body = body.substr(fence + 3);
        if (auto close = body.find("```"); close != std::string::npos) body.resize(close);
    }

    auto doc = Document::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::AdvisorFailure, "Invalid JSON response from model"};
    }
    return doc;
}

Result<Document> ModelBackedAdvisor::ask(const std::string& system_prompt,
                                         const std::string& user_prompt,
                                         double temperature) {
    if (!client_) {
        return Error{ErrorCode::AdvisorFailure, "No completion client configured"};
    }

    auto reply = client_->complete(CompletionRequest{
        .system_prompt = system_prompt,
        .user_prompt = user_prompt,
        .model = config_.model,
        .temperature = temperature,
        .max_tokens = config_.max_tokens
    });
    if (!reply) return reply.error();

    return parse_reply(*reply);
}

Result<PlanProposal> ModelBackedAdvisor::generate_plan(const PlanRequest& request) {
    std::ostringstream prompt;
    prompt << "Project: " << request.project_name << '\n'
           << "Goal: " << request.goal << '\n'
           << "Description: " << request.description << '\n'
           << "Acceptance criteria:\n" << bullet_list(request.acceptance_criteria) << '\n'
           << "Environment: "
           << (request.environment.empty() ? "Not specified" : request.environment);

    auto doc = ask(kPlannerSystemPrompt, prompt.str(), config_.temperature);
    if (doc) {
        auto plan = parse_plan(*doc);
        if (plan) return plan;
        logger_.warn("Invalid plan structure, using fallback", {{"reason", plan.error().message}});
    } else {
        logger_.warn("Plan generation failed, using fallback", {{"reason", doc.error().message}});
    }
    return fallback_.generate_plan(request);
}

Result<Document> ModelBackedAdvisor::generate_spec(const SpecRequest& request) {
    std::ostringstream prompt;
    prompt << "Task: " << request.task_name << '\n'
           << "Description: " << request.task_description << '\n'
           << "Context: " << request.project_context << '\n'
           << "Inputs: " << request.inputs.dump() << '\n'
           << "Outputs: " << request.outputs.dump() << '\n'
           << "Tests: " << request.tests.dump();

    auto doc = ask(kSpecSystemPrompt, prompt.str(), config_.temperature);
    if (doc) {
        auto valid = validate_required(*doc, kSpecRequiredFields);
        if (valid) return doc;
        logger_.warn("Invalid spec structure, using fallback", {{"reason", valid.error().message}});
    } else {
        logger_.warn("Spec generation failed, using fallback", {{"reason", doc.error().message}});
    }
    return fallback_.generate_spec(request);
}

Result<Document> ModelBackedAdvisor::verify_artifact(const VerificationRequest& request) {
    std::string content = request.content.substr(0, kMaxVerificationChars);
    if (request.content.size() > kMaxVerificationChars) {
        content += "\n... (content truncated)";
    }

    std::ostringstream prompt;
    prompt << "File: " << request.filename << " (" << request.mime_type << ", "
           << request.size_bytes << " bytes)\n"
           << "Task: " << request.task_name << '\n'
           << "Description: " << request.task_description << '\n'
           << "Expected outputs: " << request.expected_outputs.dump() << '\n'
           << "Content:\n" << content;

    auto doc = ask(kVerifierSystemPrompt, prompt.str(), kVerifierTemperature);
    if (doc) {
        auto valid = validate_required(*doc, kVerificationRequiredFields);
        if (valid) return doc;
        logger_.warn("Invalid verification structure, using fallback",
                     {{"reason", valid.error().message}});
    } else {
        logger_.warn("Verification failed, using fallback", {{"reason", doc.error().message}});
    }
    return fallback_.verify_artifact(request);
}

}  // namespace task_orchestrator

/**
 * @file advisor.cpp
 * @brief Required-field validation and plan parsing.
 * @author Dimitris Kafetzis
 */

#include "advisor/advisor.hpp"

namespace task_orchestrator {

Result<void> validate_required(const Document& doc, std::span<const std::string_view> fields) {
    if (!doc.is_object()) {
        return Error{ErrorCode::AdvisorFailure, "Advisor result is not a JSON object"};
    }
    for (auto field : fields) {
        if (!doc.contains(std::string{field})) {
            return Error{ErrorCode::AdvisorFailure,
                         "Missing required key in advisor result: " + std::string{field}};
        }
    }
    return Result<void>{};
}

Result<PlanProposal> parse_plan(const Document& doc) {
    if (auto valid = validate_required(doc, kPlanRequiredFields); !valid) {
        return valid.error();
    }

    try {
        PlanProposal plan;

        auto risk = parse_risk_level(doc.at("risk_level").get<std::string>());
        if (!risk) {
            return Error{ErrorCode::AdvisorFailure, "Unknown risk level in plan"};
        }
        plan.risk_level = *risk;

        if (auto it = doc.find("estimated_total_hours"); it != doc.end() && it->is_number()) {
            plan.estimated_total_hours = it->get<double>();
        }

        for (const auto& entry : doc.at("tasks")) {
            TaskProposal task;
            task.name = entry.at("name").get<std::string>();
            task.description = entry.value("description", std::string{});
            task.inputs = entry.value("inputs", Document::object());
            task.outputs = entry.value("outputs", Document::object());
            task.tests = entry.value("tests", Document::array());
            task.security_checks = entry.value("security_checks", Document::array());
            task.requires_approval = entry.value("requires_approval", false);

            if (auto it = entry.find("estimate_hours"); it != entry.end() && it->is_number()) {
                task.estimate_hours = it->get<double>();
            }
            if (auto it = entry.find("order"); it != entry.end() && it->is_number_integer()) {
                task.order = it->get<int32_t>();
            }
            if (auto it = entry.find("confidence_score"); it != entry.end() && it->is_number()) {
                task.confidence_score = it->get<double>();
            }
            for (const auto& dep : entry.value("dependencies", Document::array())) {
                if (dep.is_number_unsigned() || (dep.is_number_integer() && dep.get<int64_t>() >= 0)) {
                    task.dependencies.push_back(dep.get<size_t>());
                }
            }
            plan.tasks.push_back(std::move(task));
        }
        return plan;

    } catch (const nlohmann::json::exception& err) {
        return Error{ErrorCode::AdvisorFailure, std::string{"Malformed plan: "} + err.what()};
    }
}

}  // namespace task_orchestrator

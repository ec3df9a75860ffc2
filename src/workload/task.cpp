/**
 * @file task.cpp
 * @brief JSON conversion for task, dependency and project records.
 * @author Dimitris Kafetzis
 */

#include "workload/task.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace task_orchestrator {

namespace {

std::optional<Timestamp> parse_timestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) return std::nullopt;

    auto ts = std::chrono::system_clock::from_time_t(timegm(&tm));
    if (iss.peek() == '.') {
        iss.get();
        // Fraction digits are scaled to milliseconds; digits past the third are dropped.
        int ms = 0;
        int digits = 0;
        while (std::isdigit(iss.peek())) {
            int digit = iss.get() - '0';
            if (digits < 3) {
                ms = ms * 10 + digit;
                ++digits;
            }
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 3; ++digits) ms *= 10;
        ts += std::chrono::milliseconds(ms);
    }
    return ts;
}

template <typename T>
std::optional<T> optional_field(const Document& j, const char* key) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        return it->template get<T>();
    }
    return std::nullopt;
}

}  // anonymous namespace

void to_json(Document& j, const Task& task) {
    j = Document{
        {"id", task.id},
        {"project_id", task.project_id},
        {"name", task.name},
        {"description", task.description},
        {"inputs", task.inputs},
        {"outputs", task.outputs},
        {"tests", task.tests},
        {"security_checks", task.security_checks},
        {"status", std::string{to_string(task.status)}},
        {"requires_approval", task.requires_approval},
        {"order", task.order}
    };
    j["estimate_hours"] = task.estimate_hours ? Document(*task.estimate_hours) : Document();
    j["confidence_score"] = task.confidence_score ? Document(*task.confidence_score) : Document();
    j["approved_by"] = task.approved_by ? Document(*task.approved_by) : Document();
    j["approved_at"] = task.approved_at ? Document(format_timestamp(*task.approved_at)) : Document();
    j["rejection_reason"] = task.rejection_reason ? Document(*task.rejection_reason) : Document();
    j["spec"] = task.spec.value_or(Document());
    j["test_results"] = task.test_results.value_or(Document());
}

void to_json(Document& j, const TaskDependency& dep) {
    j = Document{{"task_id", dep.task_id}, {"depends_on_task_id", dep.depends_on_task_id}};
}

void to_json(Document& j, const Project& project) {
    j = Document{
        {"id", project.id},
        {"name", project.name},
        {"description", project.description},
        {"goal", project.goal},
        {"acceptance_criteria", project.acceptance_criteria},
        {"environment", project.environment},
        {"status", std::string{to_string(project.status)}},
        {"risk_level", std::string{to_string(project.risk_level)}}
    };
}

void to_json(Document& j, const TaskRef& ref) {
    j = Document{
        {"task_id", ref.task_id},
        {"name", ref.name},
        {"estimate_hours", ref.duration_hours},
        {"status", std::string{to_string(ref.status)}}
    };
}

Result<Task> task_from_json(const Document& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidArgument, "Task record must be a JSON object"};
    }

    try {
        Task task;
        task.id = j.at("id").get<TaskId>();
        task.project_id = j.at("project_id").get<ProjectId>();
        task.name = j.at("name").get<std::string>();
        task.description = j.value("description", std::string{});
        task.inputs = j.value("inputs", Document::object());
        task.outputs = j.value("outputs", Document::object());
        task.tests = j.value("tests", Document::array());
        task.security_checks = j.value("security_checks", Document::array());
        task.estimate_hours = optional_field<double>(j, "estimate_hours");
        task.confidence_score = optional_field<double>(j, "confidence_score");
        task.requires_approval = j.value("requires_approval", false);
        task.approved_by = optional_field<std::string>(j, "approved_by");
        task.rejection_reason = optional_field<std::string>(j, "rejection_reason");
        task.order = j.value("order", int32_t{0});

        auto status_text = j.value("status", std::string{"pending"});
        auto status = parse_task_status(status_text);
        if (!status) {
            return Error{ErrorCode::InvalidArgument,
                         "Task " + std::to_string(task.id) + ": unknown status \"" + status_text + "\""};
        }
        task.status = *status;

        if (auto approved_at = optional_field<std::string>(j, "approved_at")) {
            task.approved_at = parse_timestamp(*approved_at);
            if (!task.approved_at) {
                return Error{ErrorCode::InvalidArgument,
                             "Task " + std::to_string(task.id) + ": malformed approved_at"};
            }
        }
        if (auto it = j.find("spec"); it != j.end() && !it->is_null()) {
            task.spec = *it;
        }
        if (auto it = j.find("test_results"); it != j.end() && !it->is_null()) {
            task.test_results = *it;
        }
        return task;

    } catch (const nlohmann::json::exception& err) {
        return Error{ErrorCode::InvalidArgument, std::string{"Malformed task record: "} + err.what()};
    }
}

Result<TaskDependency> dependency_from_json(const Document& j) {
    try {
        return TaskDependency{
            .task_id = j.at("task_id").get<TaskId>(),
            .depends_on_task_id = j.at("depends_on_task_id").get<TaskId>()
        };
    } catch (const nlohmann::json::exception& err) {
        return Error{ErrorCode::InvalidArgument, std::string{"Malformed dependency record: "} + err.what()};
    }
}

Result<Project> project_from_json(const Document& j) {
    try {
        Project project;
        project.id = j.at("id").get<ProjectId>();
        project.name = j.at("name").get<std::string>();
        project.description = j.value("description", std::string{});
        project.goal = j.value("goal", std::string{});
        project.acceptance_criteria =
            j.value("acceptance_criteria", std::vector<std::string>{});
        project.environment = j.value("environment", std::string{});

        auto status = parse_project_status(j.value("status", std::string{"draft"}));
        auto risk = parse_risk_level(j.value("risk_level", std::string{"low"}));
        if (!status || !risk) {
            return Error{ErrorCode::InvalidArgument,
                         "Project " + std::to_string(project.id) + ": unknown status or risk level"};
        }
        project.status = *status;
        project.risk_level = *risk;
        return project;

    } catch (const nlohmann::json::exception& err) {
        return Error{ErrorCode::InvalidArgument, std::string{"Malformed project record: "} + err.what()};
    }
}

}  // namespace task_orchestrator

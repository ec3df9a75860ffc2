/**
 * @file types.cpp
 * @brief Status parsing and document helpers.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace task_orchestrator {

std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept {
    for (auto status : kAllTaskStatuses) {
        if (to_string(status) == text) return status;
    }
    return std::nullopt;
}

std::optional<ProjectStatus> parse_project_status(std::string_view text) noexcept {
    for (auto status : {ProjectStatus::Draft, ProjectStatus::Planning,
                        ProjectStatus::InProgress, ProjectStatus::Review,
                        ProjectStatus::Completed, ProjectStatus::Archived}) {
        if (to_string(status) == text) return status;
    }
    return std::nullopt;
}

std::optional<RiskLevel> parse_risk_level(std::string_view text) noexcept {
    for (auto level : {RiskLevel::Low, RiskLevel::Medium,
                       RiskLevel::High, RiskLevel::Critical}) {
        if (to_string(level) == text) return level;
    }
    return std::nullopt;
}

bool is_non_empty(const std::optional<Document>& doc) noexcept {
    if (!doc.has_value()) return false;

    const auto& d = *doc;
    switch (d.type()) {
        case Document::value_t::null:
        case Document::value_t::discarded:
            return false;
        case Document::value_t::object:
        case Document::value_t::array:
            return !d.empty();
        case Document::value_t::string:
            return !d.get_ref<const std::string&>().empty();
        case Document::value_t::boolean:
            return d.get<bool>();
        case Document::value_t::number_integer:
            return d.get<int64_t>() != 0;
        case Document::value_t::number_unsigned:
            return d.get<uint64_t>() != 0;
        case Document::value_t::number_float:
            return d.get<double>() != 0.0;
        case Document::value_t::binary:
            return !d.get_binary().empty();
    }
    return false;
}

std::string format_timestamp(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_ts, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace task_orchestrator

/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 * @author Dimitris Kafetzis
 */

#include "core/logger.hpp"
#include "core/types.hpp"

#include <chrono>

namespace task_orchestrator {

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    for (auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error}) {
        if (to_string(level) == text) return level;
    }
    return std::nullopt;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level, std::string component)
    : sink_(std::move(sink)), min_level_(min_level), component_(std::move(component)) {}

void Logger::debug(std::string_view message, const nlohmann::json& fields) {
    log(LogLevel::Debug, message, fields);
}
void Logger::info(std::string_view message, const nlohmann::json& fields) {
    log(LogLevel::Info, message, fields);
}
void Logger::warn(std::string_view message, const nlohmann::json& fields) {
    log(LogLevel::Warn, message, fields);
}
void Logger::error(std::string_view message, const nlohmann::json& fields) {
    log(LogLevel::Error, message, fields);
}

void Logger::error(std::string_view context, const Error& err) {
    nlohmann::json fields{{"code", std::string{to_string(err.code)}}};
    if (err.gate) fields["gate"] = std::string{to_string(*err.gate)};
    log(LogLevel::Error, std::string{context} + ": " + err.message, fields);
}

void Logger::log(LogLevel level, std::string_view message, const nlohmann::json& fields) {
    if (level < min_level_) return;

    nlohmann::json line;
    line["level"] = std::string{to_string(level)};
    line["ts"] = format_timestamp(std::chrono::system_clock::now());
    if (!component_.empty()) line["component"] = component_;
    line["msg"] = std::string{message};
    if (fields.is_object() && !fields.empty()) line["fields"] = fields;

    auto text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard lock(mutex_);
    sink_->write(text);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_ = level; }
LogLevel Logger::level() const noexcept { return min_level_; }

}  // namespace task_orchestrator

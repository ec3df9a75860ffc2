/**
 * @file audit_recorder.cpp
 * @brief AuditRecorder implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/audit_recorder.hpp"

#include <chrono>

namespace task_orchestrator {

AuditRecorder::AuditRecorder(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void AuditRecorder::record(AuditEvent event,
                           ProjectId project,
                           std::optional<TaskId> task,
                           std::string_view actor,
                           Document details) {
    Document line = {
        {"event", std::string{to_string(event)}},
        {"ts", format_timestamp(std::chrono::system_clock::now())},
        {"project", project}
    };
    if (task) line["task"] = *task;
    line["actor"] = std::string{actor};
    line["details"] = std::move(details);

    auto text = line.dump(-1, ' ', false, Document::error_handler_t::replace);

    std::lock_guard lock(write_mutex_);
    sink_->write(text);
    ++event_count_;
}

void AuditRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

uint64_t AuditRecorder::event_count() const {
    std::lock_guard lock(write_mutex_);
    return event_count_;
}

}  // namespace task_orchestrator

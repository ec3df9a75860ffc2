/**
 * @file json_codec.hpp
 * @brief JSON rendering of facade results for the CLI.
 * @author Dimitris Kafetzis
 *
 * Presentation limits (top-N actionable / blocked) are applied here and
 * nowhere else; the engine always hands over complete lists. Truncated
 * lists are accompanied by their full length.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "lifecycle/task_lifecycle.hpp"
#include "orchestrator/orchestrator.hpp"

namespace task_orchestrator {

struct JsonCodec {
    static Document encode(ProjectId project, const CriticalPath& path);
    static Document encode(const GraphView& graph);
    static Document encode(ProjectId project, const ReorderPlan& plan);
    static Document encode(ProjectId project, const ReadinessReport& report,
                           const PresentationConfig& limits);
    static Document encode(const StatusSummary& summary);
    static Document encode(const BootstrapResult& result);

    /// `{"message", "task_id", "status"}` after a lifecycle action.
    static Document encode(LifecycleAction action, const Task& task);

    /// `{"error", "gate"?, "message"}`.
    static Document encode(const Error& error);
};

}  // namespace task_orchestrator

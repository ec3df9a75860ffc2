/**
 * @file main.cpp
 * @brief TaskOrchestrator command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into one request:
 *   Config → Logger → Snapshot → TaskStore → Orchestrator → JsonCodec → stdout
 *
 * Exit codes: 0 success, 1 error, 2 lifecycle gate violation.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/json_codec.hpp"
#include "orchestrator/orchestrator.hpp"
#include "storage/in_memory_store.hpp"
#include "storage/snapshot.hpp"
#include "telemetry/json_sink.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace task_orchestrator;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitGate = 2;

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path snapshot_path;
    std::optional<ProjectId> project;
    std::string log_dir;
    bool demo_mode = false;
    std::vector<std::string> command;   ///< Command name followed by its arguments
};

void print_usage() {
    std::cout << "Usage: task_orchestrator [OPTIONS] <command> [args]\n"
              << "  --config <path>     Configuration file (default: config/default.toml)\n"
              << "  --snapshot <path>   Project snapshot (JSON); written back after changes\n"
              << "  --project <id>      Project the command applies to\n"
              << "  --log-dir <path>    Log output directory\n"
              << "  --demo              Build a three-task example and print every view\n"
              << "  --help, -h          Show this help message\n"
              << "\n"
              << "Commands:\n"
              << "  critical-path | graph | next-actions | reprioritize | summary | bootstrap\n"
              << "  approve <task> <who>\n"
              << "  reject <task> <who> <reason>\n"
              << "  complete <task>\n"
              << "  generate-spec <task>\n"
              << "  add-dependency <task> <depends-on>\n"
              << "  record-tests <task> <json>\n";
}

std::optional<int64_t> parse_id(const std::string& text) {
    int64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value <= 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--snapshot" && i + 1 < argc) {
            args.snapshot_path = argv[++i];
        } else if (arg == "--project" && i + 1 < argc) {
            args.project = parse_id(argv[++i]);
            if (!args.project) {
                std::cerr << "Invalid project id: " << argv[i] << '\n';
                return std::nullopt;
            }
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(kExitOk);
        } else {
            args.command.push_back(std::move(arg));
        }
    }
    return args;
}

void print(const Document& doc) {
    std::cout << doc.dump(2) << std::endl;
}

int report(const Error& error) {
    std::cerr << JsonCodec::encode(error).dump(2) << std::endl;
    return error.is(ErrorCode::GateViolation) ? kExitGate : kExitError;
}

/// Print a successful result or report its error.
template <typename T, typename Encode>
int emit(const Result<T>& result, Encode&& encode) {
    if (!result) return report(result.error());
    print(encode(*result));
    return kExitOk;
}

Result<TaskId> task_arg(const std::vector<std::string>& command, size_t pos) {
    if (command.size() <= pos) {
        return Error{ErrorCode::InvalidArgument, "Missing argument for " + command.front()};
    }
    auto id = parse_id(command[pos]);
    if (!id) return Error{ErrorCode::InvalidArgument, "Invalid task id: " + command[pos]};
    return *id;
}

Result<std::string> text_arg(const std::vector<std::string>& command, size_t pos) {
    if (command.size() <= pos || command[pos].empty()) {
        return Error{ErrorCode::InvalidArgument, "Missing argument for " + command.front()};
    }
    return command[pos];
}

// ─────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────

bool is_mutating(const std::string& name) {
    return name == "reprioritize" || name == "approve" || name == "reject"
        || name == "complete" || name == "bootstrap" || name == "generate-spec"
        || name == "add-dependency" || name == "record-tests";
}

int run_command(Orchestrator& orch, const CLIArgs& args) {
    const auto& command = args.command;
    const auto& name = command.front();
    const auto& limits = orch.config().presentation;

    auto needs_project = [&]() -> Result<ProjectId> {
        if (!args.project) return Error{ErrorCode::InvalidArgument, name + " requires --project <id>"};
        return *args.project;
    };

    if (name == "critical-path" || name == "graph" || name == "next-actions"
        || name == "reprioritize" || name == "summary" || name == "bootstrap") {
        auto project = needs_project();
        if (!project) return report(project.error());
        const ProjectId pid = *project;

        if (name == "critical-path") {
            return emit(orch.critical_path(pid), [&](const CriticalPath& p) { return JsonCodec::encode(pid, p); });
        }
        if (name == "graph") {
            return emit(orch.dependency_graph(pid), [](const GraphView& g) { return JsonCodec::encode(g); });
        }
        if (name == "next-actions") {
            return emit(orch.next_actions(pid), [&](const ReadinessReport& r) {
                return JsonCodec::encode(pid, r, limits);
            });
        }
        if (name == "reprioritize") {
            return emit(orch.reprioritize(pid), [&](const ReorderPlan& p) { return JsonCodec::encode(pid, p); });
        }
        if (name == "summary") {
            return emit(orch.status_summary(pid), [](const StatusSummary& s) { return JsonCodec::encode(s); });
        }
        return emit(orch.bootstrap_plan(pid), [](const BootstrapResult& b) { return JsonCodec::encode(b); });
    }

    auto task = task_arg(command, 1);
    if (!task) return report(task.error());

    if (name == "approve") {
        auto who = text_arg(command, 2);
        if (!who) return report(who.error());
        return emit(orch.approve(*task, *who), [](const Task& t) {
            return JsonCodec::encode(LifecycleAction::Approve, t);
        });
    }
    if (name == "reject") {
        auto who = text_arg(command, 2);
        if (!who) return report(who.error());
        auto reason = text_arg(command, 3);
        if (!reason) return report(reason.error());
        return emit(orch.reject(*task, *who, *reason), [](const Task& t) {
            return JsonCodec::encode(LifecycleAction::Reject, t);
        });
    }
    if (name == "complete") {
        return emit(orch.complete(*task), [](const Task& t) {
            return JsonCodec::encode(LifecycleAction::Complete, t);
        });
    }
    if (name == "generate-spec") {
        return emit(orch.generate_spec(*task), [](const Task& t) {
            return Document{{"message", "Specification generated successfully"},
                            {"task_id", t.id},
                            {"spec", t.spec.value_or(Document::object())}};
        });
    }
    if (name == "add-dependency") {
        auto depends_on = task_arg(command, 2);
        if (!depends_on) return report(depends_on.error());
        auto added = orch.add_dependency(*task, *depends_on);
        if (!added) return report(added.error());
        print({{"message", "Dependency created successfully"},
               {"task_id", *task},
               {"depends_on_task_id", *depends_on}});
        return kExitOk;
    }
    if (name == "record-tests") {
        auto raw = text_arg(command, 2);
        if (!raw) return report(raw.error());
        auto results = Document::parse(*raw, nullptr, false);
        if (results.is_discarded()) {
            return report(Error{ErrorCode::InvalidArgument, "Test results are not valid JSON"});
        }
        return emit(orch.record_test_results(*task, std::move(results)), [](const Task& t) {
            return Document{{"task_id", t.id}, {"test_results", t.test_results.value_or(Document::object())}};
        });
    }

    return report(Error{ErrorCode::InvalidArgument, "Unknown command: " + name});
}

// ─────────────────────────────────────────────
// Demo
// ─────────────────────────────────────────────

/**
 * @brief Build a three-task chain (A 2h → B 3h → C 1h), walk task A
 *        through spec, approval, tests and completion, and print each view.
 */
int run_demo(Orchestrator& orch, InMemoryTaskStore& store, Logger& logger) {
    logger.info("=== Demo Mode ===");

    auto project = store.create_project(Project{
        .name = "Demo",
        .description = "Three-step delivery",
        .goal = "Ship a small feature",
        .status = ProjectStatus::InProgress
    });
    if (!project) return report(project.error());
    const ProjectId pid = *project;

    std::vector<TaskId> ids;
    const std::pair<const char*, double> steps[] = {{"A", 2.0}, {"B", 3.0}, {"C", 1.0}};
    for (size_t i = 0; i < std::size(steps); ++i) {
        auto id = orch.create_task(Task{
            .project_id = pid,
            .name = steps[i].first,
            .estimate_hours = steps[i].second,
            .requires_approval = (i == 0),
            .order = static_cast<int32_t>(i)
        });
        if (!id) return report(id.error());
        ids.push_back(*id);
    }
    for (size_t i = 1; i < ids.size(); ++i) {
        if (auto added = orch.add_dependency(ids[i], ids[i - 1]); !added) return report(added.error());
    }

    auto path = orch.critical_path(pid);
    if (!path) return report(path.error());
    print(JsonCodec::encode(pid, *path));

    auto early = orch.complete(ids[0]);
    if (!early) {
        std::cout << "Completing A before tests is refused:\n";
        print(JsonCodec::encode(early.error()));
    }

    auto spec = orch.generate_spec(ids[0]);
    if (!spec) return report(spec.error());
    auto approved = orch.approve(ids[0], "demo-reviewer");
    if (!approved) return report(approved.error());
    print(JsonCodec::encode(LifecycleAction::Approve, *approved));

    auto tested = orch.record_test_results(ids[0], Document{{"status", "passed"}, {"passed", 3}, {"failed", 0}});
    if (!tested) return report(tested.error());
    auto completed = orch.complete(ids[0]);
    if (!completed) return report(completed.error());
    print(JsonCodec::encode(LifecycleAction::Complete, *completed));

    auto readiness = orch.next_actions(pid);
    if (!readiness) return report(readiness.error());
    print(JsonCodec::encode(pid, *readiness, orch.config().presentation));

    auto plan = orch.reprioritize(pid);
    if (!plan) return report(plan.error());
    print(JsonCodec::encode(pid, *plan));

    auto summary = orch.status_summary(pid);
    if (!summary) return report(summary.error());
    print(JsonCodec::encode(*summary));

    logger.info("=== Demo Complete ===");
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) return kExitError;
    auto args = std::move(*parsed);

    if (!args.demo_mode && args.command.empty()) {
        print_usage();
        return kExitError;
    }

    // Load configuration
    auto config = default_config();
    if (std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (!config_result) return report(config_result.error());
        config = *config_result;
    } else {
        std::cerr << "Config file not found: " << args.config_path.string() << '\n'
                  << "Using default configuration." << '\n';
    }
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logging ───────────────────
    const auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    auto make_sink = [&config](const std::string& prefix) -> std::unique_ptr<ILogSink> {
        if (config.telemetry.log_dir.empty()) return std::make_unique<NullSink>();
        return std::make_unique<JsonFileSink>(config.telemetry.log_dir, prefix,
                                              config.telemetry.max_file_size_mb,
                                              config.telemetry.rotate_count);
    };

    // ── Initialize Engine ────────────────────
    auto store = std::make_shared<InMemoryTaskStore>();
    Orchestrator orch(Orchestrator::Options{
        .config = config,
        .store = store,
        .log_sink = make_sink("task_orchestrator"),
        .audit_sink = make_sink("audit"),
        .log_level = level
    });
    auto& logger = orch.logger();

    if (!args.snapshot_path.empty() && std::filesystem::exists(args.snapshot_path)) {
        if (auto loaded = load_snapshot(args.snapshot_path, *store); !loaded) {
            logger.error("Snapshot load failed", loaded.error());
            return report(loaded.error());
        }
        logger.info("Snapshot loaded", {{"path", args.snapshot_path.string()}});
    }

    if (args.demo_mode) {
        return run_demo(orch, *store, logger);
    }

    const int code = run_command(orch, args);

    if (code == kExitOk && is_mutating(args.command.front()) && !args.snapshot_path.empty()) {
        if (auto saved = save_snapshot(args.snapshot_path, *store); !saved) {
            logger.error("Snapshot save failed", saved.error());
            return report(saved.error());
        }
    }
    return code;
}

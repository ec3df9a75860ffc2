/**
 * @file generator.cpp
 * @brief Synthetic project generator: all topology implementations.
 * @author Dimitris Kafetzis
 *
 * Generates projects that model common delivery shapes:
 * - Linear chains (strictly sequential work)
 * - Fan-out/fan-in (parallel work streams joined by an integration step)
 * - Diamond (several fan-out/fan-in stages in a row)
 * - Random DAGs (for stress testing and benchmarking)
 */

#include "workload/generator.hpp"

#include <format>

namespace task_orchestrator {

namespace {

class FixtureBuilder {
public:
    FixtureBuilder(ProjectId project, std::string name, TaskId first_task_id)
        : next_id_(first_task_id) {
        fixture_.project = Project{
            .id = project,
            .name = std::move(name),
            .status = ProjectStatus::InProgress
        };
    }

    TaskId add(std::string name, const TaskTemplate& base) {
        const TaskId id = next_id_++;
        fixture_.tasks.push_back(Task{
            .id = id,
            .project_id = fixture_.project.id,
            .name = std::move(name),
            .estimate_hours = base.estimate_hours,
            .status = base.status,
            .requires_approval = base.requires_approval,
            .order = static_cast<int32_t>(fixture_.tasks.size())
        });
        return id;
    }

    /// `dependent` waits for `prerequisite`.
    void depend(TaskId dependent, TaskId prerequisite) {
        fixture_.dependencies.push_back(TaskDependency{
            .task_id = dependent,
            .depends_on_task_id = prerequisite
        });
    }

    ProjectFixture take() { return std::move(fixture_); }

private:
    ProjectFixture fixture_;
    TaskId next_id_;
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// Linear Chain: T0 → T1 → T2 → ... → Tn-1
// ─────────────────────────────────────────────

ProjectFixture ProjectGenerator::linear_chain(ProjectId project, size_t num_tasks,
                                              TaskTemplate base, TaskId first_task_id) {
    FixtureBuilder builder(project, "Linear Chain", first_task_id);

    TaskId prev_id = 0;
    for (size_t i = 0; i < num_tasks; ++i) {
        auto id = builder.add(std::format("Chain Task {}", i), base);
        if (i > 0) {
            builder.depend(id, prev_id);
        }
        prev_id = id;
    }

    return builder.take();
}

// ─────────────────────────────────────────────
// Fan-out / Fan-in: src → {b_0 .. b_{width-1}} → sink
// ─────────────────────────────────────────────

ProjectFixture ProjectGenerator::fan_out_fan_in(ProjectId project, size_t width,
                                                TaskTemplate base, TaskId first_task_id) {
    FixtureBuilder builder(project, "Fan-Out Fan-In", first_task_id);

    auto src = builder.add("Fan-Out Source", base);

    std::vector<TaskId> branch_ids;
    for (size_t i = 0; i < width; ++i) {
        auto branch = builder.add(std::format("Branch {}", i), base);
        builder.depend(branch, src);
        branch_ids.push_back(branch);
    }

    auto sink = builder.add("Fan-In Sink", base);
    for (auto branch : branch_ids) {
        builder.depend(sink, branch);
    }

    return builder.take();
}

// ─────────────────────────────────────────────
// Diamond: repeated fan-out/fan-in at each depth level.
//
//   hub_0 → {d_0_*} → merge_0 → hub_1 → {d_1_*} → merge_1 ...
// ─────────────────────────────────────────────

ProjectFixture ProjectGenerator::diamond(ProjectId project, size_t depth, size_t width,
                                         TaskTemplate base, TaskId first_task_id) {
    FixtureBuilder builder(project, "Diamond", first_task_id);

    TaskId prev_merge = 0;
    for (size_t d = 0; d < depth; ++d) {
        auto hub = builder.add(std::format("Hub {}", d), base);
        if (d > 0) {
            builder.depend(hub, prev_merge);
        }

        std::vector<TaskId> branch_ids;
        for (size_t w = 0; w < width; ++w) {
            auto branch = builder.add(std::format("Diamond D{} B{}", d, w), base);
            builder.depend(branch, hub);
            branch_ids.push_back(branch);
        }

        auto merge = builder.add(std::format("Merge {}", d), base);
        for (auto branch : branch_ids) {
            builder.depend(merge, branch);
        }
        prev_merge = merge;
    }

    return builder.take();
}

// ─────────────────────────────────────────────
// Random DAG:
// Erdős–Rényi-style edges, only from lower-indexed to higher-indexed
// tasks to guarantee acyclicity.
// ─────────────────────────────────────────────

ProjectFixture ProjectGenerator::random_dag(ProjectId project, size_t num_tasks,
                                            float edge_probability,
                                            double min_hours, double max_hours,
                                            std::mt19937& rng, TaskId first_task_id) {
    FixtureBuilder builder(project, "Random", first_task_id);

    std::uniform_real_distribution<double> hours_dist(min_hours, max_hours);
    std::vector<TaskId> task_ids;
    task_ids.reserve(num_tasks);

    for (size_t i = 0; i < num_tasks; ++i) {
        TaskTemplate base{.estimate_hours = hours_dist(rng)};
        task_ids.push_back(builder.add(std::format("Random Task {}", i), base));
    }

    std::uniform_real_distribution<float> edge_dist(0.0f, 1.0f);
    for (size_t i = 0; i < num_tasks; ++i) {
        for (size_t j = i + 1; j < num_tasks; ++j) {
            if (edge_dist(rng) < edge_probability) {
                builder.depend(task_ids[j], task_ids[i]);
            }
        }
    }

    return builder.take();
}

// ─────────────────────────────────────────────
// Store population
// ─────────────────────────────────────────────

Result<void> ProjectGenerator::populate(const ProjectFixture& fixture, ITaskStore& store) {
    auto project = store.create_project(fixture.project);
    if (!project) return project.error();

    for (const auto& task : fixture.tasks) {
        auto created = store.create_task(task);
        if (!created) return created.error();
    }
    for (const auto& dep : fixture.dependencies) {
        if (auto saved = store.save_dependency(dep); !saved) return saved;
    }
    return Result<void>{};
}

}  // namespace task_orchestrator

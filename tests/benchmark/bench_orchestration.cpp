/**
 * @file bench_orchestration.cpp
 * @brief Performance benchmarks for graph construction and project analyses.
 * @author Dimitris Kafetzis
 *
 * Measures the per-request cost of rebuilding a project's dependency graph
 * and running the analyses on top of it, from small chains to dense
 * random projects.
 *
 * Usage: ./bench_orchestration [--csv]
 */

#include "core/config.hpp"
#include "core/types.hpp"
#include "graph/dependency_graph.hpp"
#include "orchestrator/orchestrator.hpp"
#include "scheduler/critical_path.hpp"
#include "scheduler/prioritizer.hpp"
#include "scheduler/readiness.hpp"
#include "storage/in_memory_store.hpp"
#include "workload/generator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace task_orchestrator;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

DependencyGraph build_graph(const ProjectFixture& fixture) {
    auto graph = GraphBuilder{}.build(fixture.project.id, fixture.tasks, fixture.dependencies);
    if (!graph) {
        std::cerr << "graph build failed: " << graph.error().message << "\n";
        return DependencyGraph{};
    }
    return std::move(graph).value();
}

std::string shape(const ProjectFixture& fixture) {
    return std::to_string(fixture.tasks.size()) + "T/" + std::to_string(fixture.dependencies.size()) + "E";
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_graph() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;
    GraphBuilder builder;

    for (size_t n : {10, 100, 1000}) {
        auto fixture = ProjectGenerator::linear_chain(1, n);
        R.push_back(run_bench("build_chain(" + std::to_string(n) + ")", "Graph Build", N,
            [&]{ auto g = builder.build(1, fixture.tasks, fixture.dependencies); (void)g; },
            shape(fixture)));
    }

    std::mt19937 rng(42);
    for (size_t n : {100, 500}) {
        auto fixture = ProjectGenerator::random_dag(1, n, 0.05f, 0.5, 8.0, rng);
        R.push_back(run_bench("build_random(" + std::to_string(n) + ")", "Graph Build", N,
            [&]{ auto g = builder.build(1, fixture.tasks, fixture.dependencies); (void)g; },
            shape(fixture)));

        auto graph = build_graph(fixture);
        R.push_back(run_bench("topo_order(" + std::to_string(n) + ")", "Graph Build", N,
            [&]{ auto o = graph.topological_order(); (void)o; }, shape(fixture)));
    }

    return R;
}

std::vector<BenchResult> bench_analyses() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;
    CriticalPathAnalyzer analyzer;
    ReadinessClassifier classifier;
    Prioritizer prioritizer;

    std::mt19937 rng(7);
    std::vector<std::pair<std::string, ProjectFixture>> projects;
    projects.emplace_back("chain(200)", ProjectGenerator::linear_chain(1, 200));
    projects.emplace_back("fan(200)", ProjectGenerator::fan_out_fan_in(1, 200));
    projects.emplace_back("diamond(10x20)", ProjectGenerator::diamond(1, 10, 20));
    projects.emplace_back("random(500)", ProjectGenerator::random_dag(1, 500, 0.05f, 0.5, 8.0, rng));

    for (auto& [label, fixture] : projects) {
        auto graph = build_graph(fixture);
        R.push_back(run_bench("critical_path/" + label, "Analyses", N,
            [&]{ auto p = analyzer.analyze(graph); (void)p; }, shape(fixture)));
        R.push_back(run_bench("readiness/" + label, "Analyses", N,
            [&]{ auto r = classifier.classify(graph); (void)r; }, shape(fixture)));

        // Shuffle statuses so the prioritizer has real work to do.
        std::vector<Task> tasks = fixture.tasks;
        for (auto& task : tasks) {
            task.status = kAllTaskStatuses[rng() % std::size(kAllTaskStatuses)];
        }
        R.push_back(run_bench("reprioritize_plan/" + label, "Analyses", N,
            [&]{ auto p = prioritizer.plan(tasks); (void)p; }, shape(fixture)));
    }

    return R;
}

std::vector<BenchResult> bench_facade() {
    std::vector<BenchResult> R;
    constexpr size_t N = 200;

    auto store = std::make_shared<InMemoryTaskStore>();
    std::mt19937 rng(11);
    auto fixture = ProjectGenerator::random_dag(1, 300, 0.05f, 0.5, 8.0, rng);
    if (auto ok = ProjectGenerator::populate(fixture, *store); !ok) {
        std::cerr << "populate failed: " << ok.error().message << "\n";
        return R;
    }

    Orchestrator orch(Orchestrator::Options{.config = default_config(), .store = store});
    const auto info = shape(fixture);

    R.push_back(run_bench("critical_path(300)", "Facade (store + graph)", N,
        [&]{ auto p = orch.critical_path(1); (void)p; }, info));
    R.push_back(run_bench("next_actions(300)", "Facade (store + graph)", N,
        [&]{ auto r = orch.next_actions(1); (void)r; }, info));
    R.push_back(run_bench("status_summary(300)", "Facade (store + graph)", N,
        [&]{ auto s = orch.status_summary(1); (void)s; }, info));
    R.push_back(run_bench("reprioritize(300)", "Facade (store + graph)", N,
        [&]{ auto p = orch.reprioritize(1); (void)p; }, info));

    return R;
}

// ─────────────────────────────────────────────
// Main
// ─────────────────────────────────────────────

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  TaskOrchestrator Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_graph());
    append(bench_analyses());
    append(bench_facade());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}

/**
 * @file snapshot.cpp
 * @brief Snapshot import/export.
 * @author Dimitris Kafetzis
 */

#include "storage/snapshot.hpp"

#include <fstream>

namespace task_orchestrator {

Result<void> import_snapshot(const Document& snapshot, InMemoryTaskStore& store) {
    if (!snapshot.is_object()) {
        return Error{ErrorCode::InvalidArgument, "Snapshot must be a JSON object"};
    }

    // Projects first: tasks reference them, edges reference tasks.
    for (const auto& entry : snapshot.value("projects", Document::array())) {
        auto project = project_from_json(entry);
        if (!project) return project.error();
        if (auto created = store.create_project(std::move(*project)); !created) {
            return created.error();
        }
    }

    for (const auto& entry : snapshot.value("tasks", Document::array())) {
        auto task = task_from_json(entry);
        if (!task) return task.error();
        if (auto created = store.create_task(std::move(*task)); !created) {
            return created.error();
        }
    }

    for (const auto& entry : snapshot.value("dependencies", Document::array())) {
        auto dep = dependency_from_json(entry);
        if (!dep) return dep.error();
        if (auto saved = store.save_dependency(*dep); !saved) {
            return saved.error();
        }
    }

    return Result<void>{};
}

Document export_snapshot(const InMemoryTaskStore& store) {
    return Document{
        {"projects", store.all_projects()},
        {"tasks", store.all_tasks()},
        {"dependencies", store.all_dependencies()}
    };
}

Result<void> load_snapshot(const std::filesystem::path& path, InMemoryTaskStore& store) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::StorageFailure, "Cannot open snapshot: " + path.string()};
    }

    auto doc = Document::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::InvalidArgument, "Snapshot is not valid JSON: " + path.string()};
    }
    return import_snapshot(doc, store);
}

Result<void> save_snapshot(const std::filesystem::path& path, const InMemoryTaskStore& store) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::StorageFailure, "Cannot write snapshot: " + path.string()};
    }
    out << export_snapshot(store).dump(2) << '\n';
    if (!out) {
        return Error{ErrorCode::StorageFailure, "Failed writing snapshot: " + path.string()};
    }
    return Result<void>{};
}

}  // namespace task_orchestrator

/**
 * @file snapshot.hpp
 * @brief JSON snapshot files for the in-memory store.
 * @author Dimitris Kafetzis
 *
 * Format:
 *   {"projects": [...], "tasks": [...], "dependencies": [...]}
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/in_memory_store.hpp"

#include <filesystem>

namespace task_orchestrator {

/// Populate `store` from a parsed snapshot document.
Result<void> import_snapshot(const Document& snapshot, InMemoryTaskStore& store);

[[nodiscard]] Document export_snapshot(const InMemoryTaskStore& store);

Result<void> load_snapshot(const std::filesystem::path& path, InMemoryTaskStore& store);
Result<void> save_snapshot(const std::filesystem::path& path, const InMemoryTaskStore& store);

}  // namespace task_orchestrator

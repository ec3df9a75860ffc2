/**
 * @file config.hpp
 * @brief Orchestrator configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace task_orchestrator {

struct EngineConfig {
    double default_duration_hours = 1.0;   ///< Used when a task has no estimate
};

struct DependencyConfig {
    bool reject_cycles = false;            ///< Reject cycle-forming edges at creation
};

/// Display limits; the engine itself always returns complete lists.
struct PresentationConfig {
    uint32_t actionable_limit = 5;
    uint32_t blocked_limit = 5;
    uint32_t summary_actions_limit = 3;
};

struct AdvisorConfig {
    std::string mode = "fallback";         ///< "fallback" or "model"
    std::string model = "gpt-4";
    double temperature = 0.7;
    uint32_t max_tokens = 4096;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    EngineConfig engine;
    DependencyConfig dependencies;
    PresentationConfig presentation;
    AdvisorConfig advisor;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing tables and keys keep their defaults. Values that cannot be used
 * (non-positive default duration, unknown advisor mode or log level) are
 * reported as ErrorCode::ConfigError.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Check cross-field constraints on an already-populated Config.
 */
Result<void> validate_config(const Config& config);

}  // namespace task_orchestrator

/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

namespace task_orchestrator {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    Config config;

    try {
        auto tbl = toml::parse_file(path.string());

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            config.engine.default_duration_hours =
                engine["default_duration_hours"].value_or(1.0);
        }

        // [dependencies]
        if (auto deps = tbl["dependencies"]; deps.is_table()) {
            config.dependencies.reject_cycles = deps["reject_cycles"].value_or(false);
        }

        // [presentation]
        if (auto pres = tbl["presentation"]; pres.is_table()) {
            config.presentation.actionable_limit = static_cast<uint32_t>(
                pres["actionable_limit"].value_or(int64_t{5}));
            config.presentation.blocked_limit = static_cast<uint32_t>(
                pres["blocked_limit"].value_or(int64_t{5}));
            config.presentation.summary_actions_limit = static_cast<uint32_t>(
                pres["summary_actions_limit"].value_or(int64_t{3}));
        }

        // [advisor]
        if (auto advisor = tbl["advisor"]; advisor.is_table()) {
            config.advisor.mode = advisor["mode"].value_or(std::string{"fallback"});
            config.advisor.model = advisor["model"].value_or(std::string{"gpt-4"});
            config.advisor.temperature = advisor["temperature"].value_or(0.7);
            config.advisor.max_tokens = static_cast<uint32_t>(
                advisor["max_tokens"].value_or(int64_t{4096}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    if (!(config.engine.default_duration_hours > 0.0)) {
        return Error{ErrorCode::ConfigError,
                     "engine.default_duration_hours must be positive"};
    }
    if (config.advisor.mode != "fallback" && config.advisor.mode != "model") {
        return Error{ErrorCode::ConfigError,
                     "advisor.mode must be \"fallback\" or \"model\", got \""
                     + config.advisor.mode + "\""};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::ConfigError,
                     "Unknown telemetry.log_level \"" + config.telemetry.log_level + "\""};
    }
    return Result<void>{};
}

}  // namespace task_orchestrator

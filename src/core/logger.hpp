/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 * @author Dimitris Kafetzis
 *
 * Provides ILogSink (virtual interface for runtime-configurable log
 * destinations) and a thread-safe Logger front-end that emits one JSON
 * object per line. Structured fields ride along as a JSON object.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace task_orchestrator {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// ILogSink
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * Each line carries `level`, `ts`, `component` (when set), `msg` and an
 * optional `fields` object.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info,
                    std::string component = {});

    void debug(std::string_view message, const nlohmann::json& fields = {});
    void info(std::string_view message, const nlohmann::json& fields = {});
    void warn(std::string_view message, const nlohmann::json& fields = {});
    void error(std::string_view message, const nlohmann::json& fields = {});

    /// Log an Error with its code attached as a field.
    void error(std::string_view context, const Error& err);

    void log(LogLevel level, std::string_view message, const nlohmann::json& fields = {});
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::string component_;
    mutable std::mutex mutex_;
};

}  // namespace task_orchestrator

/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, stdout, discard.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace task_orchestrator {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * The active file is `<prefix>.ndjson`. When it reaches the size limit it
 * is renamed to `<prefix>.1.ndjson`, older files shift up by one, and
 * anything beyond `max_files` is removed.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;

    /// Byte-level limit, for callers that need finer control than MB.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
    std::mutex mutex_;
};

/**
 * @brief Writes to stdout.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output. Used by benchmarks and quiet CLI runs.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace task_orchestrator

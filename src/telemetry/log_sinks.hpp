/**
 * @file log_sinks.hpp
 * @brief NDJSON file sink with size-based rotation, stderr and null sinks.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace gantt_engine {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * The live file is `<prefix>.ndjson`. When it reaches the size limit it is
 * renamed to `<prefix>.1.ndjson`, older files move up by one, and anything
 * beyond `max_files` rotated files is deleted.
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
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    /// Byte limit override; lets tests rotate without writing megabytes.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    void open_current();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stderr, keeping stdout free for command output.
 */
class StderrSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output, used by benchmarks.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/// File sink under `log_dir` when one is configured, stderr otherwise.
[[nodiscard]] std::unique_ptr<ILogSink> make_log_sink(const LoggingConfig& config,
                                                      const std::string& prefix);

}  // namespace gantt_engine

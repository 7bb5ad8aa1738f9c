/**
 * @file log_sinks.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/log_sinks.hpp"

#include <iostream>
#include <system_error>

namespace gantt_engine {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                           const std::string& prefix,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(uint64_t{max_file_size_mb} * 1024 * 1024)
    , max_files_(max_files) {
    std::filesystem::create_directories(log_dir_);
    open_current();
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::current_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

std::filesystem::path JsonFileSink::rotated_path(uint32_t index) const {
    return log_dir_ / (prefix_ + "." + std::to_string(index) + ".ndjson");
}

void JsonFileSink::open_current() {
    const auto path = current_path();
    std::error_code ec;
    const auto existing = std::filesystem::file_size(path, ec);
    current_size_ = ec ? 0 : existing;
    current_file_.open(path, std::ios::app);
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed();
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed() {
    if (current_size_ < max_file_size_bytes_) return;

    current_file_.close();

    // Rotation errors are ignored; the live file is always reopened.
    std::error_code ec;
    if (max_files_ == 0) {
        std::filesystem::remove(current_path(), ec);
    } else {
        std::filesystem::remove(rotated_path(max_files_), ec);
        for (uint32_t i = max_files_; i > 1; --i) {
            if (std::filesystem::exists(rotated_path(i - 1), ec)) {
                std::filesystem::rename(rotated_path(i - 1), rotated_path(i), ec);
            }
        }
        std::filesystem::rename(current_path(), rotated_path(1), ec);
    }

    open_current();
}

// ── StderrSink ───────────────────────────────

void StderrSink::write(std::string_view json_line) {
    std::cerr << json_line << '\n';
}

void StderrSink::flush() {
    std::cerr.flush();
}

std::unique_ptr<ILogSink> make_log_sink(const LoggingConfig& config, const std::string& prefix) {
    if (config.log_dir.empty()) {
        return std::make_unique<StderrSink>();
    }
    return std::make_unique<JsonFileSink>(config.log_dir, prefix,
                                          config.max_file_size_mb, config.rotate_count);
}

}  // namespace gantt_engine

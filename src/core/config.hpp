/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace gantt_engine {

struct SchedulingConfig {
    int64_t default_duration_days = 1;    ///< CPM duration of unscheduled tasks
    DependencyMode default_dependency_mode = DependencyMode::Flexible;
};

struct SequencerConfig {
    double renormalize_gap = 1.0;         ///< Key spacing after renormalization
    int precision_digits = 9;             ///< Decimal places a stored key keeps
};

struct LoggingConfig {
    std::filesystem::path log_dir;        ///< Empty = stderr
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level engine configuration.
 */
struct EngineConfig {
    SchedulingConfig scheduling;
    SequencerConfig sequencer;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<EngineConfig> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<EngineConfig> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
EngineConfig default_config();

}  // namespace gantt_engine

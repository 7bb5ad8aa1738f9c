/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <cmath>

namespace gantt_engine {

namespace {

Result<EngineConfig> from_table(const toml::table& tbl) {
    EngineConfig config;

    // [scheduling]
    if (auto scheduling = tbl["scheduling"]; scheduling.is_table()) {
        config.scheduling.default_duration_days =
            scheduling["default_duration_days"].value_or(int64_t{1});
        if (config.scheduling.default_duration_days <= 0) {
            return Error{ErrorCode::ConfigError,
                         "scheduling.default_duration_days must be positive"};
        }

        auto mode_text = scheduling["default_dependency_mode"].value_or(std::string{"Flexible"});
        auto mode = parse_dependency_mode(mode_text);
        if (!mode) {
            return Error{ErrorCode::ConfigError, "Unknown dependency mode: " + mode_text};
        }
        config.scheduling.default_dependency_mode = *mode;
    }

    // [sequencer]
    if (auto sequencer = tbl["sequencer"]; sequencer.is_table()) {
        config.sequencer.renormalize_gap = sequencer["renormalize_gap"].value_or(1.0);
        config.sequencer.precision_digits = static_cast<int>(
            sequencer["precision_digits"].value_or(int64_t{9}));
        if (config.sequencer.renormalize_gap <= 0.0) {
            return Error{ErrorCode::ConfigError, "sequencer.renormalize_gap must be positive"};
        }
        if (config.sequencer.precision_digits < 1 || config.sequencer.precision_digits > 15) {
            return Error{ErrorCode::ConfigError, "sequencer.precision_digits must be in [1, 15]"};
        }
        // Renormalized neighbours must stay two rounding steps apart so the
        // retried midpoint has room.
        const double min_gap = 2.0 * std::pow(10.0, -config.sequencer.precision_digits);
        if (config.sequencer.renormalize_gap < min_gap) {
            return Error{ErrorCode::ConfigError,
                         "sequencer.renormalize_gap is below two steps of precision_digits"};
        }
    }

    // [logging]
    if (auto logging = tbl["logging"]; logging.is_table()) {
        config.logging.log_dir = logging["log_dir"].value_or(std::string{});
        config.logging.log_level = logging["log_level"].value_or(std::string{"info"});
        config.logging.max_file_size_mb = static_cast<uint32_t>(
            logging["max_file_size_mb"].value_or(int64_t{50}));
        config.logging.rotate_count = static_cast<uint32_t>(
            logging["rotate_count"].value_or(int64_t{5}));
        if (!parse_log_level(config.logging.log_level)) {
            return Error{ErrorCode::ConfigError, "Unknown log level: " + config.logging.log_level};
        }
    }

    return config;
}

}  // anonymous namespace

Result<EngineConfig> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<EngineConfig> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

EngineConfig default_config() {
    return EngineConfig{};
}

}  // namespace gantt_engine

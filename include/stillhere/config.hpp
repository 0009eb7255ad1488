#pragma once

/**
 * @file config.hpp
 * @brief Loading the server Config from JSON and the environment
 */

#include "stillhere/logger.hpp"
#include "stillhere/stillhere.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace stillhere {

/**
 * @brief Build a Config from a parsed JSON object
 *
 * Missing keys keep their defaults, unknown keys are ignored. Wrong types or
 * out-of-range values yield ConfigurationError.
 */
[[nodiscard]] Result<Config> config_from_json(const nlohmann::json& j);

/**
 * @brief Read and parse a JSON configuration file
 */
[[nodiscard]] Result<Config> load_config(const std::string& path);

/**
 * @brief Apply STILLHERE_HOST, STILLHERE_PORT, STILLHERE_POLL_INTERVAL,
 * LOG_LEVEL and DEBUG from the environment
 *
 * Unparseable values are logged and ignored.
 */
void apply_env_overrides(Config& config);

/// Effective log level for a config (debug forces Debug)
[[nodiscard]] Logger::Level effective_log_level(const Config& config);

}  // namespace stillhere

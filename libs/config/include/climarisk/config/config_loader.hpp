/**
 * @file config_loader.hpp
 * @brief Build an EngineConfig from an env file and process environment.
 * @author Watosn
 */
#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>

#include "climarisk/config/engine_config.hpp"

namespace climarisk::config {

/**
 * @brief Loaded configuration plus load/validation status.
 */
struct LoadedConfig {
  EngineConfig config{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Lookup function for environment-style variables.
 *
 * Returns nullptr when the key is unset.
 */
using EnvLookup = const char* (*)(const char*);

inline const char* process_environment(const char* key) { return std::getenv(key); }

/**
 * @brief Load configuration from defaults, then `env_file`, then the environment.
 *
 * Recognized keys: THRESHOLDS_HI_HOT_C, THRESHOLDS_HI_UNCOMF_C,
 * THRESHOLDS_WCT_COLD_C, THRESHOLDS_WIND_MS, THRESHOLDS_RAIN_MM_PER_H,
 * COVERAGE_MIN_YEARS, COVERAGE_MIN_SAMPLES, TREND_MIN_YEARS,
 * TREND_SIGNIFICANCE, CONFIDENCE_LEVEL. Keys are case-insensitive.
 *
 * @param env_file Optional `KEY=VALUE` file; an empty path skips it.
 * @param lookup Environment lookup; nullptr disables environment overrides.
 * @return Config with `status` set. The result is validated before returning.
 */
[[nodiscard]] LoadedConfig load_engine_config(const std::filesystem::path& env_file = {},
                                              EnvLookup lookup = &process_environment);

}  // namespace climarisk::config

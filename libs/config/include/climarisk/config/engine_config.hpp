/**
 * @file engine_config.hpp
 * @brief Immutable threshold/coverage/trend configuration for the risk engine.
 * @author Watosn
 */
#pragma once

#include <string>

#include "climarisk/core/types.hpp"

namespace climarisk::config {

/**
 * @brief Exceedance thresholds, one per condition.
 */
struct ThresholdConfig {
  double hot_c{41.0};
  double uncomfortable_c{32.0};
  double cold_c{-10.0};
  double wind_ms{10.8};
  double wet_mm_per_h{4.0};
};

/**
 * @brief Minimum data coverage required before a probability is reported.
 */
struct CoverageConfig {
  int min_years{15};
  int min_samples{8};
};

/**
 * @brief Trend fitting requirements.
 */
struct TrendConfig {
  int min_years{3};
  double significance{0.05};
};

/**
 * @brief Full configuration passed to the risk engine at call time.
 */
struct EngineConfig {
  ThresholdConfig thresholds{};
  CoverageConfig coverage{};
  TrendConfig trend{};
  double confidence_level{0.95};
};

/**
 * @brief Outcome of a structural configuration check.
 */
struct ValidationResult {
  core::Status status{core::Status::Ok};
  std::string message{};

  [[nodiscard]] bool ok() const noexcept { return status == core::Status::Ok; }
};

/**
 * @brief Check thresholds for NaN/infinite values and inverted hot/cold ordering.
 */
[[nodiscard]] ValidationResult validate(const ThresholdConfig& thresholds);

/**
 * @brief Check thresholds, coverage limits, trend settings and confidence level.
 */
[[nodiscard]] ValidationResult validate(const EngineConfig& config);

}  // namespace climarisk::config

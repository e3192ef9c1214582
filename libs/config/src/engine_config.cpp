/**
 * @file engine_config.cpp
 * @brief Structural validation of engine configuration.
 * @author Watosn
 */

#include "climarisk/config/engine_config.hpp"

#include <cmath>
#include <utility>

#include <fmt/format.h>

namespace climarisk::config {
namespace {

ValidationResult invalid(std::string message) {
  return ValidationResult{.status = core::Status::InvalidInput, .message = std::move(message)};
}

}  // namespace

ValidationResult validate(const ThresholdConfig& t) {
  const struct {
    const char* name;
    double value;
  } values[] = {{"hot_c", t.hot_c},
                {"uncomfortable_c", t.uncomfortable_c},
                {"cold_c", t.cold_c},
                {"wind_ms", t.wind_ms},
                {"wet_mm_per_h", t.wet_mm_per_h}};
  for (const auto& v : values) {
    if (!std::isfinite(v.value)) {
      return invalid(fmt::format("threshold {} is not finite", v.name));
    }
  }
  if (t.cold_c >= t.hot_c) {
    return invalid(fmt::format("cold threshold {} must be below hot threshold {}", t.cold_c, t.hot_c));
  }
  if (t.cold_c >= t.uncomfortable_c) {
    return invalid(
        fmt::format("cold threshold {} must be below uncomfortable threshold {}", t.cold_c, t.uncomfortable_c));
  }
  if (t.wind_ms <= 0.0) {
    return invalid(fmt::format("wind threshold must be positive, got {}", t.wind_ms));
  }
  if (t.wet_mm_per_h <= 0.0) {
    return invalid(fmt::format("precipitation threshold must be positive, got {}", t.wet_mm_per_h));
  }
  return {};
}

ValidationResult validate(const EngineConfig& config) {
  if (auto r = validate(config.thresholds); !r.ok()) {
    return r;
  }
  if (config.coverage.min_years < 1 || config.coverage.min_samples < 1) {
    return invalid(fmt::format("coverage minimums must be >= 1 (years={}, samples={})", config.coverage.min_years,
                               config.coverage.min_samples));
  }
  if (config.trend.min_years < 3) {
    return invalid(fmt::format("trend fit needs at least 3 years, got {}", config.trend.min_years));
  }
  if (!(config.trend.significance > 0.0 && config.trend.significance < 1.0)) {
    return invalid(fmt::format("trend significance must lie in (0, 1), got {}", config.trend.significance));
  }
  if (!(config.confidence_level > 0.0 && config.confidence_level < 1.0)) {
    return invalid(fmt::format("confidence level must lie in (0, 1), got {}", config.confidence_level));
  }
  return {};
}

}  // namespace climarisk::config

/**
 * @file comfort_indices.hpp
 * @brief Heat index and wind chill with validity-domain flags.
 * @author Watosn
 */
#pragma once

#include <Eigen/Dense>

#include "climarisk/core/types.hpp"

namespace climarisk::indices {

namespace constants {

// Heat index regression domain: 80 F and 40 % RH.
inline constexpr double kHeatIndexMinTemperatureC = 26.7;
inline constexpr double kHeatIndexMinHumidityPct = 40.0;
// NWS wind chill domain: 50 F and ~3 mph.
inline constexpr double kWindChillMaxTemperatureC = 10.0;
inline constexpr double kWindChillMinWindMs = 1.3;

}  // namespace constants

/**
 * @brief Scalar index value with its validity flag.
 */
struct IndexValue {
  double value_c{};
  bool valid{};
};

/**
 * @brief Array-valued index evaluation.
 */
struct IndexArray {
  Eigen::ArrayXd value_c{};
  Eigen::Array<bool, Eigen::Dynamic, 1> valid{};
};

/**
 * @brief NWS heat index (Steadman simple form blended into the Rothfusz regression).
 *
 * The simple form is used while its average with air temperature stays below
 * 80 F (the NWS switch rule); above that the full Rothfusz regression with the
 * low/high humidity adjustments applies. This differs from switching on the
 * simple value alone only for T in roughly (80, 80.4] F near 40 % RH. The value is defined everywhere. `valid` is true when
 * temperature >= 26.7 C and humidity >= 40 % (both closed).
 *
 * @param temperature_c Air temperature [C].
 * @param relative_humidity_pct Relative humidity [%], clamped to [0, 100].
 */
[[nodiscard]] IndexValue heat_index(double temperature_c, double relative_humidity_pct) noexcept;

/**
 * @brief NWS (2001) wind chill temperature.
 *
 * `valid` is true when temperature <= 10 C and a finite wind >= 1.3 m/s (both
 * closed). Negative or non-finite wind speeds are floored at 0 before the power
 * term, which makes the formula collapse to `35.74 + 0.6215 T[F]` with no NaN;
 * such values are never valid.
 *
 * @param temperature_c Air temperature [C].
 * @param wind_speed_ms Wind speed [m/s].
 */
[[nodiscard]] IndexValue wind_chill(double temperature_c, double wind_speed_ms) noexcept;

/**
 * @brief Heat index evaluated element-wise.
 * @note Inputs must have equal length; the shorter length is used otherwise.
 */
[[nodiscard]] IndexArray heat_index(const Eigen::ArrayXd& temperature_c, const Eigen::ArrayXd& relative_humidity_pct);

/**
 * @brief Wind chill evaluated element-wise.
 * @note Inputs must have equal length; the shorter length is used otherwise.
 */
[[nodiscard]] IndexArray wind_chill(const Eigen::ArrayXd& temperature_c, const Eigen::ArrayXd& wind_speed_ms);

/**
 * @brief Both indices for one sample.
 */
[[nodiscard]] core::DerivedIndices derive(const core::Sample& sample) noexcept;

/**
 * @brief "Feels like" temperature.
 *
 * Heat index when valid, else wind chill when valid, else air temperature.
 */
[[nodiscard]] double feels_like(const core::Sample& sample, const core::DerivedIndices& derived) noexcept;

}  // namespace climarisk::indices

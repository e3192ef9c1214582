/**
 * @file trend.hpp
 * @brief Year-over-year exceedance trend via ordinary least squares.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

#include "climarisk/config/engine_config.hpp"
#include "climarisk/core/types.hpp"

namespace climarisk::stats {

enum class TrendDirection : std::uint8_t { Increasing, Decreasing, NoSignificantTrend, InsufficientData };

constexpr std::string_view trend_direction_name(const TrendDirection d) {
  switch (d) {
    case TrendDirection::Increasing:
      return "increasing";
    case TrendDirection::Decreasing:
      return "decreasing";
    case TrendDirection::NoSignificantTrend:
      return "no_significant_trend";
    case TrendDirection::InsufficientData:
      return "insufficient_data";
  }
  return "unknown";
}

/**
 * @brief Trend fit of the yearly exceedance rate for one condition.
 *
 * `slope_per_decade` is in percentage points per decade and, together with
 * `p_value`, `intercept` and `r_squared`, is empty when fewer than
 * `TrendConfig::min_years` years have samples.
 */
struct TrendResult {
  core::Condition condition{core::Condition::VeryHot};
  std::map<int, double> yearly_rates{};
  std::map<int, int> yearly_samples{};
  std::optional<double> slope_per_decade{};
  std::optional<double> p_value{};
  std::optional<double> intercept{};
  std::optional<double> r_squared{};
  TrendDirection direction{TrendDirection::InsufficientData};
  core::Status status{core::Status::Ok};

  [[nodiscard]] bool insufficient_data() const noexcept { return direction == TrendDirection::InsufficientData; }
};

/**
 * @brief Fit a line to `rate ~ year` and classify its direction.
 *
 * The p-value is the two-sided OLS t-test of the slope with n-2 degrees of
 * freedom. `NoSignificantTrend` is reported when the p-value exceeds
 * `config.significance` or the slope is exactly zero.
 */
[[nodiscard]] TrendResult fit_trend(const std::map<int, double>& yearly_rates, const config::TrendConfig& config);

/**
 * @brief Group one condition's flags by local year and fit the trend.
 *
 * `flags` must be index-aligned with `samples`. Years without samples never
 * appear in the regression.
 */
[[nodiscard]] TrendResult estimate_trend(const core::SampleSet& samples,
                                         const std::vector<core::ConditionFlags>& flags,
                                         core::Condition condition,
                                         const config::TrendConfig& config);

}  // namespace climarisk::stats

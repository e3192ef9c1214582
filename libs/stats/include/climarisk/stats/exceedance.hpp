/**
 * @file exceedance.hpp
 * @brief Exceedance probability with exact Clopper-Pearson confidence interval.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <vector>

#include "climarisk/core/types.hpp"

namespace climarisk::stats {

/**
 * @brief Two-sided binomial confidence interval.
 */
struct ConfidenceInterval {
  double lower{0.0};
  double upper{1.0};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Point estimate and interval for one condition.
 */
struct ProbabilityResult {
  double point_estimate{};
  double ci_lower{};
  double ci_upper{1.0};
  double confidence_level{0.95};
  std::size_t positive_count{};
  std::size_t total_count{};
  core::Status status{core::Status::Ok};

  [[nodiscard]] double ci_width() const noexcept { return ci_upper - ci_lower; }

  /**
   * @brief Half interval width over the point estimate; +inf when the estimate is 0.
   */
  [[nodiscard]] double relative_error() const noexcept;
};

/**
 * @brief Exact Clopper-Pearson interval from Beta quantiles.
 *
 * lower = Beta^-1(alpha/2; k, n-k+1) for k > 0, else exactly 0.
 * upper = Beta^-1(1-alpha/2; k+1, n-k) for k < n, else exactly 1.
 * n = 0 gives [0, 1]. k > n or a confidence level outside (0, 1) gives
 * `Status::InvalidInput` and [0, 1].
 */
[[nodiscard]] ConfidenceInterval clopper_pearson(std::size_t successes, std::size_t trials, double confidence_level = 0.95);

/**
 * @brief Estimate from counts.
 */
[[nodiscard]] ProbabilityResult estimate(std::size_t positive_count, std::size_t total_count,
                                         double confidence_level = 0.95);

/**
 * @brief Estimate from one condition's flag sequence.
 */
[[nodiscard]] ProbabilityResult estimate(const std::vector<bool>& flags, double confidence_level = 0.95);

}  // namespace climarisk::stats

/**
 * @file coverage.hpp
 * @brief Sample coverage adequacy check.
 * @author Watosn
 */
#pragma once

#include <map>

#include "climarisk/config/engine_config.hpp"
#include "climarisk/core/types.hpp"

namespace climarisk::stats {

/**
 * @brief Coverage of a sample set in distinct local years and total samples.
 */
struct CoverageReport {
  int distinct_years{};
  int total_samples{};
  bool adequate{};
  bool meets_years{};
  bool meets_samples{};
  int min_years{};
  int min_samples{};
  /// 0.5 * years / min_years + 0.5 * samples / min_samples.
  double adequacy_score{};
  std::map<int, int> samples_per_year{};
};

/**
 * @brief Count distinct local years and samples, and compare with the minimums.
 *
 * `adequate = distinct_years >= min_years && total_samples >= min_samples`.
 */
[[nodiscard]] CoverageReport validate_coverage(const core::SampleSet& samples, const config::CoverageConfig& config);

}  // namespace climarisk::stats

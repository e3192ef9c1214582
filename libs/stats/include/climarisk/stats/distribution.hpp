/**
 * @file distribution.hpp
 * @brief Histogram and descriptive statistics of sample variables.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "climarisk/config/engine_config.hpp"
#include "climarisk/core/types.hpp"

namespace climarisk::stats {

struct HistogramBin {
  double lower_bound{};
  double upper_bound{};
  int count{};
  double frequency{};
};

/**
 * @brief Distribution summary of one variable.
 */
struct Distribution {
  std::string parameter{};
  std::string unit{};
  std::vector<HistogramBin> bins{};
  std::size_t sample_count{};
  double mean{};
  double median{};
  double std_dev{};
  std::optional<double> threshold{};
};

/**
 * @brief Summarize values, dropping non-finite entries.
 *
 * Bins are half-open `[lo, hi)` except the last, which is closed. When
 * `threshold` lies strictly inside the data range it becomes a bin edge, with
 * `n_bins / 2` bins on each side. `std_dev` uses n-1 and is 0 for fewer than
 * two values.
 */
[[nodiscard]] Distribution summarize(std::string parameter,
                                     std::string unit,
                                     const Eigen::ArrayXd& values,
                                     std::optional<double> threshold = std::nullopt,
                                     int n_bins = 20);

/**
 * @brief Summaries for temperature, humidity, wind, precipitation, heat index and wind chill.
 */
[[nodiscard]] std::vector<Distribution> build_distributions(const core::SampleSet& samples,
                                                            const config::ThresholdConfig& thresholds,
                                                            int n_bins = 20);

}  // namespace climarisk::stats

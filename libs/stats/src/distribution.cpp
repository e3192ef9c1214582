/**
 * @file distribution.cpp
 * @brief Histogram/descriptive statistics implementation.
 * @author Watosn
 */

#include "climarisk/stats/distribution.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <utility>

#include "climarisk/indices/comfort_indices.hpp"

namespace climarisk::stats {
namespace {

std::vector<double> linspace(const double lo, const double hi, const int count) {
  std::vector<double> out(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    out[static_cast<std::size_t>(i)] =
        (i == count - 1) ? hi : lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(count - 1);
  }
  return out;
}

std::vector<double> bin_edges(const double lo, const double hi, const std::optional<double>& threshold, const int n_bins) {
  if (threshold && *threshold > lo && *threshold < hi && n_bins >= 2) {
    auto edges = linspace(lo, *threshold, n_bins / 2 + 1);
    const auto upper = linspace(*threshold, hi, n_bins / 2 + 1);
    edges.insert(edges.end(), upper.begin() + 1, upper.end());
    return edges;
  }
  return linspace(lo, hi, n_bins + 1);
}

double median_of(std::vector<double> v) {
  const std::size_t mid = v.size() / 2;
  std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
  const double upper = v[mid];
  if (v.size() % 2 == 1) {
    return upper;
  }
  const double lower = *std::max_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid));
  return 0.5 * (lower + upper);
}

Eigen::ArrayXd column(const core::SampleSet& samples, double core::Sample::*member) {
  Eigen::ArrayXd out(static_cast<Eigen::Index>(samples.size()));
  for (std::size_t i = 0; i < samples.size(); ++i) {
    out(static_cast<Eigen::Index>(i)) = samples[i].*member;
  }
  return out;
}

}  // namespace

Distribution summarize(std::string parameter,
                       std::string unit,
                       const Eigen::ArrayXd& values,
                       std::optional<double> threshold,
                       int n_bins) {
  Distribution out{.parameter = std::move(parameter), .unit = std::move(unit), .threshold = threshold};

  std::vector<double> clean;
  clean.reserve(static_cast<std::size_t>(values.size()));
  for (Eigen::Index i = 0; i < values.size(); ++i) {
    if (std::isfinite(values(i))) {
      clean.push_back(values(i));
    }
  }
  out.sample_count = clean.size();
  if (clean.empty()) {
    return out;
  }

  const Eigen::Map<const Eigen::ArrayXd> v(clean.data(), static_cast<Eigen::Index>(clean.size()));
  out.mean = v.mean();
  out.median = median_of(clean);
  out.std_dev = clean.size() > 1 ? std::sqrt((v - out.mean).square().sum() / static_cast<double>(clean.size() - 1)) : 0.0;

  const double lo = v.minCoeff();
  const double hi = v.maxCoeff();
  const double total = static_cast<double>(clean.size());
  if (lo == hi) {
    out.bins.push_back(HistogramBin{.lower_bound = lo, .upper_bound = hi, .count = static_cast<int>(clean.size()), .frequency = 1.0});
    return out;
  }

  const auto edges = bin_edges(lo, hi, threshold, std::max(n_bins, 1));
  const std::size_t bin_count = edges.size() - 1;
  std::vector<int> counts(bin_count, 0);
  for (const double x : clean) {
    const auto it = std::upper_bound(edges.begin(), edges.end(), x);
    std::size_t idx = static_cast<std::size_t>(std::distance(edges.begin(), it));
    idx = (idx == 0) ? 0 : idx - 1;
    ++counts[std::min(idx, bin_count - 1)];
  }
  out.bins.reserve(bin_count);
  for (std::size_t b = 0; b < bin_count; ++b) {
    out.bins.push_back(HistogramBin{.lower_bound = edges[b],
                                    .upper_bound = edges[b + 1],
                                    .count = counts[b],
                                    .frequency = static_cast<double>(counts[b]) / total});
  }
  return out;
}

std::vector<Distribution> build_distributions(const core::SampleSet& samples,
                                              const config::ThresholdConfig& thresholds,
                                              const int n_bins) {
  const Eigen::ArrayXd t = column(samples, &core::Sample::temperature_c);
  const Eigen::ArrayXd rh = column(samples, &core::Sample::relative_humidity_pct);
  const Eigen::ArrayXd wind = column(samples, &core::Sample::wind_speed_ms);
  const Eigen::ArrayXd precip = column(samples, &core::Sample::precipitation_rate_mm_per_h);
  const indices::IndexArray hi = indices::heat_index(t, rh);
  const indices::IndexArray wc = indices::wind_chill(t, wind);

  std::vector<Distribution> out;
  out.reserve(6);
  out.push_back(summarize("temperature", "C", t, std::nullopt, n_bins));
  out.push_back(summarize("relative_humidity", "%", rh, std::nullopt, n_bins));
  out.push_back(summarize("wind_speed", "m/s", wind, thresholds.wind_ms, n_bins));
  out.push_back(summarize("precipitation", "mm/h", precip, thresholds.wet_mm_per_h, n_bins));
  out.push_back(summarize("heat_index", "C", hi.value_c, thresholds.hot_c, n_bins));
  out.push_back(summarize("wind_chill", "C", wc.value_c, thresholds.cold_c, n_bins));
  return out;
}

}  // namespace climarisk::stats

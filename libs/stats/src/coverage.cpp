/**
 * @file coverage.cpp
 * @brief Coverage validator implementation.
 * @author Watosn
 */

#include "climarisk/stats/coverage.hpp"

namespace climarisk::stats {

CoverageReport validate_coverage(const core::SampleSet& samples, const config::CoverageConfig& config) {
  CoverageReport out{};
  for (const auto& s : samples) {
    ++out.samples_per_year[s.local_date.year];
  }
  out.distinct_years = static_cast<int>(out.samples_per_year.size());
  out.total_samples = static_cast<int>(samples.size());
  out.min_years = config.min_years;
  out.min_samples = config.min_samples;
  out.meets_years = out.distinct_years >= config.min_years;
  out.meets_samples = out.total_samples >= config.min_samples;
  out.adequate = out.meets_years && out.meets_samples;
  if (config.min_years > 0 && config.min_samples > 0) {
    out.adequacy_score = 0.5 * static_cast<double>(out.distinct_years) / static_cast<double>(config.min_years) +
                         0.5 * static_cast<double>(out.total_samples) / static_cast<double>(config.min_samples);
  }
  return out;
}

}  // namespace climarisk::stats

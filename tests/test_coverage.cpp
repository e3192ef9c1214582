/**
 * @file test_coverage.cpp
 * @brief Coverage validator tests.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "climarisk/stats/coverage.hpp"

namespace {

climarisk::core::SampleSet make_years(int first_year, int years, int per_year) {
  climarisk::core::SampleSet out;
  for (int y = 0; y < years; ++y) {
    for (int d = 0; d < per_year; ++d) {
      out.push_back(climarisk::core::Sample{.local_date = {.year = first_year + y, .month = 7, .day = 10 + d},
                                            .local_hour = 14});
    }
  }
  return out;
}

}  // namespace

int main() {
  using namespace climarisk;
  const config::CoverageConfig cfg{};

  const auto empty = stats::validate_coverage({}, cfg);
  if (empty.adequate || empty.distinct_years != 0 || empty.total_samples != 0) {
    spdlog::error("empty sample set must be inadequate");
    return 1;
  }

  const auto short_record = stats::validate_coverage(make_years(2001, 14, 3), cfg);
  if (short_record.adequate || short_record.meets_years || !short_record.meets_samples ||
      short_record.distinct_years != 14 || short_record.total_samples != 42) {
    spdlog::error("14 years must fail the 15-year minimum");
    return 2;
  }

  const auto exact = stats::validate_coverage(make_years(2001, 15, 1), config::CoverageConfig{.min_years = 15, .min_samples = 15});
  if (!exact.adequate || exact.distinct_years != 15 || exact.total_samples != 15) {
    spdlog::error("exact minimums must be adequate");
    return 3;
  }
  if (std::abs(exact.adequacy_score - 1.0) > 1e-12) {
    spdlog::error("adequacy score mismatch: {}", exact.adequacy_score);
    return 4;
  }

  const auto few_samples =
      stats::validate_coverage(make_years(2001, 15, 1), config::CoverageConfig{.min_years = 15, .min_samples = 16});
  if (few_samples.adequate || !few_samples.meets_years || few_samples.meets_samples) {
    spdlog::error("sample minimum must be enforced independently");
    return 5;
  }

  // Distinct years are counted, not the span between first and last year.
  auto gapped = make_years(1990, 1, 4);
  const auto later = make_years(2020, 1, 4);
  gapped.insert(gapped.end(), later.begin(), later.end());
  const auto g = stats::validate_coverage(gapped, cfg);
  if (g.distinct_years != 2 || g.samples_per_year.at(1990) != 4 || g.samples_per_year.at(2020) != 4) {
    spdlog::error("distinct year counting failed: {}", g.distinct_years);
    return 6;
  }
  return 0;
}

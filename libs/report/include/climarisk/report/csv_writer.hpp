/**
 * @file csv_writer.hpp
 * @brief CSV writers for risk results, yearly rates and per-sample detail.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <ostream>
#include <vector>

#include "climarisk/core/types.hpp"
#include "climarisk/engine/risk_engine.hpp"

namespace climarisk::report {

inline constexpr const char* kResultsHeader =
    "condition,outcome,point_estimate,ci_lower,ci_upper,confidence_level,positive_count,total_count,"
    "distinct_years,total_samples,coverage_adequate,slope_per_decade,p_value,direction";

inline constexpr const char* kYearlyHeader = "condition,year,samples,exceedance_rate";

inline constexpr const char* kSampleHeader =
    "local_date,local_hour,day_of_year,temperature_c,relative_humidity_pct,wind_speed_ms,precipitation_mm_per_h,"
    "heat_index_c,heat_index_valid,wind_chill_c,wind_chill_valid,feels_like_c,very_hot,very_uncomfortable,"
    "very_cold,very_windy,very_wet,any_adverse,precipitation_source";

/**
 * @brief Provenance summary of an exported sample set.
 */
struct SampleSummary {
  std::size_t row_count{};
  int first_year{};
  int last_year{};
  std::array<std::size_t, 3> source_counts{};  // indexed by PrecipitationSource

  [[nodiscard]] std::size_t count(const core::PrecipitationSource s) const {
    return source_counts[static_cast<std::size_t>(s)];
  }
};

/**
 * @brief One row per condition with probability, coverage and trend columns.
 *
 * Probability columns are empty for `insufficient_coverage`; trend columns are
 * empty when the trend had too few years.
 */
void write_results_csv(std::ostream& out, const engine::RiskReport& report);

/**
 * @brief One row per (condition, year) with the yearly exceedance rate.
 */
void write_yearly_csv(std::ostream& out, const engine::RiskReport& report);

/**
 * @brief One row per sample with derived indices, flags and provenance.
 * @return Number of data rows written.
 */
std::size_t write_sample_csv(std::ostream& out,
                             const core::SampleSet& samples,
                             const std::vector<engine::SampleEvaluation>& evaluations);

[[nodiscard]] SampleSummary summarize_samples(const core::SampleSet& samples);

}  // namespace climarisk::report

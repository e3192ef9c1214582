/**
 * @file csv_writer.cpp
 * @brief CSV writer implementation.
 * @author Watosn
 */

#include "climarisk/report/csv_writer.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "climarisk/core/calendar.hpp"

namespace climarisk::report {
namespace {

std::string optional_field(const std::optional<double>& v) { return v ? fmt::format("{:.12e}", *v) : std::string{}; }

int bit(const bool b) { return b ? 1 : 0; }

}  // namespace

void write_results_csv(std::ostream& out, const engine::RiskReport& report) {
  out << kResultsHeader << '\n';
  for (const auto& risk : report.conditions) {
    const auto name = core::condition_name(risk.condition);
    const auto outcome = engine::risk_outcome_name(risk.outcome);
    if (risk.probability) {
      const auto& p = *risk.probability;
      out << fmt::format("{},{},{:.12e},{:.12e},{:.12e},{},{},{},", name, outcome, p.point_estimate, p.ci_lower,
                         p.ci_upper, p.confidence_level, p.positive_count, p.total_count);
    } else {
      out << fmt::format("{},{},,,,,,,", name, outcome);
    }
    const auto& t = risk.trend;
    out << fmt::format("{},{},{},{},{},{}\n", report.coverage.distinct_years, report.coverage.total_samples,
                       bit(report.coverage.adequate), optional_field(t.slope_per_decade), optional_field(t.p_value),
                       stats::trend_direction_name(t.direction));
  }
}

void write_yearly_csv(std::ostream& out, const engine::RiskReport& report) {
  out << kYearlyHeader << '\n';
  for (const auto& risk : report.conditions) {
    for (const auto& [year, rate] : risk.trend.yearly_rates) {
      const auto it = risk.trend.yearly_samples.find(year);
      const int n = (it != risk.trend.yearly_samples.end()) ? it->second : 0;
      out << fmt::format("{},{},{},{:.12e}\n", core::condition_name(risk.condition), year, n, rate);
    }
  }
}

std::size_t write_sample_csv(std::ostream& out,
                             const core::SampleSet& samples,
                             const std::vector<engine::SampleEvaluation>& evaluations) {
  out << kSampleHeader << '\n';
  const std::size_t n = std::min(samples.size(), evaluations.size());
  for (std::size_t i = 0; i < n; ++i) {
    const auto& s = samples[i];
    const auto& e = evaluations[i];
    out << fmt::format("{:04d}-{:02d}-{:02d},{},{},{:.6f},{:.6f},{:.6f},{:.6f},", s.local_date.year, s.local_date.month,
                       s.local_date.day, s.local_hour, core::day_of_year(s.local_date), s.temperature_c,
                       s.relative_humidity_pct, s.wind_speed_ms, s.precipitation_rate_mm_per_h);
    out << fmt::format("{:.6f},{},{:.6f},{},{:.6f},", e.derived.heat_index_c, bit(e.derived.heat_index_valid),
                       e.derived.wind_chill_c, bit(e.derived.wind_chill_valid), e.feels_like_c);
    out << fmt::format("{},{},{},{},{},{},{}\n", bit(e.flags.very_hot), bit(e.flags.very_uncomfortable),
                       bit(e.flags.very_cold), bit(e.flags.very_windy), bit(e.flags.very_wet), bit(e.flags.any()),
                       core::precipitation_source_name(s.precipitation_source));
  }
  return n;
}

SampleSummary summarize_samples(const core::SampleSet& samples) {
  SampleSummary out{.row_count = samples.size()};
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const int year = samples[i].local_date.year;
    out.first_year = (i == 0) ? year : std::min(out.first_year, year);
    out.last_year = (i == 0) ? year : std::max(out.last_year, year);
    ++out.source_counts[static_cast<std::size_t>(samples[i].precipitation_source)];
  }
  return out;
}

}  // namespace climarisk::report

/**
 * @file test_risk_engine.cpp
 * @brief Risk engine orchestration, coverage gate and repeatability.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "climarisk/engine/risk_engine.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

// `years` years of `per_year` samples at 14h around July 10; the first sample
// of each of the last `hot_years` years is very hot.
climarisk::core::SampleSet make_set(int years, int per_year, int hot_years) {
  climarisk::core::SampleSet out;
  for (int y = 0; y < years; ++y) {
    for (int d = 0; d < per_year; ++d) {
      const bool hot = d == 0 && y >= years - hot_years;
      out.push_back(climarisk::core::Sample{
          .timestamp_utc_s = static_cast<double>(y * 1000 + d),
          .local_date = {.year = 2001 + y, .month = 7, .day = 8 + d},
          .local_hour = 14,
          .temperature_c = hot ? 40.0 : 20.0,
          .relative_humidity_pct = hot ? 60.0 : 50.0,
          .wind_speed_ms = 3.0,
          .precipitation_rate_mm_per_h = 0.0,
      });
    }
  }
  return out;
}

bool same_probability(const climarisk::stats::ProbabilityResult& a, const climarisk::stats::ProbabilityResult& b) {
  return a.point_estimate == b.point_estimate && a.ci_lower == b.ci_lower && a.ci_upper == b.ci_upper &&
         a.confidence_level == b.confidence_level && a.positive_count == b.positive_count &&
         a.total_count == b.total_count && a.status == b.status;
}

}  // namespace

int main() {
  using namespace climarisk;
  const config::EngineConfig cfg{};
  const engine::RiskEngine engine(cfg);

  // 20 years, 100 samples, 5 very hot.
  const auto set = make_set(20, 5, 5);
  const auto report = engine.compute(set);
  if (report.status != core::Status::Ok || report.outcome != engine::RiskOutcome::Computed ||
      report.coverage.distinct_years != 20 || report.coverage.total_samples != 100) {
    spdlog::error("engine did not compute: {}", report.message);
    return 1;
  }
  const auto& hot = report.at(core::Condition::VeryHot);
  if (!hot.probability || hot.probability->point_estimate != 0.05 || hot.probability->positive_count != 5 ||
      hot.probability->total_count != 100) {
    spdlog::error("very hot estimate mismatch");
    return 2;
  }
  if (!approx(hot.probability->ci_lower, 0.016432, 1e-4) || !approx(hot.probability->ci_upper, 0.112835, 1e-4)) {
    spdlog::error("very hot interval mismatch: [{}, {}]", hot.probability->ci_lower, hot.probability->ci_upper);
    return 3;
  }
  const auto& uncomfortable = report.at(core::Condition::VeryUncomfortable);
  if (!uncomfortable.probability || uncomfortable.probability->positive_count != 5) {
    spdlog::error("very uncomfortable count mismatch");
    return 4;
  }
  const auto& cold = report.at(core::Condition::VeryCold);
  if (!cold.probability || cold.probability->positive_count != 0 || cold.probability->ci_lower != 0.0 ||
      !(cold.probability->ci_upper > 0.0)) {
    spdlog::error("very cold k=0 interval mismatch");
    return 5;
  }
  for (const core::Condition c : core::kAllConditions) {
    if (report.at(c).condition != c || report.at(c).trend.condition != c) {
      spdlog::error("condition ordering mismatch");
      return 6;
    }
  }

  // Trend: rate 0 for 15 years then 0.2 -> OLS slope 11.2782 pp/decade, t ~= 4.82.
  if (!hot.trend.slope_per_decade || !approx(*hot.trend.slope_per_decade, 11.278195488721808, 1e-9) ||
      hot.trend.direction != stats::TrendDirection::Increasing || hot.trend.yearly_rates.size() != 20) {
    spdlog::error("very hot trend mismatch");
    return 7;
  }
  if (cold.trend.direction != stats::TrendDirection::NoSignificantTrend) {
    spdlog::error("flat cold trend must not be significant");
    return 8;
  }

  // Identical inputs give bit-identical results.
  const auto again = engine::compute(set, cfg);
  for (const core::Condition c : core::kAllConditions) {
    const auto& a = report.at(c);
    const auto& b = again.at(c);
    if (!a.probability || !b.probability || !same_probability(*a.probability, *b.probability) ||
        a.trend.slope_per_decade != b.trend.slope_per_decade || a.trend.p_value != b.trend.p_value ||
        a.trend.yearly_rates != b.trend.yearly_rates || a.trend.direction != b.trend.direction) {
      spdlog::error("repeat computation differs");
      return 9;
    }
  }

  // min_years - 1 distinct years: insufficient coverage everywhere, trends still fitted.
  const auto short_report = engine.compute(make_set(14, 5, 2));
  if (short_report.outcome != engine::RiskOutcome::InsufficientCoverage || short_report.coverage.adequate ||
      short_report.status != core::Status::Ok) {
    spdlog::error("14-year set must be insufficient");
    return 10;
  }
  for (const auto& risk : short_report.conditions) {
    if (risk.probability || risk.outcome != engine::RiskOutcome::InsufficientCoverage) {
      spdlog::error("insufficient coverage produced a probability");
      return 11;
    }
  }
  if (!short_report.at(core::Condition::VeryHot).trend.slope_per_decade) {
    spdlog::error("trend must still be fitted under insufficient coverage");
    return 12;
  }

  // Exactly min_years and min_samples: computed.
  config::EngineConfig exact_cfg = cfg;
  exact_cfg.coverage = config::CoverageConfig{.min_years = 15, .min_samples = 15};
  const auto exact = engine::compute(make_set(15, 1, 1), exact_cfg);
  if (exact.outcome != engine::RiskOutcome::Computed || !exact.at(core::Condition::VeryHot).probability) {
    spdlog::error("exact minimum coverage must compute");
    return 13;
  }

  // Invalid configuration: rejected before any computation.
  config::EngineConfig bad_cfg = cfg;
  bad_cfg.thresholds.cold_c = 50.0;
  const auto rejected = engine::compute(set, bad_cfg);
  if (rejected.status != core::Status::InvalidInput || rejected.message.empty() ||
      rejected.at(core::Condition::VeryHot).probability || rejected.at(core::Condition::VeryHot).trend.slope_per_decade) {
    spdlog::error("invalid configuration not rejected");
    return 14;
  }

  // Shared evaluation: one derived index pair per sample.
  const auto evals = engine::evaluate_samples(set, cfg.thresholds);
  if (evals.size() != set.size() || !evals[95].flags.very_hot || evals[0].flags.very_hot ||
      evals[95].feels_like_c != evals[95].derived.heat_index_c) {
    spdlog::error("sample evaluation mismatch");
    return 15;
  }
  return 0;
}

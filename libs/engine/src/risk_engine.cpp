/**
 * @file risk_engine.cpp
 * @brief Risk engine orchestration.
 * @author Watosn
 */

#include "climarisk/engine/risk_engine.hpp"

#include <fmt/format.h>

#include "climarisk/classify/classifier.hpp"
#include "climarisk/indices/comfort_indices.hpp"

namespace climarisk::engine {

std::vector<SampleEvaluation> evaluate_samples(const core::SampleSet& samples, const config::ThresholdConfig& thresholds) {
  std::vector<SampleEvaluation> out;
  out.reserve(samples.size());
  for (const auto& s : samples) {
    const core::DerivedIndices d = indices::derive(s);
    out.push_back(SampleEvaluation{
        .derived = d, .flags = classify::classify(s, d, thresholds), .feels_like_c = indices::feels_like(s, d)});
  }
  return out;
}

RiskReport RiskEngine::compute(const core::SampleSet& samples) const {
  RiskReport report{};
  for (const core::Condition c : core::kAllConditions) {
    report.conditions[core::condition_index(c)].condition = c;
    report.conditions[core::condition_index(c)].trend.condition = c;
  }

  const auto check = config::validate(config_);
  if (!check.ok()) {
    report.status = check.status;
    report.message = check.message;
    return report;
  }

  report.coverage = stats::validate_coverage(samples, config_.coverage);
  report.outcome = report.coverage.adequate ? RiskOutcome::Computed : RiskOutcome::InsufficientCoverage;

  const auto evaluations = evaluate_samples(samples, config_.thresholds);
  std::vector<core::ConditionFlags> flags;
  flags.reserve(evaluations.size());
  for (const auto& e : evaluations) {
    flags.push_back(e.flags);
  }

  for (const core::Condition c : core::kAllConditions) {
    ConditionRisk& risk = report.conditions[core::condition_index(c)];
    risk.outcome = report.outcome;
    if (report.outcome == RiskOutcome::Computed) {
      risk.probability = stats::estimate(classify::flags_for(flags, c), config_.confidence_level);
      if (risk.probability->status != core::Status::Ok) {
        report.status = risk.probability->status;
      }
    }
    risk.trend = stats::estimate_trend(samples, flags, c, config_.trend);
    if (risk.trend.status != core::Status::Ok) {
      report.status = risk.trend.status;
    }
  }
  if (report.outcome == RiskOutcome::InsufficientCoverage) {
    report.message = fmt::format("insufficient coverage: {} years / {} samples (need {} / {})",
                                 report.coverage.distinct_years, report.coverage.total_samples,
                                 report.coverage.min_years, report.coverage.min_samples);
  }
  return report;
}

RiskReport compute(const core::SampleSet& samples, const config::EngineConfig& config) {
  return RiskEngine(config).compute(samples);
}

}  // namespace climarisk::engine

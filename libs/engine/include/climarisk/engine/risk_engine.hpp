/**
 * @file risk_engine.hpp
 * @brief Per-condition exceedance probability and trend orchestration.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "climarisk/config/engine_config.hpp"
#include "climarisk/core/types.hpp"
#include "climarisk/stats/coverage.hpp"
#include "climarisk/stats/exceedance.hpp"
#include "climarisk/stats/trend.hpp"

namespace climarisk::engine {

/**
 * @brief Terminal outcome of a computation.
 */
enum class RiskOutcome : std::uint8_t { Computed, InsufficientCoverage };

constexpr std::string_view risk_outcome_name(const RiskOutcome o) {
  return o == RiskOutcome::Computed ? "computed" : "insufficient_coverage";
}

/**
 * @brief Derived indices, flags and feels-like temperature of one sample.
 */
struct SampleEvaluation {
  core::DerivedIndices derived{};
  core::ConditionFlags flags{};
  double feels_like_c{};
};

/**
 * @brief Result for one condition.
 *
 * `probability` is empty when `outcome` is `InsufficientCoverage`; the trend
 * is filled in both outcomes.
 */
struct ConditionRisk {
  core::Condition condition{core::Condition::VeryHot};
  RiskOutcome outcome{RiskOutcome::InsufficientCoverage};
  std::optional<stats::ProbabilityResult> probability{};
  stats::TrendResult trend{};
};

/**
 * @brief Full engine output for one sample set.
 */
struct RiskReport {
  core::Status status{core::Status::Ok};
  std::string message{};
  RiskOutcome outcome{RiskOutcome::InsufficientCoverage};
  stats::CoverageReport coverage{};
  std::array<ConditionRisk, core::kConditionCount> conditions{};

  [[nodiscard]] const ConditionRisk& at(const core::Condition c) const { return conditions[core::condition_index(c)]; }
};

/**
 * @brief Evaluate indices once per sample and classify.
 */
[[nodiscard]] std::vector<SampleEvaluation> evaluate_samples(const core::SampleSet& samples,
                                                             const config::ThresholdConfig& thresholds);

/**
 * @brief Stateless risk engine bound to one immutable configuration.
 */
class RiskEngine {
 public:
  explicit RiskEngine(config::EngineConfig config) : config_(config) {}

  /**
   * @brief Run coverage, classification, estimation and trend fitting.
   *
   * An invalid configuration yields `Status::InvalidInput` and nothing else.
   * Inadequate coverage yields `InsufficientCoverage` for every condition with
   * no probabilities. Trends are fitted in both outcomes since they only need
   * per-year rates.
   */
  [[nodiscard]] RiskReport compute(const core::SampleSet& samples) const;

  [[nodiscard]] const config::EngineConfig& config() const noexcept { return config_; }

 private:
  config::EngineConfig config_{};
};

/**
 * @brief Convenience wrapper around `RiskEngine(config).compute(samples)`.
 */
[[nodiscard]] RiskReport compute(const core::SampleSet& samples, const config::EngineConfig& config);

}  // namespace climarisk::engine

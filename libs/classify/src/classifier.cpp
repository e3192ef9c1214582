/**
 * @file classifier.cpp
 * @brief Threshold classifier implementation.
 * @author Watosn
 */

#include "climarisk/classify/classifier.hpp"

#include <algorithm>
#include <cstddef>

namespace climarisk::classify {

core::ConditionFlags classify(const core::Sample& sample,
                              const core::DerivedIndices& derived,
                              const config::ThresholdConfig& thresholds) noexcept {
  return core::ConditionFlags{
      .very_hot = derived.heat_index_c >= thresholds.hot_c,
      .very_uncomfortable = derived.heat_index_c >= thresholds.uncomfortable_c,
      .very_cold = derived.wind_chill_valid && derived.wind_chill_c <= thresholds.cold_c,
      .very_windy = sample.wind_speed_ms >= thresholds.wind_ms,
      .very_wet = sample.precipitation_rate_mm_per_h >= thresholds.wet_mm_per_h,
  };
}

std::vector<core::ConditionFlags> classify_all(const core::SampleSet& samples,
                                               const std::vector<core::DerivedIndices>& derived,
                                               const config::ThresholdConfig& thresholds) {
  const std::size_t n = std::min(samples.size(), derived.size());
  std::vector<core::ConditionFlags> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(classify(samples[i], derived[i], thresholds));
  }
  return out;
}

std::vector<bool> flags_for(const std::vector<core::ConditionFlags>& flags, const core::Condition condition) {
  std::vector<bool> out;
  out.reserve(flags.size());
  for (const auto& f : flags) {
    out.push_back(f.flag(condition));
  }
  return out;
}

}  // namespace climarisk::classify

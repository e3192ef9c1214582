/**
 * @file classifier.hpp
 * @brief Threshold classification of samples into condition flags.
 * @author Watosn
 */
#pragma once

#include <vector>

#include "climarisk/config/engine_config.hpp"
#include "climarisk/core/types.hpp"

namespace climarisk::classify {

/**
 * @brief Classify one sample against caller-supplied thresholds.
 *
 * All comparisons are closed (>= / <=). Only `very_cold` is gated, on
 * `derived.wind_chill_valid`.
 */
[[nodiscard]] core::ConditionFlags classify(const core::Sample& sample,
                                            const core::DerivedIndices& derived,
                                            const config::ThresholdConfig& thresholds) noexcept;

/**
 * @brief Classify a sample set; `derived` must be index-aligned with `samples`.
 */
[[nodiscard]] std::vector<core::ConditionFlags> classify_all(const core::SampleSet& samples,
                                                             const std::vector<core::DerivedIndices>& derived,
                                                             const config::ThresholdConfig& thresholds);

/**
 * @brief Extract one condition's flag sequence.
 */
[[nodiscard]] std::vector<bool> flags_for(const std::vector<core::ConditionFlags>& flags, core::Condition condition);

}  // namespace climarisk::classify

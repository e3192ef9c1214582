/**
 * @file static_sample_source.hpp
 * @brief In-memory sample source.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <utility>

#include "climarisk/samples/interfaces.hpp"

namespace climarisk::samples {

/**
 * @brief Fixed sample set for testing and deterministic runs.
 * @note Duplicate (local_date, local_hour) samples are dropped at construction.
 */
class StaticSampleSource final : public ISampleSource {
 public:
  explicit StaticSampleSource(core::SampleSet samples) : samples_(std::move(samples)) {
    duplicates_ = deduplicate(samples_);
    std::stable_sort(samples_.begin(), samples_.end(),
                     [](const core::Sample& a, const core::Sample& b) { return a.timestamp_utc_s < b.timestamp_utc_s; });
  }

  [[nodiscard]] SampleQueryResult collect(const SampleQuery& query) const override {
    SampleQueryResult out = select_window(samples_, query);
    out.duplicate_records = duplicates_;
    return out;
  }

 private:
  core::SampleSet samples_{};
  std::size_t duplicates_{};
};

}  // namespace climarisk::samples

/**
 * @file csv_sample_source.hpp
 * @brief Sample source backed by an hourly observation CSV.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include "climarisk/samples/interfaces.hpp"

namespace climarisk::samples {

/**
 * @brief Sample source loaded once from CSV.
 *
 * Expected columns (header optional):
 * `timestamp_utc_s,local_date,local_hour,temperature_c,relative_humidity_pct,
 * wind_speed_ms,precipitation_mm_per_h[,precipitation_source]` where
 * `local_date` is `YYYY-MM-DD` and `precipitation_source` is one of
 * `primary|fallback|mixed` (default `primary`). Rows with a missing or
 * malformed field are skipped.
 */
class CsvSampleSource final : public ISampleSource {
 public:
  /**
   * @brief CSV source configuration.
   */
  struct Config {
    std::filesystem::path csv_file{};
  };

  /**
   * @brief Parse the CSV. A missing file yields an empty source reporting `DataUnavailable`.
   */
  static std::unique_ptr<CsvSampleSource> Create(const Config& config);

  [[nodiscard]] SampleQueryResult collect(const SampleQuery& query) const override;

  [[nodiscard]] const core::SampleSet& all_samples() const noexcept { return samples_; }
  [[nodiscard]] std::size_t rejected_rows() const noexcept { return rejected_rows_; }
  [[nodiscard]] std::size_t duplicate_rows() const noexcept { return duplicate_rows_; }

 private:
  CsvSampleSource(core::SampleSet samples, std::size_t rejected_rows, std::size_t duplicate_rows, bool loaded)
      : samples_(std::move(samples)), rejected_rows_(rejected_rows), duplicate_rows_(duplicate_rows), loaded_(loaded) {}

  core::SampleSet samples_{};
  std::size_t rejected_rows_{};
  std::size_t duplicate_rows_{};
  bool loaded_{};
};

}  // namespace climarisk::samples

/**
 * @file interfaces.hpp
 * @brief Sample source interface and day-of-year window query.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <optional>

#include "climarisk/core/types.hpp"

namespace climarisk::samples {

/**
 * @brief Select samples at one local hour within `target_day_of_year +- window_days`.
 *
 * The day-of-year distance wraps at the year boundary. Year bounds are
 * inclusive and refer to the sample's local calendar year.
 */
struct SampleQuery {
  int target_day_of_year{1};
  int window_days{7};
  int local_hour{10};
  std::optional<int> first_year{};
  std::optional<int> last_year{};
};

/**
 * @brief Samples matching a query plus bookkeeping about dropped records.
 */
struct SampleQueryResult {
  core::SampleSet samples{};
  std::size_t rejected_records{};
  std::size_t duplicate_records{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Interface for historical sample providers.
 */
class ISampleSource {
 public:
  virtual ~ISampleSource() = default;
  /**
   * @brief Return samples matching `query`, ordered by UTC timestamp.
   * @param query Window/hour/year selection.
   * @return Samples with `status` set.
   */
  [[nodiscard]] virtual SampleQueryResult collect(const SampleQuery& query) const = 0;
};

/**
 * @brief Check query fields: hour 0..23, day of year 1..366, window >= 0, ordered years.
 */
[[nodiscard]] bool is_valid_query(const SampleQuery& query) noexcept;

/**
 * @brief True when `sample` falls inside the query's hour, window and year range.
 */
[[nodiscard]] bool matches(const core::Sample& sample, const SampleQuery& query) noexcept;

/**
 * @brief Filter `samples` with `query`; output keeps the input order.
 */
[[nodiscard]] SampleQueryResult select_window(const core::SampleSet& samples, const SampleQuery& query);

/**
 * @brief Drop repeated (local_date, local_hour) samples, keeping the first.
 * @return Number of samples removed.
 */
std::size_t deduplicate(core::SampleSet& samples);

}  // namespace climarisk::samples

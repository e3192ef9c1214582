/**
 * @file window.cpp
 * @brief Day-of-year window selection and de-duplication.
 * @author Watosn
 */

#include "climarisk/samples/interfaces.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <tuple>
#include <utility>

#include "climarisk/core/calendar.hpp"

namespace climarisk::samples {

bool is_valid_query(const SampleQuery& query) noexcept {
  if (query.local_hour < 0 || query.local_hour > 23) {
    return false;
  }
  if (query.target_day_of_year < 1 || query.target_day_of_year > 366 || query.window_days < 0) {
    return false;
  }
  if (query.first_year && query.last_year && *query.first_year > *query.last_year) {
    return false;
  }
  return true;
}

bool matches(const core::Sample& sample, const SampleQuery& query) noexcept {
  if (sample.local_hour != query.local_hour) {
    return false;
  }
  const int year = sample.local_date.year;
  if ((query.first_year && year < *query.first_year) || (query.last_year && year > *query.last_year)) {
    return false;
  }
  const int doy = core::day_of_year(sample.local_date);
  return core::circular_doy_distance(doy, query.target_day_of_year, core::days_in_year(year)) <= query.window_days;
}

SampleQueryResult select_window(const core::SampleSet& samples, const SampleQuery& query) {
  if (!is_valid_query(query)) {
    return SampleQueryResult{.status = core::Status::InvalidInput};
  }
  SampleQueryResult out{};
  std::copy_if(samples.begin(), samples.end(), std::back_inserter(out.samples),
               [&](const core::Sample& s) { return matches(s, query); });
  if (out.samples.empty()) {
    out.status = core::Status::DataUnavailable;
  }
  return out;
}

std::size_t deduplicate(core::SampleSet& samples) {
  std::set<std::tuple<int, int, int, int>> seen;
  core::SampleSet kept;
  kept.reserve(samples.size());
  for (auto& s : samples) {
    if (seen.emplace(s.local_date.year, s.local_date.month, s.local_date.day, s.local_hour).second) {
      kept.push_back(s);
    }
  }
  const std::size_t removed = samples.size() - kept.size();
  samples = std::move(kept);
  return removed;
}

}  // namespace climarisk::samples

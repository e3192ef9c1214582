/**
 * @file test_sample_sources.cpp
 * @brief CSV/static sample sources and day-of-year window selection.
 * @author Watosn
 */

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <spdlog/spdlog.h>

#include "climarisk/core/calendar.hpp"
#include "climarisk/samples/csv_sample_source.hpp"
#include "climarisk/samples/static_sample_source.hpp"

namespace {

std::filesystem::path make_csv() {
  const auto path = std::filesystem::temp_directory_path() /
                    ("climarisk_samples_test_" +
                     std::to_string(std::chrono::high_resolution_clock::now().time_since_epoch().count()) + "_" +
                     std::to_string(std::random_device{}()) + ".csv");
  std::ofstream out(path);
  out << "timestamp_utc_s,local_date,local_hour,temperature_c,relative_humidity_pct,wind_speed_ms,precipitation_mm_per_h,"
         "precipitation_source\n";
  out << "1104580800,2004-12-31,14,-3.0,70,6.0,0.2,primary\n";
  out << "1104667200,2005-01-01,14,-4.0,72,7.0,0.0,fallback\n";
  out << "1105099200,2005-01-06,14,-2.0,65,3.0,1.0,mixed\n";
  out << "1105617600,2005-01-12,14,-1.0,60,2.0,0.0\n";
  out << "1104667200,2005-01-01,14,9.0,10,1.0,0.0,primary\n";  // duplicate of 2005-01-01 14h
  out << "1104670800,2005-01-01,15,-4.5,71,7.5,0.0,primary\n";
  out << "1104753600,2005-01-02,14,,70,6.0,0.2,primary\n";     // missing temperature
  out << "1104840000,2005-13-03,14,1.0,70,6.0,0.2,primary\n";  // bad month
  out << "1104926400,2005-01-04,24,1.0,70,6.0,0.2,primary\n";  // bad hour
  out << "1105012800,2005-01-05,14,1.0,70,6.0,0.2,radar\n";    // unknown source
  return path;
}

}  // namespace

int main() {
  using namespace climarisk;

  if (core::day_of_year({.year = 2004, .month = 12, .day = 31}) != 366 ||
      core::day_of_year({.year = 2005, .month = 3, .day = 1}) != 60 ||
      core::circular_doy_distance(365, 2, 365) != 2 || core::circular_doy_distance(10, 20, 365) != 10) {
    spdlog::error("calendar helpers mismatch");
    return 1;
  }

  const auto path = make_csv();
  const auto source = samples::CsvSampleSource::Create({.csv_file = path});
  if (source->all_samples().size() != 5 || source->rejected_rows() != 4 || source->duplicate_rows() != 1) {
    spdlog::error("csv parse counts mismatch: kept={} rejected={} dup={}", source->all_samples().size(),
                  source->rejected_rows(), source->duplicate_rows());
    return 2;
  }

  // Window of +-5 days around Jan 1 at 14h wraps back into the previous December.
  const auto q = source->collect({.target_day_of_year = 1, .window_days = 5, .local_hour = 14});
  if (q.status != core::Status::Ok || q.samples.size() != 3) {
    spdlog::error("window selection size mismatch: {}", q.samples.size());
    return 3;
  }
  if (q.samples[0].local_date.year != 2004 || q.samples[1].temperature_c != -4.0 ||
      q.samples[1].precipitation_source != core::PrecipitationSource::Fallback ||
      q.samples[2].precipitation_source != core::PrecipitationSource::Mixed) {
    spdlog::error("window selection content mismatch");
    return 4;
  }

  // Year bounds are inclusive on the local year.
  const auto bounded = source->collect({.target_day_of_year = 1, .window_days = 5, .local_hour = 14, .first_year = 2005});
  if (bounded.samples.size() != 2) {
    spdlog::error("year bound mismatch: {}", bounded.samples.size());
    return 5;
  }

  // Default precipitation source is primary.
  const auto wide = source->collect({.target_day_of_year = 12, .window_days = 0, .local_hour = 14});
  if (wide.samples.size() != 1 || wide.samples[0].precipitation_source != core::PrecipitationSource::PrimarySensor) {
    spdlog::error("default source mismatch");
    return 6;
  }

  if (source->collect({.target_day_of_year = 1, .window_days = 5, .local_hour = 24}).status !=
          core::Status::InvalidInput ||
      source->collect({.target_day_of_year = 0, .window_days = 5, .local_hour = 14}).status !=
          core::Status::InvalidInput) {
    spdlog::error("invalid query accepted");
    return 7;
  }
  if (source->collect({.target_day_of_year = 180, .window_days = 5, .local_hour = 14}).status !=
      core::Status::DataUnavailable) {
    spdlog::error("empty window not reported");
    return 8;
  }

  const auto missing = samples::CsvSampleSource::Create({.csv_file = path.string() + ".missing"});
  if (missing->collect({}).status != core::Status::DataUnavailable) {
    spdlog::error("missing csv not reported");
    return 9;
  }
  std::filesystem::remove(path);

  // Static source applies the same selection and de-duplication.
  samples::StaticSampleSource fixed(core::SampleSet{
      core::Sample{.timestamp_utc_s = 2.0, .local_date = {.year = 2010, .month = 7, .day = 1}, .local_hour = 10},
      core::Sample{.timestamp_utc_s = 1.0, .local_date = {.year = 2010, .month = 7, .day = 2}, .local_hour = 10},
      core::Sample{.timestamp_utc_s = 3.0, .local_date = {.year = 2010, .month = 7, .day = 1}, .local_hour = 10},
      core::Sample{.timestamp_utc_s = 4.0, .local_date = {.year = 2010, .month = 7, .day = 1}, .local_hour = 11},
  });
  const auto st = fixed.collect({.target_day_of_year = 182, .window_days = 3, .local_hour = 10});
  if (st.samples.size() != 2 || st.duplicate_records != 1 || st.samples[0].timestamp_utc_s != 1.0) {
    spdlog::error("static source mismatch");
    return 10;
  }
  return 0;
}

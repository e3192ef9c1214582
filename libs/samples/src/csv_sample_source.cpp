/**
 * @file csv_sample_source.cpp
 * @brief Hourly observation CSV sample source implementation.
 * @author Watosn
 */

#include "climarisk/samples/csv_sample_source.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "climarisk/core/calendar.hpp"

namespace climarisk::samples {
namespace {

constexpr std::size_t kMinColumns = 7;
constexpr std::size_t kTimestampCol = 0;
constexpr std::size_t kLocalDateCol = 1;
constexpr std::size_t kLocalHourCol = 2;
constexpr std::size_t kTemperatureCol = 3;
constexpr std::size_t kHumidityCol = 4;
constexpr std::size_t kWindCol = 5;
constexpr std::size_t kPrecipitationCol = 6;
constexpr std::size_t kPrecipitationSourceCol = 7;

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r");
  return s.substr(first, last - first + 1);
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  fields.reserve(8);
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(trim(token));
  }
  return fields;
}

bool parse_double(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0' || !std::isfinite(v)) {
    return false;
  }
  value = v;
  return true;
}

bool parse_hour(const std::string& text, int& hour) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  const long v = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || v < 0 || v > 23) {
    return false;
  }
  hour = static_cast<int>(v);
  return true;
}

bool parse_source(const std::string& text, core::PrecipitationSource& source) {
  if (text.empty() || text == "primary") {
    source = core::PrecipitationSource::PrimarySensor;
  } else if (text == "fallback") {
    source = core::PrecipitationSource::Fallback;
  } else if (text == "mixed") {
    source = core::PrecipitationSource::Mixed;
  } else {
    return false;
  }
  return true;
}

bool parse_row(const std::vector<std::string>& fields, core::Sample& out) {
  if (fields.size() < kMinColumns) {
    return false;
  }
  core::Sample s{};
  if (!parse_double(fields[kTimestampCol], s.timestamp_utc_s) || !core::parse_iso_date(fields[kLocalDateCol], s.local_date) ||
      !parse_hour(fields[kLocalHourCol], s.local_hour) || !parse_double(fields[kTemperatureCol], s.temperature_c) ||
      !parse_double(fields[kHumidityCol], s.relative_humidity_pct) || !parse_double(fields[kWindCol], s.wind_speed_ms) ||
      !parse_double(fields[kPrecipitationCol], s.precipitation_rate_mm_per_h)) {
    return false;
  }
  const std::string source = fields.size() > kPrecipitationSourceCol ? fields[kPrecipitationSourceCol] : std::string{};
  if (!parse_source(source, s.precipitation_source)) {
    return false;
  }
  out = s;
  return true;
}

}  // namespace

std::unique_ptr<CsvSampleSource> CsvSampleSource::Create(const Config& config) {
  std::ifstream in(config.csv_file);
  if (!in) {
    spdlog::error("failed to open sample csv: {}", config.csv_file.string());
    return std::unique_ptr<CsvSampleSource>(new CsvSampleSource(core::SampleSet{}, 0U, 0U, false));
  }

  core::SampleSet samples;
  std::size_t rejected = 0;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (trim(line).empty() || line[0] == '#') {
      continue;
    }
    core::Sample s{};
    if (!parse_row(split_csv_line(line), s)) {
      if (line_no == 1 && line.find("timestamp_utc_s") != std::string::npos) {
        continue;
      }
      spdlog::debug("skipping malformed row {}", line_no);
      ++rejected;
      continue;
    }
    samples.push_back(s);
  }

  const std::size_t duplicates = deduplicate(samples);
  std::stable_sort(samples.begin(), samples.end(),
                   [](const core::Sample& a, const core::Sample& b) { return a.timestamp_utc_s < b.timestamp_utc_s; });
  if (rejected > 0 || duplicates > 0) {
    spdlog::warn("{}: skipped {} malformed and {} duplicate rows", config.csv_file.string(), rejected, duplicates);
  }
  return std::unique_ptr<CsvSampleSource>(new CsvSampleSource(std::move(samples), rejected, duplicates, true));
}

SampleQueryResult CsvSampleSource::collect(const SampleQuery& query) const {
  if (!loaded_) {
    return SampleQueryResult{.status = core::Status::DataUnavailable};
  }
  SampleQueryResult out = select_window(samples_, query);
  out.rejected_records = rejected_rows_;
  out.duplicate_records = duplicate_rows_;
  return out;
}

}  // namespace climarisk::samples

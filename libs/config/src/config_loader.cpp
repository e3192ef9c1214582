/**
 * @file config_loader.cpp
 * @brief Env-file and environment variable configuration loader.
 * @author Watosn
 */

#include "climarisk/config/config_loader.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace climarisk::config {
namespace {

std::string trim(std::string s) {
  const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string unquote(std::string s) {
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

bool parse_real(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    return false;
  }
  value = v;
  return true;
}

bool parse_integer(const std::string& text, int& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const long v = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || errno == ERANGE || v < std::numeric_limits<int>::min() ||
      v > std::numeric_limits<int>::max()) {
    return false;
  }
  value = static_cast<int>(v);
  return true;
}

double* real_slot(EngineConfig& c, const std::string& key) {
  if (key == "THRESHOLDS_HI_HOT_C") return &c.thresholds.hot_c;
  if (key == "THRESHOLDS_HI_UNCOMF_C") return &c.thresholds.uncomfortable_c;
  if (key == "THRESHOLDS_WCT_COLD_C") return &c.thresholds.cold_c;
  if (key == "THRESHOLDS_WIND_MS") return &c.thresholds.wind_ms;
  if (key == "THRESHOLDS_RAIN_MM_PER_H") return &c.thresholds.wet_mm_per_h;
  if (key == "TREND_SIGNIFICANCE") return &c.trend.significance;
  if (key == "CONFIDENCE_LEVEL") return &c.confidence_level;
  return nullptr;
}

int* integer_slot(EngineConfig& c, const std::string& key) {
  if (key == "COVERAGE_MIN_YEARS") return &c.coverage.min_years;
  if (key == "COVERAGE_MIN_SAMPLES") return &c.coverage.min_samples;
  if (key == "TREND_MIN_YEARS") return &c.trend.min_years;
  return nullptr;
}

constexpr std::array<const char*, 10> kKnownKeys{
    "THRESHOLDS_HI_HOT_C", "THRESHOLDS_HI_UNCOMF_C", "THRESHOLDS_WCT_COLD_C", "THRESHOLDS_WIND_MS",
    "THRESHOLDS_RAIN_MM_PER_H", "COVERAGE_MIN_YEARS", "COVERAGE_MIN_SAMPLES", "TREND_MIN_YEARS",
    "TREND_SIGNIFICANCE", "CONFIDENCE_LEVEL"};

// Returns false and fills `error` when the value does not parse.
bool apply(EngineConfig& c, const std::string& key, const std::string& value, const std::string& origin,
           std::string& error) {
  if (double* slot = real_slot(c, key)) {
    if (!parse_real(value, *slot)) {
      error = fmt::format("{}: {} expects a number, got '{}'", origin, key, value);
      return false;
    }
    return true;
  }
  if (int* slot = integer_slot(c, key)) {
    if (!parse_integer(value, *slot)) {
      error = fmt::format("{}: {} expects an integer, got '{}'", origin, key, value);
      return false;
    }
    return true;
  }
  spdlog::warn("{}: ignoring unknown configuration key {}", origin, key);
  return true;
}

LoadedConfig failure(EngineConfig config, std::string message) {
  spdlog::error("{}", message);
  return LoadedConfig{.config = config, .status = core::Status::InvalidInput, .message = std::move(message)};
}

}  // namespace

LoadedConfig load_engine_config(const std::filesystem::path& env_file, EnvLookup lookup) {
  EngineConfig config{};
  std::string error;

  if (!env_file.empty()) {
    std::ifstream in(env_file);
    if (!in) {
      LoadedConfig out{.config = config, .status = core::Status::DataUnavailable,
                       .message = fmt::format("failed to open config file: {}", env_file.string())};
      spdlog::error("{}", out.message);
      return out;
    }
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
      ++line_no;
      line = trim(line);
      if (line.empty() || line[0] == '#') {
        continue;
      }
      if (line.rfind("export ", 0) == 0) {
        line = trim(line.substr(7));
      }
      const auto eq = line.find('=');
      if (eq == std::string::npos) {
        spdlog::warn("{}:{}: skipping line without '='", env_file.string(), line_no);
        continue;
      }
      const std::string key = upper(trim(line.substr(0, eq)));
      const std::string value = unquote(trim(line.substr(eq + 1)));
      if (!apply(config, key, value, fmt::format("{}:{}", env_file.string(), line_no), error)) {
        return failure(config, error);
      }
    }
  }

  if (lookup != nullptr) {
    for (const char* key : kKnownKeys) {
      const char* raw = lookup(key);
      if (raw == nullptr || raw[0] == '\0') {
        continue;
      }
      if (!apply(config, key, trim(raw), "environment", error)) {
        return failure(config, error);
      }
    }
  }

  const auto v = validate(config);
  if (!v.ok()) {
    return failure(config, v.message);
  }
  return LoadedConfig{.config = config};
}

}  // namespace climarisk::config

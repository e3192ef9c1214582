/**
 * @file cli_common.hpp
 * @brief Argument helpers shared by the risk command-line tools.
 * @author Watosn
 */
#pragma once

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>

#include "climarisk/core/calendar.hpp"

namespace climarisk::cli {

/**
 * @brief Accept either `YYYY-MM-DD` or a bare day of year (1..366).
 */
inline std::optional<int> parse_target_day_of_year(const std::string& text) {
  core::LocalDate date{};
  if (core::parse_iso_date(text, date)) {
    return core::day_of_year(date);
  }
  char* end = nullptr;
  const long doy = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || doy < 1 || doy > 366) {
    return std::nullopt;
  }
  return static_cast<int>(doy);
}

/**
 * @brief Parse a whole decimal argument; trailing text or values outside `int` are rejected.
 */
inline std::optional<int> parse_int_arg(const std::string& text) {
  char* end = nullptr;
  errno = 0;
  const long v = std::strtol(text.c_str(), &end, 10);
  if (text.empty() || end == text.c_str() || *end != '\0' || errno == ERANGE ||
      v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(v);
}

}  // namespace climarisk::cli

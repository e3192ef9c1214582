/**
 * @file calendar.hpp
 * @brief Proleptic Gregorian calendar helpers for local dates.
 * @author Watosn
 */
#pragma once

#include <cstdlib>
#include <string>

#include "climarisk/core/types.hpp"

namespace climarisk::core {

constexpr bool is_leap_year(const int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

constexpr int days_in_year(const int year) { return is_leap_year(year) ? 366 : 365; }

constexpr int days_in_month(const int year, const int month) {
  constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) {
    return 0;
  }
  return (month == 2 && is_leap_year(year)) ? 29 : kDays[month - 1];
}

constexpr bool is_valid_date(const LocalDate& d) {
  return d.month >= 1 && d.month <= 12 && d.day >= 1 && d.day <= days_in_month(d.year, d.month);
}

/**
 * @brief 1-based day of year (1..366).
 */
constexpr int day_of_year(const LocalDate& d) {
  int doy = d.day;
  for (int m = 1; m < d.month; ++m) {
    doy += days_in_month(d.year, m);
  }
  return doy;
}

/**
 * @brief Circular distance in days between two days of year.
 *
 * Wraps at the year boundary, so DOY 365 and DOY 2 are 2 days apart in a
 * common year. `year_length` is the length of the year the sample falls in.
 */
constexpr int circular_doy_distance(const int doy_a, const int doy_b, const int year_length) {
  const int d = doy_a > doy_b ? doy_a - doy_b : doy_b - doy_a;
  return d < year_length - d ? d : year_length - d;
}

/**
 * @brief Parse an ISO `YYYY-MM-DD` date.
 */
inline bool parse_iso_date(const std::string& text, LocalDate& out) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return false;
  }
  for (const std::size_t i : {0U, 1U, 2U, 3U, 5U, 6U, 8U, 9U}) {
    if (text[i] < '0' || text[i] > '9') {
      return false;
    }
  }
  LocalDate d{};
  d.year = std::atoi(text.substr(0, 4).c_str());
  d.month = std::atoi(text.substr(5, 2).c_str());
  d.day = std::atoi(text.substr(8, 2).c_str());
  if (!is_valid_date(d)) {
    return false;
  }
  out = d;
  return true;
}

}  // namespace climarisk::core

/**
 * @file units.hpp
 * @brief Unit conversion helpers used by the index formulas.
 * @author Watosn
 */
#pragma once

namespace climarisk::core {

namespace constants {

inline constexpr double kMphPerMps = 2.23694;

}  // namespace constants

constexpr double celsius_to_fahrenheit(const double c) { return c * 9.0 / 5.0 + 32.0; }

constexpr double fahrenheit_to_celsius(const double f) { return (f - 32.0) * 5.0 / 9.0; }

constexpr double mps_to_mph(const double mps) { return mps * constants::kMphPerMps; }

constexpr double mph_to_mps(const double mph) { return mph / constants::kMphPerMps; }

}  // namespace climarisk::core

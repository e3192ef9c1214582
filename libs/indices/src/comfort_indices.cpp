/**
 * @file comfort_indices.cpp
 * @brief Heat index and wind chill implementation.
 * @author Watosn
 */

#include "climarisk/indices/comfort_indices.hpp"

#include <algorithm>
#include <cmath>

#include "climarisk/core/units.hpp"

namespace climarisk::indices {
namespace {

constexpr double kRothfuszThresholdF = 80.0;

double rothfusz_f(const double t, const double rh) {
  double hi = -42.379 + 2.04901523 * t + 10.14333127 * rh - 0.22475541 * t * rh - 0.00683783 * t * t -
              0.05481717 * rh * rh + 0.00122874 * t * t * rh + 0.00085282 * t * rh * rh -
              0.00000199 * t * t * rh * rh;
  if (rh < 13.0 && t >= 80.0 && t <= 112.0) {
    hi -= ((13.0 - rh) / 4.0) * std::sqrt((17.0 - std::abs(t - 95.0)) / 17.0);
  } else if (rh > 85.0 && t >= 80.0 && t <= 87.0) {
    hi += ((rh - 85.0) / 10.0) * ((87.0 - t) / 5.0);
  }
  return hi;
}

Eigen::Index common_size(const Eigen::ArrayXd& a, const Eigen::ArrayXd& b) { return std::min(a.size(), b.size()); }

}  // namespace

IndexValue heat_index(const double temperature_c, double relative_humidity_pct) noexcept {
  relative_humidity_pct = std::clamp(relative_humidity_pct, 0.0, 100.0);
  const double t = core::celsius_to_fahrenheit(temperature_c);
  const double rh = relative_humidity_pct;

  const double simple = 0.5 * (t + 61.0 + (t - 68.0) * 1.2 + rh * 0.094);
  const double hi_f = (0.5 * (simple + t) < kRothfuszThresholdF) ? simple : rothfusz_f(t, rh);

  const bool valid = temperature_c >= constants::kHeatIndexMinTemperatureC &&
                     relative_humidity_pct >= constants::kHeatIndexMinHumidityPct;
  return IndexValue{.value_c = core::fahrenheit_to_celsius(hi_f), .valid = valid};
}

IndexValue wind_chill(const double temperature_c, const double wind_speed_ms) noexcept {
  const double w = std::isfinite(wind_speed_ms) ? std::max(wind_speed_ms, 0.0) : 0.0;
  const double t = core::celsius_to_fahrenheit(temperature_c);
  const double v16 = std::pow(core::mps_to_mph(w), 0.16);
  const double wc_f = 35.74 + 0.6215 * t - 35.75 * v16 + 0.4275 * t * v16;

  const bool valid = temperature_c <= constants::kWindChillMaxTemperatureC && std::isfinite(wind_speed_ms) &&
                     wind_speed_ms >= constants::kWindChillMinWindMs;
  return IndexValue{.value_c = core::fahrenheit_to_celsius(wc_f), .valid = valid};
}

IndexArray heat_index(const Eigen::ArrayXd& temperature_c, const Eigen::ArrayXd& relative_humidity_pct) {
  const Eigen::Index n = common_size(temperature_c, relative_humidity_pct);
  const auto t = temperature_c.head(n);
  const auto rh = relative_humidity_pct.head(n);
  IndexArray out{};
  out.value_c = t.binaryExpr(rh, [](double a, double b) { return heat_index(a, b).value_c; });
  out.valid = (t >= constants::kHeatIndexMinTemperatureC) &&
              (rh.min(100.0).max(0.0) >= constants::kHeatIndexMinHumidityPct);
  return out;
}

IndexArray wind_chill(const Eigen::ArrayXd& temperature_c, const Eigen::ArrayXd& wind_speed_ms) {
  const Eigen::Index n = common_size(temperature_c, wind_speed_ms);
  const auto t = temperature_c.head(n);
  const auto w = wind_speed_ms.head(n);
  IndexArray out{};
  out.value_c = t.binaryExpr(w, [](double a, double b) { return wind_chill(a, b).value_c; });
  out.valid = (t <= constants::kWindChillMaxTemperatureC) && w.isFinite() && (w >= constants::kWindChillMinWindMs);
  return out;
}

core::DerivedIndices derive(const core::Sample& sample) noexcept {
  const IndexValue hi = heat_index(sample.temperature_c, sample.relative_humidity_pct);
  const IndexValue wc = wind_chill(sample.temperature_c, sample.wind_speed_ms);
  return core::DerivedIndices{
      .heat_index_c = hi.value_c, .heat_index_valid = hi.valid, .wind_chill_c = wc.value_c, .wind_chill_valid = wc.valid};
}

double feels_like(const core::Sample& sample, const core::DerivedIndices& derived) noexcept {
  if (derived.heat_index_valid) {
    return derived.heat_index_c;
  }
  if (derived.wind_chill_valid) {
    return derived.wind_chill_c;
  }
  return sample.temperature_c;
}

}  // namespace climarisk::indices

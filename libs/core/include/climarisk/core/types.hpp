/**
 * @file types.hpp
 * @brief Core domain types for climarisk.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace climarisk::core {

/**
 * @brief Standard status code used by result structs.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, DataUnavailable, NumericalError };

/**
 * @brief Provenance tag for the precipitation rate of a sample.
 */
enum class PrecipitationSource : std::uint8_t { PrimarySensor, Fallback, Mixed };

/**
 * @brief Hazard conditions evaluated per sample.
 */
enum class Condition : std::uint8_t { VeryHot, VeryUncomfortable, VeryCold, VeryWindy, VeryWet };

inline constexpr std::size_t kConditionCount = 5;

inline constexpr std::array<Condition, kConditionCount> kAllConditions{
    Condition::VeryHot, Condition::VeryUncomfortable, Condition::VeryCold, Condition::VeryWindy, Condition::VeryWet};

/**
 * @brief Stable snake_case name used by downstream JSON/CSV formatting.
 */
constexpr std::string_view condition_name(const Condition c) {
  switch (c) {
    case Condition::VeryHot:
      return "very_hot";
    case Condition::VeryUncomfortable:
      return "very_uncomfortable";
    case Condition::VeryCold:
      return "very_cold";
    case Condition::VeryWindy:
      return "very_windy";
    case Condition::VeryWet:
      return "very_wet";
  }
  return "unknown";
}

constexpr std::string_view precipitation_source_name(const PrecipitationSource s) {
  switch (s) {
    case PrecipitationSource::PrimarySensor:
      return "primary";
    case PrecipitationSource::Fallback:
      return "fallback";
    case PrecipitationSource::Mixed:
      return "mixed";
  }
  return "unknown";
}

constexpr std::size_t condition_index(const Condition c) { return static_cast<std::size_t>(c); }

/**
 * @brief Local calendar date of a sample.
 */
struct LocalDate {
  int year{};
  int month{1};
  int day{1};

  friend constexpr bool operator==(const LocalDate&, const LocalDate&) = default;
};

/**
 * @brief One observation at a UTC instant, already mapped to local date/hour.
 */
struct Sample {
  double timestamp_utc_s{};
  LocalDate local_date{};
  int local_hour{};
  double temperature_c{};
  double relative_humidity_pct{};
  double wind_speed_ms{};
  double precipitation_rate_mm_per_h{};
  PrecipitationSource precipitation_source{PrecipitationSource::PrimarySensor};
};

/**
 * @brief Samples at one local hour, pooled over a day-of-year window and many years.
 */
using SampleSet = std::vector<Sample>;

/**
 * @brief Derived comfort indices for one sample.
 *
 * Both indices are always numeric; `*_valid` marks whether the value lies in
 * the domain where its formula is physically meaningful.
 */
struct DerivedIndices {
  double heat_index_c{};
  bool heat_index_valid{};
  double wind_chill_c{};
  bool wind_chill_valid{};
};

/**
 * @brief Per-sample exceedance flags.
 */
struct ConditionFlags {
  bool very_hot{};
  bool very_uncomfortable{};
  bool very_cold{};
  bool very_windy{};
  bool very_wet{};

  [[nodiscard]] constexpr bool flag(const Condition c) const {
    switch (c) {
      case Condition::VeryHot:
        return very_hot;
      case Condition::VeryUncomfortable:
        return very_uncomfortable;
      case Condition::VeryCold:
        return very_cold;
      case Condition::VeryWindy:
        return very_windy;
      case Condition::VeryWet:
        return very_wet;
    }
    return false;
  }

  [[nodiscard]] constexpr bool any() const {
    return very_hot || very_uncomfortable || very_cold || very_windy || very_wet;
  }

  [[nodiscard]] constexpr int count() const {
    return static_cast<int>(very_hot) + static_cast<int>(very_uncomfortable) + static_cast<int>(very_cold) +
           static_cast<int>(very_windy) + static_cast<int>(very_wet);
  }
};

}  // namespace climarisk::core

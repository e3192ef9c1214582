/**
 * @file main.cpp
 * @brief climarisk command-line entrypoint.
 * @author Watosn
 */

#include <cstdlib>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "cli_common.hpp"
#include "climarisk/config/config_loader.hpp"
#include "climarisk/engine/risk_engine.hpp"
#include "climarisk/samples/csv_sample_source.hpp"
#include "climarisk/stats/distribution.hpp"

int main(int argc, char** argv) {
  if (argc < 4 || argc > 8) {
    spdlog::error("usage: risk_cli <samples_csv> <target_date|doy> <local_hour> [window_days] [first_year] [last_year] [env_file]");
    spdlog::error("samples row: timestamp_utc_s,local_date,local_hour,temperature_c,relative_humidity_pct,wind_speed_ms,precipitation_mm_per_h[,precipitation_source]");
    return 1;
  }

  const auto doy = climarisk::cli::parse_target_day_of_year(argv[2]);
  const auto hour = climarisk::cli::parse_int_arg(argv[3]);
  const auto window = (argc >= 5) ? climarisk::cli::parse_int_arg(argv[4]) : std::optional<int>(7);
  if (!doy || !hour || !window) {
    spdlog::error("invalid target date, hour or window");
    return 1;
  }

  climarisk::samples::SampleQuery query{.target_day_of_year = *doy, .window_days = *window, .local_hour = *hour};
  if (argc >= 6) {
    query.first_year = climarisk::cli::parse_int_arg(argv[5]);
    if (!query.first_year) {
      spdlog::error("invalid first year: {}", argv[5]);
      return 1;
    }
  }
  if (argc >= 7) {
    query.last_year = climarisk::cli::parse_int_arg(argv[6]);
    if (!query.last_year) {
      spdlog::error("invalid last year: {}", argv[6]);
      return 1;
    }
  }
  const std::string env_file = (argc >= 8) ? argv[7] : "";

  const auto loaded = climarisk::config::load_engine_config(env_file);
  if (loaded.status != climarisk::core::Status::Ok) {
    spdlog::error("configuration rejected: {}", loaded.message);
    return 2;
  }

  const auto source = climarisk::samples::CsvSampleSource::Create({.csv_file = argv[1]});
  const auto collected = source->collect(query);
  if (collected.status == climarisk::core::Status::InvalidInput) {
    spdlog::error("invalid sample query");
    return 3;
  }
  spdlog::info("collected {} samples (doy={} +-{} hour={})", collected.samples.size(), query.target_day_of_year,
               query.window_days, query.local_hour);

  const climarisk::engine::RiskEngine engine(loaded.config);
  const auto report = engine.compute(collected.samples);
  if (report.status == climarisk::core::Status::InvalidInput) {
    spdlog::error("risk computation failed: {}", report.message);
    return 4;
  }

  fmt::print("coverage years={} samples={} adequate={} score={:.3f}\n", report.coverage.distinct_years,
             report.coverage.total_samples, report.coverage.adequate ? 1 : 0, report.coverage.adequacy_score);
  fmt::print("outcome={}\n", climarisk::engine::risk_outcome_name(report.outcome));
  for (const auto& risk : report.conditions) {
    const auto name = climarisk::core::condition_name(risk.condition);
    if (risk.probability) {
      const auto& p = *risk.probability;
      fmt::print("{} p={:.4f} ci=[{:.4f}, {:.4f}] level={} k={} n={}\n", name, p.point_estimate, p.ci_lower, p.ci_upper,
                 p.confidence_level, p.positive_count, p.total_count);
    } else {
      fmt::print("{} insufficient_coverage\n", name);
    }
    const auto& t = risk.trend;
    if (t.slope_per_decade) {
      fmt::print("{} trend slope_pp_per_decade={:.3f} p_value={:.4f} direction={}\n", name, *t.slope_per_decade,
                 *t.p_value, climarisk::stats::trend_direction_name(t.direction));
    } else {
      fmt::print("{} trend direction={} years={}\n", name, climarisk::stats::trend_direction_name(t.direction),
                 t.yearly_rates.size());
    }
  }

  for (const auto& d : climarisk::stats::build_distributions(collected.samples, loaded.config.thresholds)) {
    fmt::print("dist {} [{}] n={} mean={:.3f} median={:.3f} sd={:.3f}\n", d.parameter, d.unit, d.sample_count, d.mean,
               d.median, d.std_dev);
  }
  if (collected.status == climarisk::core::Status::DataUnavailable) {
    spdlog::warn("no samples matched the query");
  }
  return report.status == climarisk::core::Status::Ok ? 0 : 5;
}

/**
 * @file risk_export_cli.cpp
 * @brief Export per-condition probabilities, yearly exceedance rates and per-sample detail as CSV.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "cli_common.hpp"
#include "climarisk/config/config_loader.hpp"
#include "climarisk/engine/risk_engine.hpp"
#include "climarisk/report/csv_writer.hpp"
#include "climarisk/samples/csv_sample_source.hpp"

int main(int argc, char** argv) {
  if (argc < 5 || argc > 9) {
    spdlog::error(
        "usage: risk_export_cli <samples_csv> <output_csv> <target_date|doy> <local_hour> [window_days] [yearly_csv] "
        "[env_file] [samples_out_csv]");
    return 1;
  }

  const std::filesystem::path input_csv = argv[1];
  const std::filesystem::path output_csv = argv[2];
  const auto doy = climarisk::cli::parse_target_day_of_year(argv[3]);
  const auto hour = climarisk::cli::parse_int_arg(argv[4]);
  const auto window = (argc >= 6) ? climarisk::cli::parse_int_arg(argv[5]) : std::optional<int>(7);
  const std::string yearly_csv = (argc >= 7) ? argv[6] : "";
  const std::string env_file = (argc >= 8) ? argv[7] : "";
  const std::string samples_csv = (argc >= 9) ? argv[8] : "";
  if (!doy || !hour || !window) {
    spdlog::error("invalid target date, hour or window");
    return 1;
  }

  const auto loaded = climarisk::config::load_engine_config(env_file);
  if (loaded.status != climarisk::core::Status::Ok) {
    spdlog::error("configuration rejected: {}", loaded.message);
    return 2;
  }

  const auto source = climarisk::samples::CsvSampleSource::Create({.csv_file = input_csv});
  const auto collected =
      source->collect({.target_day_of_year = *doy, .window_days = *window, .local_hour = *hour});
  if (collected.status == climarisk::core::Status::InvalidInput) {
    spdlog::error("invalid sample query");
    return 3;
  }

  const auto report = climarisk::engine::compute(collected.samples, loaded.config);
  if (report.status == climarisk::core::Status::InvalidInput) {
    spdlog::error("risk computation failed: {}", report.message);
    return 4;
  }

  std::ofstream out(output_csv);
  if (!out) {
    spdlog::error("failed to open output csv: {}", output_csv.string());
    return 5;
  }
  climarisk::report::write_results_csv(out, report);
  spdlog::info("wrote risk export: {}", output_csv.string());

  if (!yearly_csv.empty()) {
    std::ofstream yearly(yearly_csv);
    if (!yearly) {
      spdlog::error("failed to open yearly csv: {}", yearly_csv);
      return 6;
    }
    climarisk::report::write_yearly_csv(yearly, report);
    spdlog::info("wrote yearly rates: {}", yearly_csv);
  }

  if (!samples_csv.empty()) {
    std::ofstream rows(samples_csv);
    if (!rows) {
      spdlog::error("failed to open samples csv: {}", samples_csv);
      return 7;
    }
    const auto evaluations = climarisk::engine::evaluate_samples(collected.samples, loaded.config.thresholds);
    const auto written = climarisk::report::write_sample_csv(rows, collected.samples, evaluations);
    const auto summary = climarisk::report::summarize_samples(collected.samples);
    spdlog::info("wrote {} sample rows ({}..{}) to {}: primary={} fallback={} mixed={}", written, summary.first_year,
                 summary.last_year, samples_csv, summary.count(climarisk::core::PrecipitationSource::PrimarySensor),
                 summary.count(climarisk::core::PrecipitationSource::Fallback),
                 summary.count(climarisk::core::PrecipitationSource::Mixed));
  }
  return 0;
}

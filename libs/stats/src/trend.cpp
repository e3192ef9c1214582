/**
 * @file trend.cpp
 * @brief OLS trend estimator.
 * @author Watosn
 */

#include "climarisk/stats/trend.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

#include <Eigen/Dense>
#include <boost/math/distributions/students_t.hpp>
#include <boost/math/policies/policy.hpp>

namespace climarisk::stats {
namespace {

namespace bmp = boost::math::policies;

using QuietPolicy = bmp::policy<bmp::domain_error<bmp::errno_on_error>, bmp::overflow_error<bmp::errno_on_error>,
                                bmp::evaluation_error<bmp::errno_on_error>>;
using StudentsT = boost::math::students_t_distribution<double, QuietPolicy>;

// Rate per year -> percentage points per decade.
constexpr double kPerDecadePercent = 10.0 * 100.0;

double two_sided_p(const double t, const double dof) {
  if (std::isinf(t)) {
    return 0.0;
  }
  return 2.0 * boost::math::cdf(boost::math::complement(StudentsT(dof), std::abs(t)));
}

}  // namespace

TrendResult fit_trend(const std::map<int, double>& yearly_rates, const config::TrendConfig& config) {
  TrendResult out{};
  out.yearly_rates = yearly_rates;

  const auto n = static_cast<Eigen::Index>(yearly_rates.size());
  if (n < std::max(config.min_years, 3)) {
    return out;
  }

  Eigen::VectorXd x(n);
  Eigen::VectorXd y(n);
  Eigen::Index i = 0;
  for (const auto& [year, rate] : yearly_rates) {
    x(i) = static_cast<double>(year);
    y(i) = rate;
    ++i;
  }
  const double x_mean = x.mean();

  // Centered abscissa keeps the normal matrix well conditioned for calendar years.
  Eigen::MatrixXd design(n, 2);
  design.col(0).setOnes();
  design.col(1) = x.array() - x_mean;
  const Eigen::VectorXd beta = design.colPivHouseholderQr().solve(y);

  const double sxx = design.col(1).squaredNorm();
  const double dof = static_cast<double>(n - 2);
  const Eigen::VectorXd residuals = y - design * beta;
  const double sse = residuals.squaredNorm();
  const double sst = (y.array() - y.mean()).matrix().squaredNorm();

  double slope = beta(1);
  double p = 1.0;
  if (y.maxCoeff() == y.minCoeff()) {
    slope = 0.0;
  } else {
    const double se = std::sqrt(sse / dof / sxx);
    p = (se > 0.0) ? two_sided_p(slope / se, dof) : 0.0;
  }
  if (!std::isfinite(slope) || !std::isfinite(p)) {
    out.status = core::Status::NumericalError;
    return out;
  }

  out.slope_per_decade = slope * kPerDecadePercent;
  out.p_value = std::clamp(p, 0.0, 1.0);
  out.intercept = beta(0) - slope * x_mean;
  out.r_squared = (sst > 0.0) ? 1.0 - sse / sst : 0.0;
  if (*out.p_value > config.significance || slope == 0.0) {
    out.direction = TrendDirection::NoSignificantTrend;
  } else {
    out.direction = slope > 0.0 ? TrendDirection::Increasing : TrendDirection::Decreasing;
  }
  return out;
}

TrendResult estimate_trend(const core::SampleSet& samples,
                           const std::vector<core::ConditionFlags>& flags,
                           const core::Condition condition,
                           const config::TrendConfig& config) {
  std::map<int, int> totals;
  std::map<int, int> positives;
  const std::size_t count = std::min(samples.size(), flags.size());
  for (std::size_t i = 0; i < count; ++i) {
    const int year = samples[i].local_date.year;
    ++totals[year];
    if (flags[i].flag(condition)) {
      ++positives[year];
    }
  }

  std::map<int, double> rates;
  for (const auto& [year, total] : totals) {
    rates[year] = static_cast<double>(positives[year]) / static_cast<double>(total);
  }

  TrendResult out = fit_trend(rates, config);
  out.condition = condition;
  out.yearly_samples = std::move(totals);
  return out;
}

}  // namespace climarisk::stats

/**
 * @file exceedance.cpp
 * @brief Clopper-Pearson exceedance estimator.
 * @author Watosn
 */

#include "climarisk/stats/exceedance.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <boost/math/distributions/beta.hpp>
#include <boost/math/policies/policy.hpp>

namespace climarisk::stats {
namespace {

namespace bmp = boost::math::policies;

using QuietPolicy = bmp::policy<bmp::domain_error<bmp::errno_on_error>, bmp::overflow_error<bmp::errno_on_error>,
                                bmp::evaluation_error<bmp::errno_on_error>>;
using BetaDistribution = boost::math::beta_distribution<double, QuietPolicy>;

double beta_quantile(const double a, const double b, const double p) {
  return boost::math::quantile(BetaDistribution(a, b), p);
}

}  // namespace

double ProbabilityResult::relative_error() const noexcept {
  if (point_estimate == 0.0) {
    return std::numeric_limits<double>::infinity();
  }
  return 0.5 * ci_width() / point_estimate;
}

ConfidenceInterval clopper_pearson(const std::size_t successes, const std::size_t trials, const double confidence_level) {
  if (successes > trials || !(confidence_level > 0.0 && confidence_level < 1.0)) {
    return ConfidenceInterval{.status = core::Status::InvalidInput};
  }
  if (trials == 0) {
    return ConfidenceInterval{};
  }

  const double alpha = 1.0 - confidence_level;
  const double k = static_cast<double>(successes);
  const double n = static_cast<double>(trials);

  ConfidenceInterval out{};
  if (successes > 0) {
    out.lower = beta_quantile(k, n - k + 1.0, 0.5 * alpha);
  }
  if (successes < trials) {
    out.upper = beta_quantile(k + 1.0, n - k, 1.0 - 0.5 * alpha);
  }
  if (!std::isfinite(out.lower) || !std::isfinite(out.upper)) {
    return ConfidenceInterval{.status = core::Status::NumericalError};
  }
  out.lower = std::clamp(out.lower, 0.0, 1.0);
  out.upper = std::clamp(out.upper, 0.0, 1.0);
  return out;
}

ProbabilityResult estimate(const std::size_t positive_count, const std::size_t total_count, const double confidence_level) {
  const ConfidenceInterval ci = clopper_pearson(positive_count, total_count, confidence_level);
  const double p = (total_count > 0 && positive_count <= total_count)
                       ? static_cast<double>(positive_count) / static_cast<double>(total_count)
                       : 0.0;
  return ProbabilityResult{.point_estimate = p,
                           .ci_lower = ci.lower,
                           .ci_upper = ci.upper,
                           .confidence_level = confidence_level,
                           .positive_count = positive_count,
                           .total_count = total_count,
                           .status = ci.status};
}

ProbabilityResult estimate(const std::vector<bool>& flags, const double confidence_level) {
  const auto k = static_cast<std::size_t>(std::count(flags.begin(), flags.end(), true));
  return estimate(k, flags.size(), confidence_level);
}

}  // namespace climarisk::stats

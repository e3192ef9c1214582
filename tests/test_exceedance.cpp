/**
 * @file test_exceedance.cpp
 * @brief Clopper-Pearson exceedance estimator tests.
 * @author Watosn
 */

#include <cmath>
#include <cstddef>
#include <vector>

#include <spdlog/spdlog.h>

#include "climarisk/stats/exceedance.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace climarisk;

  // 5 of 100 at 95 %: reference Beta quantiles (bisection on the regularized incomplete beta).
  std::vector<bool> flags(100, false);
  for (std::size_t i = 0; i < 5; ++i) {
    flags[i * 20] = true;
  }
  const auto r = stats::estimate(flags);
  if (r.point_estimate != 0.05 || r.positive_count != 5 || r.total_count != 100 || r.status != core::Status::Ok) {
    spdlog::error("point estimate mismatch: {}", r.point_estimate);
    return 1;
  }
  if (!approx(r.ci_lower, 0.01643187918205203, 5e-5) || !approx(r.ci_upper, 0.1128349111054619, 5e-5)) {
    spdlog::error("5/100 interval mismatch: [{}, {}]", r.ci_lower, r.ci_upper);
    return 2;
  }

  // k = 0: lower exactly 0, upper has the closed form 1 - (alpha/2)^(1/n).
  const auto zero = stats::estimate(0, 20, 0.95);
  if (zero.ci_lower != 0.0 || !approx(zero.ci_upper, 1.0 - std::pow(0.025, 1.0 / 20.0), 1e-9) || zero.ci_upper <= 0.0) {
    spdlog::error("k=0 interval mismatch: [{}, {}]", zero.ci_lower, zero.ci_upper);
    return 3;
  }

  // k = n: upper exactly 1, lower has the closed form (alpha/2)^(1/n).
  const auto all = stats::estimate(20, 20, 0.95);
  if (all.ci_upper != 1.0 || !approx(all.ci_lower, std::pow(0.025, 1.0 / 20.0), 1e-9) || all.point_estimate != 1.0) {
    spdlog::error("k=n interval mismatch: [{}, {}]", all.ci_lower, all.ci_upper);
    return 4;
  }

  // Interior case with both quantiles.
  const auto mid = stats::estimate(3, 10, 0.95);
  if (!approx(mid.ci_lower, 0.0667395111777345, 1e-6) || !approx(mid.ci_upper, 0.6524528500599969, 1e-6)) {
    spdlog::error("3/10 interval mismatch: [{}, {}]", mid.ci_lower, mid.ci_upper);
    return 5;
  }

  // lower <= p <= upper for every k and n up to 60.
  for (std::size_t n = 0; n <= 60; ++n) {
    for (std::size_t k = 0; k <= n; ++k) {
      const auto e = stats::estimate(k, n, 0.95);
      if (e.status != core::Status::Ok || e.ci_lower > e.point_estimate || e.point_estimate > e.ci_upper) {
        spdlog::error("interval ordering broken at k={} n={}", k, n);
        return 6;
      }
    }
  }

  // A higher confidence level never gives a narrower interval.
  for (const std::size_t k : {0U, 1U, 5U, 25U, 49U, 50U}) {
    const auto c95 = stats::estimate(k, 50, 0.95);
    const auto c99 = stats::estimate(k, 50, 0.99);
    if (c99.ci_lower > c95.ci_lower || c99.ci_upper < c95.ci_upper || c99.ci_width() < c95.ci_width()) {
      spdlog::error("99% interval does not contain 95% interval at k={}", k);
      return 7;
    }
  }
  const auto c99 = stats::estimate(5, 100, 0.99);
  if (!approx(c99.ci_lower, 0.010940333584789953, 5e-5) || !approx(c99.ci_upper, 0.13514468253562267, 5e-5)) {
    spdlog::error("5/100 99% interval mismatch: [{}, {}]", c99.ci_lower, c99.ci_upper);
    return 8;
  }

  // n = 0 is a defined fallback.
  const auto none = stats::estimate(std::vector<bool>{});
  if (none.point_estimate != 0.0 || none.ci_lower != 0.0 || none.ci_upper != 1.0 || none.status != core::Status::Ok) {
    spdlog::error("n=0 fallback mismatch");
    return 9;
  }

  // Structurally invalid requests are reported, not thrown.
  if (stats::clopper_pearson(5, 4).status != core::Status::InvalidInput ||
      stats::clopper_pearson(1, 4, 1.0).status != core::Status::InvalidInput ||
      stats::clopper_pearson(1, 4, 0.0).status != core::Status::InvalidInput) {
    spdlog::error("invalid input not reported");
    return 10;
  }

  if (!std::isinf(zero.relative_error()) || !approx(r.relative_error(), 0.5 * r.ci_width() / 0.05, 1e-12)) {
    spdlog::error("relative error mismatch");
    return 11;
  }
  return 0;
}

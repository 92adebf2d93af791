/*
  Distribution Evaluator Selftest

  Checks:
    1) Lognormal reference point: PoF(median) == 0.5, strictly increasing around it.
    2) Weibull / logistic closed-form reference values and numerically stable tails.
    3) Monotonicity + [0,1] range over an intensity sweep for every model.
    4) Recovery paths: missing points, unknown model, inherit, malformed parameters.

  Framework-free; non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/fragility/distribution.hpp"

namespace clirisk {
namespace {

using namespace clirisk::selftest;
using fragility::DistributionEvaluator;
using fragility::EvalDiagnostics;

bool in_unit_interval(const std::vector<double>& v) {
  for (double p : v) {
    if (!(p >= 0.0 && p <= 1.0)) return false;
  }
  return true;
}

bool non_decreasing(const std::vector<double>& v) {
  for (size_t i = 1; i < v.size(); ++i) {
    if (v[i] < v[i - 1]) return false;
  }
  return true;
}

void test_lognormal_reference() {
  const DistributionEvaluator ev;
  const hbom::ParamMap params{{"median", 100.0}, {"dispersion", 0.3}};
  const auto p = ev.evaluate("lognormal", params, {50.0, 100.0, 200.0});

  expect_true(p.size() == 3, "lognormal: one PoF per input point");
  expect_true(p[0] < p[1] && p[1] < p[2], "lognormal: strictly increasing over [50,100,200]");
  expect_near(p[1], 0.5, "lognormal: PoF(median) == 0.5", 1e-6);
  expect_true(p[0] < 0.05 && p[2] > 0.95, "lognormal: dispersion 0.3 puts 50/200 in the tails");

  const hbom::ParamMap mu_sigma{{"mu", std::log(100.0)}, {"sigma", 0.3}, {"median", 5.0}};
  const auto q = ev.evaluate("lognormal", mu_sigma, {50.0, 100.0, 200.0});
  expect_near(q[0], p[0], "lognormal: mu/sigma takes precedence over median", 1e-12);
  expect_near(q[2], p[2], "lognormal: mu/sigma matches equivalent median/dispersion", 1e-12);

  const auto z = ev.evaluate("lognormal", params, {0.0});
  expect_true(z.size() == 1 && z[0] >= 0.0 && z[0] < 1e-12, "lognormal: zero intensity guarded by log epsilon");
}

void test_weibull_reference() {
  const DistributionEvaluator ev;
  const hbom::ParamMap params{{"shape", 2.0}, {"scale", 40.0}};
  const auto p = ev.evaluate("weibull", params, {-5.0, 0.0, 40.0, 1e9});

  expect_near(p[0], 0.0, "weibull: negative intensity -> 0");
  expect_near(p[1], 0.0, "weibull: zero intensity -> 0");
  expect_near(p[2], 1.0 - std::exp(-1.0), "weibull: PoF(scale) == 1 - e^-1", 1e-12);
  expect_near(p[3], 1.0, "weibull: overflow of (x/scale)^shape saturates at 1");

  // Defaults: shape 2, scale 100.
  const auto d = ev.evaluate("weibull", {}, {100.0});
  expect_near(d[0], 1.0 - std::exp(-1.0), "weibull: missing parameters use defaults", 1e-12);
}

void test_logistic_reference() {
  const DistributionEvaluator ev;
  const hbom::ParamMap params{{"mid_point", 30.0}, {"slope", 1.0}};
  const auto p = ev.evaluate("logistic", params, {30.0, -1e6, 1e6});

  expect_near(p[0], 0.5, "logistic: PoF(mid_point) == 0.5");
  expect_true(std::isfinite(p[1]) && p[1] >= 0.0 && p[1] < 1e-12, "logistic: far lower tail is finite ~0");
  expect_near(p[2], 1.0, "logistic: far upper tail saturates at 1");
}

void test_monotonic_sweep() {
  const DistributionEvaluator ev;

  std::vector<double> xs;
  for (int i = 0; i <= 100; ++i) xs.push_back(5.0 * i);

  struct Case { const char* model; hbom::ParamMap params; };
  const Case cases[] = {
      {"lognormal", {{"median", 120.0}, {"dispersion", 0.5}}},
      {"lognormal", {{"mu", 4.0}, {"sigma", 1.2}}},
      {"weibull", {{"shape", 0.7}, {"scale", 80.0}}},
      {"weibull", {{"shape", 6.0}, {"scale", 250.0}}},
      {"logistic", {{"mid_point", 200.0}, {"slope", 0.05}}},
      {"logistic", {{"mid_point", 10.0}, {"slope", 3.0}}},
  };

  for (const auto& c : cases) {
    const auto p = ev.evaluate(c.model, c.params, xs);
    const std::string name = std::string(c.model) + " sweep";
    expect_true(p.size() == xs.size(), name + ": size preserved");
    expect_true(in_unit_interval(p), name + ": every PoF in [0,1]");
    expect_true(non_decreasing(p), name + ": non-decreasing in intensity");
  }
}

void test_missing_points() {
  const DistributionEvaluator ev;
  EvalDiagnostics diag;
  const double nan = std::nan("");
  const auto p = ev.evaluate("weibull", {{"shape", 2.0}, {"scale", 10.0}}, {nan, 10.0, nan}, &diag);

  expect_true(p.size() == 3, "missing: positions preserved");
  expect_near(p[0], 0.0, "missing: NaN point -> 0 PoF");
  expect_true(p[1] > 0.6, "missing: finite neighbor still evaluated");
  expect_true(diag.missing_points == 2, "missing: counted in diagnostics");
  expect_true(!diag.has_warnings(), "missing: not a warning by itself");
}

void test_unknown_and_inherit() {
  const DistributionEvaluator ev;

  EvalDiagnostics d1;
  const auto u = ev.evaluate("gamma", {{"k", 2.0}}, {1.0, 2.0, 3.0}, &d1);
  expect_true(u == std::vector<double>({0.0, 0.0, 0.0}), "unknown model: zero series of input length");
  expect_true(d1.unknown_model == 1 && d1.has_warnings(), "unknown model: reported once per series");

  EvalDiagnostics d2;
  const auto h = ev.evaluate("inherit", {}, {50.0, 500.0}, &d2);
  expect_true(h == std::vector<double>({0.0, 0.0}), "inherit: no own curve (zeros)");
  expect_true(!d2.has_warnings(), "inherit: not a warning");

  expect_true(ev.evaluate("lognormal", {}, {}).empty(), "empty input: empty output");
  expect_true(fragility::parse_fragility_model("Lognormal") == fragility::FragilityModel::Unknown,
              "model names are exact lowercase");
}

void test_malformed_parameters() {
  const DistributionEvaluator ev;
  EvalDiagnostics diag;
  const auto p = ev.evaluate("weibull", {{"shape", -1.0}, {"scale", 10.0}}, {5.0, 50.0}, &diag);

  expect_true(p == std::vector<double>({0.0, 0.0}), "malformed params: NaN coerced to 0");
  expect_true(diag.nonfinite_coerced == 2 && diag.has_warnings(), "malformed params: coercions counted");
}

void test_invalid_defaults() {
  FragilityDefaults d;
  d.lognormal_dispersion = 0.0;
  expect_error([&] { DistributionEvaluator ev(d); (void)ev; },
               ErrorCode::kInvalidConfig, "defaults: zero dispersion rejected at construction");

  FragilityDefaults ok;
  ok.weibull_scale = 40.0;
  const DistributionEvaluator ev(ok);
  expect_near(ev.evaluate("weibull", {}, {40.0})[0], 1.0 - std::exp(-1.0),
              "defaults: custom defaults applied", 1e-12);
}

}  // namespace
}  // namespace clirisk

int main() {
  using namespace clirisk;

  test_lognormal_reference();
  test_weibull_reference();
  test_logistic_reference();
  test_monotonic_sweep();
  test_missing_points();
  test_unknown_and_inherit();
  test_malformed_parameters();
  test_invalid_defaults();

  return selftest::exit_code();
}

/*
  Fragility Engine Selftest (reducer, combiner, computer)

  Checks:
    1) Grid reduction: worst cell dominates; per-timestep max with short cells.
    2) Series combination: reference value, union of variables, NaN coercion,
       combined(v) >= max(own(v), child_combined(v)).
    3) compute_for_tree: post-order fold, variable restriction, empty series,
       unknown / inherit models, input tree left untouched.
    4) compute_timeseries: aligned series, nodes without curves omitted.

  Framework-free; non-zero return code indicates failure.
*/

#include <cmath>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "engine/climate/climate_types.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/fragility/distribution.hpp"
#include "engine/fragility/fragility_computer.hpp"
#include "engine/fragility/grid_reducer.hpp"
#include "engine/fragility/reliability_combiner.hpp"
#include "engine/hbom/hbom_types.hpp"

namespace clirisk {
namespace {

using namespace clirisk::selftest;
using climate::GridCell;
using climate::PreparedClimateDataset;
using hbom::ComponentNode;
using hbom::HazardBinding;
using hbom::HbomTree;

const char* kWind = "Wind";

// Weibull with shape 1 and unit intensity: PoF = 1 - exp(-1/scale).
// Pick scale so that PoF(1.0) == p.
HazardBinding binding_with_pof(double p) {
  HazardBinding b;
  b.fragility_model = "weibull";
  b.fragility_params = {{"shape", 1.0}, {"scale", 1.0 / -std::log(1.0 - p)}};
  return b;
}

ComponentNode node(const std::string& uuid) {
  ComponentNode n;
  n.uuid = uuid;
  n.label = uuid;
  return n;
}

GridCell cell(int idx, const std::string& var, std::vector<double> series) {
  GridCell c;
  c.grid_index = idx;
  c.climate[var] = std::move(series);
  return c;
}

PreparedClimateDataset unit_dataset() {
  PreparedClimateDataset d;
  d.variables = {"sfcWind"};
  d.times = {"2030-01-01"};
  d.cells.push_back(cell(0, "sfcWind", {1.0}));
  return d;
}

struct Engine {
  fragility::DistributionEvaluator evaluator;
  fragility::MaxGridReducer reducer;
  fragility::SeriesReliabilityCombiner combiner;
  fragility::FragilityComputer computer{evaluator, reducer, combiner};
};

// ----------------------------- reducer ---------------------------------------
void test_grid_reducer() {
  const fragility::MaxGridReducer r;

  expect_near(r.reduce_final_pof({}), 0.0, "reducer: no cells -> 0");

  hbom::GridCurveMap m;
  m[3].fc_values = {0.1, 0.2};
  m[3].final_pof = 0.2;
  m[7].fc_values = {0.5, 0.6, 0.7};
  m[7].final_pof = 0.7;
  m[9].fc_values = {0.9};
  m[9].final_pof = 0.9;
  expect_near(r.reduce_final_pof(m), 0.9, "reducer: worst cell dominates final PoF");

  const auto ts = r.reduce_per_timestep(m, 4);
  expect_true(ts.size() == 4, "reducer: per-timestep result aligned to time axis");
  expect_near(ts[0], 0.9, "reducer: t0 max over all cells");
  expect_near(ts[1], 0.6, "reducer: t1 ignores cells too short");
  expect_near(ts[2], 0.7, "reducer: t2 only the longest cell");
  expect_near(ts[3], 0.0, "reducer: beyond every cell -> 0");
}

// ----------------------------- combiner --------------------------------------
void test_combiner_reference() {
  const fragility::SeriesReliabilityCombiner c;
  const auto out = c.combine(hbom::PofByVar{{"v", 0.3}},
                             {hbom::PofByVar{{"v", 0.2}}, hbom::PofByVar{{"v", 0.4}}});
  expect_near(out.pof_by_var.at("v"), 0.664, "combiner: 1-(0.7)(1-0.52) == 0.664", 1e-12);
  expect_near(out.pof, 0.664, "combiner: pof is max over variables", 1e-12);
  expect_near(fragility::series_failure({}), 0.0, "combiner: no parts -> 0");
}

void test_combiner_union_and_nan() {
  const fragility::SeriesReliabilityCombiner c;
  fragility::CombineDiagnostics diag;
  const double nan = std::nan("");

  const auto out = c.combine(hbom::PofByVar{{"tas", 0.1}, {"hurs", nan}},
                             {hbom::PofByVar{{"pr", 0.25}}, hbom::PofByVar{{"tas", 0.5}}}, &diag);
  expect_true(out.pof_by_var.size() == 3, "combiner: result covers the union of variables");
  expect_near(out.pof_by_var.at("hurs"), 0.0, "combiner: NaN own PoF coerced to 0");
  expect_near(out.pof_by_var.at("pr"), 0.25, "combiner: child-only variable carried up");
  expect_near(out.pof_by_var.at("tas"), 1.0 - 0.9 * 0.5, "combiner: own and child combined in series");
  expect_near(out.pof, 0.55, "combiner: pof is max over variables");
  expect_true(diag.nonfinite_coerced == 1, "combiner: coercion counted");
  for (const auto& kv : out.pof_by_var) {
    expect_true(std::isfinite(kv.second), "combiner: no NaN escapes (" + kv.first + ")");
  }
}

void test_combiner_bounds_property() {
  const fragility::SeriesReliabilityCombiner c;
  std::uint64_t s = 0x9e3779b97f4a7c15ull;
  auto next = [&s]() {
    s = s * 6364136223846793005ull + 1442695040888963407ull;
    return static_cast<double>(s >> 11) / static_cast<double>(1ull << 53);
  };

  bool ok = true;
  for (int trial = 0; trial < 500; ++trial) {
    const double own = next();
    std::vector<hbom::PofByVar> kids;
    std::vector<double> kid_vals;
    const int n = static_cast<int>(next() * 5.0);
    for (int k = 0; k < n; ++k) {
      kid_vals.push_back(next());
      kids.push_back(hbom::PofByVar{{"v", kid_vals.back()}});
    }
    const double child = fragility::series_failure(kid_vals);
    const auto out = c.combine(hbom::PofByVar{{"v", own}}, kids);
    const double got = out.pof_by_var.at("v");
    if (!(got >= own && got >= child && got <= 1.0)) ok = false;
  }
  expect_true(ok, "combiner: combined(v) >= max(own, child_combined) and <= 1");
}

// ----------------------------- computer --------------------------------------
void test_compute_scenario_series() {
  Engine e;

  ComponentNode parent = node("P");
  parent.hazards[kWind] = binding_with_pof(0.3);
  ComponentNode c1 = node("C1");
  c1.hazards[kWind] = binding_with_pof(0.2);
  ComponentNode c2 = node("C2");
  c2.hazards[kWind] = binding_with_pof(0.4);
  parent.subcomponents = {c1, c2};

  const HbomTree tree{"energy", {parent}};
  fragility::ComputeStats stats;
  const HbomTree out = e.computer.compute_for_tree(tree, kWind, unit_dataset(), &stats);

  const ComponentNode& p = out.components.at(0);
  expect_near(p.subcomponents[0].pof, 0.2, "compute: leaf C1 own PoF", 1e-12);
  expect_near(p.subcomponents[1].pof, 0.4, "compute: leaf C2 own PoF", 1e-12);
  expect_near(p.pof_by_var.at("sfcWind"), 0.664, "compute: parent combines own with children", 1e-12);
  expect_near(p.pof, 0.664, "compute: parent pof", 1e-12);
  expect_true(stats.nodes_visited == 3 && stats.nodes_with_curves == 3, "compute: stats count nodes");

  const auto& curves = p.hazards.at(kWind).fragility_curves.at("sfcWind");
  expect_true(curves.size() == 1 && curves.count(0) == 1, "compute: curves keyed by cell position");
  expect_true(curves.at(0).x_values == std::vector<double>({1.0}), "compute: x_values keep raw intensity");

  // Input is left untouched.
  const ComponentNode& in = tree.components.at(0);
  expect_true(in.pof == 0.0 && in.pof_by_var.empty(), "compute: input tree results untouched");
  expect_true(in.hazards.at(kWind).fragility_curves.empty(), "compute: input tree curves untouched");
}

void test_compute_variable_restriction() {
  Engine e;

  ComponentNode n = node("T");
  HazardBinding b;
  b.fragility_model = "logistic";
  b.fragility_params = {{"mid_point", 300.0}, {"slope", 0.5}};
  b.climate_variable = std::string("tas");
  n.hazards["Heat Stress"] = b;

  PreparedClimateDataset d;
  d.variables = {"tas", "hurs"};
  d.times = {"t0", "t1"};
  GridCell c;
  c.grid_index = 4;
  c.climate["tas"] = {290.0, 310.0};
  c.climate["hurs"] = {60.0, 95.0};
  d.cells.push_back(c);

  const HbomTree out = e.computer.compute_for_tree(HbomTree{"s", {n}}, "Heat Stress", d);
  const ComponentNode& r = out.components.at(0);
  const auto& fc = r.hazards.at("Heat Stress").fragility_curves;

  expect_true(fc.size() == 1 && fc.count("tas") == 1, "restriction: only the bound variable evaluated");
  expect_true(r.pof_by_var.size() == 1 && r.pof_by_var.count("tas") == 1, "restriction: pof_by_var only tas");
  expect_near(r.pof, 1.0 / (1.0 + std::exp(-5.0)), "restriction: final PoF is last time step", 1e-12);
}

void test_compute_repeated_grid_index() {
  Engine e;

  ComponentNode n = node("W");
  n.hazards[kWind].fragility_model = "weibull";  // defaults: shape 2, scale 100

  PreparedClimateDataset d;
  d.variables = {"sfcWind"};
  d.times = {"t0"};
  d.cells.push_back(cell(0, "sfcWind", {500.0}));
  d.cells.push_back(cell(0, "sfcWind", {1.0}));

  fragility::ComputeStats stats;
  const HbomTree out = e.computer.compute_for_tree(HbomTree{"s", {n}}, kWind, d, &stats);
  const ComponentNode& r = out.components.at(0);
  const auto& grids = r.hazards.at(kWind).fragility_curves.at("sfcWind");

  expect_true(grids.size() == 2 && stats.grid_curves == 2, "repeated grid_index: one curve per cell");
  expect_near(r.pof, -std::expm1(-25.0), "repeated grid_index: worst cell dominates", 1e-12);

  const fragility::PofTimeSeries ts = e.computer.compute_timeseries(HbomTree{"s", {n}}, kWind, d);
  expect_near(ts.at("W").at("sfcWind").at(0), -std::expm1(-25.0),
              "repeated grid_index: per-timestep max sees every cell", 1e-12);
}

void test_compute_empty_and_unknown() {
  Engine e;

  ComponentNode root = node("R");
  root.hazards[kWind].fragility_model = "gumbel";   // unknown
  ComponentNode leaf = node("L");
  leaf.hazards[kWind] = binding_with_pof(0.5);
  root.subcomponents = {leaf};

  PreparedClimateDataset d;
  d.variables = {"sfcWind"};
  d.times = {"t0"};
  d.cells.push_back(cell(0, "sfcWind", {}));         // empty series
  d.cells.push_back(cell(1, "pr", {3.0}));           // variable absent
  d.cells.push_back(cell(2, "sfcWind", {1.0}));

  std::ostringstream captured;
  set_log_sink(&captured);
  reset_log_counters();
  fragility::ComputeStats stats;
  const HbomTree out = e.computer.compute_for_tree(HbomTree{"s", {root}}, kWind, d, &stats);
  set_log_sink(nullptr);
  const ComponentNode& r = out.components.at(0);
  const ComponentNode& l = r.subcomponents.at(0);

  const auto& grids = l.hazards.at(kWind).fragility_curves.at("sfcWind");
  expect_true(grids.at(0).x_values == std::vector<double>({0.0}) &&
                  grids.at(0).fc_values == std::vector<double>({0.0}) &&
                  grids.at(0).final_pof == 0.0,
              "empty series: single-point zero curve");
  expect_true(grids.at(1).fc_values == std::vector<double>({0.0}), "absent variable: single-point zero curve");
  expect_near(l.pof, 0.5, "empty series: other cells still reduce by max", 1e-12);
  expect_true(stats.empty_series == 4, "empty series: counted (2 cells x 2 nodes)");

  const auto& rg = r.hazards.at(kWind).fragility_curves.at("sfcWind");
  expect_true(rg.at(2).fc_values == std::vector<double>({0.0}), "unknown model: zero-filled curve");
  expect_near(r.pof, 0.5, "unknown model: node still combines children");
  expect_true(stats.eval.unknown_model > 0 && stats.warned_nodes == 1, "unknown model: one warned node");
  expect_true(log_emitted(LogLevel::WARN) == 1, "unknown model: warned once per node, not per value");
  expect_true(captured.str().find("unknown model") != std::string::npos, "unknown model: warning names the fault");
}

void test_compute_inherit_and_absent_hazard() {
  Engine e;

  ComponentNode root = node("R");
  root.hazards[kWind].fragility_model = "inherit";
  ComponentNode leaf = node("L");
  leaf.hazards[kWind] = binding_with_pof(0.25);
  ComponentNode bare = node("B");
  root.subcomponents = {leaf, bare};

  fragility::ComputeStats stats;
  const HbomTree out = e.computer.compute_for_tree(HbomTree{"s", {root}}, kWind, unit_dataset(), &stats);
  const ComponentNode& r = out.components.at(0);
  expect_true(r.hazards.at(kWind).fragility_curves.empty(), "inherit: no own curves");
  expect_near(r.pof, 0.25, "inherit: PoF comes from children", 1e-12);
  expect_true(stats.inherit_nodes == 1, "inherit: counted");
  expect_near(r.subcomponents.at(1).pof, 0.0, "no binding: zero PoF");

  const HbomTree none = e.computer.compute_for_tree(HbomTree{"s", {root}}, "Drought", unit_dataset());
  expect_near(none.components.at(0).pof, 0.0, "absent hazard: zero PoF, no error");
  const auto ts = e.computer.compute_timeseries(HbomTree{"s", {root}}, "Drought", unit_dataset());
  expect_true(ts.empty(), "absent hazard: empty time series");
}

void test_timeseries() {
  Engine e;

  ComponentNode root = node("R");
  root.hazards[kWind].fragility_model = "inherit";
  ComponentNode a = node("A");
  HazardBinding b;
  b.fragility_model = "logistic";
  b.fragility_params = {{"mid_point", 0.0}, {"slope", 1.0}};
  a.hazards[kWind] = b;
  root.subcomponents = {a};

  PreparedClimateDataset d;
  d.variables = {"sfcWind"};
  d.times = {"t0", "t1", "t2"};
  d.cells.push_back(cell(0, "sfcWind", {0.0, -50.0, 50.0}));
  d.cells.push_back(cell(1, "sfcWind", {-50.0, 50.0}));       // shorter than times

  const auto ts = e.computer.compute_timeseries(HbomTree{"s", {root}}, kWind, d);
  expect_true(ts.size() == 1 && ts.count("A") == 1, "timeseries: nodes without curves omitted");

  const auto& s = ts.at("A").at("sfcWind");
  expect_true(s.size() == 3, "timeseries: aligned to dataset times");
  expect_near(s[0], 0.5, "timeseries: t0 max over cells", 1e-12);
  expect_near(s[1], 1.0 / (1.0 + std::exp(-50.0)), "timeseries: t1 max over cells", 1e-12);
  expect_near(s[2], 1.0 / (1.0 + std::exp(-50.0)), "timeseries: t2 short cell contributes 0", 1e-12);
}

}  // namespace
}  // namespace clirisk

int main() {
  using namespace clirisk;

  set_log_level(LogLevel::WARN);

  test_grid_reducer();
  test_combiner_reference();
  test_combiner_union_and_nan();
  test_combiner_bounds_property();
  test_compute_scenario_series();
  test_compute_variable_restriction();
  test_compute_repeated_grid_index();
  test_compute_empty_and_unknown();
  test_compute_inherit_and_absent_hazard();
  test_timeseries();

  return selftest::exit_code();
}

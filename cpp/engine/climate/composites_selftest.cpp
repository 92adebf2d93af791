/*
  Climate Composites / Hazard Catalog Selftest

  Checks:
    1) Heat index: passthrough below the regression window, Rothfusz inside it.
    2) Registry: apply() adds the variable to the dataset and every cell;
       missing inputs give null points or an absent series; unknown names raise.
    3) Hazard catalog lookups and hazard-driven composite application.

  Framework-free; non-zero return code indicates failure.
*/

#include <cmath>
#include <string>
#include <vector>

#include "engine/climate/composites.hpp"
#include "engine/climate/hazard_catalog.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"

namespace clirisk {
namespace {

using namespace clirisk::selftest;
using namespace clirisk::climate;

double k_from_f(double f) {
  return (f - 32.0) * 5.0 / 9.0 + 273.15;
}

void test_heat_index() {
  expect_near(heat_index_f(k_from_f(70.0), 90.0), 70.0, "heat index: below 80F returns temperature", 1e-9);
  expect_near(heat_index_f(k_from_f(95.0), 30.0), 95.0, "heat index: below 40% RH returns temperature", 1e-9);

  // NWS table: 90F / 70% RH -> ~105.9F (Rothfusz).
  const double hi = heat_index_f(k_from_f(90.0), 70.0);
  expect_near(hi, 105.92, "heat index: Rothfusz regression reference", 1e-3);
  expect_true(heat_index_f(k_from_f(100.0), 60.0) > heat_index_f(k_from_f(90.0), 60.0),
              "heat index: increases with temperature");
}

PreparedClimateDataset heat_dataset() {
  PreparedClimateDataset d;
  d.variables = {"tas", "hurs"};
  d.times = {"t0", "t1", "t2"};

  GridCell a;
  a.grid_index = 0;
  a.climate["tas"] = {k_from_f(90.0), kNaN, k_from_f(70.0)};
  a.climate["hurs"] = {70.0, 50.0, 90.0};
  d.cells.push_back(a);

  GridCell b;
  b.grid_index = 1;
  b.climate["tas"] = {k_from_f(85.0), k_from_f(85.0), k_from_f(85.0)};
  d.cells.push_back(b);  // no hurs
  return d;
}

void test_registry_apply() {
  const CompositeRegistry reg = make_default_composite_registry();
  expect_true(reg.has("hi") && reg.names() == std::vector<std::string>{"hi"}, "registry: built-in hi");

  PreparedClimateDataset d = heat_dataset();
  reg.apply("hi", d);

  expect_true(d.has_variable("hi") && d.variables.back() == "hi", "apply: variable appended");
  const Series* s = d.cells[0].series("hi");
  expect_true(s && s->size() == 3, "apply: series aligned");
  if (s && s->size() == 3) {
    expect_near((*s)[0], 105.92, "apply: pointwise transform", 1e-3);
    expect_true(std::isnan((*s)[1]), "apply: missing input point -> null point");
    expect_near((*s)[2], 70.0, "apply: passthrough point", 1e-9);
  }
  expect_true(d.cells[1].series("hi") == nullptr, "apply: cell missing an input has no series");

  reg.apply("hi", d);
  expect_true(d.variables.size() == 3, "apply: idempotent on variable list");

  expect_error([&] { reg.apply("wbgt", d); }, ErrorCode::kInvalidArgument, "apply: unknown composite raises");
  expect_error([&] { (void)reg.compute("wbgt", d.cells[0]); }, ErrorCode::kInvalidArgument,
               "compute: unknown composite raises");

  CompositeRegistry custom;
  CompositeSpec spread;
  spread.inputs = {"tasmax", "tasmin"};
  spread.fn = [](const std::vector<double>& in) { return in[0] - in[1]; };
  custom.register_composite("dtr", spread);
  GridCell c;
  c.climate["tasmax"] = {300.0, 305.0};
  c.climate["tasmin"] = {290.0, 292.0, 280.0};
  const Series dtr = custom.compute("dtr", c);
  expect_true(dtr.size() == 2 && dtr[0] == 10.0 && dtr[1] == 13.0, "compute: custom composite, shortest input wins");

  CompositeSpec empty;
  expect_error([&] { custom.register_composite("bad", empty); }, ErrorCode::kInvalidArgument,
               "register: missing transform rejected");
}

void test_hazard_catalog() {
  const HazardCatalog cat = make_default_hazard_catalog();
  expect_true(cat.names() == std::vector<std::string>({"Heat Stress", "Drought", "Wind"}), "catalog: built-ins");

  const HazardDefinition* heat = cat.find("Heat Stress");
  expect_true(heat && heat->all_variables() == std::vector<std::string>({"tas", "hurs", "hi"}),
              "catalog: heat stress variables");
  expect_true(cat.find("Flood") == nullptr, "catalog: find() absent -> nullptr");
  expect_error([&] { (void)cat.get("Flood"); }, ErrorCode::kInvalidArgument, "catalog: get() absent raises");
  expect_true(cat.get("Wind").base_variables == std::vector<std::string>{"sfcWind"}, "catalog: wind variables");

  const CompositeRegistry reg = make_default_composite_registry();

  PreparedClimateDataset d = heat_dataset();
  const auto applied = apply_hazard_composites(reg, *heat, d);
  expect_true(applied == std::vector<std::string>{"hi"} && d.has_variable("hi"), "hazard composites: hi applied");

  PreparedClimateDataset no_hurs = heat_dataset();
  no_hurs.variables = {"tas"};
  expect_true(apply_hazard_composites(reg, *heat, no_hurs).empty() && !no_hurs.has_variable("hi"),
              "hazard composites: skipped when inputs absent from dataset");

  PreparedClimateDataset wind = heat_dataset();
  expect_true(apply_hazard_composites(reg, cat.get("Wind"), wind).empty(), "hazard composites: none for wind");
}

}  // namespace
}  // namespace clirisk

int main() {
  using namespace clirisk;

  set_log_level(LogLevel::ERROR);

  test_heat_index();
  test_registry_apply();
  test_hazard_catalog();

  return selftest::exit_code();
}

/*
  JSON IO Selftest

  Checks:
    1) Parser strictness: NaN/Inf literals, trailing characters, error location.
    2) Writer layout (pretty + compact) and null for every non-finite number.
    3) Document readers: records, curve documents, climate dataset
       (null -> NaN, whole-variable null -> absent, grid_index default).
    4) Flat HBOM written then read back is unchanged; tree output shape.
    5) Engine settings overlay.

  Framework-free; non-zero return code indicates failure.
*/

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/hbom/tree_reconstructor.hpp"
#include "engine/io/hbom_json.hpp"
#include "engine/io/json_value.hpp"
#include "engine/io/json_writer.hpp"
#include "engine/io/settings_json.hpp"

namespace clirisk {
namespace {

using namespace clirisk::selftest;
using io::JsonParseError;
using io::JsonValue;

JsonValue parse_or_fail(const std::string& text, const std::string& what) {
  JsonValue v;
  JsonParseError err;
  if (!io::parse_json(text, &v, &err)) {
    fail(what + ": parse failed: " + io::format_parse_error(err));
  }
  return v;
}

bool contains(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

void expect_json_has_no_nonfinite_literals(const std::string& json) {
  expect_true(!contains(json, "nan") && !contains(json, "NaN"), "JSON must not contain NaN literals");
  expect_true(!contains(json, "inf") && !contains(json, "Infinity"), "JSON must not contain Inf literals");
}

void test_parser_strictness() {
  JsonValue v;
  JsonParseError err;

  expect_true(!io::parse_json("[1, NaN]", &v, &err), "parser: NaN literal rejected");
  expect_true(!io::parse_json("[Infinity]", &v, &err), "parser: Infinity literal rejected");
  expect_true(!io::parse_json("{\"a\": 1} x", &v, &err), "parser: trailing characters rejected");
  expect_true(!io::parse_json("[01]", &v, &err), "parser: leading zero rejected");

  expect_true(!io::parse_json("{\n  \"a\": [1,\n  ]\n}", &v, &err), "parser: trailing comma rejected");
  expect_true(err.line == 3 && err.col == 3, "parser: error carries line/column");

  std::string deep(io::kMaxJsonDepth + 1, '[');
  deep += std::string(io::kMaxJsonDepth + 1, ']');
  expect_true(!io::parse_json(deep, &v, &err), "parser: nesting depth bounded");

  const JsonValue ok = parse_or_fail("{\"s\": \"caf\\u00e9 \\ud83d\\ude00\", \"n\": null, \"b\": false, \"x\": -1.5e2}",
                                     "parser: valid document");
  expect_true(ok.find("s") && ok.find("s")->str == "caf\xc3\xa9 \xf0\x9f\x98\x80", "parser: unicode escapes decoded");
  expect_true(ok.find("n") && ok.find("n")->is_null(), "parser: null preserved");
  expect_true(ok.find("x") && ok.find("x")->num == -150.0, "parser: exponent numbers");
  expect_true(ok.find("missing") == nullptr, "parser: find() absent key");
}

void test_writer_layout() {
  std::ostringstream pretty;
  {
    io::JsonWriter w(pretty, io::JsonWriteOptions{});
    w.begin_object();
    w.key("a");
    w.begin_array();
    w.number(1);
    w.number(2);
    w.end_array();
    w.key("b");
    w.begin_object();
    w.end_object();
    w.key("c");
    w.number(std::nan(""));
    w.end_object();
  }
  expect_eq_str(pretty.str(),
                "{\n  \"a\": [\n    1,\n    2\n  ],\n  \"b\": {},\n  \"c\": null\n}",
                "writer: pretty layout");

  const JsonValue v = parse_or_fail("{\"z\": [true, null, {\"k\": \"v\"}], \"a\": 0.25}", "writer: input");
  expect_eq_str(io::to_compact_json(v), "{\"a\":0.25,\"z\":[true,null,{\"k\":\"v\"}]}",
                "writer: compact output with sorted keys");

  std::ostringstream skip;
  {
    io::JsonWriteOptions opt;
    opt.pretty = false;
    opt.emit_null_for_unset = false;
    io::JsonWriter w(skip, opt);
    w.begin_object();
    w.key_number_optional("set", 1.5);
    w.key_number_optional("unset", std::nan(""));
    w.end_object();
  }
  expect_eq_str(skip.str(), "{\"set\":1.5}", "writer: unset numbers dropped when requested");

  expect_eq_str(io::escape_json("a\"b\\c\n\x01"), "a\\\"b\\\\c\\n\\u0001", "writer: string escaping");

  expect_eq_str(io::format_json_number(0.1), "0.1", "writer: short decimals stay short");
  const double third = 1.0 / 3.0;
  expect_true(std::strtod(io::format_json_number(third).c_str(), nullptr) == third,
              "writer: 1/3 reads back exactly");
  const double tiny = 5e-324;
  expect_true(std::strtod(io::format_json_number(tiny).c_str(), nullptr) == tiny,
              "writer: denormal reads back exactly");
}

void test_read_records() {
  const JsonValue root = parse_or_fail(R"({"nodes": [
    {"uuid": "A", "label": "Substation", "asset_type": "substation", "level": 0,
     "node_path": "A", "parent_uuid": null, "children_uuids": ["B"],
     "canonical_component_type": "substation",
     "metadata": {"voltage_kv": 138, "terrain": "coastal", "tags": ["x", "y"], "active": true}},
    {"uuid": "B", "label": "Breaker", "parent_uuid": "A"}
  ]})", "records: input");

  std::vector<hbom::FlatHbomRecord> recs;
  JsonParseError err;
  expect_true(io::read_flat_records(root, &recs, &err), "records: wrapped form accepted");
  expect_true(recs.size() == 2, "records: two records");
  if (recs.size() == 2) {
    const auto& a = recs[0];
    expect_true(!a.parent_uuid && a.children_uuids == std::vector<std::string>{"B"}, "records: links");
    expect_true(a.level && *a.level == 0, "records: level");
    expect_true(a.canonical_component_type && *a.canonical_component_type == "substation", "records: canonical type");
    expect_true(a.metadata.at("voltage_kv") == "138" && a.metadata.at("terrain") == "coastal",
                "records: scalar metadata stringified");
    expect_true(a.metadata.at("tags") == "[\"x\",\"y\"]" && a.metadata.at("active") == "true",
                "records: nested metadata kept as compact JSON");
    const auto& b = recs[1];
    expect_true(b.parent_uuid && *b.parent_uuid == "A" && b.children_uuids.empty() && !b.level,
                "records: optional fields default");
  }

  const JsonValue bare = parse_or_fail(R"([{"uuid": "A", "label": "x"}, {"label": "no uuid"}])", "records: bad");
  expect_true(!io::read_flat_records(bare, &recs, &err), "records: missing uuid rejected");
  expect_true(contains(err.message, "nodes[1].uuid"), "records: error names the path");

  const JsonValue wrong = parse_or_fail(R"({"items": []})", "records: wrong wrapper");
  expect_true(!io::read_flat_records(wrong, &recs, &err), "records: unknown wrapper rejected");
}

void test_read_curves() {
  const JsonValue root = parse_or_fail(R"([
    {"component_uuid": "B", "hazard": "Wind", "model": "weibull",
     "parameters": {"shape": 2.5, "scale": null}, "climate_variable": "sfcWind",
     "conditions": {"terrain": "coastal"}, "priority": 3, "provenance": {"source": "FEMA"}},
    {"component_uuid": "B", "model": "lognormal"}
  ])", "curves: input");

  std::vector<hbom::FragilityCurveDoc> docs;
  JsonParseError err;
  expect_true(io::read_curve_documents(root, &docs, &err), "curves: bare array accepted");
  expect_true(docs.size() == 2, "curves: two documents");
  if (docs.size() == 2) {
    const auto& d = docs[0];
    expect_true(d.parameters.size() == 1 && d.parameters.at("shape") == 2.5, "curves: null parameter skipped");
    expect_true(d.climate_variable && *d.climate_variable == "sfcWind", "curves: climate_variable");
    expect_true(d.priority == 3 && d.source == "FEMA", "curves: priority + provenance.source");
    expect_true(d.conditions.at("terrain") == "coastal", "curves: conditions");
    expect_true(docs[1].hazard == "Unknown" && docs[1].source == "Unknown" && docs[1].priority == 0,
                "curves: defaults");
  }

  // A non-numeric parameter is recovered as NaN; the batch still loads.
  const JsonValue odd = parse_or_fail(R"([
    {"component_uuid": "B", "model": "weibull", "parameters": {"shape": "2", "scale": 50}},
    {"component_uuid": "C", "model": "weibull", "parameters": {"shape": 2}}
  ])", "curves: non-numeric parameter");
  std::ostringstream captured;
  set_log_level(LogLevel::WARN);
  set_log_sink(&captured);
  reset_log_counters();
  const bool odd_ok = io::read_curve_documents(odd, &docs, &err);
  set_log_sink(nullptr);
  set_log_level(LogLevel::ERROR);
  expect_true(odd_ok && docs.size() == 2, "curves: non-numeric parameter does not fail the batch");
  if (docs.size() == 2) {
    expect_true(std::isnan(docs[0].parameters.at("shape")) && docs[0].parameters.at("scale") == 50.0,
                "curves: non-numeric parameter read as NaN, others kept");
    expect_true(docs[1].parameters.at("shape") == 2.0, "curves: later documents unaffected");
  }
  expect_true(log_emitted(LogLevel::WARN) == 1 && contains(captured.str(), "1 non-numeric"),
              "curves: one batch-level warning");

  const JsonValue bad = parse_or_fail(R"({"curves": [{"component_uuid": "B", "priority": 1.5}]})", "curves: bad");
  expect_true(!io::read_curve_documents(bad, &docs, &err), "curves: fractional priority rejected");
}

void test_read_climate() {
  const JsonValue root = parse_or_fail(R"({
    "variables": ["tas", "hurs"],
    "times": ["2030-01-01", "2031-01-01", "2032-01-01"],
    "data": [
      {"grid_index": 7, "bounds": {"min_lat": 29.5, "max_lat": 30.0, "min_lon": -95.5, "max_lon": -95.0},
       "climate": {"tas": [300.1, null, 305.2], "hurs": null}},
      {"climate": {"tas": [299.0, 301.0, 302.0], "hurs": [40, 50, 60]}}
    ]})", "climate: input");

  climate::PreparedClimateDataset ds;
  JsonParseError err;
  expect_true(io::read_climate_dataset(root, &ds, &err), "climate: dataset accepted");
  expect_true(ds.variables.size() == 2 && ds.times.size() == 3 && ds.cells.size() == 2, "climate: shape");
  if (ds.cells.size() == 2) {
    const auto& c0 = ds.cells[0];
    expect_true(c0.grid_index == 7 && c0.bounds.max_lon == -95.0, "climate: grid_index + bounds");
    expect_true(c0.series("tas") && std::isnan((*c0.series("tas"))[1]), "climate: null point -> NaN");
    expect_true(c0.series("hurs") == nullptr, "climate: whole-variable null -> absent");
    expect_true(ds.cells[1].grid_index == 1, "climate: grid_index defaults to position");
    expect_true(std::isnan(ds.cells[1].bounds.min_lat), "climate: missing bounds stay unset");
  }
  expect_true(ds.misaligned_series() == 0, "climate: series aligned with times");

  const JsonValue twins = parse_or_fail(R"({"variables": ["sfcWind"], "times": ["t0"], "data": [
      {"grid_index": 0, "climate": {"sfcWind": [500]}},
      {"grid_index": 0, "climate": {"sfcWind": [1]}}]})", "climate: repeated grid_index");
  std::ostringstream warned;
  set_log_level(LogLevel::WARN);
  set_log_sink(&warned);
  reset_log_counters();
  const bool twins_ok = io::read_climate_dataset(twins, &ds, &err);
  set_log_sink(nullptr);
  set_log_level(LogLevel::ERROR);
  expect_true(twins_ok && ds.cells.size() == 2, "climate: repeated grid_index keeps both cells");
  expect_true(log_emitted(LogLevel::WARN) == 1 && contains(warned.str(), "grid_index"),
              "climate: repeated grid_index warned once");

  const JsonValue bad = parse_or_fail(R"({"variables": ["tas"], "data": [{"climate": {"tas": ["hot"]}}]})", "climate: bad");
  expect_true(!io::read_climate_dataset(bad, &ds, &err), "climate: non-numeric point rejected");
  expect_true(contains(err.message, "data[0].climate.tas[0]"), "climate: error names the path");
}

void test_flat_roundtrip_and_tree_output() {
  const JsonValue recs_json = parse_or_fail(R"([
    {"uuid": "A", "label": "Plant", "asset_type": "plant", "parent_uuid": null, "children_uuids": ["B"],
     "metadata": {"owner": "coop"}},
    {"uuid": "B", "label": "Pump", "asset_type": "pump", "level": 1, "parent_uuid": "A"}
  ])", "roundtrip: records");
  const JsonValue curves_json = parse_or_fail(R"([
    {"component_uuid": "B", "hazard": "Drought", "model": "logistic",
     "parameters": {"mid_point": 10, "slope": 0.2}, "provenance": {"source": "lab"}}
  ])", "roundtrip: curves");

  std::vector<hbom::FlatHbomRecord> recs;
  std::vector<hbom::FragilityCurveDoc> docs;
  expect_true(io::read_flat_records(recs_json, &recs) && io::read_curve_documents(curves_json, &docs),
              "roundtrip: inputs read");

  const auto tree = hbom::reconstruct_tree(recs, docs);
  std::ostringstream first;
  io::write_flat_hbom_json(first, hbom::flatten(tree));

  const JsonValue again = parse_or_fail(first.str(), "roundtrip: written flat HBOM");
  std::vector<hbom::FlatHbomRecord> recs2;
  std::vector<hbom::FragilityCurveDoc> docs2;
  expect_true(io::read_flat_records(again, &recs2) && io::read_curve_documents(again, &docs2),
              "roundtrip: written document readable");

  std::ostringstream second;
  io::write_flat_hbom_json(second, hbom::flatten(hbom::reconstruct_tree(recs2, docs2)));
  expect_eq_str(second.str(), first.str(), "roundtrip: flat HBOM stable through write/read");
  if (docs2.size() > 0 && !docs2[0].parameters.empty()) {
    auto d = docs2[0];
    d.parameters.begin()->second = 1.0 / 3.0;
    std::ostringstream doc_json;
    io::write_flat_hbom_json(doc_json, hbom::FlatHbom{recs2, {d}});
    std::vector<hbom::FragilityCurveDoc> back;
    const JsonValue reread = parse_or_fail(doc_json.str(), "roundtrip: 1/3 parameter");
    expect_true(io::read_curve_documents(reread, &back) && back.size() == 1 &&
                    back[0].parameters.begin()->second == 1.0 / 3.0,
                "roundtrip: parameter 1/3 survives write/read exactly");
  }

  hbom::HbomTree computed{"water", tree};
  hbom::ComponentNode& pump = computed.components[0].subcomponents[0];
  hbom::GridCurve gc;
  gc.x_values = {std::nan(""), 12.0};
  gc.fc_values = {0.0, 0.6};
  gc.final_pof = 0.6;
  pump.hazards["Drought"].fragility_curves["pr"][3] = gc;
  pump.pof_by_var["pr"] = 0.6;
  pump.pof = 0.6;

  const std::string with = io::tree_to_json(computed);
  expect_json_has_no_nonfinite_literals(with);
  const JsonValue t = parse_or_fail(with, "tree: output parses");
  const JsonValue* comps = t.find("components");
  expect_true(t.find("sector") && t.find("sector")->str == "water" && comps && comps->arr.size() == 1,
              "tree: sector + components");
  if (comps && comps->arr.size() == 1) {
    const JsonValue& b = comps->arr[0].find("subcomponents")->arr.at(0);
    const JsonValue* cell = b.find("hazards")->find("Drought")->find("fragility_curves")->find("pr")->find("3");
    expect_true(cell && cell->find("x_values")->arr.at(0).is_null(), "tree: NaN x value written as null");
    expect_true(cell && cell->find("final_pof")->num == 0.6, "tree: curve keyed by cell position");
    expect_true(b.find("pof") && b.find("pof")->num == 0.6, "tree: pof written");
    expect_true(b.find("component_type")->str == "pump", "tree: component_type");
  }

  const std::string without = io::tree_to_json(computed, io::JsonWriteOptions{}, /*include_results=*/false);
  expect_true(!contains(without, "fragility_curves") && !contains(without, "\"pof\""),
              "tree: reconstruction output omits results");

  fragility::PofTimeSeries ts;
  ts["B"]["pr"] = {0.1, std::nan(""), 0.6};
  io::JsonWriteOptions compact;
  compact.pretty = false;
  expect_eq_str(io::timeseries_to_json(ts, compact), "{\"B\":{\"pr\":[0.1,null,0.6]}}", "timeseries: layout");
}

void test_settings_overlay() {
  const JsonValue cfg = parse_or_fail(R"({
    "fragility": {"lognormal_median": 80, "weibull_shape": 3},
    "tree": {"max_depth": 64, "curve_selection": "priority"},
    "output": {"pretty": false},
    "log_level": "warn",
    "apply_composites": false
  })", "settings: input");

  EngineSettings s = EngineSettings::defaults();
  JsonParseError err;
  expect_true(io::read_engine_settings(cfg, &s, &err), "settings: accepted");
  expect_true(s.fragility.lognormal_median == 80.0 && s.fragility.weibull_shape == 3.0,
              "settings: fragility overrides");
  expect_true(s.fragility.weibull_scale == 100.0, "settings: absent keys keep defaults");
  expect_true(s.tree.max_depth == 64 && s.tree.curve_selection == CurveSelection::kPriority, "settings: tree");
  expect_true(!s.output.pretty && s.output.indent_spaces == 2, "settings: output");
  expect_true(s.log_level == LogLevel::WARN && !s.apply_composites, "settings: log level + composites");

  const JsonValue bad = parse_or_fail(R"({"tree": {"curve_selection": "random"}})", "settings: bad");
  EngineSettings t = EngineSettings::defaults();
  expect_true(!io::read_engine_settings(bad, &t, &err), "settings: unknown selection rejected");
  expect_true(t.tree.curve_selection == CurveSelection::kFirst, "settings: failed overlay leaves input untouched");

  const JsonValue neg = parse_or_fail(R"({"fragility": {"weibull_scale": -1}})", "settings: invalid value");
  EngineSettings u = EngineSettings::defaults();
  expect_true(io::read_engine_settings(neg, &u, &err), "settings: range not checked by reader");
  expect_error([&] { u.validate_or_throw(); }, ErrorCode::kInvalidConfig, "settings: validate rejects negative scale");
}

}  // namespace
}  // namespace clirisk

int main() {
  using namespace clirisk;

  set_log_level(LogLevel::ERROR);

  test_parser_strictness();
  test_writer_layout();
  test_read_records();
  test_read_curves();
  test_read_climate();
  test_flat_roundtrip_and_tree_output();
  test_settings_overlay();

  return selftest::exit_code();
}

/*
  HBOM Reconstruction Selftest

  Checks:
    1) Basic link: root A with child B carrying its curve; hazard filter prunes
       hazard data but never structure; hazard-scoped tree construction.
    2) Curve grouping defaults and the three selection strategies.
    3) Structural faults: dangling / duplicate / multi-parent / orphan records
       are dropped and counted; cycles and excess depth raise.
    4) reconstruct(flatten(tree)) == tree.

  Framework-free; non-zero return code indicates failure.
*/

#include <optional>
#include <string>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/hbom/curve_selection.hpp"
#include "engine/hbom/tree_reconstructor.hpp"

namespace clirisk {
namespace {

using namespace clirisk::selftest;
using namespace clirisk::hbom;

FlatHbomRecord rec(const std::string& uuid,
                   std::optional<std::string> parent,
                   std::vector<std::string> children) {
  FlatHbomRecord r;
  r.uuid = uuid;
  r.label = "label-" + uuid;
  r.asset_type = "equipment";
  r.parent_uuid = std::move(parent);
  r.children_uuids = std::move(children);
  return r;
}

FragilityCurveDoc curve(const std::string& uuid, const std::string& hazard,
                        const std::string& model, int priority = 0) {
  FragilityCurveDoc d;
  d.component_uuid = uuid;
  d.hazard = hazard;
  d.model = model;
  d.priority = priority;
  d.parameters = {{"median", 100.0}, {"dispersion", 0.3}};
  return d;
}

bool same_binding(const HazardBinding& a, const HazardBinding& b) {
  return a.fragility_model == b.fragility_model && a.fragility_params == b.fragility_params &&
         a.climate_variable == b.climate_variable && a.conditions == b.conditions &&
         a.priority == b.priority && a.source == b.source;
}

bool same_node(const ComponentNode& a, const ComponentNode& b) {
  if (a.uuid != b.uuid || a.label != b.label || a.component_type != b.component_type ||
      a.canonical_component_type != b.canonical_component_type || a.level != b.level ||
      a.node_path != b.node_path || a.metadata != b.metadata) {
    return false;
  }
  if (a.hazards.size() != b.hazards.size()) return false;
  for (const auto& kv : a.hazards) {
    auto it = b.hazards.find(kv.first);
    if (it == b.hazards.end() || !same_binding(kv.second, it->second)) return false;
  }
  if (a.subcomponents.size() != b.subcomponents.size()) return false;
  for (size_t i = 0; i < a.subcomponents.size(); ++i) {
    if (!same_node(a.subcomponents[i], b.subcomponents[i])) return false;
  }
  return true;
}

bool same_forest(const std::vector<ComponentNode>& a, const std::vector<ComponentNode>& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (!same_node(a[i], b[i])) return false;
  }
  return true;
}

void test_basic_link_and_filter() {
  const std::vector<FlatHbomRecord> flat{rec("A", std::nullopt, {"B"}), rec("B", "A", {})};
  const std::vector<FragilityCurveDoc> curves{curve("B", "Wind", "weibull")};

  ReconstructReport rep;
  const FirstCurveWins first;
  auto roots = reconstruct_tree(flat, curves, first, {}, &rep);

  expect_true(roots.size() == 1 && roots[0].uuid == "A", "link: single root A");
  expect_true(roots[0].subcomponents.size() == 1 && roots[0].subcomponents[0].uuid == "B",
              "link: B nested under A");
  expect_true(roots[0].hazards.empty(), "link: A has no curves");
  expect_true(roots[0].subcomponents[0].hazards.count("Wind") == 1, "link: B carries the Wind curve");
  expect_true(roots[0].component_type == "equipment", "link: asset_type becomes component_type");
  expect_true(rep.linked_children == 1 && rep.curves_attached == 1 && rep.dropped_references() == 0,
              "link: report counts");

  filter_hazard(roots, "Heat Stress");
  expect_true(roots.size() == 1 && roots[0].subcomponents.size() == 1, "filter: structure preserved");
  expect_true(roots[0].hazards.empty() && roots[0].subcomponents[0].hazards.empty(),
              "filter: other hazards pruned on every node");

  auto again = reconstruct_tree(flat, curves);
  filter_hazard(again, "Wind");
  expect_true(again[0].subcomponents[0].hazards.count("Wind") == 1, "filter: matching hazard kept");

  expect_true(reconstruct_tree({}, curves).empty(), "empty input: empty forest");
}

void test_hazard_scoped_tree() {
  const std::vector<FlatHbomRecord> flat{rec("A", std::nullopt, {"B"}), rec("B", "A", {})};
  const std::vector<FragilityCurveDoc> curves{curve("A", "Drought", "lognormal"),
                                              curve("B", "Wind", "weibull"),
                                              curve("B", "Heat Stress", "logistic")};
  const FirstCurveWins first;

  const HbomTree wind = build_hbom_tree("energy", flat, curves, "Wind", first);
  expect_true(wind.sector == "energy" && wind.components.size() == 1, "scoped: sector + single root");
  expect_true(wind.components[0].hazards.empty(), "scoped: other hazard dropped from root");
  const ComponentNode& b = wind.components[0].subcomponents.at(0);
  expect_true(b.hazards.size() == 1 && b.hazards.count("Wind") == 1, "scoped: only the requested hazard kept");

  const HbomTree all = build_hbom_tree("energy", flat, curves, "", first);
  expect_true(all.components[0].hazards.count("Drought") == 1 &&
                  all.components[0].subcomponents.at(0).hazards.size() == 2,
              "scoped: empty hazard keeps every binding");
}

void test_curve_defaults_and_selection() {
  FlatHbomRecord a = rec("A", std::nullopt, {});
  a.asset_type.clear();
  a.metadata = {{"terrain", "coastal"}, {"age", "old"}};

  FragilityCurveDoc unnamed;
  unnamed.component_uuid = "A";
  unnamed.model = "logistic";

  FragilityCurveDoc c1 = curve("A", "Wind", "weibull", 1);
  FragilityCurveDoc c2 = curve("A", "Wind", "lognormal", 5);
  FragilityCurveDoc c3 = curve("A", "Wind", "logistic", 3);
  c3.conditions = {{"terrain", "coastal"}};
  c3.source = "field-study";
  FragilityCurveDoc c4 = curve("A", "Wind", "weibull", 9);
  c4.conditions = {{"terrain", "inland"}};
  FragilityCurveDoc stray = curve("Z", "Wind", "weibull");

  const std::vector<FragilityCurveDoc> docs{unnamed, c1, c2, c3, c4, stray};
  const std::vector<FlatHbomRecord> flat{a};

  ReconstructReport rep;
  const auto first = reconstruct_tree(flat, docs, FirstCurveWins{}, {}, &rep);
  const ComponentNode& n = first.at(0);
  expect_true(n.component_type == "unknown", "defaults: missing asset_type -> unknown");
  expect_true(n.hazards.count("Unknown") == 1, "defaults: curve without hazard grouped under Unknown");
  expect_true(n.hazards.at("Unknown").priority == 0 && n.hazards.at("Unknown").source == "Unknown",
              "defaults: priority 0, source Unknown");
  expect_true(n.hazards.at("Wind").fragility_model == "weibull" && n.hazards.at("Wind").priority == 1,
              "first: first document per hazard wins");
  expect_true(rep.curves_unmatched == 1 && rep.curves_shadowed == 3, "first: unmatched and shadowed counted");

  const auto prio = reconstruct_tree(flat, docs, HighestPriorityWins{});
  expect_true(prio.at(0).hazards.at("Wind").priority == 9, "priority: highest priority wins");

  const auto cond = reconstruct_tree(flat, docs, ConditionMatchWins{});
  const HazardBinding& cb = cond.at(0).hazards.at("Wind");
  expect_true(cb.priority == 5 && cb.fragility_model == "lognormal",
              "conditions: matching (incl. unconditioned) docs beat non-matching, then priority");

  FragilityCurveDoc p1 = curve("A", "Wind", "weibull", 2);
  FragilityCurveDoc p2 = curve("A", "Wind", "lognormal", 2);
  const auto tie = reconstruct_tree(flat, {p1, p2}, HighestPriorityWins{});
  expect_true(tie.at(0).hazards.at("Wind").fragility_model == "weibull", "priority: ties keep document order");

  expect_true(conditions_match({}, a.metadata), "conditions: empty conditions match anything");
  expect_true(!conditions_match({{"age", "new"}}, a.metadata), "conditions: value mismatch");
  expect_true(!conditions_match({{"voltage", "69kV"}}, a.metadata), "conditions: missing key mismatch");

  const auto sel = make_curve_selector(CurveSelection::kConditions);
  expect_true(dynamic_cast<const ConditionMatchWins*>(sel.get()) != nullptr, "factory: conditions strategy");
}

void test_structural_faults() {
  // R1 -> X (declared parent R2 also lists X), R1 lists missing "ghost",
  // duplicate R1 record, O is an orphan, R2 tries to adopt root R1.
  std::vector<FlatHbomRecord> flat{
      rec("R1", std::nullopt, {"X", "ghost"}),
      rec("R2", std::nullopt, {"X", "R1"}),
      rec("X", "R2", {}),
      rec("R1", std::nullopt, {}),
      rec("O", "nobody", {}),
  };

  ReconstructReport rep;
  const auto roots = reconstruct_tree(flat, {}, FirstCurveWins{}, {}, &rep);

  expect_true(roots.size() == 2, "faults: two roots");
  expect_true(roots[0].uuid == "R1" && roots[0].subcomponents.empty(),
              "faults: multi-claimed child goes to its declared parent");
  expect_true(roots[1].uuid == "R2" && roots[1].subcomponents.size() == 1 &&
                  roots[1].subcomponents[0].uuid == "X",
              "faults: declared parent keeps the child");
  expect_true(rep.duplicate_uuids == 1, "faults: duplicate uuid dropped");
  expect_true(rep.dangling_children == 1, "faults: dangling child ref dropped");
  expect_true(rep.rejected_links == 2, "faults: root adoption + losing claim rejected");
  expect_true(rep.orphaned_nodes == 1, "faults: orphan dropped");
  expect_true(count_nodes(roots) == 3, "faults: three nodes kept");
  expect_true(find_component(roots, "O") == nullptr, "faults: orphan not reachable");
  expect_true(find_component(roots, "X") != nullptr && find_component(roots, "X")->label == "label-X",
              "find_component: nested lookup");
}

void test_cycles_and_depth() {
  const std::vector<FlatHbomRecord> cyc{
      rec("root", std::nullopt, {}),
      rec("A", "B", {"B"}),
      rec("B", "A", {"A"}),
  };
  expect_error([&] { (void)reconstruct_tree(cyc, {}); }, ErrorCode::kInvariant, "cycle: rejected");

  const std::vector<FlatHbomRecord> self{rec("S", std::nullopt, {"S"})};
  expect_error([&] { (void)reconstruct_tree(self, {}); }, ErrorCode::kInvariant, "cycle: self-child rejected");

  std::vector<FlatHbomRecord> chain;
  chain.push_back(rec("n0", std::nullopt, {"n1"}));
  for (int i = 1; i <= 10; ++i) {
    chain.push_back(rec("n" + std::to_string(i), "n" + std::to_string(i - 1),
                        i < 10 ? std::vector<std::string>{"n" + std::to_string(i + 1)}
                               : std::vector<std::string>{}));
  }
  ReconstructOptions shallow;
  shallow.max_depth = 5;
  expect_error([&] { (void)reconstruct_tree(chain, {}, FirstCurveWins{}, shallow); },
               ErrorCode::kOutOfRange, "depth: guard raises");

  ReconstructOptions deep;
  deep.max_depth = 10;
  const auto ok = reconstruct_tree(chain, {}, FirstCurveWins{}, deep);
  expect_true(count_nodes(ok) == 11, "depth: chain at the limit accepted");
}

std::vector<ComponentNode> rebuild(const std::vector<ComponentNode>& roots) {
  const FlatHbom f = flatten(roots);
  return reconstruct_tree(f.records, f.curves);
}

void test_flatten_roundtrip() {
  FlatHbomRecord a = rec("A", std::nullopt, {"B", "C"});
  a.canonical_component_type = "substation";
  a.level = 0;
  a.node_path = "A";
  a.metadata = {{"owner", "utility"}};
  FlatHbomRecord b = rec("B", "A", {"D"});
  b.level = 1;
  FlatHbomRecord c = rec("C", "A", {});
  FlatHbomRecord d = rec("D", "B", {});
  d.node_path = "A/B/D";

  FragilityCurveDoc w = curve("D", "Wind", "weibull");
  w.climate_variable = std::string("sfcWind");
  w.conditions = {{"terrain", "coastal"}};
  w.source = "vendor";
  const std::vector<FragilityCurveDoc> docs{w, curve("A", "Heat Stress", "inherit"), curve("C", "Wind", "logistic", 4)};

  const auto tree = reconstruct_tree({a, b, c, d}, docs);
  const FlatHbom flat = flatten(tree);
  expect_true(flat.records.size() == 4 && flat.curves.size() == 3, "flatten: one record per node, one doc per binding");
  expect_true(flat.records[0].uuid == "A" && !flat.records[0].parent_uuid, "flatten: pre-order, root first");

  const auto back = reconstruct_tree(flat.records, flat.curves);
  expect_true(same_forest(tree, back), "flatten: reconstruct(flatten(tree)) == tree");
  expect_true(same_forest(rebuild(rebuild(tree)), tree), "flatten: stable under repetition");
}

}  // namespace
}  // namespace clirisk

int main() {
  using namespace clirisk;

  set_log_level(LogLevel::ERROR);

  test_basic_link_and_filter();
  test_hazard_scoped_tree();
  test_curve_defaults_and_selection();
  test_structural_faults();
  test_cycles_and_depth();
  test_flatten_roundtrip();

  return selftest::exit_code();
}

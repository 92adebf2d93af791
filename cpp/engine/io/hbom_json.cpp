// ============================================================================
// IO: HBOM / Curve / Climate Documents
// File: cpp/engine/io/hbom_json.cpp
// ============================================================================

#include "engine/io/hbom_json.hpp"

#include "engine/core/logging.hpp"

#include <cmath>
#include <limits>
#include <ostream>
#include <set>
#include <sstream>
#include <utility>

namespace clirisk::io {
namespace {

// Schema-level failure: the document parsed, but does not have the shape we
// expect. `path` names the offending element.
bool schema_err(JsonParseError* err, const std::string& path, const std::string& what) {
  if (err) {
    err->message = path + ": " + what;
    err->offset = 0;
    err->line = 1;
    err->col = 1;
  }
  return false;
}

std::string at(const std::string& base, size_t i) {
  return base + "[" + std::to_string(i) + "]";
}

std::string dot(const std::string& base, const char* k) {
  return base + "." + k;
}

// Array root, or an object root wrapping the array under `wrapper`.
const JsonValue* unwrap_list(const JsonValue& root, const char* wrapper) {
  if (root.is_array()) return &root;
  const JsonValue* v = root.find(wrapper);
  return (v && v->is_array()) ? v : nullptr;
}

bool read_string_required(const JsonValue& o, const char* k, const std::string& path,
                          std::string& out, JsonParseError* err) {
  const JsonValue* v = o.find(k);
  if (!v || !v->is_string()) return schema_err(err, dot(path, k), "required string");
  out = v->str;
  return true;
}

// Absent or null leaves `out` untouched.
bool read_string_optional(const JsonValue& o, const char* k, const std::string& path,
                          std::string& out, JsonParseError* err) {
  const JsonValue* v = o.find(k);
  if (!v || v->is_null()) return true;
  if (!v->is_string()) return schema_err(err, dot(path, k), "must be string or null");
  out = v->str;
  return true;
}

bool read_opt_string(const JsonValue& o, const char* k, const std::string& path,
                     std::optional<std::string>& out, JsonParseError* err) {
  const JsonValue* v = o.find(k);
  if (!v || v->is_null()) {
    out.reset();
    return true;
  }
  if (!v->is_string()) return schema_err(err, dot(path, k), "must be string or null");
  out = v->str;
  return true;
}

bool to_int(const JsonValue& v, int& out) {
  if (!v.is_number() || !std::isfinite(v.num)) return false;
  if (v.num != std::floor(v.num)) return false;
  if (v.num < static_cast<double>(std::numeric_limits<int>::min()) ||
      v.num > static_cast<double>(std::numeric_limits<int>::max())) {
    return false;
  }
  out = static_cast<int>(v.num);
  return true;
}

bool read_opt_int(const JsonValue& o, const char* k, const std::string& path,
                  std::optional<int>& out, JsonParseError* err) {
  const JsonValue* v = o.find(k);
  if (!v || v->is_null()) {
    out.reset();
    return true;
  }
  int i = 0;
  if (!to_int(*v, i)) return schema_err(err, dot(path, k), "must be integer or null");
  out = i;
  return true;
}

// null -> NaN
bool read_number_or_null(const JsonValue& v, const std::string& path, double& out,
                         JsonParseError* err) {
  if (v.is_null()) {
    out = kNaN;
    return true;
  }
  if (!v.is_number()) return schema_err(err, path, "must be number or null");
  out = v.num;
  return true;
}

bool read_string_map(const JsonValue& o, const char* k, const std::string& path,
                     hbom::StringMap& out, JsonParseError* err) {
  out.clear();
  const JsonValue* v = o.find(k);
  if (!v || v->is_null()) return true;
  if (!v->is_object()) return schema_err(err, dot(path, k), "must be object");
  for (const auto& kv : v->obj) {
    out[kv.first] = kv.second.is_string() ? kv.second.str : to_compact_json(kv.second);
  }
  return true;
}

bool read_record(const JsonValue& o, const std::string& path, hbom::FlatHbomRecord& r,
                 JsonParseError* err) {
  if (!o.is_object()) return schema_err(err, path, "must be object");

  if (!read_string_required(o, "uuid", path, r.uuid, err)) return false;
  if (r.uuid.empty()) return schema_err(err, dot(path, "uuid"), "must be non-empty");
  if (!read_string_required(o, "label", path, r.label, err)) return false;
  if (!read_string_optional(o, "asset_type", path, r.asset_type, err)) return false;
  if (!read_opt_string(o, "canonical_component_type", path, r.canonical_component_type, err)) return false;
  if (!read_opt_int(o, "level", path, r.level, err)) return false;
  if (!read_string_optional(o, "node_path", path, r.node_path, err)) return false;
  if (!read_opt_string(o, "parent_uuid", path, r.parent_uuid, err)) return false;

  r.children_uuids.clear();
  if (const JsonValue* ch = o.find("children_uuids"); ch && !ch->is_null()) {
    const std::string cpath = dot(path, "children_uuids");
    if (!ch->is_array()) return schema_err(err, cpath, "must be array");
    r.children_uuids.reserve(ch->arr.size());
    for (size_t i = 0; i < ch->arr.size(); ++i) {
      if (!ch->arr[i].is_string()) return schema_err(err, at(cpath, i), "must be string");
      r.children_uuids.push_back(ch->arr[i].str);
    }
  }

  return read_string_map(o, "metadata", path, r.metadata, err);
}

// Non-numeric parameters are kept as NaN and counted in `malformed_params`:
// the evaluator coerces the resulting PoF to 0 and reports it per component.
bool read_curve(const JsonValue& o, const std::string& path, hbom::FragilityCurveDoc& d,
                size_t& malformed_params, JsonParseError* err) {
  if (!o.is_object()) return schema_err(err, path, "must be object");

  if (!read_string_optional(o, "component_uuid", path, d.component_uuid, err)) return false;
  if (!read_string_optional(o, "hazard", path, d.hazard, err)) return false;
  if (!read_string_optional(o, "model", path, d.model, err)) return false;
  if (!read_opt_string(o, "climate_variable", path, d.climate_variable, err)) return false;
  if (!read_string_map(o, "conditions", path, d.conditions, err)) return false;

  d.parameters.clear();
  if (const JsonValue* p = o.find("parameters"); p && !p->is_null()) {
    const std::string ppath = dot(path, "parameters");
    if (!p->is_object()) return schema_err(err, ppath, "must be object");
    for (const auto& kv : p->obj) {
      // null parameter = not provided; the evaluator falls back to defaults.
      if (kv.second.is_null()) continue;
      if (kv.second.is_number()) {
        d.parameters[kv.first] = kv.second.num;
      } else {
        d.parameters[kv.first] = kNaN;
        ++malformed_params;
      }
    }
  }

  if (const JsonValue* pr = o.find("priority"); pr && !pr->is_null()) {
    if (!to_int(*pr, d.priority)) return schema_err(err, dot(path, "priority"), "must be integer");
  }

  if (const JsonValue* prov = o.find("provenance"); prov && !prov->is_null()) {
    const std::string ppath = dot(path, "provenance");
    if (!prov->is_object()) return schema_err(err, ppath, "must be object");
    if (!read_string_optional(*prov, "source", ppath, d.source, err)) return false;
  }
  return true;
}

bool read_series(const JsonValue& v, const std::string& path, climate::Series& out,
                 JsonParseError* err) {
  if (!v.is_array()) return schema_err(err, path, "must be array or null");
  out.clear();
  out.reserve(v.arr.size());
  for (size_t i = 0; i < v.arr.size(); ++i) {
    double x = kNaN;
    if (!read_number_or_null(v.arr[i], at(path, i), x, err)) return false;
    out.push_back(x);
  }
  return true;
}

bool read_cell(const JsonValue& o, const std::string& path, size_t position,
               climate::GridCell& cell, JsonParseError* err) {
  if (!o.is_object()) return schema_err(err, path, "must be object");

  cell.grid_index = static_cast<int>(position);
  if (const JsonValue* gi = o.find("grid_index"); gi && !gi->is_null()) {
    if (!to_int(*gi, cell.grid_index)) return schema_err(err, dot(path, "grid_index"), "must be integer");
  }

  if (const JsonValue* b = o.find("bounds"); b && !b->is_null()) {
    const std::string bpath = dot(path, "bounds");
    if (!b->is_object()) return schema_err(err, bpath, "must be object");
    struct Field { const char* key; double* dst; };
    const Field fields[] = {{"min_lat", &cell.bounds.min_lat},
                            {"max_lat", &cell.bounds.max_lat},
                            {"min_lon", &cell.bounds.min_lon},
                            {"max_lon", &cell.bounds.max_lon}};
    for (const auto& f : fields) {
      const JsonValue* v = b->find(f.key);
      if (!v) continue;
      if (!read_number_or_null(*v, dot(bpath, f.key), *f.dst, err)) return false;
    }
  }

  cell.climate.clear();
  if (const JsonValue* c = o.find("climate"); c && !c->is_null()) {
    const std::string cpath = dot(path, "climate");
    if (!c->is_object()) return schema_err(err, cpath, "must be object");
    for (const auto& kv : c->obj) {
      // Whole-variable null: variable absent for this cell.
      if (kv.second.is_null()) continue;
      climate::Series s;
      if (!read_series(kv.second, cpath + "." + kv.first, s, err)) return false;
      cell.climate.emplace(kv.first, std::move(s));
    }
  }
  return true;
}

bool read_string_list(const JsonValue& o, const char* k, std::vector<std::string>& out,
                      JsonParseError* err) {
  out.clear();
  const JsonValue* v = o.find(k);
  if (!v || v->is_null()) return true;
  if (!v->is_array()) return schema_err(err, k, "must be array");
  out.reserve(v->arr.size());
  for (size_t i = 0; i < v->arr.size(); ++i) {
    if (!v->arr[i].is_string()) return schema_err(err, at(k, i), "must be string");
    out.push_back(v->arr[i].str);
  }
  return true;
}

// ----------------------------- writer helpers --------------------------------
void write_string_map(JsonWriter& w, const hbom::StringMap& m) {
  w.begin_object();
  for (const auto& kv : m) {
    w.key(kv.first);
    w.string(kv.second);
  }
  w.end_object();
}

void write_opt_string(JsonWriter& w, const std::optional<std::string>& s) {
  if (s) w.string(*s);
  else w.null_value();
}

void write_params(JsonWriter& w, const hbom::ParamMap& p) {
  w.begin_object();
  for (const auto& kv : p) {
    w.key(kv.first);
    w.number_or_null(kv.second);
  }
  w.end_object();
}

void write_curves(JsonWriter& w, const hbom::CurvesByVar& curves) {
  w.begin_object();
  for (const auto& var : curves) {
    w.key(var.first);
    w.begin_object();
    for (const auto& cell : var.second) {
      w.key(std::to_string(cell.first));
      w.begin_object();
      w.key("x_values");  w.number_array(cell.second.x_values);
      w.key("fc_values"); w.number_array(cell.second.fc_values);
      w.key("final_pof"); w.number_or_null(cell.second.final_pof);
      w.end_object();
    }
    w.end_object();
  }
  w.end_object();
}

void write_binding(JsonWriter& w, const hbom::HazardBinding& b, bool include_results) {
  w.begin_object();
  w.key("fragility_model");  w.string(b.fragility_model);
  w.key("fragility_params"); write_params(w, b.fragility_params);
  w.key("climate_variable"); write_opt_string(w, b.climate_variable);
  w.key("conditions");       write_string_map(w, b.conditions);
  w.key("priority");         w.integer(b.priority);
  w.key("source");           w.string(b.source);
  if (include_results && !b.fragility_curves.empty()) {
    w.key("fragility_curves");
    write_curves(w, b.fragility_curves);
  }
  w.end_object();
}

void write_node(JsonWriter& w, const hbom::ComponentNode& n, bool include_results) {
  w.begin_object();
  w.key("uuid");           w.string(n.uuid);
  w.key("label");          w.string(n.label);
  w.key("component_type"); w.string(n.component_type);
  w.key("canonical_component_type"); write_opt_string(w, n.canonical_component_type);
  w.key("level");
  if (n.level) w.integer(*n.level);
  else w.null_value();
  w.key("node_path");      w.string(n.node_path);
  w.key("metadata");       write_string_map(w, n.metadata);

  w.key("hazards");
  w.begin_object();
  for (const auto& h : n.hazards) {
    w.key(h.first);
    write_binding(w, h.second, include_results);
  }
  w.end_object();

  if (include_results) {
    w.key("pof_by_var");
    w.begin_object();
    for (const auto& kv : n.pof_by_var) {
      w.key_number_optional(kv.first, kv.second);
    }
    w.end_object();
    w.key_number_optional("pof", n.pof);
  }

  w.key("subcomponents");
  w.begin_array();
  for (const auto& c : n.subcomponents) write_node(w, c, include_results);
  w.end_array();

  w.end_object();
}

}  // namespace

// ============================================================================
// Readers
// ============================================================================
bool read_flat_records(const JsonValue& root,
                       std::vector<hbom::FlatHbomRecord>* out,
                       JsonParseError* err) {
  if (!out) return false;
  const JsonValue* list = unwrap_list(root, "nodes");
  if (!list) return schema_err(err, "nodes", "expected array or {\"nodes\": [...]}");

  std::vector<hbom::FlatHbomRecord> recs;
  recs.reserve(list->arr.size());
  for (size_t i = 0; i < list->arr.size(); ++i) {
    hbom::FlatHbomRecord r;
    if (!read_record(list->arr[i], at("nodes", i), r, err)) return false;
    recs.push_back(std::move(r));
  }
  *out = std::move(recs);
  return true;
}

bool read_curve_documents(const JsonValue& root,
                          std::vector<hbom::FragilityCurveDoc>* out,
                          JsonParseError* err) {
  if (!out) return false;
  const JsonValue* list = unwrap_list(root, "curves");
  if (!list) return schema_err(err, "curves", "expected array or {\"curves\": [...]}");

  std::vector<hbom::FragilityCurveDoc> docs;
  docs.reserve(list->arr.size());
  size_t malformed = 0;
  for (size_t i = 0; i < list->arr.size(); ++i) {
    hbom::FragilityCurveDoc d;
    if (!read_curve(list->arr[i], at("curves", i), d, malformed, err)) return false;
    docs.push_back(std::move(d));
  }
  if (malformed > 0) {
    log(LogLevel::WARN, "curves: " + std::to_string(malformed) +
                            " non-numeric fragility parameters read as NaN");
  }
  *out = std::move(docs);
  return true;
}

bool read_climate_dataset(const JsonValue& root,
                          climate::PreparedClimateDataset* out,
                          JsonParseError* err) {
  if (!out) return false;
  if (!root.is_object()) return schema_err(err, "$", "climate dataset must be an object");

  climate::PreparedClimateDataset ds;
  if (!read_string_list(root, "variables", ds.variables, err)) return false;
  if (!read_string_list(root, "times", ds.times, err)) return false;

  if (const JsonValue* data = root.find("data"); data && !data->is_null()) {
    if (!data->is_array()) return schema_err(err, "data", "must be array");
    ds.cells.reserve(data->arr.size());
    std::set<int> seen;
    size_t repeated = 0;
    for (size_t i = 0; i < data->arr.size(); ++i) {
      climate::GridCell cell;
      if (!read_cell(data->arr[i], at("data", i), i, cell, err)) return false;
      if (!seen.insert(cell.grid_index).second) ++repeated;
      ds.cells.push_back(std::move(cell));
    }
    if (repeated > 0) {
      log(LogLevel::WARN, "climate: " + std::to_string(repeated) +
                              " grid cells repeat an earlier grid_index; curves are keyed by cell position");
    }
  }

  *out = std::move(ds);
  return true;
}

// ============================================================================
// Writers
// ============================================================================
void write_tree_json(std::ostream& os,
                     const hbom::HbomTree& tree,
                     const JsonWriteOptions& opt,
                     bool include_results) {
  JsonWriter w(os, opt);
  w.begin_object();
  w.key("sector");
  w.string(tree.sector);
  w.key("components");
  w.begin_array();
  for (const auto& n : tree.components) write_node(w, n, include_results);
  w.end_array();
  w.end_object();
  if (opt.pretty) os << "\n";
}

std::string tree_to_json(const hbom::HbomTree& tree,
                         const JsonWriteOptions& opt,
                         bool include_results) {
  std::ostringstream ss;
  write_tree_json(ss, tree, opt, include_results);
  return ss.str();
}

void write_timeseries_json(std::ostream& os,
                           const fragility::PofTimeSeries& series,
                           const JsonWriteOptions& opt) {
  JsonWriter w(os, opt);
  w.begin_object();
  for (const auto& node : series) {
    w.key(node.first);
    w.begin_object();
    for (const auto& var : node.second) {
      w.key(var.first);
      w.number_array(var.second);
    }
    w.end_object();
  }
  w.end_object();
  if (opt.pretty) os << "\n";
}

std::string timeseries_to_json(const fragility::PofTimeSeries& series,
                               const JsonWriteOptions& opt) {
  std::ostringstream ss;
  write_timeseries_json(ss, series, opt);
  return ss.str();
}

void write_flat_hbom_json(std::ostream& os,
                          const hbom::FlatHbom& flat,
                          const JsonWriteOptions& opt) {
  JsonWriter w(os, opt);
  w.begin_object();

  w.key("nodes");
  w.begin_array();
  for (const auto& r : flat.records) {
    w.begin_object();
    w.key("uuid");       w.string(r.uuid);
    w.key("label");      w.string(r.label);
    w.key("asset_type"); w.string(r.asset_type);
    w.key("canonical_component_type"); write_opt_string(w, r.canonical_component_type);
    w.key("level");
    if (r.level) w.integer(*r.level);
    else w.null_value();
    w.key("node_path");      w.string(r.node_path);
    w.key("parent_uuid");    write_opt_string(w, r.parent_uuid);
    w.key("children_uuids"); w.string_array(r.children_uuids);
    w.key("metadata");       write_string_map(w, r.metadata);
    w.end_object();
  }
  w.end_array();

  w.key("curves");
  w.begin_array();
  for (const auto& d : flat.curves) {
    w.begin_object();
    w.key("component_uuid");   w.string(d.component_uuid);
    w.key("hazard");           w.string(d.hazard);
    w.key("model");            w.string(d.model);
    w.key("parameters");       write_params(w, d.parameters);
    w.key("climate_variable"); write_opt_string(w, d.climate_variable);
    w.key("conditions");       write_string_map(w, d.conditions);
    w.key("priority");         w.integer(d.priority);
    w.key("provenance");
    w.begin_object();
    w.key("source");
    w.string(d.source);
    w.end_object();
    w.end_object();
  }
  w.end_array();

  w.end_object();
  if (opt.pretty) os << "\n";
}

}  // namespace clirisk::io

// ============================================================================
// IO: Engine Settings Overlay
// File: cpp/engine/io/settings_json.cpp
// ============================================================================

#include "engine/io/settings_json.hpp"

#include <cmath>

namespace clirisk::io {
namespace {

bool cfg_err(JsonParseError* err, const std::string& path, const char* what) {
  if (err) {
    err->message = "config " + path + ": " + what;
    err->offset = 0;
    err->line = 1;
    err->col = 1;
  }
  return false;
}

bool section(const JsonValue& root, const char* k, const JsonValue*& out, JsonParseError* err) {
  out = root.find(k);
  if (!out || out->is_null()) {
    out = nullptr;
    return true;
  }
  if (!out->is_object()) return cfg_err(err, k, "must be object");
  return true;
}

bool num(const JsonValue& sec, const char* sec_name, const char* k, double& dst,
         JsonParseError* err) {
  const JsonValue* v = sec.find(k);
  if (!v) return true;
  if (!v->is_number()) return cfg_err(err, std::string(sec_name) + "." + k, "must be number");
  dst = v->num;
  return true;
}

bool flag(const JsonValue& sec, const char* sec_name, const char* k, bool& dst,
          JsonParseError* err) {
  const JsonValue* v = sec.find(k);
  if (!v) return true;
  if (!v->is_bool()) return cfg_err(err, std::string(sec_name) + "." + k, "must be bool");
  dst = v->b;
  return true;
}

bool non_negative_int(const JsonValue& v, double& out) {
  if (!v.is_number() || !std::isfinite(v.num) || v.num < 0.0 || v.num != std::floor(v.num)) {
    return false;
  }
  out = v.num;
  return true;
}

}  // namespace

bool read_engine_settings(const JsonValue& root, EngineSettings* inout, JsonParseError* err) {
  if (!inout) return false;
  if (!root.is_object()) return cfg_err(err, "$", "must be object");

  EngineSettings s = *inout;

  const JsonValue* frag = nullptr;
  if (!section(root, "fragility", frag, err)) return false;
  if (frag) {
    FragilityDefaults& f = s.fragility;
    if (!num(*frag, "fragility", "lognormal_median", f.lognormal_median, err)) return false;
    if (!num(*frag, "fragility", "lognormal_dispersion", f.lognormal_dispersion, err)) return false;
    if (!num(*frag, "fragility", "log_epsilon", f.log_epsilon, err)) return false;
    if (!num(*frag, "fragility", "weibull_shape", f.weibull_shape, err)) return false;
    if (!num(*frag, "fragility", "weibull_scale", f.weibull_scale, err)) return false;
    if (!num(*frag, "fragility", "logistic_mid_point", f.logistic_mid_point, err)) return false;
    if (!num(*frag, "fragility", "logistic_slope", f.logistic_slope, err)) return false;
  }

  const JsonValue* tree = nullptr;
  if (!section(root, "tree", tree, err)) return false;
  if (tree) {
    if (const JsonValue* v = tree->find("max_depth")) {
      double d = 0.0;
      if (!non_negative_int(*v, d)) return cfg_err(err, "tree.max_depth", "must be non-negative integer");
      s.tree.max_depth = static_cast<std::size_t>(d);
    }
    if (const JsonValue* v = tree->find("curve_selection")) {
      if (!v->is_string() || !parse_curve_selection(v->str, &s.tree.curve_selection)) {
        return cfg_err(err, "tree.curve_selection", "must be \"first\", \"priority\" or \"conditions\"");
      }
    }
  }

  const JsonValue* output = nullptr;
  if (!section(root, "output", output, err)) return false;
  if (output) {
    if (!flag(*output, "output", "pretty", s.output.pretty, err)) return false;
    if (!flag(*output, "output", "emit_null_for_unset", s.output.emit_null_for_unset, err)) return false;
    if (const JsonValue* v = output->find("indent_spaces")) {
      double d = 0.0;
      if (!non_negative_int(*v, d) || d > 64.0) {
        return cfg_err(err, "output.indent_spaces", "must be small non-negative integer");
      }
      s.output.indent_spaces = static_cast<int>(d);
    }
  }

  if (const JsonValue* v = root.find("log_level")) {
    if (!v->is_string() || !parse_log_level(v->str, &s.log_level)) {
      return cfg_err(err, "log_level", "must be debug|info|warn|error");
    }
  }

  if (!flag(root, "$", "apply_composites", s.apply_composites, err)) return false;

  *inout = s;
  return true;
}

}  // namespace clirisk::io

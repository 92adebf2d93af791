#pragma once
/*
================================================================================
Core: Engine Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every knob that changes fragility results (distribution
    defaults, log guard epsilon), tree reconstruction policy, and output
    formatting into one validated object.
  - Loaded from an optional JSON config (io/settings_json) and overridden by
    CLI flags.

Hardening:
  - validate_or_throw() rejects nonsensical values early with
    ErrorCode::kInvalidConfig.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"

namespace clirisk {

// ----------------------------- Fragility -------------------------------------
// Parameter defaults applied when a curve document omits a parameter.
struct FragilityDefaults {
  // Lognormal: z = (ln(x + eps) - ln(median)) / dispersion
  double lognormal_median = 100.0;
  double lognormal_dispersion = 0.3;

  // Guards ln(0) for zero-intensity samples.
  double log_epsilon = 1e-9;

  // Weibull: 1 - exp(-(x/scale)^shape)
  double weibull_shape = 2.0;
  double weibull_scale = 100.0;

  // Logistic: 1 / (1 + exp(-slope * (x - mid_point)))
  double logistic_mid_point = 50.0;
  double logistic_slope = 0.5;

  void validate_or_throw() const {
    CLIRISK_ENSURE(is_finite(lognormal_median) && lognormal_median > 0.0,
                   ErrorCode::kInvalidConfig, "FragilityDefaults: lognormal_median must be > 0");
    CLIRISK_ENSURE(is_finite(lognormal_dispersion) && lognormal_dispersion > 0.0,
                   ErrorCode::kInvalidConfig, "FragilityDefaults: lognormal_dispersion must be > 0");
    CLIRISK_ENSURE(is_finite(log_epsilon) && log_epsilon > 0.0 && log_epsilon <= 1e-3,
                   ErrorCode::kInvalidConfig, "FragilityDefaults: log_epsilon outside sane bounds");
    CLIRISK_ENSURE(is_finite(weibull_shape) && weibull_shape > 0.0,
                   ErrorCode::kInvalidConfig, "FragilityDefaults: weibull_shape must be > 0");
    CLIRISK_ENSURE(is_finite(weibull_scale) && weibull_scale > 0.0,
                   ErrorCode::kInvalidConfig, "FragilityDefaults: weibull_scale must be > 0");
    CLIRISK_ENSURE(is_finite(logistic_mid_point),
                   ErrorCode::kInvalidConfig, "FragilityDefaults: logistic_mid_point not finite");
    CLIRISK_ENSURE(is_finite(logistic_slope),
                   ErrorCode::kInvalidConfig, "FragilityDefaults: logistic_slope not finite");
  }
};

// ----------------------------- Tree ------------------------------------------
// How to pick one curve document when several target the same
// (component, hazard).
enum class CurveSelection : std::uint8_t {
  kFirst = 0,       // document order, first wins
  kPriority = 1,    // highest `priority`, ties keep document order
  kConditions = 2   // conditions matching component metadata, then priority
};

inline const char* to_string(CurveSelection s) noexcept {
  switch (s) {
    case CurveSelection::kFirst:      return "first";
    case CurveSelection::kPriority:   return "priority";
    case CurveSelection::kConditions: return "conditions";
    default:                          return "first";
  }
}

inline bool parse_curve_selection(std::string_view s, CurveSelection* out) noexcept {
  if (!out) return false;
  if (s == "first")      { *out = CurveSelection::kFirst; return true; }
  if (s == "priority")   { *out = CurveSelection::kPriority; return true; }
  if (s == "conditions") { *out = CurveSelection::kConditions; return true; }
  return false;
}

struct TreeSettings {
  // Physical asset decompositions are shallow; anything deeper is corrupt input.
  std::size_t max_depth = 512;

  CurveSelection curve_selection = CurveSelection::kFirst;

  void validate_or_throw() const {
    CLIRISK_ENSURE(max_depth >= 1 && max_depth <= 100000,
                   ErrorCode::kInvalidConfig, "TreeSettings: max_depth outside sane bounds");
  }
};

// ----------------------------- Output ----------------------------------------
struct OutputSettings {
  bool pretty = true;
  int indent_spaces = 2;

  // JSON cannot carry NaN/Inf: emit null (true) or drop the field (false).
  bool emit_null_for_unset = true;

  void validate_or_throw() const {
    CLIRISK_ENSURE(indent_spaces >= 0 && indent_spaces <= 8,
                   ErrorCode::kInvalidConfig, "OutputSettings: indent_spaces outside [0,8]");
  }
};

// ----------------------------- EngineSettings --------------------------------
struct EngineSettings {
  FragilityDefaults fragility;
  TreeSettings tree;
  OutputSettings output;
  LogLevel log_level = LogLevel::INFO;

  // Apply hazard composite variables (e.g. heat index) before computing.
  bool apply_composites = true;

  void validate_or_throw() const {
    fragility.validate_or_throw();
    tree.validate_or_throw();
    output.validate_or_throw();
  }

  static EngineSettings defaults() {
    EngineSettings s;
    return s;
  }
};

}  // namespace clirisk

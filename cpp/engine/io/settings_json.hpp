#pragma once

#include <string>

#include "engine/core/settings.hpp"
#include "engine/io/json_value.hpp"

namespace clirisk::io {

/// Overlay a JSON config onto `*inout` (absent keys keep their current value).
///
///   {
///     "fragility": {"lognormal_median": 100, "lognormal_dispersion": 0.3,
///                   "log_epsilon": 1e-9, "weibull_shape": 2,
///                   "weibull_scale": 100, "logistic_mid_point": 50,
///                   "logistic_slope": 0.5},
///     "tree":      {"max_depth": 512, "curve_selection": "first"},
///     "output":    {"pretty": true, "indent_spaces": 2,
///                   "emit_null_for_unset": true},
///     "log_level": "info",
///     "apply_composites": true
///   }
///
/// Type errors return false. Range checks are left to
/// EngineSettings::validate_or_throw().
bool read_engine_settings(const JsonValue& root, EngineSettings* inout,
                          JsonParseError* err = nullptr);

}  // namespace clirisk::io

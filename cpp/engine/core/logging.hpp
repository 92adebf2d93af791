#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by ALL engine modules.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - WARN/ERROR go to stderr, DEBUG/INFO to stdout, unless a sink is set.
  - Emitted lines are counted per level; selftests use the counters and the
    sink to check that a recovered fault was reported.

Notes:
  - Recovered data faults (unknown fragility model, coerced NaN, dropped
    HBOM references) are logged once per node or per batch, never per value.
===========================================================
*/

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace clirisk {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Accepts "debug", "info", "warn", "error" (case-insensitive).
bool parse_log_level(std::string_view text, LogLevel* out) noexcept;

const char* log_level_name(LogLevel lvl) noexcept;

// Route every level to `sink` (nullptr restores stdout/stderr).
// The sink must outlive its registration.
void set_log_sink(std::ostream* sink) noexcept;

// Lines emitted at `lvl` since start or the last reset (filtered lines excluded).
std::size_t log_emitted(LogLevel lvl) noexcept;
void reset_log_counters() noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace clirisk

#pragma once
/*
================================================================================
Core: Selftest Helpers
FILE: cpp/engine/core/selftest.hpp

Framework-free checks shared by the *_selftest executables. Every check prints
one "[ OK ]" or "[FAIL]" line to stderr; exit_code() is non-zero when any
check failed.
================================================================================
*/

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/core/error.hpp"

namespace clirisk::selftest {

inline int& fail_count() {
  static int n = 0;
  return n;
}

inline void fail(std::string_view msg) {
  ++fail_count();
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

// Approximate equality (relative with absolute floor).
inline bool near(double a, double b, double rel = 1e-9, double abs = 1e-12) noexcept {
  const double da = std::fabs(a - b);
  if (da <= abs) return true;
  const double sc = std::max({std::fabs(a), std::fabs(b), abs});
  return da / sc <= rel;
}

inline void expect_near(double got, double exp, std::string_view msg, double tol = 1e-9) {
  if (!near(got, exp, tol, tol)) {
    fail(msg);
    std::cerr << "  expected " << exp << ", got " << got << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

template <typename Fn>
void expect_error(Fn&& fn, ErrorCode code, std::string_view msg) {
  try {
    fn();
    fail(msg);
    std::cerr << "  expected clirisk::Error, nothing thrown\n";
  } catch (const Error& e) {
    if (e.code() != code) {
      fail(msg);
      std::cerr << "  wrong code: " << to_string(e.code()) << "\n";
    } else {
      pass(msg);
    }
  }
}

inline int exit_code() {
  if (fail_count() != 0) {
    std::cerr << "\nSelftest failures: " << fail_count() << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}

}  // namespace clirisk::selftest

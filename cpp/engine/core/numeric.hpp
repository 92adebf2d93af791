#pragma once
/*
===============================================================================
Core: Hardened Math Utilities
File: cpp/engine/core/numeric.hpp
===============================================================================
*/

#include <cmath>
#include <limits>
#include <type_traits>

namespace clirisk {

inline constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// -----------------------------
// Finite checks
// -----------------------------
inline bool is_finite(double x) noexcept {
    return std::isfinite(x) != 0;
}

inline double finite_or(double x, double fallback) noexcept {
    return is_finite(x) ? x : fallback;
}

// -----------------------------
// Clamp (generic for arithmetic)
// -----------------------------
template <typename T>
inline constexpr T clamp(T v, T lo, T hi) noexcept {
    static_assert(std::is_arithmetic<T>::value, "clamp requires arithmetic type");
    return (v < lo) ? lo : ((v > hi) ? hi : v);
}

// Probability clamp. NaN maps to 0 (no-failure).
inline double clamp01(double p) noexcept {
    if (!is_finite(p)) {
        if (std::isinf(p)) return p > 0.0 ? 1.0 : 0.0;
        return 0.0;
    }
    return clamp(p, 0.0, 1.0);
}

inline bool is_probability(double p) noexcept {
    return is_finite(p) && p >= 0.0 && p <= 1.0;
}

// -----------------------------
// Safe math
// -----------------------------
inline double safe_log(double x, double min_x = 1e-300) noexcept {
    return std::log((x < min_x) ? min_x : x);
}

inline double safe_exp(double x, double max_x = 700.0) noexcept {
    // exp(709) ~ 8e307 near DBL_MAX
    return std::exp((x > max_x) ? max_x : x);
}

} // namespace clirisk

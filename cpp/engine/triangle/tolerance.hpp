#pragma once
/*
================================================================================
Fragment 3.0 — Triangle: Pythagorean Tolerance Band
FILE: cpp/engine/triangle/tolerance.hpp

  band(lhs, rhs) = max(abs_floor, rel_band * max(lhs, rhs))
  match          = |lhs - rhs| <= band

Inputs are the squared terms (a^2 + b^2 and c^2), not the side lengths.
================================================================================
*/

#include <algorithm>
#include <cmath>

#include "engine/core/settings.hpp"

namespace pythag {

inline double pythagorean_band(double lhs, double rhs, const ToleranceSettings& tol = {}) noexcept {
  return std::max(tol.abs_floor, tol.rel_band * std::max(lhs, rhs));
}

inline bool pythagorean_match(double lhs, double rhs, const ToleranceSettings& tol = {}) noexcept {
  return std::fabs(lhs - rhs) <= pythagorean_band(lhs, rhs, tol);
}

}  // namespace pythag

#include "engine/triangle/triangle_record.hpp"

#include <algorithm>
#include <array>
#include <cmath>

#include "engine/triangle/tolerance.hpp"

namespace pythag {

const char* side_to_string(Side s) noexcept {
  switch (s) {
    case Side::kNone: return "none";
    case Side::kA:    return "a";
    case Side::kB:    return "b";
    case Side::kC:    return "c";
    default:          return "none";
  }
}

const char* outcome_to_string(Outcome o) noexcept {
  switch (o) {
    case Outcome::kPending:  return "Pending";
    case Outcome::kComputed: return "Computed";
    case Outcome::kVerified: return "Verified";
    case Outcome::kRejected: return "Rejected";
    default:                 return "Unknown";
  }
}

void TriangleRecord::compute_hypotenuse() {
  PYTHAG_ENSURE(a.has_value() && b.has_value(), ErrorCode::kMissingSide,
                "Both legs a and b are required to compute hypotenuse c.");

  // hypot: no overflow/underflow of the squared terms.
  const double h = std::hypot(*a, *b);
  PYTHAG_ENSURE(std::isfinite(h) && h > 0.0, ErrorCode::kNotRepresentable,
                "Computed hypotenuse c is not a representable positive finite number.");

  c = h;
  computed = Side::kC;

  // Right-angled by construction.
  is_valid = true;
  is_right = true;
}

void TriangleRecord::compute_leg() {
  PYTHAG_ENSURE(c.has_value(), ErrorCode::kMissingSide,
                "Hypotenuse c is required to compute a leg.");
  PYTHAG_ENSURE(a.has_value() != b.has_value(), ErrorCode::kGeometryUsage,
                "Exactly one leg (a or b) must be provided to compute the other.");

  const double known = a.has_value() ? *a : *b;
  PYTHAG_ENSURE(!(known > *c), ErrorCode::kLegExceedsHypotenuse,
                "Hypotenuse c must be greater than the known leg.");
  // known == c would leave a zero-length leg.
  PYTHAG_ENSURE(known != *c, ErrorCode::kDegenerateTriangle,
                "Hypotenuse c must be greater than the known leg (degenerate triangle).");

  // c^2 - known^2 = (c - known) * 2 * (c/2 + known/2). No squared terms, and
  // the halved sum cannot overflow. c - known is exact when the two are close.
  const double missing =
      std::sqrt(*c - known) * std::sqrt(0.5 * *c + 0.5 * known) * std::sqrt(2.0);
  PYTHAG_ENSURE(std::isfinite(missing) && missing > 0.0, ErrorCode::kNotRepresentable,
                "Computed leg is not a representable positive finite number.");

  if (a.has_value()) {
    b = missing;
    computed = Side::kB;
  } else {
    a = missing;
    computed = Side::kA;
  }

  is_valid = true;
  is_right = true;
}

void TriangleRecord::normalize() {
  PYTHAG_ENSURE(has_all_sides(), ErrorCode::kMissingSide,
                "All three sides are required to validate a triangle.");

  std::array<double, 3> s{*a, *b, *c};
  std::sort(s.begin(), s.end());
  a = s[0];
  b = s[1];
  c = s[2];
}

void TriangleRecord::check_triangle_inequality() {
  PYTHAG_ENSURE(has_all_sides(), ErrorCode::kMissingSide,
                "All three sides are required to validate a triangle.");

  if (*a + *b <= *c) {
    PYTHAG_THROW(ErrorCode::kTriangleInequality,
                 "Input sorted: largest treated as hypotenuse. Triangle is impossible: a + b <= c .");
  }
  is_valid = true;
}

void TriangleRecord::check_right_angle(const ToleranceSettings& tol) {
  PYTHAG_ENSURE(has_all_sides(), ErrorCode::kMissingSide,
                "All three sides are required to verify a triangle.");

  const double lhs = *a * *a + *b * *b;
  const double rhs = *c * *c;
  is_right = pythagorean_match(lhs, rhs, tol);
}

}  // namespace pythag

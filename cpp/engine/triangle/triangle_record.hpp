#pragma once
/*
================================================================================
Fragment 3.1 — Triangle: Working Record + Geometric Operations
FILE: cpp/engine/triangle/triangle_record.hpp

Semantics:
  - a, b: legs
  - c:    hypotenuse (after normalize(): the largest side, i.e. the
          hypotenuse candidate)

Flags:
  - is_valid: the triangle is geometrically possible (set by construction in
              SOLVE mode, by check_triangle_inequality() in VERIFY mode).
  - is_right: the Pythagorean relation holds within tolerance.

Operations throw pythag::Error and stop at the first failure. Sides already
written stay as they are; the orchestration layer (solve.hpp) decides what the
caller sees.
================================================================================
*/

#include <optional>
#include <string>

#include "engine/core/errors.hpp"
#include "engine/core/settings.hpp"

namespace pythag {

// Which side slot an operation filled in.
enum class Side : int { kNone = 0, kA = 1, kB = 2, kC = 3 };

// Tagged result of one request. kPending only exists while a request is
// being processed; process_fields() never returns it.
enum class Outcome : int { kPending = 0, kComputed = 1, kVerified = 2, kRejected = 3 };

const char* side_to_string(Side s) noexcept;
const char* outcome_to_string(Outcome o) noexcept;

struct TriangleRecord {
  std::optional<double> a;
  std::optional<double> b;
  std::optional<double> c;

  bool is_valid = false;
  bool is_right = false;
  std::string message;

  Outcome outcome = Outcome::kPending;
  ErrorCode code = ErrorCode::kOk;
  std::string field;       // offending input field for parse errors
  Side computed = Side::kNone;

  bool has_all_sides() const noexcept { return a.has_value() && b.has_value() && c.has_value(); }

  // c = sqrt(a^2 + b^2). Requires both legs.
  void compute_hypotenuse();

  // Missing leg = sqrt(c^2 - known^2). Requires c and exactly one leg with
  // known < c.
  void compute_leg();

  // Sort ascending: a <= b <= c. Requires all three sides.
  void normalize();

  // Requires normalize() first. Throws if a + b <= c.
  void check_triangle_inequality();

  // Sets is_right from the tolerance band. Requires all three sides.
  void check_right_angle(const ToleranceSettings& tol = {});
};

}  // namespace pythag

#pragma once
/*
================================================================================
Fragment 3.2 — Triangle: Solve / Verify Orchestration (Entry Point)
FILE: cpp/engine/triangle/solve.hpp

Input contract:
  - Exactly the keys {a, b, c}. Blank or absent value -> missing.
  - Present values must parse to positive finite numbers.

Modes:
  - SOLVE  (one side missing)
      c missing      -> compute_hypotenuse, message "Hypotenuse calculated"
      a or b missing -> compute_leg,        message "Leg calculated"
  - VERIFY (nothing missing)
      normalize -> check_triangle_inequality -> check_right_angle
  - more than one missing -> rejected (ambiguous input)

Error policy:
  - process_fields() never throws. Every failure becomes a record with
    outcome = kRejected, is_valid = is_right = false, code/field set and
    message = failure text. Sides parsed or computed before the failure are
    left in place.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/input/field_validator.hpp"
#include "engine/triangle/triangle_record.hpp"

namespace pythag {

inline constexpr const char* kMsgHypotenuseCalculated = "Hypotenuse calculated";
inline constexpr const char* kMsgLegCalculated = "Leg calculated";
inline constexpr const char* kMsgVerifiedRight =
    "Input sorted: largest treated as hypotenuse. Triangle is RIGHT";
inline constexpr const char* kMsgVerifiedNotRight =
    "Input sorted: largest treated as hypotenuse. Triangle is NOT right";
inline constexpr const char* kMsgAmbiguousInput =
    "Enter exactly two values to compute the missing one, or all three values to verify.";

// What a request with these fields would do, judged by filled-in count only
// (2 -> kSolve, 3 -> kVerify, anything else -> kNone). Used by presentation
// code to label or disable its action before submitting.
enum class Mode : int { kNone = 0, kSolve = 1, kVerify = 2 };

const char* mode_to_string(Mode m) noexcept;

Mode detect_mode(const FieldMap& data, const FieldNames& names = {}) noexcept;

TriangleRecord process_fields(const FieldMap& data) noexcept;
TriangleRecord process_fields(const FieldMap& data, const SolverSettings& settings) noexcept;

}  // namespace pythag

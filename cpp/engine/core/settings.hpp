#pragma once
/*
================================================================================
Fragment 1.4 — Core: Solver Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize the numerical tolerance used by the right-angle check and the
    field names of the input contract into one validated object.

Right-angle tolerance:
  |lhs - rhs| <= max(abs_floor, rel_band * max(lhs, rhs))
  with lhs = a^2 + b^2, rhs = c^2.
  The absolute floor keeps tiny triangles from being judged by a vanishing
  band; the relative band keeps large triangles from failing on rounding.
  Defaults (1e-12, 1e-9) are part of the observable contract.

Hardening:
  - validate_or_throw() rejects nonsensical values early.
================================================================================
*/

#include <cmath>
#include <string>

#include "engine/core/errors.hpp"

namespace pythag {

// ----------------------------- Tolerance -------------------------------------
struct ToleranceSettings {
  double abs_floor = 1e-12;
  double rel_band = 1e-9;

  void validate_or_throw() const {
    if (!std::isfinite(abs_floor) || abs_floor < 0.0 || abs_floor > 1e-3) {
      PYTHAG_THROW(ErrorCode::kInvalidConfig, "ToleranceSettings: abs_floor outside sane bounds");
    }
    if (!std::isfinite(rel_band) || rel_band < 0.0 || rel_band > 1e-2) {
      PYTHAG_THROW(ErrorCode::kInvalidConfig, "ToleranceSettings: rel_band outside sane bounds");
    }
  }
};

// ----------------------------- Field names -----------------------------------
// Names of the three input fields: a, b are legs, c is the hypotenuse.
struct FieldNames {
  std::string leg_a = "a";
  std::string leg_b = "b";
  std::string hypotenuse = "c";

  void validate_or_throw() const {
    if (leg_a.empty() || leg_b.empty() || hypotenuse.empty()) {
      PYTHAG_THROW(ErrorCode::kInvalidConfig, "FieldNames: names must not be empty");
    }
    if (leg_a == leg_b || leg_a == hypotenuse || leg_b == hypotenuse) {
      PYTHAG_THROW(ErrorCode::kInvalidConfig, "FieldNames: names must be distinct");
    }
  }
};

// ----------------------------- SolverSettings --------------------------------
struct SolverSettings {
  ToleranceSettings tolerance;
  FieldNames fields;

  void validate_or_throw() const {
    tolerance.validate_or_throw();
    fields.validate_or_throw();
  }

  static SolverSettings defaults() {
    SolverSettings s;
    return s;
  }
};

}  // namespace pythag

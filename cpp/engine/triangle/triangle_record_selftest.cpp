/*
  Triangle Record Selftest

  Deterministic microtests for the geometric operations:
    - compute_hypotenuse / compute_leg (values, flags, failure codes)
    - normalize (ordering, idempotence, permutations)
    - check_triangle_inequality (boundary a + b == c)
    - check_right_angle (tolerance band at tiny and huge magnitudes)

  Framework-free: run ./triangle_record_selftest, non-zero exit on failure.
*/

#include <algorithm>
#include <array>
#include <cmath>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "engine/triangle/tolerance.hpp"
#include "engine/triangle/triangle_record.hpp"

namespace pythag {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

bool near(const std::optional<double>& a, double b, double rel = 1e-12) {
  if (!a.has_value()) return false;
  return std::fabs(*a - b) <= rel * std::max({1.0, std::fabs(*a), std::fabs(b)});
}

void expect_error(const std::function<void()>& fn, ErrorCode code, std::string_view msg) {
  try {
    fn();
    fail(msg);
    std::cerr << "  expected " << to_string(code) << ", nothing thrown\n";
  } catch (const Error& e) {
    if (e.code() != code) {
      fail(msg);
      std::cerr << "  expected " << to_string(code) << ", got " << to_string(e.code()) << "\n";
    } else {
      pass(msg);
    }
  }
}

TriangleRecord make(std::optional<double> a, std::optional<double> b, std::optional<double> c) {
  TriangleRecord t;
  t.a = a;
  t.b = b;
  t.c = c;
  return t;
}

void test_compute_hypotenuse() {
  TriangleRecord t = make(3.0, 4.0, std::nullopt);
  t.compute_hypotenuse();
  expect_true(near(t.c, 5.0), "hypotenuse: 3,4 -> 5");
  expect_true(t.is_valid && t.is_right, "hypotenuse: flags set");
  expect_true(t.computed == Side::kC, "hypotenuse: computed side is c");

  const double legs[][2] = {{1.0, 1.0}, {0.001, 2000.0}, {5.0, 12.0}, {1e-6, 1e-6}, {1e150, 1e150}};
  for (const auto& p : legs) {
    TriangleRecord u = make(p[0], p[1], std::nullopt);
    u.compute_hypotenuse();
    expect_true(near(u.c, std::sqrt(p[0] * p[0] + p[1] * p[1])), "hypotenuse: sqrt(p^2 + q^2)");
  }

  expect_error([] { make(std::nullopt, 4.0, std::nullopt).compute_hypotenuse(); }, ErrorCode::kMissingSide,
               "hypotenuse: missing a rejected");
  expect_error([] { make(3.0, std::nullopt, std::nullopt).compute_hypotenuse(); }, ErrorCode::kMissingSide,
               "hypotenuse: missing b rejected");
  expect_error([] { make(std::nullopt, std::nullopt, std::nullopt).compute_hypotenuse(); },
               ErrorCode::kMissingSide, "hypotenuse: both legs missing rejected");
}

void test_compute_leg() {
  struct Case {
    std::optional<double> a, b;
    double c, ea, eb;
    Side computed;
  };
  const Case cases[] = {
      {3.0, std::nullopt, 5.0, 3.0, 4.0, Side::kB},
      {std::nullopt, 4.0, 5.0, 3.0, 4.0, Side::kA},
      {5.0, std::nullopt, 13.0, 5.0, 12.0, Side::kB},
      {std::nullopt, 12.0, 13.0, 5.0, 12.0, Side::kA},
  };
  for (const auto& cs : cases) {
    TriangleRecord t = make(cs.a, cs.b, cs.c);
    t.compute_leg();
    expect_true(near(t.a, cs.ea) && near(t.b, cs.eb), "leg: expected legs");
    expect_true(t.is_valid && t.is_right, "leg: flags set");
    expect_true(t.computed == cs.computed, "leg: computed side recorded");
  }

  expect_error([] { make(3.0, std::nullopt, std::nullopt).compute_leg(); }, ErrorCode::kMissingSide,
               "leg: missing hypotenuse rejected");
  expect_error([] { make(std::nullopt, std::nullopt, 5.0).compute_leg(); }, ErrorCode::kGeometryUsage,
               "leg: no leg known rejected");
  expect_error([] { make(3.0, 4.0, 5.0).compute_leg(); }, ErrorCode::kGeometryUsage,
               "leg: both legs known rejected");
  expect_error([] { make(6.0, std::nullopt, 5.0).compute_leg(); }, ErrorCode::kLegExceedsHypotenuse,
               "leg: known leg > hypotenuse rejected");
  expect_error([] { make(std::nullopt, 5.0, 5.0).compute_leg(); }, ErrorCode::kDegenerateTriangle,
               "leg: known leg == hypotenuse rejected");

  TriangleRecord t = make(6.0, std::nullopt, 5.0);
  try {
    t.compute_leg();
  } catch (const Error& e) {
    expect_true(e.message() == "Hypotenuse c must be greater than the known leg.", "leg: exceed message");
  }
  expect_true(!t.b.has_value() && !t.is_valid && !t.is_right, "leg: failed call leaves record untouched");
}

void test_normalize() {
  const std::array<std::array<double, 3>, 6> perms = {{
      {3, 4, 5}, {3, 5, 4}, {4, 3, 5}, {4, 5, 3}, {5, 3, 4}, {5, 4, 3},
  }};
  for (const auto& p : perms) {
    TriangleRecord t = make(p[0], p[1], p[2]);
    t.normalize();
    expect_true(*t.a == 3.0 && *t.b == 4.0 && *t.c == 5.0, "normalize: permutation of 3,4,5 -> 3,4,5");
  }

  TriangleRecord sorted = make(2.0, 7.5, 9.0);
  sorted.normalize();
  expect_true(*sorted.a == 2.0 && *sorted.b == 7.5 && *sorted.c == 9.0, "normalize: sorted input unchanged");
  sorted.normalize();
  expect_true(*sorted.a == 2.0 && *sorted.b == 7.5 && *sorted.c == 9.0, "normalize: idempotent");

  expect_error([] { make(3.0, std::nullopt, 5.0).normalize(); }, ErrorCode::kMissingSide,
               "normalize: missing side rejected");
}

void test_triangle_inequality() {
  struct Case {
    double a, b, c;
    bool ok;
  };
  const Case cases[] = {
      {3.0, 4.0, 5.0, true},
      {1.0, 2.0, 3.0, false},
      {1.0, 1.0, 2.0, false},
      {1.0, 1.0, 3.0, false},
      {3.0, 1.0, 2.0, false},
      {2.0, 3.0, 4.0, true},
  };
  for (const auto& cs : cases) {
    TriangleRecord t = make(cs.a, cs.b, cs.c);
    t.normalize();
    if (cs.ok) {
      t.check_triangle_inequality();
      expect_true(t.is_valid, "inequality: feasible triangle accepted");
    } else {
      expect_error([&] { t.check_triangle_inequality(); }, ErrorCode::kTriangleInequality,
                   "inequality: a + b <= c rejected");
      expect_true(!t.is_valid, "inequality: is_valid stays false");
    }
  }
}

void test_right_angle() {
  TriangleRecord t = make(3.0, 4.0, 5.0);
  t.check_right_angle();
  expect_true(t.is_right, "right angle: 3,4,5 is right");

  TriangleRecord u = make(2.0, 3.0, 4.0);
  u.check_right_angle();
  expect_true(!u.is_right, "right angle: 2,3,4 is not right");

  const double big = 1e9;
  TriangleRecord v = make(big, big, std::sqrt(2.0) * big);
  v.check_right_angle();
  expect_true(v.is_right, "right angle: 1e9 scale classified right");

  // Relative band: 1e-9 of c^2 = 25e-9. An error of 1e-12 in c keeps
  // |lhs - rhs| ~ 1e-11, well inside; 1e-6 in c gives ~1e-5, outside.
  TriangleRecord w = make(3.0, 4.0, 5.0 + 1e-12);
  w.check_right_angle();
  expect_true(w.is_right, "right angle: tiny error inside band");
  TriangleRecord x = make(3.0, 4.0, 5.0 + 1e-6);
  x.check_right_angle();
  expect_true(!x.is_right, "right angle: error outside band");

  // Absolute floor dominates for tiny triangles.
  expect_true(pythagorean_band(1e-8, 1e-8) == 1e-12, "band: absolute floor at tiny magnitude");
  expect_true(std::fabs(pythagorean_band(1e6, 1e6) - 1e-3) < 1e-15, "band: relative band at large magnitude");
  expect_true(pythagorean_match(1.0, 1.0 + 0.5e-9), "band: just inside relative band");
  expect_true(!pythagorean_match(1.0, 1.0 + 2e-9), "band: just outside relative band");

  ToleranceSettings strict;
  strict.abs_floor = 0.0;
  strict.rel_band = 0.0;
  TriangleRecord y = make(3.0, 4.0, 5.0 + 1e-12);
  y.check_right_angle(strict);
  expect_true(!y.is_right, "right angle: zero tolerance is exact");

  expect_error([] { make(3.0, 4.0, std::nullopt).check_right_angle(); }, ErrorCode::kMissingSide,
               "right angle: missing side rejected");
}

// Ratio check: works at any magnitude, unlike an absolute tolerance.
bool near_ratio(const std::optional<double>& v, double expected, double rel = 1e-12) {
  return v.has_value() && std::isfinite(*v) && *v > 0.0 && std::fabs(*v / expected - 1.0) <= rel;
}

void test_extreme_magnitudes() {
  TriangleRecord big = make(1e200, 1e200, std::nullopt);
  big.compute_hypotenuse();
  expect_true(near_ratio(big.c, std::sqrt(2.0) * 1e200), "extreme: hypotenuse of 1e200 legs is finite");

  TriangleRecord tiny = make(1e-200, 1e-200, std::nullopt);
  tiny.compute_hypotenuse();
  expect_true(near_ratio(tiny.c, std::sqrt(2.0) * 1e-200), "extreme: hypotenuse of 1e-200 legs is positive");

  TriangleRecord over = make(1.5e308, 1.5e308, std::nullopt);
  expect_error([&] { over.compute_hypotenuse(); }, ErrorCode::kNotRepresentable,
               "extreme: overflowing hypotenuse rejected");
  expect_true(!over.c.has_value() && !over.is_valid && !over.is_right,
              "extreme: rejected hypotenuse leaves record untouched");

  TriangleRecord small_leg = make(std::nullopt, 1e-170, 1.5e-170);
  small_leg.compute_leg();
  expect_true(near_ratio(small_leg.a, std::sqrt(1.25) * 1e-170), "extreme: leg from 1e-170 scale is positive");

  TriangleRecord big_leg = make(std::nullopt, 1e308, 1.7e308);
  big_leg.compute_leg();
  expect_true(near_ratio(big_leg.a, std::sqrt(1.89) * 1e308, 1e-9), "extreme: leg near DBL_MAX is finite");

  // Smallest denormals still give a positive leg.
  TriangleRecord denorm = make(5e-324, std::nullopt, 1e-323);
  denorm.compute_leg();
  expect_true(denorm.b.has_value() && *denorm.b > 0.0, "extreme: leg from denormal inputs is positive");
}

void test_round_trip() {
  const double legs[][2] = {{3.0, 4.0}, {1.0, 1.0}, {0.7, 123.4}, {1e-3, 2e-3}, {1e8, 3e8}};
  for (const auto& p : legs) {
    TriangleRecord s = make(p[0], p[1], std::nullopt);
    s.compute_hypotenuse();

    TriangleRecord v = make(p[0], p[1], s.c);
    v.normalize();
    v.check_triangle_inequality();
    v.check_right_angle();
    expect_true(v.is_valid && v.is_right, "round trip: computed hypotenuse verifies as right");
  }
}

}  // namespace
}  // namespace pythag

int main() {
  using namespace pythag;

  test_compute_hypotenuse();
  test_compute_leg();
  test_normalize();
  test_triangle_inequality();
  test_right_angle();
  test_extreme_magnitudes();
  test_round_trip();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}

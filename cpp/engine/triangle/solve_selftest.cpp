/*
  Solve / Verify Orchestration Selftest

  End-to-end scenarios through process_fields():
    - SOLVE: hypotenuse / leg computed, message + outcome + computed side
    - VERIFY: out-of-order input sorted, RIGHT / NOT right / impossible
    - Rejections never throw and always carry a message, code and flags reset
    - detect_mode() button rule

  Framework-free: run ./solve_selftest, non-zero exit on failure.
*/

#include <cmath>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/triangle/solve.hpp"

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

void expect_contains(const std::string& hay, std::string_view needle, std::string_view msg) {
  if (hay.find(needle) == std::string::npos) {
    fail(msg);
    std::cerr << "  message: " << hay << "\n";
    std::cerr << "  missing: " << needle << "\n";
  } else {
    pass(msg);
  }
}

bool near(const std::optional<double>& a, double b) {
  return a.has_value() && std::fabs(*a - b) <= 1e-12 * std::fmax(1.0, std::fabs(b));
}

FieldMap make(std::optional<std::string> a, std::optional<std::string> b, std::optional<std::string> c) {
  FieldMap m;
  m["a"] = std::move(a);
  m["b"] = std::move(b);
  m["c"] = std::move(c);
  return m;
}

void expect_rejected(const TriangleRecord& r, ErrorCode code, std::string_view msg) {
  const bool ok = r.outcome == Outcome::kRejected && r.code == code && !r.is_valid && !r.is_right &&
                  !r.message.empty();
  if (!ok) {
    fail(msg);
    std::cerr << "  outcome=" << outcome_to_string(r.outcome) << " code=" << to_string(r.code)
              << " message=" << r.message << "\n";
  } else {
    pass(msg);
  }
}

void test_solve_hypotenuse() {
  const TriangleRecord r = process_fields(make("3", "4", ""));
  expect_true(r.message == "Hypotenuse calculated", "solve: hypotenuse message");
  expect_true(near(r.c, 5.0), "solve: c = 5");
  expect_true(r.is_valid && r.is_right, "solve: hypotenuse flags");
  expect_true(r.outcome == Outcome::kComputed && r.code == ErrorCode::kOk, "solve: outcome Computed");
  expect_true(r.computed == Side::kC, "solve: computed side c");

  const TriangleRecord n = process_fields(make("3", "4", std::nullopt));
  expect_true(near(n.c, 5.0), "solve: absent value treated like blank");
}

void test_solve_leg() {
  const TriangleRecord r = process_fields(make("", "4", "5"));
  expect_true(near(r.a, 3.0) && r.message == "Leg calculated", "solve: a = 3, Leg calculated");
  expect_true(r.is_valid && r.is_right && r.computed == Side::kA, "solve: leg a flags");

  const TriangleRecord s = process_fields(make("3", "  ", "5"));
  expect_true(near(s.b, 4.0) && s.message == "Leg calculated", "solve: b = 4, Leg calculated");
  expect_true(s.computed == Side::kB, "solve: computed side b");

  const TriangleRecord bad = process_fields(make("6", "", "5"));
  expect_rejected(bad, ErrorCode::kLegExceedsHypotenuse, "solve: known leg > c rejected");
  expect_contains(bad.message, "Hypotenuse c must be greater", "solve: leg > c message");
  expect_true(near(bad.a, 6.0) && near(bad.c, 5.0) && !bad.b.has_value(),
              "solve: parsed sides preserved on failure");

  const TriangleRecord eq = process_fields(make("5", "", "5"));
  expect_rejected(eq, ErrorCode::kDegenerateTriangle, "solve: known leg == c rejected");
}

void test_verify() {
  const TriangleRecord r = process_fields(make("4", "5", "3"));
  expect_true(r.is_valid && r.is_right, "verify: 4,5,3 valid and right");
  expect_true(*r.a == 3.0 && *r.b == 4.0 && *r.c == 5.0, "verify: sides sorted to 3,4,5");
  expect_contains(r.message, "Triangle is RIGHT", "verify: RIGHT message");
  expect_contains(r.message, "Input sorted: largest treated as hypotenuse", "verify: sorted-order note");
  expect_true(r.outcome == Outcome::kVerified && r.computed == Side::kNone, "verify: outcome Verified");

  const TriangleRecord n = process_fields(make("2", "3", "4"));
  expect_true(n.is_valid && !n.is_right, "verify: 2,3,4 valid, not right");
  expect_contains(n.message, "Triangle is NOT right", "verify: NOT right message");
  expect_true(n.outcome == Outcome::kVerified && n.code == ErrorCode::kOk, "verify: NOT right is not an error");

  const TriangleRecord i = process_fields(make("1", "2", "3"));
  expect_rejected(i, ErrorCode::kTriangleInequality, "verify: 1,2,3 impossible");
  expect_contains(i.message, "Triangle is impossible", "verify: impossible message");

  const TriangleRecord big = process_fields(make("1e9", "1e9", "1414213562.373095"));
  expect_true(big.is_valid && big.is_right, "verify: large-magnitude right triangle");
}

void test_extreme_magnitudes() {
  const TriangleRecord big = process_fields(make("1e200", "1e200", ""));
  expect_true(big.outcome == Outcome::kComputed && big.c.has_value() && std::isfinite(*big.c),
              "extreme: 1e200 legs give a finite hypotenuse");
  expect_true(big.c.has_value() && std::fabs(*big.c / 1e200 - std::sqrt(2.0)) <= 1e-12,
              "extreme: 1e200 hypotenuse value");

  const TriangleRecord tiny = process_fields(make("1e-200", "1e-200", ""));
  expect_true(tiny.outcome == Outcome::kComputed && tiny.c.has_value() && *tiny.c > 0.0,
              "extreme: 1e-200 legs give a positive hypotenuse");

  const TriangleRecord leg = process_fields(make("", "1e-170", "1.5e-170"));
  expect_true(leg.outcome == Outcome::kComputed && leg.a.has_value() && *leg.a > 0.0,
              "extreme: leg at 1e-170 scale is positive");

  const TriangleRecord over = process_fields(make("1.5e308", "1.5e308", ""));
  expect_rejected(over, ErrorCode::kNotRepresentable, "extreme: overflowing hypotenuse rejected");
  expect_true(!over.c.has_value() && over.computed == Side::kNone, "extreme: no hypotenuse stored on overflow");
}

void test_round_trip() {
  const char* legs[][2] = {{"3", "4"}, {"0.3", "0.7"}, {"12.5", "1e5"}};
  for (const auto& p : legs) {
    const TriangleRecord s = process_fields(make(p[0], p[1], ""));
    std::ostringstream c;
    c << std::setprecision(17) << *s.c;
    const TriangleRecord v = process_fields(make(p[0], p[1], c.str()));
    expect_true(v.is_valid && v.is_right, "round trip: solve then verify is right");
  }
}

void test_rejections_never_throw() {
  const std::vector<FieldMap> bad_shape = {
      {{"a", "3"}, {"b", "4"}},
      {{"a", "3"}, {"b", "4"}, {"c", "5"}, {"d", "1"}},
      {},
  };
  for (const auto& m : bad_shape) {
    const TriangleRecord r = process_fields(m);
    expect_rejected(r, ErrorCode::kInvalidFieldSet, "reject: wrong key set");
    expect_contains(r.message, "Data must contain exactly keys", "reject: key set message");
  }

  const std::vector<FieldMap> ambiguous = {
      make("", "", ""),
      make("3", "", ""),
      make("", "4", ""),
      make("", "", "5"),
  };
  for (const auto& m : ambiguous) {
    const TriangleRecord r = process_fields(m);
    expect_rejected(r, ErrorCode::kAmbiguousInput, "reject: fewer than two values");
    expect_contains(r.message, "Enter exactly two values", "reject: ambiguous message");
  }

  struct Case {
    const char* a;
    ErrorCode code;
    const char* needle;
  };
  const Case cases[] = {
      {"0", ErrorCode::kNotPositive, "greater than zero"},
      {"-1", ErrorCode::kNotPositive, "greater than zero"},
      {"nan", ErrorCode::kNotFinite, "finite"},
      {"inf", ErrorCode::kNotFinite, "finite"},
      {"abc", ErrorCode::kNotANumber, "must be a number"},
      {"3,5", ErrorCode::kNotANumber, "must be a number"},
  };
  for (const auto& cs : cases) {
    const TriangleRecord r = process_fields(make(cs.a, "4", ""));
    expect_rejected(r, cs.code, std::string("reject: a='") + cs.a + "'");
    expect_contains(r.message, cs.needle, "reject: parse message");
    expect_true(r.field == "a", "reject: offending field reported");
  }

  // a parses, b fails: a stays on the record.
  const TriangleRecord partial = process_fields(make("3", "x", ""));
  expect_true(near(partial.a, 3.0) && partial.field == "b", "reject: earlier fields preserved");
}

void test_rejection_with_debug_logging() {
  // Rejection path builds log lines and record text; at DEBUG every log call runs.
  set_log_level(LogLevel::DEBUG);
  const TriangleRecord r = process_fields(make("3", "x", ""));
  const TriangleRecord k = process_fields({{"a", "3"}});
  set_log_level(LogLevel::ERROR);
  expect_rejected(r, ErrorCode::kNotANumber, "reject: logged rejection still stamped");
  expect_true(r.field == "b", "reject: logged rejection keeps field");
  expect_rejected(k, ErrorCode::kInvalidFieldSet, "reject: logged key-set rejection still stamped");
  expect_true(k.field.empty(), "reject: key-set rejection has no field");
}

void test_invalid_settings_rejected() {
  SolverSettings s = SolverSettings::defaults();
  s.tolerance.rel_band = -1.0;
  const TriangleRecord r = process_fields(make("3", "4", ""), s);
  expect_rejected(r, ErrorCode::kInvalidConfig, "settings: invalid tolerance rejected, not thrown");
}

void test_detect_mode() {
  expect_true(detect_mode(make("3", "4", "")) == Mode::kSolve, "mode: two values -> Solve");
  expect_true(detect_mode(make("3", "4", "5")) == Mode::kVerify, "mode: three values -> Verify");
  expect_true(detect_mode(make("3", " ", std::nullopt)) == Mode::kNone, "mode: one value -> None");
  expect_true(detect_mode(make("", "", "")) == Mode::kNone, "mode: no values -> None");
  expect_true(detect_mode({{"a", "3"}, {"c", "5"}}) == Mode::kSolve, "mode: counts present keys only");
  expect_true(detect_mode(make("abc", "4", "")) == Mode::kSolve, "mode: counts filled, not parsed");

  expect_true(std::string(mode_to_string(Mode::kNone)) == "None", "mode name: None");
  expect_true(std::string(mode_to_string(Mode::kSolve)) == "Solve", "mode name: Solve");
  expect_true(std::string(mode_to_string(Mode::kVerify)) == "Verify", "mode name: Verify");
  expect_true(std::string(mode_to_string(static_cast<Mode>(7))) == "None", "mode name: unknown value -> None");
}

}  // namespace
}  // namespace pythag

int main() {
  using namespace pythag;

  set_log_level(LogLevel::ERROR);

  test_solve_hypotenuse();
  test_solve_leg();
  test_verify();
  test_extreme_magnitudes();
  test_round_trip();
  test_rejections_never_throw();
  test_rejection_with_debug_logging();
  test_invalid_settings_rejected();
  test_detect_mode();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}

/*
  Record Report Selftest

  Validates:
    1) JSON key order is stable and absent sides are emitted as null.
    2) JSON never contains nan/inf literals.
    3) Strings are escaped.
    4) Text summary marks the computed side and the rejection code.

  Framework-free: run ./record_report_selftest, non-zero exit on failure.
*/

#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "engine/core/logging.hpp"
#include "engine/report/record_report.hpp"
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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

bool contains(const std::string& hay, std::string_view needle) {
  return hay.find(needle) != std::string::npos;
}

FieldMap make(const char* a, const char* b, const char* c) {
  return FieldMap{{"a", std::string(a)}, {"b", std::string(b)}, {"c", std::string(c)}};
}

void test_compact_json_solve() {
  const TriangleRecord r = process_fields(make("3", "4", ""));
  JsonWriteOptions opt;
  opt.pretty = false;
  expect_eq_str(record_to_json(r, opt),
                "{\"outcome\":\"Computed\",\"code\":\"Ok\",\"code_value\":0,\"field\":\"\","
                "\"a\":3,\"b\":4,\"c\":5,\"computed\":\"c\",\"is_valid\":true,\"is_right\":true,"
                "\"message\":\"Hypotenuse calculated\"}",
                "JSON: compact solve output");
}

void test_json_null_for_absent() {
  const TriangleRecord r = process_fields(make("", "", "5"));
  JsonWriteOptions opt;
  opt.pretty = false;
  const std::string j = record_to_json(r, opt);
  expect_true(contains(j, "\"a\":null") && contains(j, "\"b\":null") && contains(j, "\"c\":5"),
              "JSON: absent sides -> null");
  expect_true(contains(j, "\"outcome\":\"Rejected\"") && contains(j, "\"code\":\"AmbiguousInput\""),
              "JSON: rejection outcome + code");
  expect_true(!contains(j, "nan") && !contains(j, "inf"), "JSON: no non-finite literals");
}

void test_json_non_finite_as_null() {
  TriangleRecord r;
  r.outcome = Outcome::kComputed;
  r.a = 3.0;
  r.b = std::numeric_limits<double>::quiet_NaN();
  r.c = std::numeric_limits<double>::infinity();
  r.message = "x";
  JsonWriteOptions opt;
  opt.pretty = false;
  const std::string j = record_to_json(r, opt);
  expect_true(contains(j, "\"a\":3,") && contains(j, "\"b\":null") && contains(j, "\"c\":null"),
              "JSON: non-finite sides -> null");
  expect_true(!contains(j, "nan") && !contains(j, "inf"), "JSON: no non-finite literals for inf/nan sides");

  r.c = -std::numeric_limits<double>::infinity();
  expect_true(contains(record_to_json(r, opt), "\"c\":null"), "JSON: -inf -> null");
}

void test_json_pretty_and_escape() {
  TriangleRecord r;
  r.outcome = Outcome::kRejected;
  r.code = ErrorCode::kNotANumber;
  r.field = "a";
  r.message = "quote \" backslash \\ newline \n";
  const std::string j = record_to_json(r);
  expect_true(contains(j, "\"message\": \"quote \\\" backslash \\\\ newline \\n\""), "JSON: strings escaped");
  expect_true(j.front() == '{' && contains(j, "\n  \"outcome\": \"Rejected\",\n"), "JSON: pretty indentation");
  expect_true(j.size() >= 2 && j.substr(j.size() - 2) == "}\n", "JSON: pretty output ends with newline");
}

void test_text_summary() {
  const TriangleRecord r = process_fields(make("", "4", "5"));
  const std::string t = format_record_text(r);
  expect_true(contains(t, "a = 3  (computed)\n"), "text: computed side marked");
  expect_true(contains(t, "b = 4\n") && contains(t, "c = 5\n"), "text: given sides listed");
  expect_true(contains(t, "valid: yes\n") && contains(t, "right: yes\n"), "text: flags");
  expect_true(contains(t, "Leg calculated\n"), "text: message");

  const TriangleRecord bad = process_fields(make("3", "0", ""));
  const std::string u = format_record_text(bad);
  expect_true(contains(u, "error: NotPositive (field b)\n"), "text: error code and field");
  expect_true(contains(u, "a = 3\n") && contains(u, "b = -\n") && contains(u, "c = -\n"),
              "text: unparsed sides shown as '-'");
}

}  // namespace
}  // namespace pythag

int main() {
  using namespace pythag;

  set_log_level(LogLevel::ERROR);

  test_compact_json_solve();
  test_json_null_for_absent();
  test_json_non_finite_as_null();
  test_json_pretty_and_escape();
  test_text_summary();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}

/*
  Field Validator Selftest

  Checks the input contract of the engine without any solver wiring:
    1) Key set must be exactly {a, b, c}.
    2) Blank / absent values map to "missing".
    3) Present values: number, finite, > 0, each with its own code + field.

  Framework-free: run ./field_validator_selftest, non-zero exit on failure.
*/

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "engine/input/field_validator.hpp"

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

// Runs fn, expects a pythag::Error with the given code (and field, if given).
void expect_error(const std::function<void()>& fn,
                  ErrorCode code,
                  std::string_view msg,
                  std::string_view field = {}) {
  try {
    fn();
    fail(msg);
    std::cerr << "  expected " << to_string(code) << ", nothing thrown\n";
  } catch (const Error& e) {
    if (e.code() != code) {
      fail(msg);
      std::cerr << "  expected " << to_string(code) << ", got " << to_string(e.code()) << "\n";
    } else if (!field.empty() && e.field() != field) {
      fail(msg);
      std::cerr << "  expected field " << field << ", got '" << e.field() << "'\n";
    } else {
      pass(msg);
    }
  }
}

FieldMap make(std::optional<std::string> a, std::optional<std::string> b, std::optional<std::string> c) {
  FieldMap m;
  m["a"] = std::move(a);
  m["b"] = std::move(b);
  m["c"] = std::move(c);
  return m;
}

void test_required_keys_ok() {
  try {
    validate_required_keys(make("1", "2", "3"));
    validate_required_keys(make(std::nullopt, "", "3"));
    pass("required keys: exact key set accepted");
  } catch (const Error& e) {
    fail(std::string("required keys: exact key set threw: ") + e.what());
  }
}

void test_required_keys_rejected() {
  const std::vector<FieldMap> bad = {
      {{"a", "1"}, {"b", "2"}},
      {{"a", "1"}, {"c", "3"}},
      {{"b", "2"}, {"c", "3"}},
      {{"a", "1"}, {"b", "2"}, {"c", "3"}, {"d", "4"}},
      {{"a", "1"}, {"b", "2"}, {"d", "4"}},
      {},
  };
  for (const auto& m : bad) {
    expect_error([&] { validate_required_keys(m); }, ErrorCode::kInvalidFieldSet,
                 "required keys: wrong key set rejected");
  }

  try {
    validate_required_keys({{"a", "1"}, {"b", "2"}});
  } catch (const Error& e) {
    expect_true(e.message() == "Data must contain exactly keys: a, b, c",
                "required keys: message lists the expected keys");
  }
}

void test_custom_field_names() {
  FieldNames n;
  n.leg_a = "x";
  n.leg_b = "y";
  n.hypotenuse = "h";
  const FieldMap m = {{"x", "3"}, {"y", "4"}, {"h", ""}};
  try {
    const ParsedFields p = parse_fields(m, n);
    expect_true(p.a == 3.0 && p.b == 4.0 && !p.c.has_value(), "custom names: parsed by configured names");
  } catch (const Error& e) {
    fail(std::string("custom names: threw: ") + e.what());
  }
  expect_error([&] { validate_required_keys(make("3", "4", "5"), n); }, ErrorCode::kInvalidFieldSet,
               "custom names: default names rejected");
}

void test_blank_is_missing() {
  const std::vector<std::optional<std::string>> blanks = {std::nullopt, "", "   ", "\t\n"};
  for (const auto& v : blanks) {
    expect_true(!validate_value("a", v).has_value(), "value: blank maps to missing");
  }
}

void test_valid_numbers() {
  struct Case {
    const char* text;
    double expected;
  };
  const Case cases[] = {{"3", 3.0}, {"3.5", 3.5}, {"  3.5  ", 3.5}, {"1e-3", 0.001}, {"+2", 2.0}, {".5", 0.5}};
  for (const auto& c : cases) {
    try {
      const auto v = validate_value("a", std::string(c.text));
      expect_true(v.has_value() && *v == c.expected, std::string("value: parses '") + c.text + "'");
    } catch (const Error& e) {
      fail(std::string("value: '") + c.text + "' threw: " + e.what());
    }
  }
}

void test_non_positive() {
  for (const char* t : {"0", "-1", "-0.0001", "0.0", "-0"}) {
    expect_error([&] { (void)validate_value("a", std::string(t)); }, ErrorCode::kNotPositive,
                 std::string("value: non-positive '") + t + "' rejected", "a");
  }
  try {
    (void)validate_value("b", std::string("0"));
  } catch (const Error& e) {
    expect_true(e.message() == "Field b: value must be greater than zero.",
                "value: non-positive message names field");
  }
}

void test_non_finite() {
  for (const char* t : {"nan", "NaN", "inf", "+inf", "-inf", "Infinity", "1e400"}) {
    expect_error([&] { (void)validate_value("c", std::string(t)); }, ErrorCode::kNotFinite,
                 std::string("value: non-finite '") + t + "' rejected", "c");
  }
  try {
    (void)validate_value("a", std::string("nan"));
  } catch (const Error& e) {
    expect_true(e.message().find("finite") != std::string::npos, "value: non-finite message mentions finite");
  }
}

void test_not_a_number() {
  for (const char* t : {"abc", "3,5", "3.5.1", "4a", "0x10", "1 2", "--1"}) {
    expect_error([&] { (void)validate_value("a", std::string(t)); }, ErrorCode::kNotANumber,
                 std::string("value: not-a-number '") + t + "' rejected", "a");
  }
  try {
    (void)validate_value("a", std::string("abc"));
  } catch (const Error& e) {
    expect_true(e.message() == "Field a: value must be a number.", "value: not-a-number message");
  }
}

void test_parse_fields_counts_missing() {
  try {
    const ParsedFields p = parse_fields(make("3", "", std::nullopt));
    expect_true(p.missing_count() == 2, "parse_fields: missing count");
  } catch (const Error& e) {
    fail(std::string("parse_fields: threw: ") + e.what());
  }
}

}  // namespace
}  // namespace pythag

int main() {
  using namespace pythag;

  test_required_keys_ok();
  test_required_keys_rejected();
  test_custom_field_names();
  test_blank_is_missing();
  test_valid_numbers();
  test_non_positive();
  test_non_finite();
  test_not_a_number();
  test_parse_fields_counts_missing();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}

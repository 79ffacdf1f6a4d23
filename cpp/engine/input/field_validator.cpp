#include "engine/input/field_validator.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

namespace pythag {
namespace {

inline bool is_space(char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

std::string_view trim(std::string_view s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string field_message(std::string_view key, const char* rule) {
  std::string msg = "Field ";
  msg.append(key.data(), key.size());
  msg += ": ";
  msg += rule;
  return msg;
}

// Full-string strtod. Hex floats are refused: only decimal notation is part of
// the input contract.
bool parse_decimal(std::string_view text, double* out) {
  if (text.empty()) return false;
  if (text.find_first_of("xX") != std::string_view::npos) return false;

  const std::string buf(text);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(buf.c_str(), &end);
  if (end == buf.c_str() || end != buf.c_str() + buf.size()) return false;

  // Overflow yields +/-HUGE_VAL (classified as non-finite by the caller);
  // underflow yields 0 or a denormal (classified by sign/zero checks).
  *out = v;
  return true;
}

}  // namespace

bool is_blank(const std::optional<std::string>& raw) noexcept {
  if (!raw.has_value()) return true;
  for (char ch : *raw) {
    if (!is_space(ch)) return false;
  }
  return true;
}

void validate_required_keys(const FieldMap& data, const FieldNames& names) {
  const bool exact = data.size() == 3 &&
                     data.count(names.leg_a) == 1 &&
                     data.count(names.leg_b) == 1 &&
                     data.count(names.hypotenuse) == 1;
  if (!exact) {
    PYTHAG_THROW(ErrorCode::kInvalidFieldSet,
                 "Data must contain exactly keys: " + names.leg_a + ", " + names.leg_b + ", " +
                     names.hypotenuse);
  }
}

std::optional<double> validate_value(std::string_view key, const std::optional<std::string>& raw) {
  if (is_blank(raw)) return std::nullopt;

  double number = 0.0;
  if (!parse_decimal(trim(*raw), &number)) {
    PYTHAG_THROW_FIELD(ErrorCode::kNotANumber, std::string(key),
                       field_message(key, "value must be a number."));
  }
  if (!std::isfinite(number)) {
    PYTHAG_THROW_FIELD(ErrorCode::kNotFinite, std::string(key),
                       field_message(key, "value must be finite (not NaN or infinity)."));
  }
  if (number <= 0.0) {
    PYTHAG_THROW_FIELD(ErrorCode::kNotPositive, std::string(key),
                       field_message(key, "value must be greater than zero."));
  }
  return number;
}

ParsedFields parse_fields(const FieldMap& data, const FieldNames& names) {
  validate_required_keys(data, names);

  ParsedFields out;
  out.a = validate_value(names.leg_a, data.at(names.leg_a));
  out.b = validate_value(names.leg_b, data.at(names.leg_b));
  out.c = validate_value(names.hypotenuse, data.at(names.hypotenuse));
  return out;
}

}  // namespace pythag

#pragma once
/*
================================================================================
Fragment 2.1 — Input: Field Validator
FILE: cpp/engine/input/field_validator.hpp

Purpose:
  - Turn raw UI/CLI text for the three side fields into optional positive
    finite numbers.
  - Enforce the "exactly three named fields" contract.

Rules (per value):
  - absent, empty or whitespace-only  -> std::nullopt ("missing")
  - otherwise the trimmed text must parse entirely as a real number
    (dot decimal separator), be finite and be > 0.

Errors:
  - pythag::Error with code kInvalidFieldSet / kNotANumber / kNotFinite /
    kNotPositive. Parse errors carry the offending field name.
================================================================================
*/

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "engine/core/settings.hpp"

namespace pythag {

// Raw input: field name -> text, std::nullopt meaning "left blank".
using FieldMap = std::map<std::string, std::optional<std::string>>;

struct ParsedFields {
  std::optional<double> a;
  std::optional<double> b;
  std::optional<double> c;

  int missing_count() const noexcept {
    return static_cast<int>(!a.has_value()) + static_cast<int>(!b.has_value()) +
           static_cast<int>(!c.has_value());
  }
};

// True for absent values and for text made only of whitespace.
bool is_blank(const std::optional<std::string>& raw) noexcept;

// Throws kInvalidFieldSet unless the key set is exactly {a, b, c}.
void validate_required_keys(const FieldMap& data, const FieldNames& names = {});

// Parses one field. Returns std::nullopt for blank input.
std::optional<double> validate_value(std::string_view key, const std::optional<std::string>& raw);

// validate_required_keys + validate_value for each field.
ParsedFields parse_fields(const FieldMap& data, const FieldNames& names = {});

}  // namespace pythag

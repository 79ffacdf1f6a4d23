#pragma once
/*
================================================================================
Fragment 4.1 — Report: TriangleRecord -> JSON / Text
FILE: cpp/engine/report/record_report.hpp

JSON:
  - Flat object, stable key order:
      outcome, code, field, a, b, c, computed, is_valid, is_right, message
  - Absent sides -> null (JSON has no "missing").
  - Numbers printed with 15 significant digits.

Text:
  - One line per side, flags, then the message. After a solve the computed
    side is marked "(computed)".
================================================================================
*/

#include <iosfwd>
#include <string>

#include "engine/triangle/triangle_record.hpp"

namespace pythag {

struct JsonWriteOptions {
  bool pretty = true;
  int indent_spaces = 2;
};

std::string record_to_json(const TriangleRecord& record, const JsonWriteOptions& opt = {});

void write_record_json(std::ostream& os, const TriangleRecord& record, const JsonWriteOptions& opt = {});

std::string format_record_text(const TriangleRecord& record);

}  // namespace pythag

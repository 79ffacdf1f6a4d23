#include "engine/report/record_report.hpp"

#include <cmath>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace pythag {
namespace {

std::string escape_json(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);

  for (unsigned char c : s) {
    switch (c) {
      case '\"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          static const char* hex = "0123456789abcdef";
          out += "\\u00";
          out += hex[(c >> 4) & 0xF];
          out += hex[c & 0xF];
        } else {
          out += static_cast<char>(c);
        }
        break;
    }
  }
  return out;
}

// Single flat object writer: key order is the call order.
class JsonObjectWriter {
 public:
  JsonObjectWriter(std::ostream& os, const JsonWriteOptions& opt) : os_(os), opt_(opt) {
    os_ << "{";
  }

  void key_string(std::string_view k, std::string_view v) {
    key(k);
    os_ << "\"" << escape_json(v) << "\"";
  }

  void key_bool(std::string_view k, bool v) {
    key(k);
    os_ << (v ? "true" : "false");
  }

  void key_int(std::string_view k, int v) {
    key(k);
    os_ << v;
  }

  void key_number_or_null(std::string_view k, const std::optional<double>& v) {
    key(k);
    // JSON has no inf/nan literals.
    if (v.has_value() && std::isfinite(*v)) {
      os_ << std::setprecision(15) << *v;
    } else {
      os_ << "null";
    }
  }

  void close() {
    if (opt_.pretty && !first_) os_ << "\n";
    os_ << "}";
  }

 private:
  void key(std::string_view k) {
    if (!first_) os_ << ",";
    first_ = false;
    if (opt_.pretty) {
      os_ << "\n";
      for (int i = 0; i < opt_.indent_spaces; ++i) os_ << ' ';
    }
    os_ << "\"" << escape_json(k) << "\":";
    if (opt_.pretty) os_ << " ";
  }

  std::ostream& os_;
  JsonWriteOptions opt_;
  bool first_ = true;
};

void write_side_line(std::ostream& os, const char* name, const std::optional<double>& v, bool computed) {
  os << name << " = ";
  if (v.has_value()) {
    os << std::setprecision(15) << *v;
  } else {
    os << "-";
  }
  if (computed) os << "  (computed)";
  os << "\n";
}

}  // namespace

void write_record_json(std::ostream& os, const TriangleRecord& record, const JsonWriteOptions& opt) {
  JsonObjectWriter w(os, opt);
  w.key_string("outcome", outcome_to_string(record.outcome));
  w.key_string("code", to_string(record.code));
  w.key_int("code_value", static_cast<int>(record.code));
  w.key_string("field", record.field);
  w.key_number_or_null("a", record.a);
  w.key_number_or_null("b", record.b);
  w.key_number_or_null("c", record.c);
  w.key_string("computed", side_to_string(record.computed));
  w.key_bool("is_valid", record.is_valid);
  w.key_bool("is_right", record.is_right);
  w.key_string("message", record.message);
  w.close();

  if (opt.pretty) os << "\n";
}

std::string record_to_json(const TriangleRecord& record, const JsonWriteOptions& opt) {
  std::ostringstream ss;
  write_record_json(ss, record, opt);
  return ss.str();
}

std::string format_record_text(const TriangleRecord& record) {
  std::ostringstream os;

  write_side_line(os, "a", record.a, record.computed == Side::kA);
  write_side_line(os, "b", record.b, record.computed == Side::kB);
  write_side_line(os, "c", record.c, record.computed == Side::kC);

  os << "valid: " << (record.is_valid ? "yes" : "no") << "\n";
  os << "right: " << (record.is_right ? "yes" : "no") << "\n";

  if (record.outcome == Outcome::kRejected) {
    os << "error: " << to_string(record.code);
    if (!record.field.empty()) os << " (field " << record.field << ")";
    os << "\n";
  }

  os << record.message << "\n";
  return os.str();
}

}  // namespace pythag

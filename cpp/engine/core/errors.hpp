#pragma once
/*
================================================================================
Fragment 1.2 — Core: Error Types (Coded, Field-Aware)
FILE: cpp/engine/core/errors.hpp

Purpose:
  - One exception type for every validation / geometry failure in the engine.
  - Stable error codes so callers (CLI, UI, tests) branch on the category and
    never on message text.
  - Optional field name for parse failures ("which input box was wrong").

Hardening:
  - message() is the exact user-facing text; what() adds code + throw site
    for logs.
  - Macros capture __FILE__/__LINE__/__func__ for auditability.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace pythag {

// Keep these values stable once public (exit codes / JSON depend on them).
enum class ErrorCode : int {
  kOk = 0,

  // Input shape / parsing
  kInvalidFieldSet = 10,
  kNotANumber      = 11,
  kNotFinite       = 12,
  kNotPositive     = 13,
  kAmbiguousInput  = 14,

  // Geometry usage
  kMissingSide          = 20,
  kGeometryUsage        = 21,
  kLegExceedsHypotenuse = 22,
  kDegenerateTriangle   = 23,
  kNotRepresentable     = 24,

  // Feasibility
  kTriangleInequality = 30,

  // Configuration / internal
  kInvalidConfig = 40,
  kInternal      = 50,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kOk:                   return "Ok";
    case ErrorCode::kInvalidFieldSet:      return "InvalidFieldSet";
    case ErrorCode::kNotANumber:           return "NotANumber";
    case ErrorCode::kNotFinite:            return "NotFinite";
    case ErrorCode::kNotPositive:          return "NotPositive";
    case ErrorCode::kAmbiguousInput:       return "AmbiguousInput";
    case ErrorCode::kMissingSide:          return "MissingSide";
    case ErrorCode::kGeometryUsage:        return "GeometryUsage";
    case ErrorCode::kLegExceedsHypotenuse: return "LegExceedsHypotenuse";
    case ErrorCode::kDegenerateTriangle:   return "DegenerateTriangle";
    case ErrorCode::kNotRepresentable:     return "NotRepresentable";
    case ErrorCode::kTriangleInequality:   return "TriangleInequality";
    case ErrorCode::kInvalidConfig:        return "InvalidConfig";
    case ErrorCode::kInternal:             return "Internal";
    default:                               return "Unknown";
  }
}

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code,
        std::string field,
        std::string message,
        const char* file,
        int line,
        const char* function)
      : std::runtime_error(build_what(code, field, message, file, line, function)),
        code_(code),
        field_(std::move(field)),
        message_(std::move(message)),
        file_(file ? file : ""),
        function_(function ? function : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  // Empty unless the failure belongs to a single input field.
  const std::string& field() const noexcept { return field_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return file_; }
  const std::string& function() const noexcept { return function_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& field,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "[pythag::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")";
    if (!field.empty()) oss << " field=" << field;
    oss << "] " << msg;
    if (file && *file) {
      oss << " @ " << file << ":" << line;
      if (func && *func) oss << " (" << func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string field_;
  std::string message_;
  std::string file_;
  std::string function_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                    std::string field,
                                    std::string message,
                                    const char* file,
                                    int line,
                                    const char* function) {
  throw Error(code, std::move(field), std::move(message), file, line, function);
}

inline void ensure(bool ok,
                   ErrorCode code,
                   std::string message,
                   const char* file,
                   int line,
                   const char* function) {
  if (!ok) {
    throw_error(code, std::string{}, std::move(message), file, line, function);
  }
}

}  // namespace pythag

#define PYTHAG_THROW(CODE, MSG) \
  ::pythag::throw_error((CODE), std::string{}, (MSG), __FILE__, __LINE__, __func__)
#define PYTHAG_THROW_FIELD(CODE, FIELD, MSG) \
  ::pythag::throw_error((CODE), (FIELD), (MSG), __FILE__, __LINE__, __func__)
#define PYTHAG_ENSURE(EXPR, CODE, MSG) \
  ::pythag::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)
